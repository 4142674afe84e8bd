/**
 *   Copyright (C) 2016 Oslandia <infos@oslandia.com>
 *
 *   This library is free software; you can redistribute it and/or
 *   modify it under the terms of the GNU Library General Public
 *   License as published by the Free Software Foundation; either
 *   version 2 of the License, or (at your option) any later version.
 *
 *   This library is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *   Library General Public License for more details.
 *   You should have received a copy of the GNU Library General Public
 *   License along with this library; if not, see <http://www.gnu.org/licenses/>.
 */

#include <math.h>
#include <boost/algorithm/string.hpp>

#include "point.hh"

namespace Footfall
{

double distance( const Point2D& a, const Point2D& b )
{
    return sqrt(
                (a.x() - b.x()) * (a.x() - b.x()) +
                (a.y() - b.y()) * (a.y() - b.y()) );
}

double length( const Shape& shape )
{
    double l = 0.0;
    for ( size_t i = 1; i < shape.size(); i++ ) {
        l += distance( shape[i-1], shape[i] );
    }
    return l;
}

Shape shape_from_string( const std::string& str )
{
    Shape shape;
    std::vector<std::string> points;
    std::string trimmed = boost::algorithm::trim_copy( str );
    if ( trimmed.empty() ) {
        return shape;
    }
    boost::algorithm::split( points, trimmed, boost::is_any_of( " " ), boost::token_compress_on );
    for ( const std::string& p : points ) {
        std::vector<std::string> coords;
        boost::algorithm::split( coords, p, boost::is_any_of( "," ) );
        if ( coords.size() < 2 ) {
            throw bad_lexical_cast( "cannot parse point " + p );
        }
        // a third coordinate (elevation) may be present, it is ignored
        shape.push_back( Point2D( lexical_cast<double>( coords[0] ), lexical_cast<double>( coords[1] ) ) );
    }
    return shape;
}

}
