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

#ifndef FOOTFALL_POINT_HH
#define FOOTFALL_POINT_HH

#include <vector>
#include "common.hh"

namespace Footfall
{

///
/// 2D Points, in the network projected coordinates
struct Point2D {
    DECLARE_RW_PROPERTY( x, double );
    DECLARE_RW_PROPERTY( y, double );
public:
    Point2D() : x_( 0.0 ), y_( 0.0 ) {}
    Point2D( double mx, double my ) : x_( mx ), y_( my ) {}
};

///
/// A polyline
typedef std::vector<Point2D> Shape;

/** Compute the distance between a and b */
double distance( const Point2D& a, const Point2D& b );

/** Compute the length of a polyline */
double length( const Shape& shape );

///
/// Parse a SUMO shape attribute ("x1,y1 x2,y2 ...")
/// @throws bad_lexical_cast on malformed coordinates
Shape shape_from_string( const std::string& str );

}

#endif
