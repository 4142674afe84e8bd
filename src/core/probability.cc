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
#include <cmath>
#include <random>
#include <boost/format.hpp>

#include "probability.hh"
#include "errors.hh"

namespace Footfall {

double normpdf( double x, double mean, double sd )
{
    const double var = sd * sd;
    const double denom = sqrt( 2 * M_PI * var );
    const double num = exp( -( x - mean ) * ( x - mean ) / ( 2 * var ) );
    return num / denom;
}

double probability_sum( const std::vector<double>& p )
{
    double sum = 0.0;
    for ( double v : p ) {
        sum += v;
    }
    return sum;
}

void ensure_normalized( const std::vector<double>& p, const std::string& what )
{
    const double sum = probability_sum( p );
    if ( fabs( sum - 1.0 ) > PROBABILITY_TOLERANCE ) {
        throw DistributionNormalizationError( ( boost::format( "%1% sums to %2$.12f" ) % what % sum ).str() );
    }
    for ( double v : p ) {
        if ( v < 0 || std::isnan( v ) ) {
            throw DistributionNormalizationError( what + " has invalid probabilities" );
        }
    }
}

size_t draw_index( const std::vector<double>& weights, RandomGenerator& gen )
{
    std::discrete_distribution<int> d( weights.begin(), weights.end() );
    return static_cast<size_t>( d( gen ) );
}

TimeOfDayDistribution::TimeOfDayDistribution( bool day_night_cycle )
    : pmf_( MINUTES_PER_DAY )
{
    if ( day_night_cycle ) {
        // morning, noon and evening peaks, in minutes
        for ( int x = 0; x < MINUTES_PER_DAY; x++ ) {
            pmf_[x] = normpdf( x, 9 * 60, 24 * 9 )
                + normpdf( x, 13 * 60, 24 * 12 )
                + normpdf( x, 18 * 60, 24 * 9 );
        }
        const double sum = probability_sum( pmf_ );
        for ( double& p : pmf_ ) {
            p /= sum;
        }
    }
    else {
        for ( double& p : pmf_ ) {
            p = 1.0 / MINUTES_PER_DAY;
        }
    }
    ensure_normalized( pmf_, "time of day distribution" );
}

long TimeOfDayDistribution::draw_seconds( RandomGenerator& gen ) const
{
    return static_cast<long>( draw_index( pmf_, gen ) ) * 60;
}

} // Footfall namespace
