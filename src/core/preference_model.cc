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

#include <algorithm>

#include "preference_model.hh"
#include "probability.hh"

namespace Footfall {

PreferenceModel::PreferenceModel( size_t poi_count, bool common_favorites, bool favorites ) :
    poi_count_( poi_count ),
    favorites_( favorites )
{
    const double n = static_cast<double>( poi_count );
    if ( common_favorites ) {
        common_weights_.resize( poi_count );
        for ( size_t i = 0; i < poi_count; i++ ) {
            common_weights_[i] = normpdf( double( i ), n / 2, n / 4 );
        }
    }
    if ( favorites ) {
        personal_weights_.resize( poi_count );
        for ( size_t i = 0; i < poi_count; i++ ) {
            personal_weights_[i] = normpdf( double( i ), n / 2, n / 16 );
        }
    }
}

std::vector<double> PreferenceModel::poi_distribution( RandomGenerator& gen ) const
{
    if ( poi_count_ == 0 ) {
        return std::vector<double>();
    }

    std::vector<double> p( poi_count_, 0.0 );
    if ( !common_weights_.empty() ) {
        for ( size_t i = 0; i < poi_count_; i++ ) {
            p[i] += common_weights_[i];
        }
    }
    if ( favorites_ ) {
        std::vector<double> shuffled( personal_weights_ );
        std::shuffle( shuffled.begin(), shuffled.end(), gen );
        for ( size_t i = 0; i < poi_count_; i++ ) {
            p[i] += shuffled[i];
        }
    }

    double sum = probability_sum( p );
    if ( sum <= 0.0 ) {
        // no bias at all
        std::fill( p.begin(), p.end(), 1.0 );
        sum = double( poi_count_ );
    }
    for ( double& v : p ) {
        v /= sum;
    }

    const double normalized_sum = probability_sum( p );
    if ( normalized_sum < 1.0 ) {
        std::uniform_int_distribution<size_t> d( 0, poi_count_ - 1 );
        p[d( gen )] += 1.0 - normalized_sum;
    }

    ensure_normalized( p, "POI distribution" );
    return p;
}

std::vector<double> fold_probability( const std::vector<double>& distribution, size_t index )
{
    if ( distribution.size() < 2 ) {
        throw std::invalid_argument( "Cannot remove an entry from a distribution of less than two values" );
    }
    REQUIRE( index < distribution.size() );

    std::vector<double> p( distribution );
    const double removed = p[index];
    p.erase( p.begin() + index );
    if ( index < p.size() ) {
        p[index] += removed;
    }
    else {
        p.back() += removed;
    }
    return p;
}

} // Footfall namespace
