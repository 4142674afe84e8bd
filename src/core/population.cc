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
#include <boost/format.hpp>

#include "population.hh"
#include "errors.hh"
#include "utils/timer.hh"

namespace Footfall {

Pedestrian::Pedestrian( size_t id,
                        const Road::Edge& home,
                        int level,
                        double daily_travel_time,
                        const PoiList& pois,
                        const std::vector<double>& poi_distribution ) :
    id_( id ),
    home_( home ),
    level_( level ),
    daily_travel_time_( daily_travel_time ),
    pois_( pois ),
    poi_distribution_( poi_distribution )
{
    REQUIRE( pois_.size() == poi_distribution_.size() );
}

double daily_travel_time( int level, double day_fraction )
{
    // a fully active pedestrian travels the whole day
    return day_fraction * SECONDS_PER_DAY * ( level * level * 0.01 );
}

PopulationGenerator::PopulationGenerator( const PoiList& pois,
                                          const PreferenceModel& preferences,
                                          const PopulationParameters& parameters,
                                          RandomGenerator& gen ) :
    pois_( pois ),
    preferences_( preferences ),
    parameters_( parameters ),
    gen_( gen )
{
    if ( pois_.size() < 2 ) {
        throw InsufficientConnectivityError( ( boost::format( "At least two POIs are needed to generate pedestrians, got %1%" ) % pois_.size() ).str() );
    }
    REQUIRE( preferences_.poi_count() == pois_.size() );
}

Pedestrian PopulationGenerator::generate_pedestrian( size_t id )
{
    std::uniform_int_distribution<size_t> home_distribution( 0, pois_.size() - 1 );
    const size_t home_idx = home_distribution( gen_ );

    double drawn = parameters_.al_mu;
    if ( parameters_.al_sigma > 0 ) {
        std::normal_distribution<double> level_distribution( parameters_.al_mu, parameters_.al_sigma );
        drawn = level_distribution( gen_ );
    }
    drawn = std::min( double( parameters_.activity_levels ), std::max( 0.0, drawn ) );
    const int level = static_cast<int>( drawn );

    const std::vector<double> distribution = preferences_.poi_distribution( gen_ );

    // home is not a destination
    PoiList pois( pois_ );
    pois.erase( pois.begin() + home_idx );

    return Pedestrian( id,
                       pois_[home_idx],
                       level,
                       daily_travel_time( level, parameters_.day_fraction ),
                       pois,
                       fold_probability( distribution, home_idx ) );
}

Population PopulationGenerator::generate( size_t n, ProgressionCallback& progression )
{
    Timer timer;
    Population population;
    population.reserve( n );
    progression.set_label( "Generating pedestrians" );
    for ( size_t i = 0; i < n; i++ ) {
        progression( float( i ) / n );
        population.push_back( generate_pedestrian( i ) );
    }
    progression( 1.0, true );
    COUT << "Generated " << n << " pedestrians in " << timer.elapsed() << "s" << std::endl;
    return population;
}

} // Footfall namespace
