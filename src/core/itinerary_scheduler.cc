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

#include <cmath>
#include <algorithm>
#include <boost/format.hpp>

#include "itinerary_scheduler.hh"
#include "errors.hh"
#include "utils/timer.hh"

namespace Footfall {

double credited_time( double daily_travel_time, int day, bool week_cycle )
{
    if ( ( week_cycle && day % 7 == 0 ) || day % 7 == 1 ) {
        return daily_travel_time / 2;
    }
    return daily_travel_time;
}

ItineraryScheduler::ItineraryScheduler( const RoadNetwork& network,
                                        const RoutingOracle& oracle,
                                        const TimeOfDayDistribution& time_distribution,
                                        const SchedulerParameters& parameters,
                                        RandomGenerator& gen ) :
    network_( network ),
    oracle_( oracle ),
    time_distribution_( time_distribution ),
    parameters_( parameters ),
    gen_( gen )
{
    REQUIRE( parameters_.walk_speed > 0 );
}

long ItineraryScheduler::walk_duration( const Road::Edge& from, const Road::Edge& to ) const
{
    boost::optional<Path> path = oracle_.shortest_path( from, to );
    if ( !path ) {
        throw UnreachablePOIError( network_.section_id( from ), network_.section_id( to ) );
    }
    // every walk takes time, otherwise a day never ends
    return std::max( 1L, static_cast<long>( path->length / parameters_.walk_speed ) );
}

Trip ItineraryScheduler::generate_trip( const Pedestrian& pedestrian, SchedulingContext& context, long day )
{
    // levels 0 to 4: home->1->home
    // levels 5 to 7: home->1->2->home
    // levels 8 to 10: home->1->2->3->home
    const size_t max_legs = static_cast<size_t>( std::lround( pedestrian.level() / 3.0 ) );

    std::vector<Leg> legs;
    std::vector<long> durations;

    // destinations are drawn without replacement within a trip
    std::vector<double> weights( pedestrian.poi_distribution() );
    Road::Edge current = pedestrian.home();
    size_t current_idx = weights.size();

    while ( legs.empty() || ( legs.size() < max_legs && context.remaining_time > 0 ) ) {
        if ( probability_sum( weights ) <= 0.0 ) {
            // every POI has been visited
            weights = pedestrian.poi_distribution();
            if ( current_idx < weights.size() ) {
                weights[current_idx] = 0.0;
            }
            if ( probability_sum( weights ) <= 0.0 ) {
                break;
            }
        }
        const size_t idx = draw_index( weights, gen_ );
        weights[idx] = 0.0;
        const Road::Edge next = pedestrian.pois()[idx];

        const long duration = walk_duration( current, next );
        legs.push_back( Leg( network_.section_id( current ), network_.section_id( next ) ) );
        durations.push_back( duration );
        context.remaining_time -= duration;

        current = next;
        current_idx = idx;
    }

    // back home
    const long duration = walk_duration( current, pedestrian.home() );
    legs.push_back( Leg( network_.section_id( current ), network_.section_id( pedestrian.home() ) ) );
    durations.push_back( duration );
    context.remaining_time -= duration;

    std::vector<long> wait_times( legs.size() - 1, 0 );
    if ( parameters_.average_stay_duration > 0 ) {
        std::uniform_int_distribution<long> wait_distribution( 0, 2 * long( parameters_.average_stay_duration ) - 1 );
        for ( long& w : wait_times ) {
            w = wait_distribution( gen_ );
            context.remaining_time -= w;
        }
    }

    std::vector<long> times( legs.size() );
    times[0] = time_distribution_.draw_seconds( gen_ );
    for ( size_t k = 1; k < legs.size(); k++ ) {
        times[k] = times[k - 1] + durations[k - 1] + wait_times[k - 1];
    }

    const std::string trip_id = ( boost::format( "%1%_%2%" ) % pedestrian.id() % context.trip_count ).str();
    context.trip_count++;

    return Trip( trip_id, pedestrian.id(), day, legs, times, durations, wait_times );
}

void ItineraryScheduler::generate_day_( const Pedestrian& pedestrian, SchedulingContext& context, long day, TripSchedule* trips )
{
    try {
        while ( context.remaining_time > 0 ) {
            Trip trip = generate_trip( pedestrian, context, day );
            if ( trips ) {
                trips->push_back( trip );
            }
        }
    }
    catch ( UnreachablePOIError& e ) {
        CERR << "Pedestrian " << pedestrian.id() << ", day " << day << ": " << e.what() << std::endl;
    }
    catch ( ExternalOracleFailure& e ) {
        CERR << "Pedestrian " << pedestrian.id() << ", day " << day << ": " << e.what() << std::endl;
    }
}

TripSchedule ItineraryScheduler::generate_trips( const Population& pedestrians, int days, ProgressionCallback& progression )
{
    Timer timer;
    TripSchedule trips;
    contexts_.assign( pedestrians.size(), SchedulingContext() );

    // warm-up day, not kept
    progression.set_label( ( boost::format( "Generating trips for day 0/%1%" ) % days ).str() );
    for ( size_t i = 0; i < pedestrians.size(); i++ ) {
        const Pedestrian& pedestrian = pedestrians[i];
        SchedulingContext& context = contexts_[i];
        context.remaining_time += pedestrian.daily_travel_time() / 2;
        try {
            // at least one trip, even without travel time
            generate_trip( pedestrian, context, -1 );
        }
        catch ( UnreachablePOIError& e ) {
            CERR << "Pedestrian " << pedestrian.id() << ", warm-up day: " << e.what() << std::endl;
            continue;
        }
        catch ( ExternalOracleFailure& e ) {
            CERR << "Pedestrian " << pedestrian.id() << ", warm-up day: " << e.what() << std::endl;
            continue;
        }
        generate_day_( pedestrian, context, -1, nullptr );
    }

    for ( int day = 0; day < days; day++ ) {
        progression.set_label( ( boost::format( "Generating trips for day %1%/%2%" ) % ( day + 1 ) % days ).str() );
        progression( float( day ) / days );
        for ( size_t i = 0; i < pedestrians.size(); i++ ) {
            const Pedestrian& pedestrian = pedestrians[i];
            SchedulingContext& context = contexts_[i];
            context.remaining_time += credited_time( pedestrian.daily_travel_time(), day, parameters_.week_cycle );
            generate_day_( pedestrian, context, day, &trips );
        }
    }
    progression( 1.0, true );

    sort_by_start_time( trips );
    COUT << "Generated " << trips.size() << " trips for " << ( long( days ) * SECONDS_PER_DAY ) << " seconds in " << timer.elapsed() << "s" << std::endl;
    return trips;
}

} // Footfall namespace
