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

#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>
#include <cmath>
#include <set>

#include "itinerary_scheduler.hh"
#include "errors.hh"
#include "test_utils.hh"

using namespace boost::unit_test ;
using namespace Footfall;

namespace {

Road::Edge section( const RoadNetwork& network, const std::string& id )
{
    boost::optional<Road::Edge> e = network.section_from_id( id );
    BOOST_REQUIRE( e );
    return *e;
}

///
/// A pedestrian living on "f0" of the network, who can go everywhere else
Pedestrian pedestrian_at_f0( const RoadNetwork& network, size_t id, int level, double daily_travel_time )
{
    const Road::Edge home = section( network, "f0" );
    PoiList pois;
    for ( const Road::Edge& e : network.sections() ) {
        if ( e != home ) {
            pois.push_back( e );
        }
    }
    std::vector<double> distribution( pois.size(), 1.0 / pois.size() );
    return Pedestrian( id, home, level, daily_travel_time, pois, distribution );
}

void check_trip( const Trip& trip, const std::string& home, int average_stay_duration )
{
    const std::vector<Leg>& legs = trip.legs();
    BOOST_REQUIRE( !legs.empty() );
    BOOST_CHECK_EQUAL( trip.times().size(), legs.size() );
    BOOST_CHECK_EQUAL( trip.durations().size(), legs.size() );
    BOOST_CHECK_EQUAL( trip.wait_times().size(), legs.size() - 1 );

    BOOST_CHECK_EQUAL( legs.front().from, home );
    BOOST_CHECK_EQUAL( legs.back().to, home );
    for ( size_t k = 0; k < legs.size(); k++ ) {
        BOOST_CHECK( legs[k].from != legs[k].to );
        if ( k > 0 ) {
            BOOST_CHECK_EQUAL( legs[k].from, legs[k - 1].to );
            BOOST_CHECK_EQUAL( trip.times()[k], trip.times()[k - 1] + trip.durations()[k - 1] + trip.wait_times()[k - 1] );
        }
    }
    for ( long w : trip.wait_times() ) {
        BOOST_CHECK_GE( w, 0 );
        BOOST_CHECK_LT( w, 2 * average_stay_duration );
    }
    BOOST_CHECK_EQUAL( trip.times()[0] % 60, 0 );
    BOOST_CHECK_EQUAL( trip.start_time() % SECONDS_PER_DAY, trip.times()[0] );
}

}

BOOST_AUTO_TEST_SUITE( footfall_itinerary_scheduler )

BOOST_AUTO_TEST_CASE( testCreditedTime )
{
    BOOST_CHECK_EQUAL( credited_time( 100.0, 0, true ), 50.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 1, true ), 50.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 2, true ), 100.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 6, true ), 100.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 7, true ), 50.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 8, true ), 50.0 );

    // day 1 of each week stays a short day
    BOOST_CHECK_EQUAL( credited_time( 100.0, 0, false ), 100.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 1, false ), 50.0 );
    BOOST_CHECK_EQUAL( credited_time( 100.0, 7, false ), 100.0 );
}

BOOST_AUTO_TEST_CASE( testWalkDuration )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    TimeOfDayDistribution time_distribution( true );
    SchedulerParameters params;
    RandomGenerator gen( 5 );
    ItineraryScheduler scheduler( *network, oracle, time_distribution, params, gen );

    // 200m at 0.8 m/s
    BOOST_CHECK_EQUAL( scheduler.walk_duration( section( *network, "f0" ), section( *network, "f1" ) ), 250 );
    // 300m, truncated
    params.walk_speed = 0.7;
    ItineraryScheduler slow( *network, oracle, time_distribution, params, gen );
    BOOST_CHECK_EQUAL( slow.walk_duration( section( *network, "f0" ), section( *network, "f2" ) ), 428 );
}

BOOST_AUTO_TEST_CASE( testInstantaneousWalks )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    TimeOfDayDistribution time_distribution( false );
    SchedulerParameters params;
    params.walk_speed = 1e6;
    params.average_stay_duration = 0;
    RandomGenerator gen( 5 );
    ItineraryScheduler scheduler( *network, oracle, time_distribution, params, gen );

    BOOST_CHECK_EQUAL( scheduler.walk_duration( section( *network, "f0" ), section( *network, "f1" ) ), 1 );

    // no wait and sub-second walks, the budget is still consumed
    Population population( 1, pedestrian_at_f0( *network, 0, 5, 7200.0 ) );
    TripSchedule trips = scheduler.generate_trips( population, 1 );
    BOOST_CHECK( !trips.empty() );
    for ( const Trip& trip : trips ) {
        for ( long d : trip.durations() ) {
            BOOST_CHECK_EQUAL( d, 1 );
        }
        for ( long w : trip.wait_times() ) {
            BOOST_CHECK_EQUAL( w, 0 );
        }
    }
    BOOST_CHECK_LE( scheduler.contexts()[0].remaining_time, 0.0 );
}

BOOST_AUTO_TEST_CASE( testSingleTrip )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    TimeOfDayDistribution time_distribution( true );
    SchedulerParameters params;
    RandomGenerator gen( 5 );
    ItineraryScheduler scheduler( *network, oracle, time_distribution, params, gen );

    for ( int level = 0; level <= 10; level++ ) {
        Pedestrian p = pedestrian_at_f0( *network, 3, level, 1e6 );
        SchedulingContext context;
        context.remaining_time = 1e6;
        Trip trip = scheduler.generate_trip( p, context, 2 );
        check_trip( trip, "f0", params.average_stay_duration );

        // plenty of time: every allowed stop is done
        const size_t max_legs = std::max<size_t>( 1, std::lround( level / 3.0 ) );
        BOOST_CHECK_EQUAL( trip.legs().size(), max_legs + 1 );
        BOOST_CHECK_EQUAL( trip.trip_id(), "3_0" );
        BOOST_CHECK_EQUAL( trip.pedestrian_id(), 3 );
        BOOST_CHECK_EQUAL( context.trip_count, 1 );
        BOOST_CHECK_GE( trip.start_time(), 2 * SECONDS_PER_DAY );
        BOOST_CHECK_LT( trip.start_time(), 3 * SECONDS_PER_DAY );

        long consumed = 0;
        for ( long d : trip.durations() ) {
            consumed += d;
        }
        for ( long w : trip.wait_times() ) {
            consumed += w;
        }
        BOOST_CHECK_CLOSE( context.remaining_time, 1e6 - consumed, 1e-9 );

        // destinations are not visited twice in a trip
        std::set<std::string> visited;
        for ( size_t k = 0; k + 1 < trip.legs().size(); k++ ) {
            BOOST_CHECK( visited.insert( trip.legs()[k].to ).second );
        }
    }

    // without time, one stop is done
    Pedestrian p = pedestrian_at_f0( *network, 0, 10, 0.0 );
    SchedulingContext context;
    Trip trip = scheduler.generate_trip( p, context, 0 );
    BOOST_CHECK_EQUAL( trip.legs().size(), 2 );
    BOOST_CHECK_LT( context.remaining_time, 0.0 );
}

BOOST_AUTO_TEST_CASE( testGenerateTrips )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    TimeOfDayDistribution time_distribution( true );
    SchedulerParameters params;
    params.average_stay_duration = 600;
    RandomGenerator gen( 5 );
    ItineraryScheduler scheduler( *network, oracle, time_distribution, params, gen );

    Population population;
    for ( int level = 0; level <= 10; level++ ) {
        population.push_back( pedestrian_at_f0( *network, level, level, daily_travel_time( level, 0.5 ) ) );
    }

    const int days = 8;
    TripSchedule trips = scheduler.generate_trips( population, days );
    BOOST_CHECK( !trips.empty() );

    std::set<std::string> trip_ids;
    for ( size_t i = 0; i < trips.size(); i++ ) {
        const Trip& trip = trips[i];
        check_trip( trip, "f0", params.average_stay_duration );
        BOOST_CHECK( trip_ids.insert( trip.trip_id() ).second );
        BOOST_CHECK( boost::algorithm::starts_with( trip.trip_id(), ( boost::format( "%1%_" ) % trip.pedestrian_id() ).str() ) );
        BOOST_CHECK_GE( trip.start_time(), 0 );
        BOOST_CHECK_LT( trip.start_time(), days * SECONDS_PER_DAY );
        if ( i > 0 ) {
            BOOST_CHECK_LE( trips[i - 1].start_time(), trip.start_time() );
        }

        // level 0 and 1 pedestrians do a single stop
        if ( trip.pedestrian_id() < 2 ) {
            BOOST_CHECK_LE( trip.legs().size(), 2 );
        }
    }

    // level 0: no travel time, only the warm-up trip
    BOOST_REQUIRE_EQUAL( scheduler.contexts().size(), population.size() );
    BOOST_CHECK_EQUAL( scheduler.contexts()[0].trip_count, 1 );
    for ( const Trip& trip : trips ) {
        BOOST_CHECK( trip.pedestrian_id() != 0 );
    }
    // the warm-up trips are not kept
    BOOST_CHECK( trip_ids.find( "10_0" ) == trip_ids.end() );

    // sorting again changes nothing
    TripSchedule sorted( trips );
    sort_by_start_time( sorted );
    for ( size_t i = 0; i < trips.size(); i++ ) {
        BOOST_CHECK_EQUAL( sorted[i].trip_id(), trips[i].trip_id() );
    }
}

BOOST_AUTO_TEST_CASE( testUnreachable )
{
    std::unique_ptr<RoadNetwork> network( disconnected_network() );
    DijkstraRoutingOracle oracle( *network );
    TimeOfDayDistribution time_distribution( false );
    SchedulerParameters params;
    RandomGenerator gen( 5 );
    ItineraryScheduler scheduler( *network, oracle, time_distribution, params, gen );

    // can go to the dead end, but not come back
    Pedestrian stuck( 0, section( *network, "f0" ), 5, 7200.0,
                      PoiList( 1, section( *network, "dead" ) ), std::vector<double>( 1, 1.0 ) );
    SchedulingContext context;
    BOOST_CHECK_THROW( scheduler.generate_trip( stuck, context, 0 ), UnreachablePOIError );
    try {
        scheduler.generate_trip( stuck, context, 0 );
    }
    catch ( UnreachablePOIError& e ) {
        BOOST_CHECK_EQUAL( e.from(), "dead" );
        BOOST_CHECK_EQUAL( e.to(), "f0" );
    }

    // errors only abort the pedestrian's day
    PoiList pois;
    pois.push_back( section( *network, "f1" ) );
    pois.push_back( section( *network, "f2" ) );
    Pedestrian walker( 1, section( *network, "b0" ), 5, 7200.0, pois, std::vector<double>( 2, 0.5 ) );

    Population population;
    population.push_back( stuck );
    population.push_back( walker );
    TripSchedule trips = scheduler.generate_trips( population, 3 );
    BOOST_CHECK( !trips.empty() );
    for ( const Trip& trip : trips ) {
        BOOST_CHECK_EQUAL( trip.pedestrian_id(), 1 );
    }
}

BOOST_AUTO_TEST_SUITE_END()
