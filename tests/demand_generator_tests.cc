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
#include <boost/filesystem.hpp>

#include "demand_generator.hh"
#include "errors.hh"
#include "fake_repairer.hh"
#include "test_utils.hh"

using namespace boost::unit_test ;
using namespace Footfall;

namespace {
GeneratorParameters toy_parameters( unsigned seed )
{
    GeneratorParameters params;
    params.nr_pois = 5;
    params.nr_core_pois = 3;
    params.seed = seed;
    return params;
}
}

BOOST_AUTO_TEST_SUITE( footfall_demand_generator )

BOOST_AUTO_TEST_CASE( testInMemory )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    DemandGenerator generator( *network, oracle, toy_parameters( 42 ) );

    BOOST_CHECK_EQUAL( generator.seed(), 42u );
    BOOST_CHECK_EQUAL( generator.core_pois().size(), 3 );
    BOOST_CHECK_EQUAL( generator.pois().size(), 5 );
    BOOST_CHECK_EQUAL( generator.preferences().poi_count(), 5 );

    Population pedestrians = generator.generate_pedestrians( 20 );
    BOOST_CHECK_EQUAL( pedestrians.size(), 20 );
    for ( const Pedestrian& p : pedestrians ) {
        BOOST_CHECK_EQUAL( p.pois().size(), 4 );
    }

    TripSchedule trips = generator.generate_trips( pedestrians, 3 );
    BOOST_CHECK( !trips.empty() );
    for ( size_t i = 1; i < trips.size(); i++ ) {
        BOOST_CHECK_LE( trips[i - 1].start_time(), trips[i].start_time() );
    }

    // a generator without network file cannot write files
    FakeRepairer repairer;
    BOOST_CHECK_THROW( generator.get_trajectories( 2, 1, "", false, false, repairer ), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testDeterminism )
{
    std::unique_ptr<RoadNetwork> network( ring_network( 8 ) );
    DijkstraRoutingOracle oracle( *network );
    DemandGenerator g1( *network, oracle, toy_parameters( 7 ) );
    DemandGenerator g2( *network, oracle, toy_parameters( 7 ) );

    BOOST_CHECK( g1.pois() == g2.pois() );
    BOOST_CHECK( g1.core_pois() == g2.core_pois() );

    Population p1 = g1.generate_pedestrians( 15 );
    Population p2 = g2.generate_pedestrians( 15 );
    BOOST_REQUIRE_EQUAL( p1.size(), p2.size() );
    for ( size_t i = 0; i < p1.size(); i++ ) {
        BOOST_CHECK( p1[i].home() == p2[i].home() );
        BOOST_CHECK_EQUAL( p1[i].level(), p2[i].level() );
        BOOST_CHECK( p1[i].poi_distribution() == p2[i].poi_distribution() );
    }

    TripSchedule t1 = g1.generate_trips( p1, 2 );
    TripSchedule t2 = g2.generate_trips( p2, 2 );
    BOOST_REQUIRE_EQUAL( t1.size(), t2.size() );
    for ( size_t i = 0; i < t1.size(); i++ ) {
        BOOST_CHECK_EQUAL( t1[i].trip_id(), t2[i].trip_id() );
        BOOST_CHECK_EQUAL( t1[i].start_time(), t2[i].start_time() );
        BOOST_CHECK( t1[i].durations() == t2[i].durations() );
        BOOST_CHECK( t1[i].wait_times() == t2[i].wait_times() );
    }
}

BOOST_AUTO_TEST_CASE( testNotEnoughCandidates )
{
    // a single POI: no pedestrian can be generated
    std::unique_ptr<RoadNetwork> network( ring_network( 6 ) );
    DijkstraRoutingOracle oracle( *network );
    GeneratorParameters params = toy_parameters( 1 );
    params.nr_pois = 1;
    DemandGenerator generator( *network, oracle, params );
    BOOST_CHECK_EQUAL( generator.pois().size(), 1 );
    BOOST_CHECK_THROW( generator.generate_pedestrians( 3 ), InsufficientConnectivityError );
}

BOOST_AUTO_TEST_CASE( testTrajectoriesWithoutSimulation )
{
    GeneratorParameters params = toy_parameters( 3 );
    params.nr_pois = 0;
    DemandGenerator generator( test_data_dir() + "/toy.net.xml", params );
    // every pedestrian section of the file
    BOOST_CHECK_EQUAL( generator.pois().size(), 6 );

    const std::string dir = make_temporary_directory() + "/output";
    FakeRepairer repairer;
    const std::string routes = generator.get_trajectories( 5, 2, dir, false, false, repairer );

    namespace fs = boost::filesystem;
    BOOST_CHECK_EQUAL( fs::path( routes ), fs::path( dir ) / "5_2_routes.xml" );
    BOOST_CHECK( fs::exists( fs::path( dir ) / "toy.net.xml" ) );
    BOOST_CHECK( fs::exists( fs::path( dir ) / "5_2_trips.xml" ) );
    BOOST_CHECK( fs::exists( routes ) );
    BOOST_CHECK_EQUAL( repairer.n_calls(), 1 );
    BOOST_CHECK_EQUAL( fs::path( repairer.network_file() ), fs::path( dir ) / "toy.net.xml" );
    BOOST_CHECK( !fs::exists( fs::path( dir ) / "5_2_config.sumocfg" ) );

    fs::remove_all( fs::path( dir ).parent_path() );
}

BOOST_AUTO_TEST_SUITE_END()
