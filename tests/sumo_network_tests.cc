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
#include <fstream>

#include "sumo_network.hh"
#include "test_utils.hh"

using namespace boost::unit_test ;
using namespace Footfall;

BOOST_AUTO_TEST_SUITE( footfall_sumo_network )

BOOST_AUTO_TEST_CASE( testLanePermissions )
{
    BOOST_CHECK( lane_allows_pedestrian( "", "" ) );
    BOOST_CHECK( lane_allows_pedestrian( "pedestrian", "" ) );
    BOOST_CHECK( lane_allows_pedestrian( "bicycle pedestrian", "" ) );
    BOOST_CHECK( lane_allows_pedestrian( "all", "" ) );
    BOOST_CHECK( !lane_allows_pedestrian( "passenger bus", "" ) );
    BOOST_CHECK( lane_allows_pedestrian( "", "passenger" ) );
    BOOST_CHECK( !lane_allows_pedestrian( "", "passenger pedestrian" ) );
    BOOST_CHECK( !lane_allows_pedestrian( "", "all" ) );
    // allow has precedence
    BOOST_CHECK( lane_allows_pedestrian( "pedestrian", "pedestrian" ) );
}

BOOST_AUTO_TEST_CASE( testRead )
{
    std::unique_ptr<RoadNetwork> network = read_sumo_network( test_data_dir() + "/toy.net.xml" );
    const Road::Graph& g = network->graph();

    // internal junctions and edges are skipped
    BOOST_CHECK_EQUAL( num_vertices( g ), 4 );
    BOOST_REQUIRE_EQUAL( network->sections().size(), 8 );
    BOOST_CHECK( !network->section_from_id( ":J0_0" ) );
    BOOST_CHECK( !network->section_from_id( ":J0_c0" ) );
    BOOST_CHECK_EQUAL( network->section_id( network->sections()[0] ), "e01" );

    const char* accessible[] = { "e01", "e10", "e12", "e21", "e23", "e32" };
    for ( const char* id : accessible ) {
        BOOST_REQUIRE( network->section_from_id( id ) );
        BOOST_CHECK_MESSAGE( network->section( *network->section_from_id( id ) ).allows_pedestrian(), id );
    }
    const char* closed[] = { "e30", "e03" };
    for ( const char* id : closed ) {
        BOOST_REQUIRE( network->section_from_id( id ) );
        BOOST_CHECK_MESSAGE( !network->section( *network->section_from_id( id ) ).allows_pedestrian(), id );
    }

    Road::Edge e01 = *network->section_from_id( "e01" );
    BOOST_CHECK_EQUAL( g[source( e01, g )].id(), "J0" );
    BOOST_CHECK_EQUAL( g[target( e01, g )].id(), "J1" );
    BOOST_CHECK_CLOSE( g[target( e01, g )].coordinates().x(), 100.0, 1e-9 );
    BOOST_CHECK_CLOSE( network->section( e01 ).length(), 100.0, 1e-9 );
    // shape of the first lane
    BOOST_CHECK_EQUAL( network->section( e01 ).shape().size(), 3 );
    BOOST_CHECK_CLOSE( network->middle_point( e01 ).x(), 50.0, 1e-9 );

    // shape of the edge
    Road::Edge e12 = *network->section_from_id( "e12" );
    BOOST_CHECK_CLOSE( network->section( e12 ).length(), 102.0, 1e-9 );
    BOOST_CHECK_CLOSE( network->middle_point( e12 ).x(), 110.0, 1e-9 );
    BOOST_CHECK_CLOSE( network->middle_point( e12 ).y(), 50.0, 1e-9 );
}

BOOST_AUTO_TEST_CASE( testInvalidFiles )
{
    BOOST_CHECK_THROW( read_sumo_network( test_data_dir() + "/zorglub.net.xml" ), std::invalid_argument );

    namespace fs = boost::filesystem;
    const fs::path tmp = fs::temp_directory_path() / fs::unique_path( "footfall-%%%%-%%%%.net.xml" );
    {
        std::ofstream ofs( tmp.string().c_str() );
        ofs << "<net>\n"
            << "  <junction id=\"a\" type=\"priority\" x=\"0\" y=\"0\"/>\n"
            << "  <edge id=\"ab\" from=\"a\" to=\"b\"><lane id=\"ab_0\" length=\"10\" shape=\"0,0 10,0\"/></edge>\n"
            << "</net>\n";
    }
    BOOST_CHECK_THROW( read_sumo_network( tmp.string() ), std::invalid_argument );

    {
        std::ofstream ofs( tmp.string().c_str() );
        ofs << "<routes/>\n";
    }
    BOOST_CHECK_THROW( read_sumo_network( tmp.string() ), std::invalid_argument );
    fs::remove( tmp );
}

BOOST_AUTO_TEST_SUITE_END()
