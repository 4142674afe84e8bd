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
#include <algorithm>

#include "preference_model.hh"
#include "probability.hh"
#include "errors.hh"

using namespace boost::unit_test ;
using namespace Footfall;

BOOST_AUTO_TEST_SUITE( footfall_preferences )

BOOST_AUTO_TEST_CASE( testNormalization )
{
    RandomGenerator gen( 7 );
    const size_t sizes[] = { 1, 2, 5, 100, 1000 };
    for ( size_t n : sizes ) {
        PreferenceModel model( n, true, true );
        for ( int i = 0; i < 10; i++ ) {
            std::vector<double> p = model.poi_distribution( gen );
            BOOST_REQUIRE_EQUAL( p.size(), n );
            BOOST_CHECK_SMALL( probability_sum( p ) - 1.0, PROBABILITY_TOLERANCE );
            for ( double v : p ) {
                BOOST_CHECK_GE( v, 0.0 );
            }
        }
    }
}

BOOST_AUTO_TEST_CASE( testBiases )
{
    RandomGenerator gen( 7 );

    // no bias
    {
        PreferenceModel model( 50, false, false );
        BOOST_CHECK( model.common_weights().empty() );
        std::vector<double> p = model.poi_distribution( gen );
        for ( double v : p ) {
            BOOST_CHECK_CLOSE( v, 1.0 / 50, 1e-6 );
        }
    }

    // common bias: favors the middle of the list, the same for everybody
    {
        PreferenceModel model( 100, true, false );
        BOOST_CHECK_EQUAL( model.common_weights().size(), 100 );
        std::vector<double> p1 = model.poi_distribution( gen );
        std::vector<double> p2 = model.poi_distribution( gen );
        BOOST_CHECK_GT( p1[50], p1[0] );
        BOOST_CHECK_GT( p1[50], p1[99] );
        BOOST_CHECK_CLOSE( p1[25], p2[25], 1e-6 );
    }

    // personal bias: shuffled per pedestrian
    {
        PreferenceModel model( 100, false, true );
        std::vector<double> p1 = model.poi_distribution( gen );
        std::vector<double> p2 = model.poi_distribution( gen );
        BOOST_CHECK( p1 != p2 );
        std::sort( p1.begin(), p1.end() );
        std::sort( p2.begin(), p2.end() );
        BOOST_CHECK_CLOSE( p1.back(), p2.back(), 1e-6 );
    }
}

BOOST_AUTO_TEST_CASE( testFoldProbability )
{
    std::vector<double> p;
    p.push_back( 0.1 );
    p.push_back( 0.2 );
    p.push_back( 0.3 );
    p.push_back( 0.4 );

    std::vector<double> q = fold_probability( p, 1 );
    BOOST_REQUIRE_EQUAL( q.size(), 3 );
    BOOST_CHECK_CLOSE( q[0], 0.1, 1e-9 );
    BOOST_CHECK_CLOSE( q[1], 0.5, 1e-9 );
    BOOST_CHECK_CLOSE( q[2], 0.4, 1e-9 );

    // the last one goes to the previous entry
    q = fold_probability( p, 3 );
    BOOST_REQUIRE_EQUAL( q.size(), 3 );
    BOOST_CHECK_CLOSE( q[2], 0.7, 1e-9 );
    BOOST_CHECK_SMALL( probability_sum( q ) - 1.0, PROBABILITY_TOLERANCE );

    BOOST_CHECK_THROW( fold_probability( std::vector<double>( 1, 1.0 ), 0 ), std::invalid_argument );
    BOOST_CHECK_THROW( fold_probability( p, 4 ), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testEnsureNormalized )
{
    std::vector<double> p;
    p.push_back( 0.5 );
    p.push_back( 0.4 );
    BOOST_CHECK_THROW( ensure_normalized( p, "p" ), DistributionNormalizationError );
    p.push_back( 0.1 );
    BOOST_CHECK_NO_THROW( ensure_normalized( p, "p" ) );
    p[0] = 1.1;
    p[2] = -0.5;
    BOOST_CHECK_THROW( ensure_normalized( p, "p" ), DistributionNormalizationError );
}

BOOST_AUTO_TEST_CASE( testTimeOfDay )
{
    RandomGenerator gen( 3 );

    TimeOfDayDistribution cycle( true );
    BOOST_REQUIRE_EQUAL( cycle.pmf().size(), MINUTES_PER_DAY );
    BOOST_CHECK_SMALL( probability_sum( cycle.pmf() ) - 1.0, PROBABILITY_TOLERANCE );
    // 9:00 is busier than 3:00
    BOOST_CHECK_GT( cycle.pmf()[9 * 60], 3 * cycle.pmf()[3 * 60] );

    TimeOfDayDistribution flat( false );
    BOOST_CHECK_CLOSE( flat.pmf()[0], 1.0 / MINUTES_PER_DAY, 1e-9 );
    BOOST_CHECK_CLOSE( flat.pmf()[MINUTES_PER_DAY - 1], 1.0 / MINUTES_PER_DAY, 1e-9 );

    for ( int i = 0; i < 1000; i++ ) {
        long t = cycle.draw_seconds( gen );
        BOOST_CHECK_EQUAL( t % 60, 0 );
        BOOST_CHECK_GE( t, 0 );
        BOOST_CHECK_LT( t, SECONDS_PER_DAY );
    }
}

BOOST_AUTO_TEST_SUITE_END()
