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

#include "trip.hh"

namespace Footfall {

Trip::Trip( const std::string& trip_id,
            size_t pedestrian_id,
            long day,
            const std::vector<Leg>& legs,
            const std::vector<long>& times,
            const std::vector<long>& durations,
            const std::vector<long>& wait_times ) :
    trip_id_( trip_id ),
    pedestrian_id_( pedestrian_id ),
    start_time_( 0 ),
    legs_( legs ),
    times_( times ),
    durations_( durations ),
    wait_times_( wait_times )
{
    REQUIRE( !legs_.empty() );
    REQUIRE( times_.size() == legs_.size() );
    REQUIRE( durations_.size() == legs_.size() );
    REQUIRE( wait_times_.size() == legs_.size() - 1 );
    start_time_ = day * SECONDS_PER_DAY + times_[0];
}

namespace {
bool start_before( const Trip& a, const Trip& b )
{
    return a.start_time() < b.start_time();
}
}

void sort_by_start_time( TripSchedule& trips )
{
    std::stable_sort( trips.begin(), trips.end(), start_before );
}

} // Footfall namespace
