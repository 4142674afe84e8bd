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

#ifndef FOOTFALL_TRIP_HH
#define FOOTFALL_TRIP_HH

#include <string>
#include <vector>

#include "common.hh"

namespace Footfall {

///
/// A walk between two sections, identified by their ids
struct Leg {
    std::string from;
    std::string to;

    Leg() {}
    Leg( const std::string& f, const std::string& t ) : from( f ), to( t ) {}
};

///
/// A round trip of a pedestrian, starting and ending at home.
///
/// times[k] is the departure of leg k, in seconds since the beginning of the trip's day.
/// wait_times[k] is the stay between leg k and leg k+1.
class Trip
{
public:
    ///
    /// @param[in] day index of the day of the trip, used to compute its absolute start time
    /// @throws std::invalid_argument if the per leg vectors are not consistent
    Trip( const std::string& trip_id,
          size_t pedestrian_id,
          long day,
          const std::vector<Leg>& legs,
          const std::vector<long>& times,
          const std::vector<long>& durations,
          const std::vector<long>& wait_times );

    DECLARE_RO_PROPERTY( trip_id, std::string );
    DECLARE_RO_PROPERTY( pedestrian_id, size_t );

    ///
    /// Absolute start time, in seconds since the beginning of the simulation
    DECLARE_RO_PROPERTY( start_time, long );
    DECLARE_RO_PROPERTY( legs, std::vector<Leg> );
    DECLARE_RO_PROPERTY( times, std::vector<long> );
    DECLARE_RO_PROPERTY( durations, std::vector<long> );
    DECLARE_RO_PROPERTY( wait_times, std::vector<long> );
};

typedef std::vector<Trip> TripSchedule;

///
/// Stable sort of trips by start time
void sort_by_start_time( TripSchedule& trips );

} // Footfall namespace

#endif
