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

#ifndef FOOTFALL_SCHEDULE_EMITTER_HH
#define FOOTFALL_SCHEDULE_EMITTER_HH

#include <string>

#include "trip.hh"

namespace Footfall {

///
/// Id of the pedestrian vehicle type, used by every person of the routes files
extern const char* PEDESTRIAN_TYPE_ID;

///
/// Turns a trips file into a routes file the simulator can run.
/// Departures of the output may be altered.
class RouteRepairer
{
public:
    virtual ~RouteRepairer() {}

    ///
    /// @throws ExternalOracleFailure
    virtual void repair( const std::string& network_file, const std::string& trips_path, const std::string& routes_path ) = 0;
};

///
/// Route repair by SUMO's duarouter, which has to be in the PATH
class DuarouterRepairer : public RouteRepairer
{
public:
    virtual void repair( const std::string& network_file, const std::string& trips_path, const std::string& routes_path );
};

///
/// Writes the trip schedule as SUMO routes files
class ScheduleEmitter
{
public:
    ScheduleEmitter( const std::string& network_file, RouteRepairer& repairer );

    ///
    /// Write trips as a SUMO routes document, persons walking and stopping at each POI
    /// @throws std::runtime_error if the file cannot be written
    void store_trips( const TripSchedule& trips, const std::string& path ) const;

    ///
    /// Repair the trips file into a routes file, then restore the departure of each person
    /// @throws ExternalOracleFailure
    void store_routes( const std::string& trips_path, const std::string& routes_path ) const;

private:
    std::string network_file_;
    RouteRepairer& repairer_;
};

///
/// Set the departure of each person of the routes file to the one of the trips file,
/// then sort persons by departure. vType elements are kept first, other elements dropped.
/// @throws ExternalOracleFailure if a person of the routes file is not in the trips file
void reconcile_departures( const std::string& trips_path, const std::string& routes_path );

} // Footfall namespace

#endif
