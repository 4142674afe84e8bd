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

#ifndef FOOTFALL_ITINERARY_SCHEDULER_HH
#define FOOTFALL_ITINERARY_SCHEDULER_HH

#include <vector>

#include "common.hh"
#include "population.hh"
#include "probability.hh"
#include "progression.hh"
#include "road_network.hh"
#include "routing_oracle.hh"
#include "trip.hh"

namespace Footfall {

///
/// Per pedestrian state of a scheduling run
struct SchedulingContext {
    /// Travel time left, in seconds. May go negative
    double remaining_time;
    /// Number of trips generated so far, warm-up trips included
    size_t trip_count;

    SchedulingContext() : remaining_time( 0.0 ), trip_count( 0 ) {}
};

struct SchedulerParameters {
    /// Whether the first day of each week is a short day
    bool week_cycle;
    /// Average stay at a POI, in seconds
    int average_stay_duration;
    /// Walking speed, in m/s
    double walk_speed;

    SchedulerParameters() : week_cycle( true ), average_stay_duration( 3600 ), walk_speed( 0.8 ) {}
};

///
/// Travel time credited to a pedestrian at the beginning of a day.
/// Day 0 (if week_cycle) and every day 1 modulo 7 get half the daily budget.
double credited_time( double daily_travel_time, int day, bool week_cycle );

/**
   Turns the pedestrians time budgets into trips.

   A trip leaves home, visits one or more POIs drawn from the pedestrian's preferences,
   waits at each of them and comes back home.
   A first "warm-up" day is generated and discarded so that the first simulated day
   starts with a realistic remaining time.
*/
class ItineraryScheduler
{
public:
    ItineraryScheduler( const RoadNetwork& network,
                        const RoutingOracle& oracle,
                        const TimeOfDayDistribution& time_distribution,
                        const SchedulerParameters& parameters,
                        RandomGenerator& gen );

    ///
    /// Generate one trip, consuming travel time of the context
    /// @throws UnreachablePOIError if a leg has no path
    Trip generate_trip( const Pedestrian& pedestrian, SchedulingContext& context, long day );

    ///
    /// Generate trips of every pedestrian over a number of days, sorted by start time
    TripSchedule generate_trips( const Population& pedestrians, int days, ProgressionCallback& progression = null_progression_callback );

    ///
    /// Scheduling context of each pedestrian of the last generate_trips() call
    const std::vector<SchedulingContext>& contexts() const { return contexts_; }

    ///
    /// Walking duration between two sections, in whole seconds, at least one
    /// @throws UnreachablePOIError
    long walk_duration( const Road::Edge& from, const Road::Edge& to ) const;

private:
    ///
    /// Generate the trips of a pedestrian for a day, until the travel time is exhausted
    /// Errors abort the day of this pedestrian only.
    void generate_day_( const Pedestrian& pedestrian, SchedulingContext& context, long day, TripSchedule* trips );

    const RoadNetwork& network_;
    const RoutingOracle& oracle_;
    const TimeOfDayDistribution& time_distribution_;
    SchedulerParameters parameters_;
    RandomGenerator& gen_;
    std::vector<SchedulingContext> contexts_;
};

} // Footfall namespace

#endif
