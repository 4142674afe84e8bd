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

#ifndef FOOTFALL_DEMAND_GENERATOR_HH
#define FOOTFALL_DEMAND_GENERATOR_HH

#include <memory>
#include <string>

#include "common.hh"
#include "options.hh"
#include "road_network.hh"
#include "routing_oracle.hh"
#include "poi_selector.hh"
#include "preference_model.hh"
#include "population.hh"
#include "probability.hh"
#include "itinerary_scheduler.hh"
#include "schedule_emitter.hh"
#include "progression.hh"

namespace Footfall {

/**
   Pedestrian demand generator.

   On construction, the random generator is seeded and the POIs are selected.
   Pedestrians, trips and routes can then be generated, and simulated by SUMO.
*/
class DemandGenerator
{
public:
    ///
    /// Read a SUMO network and select the POIs
    /// @throws InsufficientConnectivityError, DistributionNormalizationError, std::invalid_argument
    DemandGenerator( const std::string& network_file,
                     const GeneratorParameters& parameters,
                     ProgressionCallback& progression = null_progression_callback );

    ///
    /// Generator on a network owned by the caller. No simulation can be run from it.
    DemandGenerator( const RoadNetwork& network,
                     const RoutingOracle& oracle,
                     const GeneratorParameters& parameters,
                     ProgressionCallback& progression = null_progression_callback );

    const GeneratorParameters& parameters() const { return parameters_; }
    const RoadNetwork& network() const { return *network_; }
    const RoutingOracle& oracle() const { return *oracle_; }
    const TimeOfDayDistribution& time_distribution() const { return time_distribution_; }
    const PreferenceModel& preferences() const { return *preferences_; }

    ///
    /// The seed actually used
    unsigned seed() const { return seed_; }

    ///
    /// Selected POIs, each mutually reachable with core_pois().front()
    const PoiList& pois() const { return selection_.pois; }
    const PoiList& core_pois() const { return selection_.core; }

    ///
    /// Generate n pedestrians
    Population generate_pedestrians( size_t n );

    ///
    /// Generate trips of pedestrians over a number of days, sorted by start time
    TripSchedule generate_trips( const Population& pedestrians, int days );

    ///
    /// Generate pedestrians and their trips, write the trips and the repaired routes
    /// and, optionally, run the simulation.
    ///
    /// Files are named after the number of pedestrians and days ("10_7_trips.xml", ...)
    /// and written in store_dir (created if needed, the network file is copied there).
    /// @returns the path of the trajectories file with homes, or of the routes file if the simulation is not run
    std::string get_trajectories( size_t n,
                                  int days,
                                  const std::string& store_dir,
                                  bool geo_format,
                                  bool run_simulation,
                                  RouteRepairer& repairer );

private:
    void init_();

    std::string network_file_;
    GeneratorParameters parameters_;
    ProgressionCallback& progression_;

    std::unique_ptr<RoadNetwork> owned_network_;
    std::unique_ptr<RoutingOracle> owned_oracle_;
    const RoadNetwork* network_;
    const RoutingOracle* oracle_;

    unsigned seed_;
    RandomGenerator gen_;
    TimeOfDayDistribution time_distribution_;
    PoiSelection selection_;
    std::unique_ptr<PreferenceModel> preferences_;
};

} // Footfall namespace

#endif
