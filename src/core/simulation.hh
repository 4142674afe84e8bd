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

#ifndef FOOTFALL_SIMULATION_HH
#define FOOTFALL_SIMULATION_HH

#include <string>
#include <boost/optional.hpp>

#include "population.hh"
#include "road_network.hh"

namespace Footfall {

/**
   Configuration of a SUMO simulation of the generated routes.

   File names are relative to the working directory, where the configuration file is written
   and where the simulator is run.
*/
struct SimulationConfig {
    std::string directory;
    std::string network_file;
    std::string routes_file;
    std::string output_file;
    std::string config_file;
    /// Simulation step, in seconds. The simulation begins after the first step
    int step_length;
    /// Output longitude/latitude instead of projected coordinates
    bool geo;
    boost::optional<unsigned> seed;

    SimulationConfig() : config_file( "config.sumocfg" ), step_length( 1 ), geo( false ) {}

    ///
    /// Full path of a file of the working directory
    std::string path( const std::string& file ) const;

    ///
    /// Write the .sumocfg file
    /// @throws std::runtime_error if the file cannot be written
    void write() const;

    ///
    /// Run "sumo <config_file>" in the working directory
    /// @throws ExternalOracleFailure if the simulator fails
    void run() const;
};

///
/// Name of the trajectories file with homes: the output name with "_full" before its extension
std::string full_output_path( const std::string& output_path );

///
/// Copy FCD trajectories, adding a first timestep where every pedestrian stands at home
/// @returns the path of the new file, see full_output_path()
/// @throws std::runtime_error if a file cannot be opened
std::string add_homes( const std::string& output_path, const Population& pedestrians, const RoadNetwork& network );

} // Footfall namespace

#endif
