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

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "demand_generator.hh"
#include "sumo_network.hh"
#include "simulation.hh"
#include "utils/timer.hh"

namespace Footfall {

namespace {
unsigned initial_seed( const boost::optional<unsigned>& seed )
{
    if ( seed ) {
        return *seed;
    }
    std::random_device rd;
    return rd();
}
}

DemandGenerator::DemandGenerator( const std::string& network_file,
                                  const GeneratorParameters& parameters,
                                  ProgressionCallback& progression ) :
    network_file_( network_file ),
    parameters_( parameters ),
    progression_( progression ),
    network_( nullptr ),
    oracle_( nullptr ),
    seed_( initial_seed( parameters.seed ) ),
    gen_( seed_ ),
    time_distribution_( parameters.day_night_cycle )
{
    Timer timer;
    owned_network_ = read_sumo_network( network_file, progression_ );
    owned_oracle_.reset( new DijkstraRoutingOracle( *owned_network_ ) );
    network_ = owned_network_.get();
    oracle_ = owned_oracle_.get();
    COUT << "Read " << network_file << " (" << network_->sections().size() << " sections) in " << timer.elapsed() << "s" << std::endl;
    init_();
}

DemandGenerator::DemandGenerator( const RoadNetwork& network,
                                  const RoutingOracle& oracle,
                                  const GeneratorParameters& parameters,
                                  ProgressionCallback& progression ) :
    parameters_( parameters ),
    progression_( progression ),
    network_( &network ),
    oracle_( &oracle ),
    seed_( initial_seed( parameters.seed ) ),
    gen_( seed_ ),
    time_distribution_( parameters.day_night_cycle )
{
    init_();
}

void DemandGenerator::init_()
{
    COUT << "Random seed: " << seed_ << std::endl;
    selection_ = select_pois( *network_, *oracle_, parameters_.nr_pois, parameters_.nr_core_pois, gen_, progression_ );
    preferences_.reset( new PreferenceModel( selection_.pois.size(), parameters_.common_favorites, parameters_.favorites ) );
}

Population DemandGenerator::generate_pedestrians( size_t n )
{
    PopulationParameters params;
    params.activity_levels = parameters_.activity_levels;
    params.al_mu = parameters_.al_mu;
    params.al_sigma = parameters_.al_sigma;
    params.day_fraction = parameters_.day_fraction();

    PopulationGenerator generator( selection_.pois, *preferences_, params, gen_ );
    return generator.generate( n, progression_ );
}

TripSchedule DemandGenerator::generate_trips( const Population& pedestrians, int days )
{
    SchedulerParameters params;
    params.week_cycle = parameters_.week_cycle;
    params.average_stay_duration = parameters_.average_stay_duration;
    params.walk_speed = parameters_.walk_speed;

    ItineraryScheduler scheduler( *network_, *oracle_, time_distribution_, params, gen_ );
    return scheduler.generate_trips( pedestrians, days, progression_ );
}

std::string DemandGenerator::get_trajectories( size_t n,
                                               int days,
                                               const std::string& store_dir,
                                               bool geo_format,
                                               bool run_simulation,
                                               RouteRepairer& repairer )
{
    namespace fs = boost::filesystem;

    if ( network_file_.empty() ) {
        throw std::invalid_argument( "get_trajectories(): the generator has no network file" );
    }

    // the output directory holds a copy of the network
    const fs::path network_path( network_file_ );
    const fs::path directory( store_dir.empty() ? fs::current_path() : fs::path( store_dir ) );
    if ( !fs::exists( directory ) ) {
        fs::create_directories( directory );
    }
    const fs::path local_network = directory / network_path.filename();
    if ( !fs::exists( local_network ) ) {
        fs::copy_file( network_path, local_network );
    }

    SimulationConfig config;
    config.directory = directory.string();
    config.network_file = network_path.filename().string();
    config.routes_file = ( boost::format( "%1%_%2%_routes.xml" ) % n % days ).str();
    config.output_file = ( boost::format( "%1%_%2%_output.xml" ) % n % days ).str();
    config.config_file = ( boost::format( "%1%_%2%_config.sumocfg" ) % n % days ).str();
    config.step_length = parameters_.timestep_length;
    config.geo = geo_format;
    config.seed = parameters_.seed;
    const std::string trips_path = config.path( ( boost::format( "%1%_%2%_trips.xml" ) % n % days ).str() );
    const std::string routes_path = config.path( config.routes_file );

    Population pedestrians = generate_pedestrians( n );
    TripSchedule trips = generate_trips( pedestrians, days );

    ScheduleEmitter emitter( local_network.string(), repairer );
    emitter.store_trips( trips, trips_path );
    emitter.store_routes( trips_path, routes_path );

    if ( !run_simulation ) {
        return routes_path;
    }

    Timer timer;
    COUT << "Running SUMO" << std::endl;
    config.write();
    config.run();
    COUT << "Simulation done in " << timer.elapsed() << "s" << std::endl;

    COUT << "Inserting initial pedestrian positions" << std::endl;
    return add_homes( config.path( config.output_file ), pedestrians, *network_ );
}

} // Footfall namespace
