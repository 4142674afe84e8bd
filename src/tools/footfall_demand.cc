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

///
/// Command line pedestrian demand generator: reads a SUMO network, generates pedestrians and their trips,
/// writes the routes and runs the simulation
///

#include <boost/program_options.hpp>
#include <iostream>
#include <fstream>
#include <vector>
#include <algorithm>

#include "common.hh"
#include "options.hh"
#include "demand_generator.hh"
#include "schedule_emitter.hh"
#include "progression.hh"

using namespace std;
using namespace Footfall;

namespace po = boost::program_options;

namespace {

///
/// Declare a command line option for each generator option, typed after its default value
void add_generator_options( po::options_description& desc, const OptionDescriptionList& odl )
{
    for ( const auto& p : odl ) {
        const char* name = p.first.c_str();
        const char* description = p.second.description.c_str();
        switch ( p.second.type() ) {
        case BoolOption:
            desc.add_options()( name, po::value<bool>(), description );
            break;
        case IntOption:
            desc.add_options()( name, po::value<int64_t>(), description );
            break;
        case FloatOption:
            desc.add_options()( name, po::value<double>(), description );
            break;
        case StringOption:
            desc.add_options()( name, po::value<string>(), description );
            break;
        }
    }
}

OptionMap to_option_map( const po::variables_map& vm, const OptionDescriptionList& odl )
{
    OptionMap options;
    for ( const auto& p : odl ) {
        if ( !vm.count( p.first ) ) {
            continue;
        }
        switch ( p.second.type() ) {
        case BoolOption:
            options[p.first] = OptionValue::from_bool( vm[p.first].as<bool>() );
            break;
        case IntOption:
            options[p.first] = OptionValue::from_int( vm[p.first].as<int64_t>() );
            break;
        case FloatOption:
            options[p.first] = OptionValue::from_float( vm[p.first].as<double>() );
            break;
        case StringOption:
            options[p.first] = OptionValue::from_string( vm[p.first].as<string>() );
            break;
        }
    }
    return options;
}

}

int main_( int argc, char* argv[] )
{
    string network_file;
    size_t n_pedestrians = 10;
    int days = 1;
    string output_dir = ".";

    const OptionDescriptionList odl = generator_option_descriptions();

    // parse command line arguments
    po::options_description desc( "Allowed options" );
    desc.add_options()
        ( "help,h", "produce help message" )
        ( "network,n", po::value<string>(), "set the SUMO network file (.net.xml)" )
        ( "pedestrians,p", po::value<size_t>(), "set the number of pedestrians" )
        ( "days,d", po::value<int>(), "set the number of simulated days" )
        ( "output-dir,o", po::value<string>(), "set the directory where files are written" )
        ( "geo", "output trajectories as longitude/latitude" )
        ( "no-simulation", "only write trips and routes, do not run SUMO" )
        ( "list-options", "list generator options and their default values" )
        ( "config,c", po::value<string>(), "read generator options from this file (option = value lines)" )
        ( "no-catch", "Debug mode, don't catch exceptions" )
        ;
    po::options_description generator_desc( "Generator options" );
    add_generator_options( generator_desc, odl );
    desc.add( generator_desc );

    po::variables_map vm;
    try {
        po::store( po::parse_command_line( argc, argv, desc ), vm );
    }
    catch ( po::unknown_option& e ) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if ( vm.count( "config" ) ) {
        const string config_file = vm["config"].as<string>();
        ifstream ifs( config_file.c_str() );
        if ( !ifs ) {
            std::cerr << "Cannot open " << config_file << std::endl;
            return 1;
        }
        // command line values take precedence
        po::store( po::parse_config_file( ifs, generator_desc ), vm );
    }
    po::notify( vm );

    if ( vm.count( "help" ) ) {
        COUT << desc << "\n";
        return 1;
    }

    if ( vm.count( "list-options" ) ) {
        for ( const auto& p : odl ) {
            std::cout << p.first << " (default " << p.second.default_value.str() << "): " << p.second.description << std::endl;
        }
        return 0;
    }

    if ( !vm.count( "network" ) ) {
        std::cerr << "A network file is needed, see --help" << std::endl;
        return 1;
    }
    network_file = vm["network"].as<string>();

    if ( vm.count( "pedestrians" ) ) {
        n_pedestrians = vm["pedestrians"].as<size_t>();
    }

    if ( vm.count( "days" ) ) {
        days = vm["days"].as<int>();
        if ( days < 0 ) {
            std::cerr << "The number of days must not be negative" << std::endl;
            return 1;
        }
    }

    if ( vm.count( "output-dir" ) ) {
        output_dir = vm["output-dir"].as<string>();
    }

    OptionMap options = to_option_map( vm, odl );
    for ( auto p : options ) {
        cout << p.first << "=" << p.second.str() << endl;
    }
    GeneratorParameters parameters = GeneratorParameters::from_options( options );

    TextProgression progression;
    DemandGenerator generator( network_file, parameters, progression );

    DuarouterRepairer repairer;
    const string output = generator.get_trajectories( n_pedestrians, days, output_dir, vm.count( "geo" ) > 0, vm.count( "no-simulation" ) == 0, repairer );
    COUT << "Output written to " << output << endl;

    return 0;
}

int main( int argc, char* argv[] )
{
    const std::vector<std::string> args{ argv, argv + argc };
    bool debug_mode = find( begin( args ), end( args ), "--no-catch" ) != end( args );

    if ( debug_mode ) {
        return main_( argc, argv );
    }
    else {
        try {
            return main_( argc, argv );
        }
        catch ( std::exception& e ) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    return 1;
}
