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

#include <fstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

#include "simulation.hh"
#include "xml_helper.hh"
#include "process.hh"

namespace Footfall {

namespace {

///
/// Add a <name value="..."/> element
template <class T>
void add_value( xmlNode* parent, const std::string& name, T value )
{
    xmlNode* node = XML::new_node( name );
    XML::new_prop( node, "value", value );
    XML::add_child( parent, node );
}

}

std::string SimulationConfig::path( const std::string& file ) const
{
    if ( directory.empty() ) {
        return file;
    }
    if ( boost::algorithm::ends_with( directory, "/" ) ) {
        return directory + file;
    }
    return directory + "/" + file;
}

void SimulationConfig::write() const
{
    scoped_xmlDoc doc = xmlNewDoc( ( const xmlChar* )"1.0" );
    xmlNode* root = XML::new_node( "configuration" );
    xmlDocSetRootElement( doc.get(), root );
    xmlNs* xsi = xmlNewNs( root, ( const xmlChar* )"http://www.w3.org/2001/XMLSchema-instance", ( const xmlChar* )"xsi" );
    xmlNewNsProp( root, xsi, ( const xmlChar* )"noNamespaceSchemaLocation", ( const xmlChar* )"http://sumo.dlr.de/xsd/sumoConfiguration.xsd" );

    xmlNode* input = XML::new_node( "input" );
    add_value( input, "net-file", network_file );
    add_value( input, "route-files", routes_file );
    XML::add_child( root, input );

    // the first step is skipped
    xmlNode* time = XML::new_node( "time" );
    add_value( time, "step-length", step_length );
    add_value( time, "begin", step_length );
    XML::add_child( root, time );

    xmlNode* output = XML::new_node( "output" );
    add_value( output, "fcd-output", output_file );
    if ( geo ) {
        add_value( output, "fcd-output.geo", "true" );
    }
    if ( seed ) {
        add_value( output, "seed", *seed );
    }
    XML::add_child( root, output );

    xmlNode* processing = XML::new_node( "processing" );
    add_value( processing, "ignore-route-errors", "true" );
    add_value( processing, "pedestrian.model", "nonInteracting" );
    XML::add_child( root, processing );

    XML::save_file( doc.get(), path( config_file ) );
}

void SimulationConfig::run() const
{
    std::vector<std::string> args;
    args.push_back( "sumo" );
    args.push_back( config_file );
    run_process_checked( args, directory );
}

std::string full_output_path( const std::string& output_path )
{
    if ( boost::algorithm::ends_with( output_path, ".xml" ) ) {
        return output_path.substr( 0, output_path.size() - 4 ) + "_full.xml";
    }
    return output_path + "_full.xml";
}

std::string add_homes( const std::string& output_path, const Population& pedestrians, const RoadNetwork& network )
{
    const std::string new_output_path = full_output_path( output_path );

    std::ifstream in( output_path.c_str() );
    if ( !in ) {
        throw std::runtime_error( "Cannot open " + output_path );
    }
    std::ofstream out( new_output_path.c_str() );
    if ( !out ) {
        throw std::runtime_error( "Cannot open " + new_output_path + " for writing" );
    }

    // trajectory files are large, they are streamed line by line
    bool found = false;
    std::string line;
    while ( std::getline( in, line ) ) {
        if ( !found && line.find( "<timestep" ) != std::string::npos ) {
            found = true;
            out << "\t<timestep time=\"0.00\">\n";
            for ( const Pedestrian& p : pedestrians ) {
                const Point2D home = network.middle_point( p.home() );
                out << boost::format( "\t\t<person id=\"ped%1%_0\" x=\"%2$.2f\" y=\"%3$.2f\" angle=\"0.00\" speed=\"0.00\" pos=\"0.00\" edge=\"%4%\" slope=\"0.00\"/>\n" )
                    % p.id() % home.x() % home.y() % network.section_id( p.home() );
            }
            out << "\t</timestep>\n";
        }
        out << line << "\n";
    }
    if ( !found ) {
        CERR << "No timestep in " << output_path << ", homes not added" << std::endl;
    }
    if ( !out ) {
        throw std::runtime_error( "Cannot write " + new_output_path );
    }
    return new_output_path;
}

} // Footfall namespace
