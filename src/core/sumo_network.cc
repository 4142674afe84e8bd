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

#include <map>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "sumo_network.hh"
#include "xml_helper.hh"

namespace Footfall {

namespace {

bool has_token( const std::string& list, const std::string& token )
{
    std::vector<std::string> tokens;
    boost::algorithm::split( tokens, list, boost::is_any_of( " " ), boost::token_compress_on );
    return std::find( tokens.begin(), tokens.end(), token ) != tokens.end();
}

}

bool lane_allows_pedestrian( const std::string& allow, const std::string& disallow )
{
    if ( !allow.empty() ) {
        return has_token( allow, "pedestrian" ) || has_token( allow, "all" );
    }
    if ( !disallow.empty() ) {
        return !( has_token( disallow, "pedestrian" ) || has_token( disallow, "all" ) );
    }
    return true;
}

std::unique_ptr<RoadNetwork> read_sumo_network( const std::string& filename, ProgressionCallback& progression )
{
    scoped_xmlDoc doc = XML::read_file( filename );
    const xmlNode* root = xmlDocGetRootElement( doc.get() );
    if ( root == NULL || !XML::is_element( root, "net" ) ) {
        throw std::invalid_argument( filename + " is not a SUMO network" );
    }

    std::vector<Road::Node> nodes;
    std::map<std::string, size_t> node_index;
    for ( const xmlNode* junction : XML::child_elements( root, "junction" ) ) {
        if ( XML::get_prop( junction, "type" ) == "internal" ) {
            continue;
        }
        Road::Node node;
        node.set_id( XML::get_prop( junction, "id" ) );
        node.set_coordinates( Point2D( lexical_cast<double>( XML::get_prop( junction, "x" ) ),
                                       lexical_cast<double>( XML::get_prop( junction, "y" ) ) ) );
        node_index[node.id()] = nodes.size();
        nodes.push_back( node );
    }

    std::vector<xmlNode*> edges = XML::child_elements( root, "edge" );
    std::vector<Road::SectionRecord> sections;
    progression.set_label( "Reading network" );
    for ( size_t i = 0; i < edges.size(); i++ ) {
        const xmlNode* edge = edges[i];
        progression( float( i ) / edges.size() );

        const std::string function = XML::get_prop( edge, "function" );
        if ( !function.empty() && function != "normal" ) {
            continue;
        }

        Road::Section section;
        section.set_id( XML::get_prop( edge, "id" ) );

        const std::string from = XML::get_prop( edge, "from" );
        const std::string to = XML::get_prop( edge, "to" );
        auto from_it = node_index.find( from );
        auto to_it = node_index.find( to );
        if ( from_it == node_index.end() || to_it == node_index.end() ) {
            throw std::invalid_argument( ( boost::format( "Edge %1% refers to unknown junctions %2% -> %3%" ) % section.id() % from % to ).str() );
        }

        std::vector<xmlNode*> lanes = XML::child_elements( edge, "lane" );
        bool allows_pedestrian = false;
        for ( const xmlNode* lane : lanes ) {
            if ( lane_allows_pedestrian( XML::get_prop( lane, "allow" ), XML::get_prop( lane, "disallow" ) ) ) {
                allows_pedestrian = true;
                break;
            }
        }
        section.set_allows_pedestrian( allows_pedestrian );

        if ( XML::has_prop( edge, "shape" ) ) {
            section.set_shape( shape_from_string( XML::get_prop( edge, "shape" ) ) );
        }
        else if ( !lanes.empty() ) {
            section.set_shape( shape_from_string( XML::get_prop( lanes[0], "shape" ) ) );
        }

        if ( !lanes.empty() && XML::has_prop( lanes[0], "length" ) ) {
            section.set_length( lexical_cast<double>( XML::get_prop( lanes[0], "length" ) ) );
        }
        else {
            section.set_length( length( section.shape() ) );
        }

        sections.push_back( Road::SectionRecord( from_it->second, to_it->second, section ) );
    }
    progression( 1.0, true );

    return std::unique_ptr<RoadNetwork>( new RoadNetwork( nodes, sections ) );
}

} // Footfall namespace
