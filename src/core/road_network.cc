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

#include <boost/format.hpp>

#include "road_network.hh"

namespace Footfall {

RoadNetwork::RoadNetwork( const std::vector<Road::Node>& nodes, const std::vector<Road::SectionRecord>& sections )
{
    std::vector<std::pair<size_t, size_t> > ends;
    std::vector<Road::Section> properties;
    ends.reserve( sections.size() );
    properties.reserve( sections.size() );
    for ( const Road::SectionRecord& r : sections ) {
        if ( r.node_from >= nodes.size() || r.node_to >= nodes.size() ) {
            throw std::invalid_argument( ( boost::format( "Section %1% refers to a non existing node" ) % r.section.id() ).str() );
        }
        ends.push_back( std::make_pair( r.node_from, r.node_to ) );
        properties.push_back( r.section );
    }

    graph_.reset( new Road::Graph( boost::edges_are_unsorted_multi_pass,
                                   ends.begin(), ends.end(),
                                   properties.begin(),
                                   nodes.size() ) );

    {
        size_t i = 0;
        for ( const Road::Node& n : nodes ) {
            ( *graph_ )[i] = n;
            i++;
        }
    }

    Road::EdgeIterator ei, ei_end;
    for ( boost::tie( ei, ei_end ) = edges( *graph_ ); ei != ei_end; ++ei ) {
        const std::string& id = ( *graph_ )[*ei].id();
        if ( !section_index_.insert( std::make_pair( id, *ei ) ).second ) {
            throw std::invalid_argument( "Duplicate section id " + id );
        }
    }

    // keep the input order, the CSR graph sorts edges by source vertex
    sections_.reserve( sections.size() );
    for ( const Road::SectionRecord& r : sections ) {
        sections_.push_back( section_index_.find( r.section.id() )->second );
    }
}

boost::optional<Road::Edge> RoadNetwork::section_from_id( const std::string& id ) const
{
    auto it = section_index_.find( id );
    if ( it == section_index_.end() ) {
        return boost::optional<Road::Edge>();
    }
    return it->second;
}

size_t RoadNetwork::section_index( const Road::Edge& e ) const
{
    return get( boost::edge_index, *graph_, e );
}

Point2D RoadNetwork::middle_point( const Road::Edge& e ) const
{
    const Shape& shape = ( *graph_ )[e].shape();
    if ( shape.empty() ) {
        return ( *graph_ )[source( e, *graph_ )].coordinates();
    }
    return shape[shape.size() / 2];
}

} // Footfall namespace
