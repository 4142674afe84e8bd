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

#ifndef FOOTFALL_ROAD_NETWORK_HH
#define FOOTFALL_ROAD_NETWORK_HH

#include <map>
#include <vector>
#include <memory>
#include <stdint.h>

#ifdef _WIN32
#pragma warning(push, 0)
#endif
#include <boost/graph/compressed_sparse_row_graph.hpp>
#include <boost/optional.hpp>
#ifdef _WIN32
#pragma warning(pop)
#endif
#include "common.hh"
#include "point.hh"

namespace Footfall {

/**
   A Road::Graph is made of Road::Node and Road::Section

   It maps to the SUMO network description: junctions are nodes, edges are sections.
   Road::Node and Road::Section classes are used to build a BGL road graph as "bundled" edge and vertex properties
*/
namespace Road {

struct Node;
struct Section;
///
/// The final road graph type
/// vertex and edge indices are stored in a uin32_t, which means there is maximum of 4G vertices or arcs
typedef boost::compressed_sparse_row_graph<boost::bidirectionalS, Node, Section, /*GraphProperty = */ boost::no_property, uint32_t, uint32_t> Graph;
typedef Graph::vertex_descriptor Vertex;
typedef Graph::edge_descriptor Edge;

///
/// Used as Vertex.
/// Refers to a SUMO 'junction'
struct Node {
    DECLARE_RW_PROPERTY( id, std::string );

    /// coordinates
    DECLARE_RW_PROPERTY( coordinates, Point2D );
};

///
/// Used as Directed Edge.
/// Refers to a SUMO 'edge'
struct Section {
    DECLARE_RW_PROPERTY( id, std::string );

    /// Length in meters
    DECLARE_RW_PROPERTY( length, double );

    /// Can a pedestrian walk on it
    DECLARE_RW_PROPERTY( allows_pedestrian, bool );

    /// Geometry, may be empty
    DECLARE_RW_PROPERTY( shape, Shape );

public:
    Section() : length_( 0.0 ), allows_pedestrian_( false ) {}
};

typedef boost::graph_traits<Graph>::vertex_iterator VertexIterator;
typedef boost::graph_traits<Graph>::edge_iterator EdgeIterator;
typedef boost::graph_traits<Graph>::out_edge_iterator OutEdgeIterator;
typedef boost::graph_traits<Graph>::in_edge_iterator InEdgeIterator;

///
/// A section and the indices of its end nodes, used to build a RoadNetwork
struct SectionRecord {
    size_t node_from;
    size_t node_to;
    Section section;

    SectionRecord() : node_from( 0 ), node_to( 0 ) {}
    SectionRecord( size_t f, size_t t, const Section& s ) : node_from( f ), node_to( t ), section( s ) {}
};

}  // Road namespace

///
/// Read-only road network: the graph plus an index from section ids to edges
class RoadNetwork
{
public:
    ///
    /// Build the network
    /// @throws std::invalid_argument on duplicate section ids or dangling node indices
    RoadNetwork( const std::vector<Road::Node>& nodes, const std::vector<Road::SectionRecord>& sections );

    const Road::Graph& graph() const { return *graph_; }

    ///
    /// All sections, in the order they were given
    const std::vector<Road::Edge>& sections() const { return sections_; }

    ///
    /// Access to a section by its id
    boost::optional<Road::Edge> section_from_id( const std::string& id ) const;

    const Road::Section& section( const Road::Edge& e ) const { return ( *graph_ )[e]; }
    const std::string& section_id( const Road::Edge& e ) const { return ( *graph_ )[e].id(); }

    ///
    /// Dense index of a section, in [0, num_edges)
    size_t section_index( const Road::Edge& e ) const;

    ///
    /// Point used to place something "on" a section: the middle point of its shape,
    /// or the source node when the section has no geometry
    Point2D middle_point( const Road::Edge& e ) const;

private:
    std::unique_ptr<Road::Graph> graph_;
    std::vector<Road::Edge> sections_;
    std::map<std::string, Road::Edge> section_index_;
};

} // Footfall namespace

#endif
