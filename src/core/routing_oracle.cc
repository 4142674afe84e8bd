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

#ifdef _WIN32
#pragma warning(push, 0)
#endif
#include <boost/graph/dijkstra_shortest_paths.hpp>
#include <boost/property_map/function_property_map.hpp>
#ifdef _WIN32
#pragma warning(pop)
#endif

#include <limits>
#include <boost/assert.hpp>
#include <list>

#include "routing_oracle.hh"

namespace Footfall {

namespace {

class PedestrianLength
{
public:
    PedestrianLength( const Road::Graph& graph ) : graph_( &graph ) {}
    double operator() ( const Road::Edge& e ) const {
        if ( !( *graph_ )[e].allows_pedestrian() ) {
            return std::numeric_limits<double>::infinity();
        }
        return ( *graph_ )[e].length();
    }
private:
    const Road::Graph* graph_;
};

struct path_found_exception {};

///
/// Stops the Dijkstra as soon as the destination is examined
class DestinationVisitor : public boost::default_dijkstra_visitor
{
public:
    DestinationVisitor( Road::Vertex destination ) : destination_( destination ) {}
    void examine_vertex( const Road::Vertex& v, const Road::Graph& ) {
        if ( v == destination_ ) {
            throw path_found_exception();
        }
    }
private:
    Road::Vertex destination_;
};

}

boost::optional<Path> DijkstraRoutingOracle::shortest_path( const Road::Edge& from, const Road::Edge& to ) const
{
    std::pair<size_t, size_t> key( network_.section_index( from ), network_.section_index( to ) );
    auto it = cache_.find( key );
    if ( it != cache_.end() ) {
        return it->second;
    }
    boost::optional<Path> p = compute_path_( from, to );
    cache_[key] = p;
    return p;
}

boost::optional<Path> DijkstraRoutingOracle::compute_path_( const Road::Edge& from, const Road::Edge& to ) const
{
    const Road::Graph& road_graph = network_.graph();
    if ( !road_graph[from].allows_pedestrian() || !road_graph[to].allows_pedestrian() ) {
        return boost::optional<Path>();
    }

    Path path;
    if ( from == to ) {
        path.sections.push_back( from );
        path.length = road_graph[from].length();
        return path;
    }

    Road::Vertex origin = target( from, road_graph );
    Road::Vertex destination = source( to, road_graph );

    std::list<Road::Edge> middle;
    double middle_length = 0.0;

    if ( origin != destination ) {
        n_queries_++;

        std::vector<Road::Vertex> pred_map( boost::num_vertices( road_graph ) );
        std::vector<double> distance_map( boost::num_vertices( road_graph ) );
        PedestrianLength weight_calculator( road_graph );
        auto weight_map = boost::make_function_property_map<Road::Edge, double, PedestrianLength>( weight_calculator );
        auto vertex_index = get( boost::vertex_index, road_graph );
        DestinationVisitor vis( destination );

        try {
            boost::dijkstra_shortest_paths( road_graph,
                                            origin,
                                            boost::predecessor_map( boost::make_iterator_property_map( pred_map.begin(), vertex_index ) )
                                            .distance_map( boost::make_iterator_property_map( distance_map.begin(), vertex_index ) )
                                            .weight_map( weight_map )
                                            .visitor( vis ) );
        }
        catch ( path_found_exception& ) {
            // Dijkstra has been short cut
        }

        if ( pred_map[destination] == destination ) {
            return boost::optional<Path>();
        }
        middle_length = distance_map[destination];

        // reorder the path, picking the shortest walkable section between two consecutive vertices
        Road::Vertex current = destination;
        while ( current != origin ) {
            Road::Vertex previous = pred_map[current];
            boost::optional<Road::Edge> best;
            Road::OutEdgeIterator oei, oei_end;
            for ( boost::tie( oei, oei_end ) = out_edges( previous, road_graph ); oei != oei_end; ++oei ) {
                if ( target( *oei, road_graph ) != current || !road_graph[*oei].allows_pedestrian() ) {
                    continue;
                }
                if ( !best || road_graph[*oei].length() < road_graph[*best].length() ) {
                    best = *oei;
                }
            }
            BOOST_ASSERT( best );
            middle.push_front( *best );
            current = previous;
        }
    }

    path.sections.push_back( from );
    path.sections.insert( path.sections.end(), middle.begin(), middle.end() );
    path.sections.push_back( to );
    path.length = road_graph[from].length() + middle_length + road_graph[to].length();
    return path;
}

} // Footfall namespace
