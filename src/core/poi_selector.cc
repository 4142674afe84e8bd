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
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/connected_components.hpp>
#include <boost/graph/bron_kerbosch_all_cliques.hpp>
#ifdef _WIN32
#pragma warning(pop)
#endif
#include <algorithm>
#include <boost/format.hpp>

#include "poi_selector.hh"
#include "errors.hh"
#include "utils/timer.hh"

namespace Footfall {

namespace {

typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS> UndirectedGraph;

///
/// Clique visitor keeping the first clique of maximum size
class MaximumCliqueRecorder
{
public:
    MaximumCliqueRecorder( std::vector<size_t>& best ) : best_( &best ) {}

    template <typename Clique, typename Graph>
    void clique( const Clique& c, const Graph& ) {
        if ( c.size() > best_->size() ) {
            best_->assign( c.begin(), c.end() );
        }
    }
private:
    std::vector<size_t>* best_;
};

}

PoiSelector::PoiSelector( const RoadNetwork& network,
                          const RoutingOracle& oracle,
                          RandomGenerator& gen,
                          ProgressionCallback& progression ) :
    network_( network ),
    oracle_( oracle ),
    gen_( gen ),
    progression_( progression )
{
}

PoiList PoiSelector::connected_sections() const
{
    const Road::Graph& road_graph = network_.graph();
    const size_t nv = num_vertices( road_graph );
    if ( nv == 0 ) {
        throw InsufficientConnectivityError( "Empty network" );
    }

    UndirectedGraph g( nv );
    std::vector<bool> touched( nv, false );
    for ( const Road::Edge& e : network_.sections() ) {
        if ( !road_graph[e].allows_pedestrian() ) {
            continue;
        }
        Road::Vertex u = source( e, road_graph );
        Road::Vertex v = target( e, road_graph );
        add_edge( u, v, g );
        touched[u] = touched[v] = true;
    }

    std::vector<int> component( nv );
    const int n_components = boost::connected_components( g, &component[0] );

    // isolated vertices are not part of the pedestrian network
    std::vector<size_t> component_size( n_components, 0 );
    for ( size_t v = 0; v < nv; v++ ) {
        if ( touched[v] ) {
            component_size[component[v]]++;
        }
    }
    auto largest = std::max_element( component_size.begin(), component_size.end() );
    if ( largest == component_size.end() || *largest == 0 ) {
        throw InsufficientConnectivityError( "No section of the network allows pedestrians" );
    }
    const int core_component = static_cast<int>( largest - component_size.begin() );

    PoiList sections;
    for ( const Road::Edge& e : network_.sections() ) {
        if ( road_graph[e].allows_pedestrian() && component[source( e, road_graph )] == core_component ) {
            sections.push_back( e );
        }
    }
    COUT << sections.size() << " sections in the largest pedestrian component (" << n_components << " components)" << std::endl;
    return sections;
}

PoiList PoiSelector::core_pois( const PoiList& pool, size_t core_count )
{
    const size_t k = std::min( core_count, pool.size() );
    if ( k == 0 ) {
        throw InsufficientConnectivityError( "No core POI candidate" );
    }

    // sample without replacement (partial Fisher-Yates)
    std::vector<size_t> indices( pool.size() );
    for ( size_t i = 0; i < indices.size(); i++ ) {
        indices[i] = i;
    }
    for ( size_t i = 0; i < k; i++ ) {
        std::uniform_int_distribution<size_t> d( i, indices.size() - 1 );
        std::swap( indices[i], indices[d( gen_ )] );
    }
    PoiList candidates;
    for ( size_t i = 0; i < k; i++ ) {
        candidates.push_back( pool[indices[i]] );
    }

    // a lone candidate is a clique, a pair graph without edges is not
    if ( k == 1 ) {
        return candidates;
    }

    Timer timer;
    UndirectedGraph clique_graph( k );
    const size_t n_pairs = k * ( k - 1 ) / 2;
    size_t pair_idx = 0;
    progression_.set_label( "Generating core points of interest" );
    for ( size_t i = 0; i < k; i++ ) {
        for ( size_t j = i + 1; j < k; j++ ) {
            progression_( float( pair_idx ) / n_pairs );
            pair_idx++;
            if ( oracle_.mutually_reachable( candidates[i], candidates[j] ) ) {
                add_edge( i, j, clique_graph );
            }
        }
    }
    progression_( 1.0, true );

    std::vector<size_t> best;
    boost::bron_kerbosch_all_cliques( clique_graph, MaximumCliqueRecorder( best ), 2 );
    if ( best.empty() ) {
        throw InsufficientConnectivityError( ( boost::format( "None of the %1% core POI candidates are mutually reachable, "
                                                              "retry with another seed or more core POIs" ) % k ).str() );
    }
    std::sort( best.begin(), best.end() );

    PoiList core;
    for ( size_t i : best ) {
        core.push_back( candidates[i] );
    }
    COUT << "Generated " << core.size() << " core points of interest in " << timer.elapsed() << "s" << std::endl;
    return core;
}

PoiList PoiSelector::grow_pois( const PoiList& pool, const Road::Edge& anchor, size_t target_count )
{
    PoiList remaining( pool );
    PoiList pois;
    const size_t n_sections = pool.size();

    progression_.set_label( "Generating points of interest" );
    while ( !remaining.empty() && ( target_count == 0 || pois.size() < target_count ) ) {
        if ( target_count == 0 ) {
            progression_( 1.0f - float( remaining.size() ) / n_sections );
        }
        else {
            progression_( float( pois.size() ) / target_count );
        }

        std::uniform_int_distribution<size_t> d( 0, remaining.size() - 1 );
        const size_t idx = d( gen_ );
        Road::Edge candidate = remaining[idx];
        remaining[idx] = remaining.back();
        remaining.pop_back();

        if ( oracle_.mutually_reachable( candidate, anchor ) ) {
            pois.push_back( candidate );
        }
    }
    progression_( 1.0, true );

    COUT << "Generated " << pois.size() << " points of interest" << std::endl;
    return pois;
}

PoiSelection PoiSelector::select( size_t target_count, size_t core_count )
{
    PoiSelection selection;
    const PoiList sections = connected_sections();
    selection.core = core_pois( sections, core_count );
    selection.pois = grow_pois( sections, selection.core.front(), target_count );
    return selection;
}

PoiSelection select_pois( const RoadNetwork& network,
                          const RoutingOracle& oracle,
                          size_t target_count,
                          size_t core_count,
                          RandomGenerator& gen,
                          ProgressionCallback& progression )
{
    PoiSelector selector( network, oracle, gen, progression );
    return selector.select( target_count, core_count );
}

} // Footfall namespace
