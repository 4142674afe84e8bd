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

#ifndef FOOTFALL_ROUTING_ORACLE_HH
#define FOOTFALL_ROUTING_ORACLE_HH

#include <map>
#include <vector>
#include <boost/optional.hpp>

#include "road_network.hh"

namespace Footfall {

///
/// A pedestrian path between two sections, both included
struct Path {
    std::vector<Road::Edge> sections;
    /// Physical length, in meters
    double length;

    Path() : length( 0.0 ) {}
};

///
/// Answers "is there a path, and how long" between two sections.
/// Implementations may be in-process or delegate to an external router.
class RoutingOracle
{
public:
    virtual ~RoutingOracle() {}

    ///
    /// Shortest pedestrian path from a section to another one
    /// @returns an empty optional if there is no path
    virtual boost::optional<Path> shortest_path( const Road::Edge& from, const Road::Edge& to ) const = 0;

    bool has_path( const Road::Edge& from, const Road::Edge& to ) const {
        return shortest_path( from, to ).is_initialized();
    }

    ///
    /// Path in both directions
    bool mutually_reachable( const Road::Edge& a, const Road::Edge& b ) const {
        return has_path( a, b ) && has_path( b, a );
    }
};

///
/// Routing oracle running a Dijkstra on the road graph.
/// Only sections allowing pedestrians are walked on, in their own direction.
/// Results are cached by (from, to) pair.
class DijkstraRoutingOracle : public RoutingOracle
{
public:
    DijkstraRoutingOracle( const RoadNetwork& network ) : network_( network ) {}

    virtual boost::optional<Path> shortest_path( const Road::Edge& from, const Road::Edge& to ) const;

    ///
    /// Number of Dijkstra runs so far (cache misses)
    size_t n_queries() const { return n_queries_; }

private:
    boost::optional<Path> compute_path_( const Road::Edge& from, const Road::Edge& to ) const;

    const RoadNetwork& network_;

    typedef std::map<std::pair<size_t, size_t>, boost::optional<Path> > PathCache;
    mutable PathCache cache_;
    mutable size_t n_queries_ = 0;
};

} // Footfall namespace

#endif
