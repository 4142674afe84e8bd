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

#ifndef FOOTFALL_POI_SELECTOR_HH
#define FOOTFALL_POI_SELECTOR_HH

#include <vector>

#include "common.hh"
#include "road_network.hh"
#include "routing_oracle.hh"
#include "progression.hh"

namespace Footfall {

///
/// Points of interest: sections that can be used as trip ends
typedef std::vector<Road::Edge> PoiList;

///
/// Result of the POI selection
struct PoiSelection {
    ///
    /// Core POIs, pairwise reachable in both directions
    PoiList core;
    ///
    /// Every selected POI, each reachable in both directions from core.front()
    PoiList pois;
};

/**
   Selection of well connected points of interest

   1. The largest connected component of the pedestrian network is extracted (topological connectivity)
   2. A few candidates are sampled and the largest subset of them that is pairwise reachable is found (clique search)
   3. Other sections are drawn at random and kept if they are reachable from and to the first core POI
*/
class PoiSelector
{
public:
    PoiSelector( const RoadNetwork& network,
                 const RoutingOracle& oracle,
                 RandomGenerator& gen,
                 ProgressionCallback& progression = null_progression_callback );

    ///
    /// Pedestrian sections whose end nodes lie in the largest connected component,
    /// direction ignored. Input order is kept.
    /// @throws InsufficientConnectivityError if no section allows pedestrians
    PoiList connected_sections() const;

    ///
    /// Sample core_count sections from the pool and return the largest pairwise reachable subset.
    /// A single candidate is its own core. With two candidates or more, the core has at least two sections.
    /// @throws InsufficientConnectivityError if no pair of candidates is mutually reachable
    PoiList core_pois( const PoiList& pool, size_t core_count );

    ///
    /// Grow the POI set from the pool, testing reachability with the anchor
    /// @param[in] target_count number of POIs wanted, 0 for every reachable section of the pool
    PoiList grow_pois( const PoiList& pool, const Road::Edge& anchor, size_t target_count );

    ///
    /// The whole selection
    PoiSelection select( size_t target_count, size_t core_count );

private:
    const RoadNetwork& network_;
    const RoutingOracle& oracle_;
    RandomGenerator& gen_;
    ProgressionCallback& progression_;
};

///
/// Convenience function
PoiSelection select_pois( const RoadNetwork& network,
                          const RoutingOracle& oracle,
                          size_t target_count,
                          size_t core_count,
                          RandomGenerator& gen,
                          ProgressionCallback& progression = null_progression_callback );

} // Footfall namespace

#endif
