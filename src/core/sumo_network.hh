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

#ifndef FOOTFALL_SUMO_NETWORK_HH
#define FOOTFALL_SUMO_NETWORK_HH

#include <memory>
#include <string>

#include "road_network.hh"
#include "progression.hh"

namespace Footfall {

///
/// Whether a lane allows pedestrians, given its 'allow' and 'disallow' SUMO attributes.
/// An absent allow list means every vehicle class not disallowed.
bool lane_allows_pedestrian( const std::string& allow, const std::string& disallow );

///
/// Read a SUMO network file (.net.xml)
///
/// Internal edges (crossings, walking areas, junction internals) are ignored.
/// A section is pedestrian accessible if any of its lanes allows pedestrians.
/// @throws std::invalid_argument if the file cannot be parsed or is inconsistent
std::unique_ptr<RoadNetwork> read_sumo_network( const std::string& filename, ProgressionCallback& progression = null_progression_callback );

} // Footfall namespace

#endif
