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

#ifndef FOOTFALL_PREFERENCE_MODEL_HH
#define FOOTFALL_PREFERENCE_MODEL_HH

#include <vector>

#include "common.hh"

namespace Footfall {

/**
   Visit likelihood of each POI for a pedestrian.

   Two biases can be combined:
   - a common one, shared by every pedestrian, favoring POIs in the middle of the POI list
   - a personal one, with the same shape but narrower, shuffled for each pedestrian
*/
class PreferenceModel
{
public:
    PreferenceModel( size_t poi_count, bool common_favorites, bool favorites );

    size_t poi_count() const { return poi_count_; }

    ///
    /// Common bias weights, not normalized. Empty if the common bias is disabled.
    const std::vector<double>& common_weights() const { return common_weights_; }

    ///
    /// Draw a new distribution over the POIs. Sums to 1.
    /// @throws DistributionNormalizationError
    std::vector<double> poi_distribution( RandomGenerator& gen ) const;

private:
    size_t poi_count_;
    bool favorites_;
    std::vector<double> common_weights_;
    std::vector<double> personal_weights_;
};

///
/// Remove an entry from a distribution, its probability being given to the next entry
/// (or the previous one for the last entry)
/// @throws std::invalid_argument if the distribution has less than two entries
std::vector<double> fold_probability( const std::vector<double>& distribution, size_t index );

} // Footfall namespace

#endif
