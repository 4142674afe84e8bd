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

#ifndef FOOTFALL_PROBABILITY_HH
#define FOOTFALL_PROBABILITY_HH

#include <vector>
#include <string>

#include "common.hh"

namespace Footfall {

///
/// Tolerance used when checking that probabilities sum to 1
const double PROBABILITY_TOLERANCE = 1e-9;

///
/// Normal probability density function
double normpdf( double x, double mean, double sd );

///
/// Sum of a probability vector
double probability_sum( const std::vector<double>& p );

///
/// Throws a DistributionNormalizationError if p does not sum to 1
/// @param[in] what name of the distribution, for the error message
void ensure_normalized( const std::vector<double>& p, const std::string& what );

///
/// Draw an index with probability proportional to its weight
/// Weights must not all be null.
size_t draw_index( const std::vector<double>& weights, RandomGenerator& gen );

///
/// Per-minute distribution of trip departures over a day.
///
/// With the day/night cycle, departures follow three bumps around 9:00, 13:00 and 18:00.
/// Without, every minute is equally likely.
class TimeOfDayDistribution
{
public:
    TimeOfDayDistribution( bool day_night_cycle );

    ///
    /// Probability of each minute of the day, sums to 1
    const std::vector<double>& pmf() const { return pmf_; }

    ///
    /// Draw a departure, in seconds since midnight (a whole minute)
    long draw_seconds( RandomGenerator& gen ) const;

private:
    std::vector<double> pmf_;
};

} // Footfall namespace

#endif
