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

#ifndef FOOTFALL_POPULATION_HH
#define FOOTFALL_POPULATION_HH

#include <vector>

#include "common.hh"
#include "poi_selector.hh"
#include "preference_model.hh"
#include "progression.hh"

namespace Footfall {

///
/// A synthetic pedestrian.
/// Immutable once generated: the per-run state lives in the scheduler
struct Pedestrian {
    DECLARE_RO_PROPERTY( id, size_t );

    /// Home location, one of the POIs
    DECLARE_RO_PROPERTY( home, Road::Edge );

    /// Activity level, in [0, activity_levels]
    DECLARE_RO_PROPERTY( level, int );

    /// Travel time credited each day, in seconds
    DECLARE_RO_PROPERTY( daily_travel_time, double );

    /// Places the pedestrian may visit: every POI but home
    DECLARE_RO_PROPERTY( pois, PoiList );

    /// Visit likelihood of each of pois(), sums to 1
    DECLARE_RO_PROPERTY( poi_distribution, std::vector<double> );

public:
    Pedestrian( size_t id,
                const Road::Edge& home,
                int level,
                double daily_travel_time,
                const PoiList& pois,
                const std::vector<double>& poi_distribution );
};

typedef std::vector<Pedestrian> Population;

///
/// Parameters of the population
struct PopulationParameters {
    /// Highest activity level
    int activity_levels;
    /// Mean and standard deviation of the activity level
    double al_mu;
    double al_sigma;
    /// Fraction of the day spent being active
    double day_fraction;

    PopulationParameters() : activity_levels( 10 ), al_mu( 5.5 ), al_sigma( 2.5 ), day_fraction( 0.5 ) {}
};

///
/// Daily travel time of a given activity level, in seconds
double daily_travel_time( int level, double day_fraction );

///
/// Generates pedestrians living on POIs
class PopulationGenerator
{
public:
    ///
    /// @throws InsufficientConnectivityError if there are less than two POIs
    PopulationGenerator( const PoiList& pois,
                         const PreferenceModel& preferences,
                         const PopulationParameters& parameters,
                         RandomGenerator& gen );

    ///
    /// Generate n pedestrians with ids 0 to n-1
    Population generate( size_t n, ProgressionCallback& progression = null_progression_callback );

    ///
    /// Generate one pedestrian
    Pedestrian generate_pedestrian( size_t id );

private:
    const PoiList& pois_;
    const PreferenceModel& preferences_;
    PopulationParameters parameters_;
    RandomGenerator& gen_;
};

} // Footfall namespace

#endif
