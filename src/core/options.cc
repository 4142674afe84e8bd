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

#include <stdexcept>
#include <boost/format.hpp>

#include "options.hh"

namespace Footfall {

OptionValue OptionValue::parse( const std::string& s, OptionType type )
{
    switch ( type ) {
    case BoolOption:
        return from_bool( detail::OptionConverter<bool>()( s ) );
    case IntOption:
        return from_int( lexical_cast<int64_t>( s ) );
    case FloatOption:
        return from_float( lexical_cast<double>( s ) );
    case StringOption:
        break;
    }
    return from_string( s );
}

OptionDescriptionList generator_option_descriptions()
{
    OptionDescriptionList odl;
    odl.declare_option( "timestep_length", "Length of a simulation step (s)", OptionValue::from_int( 60 ) );
    odl.declare_option( "day_night_cycle", "Schedule trips mostly during the day", OptionValue::from_bool( true ) );
    odl.declare_option( "week_cycle", "Reduce traffic on weekends", OptionValue::from_bool( true ) );
    odl.declare_option( "day_hours", "Number of active hours in a day", OptionValue::from_float( 12.0 ) );
    odl.declare_option( "average_stay_duration", "Average time spent at a place (s)", OptionValue::from_int( 60 * 60 ) );
    odl.declare_option( "activity_levels", "Number of activity levels", OptionValue::from_int( 10 ) );
    odl.declare_option( "al_mu", "Mean of the activity level distribution", OptionValue::from_float( 5.5 ) );
    odl.declare_option( "al_sigma", "Standard deviation of the activity level distribution", OptionValue::from_float( 2.5 ) );
    odl.declare_option( "nr_pois", "Number of points of interest, 0 for every reachable section", OptionValue::from_int( 1000 ) );
    odl.declare_option( "nr_core_pois", "Number of core points of interest candidates", OptionValue::from_int( 10 ) );
    odl.declare_option( "favorites", "Each pedestrian prefers some places over others", OptionValue::from_bool( true ) );
    odl.declare_option( "common_favorites", "All pedestrians prefer some places over others", OptionValue::from_bool( true ) );
    odl.declare_option( "walk_speed", "Walking speed (m/s)", OptionValue::from_float( 0.8 ) );
    odl.declare_option( "seed", "Random seed, negative for a random one", OptionValue::from_int( -1 ) );
    return odl;
}

OptionValue get_option_or_default( const OptionDescriptionList& desc, const OptionMap& options, const std::string& key )
{
    auto dit = desc.find( key );
    if ( dit == desc.end() ) {
        throw std::invalid_argument( "Unknown option " + key );
    }
    auto it = options.find( key );
    if ( it != options.end() ) {
        return it->second;
    }
    return dit->second.default_value;
}

GeneratorParameters::GeneratorParameters() :
    timestep_length( 60 ),
    day_night_cycle( true ),
    week_cycle( true ),
    day_hours( 12.0 ),
    average_stay_duration( 60 * 60 ),
    activity_levels( 10 ),
    al_mu( 5.5 ),
    al_sigma( 2.5 ),
    nr_pois( 1000 ),
    nr_core_pois( 10 ),
    favorites( true ),
    common_favorites( true ),
    walk_speed( 0.8 )
{
}

GeneratorParameters GeneratorParameters::from_options( const OptionMap& options )
{
    const OptionDescriptionList desc = generator_option_descriptions();
    for ( const auto& p : options ) {
        if ( desc.find( p.first ) == desc.end() ) {
            throw std::invalid_argument( "Unknown option " + p.first );
        }
    }

    GeneratorParameters params;
    params.timestep_length = static_cast<int>( get_option_or_default( desc, options, "timestep_length" ).as<int64_t>() );
    params.day_night_cycle = get_option_or_default( desc, options, "day_night_cycle" ).as<bool>();
    params.week_cycle = get_option_or_default( desc, options, "week_cycle" ).as<bool>();
    params.day_hours = get_option_or_default( desc, options, "day_hours" ).as<double>();
    params.average_stay_duration = static_cast<int>( get_option_or_default( desc, options, "average_stay_duration" ).as<int64_t>() );
    params.activity_levels = static_cast<int>( get_option_or_default( desc, options, "activity_levels" ).as<int64_t>() );
    params.al_mu = get_option_or_default( desc, options, "al_mu" ).as<double>();
    params.al_sigma = get_option_or_default( desc, options, "al_sigma" ).as<double>();
    int64_t nr_pois = get_option_or_default( desc, options, "nr_pois" ).as<int64_t>();
    int64_t nr_core_pois = get_option_or_default( desc, options, "nr_core_pois" ).as<int64_t>();
    params.favorites = get_option_or_default( desc, options, "favorites" ).as<bool>();
    params.common_favorites = get_option_or_default( desc, options, "common_favorites" ).as<bool>();
    params.walk_speed = get_option_or_default( desc, options, "walk_speed" ).as<double>();
    int64_t seed = get_option_or_default( desc, options, "seed" ).as<int64_t>();

    if ( params.timestep_length <= 0 ) {
        throw std::invalid_argument( ( boost::format( "timestep_length must be positive, got %1%" ) % params.timestep_length ).str() );
    }
    if ( params.day_hours < 0 || params.day_hours > 24 ) {
        throw std::invalid_argument( ( boost::format( "day_hours must be in [0, 24], got %1%" ) % params.day_hours ).str() );
    }
    if ( params.average_stay_duration < 0 ) {
        throw std::invalid_argument( ( boost::format( "average_stay_duration must not be negative, got %1%" ) % params.average_stay_duration ).str() );
    }
    if ( params.activity_levels < 0 ) {
        throw std::invalid_argument( ( boost::format( "activity_levels must not be negative, got %1%" ) % params.activity_levels ).str() );
    }
    if ( params.al_sigma < 0 ) {
        throw std::invalid_argument( ( boost::format( "al_sigma must not be negative, got %1%" ) % params.al_sigma ).str() );
    }
    if ( nr_pois < 0 || nr_core_pois <= 0 ) {
        throw std::invalid_argument( ( boost::format( "invalid POI counts %1%/%2%" ) % nr_pois % nr_core_pois ).str() );
    }
    if ( params.walk_speed <= 0 ) {
        throw std::invalid_argument( ( boost::format( "walk_speed must be positive, got %1%" ) % params.walk_speed ).str() );
    }
    params.nr_pois = static_cast<size_t>( nr_pois );
    params.nr_core_pois = static_cast<size_t>( nr_core_pois );
    if ( seed >= 0 ) {
        params.seed = static_cast<unsigned>( seed );
    }
    return params;
}

} // Footfall
