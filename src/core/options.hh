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

#ifndef FOOTFALL_OPTIONS_HH
#define FOOTFALL_OPTIONS_HH

#include <string>
#include <boost/optional.hpp>

#include <map>
#include <stdint.h>
#include <boost/variant.hpp>

#include "common.hh"

namespace Footfall {

///
/// Type of an option, given by its default value
enum OptionType {
    BoolOption,
    IntOption,
    FloatOption, // stored as a double
    StringOption
};

namespace detail {
///
/// Conversion of a stored option value to the requested type
template <typename T>
struct OptionConverter : public boost::static_visitor<T> {
    T operator()( bool b ) const { return static_cast<T>( b ); }
    T operator()( int64_t i ) const { return static_cast<T>( i ); }
    T operator()( double f ) const { return static_cast<T>( f ); }
    T operator()( const std::string& s ) const { return lexical_cast<T>( s ); }
};

template <>
struct OptionConverter<bool> : public boost::static_visitor<bool> {
    bool operator()( bool b ) const { return b; }
    bool operator()( int64_t i ) const { return i != 0; }
    bool operator()( double f ) const { return f != 0.0; }
    bool operator()( const std::string& s ) const { return s == "true" || s == "1"; }
};

template <>
struct OptionConverter<std::string> : public boost::static_visitor<std::string> {
    std::string operator()( bool b ) const { return b ? "true" : "false"; }
    template <typename U>
    std::string operator()( const U& u ) const { return to_string( u ); }
};
}

///
/// Value of a generator option
class OptionValue
{
public:
    OptionValue() : v_( false ) {}

    static OptionValue from_bool( bool b ) { return OptionValue( Value( b ) ); }
    static OptionValue from_int( int64_t i ) { return OptionValue( Value( i ) ); }
    static OptionValue from_float( double f ) { return OptionValue( Value( f ) ); }
    static OptionValue from_string( const std::string& s ) { return OptionValue( Value( s ) ); }

    ///
    /// Parse a value given as text (configuration file, command line)
    /// @throws bad_lexical_cast if the text cannot be converted
    static OptionValue parse( const std::string& s, OptionType type );

    OptionType type() const { return OptionType( v_.which() ); }

    template <typename T>
    T as() const {
        return boost::apply_visitor( detail::OptionConverter<T>(), v_ );
    }

    std::string str() const { return as<std::string>(); }

private:
    // same order as OptionType
    typedef boost::variant<bool, int64_t, double, std::string> Value;
    explicit OptionValue( const Value& v ) : v_( v ) {}
    Value v_;
};

typedef std::map<std::string, OptionValue> OptionMap;

///
/// Option description
struct OptionDescription {
    std::string description;
    OptionValue default_value;
    OptionType type() const {
        return default_value.type();
    }
};

struct OptionDescriptionList : public std::map<std::string, OptionDescription>
{
    ///
    /// Method used to declare an option
    void declare_option( const std::string& nname, const std::string& description, const OptionValue& default_value ) {
        ( *this )[nname].description = description;
        ( *this )[nname].default_value = default_value;
    }
};

///
/// Options understood by the demand generator, with their default values
OptionDescriptionList generator_option_descriptions();

///
/// Gets an option value, or the default value if unavailable
/// @throws std::invalid_argument if the option is not declared
OptionValue get_option_or_default( const OptionDescriptionList& desc, const OptionMap& options, const std::string& key );

///
/// Typed view of the demand generator options
struct GeneratorParameters {
    /// How many seconds a simulation step lasts
    int timestep_length;
    /// Whether departures follow a day/night cycle
    bool day_night_cycle;
    /// Whether weekend days get less travel time
    bool week_cycle;
    /// How many hours of a day are active
    double day_hours;
    /// How many seconds a pedestrian stays somewhere on average
    int average_stay_duration;
    /// Highest activity level
    int activity_levels;
    double al_mu;
    double al_sigma;
    /// Number of POIs to select, 0 means every reachable section
    size_t nr_pois;
    /// Number of candidates for the core POIs
    size_t nr_core_pois;
    /// Personal favorite places
    bool favorites;
    /// Population-wide favorite places
    bool common_favorites;
    /// Walking speed, in m/s
    double walk_speed;
    /// Seed of the random generator, none means a nondeterministic seed
    boost::optional<unsigned> seed;

    ///
    /// Default parameters
    GeneratorParameters();

    ///
    /// Resolve user options against generator_option_descriptions()
    /// @throws std::invalid_argument on unknown options or out of range values
    static GeneratorParameters from_options( const OptionMap& options );

    ///
    /// Fraction of a day spent being active
    double day_fraction() const { return day_hours / 24.0; }
};

} // Footfall

#endif
