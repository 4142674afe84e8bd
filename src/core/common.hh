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

//
// This file contains common declarations and constants used by all the objects inside the "Footfall" namespace
//

#ifndef FOOTFALL_COMMON_HH
#define FOOTFALL_COMMON_HH

#include <string>
#include <sstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <typeinfo>

#ifdef _WIN32
#pragma warning(push, 0)
#endif
#include <boost/thread.hpp>
#ifdef _WIN32
#pragma warning(pop)
#endif

///
/// @brief Macro for mutex protected cerr and cout
/// @detailled Macro creates a temporary responsible
/// for freeing the mutex at the end of the line (temporaries are destroyed at the ";")
/// the use of a macro allows to print __FILE__ and __LINE__ to
/// find easilly where a given print is done.
///

#define IOSTREAM_OUTPUT_LOCATION
#ifdef IOSTREAM_OUTPUT_LOCATION
#   define FOOTFALL_LOCATION __FILE__ << ":" << __LINE__ << " "
#else
#   define FOOTFALL_LOCATION ""
#endif

#define CERR if(1) (boost::lock_guard<boost::mutex>( Footfall::iostream_mutex ), std::cerr << FOOTFALL_LOCATION )
#define COUT if(1) (boost::lock_guard<boost::mutex>( Footfall::iostream_mutex ), std::cout << FOOTFALL_LOCATION )

///
/// @mainpage Footfall API
///
/// Footfall generates pedestrian travel demand over a road network.
///
/// Main classes are:
/// - Footfall::RoadNetwork wrapping the road graph read from a SUMO network (see sumo_network.hh)
/// - Footfall::PoiSelector building the set of mutually reachable points of interest
/// - Footfall::PopulationGenerator creating pedestrians and their preferences
/// - Footfall::ItineraryScheduler turning time budgets into trips
/// - Footfall::ScheduleEmitter writing trips and routes for the simulator
/// - Footfall::DemandGenerator which glues everything together
///

namespace Footfall {
extern boost::mutex iostream_mutex; // its a plain old global variable

///
/// The random generator shared by every stochastic component of a run
typedef std::mt19937 RandomGenerator;

///
/// Number of seconds in a day
const long SECONDS_PER_DAY = 24 * 60 * 60;

///
/// Number of minutes in a day
const int MINUTES_PER_DAY = 24 * 60;

// because boost::lexical_cast calls locale, which is not thread safe
struct bad_lexical_cast : public std::exception {
    bad_lexical_cast( const std::string& msg ) : std::exception(), msg_( msg ) {}
    virtual const char* what() const throw() {
        return msg_.c_str();
    }
    virtual ~bad_lexical_cast() throw() {}
    std::string msg_;
};
template <typename TOUT>
struct lexical_cast_aux_ {
    TOUT operator()( const std::string& in ) {
        TOUT out;

        if( !( std::istringstream( in ) >> out ) ) {
            throw bad_lexical_cast( "cannot cast " + in + " to " + typeid( TOUT ).name() );
        }

        return out;
    }
};
template <>
struct lexical_cast_aux_<std::string> {
    std::string operator()( const std::string& in ) {
        return in;
    }
};

template <typename TOUT>
TOUT lexical_cast( const std::string& in )
{
    return lexical_cast_aux_<TOUT>()( in );
}

template <typename TIN>
std::string to_string( const TIN& in )
{
    std::stringstream ss;
    ss << in;
    return ss.str();
}

///
/// Precondition check, throws std::invalid_argument if the condition is false
#define REQUIRE( expr ) {if (!(expr)) { std::stringstream ss; ss << __FILE__ << ":" << __LINE__ << ": Assertion " << #expr << " failed"; throw std::invalid_argument( ss.str() ); }}

template <typename T>
struct remove_const
{
    typedef T type;
};
template <typename T>
struct remove_const<T const>
{
    typedef T type;
};

///
/// Macro used to declare a class property as well as its getter and setter
#define DECLARE_RW_PROPERTY(NAME, TYPE)                \
private:                                               \
  TYPE NAME ## _;                                      \
public:                                                \
  const remove_const<TYPE>::type& NAME() const { return NAME ## _; } \
  void set_##NAME( const remove_const<TYPE>::type& a ) { NAME ## _ = a; }

///
/// Macro used to declare a class property and its getter
#define DECLARE_RO_PROPERTY(NAME, TYPE)                \
private:                                               \
  TYPE NAME ## _;                                      \
public:                                                \
  const remove_const<TYPE>::type& NAME() const { return NAME ## _; }

} // Footfall namespace

#endif
