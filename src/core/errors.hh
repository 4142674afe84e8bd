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

#ifndef FOOTFALL_ERRORS_HH
#define FOOTFALL_ERRORS_HH

#include <stdexcept>
#include <string>

namespace Footfall {

///
/// No viable set of mutually reachable points of interest can be found.
/// Fatal for the engine setup: the number of core POIs or the network has to change.
struct InsufficientConnectivityError : public std::runtime_error {
    InsufficientConnectivityError( const std::string& msg ) : std::runtime_error( msg ) {}
};

///
/// A scheduled leg has no path between its two locations
struct UnreachablePOIError : public std::runtime_error {
    UnreachablePOIError( const std::string& from, const std::string& to ) :
        std::runtime_error( "No path from " + from + " to " + to ), from_( from ), to_( to ) {}
    virtual ~UnreachablePOIError() throw() {}

    const std::string& from() const { return from_; }
    const std::string& to() const { return to_; }
private:
    std::string from_;
    std::string to_;
};

///
/// An external program (router, simulator) failed or produced something unexpected
struct ExternalOracleFailure : public std::runtime_error {
    ExternalOracleFailure( const std::string& msg ) : std::runtime_error( msg ) {}
};

///
/// A probability vector does not sum to 1
struct DistributionNormalizationError : public std::runtime_error {
    DistributionNormalizationError( const std::string& msg ) : std::runtime_error( msg ) {}
};

} // Footfall namespace

#endif
