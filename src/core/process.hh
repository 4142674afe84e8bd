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

#ifndef FOOTFALL_PROCESS_HH
#define FOOTFALL_PROCESS_HH

#include <string>
#include <vector>

namespace Footfall {

///
/// Run an external program and wait for it.
/// The program is looked up in the PATH.
/// @param[in] args program name followed by its arguments
/// @param[in] working_directory directory to run into, the current one if empty
/// @returns the exit status of the program
/// @throws ExternalOracleFailure if the program cannot be started, the working directory cannot be entered
/// or the program is killed by a signal
int run_process( const std::vector<std::string>& args, const std::string& working_directory = "" );

///
/// Run an external program and throw an ExternalOracleFailure if it does not exit with 0
void run_process_checked( const std::vector<std::string>& args, const std::string& working_directory = "" );

} // Footfall namespace

#endif
