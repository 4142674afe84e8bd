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

#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/format.hpp>

#include "process.hh"
#include "errors.hh"
#include "common.hh"

namespace Footfall {

namespace {
// exit status of the child when it cannot enter the working directory
const int CHDIR_FAILURE = 126;
}

int run_process( const std::vector<std::string>& args, const std::string& working_directory )
{
    if ( args.empty() ) {
        throw std::invalid_argument( "run_process(): no program given" );
    }

    const std::string command_line = boost::algorithm::join( args, " " );

    std::vector<char*> argv;
    for ( const std::string& a : args ) {
        argv.push_back( const_cast<char*>( a.c_str() ) );
    }
    argv.push_back( nullptr );

    if ( !working_directory.empty() && access( working_directory.c_str(), X_OK ) != 0 ) {
        throw ExternalOracleFailure( ( boost::format( "Cannot run '%1%' in %2%: %3%" ) % command_line % working_directory % strerror( errno ) ).str() );
    }

    // flush before forking, buffered output would be written twice
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = fork();
    if ( pid < 0 ) {
        throw ExternalOracleFailure( ( boost::format( "Cannot run '%1%': %2%" ) % command_line % strerror( errno ) ).str() );
    }
    if ( pid == 0 ) {
        if ( !working_directory.empty() && chdir( working_directory.c_str() ) != 0 ) {
            _exit( CHDIR_FAILURE );
        }
        execvp( argv[0], argv.data() );
        _exit( 127 );
    }

    int status = 0;
    while ( waitpid( pid, &status, 0 ) < 0 ) {
        if ( errno != EINTR ) {
            throw ExternalOracleFailure( ( boost::format( "Cannot wait for '%1%': %2%" ) % command_line % strerror( errno ) ).str() );
        }
    }

    if ( WIFSIGNALED( status ) ) {
        throw ExternalOracleFailure( ( boost::format( "'%1%' killed by signal %2%" ) % command_line % WTERMSIG( status ) ).str() );
    }
    int code = WEXITSTATUS( status );
    if ( code == 127 ) {
        CERR << "'" << command_line << "' exited with 127, the program may not be installed" << std::endl;
    }
    else if ( code == CHDIR_FAILURE && !working_directory.empty() ) {
        CERR << "'" << command_line << "' exited with " << CHDIR_FAILURE << ", " << working_directory << " may not be accessible" << std::endl;
    }
    return code;
}

void run_process_checked( const std::vector<std::string>& args, const std::string& working_directory )
{
    int code = run_process( args, working_directory );
    if ( code != 0 ) {
        throw ExternalOracleFailure( ( boost::format( "'%1%' exited with status %2%" ) % boost::algorithm::join( args, " " ) % code ).str() );
    }
}

} // Footfall namespace
