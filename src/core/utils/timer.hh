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

#ifndef FOOTFALL_UTILS_TIMER_HH
#define FOOTFALL_UTILS_TIMER_HH

#include <chrono>

///
/// Wall clock timer, used to log how long the generation phases last
class Timer
{
public:
    Timer() : start_( std::chrono::steady_clock::now() ) {}

    void restart()
    {
        start_ = std::chrono::steady_clock::now();
    }

    ///
    /// Seconds since construction or the last restart
    double elapsed() const
    {
        return std::chrono::duration<double>( std::chrono::steady_clock::now() - start_ ).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

#endif
