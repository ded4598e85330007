// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/usage_timer.h>

#include <iostream>
#include <iomanip>

namespace specrec
{
namespace util
{

void UsageTimer::reset()
{
    if ( enabled )
    {
        _start       = std::chrono::steady_clock::now();
        _initialized = true;
    }
}

double
UsageTimer::print( const std::string &subject, const std::string &step ) const
{
    if ( !enabled || !_initialized )
        return 0;

    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - _start;

    std::ios_base::fmtflags flags     = std::cerr.flags();
    std::streamsize         precision = std::cerr.precision();

    std::cerr << "Timing: " << subject << "/" << step << ": " << std::fixed
              << std::setprecision( 3 ) << elapsed.count() << "msec"
              << std::endl;

    std::cerr.flags( flags );
    std::cerr.precision( precision );

    return elapsed.count();
}

} //namespace util
} //namespace specrec
