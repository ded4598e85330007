// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <chrono>
#include <string>

namespace specrec
{
namespace util
{

/// Tracks the time spent in the processing steps, enabled by `--use-timing`.
class UsageTimer
{
public:
    /// Set to `true` to enable tracking.
    bool enabled = false;

    /// Start measuring a new step.
    void reset();

    /// Print the time passed since the last invocation of `reset()`.
    /// @param subject the file or colour being processed.
    /// @param step the name of the step.
    /// @result the elapsed time in milliseconds, 0 if disabled.
    double print( const std::string &subject, const std::string &step ) const;

private:
    std::chrono::steady_clock::time_point _start;
    bool                                  _initialized = false;
};

} //namespace util
} //namespace specrec
