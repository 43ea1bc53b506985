/*
 *    Copyright (c) 2026, The Vibe Agent Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @file
 *   This file includes definition for time related utilities.
 */

#ifndef VIBE_COMMON_TIME_HPP_
#define VIBE_COMMON_TIME_HPP_

#include "vibe-agent/config.h"

#include <chrono>
#include <string>

#include <stdint.h>
#include <sys/time.h>

namespace vibe {

using Clock        = std::chrono::steady_clock;
using Duration     = std::chrono::steady_clock::duration;
using TimePoint    = std::chrono::time_point<Clock>;
using MicroSeconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds      = std::chrono::seconds;
using WallClock    = std::chrono::system_clock;
using WallTime     = WallClock::time_point;

/**
 * This method converts a MicroSeconds to a timeval.
 *
 * @param[in] aMicroSeconds  The MicroSeconds to convert.
 *
 * @returns The corresponding timeval.
 *
 */
inline struct timeval GetTimeval(MicroSeconds aMicroSeconds)
{
    struct timeval ret;

    ret.tv_sec  = aMicroSeconds.count() / 1000000;
    ret.tv_usec = aMicroSeconds.count() % 1000000;

    return ret;
}

/**
 * This method converts a timeval to MicroSeconds.
 *
 * @param[in] aTimeval  The timeval to convert.
 *
 * @returns The corresponding MicroSeconds.
 *
 */
inline MicroSeconds GetMicroSeconds(const timeval &aTimeval)
{
    return MicroSeconds{aTimeval.tv_sec * 1000000 + aTimeval.tv_usec};
}

/**
 * This function formats a wall clock time as an ISO-8601 UTC string with millisecond precision,
 * e.g. "2024-03-01T08:15:30.250Z".
 *
 */
std::string FormatUtcTime(WallTime aTime);

/**
 * This function parses an ISO-8601 UTC string produced by FormatUtcTime().
 *
 * The fractional part is optional.
 *
 * @param[in]  aText  The text to parse.
 * @param[out] aTime  The parsed time.
 *
 * @retval TRUE   Successfully parsed @p aText.
 * @retval FALSE  @p aText is not a UTC timestamp.
 *
 */
bool ParseUtcTime(const std::string &aText, WallTime &aTime);

} // namespace vibe

#endif // VIBE_COMMON_TIME_HPP_
