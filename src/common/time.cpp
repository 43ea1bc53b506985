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

#define VIBE_LOG_TAG "TIME"

#include "common/time.hpp"

#include <stddef.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#include "common/code_utils.hpp"

namespace vibe {

std::string FormatUtcTime(WallTime aTime)
{
    char        buffer[40];
    struct tm   utc;
    time_t      seconds = WallClock::to_time_t(aTime);
    long        millis;
    std::size_t length;

    millis = static_cast<long>(
        std::chrono::duration_cast<Milliseconds>(aTime.time_since_epoch()).count() % 1000);
    if (millis < 0)
    {
        millis += 1000;
    }

    gmtime_r(&seconds, &utc);
    length = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buffer + length, sizeof(buffer) - length, ".%03ldZ", millis);

    return buffer;
}

bool ParseUtcTime(const std::string &aText, WallTime &aTime)
{
    bool        successful = false;
    struct tm   utc;
    const char *rest;
    long        millis = 0;

    memset(&utc, 0, sizeof(utc));
    rest = strptime(aText.c_str(), "%Y-%m-%dT%H:%M:%S", &utc);
    VerifyOrExit(rest != nullptr);

    if (*rest == '.')
    {
        char *end;

        millis = strtol(rest + 1, &end, 10);
        VerifyOrExit(end != rest + 1);
        // Scale "5" -> 500 ms, "25" -> 250 ms.
        for (std::ptrdiff_t digits = end - (rest + 1); digits < 3; ++digits)
        {
            millis *= 10;
        }
        for (std::ptrdiff_t digits = end - (rest + 1); digits > 3; --digits)
        {
            millis /= 10;
        }
        rest = end;
    }

    VerifyOrExit(*rest == 'Z' || *rest == '\0');

    aTime      = WallClock::from_time_t(timegm(&utc)) + Milliseconds(millis);
    successful = true;

exit:
    return successful;
}

} // namespace vibe
