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

#define VIBE_LOG_TAG "LOG"

#include "common/logging.hpp"

#include <assert.h>
#include <errno.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <syslog.h>
#include <time.h>

#include "common/code_utils.hpp"

static vibeLogLevel sLevel         = VIBE_LOG_LEVEL_INFO;
static bool         sSyslogEnabled = true;
static bool         sSyslogOpened  = false;

static const char *const kLevelNames[] = {"CRIT", "WARN", "NOTE", "INFO", "DEBG"};

static int ToSyslogPriority(vibeLogLevel aLevel)
{
    static const int kPriorities[] = {LOG_CRIT, LOG_WARNING, LOG_NOTICE, LOG_INFO, LOG_DEBUG};

    return kPriorities[aLevel];
}

/** Get the current debug log level */
vibeLogLevel vibeLogGetLevel(void)
{
    return sLevel;
}

/**
 * Set current log level.
 */
void vibeLogSetLevel(vibeLogLevel aLevel)
{
    assert(aLevel >= VIBE_LOG_LEVEL_CRIT && aLevel <= VIBE_LOG_LEVEL_DEBG);
    sLevel = aLevel;
}

/** Enable/disable logging with syslog */
void vibeLogEnableSyslog(bool aEnabled)
{
    sSyslogEnabled = aEnabled;
}

/** Initialize logging */
void vibeLogInit(const char *aIdent, vibeLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable)
{
    const char *ident;

    assert(aIdent);
    assert(aLevel >= VIBE_LOG_LEVEL_CRIT && aLevel <= VIBE_LOG_LEVEL_DEBG);

    ident = strrchr(aIdent, '/');
    ident = (ident != nullptr) ? ident + 1 : aIdent;

    vibeLogEnableSyslog(!aSyslogDisable);

    if (sSyslogEnabled)
    {
        openlog(ident, (LOG_CONS | LOG_PID) | (aPrintStderr ? LOG_PERROR : 0), LOG_USER);
        sSyslogOpened = true;
    }

    sLevel = aLevel;
}

/** log to the syslog or standard out */
void vibeLog(vibeLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
{
    va_list ap;

    va_start(ap, aFormat);
    vibeLogv(aLevel, aLogTag, aFormat, ap);
    va_end(ap);
}

/** log to the syslog or standard out */
void vibeLogv(vibeLogLevel aLevel, const char *aLogTag, const char *aFormat, va_list aArgList)
{
    char buffer[1024];

    assert(aFormat);
    VerifyOrExit(aLevel <= sLevel);

    vsnprintf(buffer, sizeof(buffer), aFormat, aArgList);

    if (sSyslogEnabled)
    {
        syslog(ToSyslogPriority(aLevel), "[%s] %s", aLogTag, buffer);
    }
    else
    {
        struct timeval now;
        struct tm      local;
        char           stamp[32];

        gettimeofday(&now, nullptr);
        localtime_r(&now.tv_sec, &local);
        strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);
        printf("%s.%03ld [%s] %-8s: %s\n", stamp, static_cast<long>(now.tv_usec / 1000), kLevelNames[aLevel], aLogTag,
               buffer);
        fflush(stdout);
    }

exit:
    return;
}

const char *vibeErrorString(vibeError aError)
{
    const char *error;

    switch (aError)
    {
    case VIBE_ERROR_NONE:
        error = "OK";
        break;

    case VIBE_ERROR_ERRNO:
        error = strerror(errno);
        break;

    case VIBE_ERROR_INVALID_ARGS:
        error = "Invalid arguments";
        break;

    case VIBE_ERROR_INVALID_STATE:
        error = "Invalid state";
        break;

    case VIBE_ERROR_NOT_FOUND:
        error = "Not found";
        break;

    case VIBE_ERROR_ALREADY:
        error = "Already exists";
        break;

    case VIBE_ERROR_BUSY:
        error = "Busy";
        break;

    case VIBE_ERROR_PARSE:
        error = "Parse error";
        break;

    case VIBE_ERROR_NOT_CONNECTED:
        error = "Not connected";
        break;

    case VIBE_ERROR_AUTH:
        error = "Authentication failed";
        break;

    case VIBE_ERROR_UNSUPPORTED:
        error = "Unsupported";
        break;

    default:
        error = "Unknown";
    }

    return error;
}

void vibeLogDeinit(void)
{
    if (sSyslogOpened)
    {
        closelog();
        sSyslogOpened = false;
    }
}
