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
 * This file define logging interface.
 */
#ifndef VIBE_COMMON_LOGGING_HPP_
#define VIBE_COMMON_LOGGING_HPP_

#include "vibe-agent/config.h"

#include <stdarg.h>
#include <stddef.h>

#include "common/types.hpp"

#ifndef VIBE_LOG_TAG
#define VIBE_LOG_TAG ""
#endif

/**
 * Logging level.
 *
 */
typedef enum
{
    VIBE_LOG_LEVEL_CRIT, ///< Critical conditions.
    VIBE_LOG_LEVEL_WARN, ///< Warning conditions.
    VIBE_LOG_LEVEL_NOTE, ///< Normal but significant condition.
    VIBE_LOG_LEVEL_INFO, ///< Informational.
    VIBE_LOG_LEVEL_DEBG, ///< Debug-level messages.
} vibeLogLevel;

/**
 * Get current log level
 */
vibeLogLevel vibeLogGetLevel(void);

/**
 * Set current log level
 */
void vibeLogSetLevel(vibeLogLevel aLevel);

/**
 * Control log to syslog
 *
 * @param[in] enable  True to enable logging to/via syslog.
 *
 */
void vibeLogEnableSyslog(bool aEnabled);

/**
 * This function initialize the logging service.
 *
 * @param[in] aIdent          Identity of the logger.
 * @param[in] aLevel          Log level of the logger.
 * @param[in] aPrintStderr    Whether to log to stderr.
 * @param[in] aSyslogDisable  Whether to disable logging to syslog and print to stdout instead.
 *
 */
void vibeLogInit(const char *aIdent, vibeLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable);

/**
 * This function log at level @p aLevel.
 *
 * @param[in] aLevel   Log level of the logger.
 * @param[in] aLogTag  Log tag.
 * @param[in] aFormat  Format string as in printf.
 *
 */
void vibeLog(vibeLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * This function log at level @p aLevel.
 *
 * @param[in] aLevel   Log level of the logger.
 * @param[in] aLogTag  Log tag.
 * @param[in] aFormat  Format string as in printf.
 * @param[in] aArgList The variable-length arguments list.
 *
 */
void vibeLogv(vibeLogLevel aLevel, const char *aLogTag, const char *aFormat, va_list aArgList);

/**
 * This function converts error code to string.
 *
 * @param[in] aError  The error code.
 *
 * @returns The string information of error.
 *
 */
const char *vibeErrorString(vibeError aError);

/**
 * This function deinitializes the logging service.
 *
 */
void vibeLogDeinit(void);

/**
 * This macro log an action result according to @p aError.
 *
 * If @p aError is VIBE_ERROR_NONE, the log level is VIBE_LOG_LEVEL_INFO,
 * otherwise the log level is VIBE_LOG_LEVEL_WARN.
 *
 * @param[in] aError   The action result.
 * @param[in] aFormat  Format string as in printf.
 * @param[in] ...      Arguments for the format specification.
 *
 */
#define vibeLogResult(aError, aFormat, ...)                                                                        \
    do                                                                                                             \
    {                                                                                                              \
        vibeError _err = (aError);                                                                                 \
        vibeLog(_err == VIBE_ERROR_NONE ? VIBE_LOG_LEVEL_INFO : VIBE_LOG_LEVEL_WARN, VIBE_LOG_TAG, aFormat ": %s", \
                ##__VA_ARGS__, vibeErrorString(_err));                                                             \
    } while (0)

/**
 * @def vibeLogCrit
 *
 * Logging at log level critical.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */

/**
 * @def vibeLogWarn
 *
 * Logging at log level warning.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */

/**
 * @def vibeLogNote
 *
 * Logging at log level note
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */

/**
 * @def vibeLogInfo
 *
 * Logging at log level information.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */

/**
 * @def vibeLogDebg
 *
 * Logging at log level debug.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
#define vibeLogCrit(...) vibeLog(VIBE_LOG_LEVEL_CRIT, VIBE_LOG_TAG, __VA_ARGS__)
#define vibeLogWarn(...) vibeLog(VIBE_LOG_LEVEL_WARN, VIBE_LOG_TAG, __VA_ARGS__)
#define vibeLogNote(...) vibeLog(VIBE_LOG_LEVEL_NOTE, VIBE_LOG_TAG, __VA_ARGS__)
#define vibeLogInfo(...) vibeLog(VIBE_LOG_LEVEL_INFO, VIBE_LOG_TAG, __VA_ARGS__)
#define vibeLogDebg(...) vibeLog(VIBE_LOG_LEVEL_DEBG, VIBE_LOG_TAG, __VA_ARGS__)

#endif // VIBE_COMMON_LOGGING_HPP_
