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
 *   This file includes definitions for string helpers.
 */

#ifndef VIBE_UTILS_STRING_UTILS_HPP_
#define VIBE_UTILS_STRING_UTILS_HPP_

#include <string>

namespace vibe {
namespace StringUtils {

/**
 * This function returns a lower case copy of @p aString.
 *
 */
std::string ToLowercase(const std::string &aString);

/**
 * This function returns the first eight characters of a session id, which is enough to tell sessions apart in logs.
 *
 */
std::string ShortId(const std::string &aId);

/**
 * This function strips ANSI escape sequences and control characters from terminal output and collapses runs of
 * whitespace, so a line of CLI output can be written to the log.
 *
 */
std::string StripTerminalControl(const std::string &aText);

/**
 * This function truncates @p aText to at most @p aMaxLength bytes, appending "..." when truncated.
 *
 */
std::string Truncate(const std::string &aText, size_t aMaxLength);

} // namespace StringUtils
} // namespace vibe

#endif // VIBE_UTILS_STRING_UTILS_HPP_
