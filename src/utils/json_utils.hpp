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
 *   This file includes definitions for JSON helpers on top of jsoncpp.
 */

#ifndef VIBE_UTILS_JSON_UTILS_HPP_
#define VIBE_UTILS_JSON_UTILS_HPP_

#include <string>

#include <sys/types.h>

#include <json/json.h>

#include "common/types.hpp"

namespace vibe {
namespace JsonUtils {

/**
 * This function parses a JSON document.
 *
 * @param[in]  aText   The text to parse.
 * @param[out] aValue  The parsed document.
 *
 * @retval VIBE_ERROR_NONE   Successfully parsed the document.
 * @retval VIBE_ERROR_PARSE  @p aText is not valid JSON.
 *
 */
vibeError Parse(const std::string &aText, Json::Value &aValue);

/**
 * This function serializes @p aValue on a single line.
 *
 */
std::string Write(const Json::Value &aValue);

/**
 * This function serializes @p aValue indented for humans.
 *
 */
std::string WriteStyled(const Json::Value &aValue);

/**
 * This function loads a JSON document from @p aPath.
 *
 * @retval VIBE_ERROR_NONE       Successfully loaded the document.
 * @retval VIBE_ERROR_NOT_FOUND  The file does not exist.
 * @retval VIBE_ERROR_PARSE      The file is not valid JSON.
 * @retval VIBE_ERROR_ERRNO      Failed to read the file.
 *
 */
vibeError ReadFile(const std::string &aPath, Json::Value &aValue);

/**
 * This function stores @p aValue to @p aPath atomically with permissions @p aMode.
 *
 */
vibeError WriteFile(const std::string &aPath, const Json::Value &aValue, mode_t aMode);

/**
 * This function returns the string member @p aKey of @p aObject, or @p aDefault if it is missing or not a string.
 *
 */
std::string GetString(const Json::Value &aObject, const char *aKey, const std::string &aDefault = "");

/**
 * This function returns a string value, or null for an empty string.
 *
 */
Json::Value StringOrNull(const std::string &aString);

} // namespace JsonUtils
} // namespace vibe

#endif // VIBE_UTILS_JSON_UTILS_HPP_
