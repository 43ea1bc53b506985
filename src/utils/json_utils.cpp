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

#define VIBE_LOG_TAG "JSON"

#include "utils/json_utils.hpp"

#include <memory>

#include "common/code_utils.hpp"
#include "utils/file_utils.hpp"

namespace vibe {
namespace JsonUtils {

vibeError Parse(const std::string &aText, Json::Value &aValue)
{
    vibeError                         error = VIBE_ERROR_NONE;
    Json::CharReaderBuilder           builder;
    std::unique_ptr<Json::CharReader> reader;
    std::string                       errors;

    builder["collectComments"] = false;
    reader.reset(builder.newCharReader());

    VerifyOrExit(reader->parse(aText.data(), aText.data() + aText.size(), &aValue, &errors), error = VIBE_ERROR_PARSE);

exit:
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogDebg("Failed to parse JSON: %s", errors.c_str());
    }
    return error;
}

std::string Write(const Json::Value &aValue)
{
    Json::StreamWriterBuilder builder;

    builder["indentation"] = "";
    return Json::writeString(builder, aValue);
}

std::string WriteStyled(const Json::Value &aValue)
{
    Json::StreamWriterBuilder builder;

    builder["indentation"] = "  ";
    return Json::writeString(builder, aValue) + "\n";
}

vibeError ReadFile(const std::string &aPath, Json::Value &aValue)
{
    vibeError   error;
    std::string content;

    SuccessOrExit(error = Utils::ReadFile(aPath, content));
    error = Parse(content, aValue);

exit:
    return error;
}

vibeError WriteFile(const std::string &aPath, const Json::Value &aValue, mode_t aMode)
{
    return Utils::WriteFile(aPath, WriteStyled(aValue), aMode);
}

std::string GetString(const Json::Value &aObject, const char *aKey, const std::string &aDefault)
{
    std::string result = aDefault;

    VerifyOrExit(aObject.isObject());
    {
        const Json::Value &member = aObject[aKey];

        VerifyOrExit(member.isString());
        result = member.asString();
    }

exit:
    return result;
}

Json::Value StringOrNull(const std::string &aString)
{
    return aString.empty() ? Json::Value(Json::nullValue) : Json::Value(aString);
}

} // namespace JsonUtils
} // namespace vibe
