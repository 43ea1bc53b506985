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

#define VIBE_LOG_TAG "TOKEN"

#include "agent/token_provider.hpp"

#include <json/json.h>

#include "common/time.hpp"
#include "utils/file_utils.hpp"
#include "utils/json_utils.hpp"

namespace vibe {

namespace {
const char   kAuthFileName[]        = "auth.json";
const char   kLegacyTokenFileName[] = "token";
const mode_t kCredentialsMode       = 0600;
const mode_t kDirectoryMode         = 0700;

std::string Trim(const std::string &aText)
{
    size_t begin = aText.find_first_not_of(" \t\r\n");
    size_t end   = aText.find_last_not_of(" \t\r\n");

    return (begin == std::string::npos) ? std::string() : aText.substr(begin, end - begin + 1);
}
} // namespace

StoredTokenProvider::StoredTokenProvider(const std::string &aDirectory)
    : mDirectory(aDirectory)
    , mAuthFile(Utils::JoinPath(aDirectory, kAuthFileName))
    , mLegacyTokenFile(Utils::JoinPath(aDirectory, kLegacyTokenFileName))
{
}

vibeError StoredTokenProvider::ReadToken(std::string &aToken) const
{
    vibeError   error;
    Json::Value auth;
    std::string legacy;

    if (JsonUtils::ReadFile(mAuthFile, auth) == VIBE_ERROR_NONE && auth.isObject())
    {
        aToken = JsonUtils::GetString(auth, "idToken");
        if (!aToken.empty())
        {
            ExitNow(error = VIBE_ERROR_NONE);
        }
    }

    SuccessOrExit(error = Utils::ReadFile(mLegacyTokenFile, legacy), error = VIBE_ERROR_NOT_FOUND);
    aToken = Trim(legacy);
    error  = aToken.empty() ? VIBE_ERROR_NOT_FOUND : VIBE_ERROR_NONE;

exit:
    return error;
}

vibeError StoredTokenProvider::EnsureValidToken(std::string &aToken)
{
    vibeError error;

    SuccessOrExit(error = ReadToken(aToken), vibeLogWarn("No credentials in %s", mAuthFile.c_str()));
    mLastToken = aToken;

exit:
    return error;
}

vibeError StoredTokenProvider::RefreshIdToken(std::string &aToken)
{
    vibeError   error = VIBE_ERROR_NONE;
    std::string token;

    VerifyOrExit(ReadToken(token) == VIBE_ERROR_NONE, error = VIBE_ERROR_AUTH);
    VerifyOrExit(token != mLastToken, error = VIBE_ERROR_AUTH);

    aToken     = token;
    mLastToken = token;
    vibeLogInfo("Picked up a refreshed token");

exit:
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogWarn("No refreshed token available, sign in again");
    }
    return error;
}

vibeError StoredTokenProvider::StoreToken(const std::string &aToken)
{
    vibeError   error;
    Json::Value auth;

    if (JsonUtils::ReadFile(mAuthFile, auth) != VIBE_ERROR_NONE || !auth.isObject())
    {
        auth = Json::Value(Json::objectValue);
    }

    auth["idToken"]   = aToken;
    auth["updatedAt"] = FormatUtcTime(WallClock::now());

    SuccessOrExit(error = Utils::EnsureDirectory(mDirectory, kDirectoryMode));
    SuccessOrExit(error = JsonUtils::WriteFile(mAuthFile, auth, kCredentialsMode));
    vibeLogInfo("Token saved to %s", mAuthFile.c_str());

exit:
    return error;
}

bool StoredTokenProvider::HasCredentials(void) const
{
    std::string token;

    return ReadToken(token) == VIBE_ERROR_NONE;
}

} // namespace vibe
