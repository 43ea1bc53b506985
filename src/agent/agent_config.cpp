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

#define VIBE_LOG_TAG "CONFIG"

#include "agent/agent_config.hpp"

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <string.h>
#include <stdlib.h>
#include <unistd.h>

#include "utils/file_utils.hpp"
#include "utils/json_utils.hpp"

namespace vibe {

namespace {
const char   kConfigFileName[]    = "config.json";
const char   kHistoryFileName[]   = "session-history.json";
const char   kPortFileName[]      = "port";
const char   kPidFileName[]       = "pid";
const char   kStartTimeFileName[] = "start_time";
const mode_t kDirectoryMode       = 0700;
const mode_t kFileMode            = 0600;
const mode_t kRuntimeFileMode     = 0644;

bool ParseUnsigned(const std::string &aText, unsigned long aMax, unsigned long &aValue)
{
    bool  parsed = false;
    char *end;

    VerifyOrExit(!aText.empty() && isdigit(static_cast<unsigned char>(aText[0])));
    errno  = 0;
    aValue = strtoul(aText.c_str(), &end, 10);
    VerifyOrExit(errno == 0 && (*end == '\0' || strcmp(end, "\n") == 0) && aValue <= aMax);
    parsed = true;

exit:
    return parsed;
}

} // namespace

AgentConfig::AgentConfig(const std::string &aDirectory)
    : mDirectory(aDirectory)
    , mDocument(Json::objectValue)
    , mE2e(false)
{
}

std::string AgentConfig::GetFilePath(const char *aName) const
{
    return Utils::JoinPath(mDirectory, aName);
}

std::string AgentConfig::GetHistoryFilePath(void) const
{
    return GetFilePath(kHistoryFileName);
}

vibeError AgentConfig::Load(void)
{
    vibeError   error;
    Json::Value document;

    error = JsonUtils::ReadFile(GetFilePath(kConfigFileName), document);
    if (error == VIBE_ERROR_NOT_FOUND)
    {
        ExitNow(error = VIBE_ERROR_NONE);
    }
    SuccessOrExit(error);
    VerifyOrExit(document.isObject(), error = VIBE_ERROR_PARSE);

    mDocument  = document;
    mAgentId   = JsonUtils::GetString(document, "agentId");
    mBridgeUrl = JsonUtils::GetString(document, "bridgeUrl");
    mHostName  = JsonUtils::GetString(document, "hostName");
    mE2e       = document.get("e2e", false).isBool() && document["e2e"].asBool();

exit:
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Ignoring malformed %s: %s", GetFilePath(kConfigFileName).c_str(), vibeErrorString(error));
    }
    return error;
}

vibeError AgentConfig::Save(void)
{
    vibeError error;

    mDocument["agentId"]   = JsonUtils::StringOrNull(mAgentId);
    mDocument["bridgeUrl"] = JsonUtils::StringOrNull(mBridgeUrl);
    mDocument["hostName"]  = JsonUtils::StringOrNull(mHostName);
    mDocument["e2e"]       = mE2e;

    SuccessOrExit(error = Utils::EnsureDirectory(mDirectory, kDirectoryMode));
    SuccessOrExit(error = JsonUtils::WriteFile(GetFilePath(kConfigFileName), mDocument, kFileMode));

exit:
    vibeLogResult(error, "Save %s", GetFilePath(kConfigFileName).c_str());
    return error;
}

std::string AgentConfig::GetBridgeUrl(void) const
{
    return mBridgeUrl.empty() ? std::string(VIBE_CONFIG_DEFAULT_BRIDGE_URL) : mBridgeUrl;
}

std::string AgentConfig::GetHostName(void) const
{
    std::string hostName = mHostName;
    char        buffer[HOST_NAME_MAX + 1];

    if (hostName.empty() && gethostname(buffer, sizeof(buffer)) == 0)
    {
        buffer[sizeof(buffer) - 1] = '\0';
        hostName                   = buffer;
    }

    return hostName.empty() ? std::string("unknown") : hostName;
}

vibeError AgentConfig::WriteRuntimeFiles(const AgentRuntimeInfo &aInfo) const
{
    vibeError error;

    SuccessOrExit(error = Utils::EnsureDirectory(mDirectory, kDirectoryMode));
    SuccessOrExit(error = Utils::WriteFile(GetFilePath(kPortFileName), std::to_string(aInfo.mPort), kRuntimeFileMode));
    SuccessOrExit(error = Utils::WriteFile(GetFilePath(kPidFileName), std::to_string(aInfo.mPid), kRuntimeFileMode));
    SuccessOrExit(error = Utils::WriteFile(GetFilePath(kStartTimeFileName), FormatUtcTime(aInfo.mStartTime),
                                           kRuntimeFileMode));

exit:
    vibeLogResult(error, "Advertise port %u in %s", aInfo.mPort, mDirectory.c_str());
    return error;
}

void AgentConfig::RemoveRuntimeFiles(void) const
{
    for (const char *name : {kPortFileName, kPidFileName, kStartTimeFileName})
    {
        vibeError error = Utils::RemoveFile(GetFilePath(name));

        if (error != VIBE_ERROR_NONE)
        {
            vibeLogWarn("Failed to remove %s: %s", GetFilePath(name).c_str(), vibeErrorString(error));
        }
    }
}

vibeError AgentConfig::ReadRuntimeInfo(AgentRuntimeInfo &aInfo) const
{
    vibeError     error;
    std::string   text;
    unsigned long value;

    SuccessOrExit(error = Utils::ReadFile(GetFilePath(kPidFileName), text));
    VerifyOrExit(ParseUnsigned(text, INT_MAX, value) && value > 0, error = VIBE_ERROR_PARSE);
    aInfo.mPid = static_cast<pid_t>(value);

    SuccessOrExit(error = Utils::ReadFile(GetFilePath(kPortFileName), text));
    VerifyOrExit(ParseUnsigned(text, UINT16_MAX, value), error = VIBE_ERROR_PARSE);
    aInfo.mPort = static_cast<uint16_t>(value);

    aInfo.mStartTime = WallTime();
    if (Utils::ReadFile(GetFilePath(kStartTimeFileName), text) == VIBE_ERROR_NONE)
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == ' '))
        {
            text.pop_back();
        }
        if (!ParseUtcTime(text, aInfo.mStartTime))
        {
            aInfo.mStartTime = WallTime();
        }
    }

exit:
    return error;
}

} // namespace vibe
