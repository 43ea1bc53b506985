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

#define VIBE_LOG_TAG "WSURL"

#include "transport/websocket_url.hpp"

#include <stdlib.h>

#include "common/code_utils.hpp"
#include "utils/string_utils.hpp"

namespace vibe {

namespace {
const char kWsScheme[]  = "ws://";
const char kWssScheme[] = "wss://";
} // namespace

std::string WebSocketUrl::GetHostHeader(void) const
{
    std::string host = (mHost.find(':') != std::string::npos) ? "[" + mHost + "]" : mHost;

    if (mPort != (mSecure ? 443 : 80))
    {
        host += ":" + std::to_string(mPort);
    }

    return host;
}

vibeError ParseWebSocketUrl(const std::string &aText, WebSocketUrl &aUrl)
{
    vibeError   error = VIBE_ERROR_NONE;
    std::string lower = StringUtils::ToLowercase(aText);
    std::string authority;
    std::string portText;
    size_t      start;
    size_t      slash;

    if (lower.compare(0, sizeof(kWssScheme) - 1, kWssScheme) == 0)
    {
        aUrl.mSecure = true;
        start        = sizeof(kWssScheme) - 1;
    }
    else if (lower.compare(0, sizeof(kWsScheme) - 1, kWsScheme) == 0)
    {
        aUrl.mSecure = false;
        start        = sizeof(kWsScheme) - 1;
    }
    else
    {
        ExitNow(error = VIBE_ERROR_INVALID_ARGS);
    }

    slash        = aText.find_first_of("/?#", start);
    authority    = aText.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    aUrl.mTarget = (slash == std::string::npos) ? "/" : aText.substr(slash);
    if (aUrl.mTarget[0] != '/')
    {
        aUrl.mTarget.insert(0, "/");
    }
    aUrl.mTarget = aUrl.mTarget.substr(0, aUrl.mTarget.find('#'));

    VerifyOrExit(!authority.empty() && authority.find('@') == std::string::npos, error = VIBE_ERROR_INVALID_ARGS);

    if (authority[0] == '[')
    {
        size_t close = authority.find(']');

        VerifyOrExit(close != std::string::npos && close > 1, error = VIBE_ERROR_INVALID_ARGS);
        aUrl.mHost = authority.substr(1, close - 1);
        VerifyOrExit(close + 1 == authority.size() || authority[close + 1] == ':', error = VIBE_ERROR_INVALID_ARGS);
        if (close + 1 < authority.size())
        {
            portText = authority.substr(close + 2);
            VerifyOrExit(!portText.empty(), error = VIBE_ERROR_INVALID_ARGS);
        }
    }
    else
    {
        size_t colon = authority.find(':');

        aUrl.mHost = authority.substr(0, colon);
        if (colon != std::string::npos)
        {
            portText = authority.substr(colon + 1);
            VerifyOrExit(!portText.empty(), error = VIBE_ERROR_INVALID_ARGS);
        }
    }

    VerifyOrExit(!aUrl.mHost.empty(), error = VIBE_ERROR_INVALID_ARGS);

    if (portText.empty())
    {
        aUrl.mPort = aUrl.mSecure ? 443 : 80;
    }
    else
    {
        char *end;
        long  port;

        VerifyOrExit(portText.find_first_not_of("0123456789") == std::string::npos, error = VIBE_ERROR_INVALID_ARGS);
        port = strtol(portText.c_str(), &end, 10);
        VerifyOrExit(*end == '\0' && port > 0 && port <= 65535, error = VIBE_ERROR_INVALID_ARGS);
        aUrl.mPort = static_cast<uint16_t>(port);
    }

exit:
    return error;
}

} // namespace vibe
