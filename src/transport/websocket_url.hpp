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
 *   This file includes definitions for parsing WebSocket URLs.
 */

#ifndef VIBE_TRANSPORT_WEBSOCKET_URL_HPP_
#define VIBE_TRANSPORT_WEBSOCKET_URL_HPP_

#include "vibe-agent/config.h"

#include <string>

#include <stdint.h>

#include "common/types.hpp"

namespace vibe {

/**
 * This structure represents the parts of a `ws://` or `wss://` URL.
 *
 */
struct WebSocketUrl
{
    bool        mSecure;
    std::string mHost;
    uint16_t    mPort;
    std::string mTarget; ///< The request target, at least "/".

    /**
     * This method returns the value of the HTTP `Host` header for the handshake.
     *
     */
    std::string GetHostHeader(void) const;
};

/**
 * This function parses a WebSocket URL.
 *
 * The port defaults to 80 for `ws` and 443 for `wss`. IPv6 literals are accepted in brackets.
 *
 * @param[in]  aText  The URL text.
 * @param[out] aUrl   The parsed URL.
 *
 * @retval VIBE_ERROR_NONE          Successfully parsed the URL.
 * @retval VIBE_ERROR_INVALID_ARGS  The scheme, host or port is invalid.
 *
 */
vibeError ParseWebSocketUrl(const std::string &aText, WebSocketUrl &aUrl);

} // namespace vibe

#endif // VIBE_TRANSPORT_WEBSOCKET_URL_HPP_
