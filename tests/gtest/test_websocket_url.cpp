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

#include <gtest/gtest.h>

#include "transport/websocket_url.hpp"

using vibe::ParseWebSocketUrl;
using vibe::WebSocketUrl;

TEST(WebSocketUrl, TestSecureDefaults)
{
    WebSocketUrl url;

    ASSERT_EQ(VIBE_ERROR_NONE, ParseWebSocketUrl("wss://ws.minivibeapp.com", url));
    EXPECT_TRUE(url.mSecure);
    EXPECT_EQ("ws.minivibeapp.com", url.mHost);
    EXPECT_EQ(443, url.mPort);
    EXPECT_EQ("/", url.mTarget);
    EXPECT_EQ("ws.minivibeapp.com", url.GetHostHeader());
}

TEST(WebSocketUrl, TestPlainWithPortAndTarget)
{
    WebSocketUrl url;

    ASSERT_EQ(VIBE_ERROR_NONE, ParseWebSocketUrl("ws://localhost:8080/agent?v=1#frag", url));
    EXPECT_FALSE(url.mSecure);
    EXPECT_EQ("localhost", url.mHost);
    EXPECT_EQ(8080, url.mPort);
    EXPECT_EQ("/agent?v=1", url.mTarget);
    EXPECT_EQ("localhost:8080", url.GetHostHeader());
}

TEST(WebSocketUrl, TestSchemeIsCaseInsensitive)
{
    WebSocketUrl url;

    ASSERT_EQ(VIBE_ERROR_NONE, ParseWebSocketUrl("WS://Example.org", url));
    EXPECT_FALSE(url.mSecure);
    EXPECT_EQ("Example.org", url.mHost);
    EXPECT_EQ(80, url.mPort);
}

TEST(WebSocketUrl, TestIpv6Literal)
{
    WebSocketUrl url;

    ASSERT_EQ(VIBE_ERROR_NONE, ParseWebSocketUrl("ws://[::1]:9999", url));
    EXPECT_EQ("::1", url.mHost);
    EXPECT_EQ(9999, url.mPort);
    EXPECT_EQ("[::1]:9999", url.GetHostHeader());
}

TEST(WebSocketUrl, TestRejectsMalformedUrls)
{
    WebSocketUrl url;

    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("https://example.org", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://:80/", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://host:/", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://host:0", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://host:70000", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://host:8o", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://user@host", url));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, ParseWebSocketUrl("ws://[::1", url));
}
