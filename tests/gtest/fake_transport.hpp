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

#ifndef VIBE_TESTS_GTEST_FAKE_TRANSPORT_HPP_
#define VIBE_TESTS_GTEST_FAKE_TRANSPORT_HPP_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "agent/token_provider.hpp"
#include "transport/websocket_client.hpp"
#include "transport/websocket_server.hpp"
#include "utils/json_utils.hpp"

namespace vibe {
namespace Test {

inline std::vector<Json::Value> ParseAll(const std::vector<std::string> &aTexts)
{
    std::vector<Json::Value> values;

    for (const std::string &text : aTexts)
    {
        Json::Value value;

        if (JsonUtils::Parse(text, value) == VIBE_ERROR_NONE)
        {
            values.push_back(value);
        }
    }

    return values;
}

inline std::vector<Json::Value> FilterByType(const std::vector<Json::Value> &aMessages, const std::string &aType)
{
    std::vector<Json::Value> matched;

    for (const Json::Value &message : aMessages)
    {
        if (message["type"].asString() == aType)
        {
            matched.push_back(message);
        }
    }

    return matched;
}

/**
 * An in-process WebSocket client. The test drives open, message and close events.
 *
 */
class FakeWebSocketClient : public WebSocketClient
{
public:
    FakeWebSocketClient(void)
        : mConnectError(VIBE_ERROR_NONE)
        , mConnectCount(0)
        , mCloseCount(0)
        , mOpen(false)
    {
    }

    vibeError Connect(const std::string &aUrl) override
    {
        mUrl  = aUrl;
        mOpen = false;
        ++mConnectCount;
        return mConnectError;
    }

    bool Send(const std::string &aText) override
    {
        if (mOpen)
        {
            mSent.push_back(aText);
        }
        return mOpen;
    }

    void Close(void) override
    {
        mOpen = false;
        ++mCloseCount;
    }

    bool IsOpen(void) const override { return mOpen; }

    void Open(void)
    {
        mOpen = true;
        mDelegate->HandleClientOpened();
    }

    void Receive(const std::string &aText) { mDelegate->HandleClientMessage(aText); }

    void Drop(const std::string &aReason = "connection reset")
    {
        mOpen = false;
        mDelegate->HandleClientClosed(aReason);
    }

    std::vector<Json::Value> TakeSent(void)
    {
        std::vector<Json::Value> sent = ParseAll(mSent);

        mSent.clear();
        return sent;
    }

    vibeError                mConnectError;
    int                      mConnectCount;
    int                      mCloseCount;
    bool                     mOpen;
    std::string              mUrl;
    std::vector<std::string> mSent;
};

/**
 * An in-process WebSocket server. Connections are opened, fed and dropped by the test.
 *
 * Close() only records the request; the test reports the close with Drop(), as the real server does later.
 *
 */
class FakeWebSocketServer : public WebSocketServer
{
public:
    struct CloseRequest
    {
        uint16_t    mCode;
        std::string mReason;
    };

    FakeWebSocketServer(void)
        : mNextConnection(1)
        , mStarted(false)
    {
    }

    vibeError Start(const std::string &, uint16_t aPort) override
    {
        mStarted = true;
        mPort    = aPort;
        return VIBE_ERROR_NONE;
    }

    void Stop(void) override { mStarted = false; }

    uint16_t GetPort(void) const override { return mPort; }

    bool Send(ConnectionId aConnection, const std::string &aText) override
    {
        bool open = mOpen.count(aConnection) != 0;

        if (open)
        {
            mSent[aConnection].push_back(aText);
        }
        return open;
    }

    void Close(ConnectionId aConnection, uint16_t aCode, const std::string &aReason) override
    {
        if (mOpen.count(aConnection) != 0)
        {
            CloseRequest request = {aCode, aReason};

            mCloseRequests[aConnection] = request;
        }
    }

    ConnectionId Connect(void)
    {
        ConnectionId connection = mNextConnection++;

        mOpen.insert(connection);
        mDelegate->HandleConnectionOpened(connection);
        return connection;
    }

    void Receive(ConnectionId aConnection, const std::string &aText)
    {
        mDelegate->HandleConnectionMessage(aConnection, aText);
    }

    void Drop(ConnectionId aConnection)
    {
        mOpen.erase(aConnection);
        mDelegate->HandleConnectionClosed(aConnection);
    }

    std::vector<Json::Value> TakeSent(ConnectionId aConnection)
    {
        std::vector<Json::Value> sent = ParseAll(mSent[aConnection]);

        mSent[aConnection].clear();
        return sent;
    }

    ConnectionId                                     mNextConnection;
    bool                                             mStarted;
    uint16_t                                         mPort = 0;
    std::set<ConnectionId>                           mOpen;
    std::map<ConnectionId, std::vector<std::string>> mSent;
    std::map<ConnectionId, CloseRequest>             mCloseRequests;
};

/**
 * A token provider serving a fixed token, and a fixed refresh result.
 *
 */
class FakeTokenProvider : public TokenProvider
{
public:
    FakeTokenProvider(void)
        : mToken("token-1")
        , mRefreshedToken("token-2")
        , mRefreshCount(0)
    {
    }

    vibeError EnsureValidToken(std::string &aToken) override
    {
        aToken = mToken;
        return mToken.empty() ? VIBE_ERROR_NOT_FOUND : VIBE_ERROR_NONE;
    }

    vibeError RefreshIdToken(std::string &aToken) override
    {
        ++mRefreshCount;
        aToken = mRefreshedToken;
        return mRefreshedToken.empty() ? VIBE_ERROR_AUTH : VIBE_ERROR_NONE;
    }

    std::string mToken;
    std::string mRefreshedToken;
    int         mRefreshCount;
};

} // namespace Test
} // namespace vibe

#endif // VIBE_TESTS_GTEST_FAKE_TRANSPORT_HPP_
