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
 *   This file includes definitions for the Boost.Beast WebSocket listener.
 */

#ifndef VIBE_TRANSPORT_BEAST_WEBSOCKET_SERVER_HPP_
#define VIBE_TRANSPORT_BEAST_WEBSOCKET_SERVER_HPP_

#include "vibe-agent/config.h"

#include <map>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "common/code_utils.hpp"
#include "common/task_runner.hpp"
#include "transport/websocket_server.hpp"

namespace vibe {

/**
 * This class implements WebSocketServer with Boost.Beast over plain TCP.
 *
 * Accepted sockets and their session table live on the io_context thread. The mainloop side only tracks the set of
 * open connection ids, updated by the events posted through the TaskRunner.
 *
 * The io_context must stop running before this object is destroyed.
 *
 */
class BeastWebSocketServer : public WebSocketServer, private NonCopyable
{
public:
    BeastWebSocketServer(boost::asio::io_context &aIoContext, TaskRunner &aTaskRunner);
    ~BeastWebSocketServer(void) override = default;

    vibeError Start(const std::string &aAddress, uint16_t aPort) override;
    void      Stop(void) override;
    uint16_t  GetPort(void) const override { return mPort; }
    bool      Send(ConnectionId aConnection, const std::string &aText) override;
    void      Close(ConnectionId aConnection, uint16_t aCode, const std::string &aReason) override;

private:
    class Session;

    void DoAccept(void);
    void OnAccept(boost::system::error_code aError, boost::asio::ip::tcp::socket aSocket);
    void PostOpened(ConnectionId aConnection);
    void PostMessage(ConnectionId aConnection, std::string aText);
    void PostClosed(ConnectionId aConnection);

    boost::asio::io_context       &mIoContext;
    TaskRunner                    &mTaskRunner;
    boost::asio::ip::tcp::acceptor mAcceptor;
    uint16_t                       mPort;
    bool                           mStopped;

    // Only accessed on the io_context thread.
    ConnectionId                                 mNextConnectionId;
    std::map<ConnectionId, std::shared_ptr<Session>> mSessions;

    // Only accessed on the mainloop thread.
    std::set<ConnectionId> mOpenConnections;
};

} // namespace vibe

#endif // VIBE_TRANSPORT_BEAST_WEBSOCKET_SERVER_HPP_
