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
 *   This file includes definitions for the Boost.Beast WebSocket client.
 */

#ifndef VIBE_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_
#define VIBE_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_

#include "vibe-agent/config.h"

#include <memory>
#include <string>

#include <stdint.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "common/code_utils.hpp"
#include "common/task_runner.hpp"
#include "transport/websocket_client.hpp"

namespace vibe {

/**
 * This class implements WebSocketClient with Boost.Beast over TCP or TLS.
 *
 * The socket lives on the io_context thread; every event is posted to the mainloop through the TaskRunner. Each
 * Connect() starts a new generation and events of older generations are discarded.
 *
 * The io_context must stop running before this object is destroyed.
 *
 */
class BeastWebSocketClient : public WebSocketClient, private NonCopyable
{
public:
    BeastWebSocketClient(boost::asio::io_context &aIoContext, TaskRunner &aTaskRunner);
    ~BeastWebSocketClient(void) override;

    vibeError Connect(const std::string &aUrl) override;
    bool      Send(const std::string &aText) override;
    void      Close(void) override;
    bool      IsOpen(void) const override { return mOpen; }

private:
    class Session;
    template <class Stream> class StreamSession;

    void PostOpened(uint64_t aGeneration);
    void PostMessage(uint64_t aGeneration, std::string aText);
    void PostClosed(uint64_t aGeneration, std::string aReason);

    boost::asio::io_context  &mIoContext;
    TaskRunner               &mTaskRunner;
    boost::asio::ssl::context mSslContext;
    std::shared_ptr<Session>  mSession;
    uint64_t                  mGeneration;
    bool                      mOpen;
};

} // namespace vibe

#endif // VIBE_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_
