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
 *   This file includes the interface of a WebSocket listener.
 */

#ifndef VIBE_TRANSPORT_WEBSOCKET_SERVER_HPP_
#define VIBE_TRANSPORT_WEBSOCKET_SERVER_HPP_

#include "vibe-agent/config.h"

#include <string>

#include <stdint.h>

#include "common/types.hpp"

namespace vibe {

/**
 * This interface represents a WebSocket listener multiplexing inbound connections by ConnectionId.
 *
 * All methods and delegate callbacks are on the mainloop thread.
 *
 */
class WebSocketServer
{
public:
    class Delegate
    {
    public:
        virtual ~Delegate(void) = default;

        virtual void HandleConnectionOpened(ConnectionId aConnection)                              = 0;
        virtual void HandleConnectionMessage(ConnectionId aConnection, const std::string &aText)   = 0;

        /**
         * This method is called once per opened connection, including those closed with Close().
         *
         */
        virtual void HandleConnectionClosed(ConnectionId aConnection) = 0;
    };

    virtual ~WebSocketServer(void) = default;

    void SetDelegate(Delegate &aDelegate) { mDelegate = &aDelegate; }

    /**
     * This method binds the listener and starts accepting connections.
     *
     * @param[in] aAddress  The local address, e.g. "127.0.0.1".
     * @param[in] aPort     The port, 0 for an ephemeral one.
     *
     * @retval VIBE_ERROR_NONE   The listener is accepting connections.
     * @retval VIBE_ERROR_ERRNO  The address could not be bound.
     *
     */
    virtual vibeError Start(const std::string &aAddress, uint16_t aPort) = 0;

    /**
     * This method stops accepting and drops every connection without notifying the delegate.
     *
     */
    virtual void Stop(void) = 0;

    /**
     * This method returns the bound port, 0 if not started.
     *
     */
    virtual uint16_t GetPort(void) const = 0;

    /**
     * This method sends a text frame to one connection.
     *
     * @returns TRUE if the frame was queued, FALSE if the connection is not open.
     *
     */
    virtual bool Send(ConnectionId aConnection, const std::string &aText) = 0;

    /**
     * This method starts the close handshake of one connection.
     *
     */
    virtual void Close(ConnectionId aConnection, uint16_t aCode, const std::string &aReason) = 0;

protected:
    Delegate *mDelegate = nullptr;
};

} // namespace vibe

#endif // VIBE_TRANSPORT_WEBSOCKET_SERVER_HPP_
