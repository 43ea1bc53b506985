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
 *   This file includes the interface of an outbound WebSocket connection.
 */

#ifndef VIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP_
#define VIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP_

#include "vibe-agent/config.h"

#include <string>

#include "common/types.hpp"

namespace vibe {

/**
 * This interface represents one outbound WebSocket connection carrying text frames.
 *
 * All methods and delegate callbacks are on the mainloop thread.
 *
 */
class WebSocketClient
{
public:
    class Delegate
    {
    public:
        virtual ~Delegate(void) = default;

        /**
         * This method is called when the handshake of the current attempt completed.
         *
         */
        virtual void HandleClientOpened(void) = 0;

        /**
         * This method is called for every text frame received.
         *
         */
        virtual void HandleClientMessage(const std::string &aText) = 0;

        /**
         * This method is called once when the current attempt failed or the open connection was lost.
         *
         * It is not called for a connection closed with Close().
         *
         */
        virtual void HandleClientClosed(const std::string &aReason) = 0;
    };

    virtual ~WebSocketClient(void) = default;

    void SetDelegate(Delegate &aDelegate) { mDelegate = &aDelegate; }

    /**
     * This method starts a connection attempt to @p aUrl, abandoning any previous connection.
     *
     * @retval VIBE_ERROR_NONE          The attempt started; the outcome is reported to the delegate.
     * @retval VIBE_ERROR_INVALID_ARGS  @p aUrl is not a valid WebSocket URL.
     *
     */
    virtual vibeError Connect(const std::string &aUrl) = 0;

    /**
     * This method sends a text frame.
     *
     * @returns TRUE if the frame was queued, FALSE if the connection is not open and the frame was dropped.
     *
     */
    virtual bool Send(const std::string &aText) = 0;

    /**
     * This method closes the connection without notifying the delegate.
     *
     */
    virtual void Close(void) = 0;

    virtual bool IsOpen(void) const = 0;

protected:
    Delegate *mDelegate = nullptr;
};

} // namespace vibe

#endif // VIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP_
