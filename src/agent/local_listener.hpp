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
 *   This file includes definitions for the listener of local CLI connections.
 */

#ifndef VIBE_AGENT_LOCAL_LISTENER_HPP_
#define VIBE_AGENT_LOCAL_LISTENER_HPP_

#include "vibe-agent/config.h"

#include <map>
#include <string>

#include "agent/bridge_connection.hpp"
#include "agent/session_registry.hpp"
#include "common/code_utils.hpp"
#include "protocol/messages.hpp"
#include "transport/websocket_server.hpp"

namespace vibe {

/**
 * This class serves CLI instances on the same host.
 *
 * A connection becomes the owner of a session by registering it, or a viewer by attaching to one. Terminal input of
 * viewers goes to the owner only; output and events of the owner are mirrored to the viewers and forwarded to the
 * bridge.
 *
 */
class LocalListener : public WebSocketServer::Delegate, public Protocol::LocalMessageHandler, private NonCopyable
{
public:
    class Delegate
    {
    public:
        virtual ~Delegate(void) = default;

        /**
         * This method is called when the connection owning @p aSessionId closed.
         *
         */
        virtual void HandleOwnerDisconnected(const std::string &aSessionId) = 0;
    };

    struct Settings
    {
        std::string mDefaultPath;           ///< Working directory of sessions registered without a path.
        bool        mForwardTerminalOutput; ///< Whether `terminal_output` also goes to the bridge.
    };

    LocalListener(WebSocketServer &aServer,
                  SessionRegistry &aRegistry,
                  BridgeConnection &aBridge,
                  const Settings   &aSettings);

    void SetDelegate(Delegate &aDelegate) { mDelegate = &aDelegate; }

    bool SendTo(ConnectionId aConnection, const std::string &aMessage);

    /**
     * This method sends @p aMessage to every connection.
     *
     */
    void Broadcast(const std::string &aMessage);

    /**
     * This method tells the viewers of @p aSession that it ended and unbinds them from it.
     *
     */
    void NotifySessionEnded(const Session &aSession, const std::string &aReason);

    /**
     * This method asks the owner connection to exit without reconnecting.
     *
     */
    void SendStopNotice(ConnectionId aConnection, const std::string &aSessionId);

    void CloseConnection(ConnectionId aConnection, uint16_t aCode, const std::string &aReason);

    /**
     * This method closes every connection.
     *
     */
    void CloseAll(uint16_t aCode, const std::string &aReason);

    size_t GetConnectionCount(void) const { return mClients.size(); }

    // WebSocketServer::Delegate
    void HandleConnectionOpened(ConnectionId aConnection) override;
    void HandleConnectionMessage(ConnectionId aConnection, const std::string &aText) override;
    void HandleConnectionClosed(ConnectionId aConnection) override;

    // Protocol::LocalMessageHandler
    void HandleAuthenticate(ConnectionId aConnection, const Protocol::LocalAuthenticate &aMessage) override;
    void HandleRegisterSession(ConnectionId aConnection, const Protocol::RegisterSession &aMessage) override;
    void HandleAttachSession(ConnectionId aConnection, const Protocol::AttachSession &aMessage) override;
    void HandleListSessions(ConnectionId aConnection, const Protocol::ListSessions &aMessage) override;
    void HandleTerminalInput(ConnectionId aConnection, const Protocol::TerminalInput &aMessage) override;
    void HandleTerminalOutput(ConnectionId aConnection, const Protocol::TerminalOutput &aMessage) override;
    void HandleSessionEvent(ConnectionId aConnection, const Protocol::SessionEvent &aMessage) override;

private:
    struct Client
    {
        std::string mSessionId; ///< Empty until the connection registers or attaches.
        bool        mIsAttached;
    };

    Client  *FindClient(ConnectionId aConnection);
    Session *FindOwnedSession(ConnectionId aConnection);
    vibeError BindOwner(ConnectionId aConnection, const Protocol::RegisterSession &aMessage, std::string &aError);
    void     FanOut(const Session &aSession, const std::string &aMessage);

    WebSocketServer                &mServer;
    SessionRegistry                &mRegistry;
    BridgeConnection               &mBridge;
    Settings                        mSettings;
    Delegate                       *mDelegate;
    std::map<ConnectionId, Client> mClients;
};

} // namespace vibe

#endif // VIBE_AGENT_LOCAL_LISTENER_HPP_
