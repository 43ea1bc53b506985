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
 *   This file includes definitions for the agent's connection to the bridge.
 */

#ifndef VIBE_AGENT_BRIDGE_CONNECTION_HPP_
#define VIBE_AGENT_BRIDGE_CONNECTION_HPP_

#include "vibe-agent/config.h"

#include <string>

#include "agent/session_registry.hpp"
#include "agent/token_provider.hpp"
#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/timer.hpp"
#include "protocol/messages.hpp"
#include "transport/websocket_client.hpp"
#include "utils/backoff.hpp"

namespace vibe {

/**
 * This class owns the one outbound connection to the bridge.
 *
 * It runs the authentication handshake, announces the agent and every session in the registry after each successful
 * authentication, sends heartbeats while registered and reconnects with exponential backoff.
 *
 */
class BridgeConnection : public WebSocketClient::Delegate, public Protocol::BridgeMessageHandler, private NonCopyable
{
public:
    enum class State : uint8_t
    {
        kDisconnected,
        kConnecting,
        kOpen,
        kAuthenticating,
        kRegistered,
    };

    /**
     * This class receives the bridge commands and the lifecycle of the connection.
     *
     */
    class Delegate
    {
    public:
        virtual ~Delegate(void) = default;

        virtual void HandleStartSession(const Protocol::StartSession &aMessage)           = 0;
        virtual void HandleResumeSession(const Protocol::ResumeSession &aMessage)         = 0;
        virtual void HandleStopSession(const Protocol::StopSession &aMessage)             = 0;
        virtual void HandleListAgentSessions(const Protocol::ListAgentSessions &aMessage) = 0;
        virtual void HandleSessionRelay(const Protocol::SessionRelay &aMessage)           = 0;

        /**
         * This method is called for an `error` sent by the bridge, after it has been logged.
         *
         */
        virtual void HandleBridgeError(const Protocol::BridgeError &aMessage) = 0;

        /**
         * This method is called when the agent generated its id on the first authentication.
         *
         */
        virtual void HandleAgentIdAssigned(const std::string &aAgentId) = 0;

        /**
         * This method is called after the agent and its sessions were announced.
         *
         */
        virtual void HandleBridgeRegistered(void) = 0;

        /**
         * This method is called when a connection that had been open was lost.
         *
         */
        virtual void HandleBridgeDisconnected(void) = 0;

        /**
         * This method is called when authentication cannot succeed without the operator; no reconnect follows.
         *
         */
        virtual void HandleBridgeFatalError(const std::string &aReason) = 0;
    };

    struct Settings
    {
        std::string  mUrl;
        std::string  mHostName;
        std::string  mPlatform;
        std::string  mAgentId; ///< Empty to generate one on the first authentication.
        Milliseconds mReconnectBaseDelay;
        uint32_t     mReconnectFactor;
        Milliseconds mReconnectMaxDelay;
        double       mReconnectJitter;
        Milliseconds mHeartbeatInterval;

        Settings(void);
    };

    BridgeConnection(WebSocketClient       &aClient,
                     TokenProvider         &aTokenProvider,
                     const SessionRegistry &aRegistry,
                     const Settings        &aSettings);
    ~BridgeConnection(void) override;

    void SetDelegate(Delegate &aDelegate) { mDelegate = &aDelegate; }

    /**
     * This method starts connecting. Further attempts are scheduled on every loss of the connection.
     *
     */
    void Connect(void);

    /**
     * This method stops reconnecting and closes the connection.
     *
     */
    void Shutdown(void);

    /**
     * This method sends a message to the bridge.
     *
     * @returns TRUE if the message was queued, FALSE if the connection is not open and the message was dropped.
     *
     */
    bool Send(const std::string &aMessage);

    /**
     * This method announces one session to the bridge, tagged with the agent id if there is one.
     *
     * @param[in] aBase  The original `register_session` message whose other fields are kept.
     *
     */
    bool SendRegisterSession(const Json::Value &aBase,
                             const std::string &aSessionId,
                             const std::string &aPath,
                             const std::string &aName);

    State              GetState(void) const { return mState; }
    bool               IsRegistered(void) const { return mState == State::kRegistered; }
    const std::string &GetAgentId(void) const { return mSettings.mAgentId; }
    const std::string &GetHostName(void) const { return mSettings.mHostName; }

    uint32_t     GetReconnectAttempt(void) const { return mBackoff.GetAttempt(); }
    Milliseconds GetLastReconnectDelay(void) const { return mLastReconnectDelay; }

    // WebSocketClient::Delegate
    void HandleClientOpened(void) override;
    void HandleClientMessage(const std::string &aText) override;
    void HandleClientClosed(const std::string &aReason) override;

    // Protocol::BridgeMessageHandler
    void HandleAuthenticated(const Protocol::Authenticated &aMessage) override;
    void HandleAuthError(const Protocol::AuthError &aMessage) override;
    void HandleAgentRegistered(const Protocol::AgentRegistered &aMessage) override;
    void HandleStartSession(const Protocol::StartSession &aMessage) override;
    void HandleResumeSession(const Protocol::ResumeSession &aMessage) override;
    void HandleStopSession(const Protocol::StopSession &aMessage) override;
    void HandleListAgentSessions(const Protocol::ListAgentSessions &aMessage) override;
    void HandleBridgeError(const Protocol::BridgeError &aMessage) override;
    void HandleSessionRelay(const Protocol::SessionRelay &aMessage) override;

private:
    static const char *StateToString(State aState);

    void SetState(State aState);
    void StartAttempt(void);
    void ScheduleReconnect(void);
    void RetryAuthentication(const std::string &aReason);
    void Fail(const std::string &aReason);
    void AnnounceSessions(void);
    void HandleHeartbeatTimer(void);

    WebSocketClient       &mClient;
    TokenProvider         &mTokenProvider;
    const SessionRegistry &mRegistry;
    Settings               mSettings;
    Delegate              *mDelegate;
    State                  mState;
    ExponentialBackoff     mBackoff;
    Milliseconds           mLastReconnectDelay;
    bool                   mRefreshAttempted;
    bool                   mShuttingDown;
    bool                   mFatal;
    Timer                  mReconnectTimer;
    Timer                  mHeartbeatTimer;
};

} // namespace vibe

#endif // VIBE_AGENT_BRIDGE_CONNECTION_HPP_
