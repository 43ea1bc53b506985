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
 *   This file includes definitions for the dispatcher relaying sessions between the bridge and the host.
 */

#ifndef VIBE_AGENT_RELAY_DISPATCHER_HPP_
#define VIBE_AGENT_RELAY_DISPATCHER_HPP_

#include "vibe-agent/config.h"

#include <functional>
#include <string>
#include <vector>

#include "agent/agent_config.hpp"
#include "agent/bridge_connection.hpp"
#include "agent/local_listener.hpp"
#include "agent/process_supervisor.hpp"
#include "agent/session_history.hpp"
#include "agent/session_registry.hpp"
#include "common/code_utils.hpp"

namespace vibe {

/**
 * This class executes bridge commands against the registry and the process supervisor, and ends sessions when
 * their owner goes away.
 *
 */
class RelayDispatcher : public BridgeConnection::Delegate,
                        public LocalListener::Delegate,
                        public ProcessSupervisor::Delegate,
                        public SessionRegistry::Dependencies,
                        private NonCopyable
{
public:
    typedef std::function<void(const std::string &aReason)> FatalErrorHandler;

    struct Settings
    {
        std::string mCliExecutable; ///< Name looked up on PATH, or a path.
        uint16_t    mLocalPort;     ///< Port the spawned CLI connects back to.
        bool        mE2e;
        std::string mHomeDirectory;
    };

    RelayDispatcher(SessionRegistry   &aRegistry,
                    SessionHistory    &aHistory,
                    ProcessSupervisor &aSupervisor,
                    BridgeConnection  &aBridge,
                    LocalListener     &aListener,
                    AgentConfig       &aConfig,
                    const Settings    &aSettings);

    void SetFatalErrorHandler(FatalErrorHandler aHandler) { mFatalErrorHandler = std::move(aHandler); }

    /**
     * This method records every live session to the history and drops them from the registry.
     *
     * Owner events that arrive afterwards are ignored.
     *
     */
    void Shutdown(void);

    // BridgeConnection::Delegate
    void HandleStartSession(const Protocol::StartSession &aMessage) override;
    void HandleResumeSession(const Protocol::ResumeSession &aMessage) override;
    void HandleStopSession(const Protocol::StopSession &aMessage) override;
    void HandleListAgentSessions(const Protocol::ListAgentSessions &aMessage) override;
    void HandleSessionRelay(const Protocol::SessionRelay &aMessage) override;
    void HandleBridgeError(const Protocol::BridgeError &aMessage) override;
    void HandleAgentIdAssigned(const std::string &aAgentId) override;
    void HandleBridgeRegistered(void) override;
    void HandleBridgeDisconnected(void) override;
    void HandleBridgeFatalError(const std::string &aReason) override;

    // LocalListener::Delegate
    void HandleOwnerDisconnected(const std::string &aSessionId) override;

    // ProcessSupervisor::Delegate
    void HandleProcessExit(const std::string &aSessionId, pid_t aPid, const Protocol::ExitStatus &aStatus) override;
    void HandleProcessError(const std::string &aSessionId, pid_t aPid, const std::string &aError) override;

    // SessionRegistry::Dependencies
    vibeError SignalProcess(pid_t aPid, bool aForce) override;
    void      SendStopNotice(ConnectionId aConnection, const std::string &aSessionId) override;
    void      CloseConnection(ConnectionId aConnection, uint16_t aCode, const std::string &aReason) override;

private:
    bool CheckAvailable(const std::string &aRequestId, const std::string &aSessionId);
    void LaunchSession(const std::string &aRequestId,
                       const std::string &aSessionId,
                       const std::string &aPath,
                       const std::string &aName,
                       const std::string &aPrompt,
                       bool               aResume);
    std::vector<std::string> BuildArguments(const std::string &aSessionId,
                                            const std::string &aName,
                                            const std::string &aPrompt,
                                            bool               aResume) const;
    void SendSessionError(const std::string &aRequestId, const std::string &aSessionId, const std::string &aError);
    void RelayToOwner(const std::string &aSessionId, const Json::Value &aMessage);
    void RecordHistory(const Session &aSession);
    void EndSession(const std::string &aSessionId, const std::string &aReason, const Protocol::ExitStatus *aStatus);

    SessionRegistry   &mRegistry;
    SessionHistory    &mHistory;
    ProcessSupervisor &mSupervisor;
    BridgeConnection  &mBridge;
    LocalListener     &mListener;
    AgentConfig       &mConfig;
    Settings           mSettings;
    FatalErrorHandler  mFatalErrorHandler;
    bool               mShuttingDown;
};

} // namespace vibe

#endif // VIBE_AGENT_RELAY_DISPATCHER_HPP_
