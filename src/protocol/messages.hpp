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
 *   This file includes definitions of the JSON messages exchanged with the bridge and with local CLI connections.
 */

#ifndef VIBE_PROTOCOL_MESSAGES_HPP_
#define VIBE_PROTOCOL_MESSAGES_HPP_

#include "vibe-agent/config.h"

#include <string>
#include <vector>

#include <json/json.h>

#include "common/types.hpp"

namespace vibe {
namespace Protocol {

/**
 * This structure describes a live session in `sessions_list` and `agent_sessions` replies.
 *
 */
struct SessionSummary
{
    std::string mSessionId;
    std::string mName;
    std::string mPath;
    std::string mStartedAt;
    std::string mSource; ///< "ios" for a spawned session, "cli" for a managed one.
};

/**
 * This structure represents how a child process ended.
 *
 */
struct ExitStatus
{
    bool mExited; ///< TRUE if the process called exit(), FALSE if it was killed by a signal.
    int  mCode;   ///< The exit code if `mExited`, otherwise the signal number.
};

/**
 * @addtogroup bridge-inbound
 *
 * Messages received from the bridge.
 *
 * @{
 */

struct Authenticated
{
    std::string mUserId;
    std::string mEmail;
};

struct AuthError
{
    std::string mMessage;
};

struct AgentRegistered
{
    std::string mAgentId;
};

struct StartSession
{
    std::string mRequestId;
    std::string mSessionId; ///< Empty if the agent should generate one.
    std::string mPath;
    std::string mName;
    std::string mPrompt;
};

struct ResumeSession
{
    std::string mRequestId;
    std::string mSessionId;
    std::string mPath;
    std::string mName;
};

struct StopSession
{
    std::string mRequestId;
    std::string mSessionId;
};

struct ListAgentSessions
{
    std::string mRequestId;
};

struct BridgeError
{
    std::string mMessage;
    std::string mSessionId;
    Json::Value mRaw;
};

/**
 * A session-scoped message the agent forwards to the session owner without interpreting it, e.g. `claude_message`,
 * `user_message` or `permission_approved`.
 *
 */
struct SessionRelay
{
    std::string mType;
    std::string mSessionId;
    Json::Value mRaw;
};

/**
 * This interface receives one decoded bridge message.
 *
 */
class BridgeMessageHandler
{
public:
    virtual ~BridgeMessageHandler(void) = default;

    virtual void HandleAuthenticated(const Authenticated &aMessage)         = 0;
    virtual void HandleAuthError(const AuthError &aMessage)                 = 0;
    virtual void HandleAgentRegistered(const AgentRegistered &aMessage)     = 0;
    virtual void HandleStartSession(const StartSession &aMessage)           = 0;
    virtual void HandleResumeSession(const ResumeSession &aMessage)         = 0;
    virtual void HandleStopSession(const StopSession &aMessage)             = 0;
    virtual void HandleListAgentSessions(const ListAgentSessions &aMessage) = 0;
    virtual void HandleBridgeError(const BridgeError &aMessage)             = 0;
    virtual void HandleSessionRelay(const SessionRelay &aMessage)           = 0;
};

/**
 * This function decodes a bridge message and passes it to the matching method of @p aHandler.
 *
 * @retval VIBE_ERROR_NONE         Successfully decoded and dispatched the message.
 * @retval VIBE_ERROR_PARSE        The message is not a JSON object with a string `type`.
 * @retval VIBE_ERROR_UNSUPPORTED  The type is unknown and the message is not scoped to a session.
 *
 */
vibeError DecodeBridgeMessage(const std::string &aText, BridgeMessageHandler &aHandler);

/**
 * @}
 *
 * @addtogroup local-inbound
 *
 * Messages received from CLI instances on the local listener.
 *
 * @{
 */

struct LocalAuthenticate
{
};

struct RegisterSession
{
    std::string mSessionId;
    std::string mPath;
    std::string mName;
    Json::Value mRaw;
};

struct AttachSession
{
    std::string mSessionId; ///< Empty if the client did not name one.
};

struct ListSessions
{
};

struct TerminalInput
{
    Json::Value mRaw;
};

struct TerminalOutput
{
    Json::Value mRaw;
};

/**
 * Any other message of a session, forwarded to the bridge.
 *
 * `claude_message`, `permission_request` and `session_status` are also mirrored to attached viewers.
 *
 */
struct SessionEvent
{
    std::string mType;
    Json::Value mRaw;

    bool IsMirroredToViewers(void) const;
};

/**
 * This interface receives one decoded local message.
 *
 */
class LocalMessageHandler
{
public:
    virtual ~LocalMessageHandler(void) = default;

    virtual void HandleAuthenticate(ConnectionId aConnection, const LocalAuthenticate &aMessage)    = 0;
    virtual void HandleRegisterSession(ConnectionId aConnection, const RegisterSession &aMessage)   = 0;
    virtual void HandleAttachSession(ConnectionId aConnection, const AttachSession &aMessage)       = 0;
    virtual void HandleListSessions(ConnectionId aConnection, const ListSessions &aMessage)         = 0;
    virtual void HandleTerminalInput(ConnectionId aConnection, const TerminalInput &aMessage)       = 0;
    virtual void HandleTerminalOutput(ConnectionId aConnection, const TerminalOutput &aMessage)     = 0;
    virtual void HandleSessionEvent(ConnectionId aConnection, const SessionEvent &aMessage)         = 0;
};

/**
 * This function decodes a local message and passes it to the matching method of @p aHandler.
 *
 * @retval VIBE_ERROR_NONE   Successfully decoded and dispatched the message.
 * @retval VIBE_ERROR_PARSE  The message is malformed or misses a required field.
 *
 */
vibeError DecodeLocalMessage(const std::string &aText, ConnectionId aConnection, LocalMessageHandler &aHandler);

/**
 * @}
 *
 * @addtogroup bridge-outbound
 *
 * @{
 */

std::string EncodeAuthenticate(const std::string &aToken);
std::string EncodeAgentRegister(const std::string              &aAgentId,
                                const std::string              &aHostName,
                                const std::string              &aPlatform,
                                const std::vector<std::string> &aActiveSessions);
std::string EncodeAgentHeartbeat(void);
std::string EncodeSessionRegistration(const Json::Value &aBase,
                                      const std::string &aSessionId,
                                      const std::string &aPath,
                                      const std::string &aName,
                                      const std::string &aAgentId,
                                      const std::string &aAgentHostName);
std::string EncodeAgentSessionStarted(const std::string &aRequestId,
                                      const std::string &aSessionId,
                                      const std::string &aPath,
                                      const std::string &aName,
                                      bool               aResumed);
std::string EncodeAgentSessionEnded(const std::string &aSessionId, const ExitStatus *aStatus, const std::string &aReason);
std::string EncodeAgentSessionError(const std::string &aRequestId,
                                    const std::string &aSessionId,
                                    const std::string &aError);
std::string EncodeAgentSessionStopping(const std::string &aRequestId, const std::string &aSessionId);
std::string EncodeAgentSessions(const std::string &aRequestId, const std::vector<SessionSummary> &aSessions);

/**
 * This function stamps @p aSessionId on a session-scoped message unless it already carries one.
 *
 */
std::string EncodeWithSessionId(const Json::Value &aMessage, const std::string &aSessionId);

/**
 * @}
 *
 * @addtogroup local-outbound
 *
 * @{
 */

std::string EncodeLocalAuthenticated(void);
std::string EncodeAttachSuccess(const std::string &aSessionId, const std::string &aName, const std::string &aPath);
std::string EncodeAttachError(const std::string &aSessionId, const std::string &aError);
std::string EncodeSessionsList(const std::vector<SessionSummary> &aSessions);
std::string EncodeTerminalInput(const Json::Value &aData);
std::string EncodeSessionStop(const std::string &aSessionId, const std::string &aReason);
std::string EncodeSessionEnded(const std::string &aSessionId, const std::string &aReason);
std::string EncodeBridgeDisconnected(void);
std::string EncodeBridgeReconnected(void);
std::string EncodeError(const std::string &aMessage);
std::string Encode(const Json::Value &aMessage);

/**
 * @}
 *
 */

} // namespace Protocol
} // namespace vibe

#endif // VIBE_PROTOCOL_MESSAGES_HPP_
