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

#define VIBE_LOG_TAG "PROTO"

#include "protocol/messages.hpp"

#include <string.h>

#include "common/code_utils.hpp"
#include "utils/json_utils.hpp"

namespace vibe {
namespace Protocol {

namespace {

enum class BridgeMessageType : uint8_t
{
    kAuthenticated,
    kAuthError,
    kAgentRegistered,
    kStartSession,
    kResumeSession,
    kStopSession,
    kListAgentSessions,
    kError,
    kSessionRelay,
};

enum class LocalMessageType : uint8_t
{
    kAuthenticate,
    kRegisterSession,
    kAttachSession,
    kListSessions,
    kTerminalInput,
    kTerminalOutput,
    kSessionEvent,
};

struct BridgeTypeEntry
{
    const char       *mName;
    BridgeMessageType mType;
};

const BridgeTypeEntry kBridgeTypes[] = {
    {"authenticated", BridgeMessageType::kAuthenticated},
    {"auth_error", BridgeMessageType::kAuthError},
    {"agent_registered", BridgeMessageType::kAgentRegistered},
    {"start_session", BridgeMessageType::kStartSession},
    {"resume_session", BridgeMessageType::kResumeSession},
    {"stop_session", BridgeMessageType::kStopSession},
    {"list_agent_sessions", BridgeMessageType::kListAgentSessions},
    {"error", BridgeMessageType::kError},
    {"session_registered", BridgeMessageType::kSessionRelay},
    {"joined_session", BridgeMessageType::kSessionRelay},
    {"message_history", BridgeMessageType::kSessionRelay},
    {"claude_message", BridgeMessageType::kSessionRelay},
    {"permission_request", BridgeMessageType::kSessionRelay},
    {"session_status", BridgeMessageType::kSessionRelay},
    {"session_ended", BridgeMessageType::kSessionRelay},
    {"session_renamed", BridgeMessageType::kSessionRelay},
    {"user_message", BridgeMessageType::kSessionRelay},
    {"permission_approved", BridgeMessageType::kSessionRelay},
    {"permission_denied", BridgeMessageType::kSessionRelay},
    {"send_message", BridgeMessageType::kSessionRelay},
};

const char *const kMirroredEventTypes[] = {"claude_message", "permission_request", "session_status"};

bool LookupBridgeType(const std::string &aName, BridgeMessageType &aType)
{
    bool found = false;

    for (const BridgeTypeEntry &entry : kBridgeTypes)
    {
        if (aName == entry.mName)
        {
            aType = entry.mType;
            ExitNow(found = true);
        }
    }

exit:
    return found;
}

LocalMessageType LookupLocalType(const std::string &aName)
{
    LocalMessageType type = LocalMessageType::kSessionEvent;

    if (aName == "authenticate")
    {
        type = LocalMessageType::kAuthenticate;
    }
    else if (aName == "register_session")
    {
        type = LocalMessageType::kRegisterSession;
    }
    else if (aName == "attach_session")
    {
        type = LocalMessageType::kAttachSession;
    }
    else if (aName == "list_sessions")
    {
        type = LocalMessageType::kListSessions;
    }
    else if (aName == "terminal_input")
    {
        type = LocalMessageType::kTerminalInput;
    }
    else if (aName == "terminal_output")
    {
        type = LocalMessageType::kTerminalOutput;
    }

    return type;
}

vibeError ParseTypedObject(const std::string &aText, Json::Value &aRoot, std::string &aType)
{
    vibeError error;

    SuccessOrExit(error = JsonUtils::Parse(aText, aRoot));
    VerifyOrExit(aRoot.isObject() && aRoot["type"].isString(), error = VIBE_ERROR_PARSE);
    aType = aRoot["type"].asString();

exit:
    return error;
}

Json::Value MakeMessage(const char *aType)
{
    Json::Value message(Json::objectValue);

    message["type"] = aType;
    return message;
}

Json::Value ToJson(const std::vector<SessionSummary> &aSessions, bool aWithStatus)
{
    Json::Value sessions(Json::arrayValue);

    for (const SessionSummary &summary : aSessions)
    {
        Json::Value session(Json::objectValue);

        session["sessionId"] = summary.mSessionId;
        session["name"]      = summary.mName;
        session["path"]      = summary.mPath;
        session["startedAt"] = summary.mStartedAt;
        session["source"]    = summary.mSource;
        if (aWithStatus)
        {
            session["status"] = "active";
        }
        sessions.append(session);
    }

    return sessions;
}

} // namespace

using JsonUtils::GetString;

vibeError DecodeBridgeMessage(const std::string &aText, BridgeMessageHandler &aHandler)
{
    vibeError         error;
    Json::Value       root;
    std::string       typeName;
    BridgeMessageType type = BridgeMessageType::kSessionRelay;

    SuccessOrExit(error = ParseTypedObject(aText, root, typeName));

    if (!LookupBridgeType(typeName, type))
    {
        // Unknown types are still delivered to the session owner when they are scoped to a session.
        VerifyOrExit(root["sessionId"].isString(), error = VIBE_ERROR_UNSUPPORTED);
    }

    switch (type)
    {
    case BridgeMessageType::kAuthenticated:
    {
        Authenticated message;

        message.mUserId = GetString(root, "userId");
        message.mEmail  = GetString(root, "email");
        aHandler.HandleAuthenticated(message);
        break;
    }

    case BridgeMessageType::kAuthError:
    {
        AuthError message;

        message.mMessage = GetString(root, "message", "Authentication failed");
        aHandler.HandleAuthError(message);
        break;
    }

    case BridgeMessageType::kAgentRegistered:
    {
        AgentRegistered message;

        message.mAgentId = GetString(root, "agentId");
        aHandler.HandleAgentRegistered(message);
        break;
    }

    case BridgeMessageType::kStartSession:
    {
        StartSession message;

        message.mRequestId = GetString(root, "requestId");
        message.mSessionId = GetString(root, "sessionId");
        message.mPath      = GetString(root, "path");
        message.mName      = GetString(root, "name");
        message.mPrompt    = GetString(root, "prompt");
        aHandler.HandleStartSession(message);
        break;
    }

    case BridgeMessageType::kResumeSession:
    {
        ResumeSession message;

        message.mRequestId = GetString(root, "requestId");
        message.mSessionId = GetString(root, "sessionId");
        message.mPath      = GetString(root, "path");
        message.mName      = GetString(root, "name");
        aHandler.HandleResumeSession(message);
        break;
    }

    case BridgeMessageType::kStopSession:
    {
        StopSession message;

        message.mRequestId = GetString(root, "requestId");
        message.mSessionId = GetString(root, "sessionId");
        aHandler.HandleStopSession(message);
        break;
    }

    case BridgeMessageType::kListAgentSessions:
    {
        ListAgentSessions message;

        message.mRequestId = GetString(root, "requestId");
        aHandler.HandleListAgentSessions(message);
        break;
    }

    case BridgeMessageType::kError:
    {
        BridgeError message;

        message.mMessage   = GetString(root, "message");
        message.mSessionId = GetString(root, "sessionId");
        message.mRaw       = root;
        aHandler.HandleBridgeError(message);
        break;
    }

    case BridgeMessageType::kSessionRelay:
    {
        SessionRelay message;

        message.mType      = typeName;
        message.mSessionId = GetString(root, "sessionId");
        VerifyOrExit(!message.mSessionId.empty(), error = VIBE_ERROR_PARSE);
        message.mRaw = root;
        aHandler.HandleSessionRelay(message);
        break;
    }
    }

exit:
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Discarded bridge message (type \"%s\"): %s", typeName.c_str(), vibeErrorString(error));
    }
    return error;
}

bool SessionEvent::IsMirroredToViewers(void) const
{
    bool mirrored = false;

    for (const char *type : kMirroredEventTypes)
    {
        if (mType == type)
        {
            ExitNow(mirrored = true);
        }
    }

exit:
    return mirrored;
}

vibeError DecodeLocalMessage(const std::string &aText, ConnectionId aConnection, LocalMessageHandler &aHandler)
{
    vibeError   error;
    Json::Value root;
    std::string typeName;

    SuccessOrExit(error = ParseTypedObject(aText, root, typeName));

    switch (LookupLocalType(typeName))
    {
    case LocalMessageType::kAuthenticate:
        aHandler.HandleAuthenticate(aConnection, LocalAuthenticate());
        break;

    case LocalMessageType::kRegisterSession:
    {
        RegisterSession message;

        message.mSessionId = GetString(root, "sessionId");
        VerifyOrExit(!message.mSessionId.empty(), error = VIBE_ERROR_PARSE);
        message.mPath = GetString(root, "path");
        message.mName = GetString(root, "name");
        message.mRaw  = root;
        aHandler.HandleRegisterSession(aConnection, message);
        break;
    }

    case LocalMessageType::kAttachSession:
    {
        AttachSession message;

        message.mSessionId = GetString(root, "sessionId");
        aHandler.HandleAttachSession(aConnection, message);
        break;
    }

    case LocalMessageType::kListSessions:
        aHandler.HandleListSessions(aConnection, ListSessions());
        break;

    case LocalMessageType::kTerminalInput:
    {
        TerminalInput message;

        message.mRaw = root;
        aHandler.HandleTerminalInput(aConnection, message);
        break;
    }

    case LocalMessageType::kTerminalOutput:
    {
        TerminalOutput message;

        message.mRaw = root;
        aHandler.HandleTerminalOutput(aConnection, message);
        break;
    }

    case LocalMessageType::kSessionEvent:
    {
        SessionEvent message;

        message.mType = typeName;
        message.mRaw  = root;
        aHandler.HandleSessionEvent(aConnection, message);
        break;
    }
    }

exit:
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Discarded local message from connection %llu: %s", static_cast<unsigned long long>(aConnection),
                    vibeErrorString(error));
    }
    return error;
}

std::string EncodeAuthenticate(const std::string &aToken)
{
    Json::Value message = MakeMessage("authenticate");

    message["token"] = aToken;
    return Encode(message);
}

std::string EncodeAgentRegister(const std::string              &aAgentId,
                                const std::string              &aHostName,
                                const std::string              &aPlatform,
                                const std::vector<std::string> &aActiveSessions)
{
    Json::Value message = MakeMessage("agent_register");
    Json::Value sessions(Json::arrayValue);

    for (const std::string &sessionId : aActiveSessions)
    {
        sessions.append(sessionId);
    }

    message["agentId"]        = aAgentId;
    message["hostName"]       = aHostName;
    message["platform"]       = aPlatform;
    message["activeSessions"] = sessions;
    return Encode(message);
}

std::string EncodeAgentHeartbeat(void)
{
    return Encode(MakeMessage("agent_heartbeat"));
}

std::string EncodeSessionRegistration(const Json::Value &aBase,
                                      const std::string &aSessionId,
                                      const std::string &aPath,
                                      const std::string &aName,
                                      const std::string &aAgentId,
                                      const std::string &aAgentHostName)
{
    Json::Value message = aBase.isObject() ? aBase : Json::Value(Json::objectValue);

    message["type"]          = "register_session";
    message["sessionId"]     = aSessionId;
    message["path"]          = aPath;
    message["name"]          = aName;
    message["agentId"]       = JsonUtils::StringOrNull(aAgentId);
    message["agentHostName"] = JsonUtils::StringOrNull(aAgentId.empty() ? std::string() : aAgentHostName);
    return Encode(message);
}

std::string EncodeAgentSessionStarted(const std::string &aRequestId,
                                      const std::string &aSessionId,
                                      const std::string &aPath,
                                      const std::string &aName,
                                      bool               aResumed)
{
    Json::Value message = MakeMessage(aResumed ? "agent_session_resumed" : "agent_session_started");

    message["requestId"] = aRequestId;
    message["sessionId"] = aSessionId;
    message["path"]      = aPath;
    message["name"]      = aName;
    return Encode(message);
}

std::string EncodeAgentSessionEnded(const std::string &aSessionId, const ExitStatus *aStatus, const std::string &aReason)
{
    Json::Value message = MakeMessage("agent_session_ended");

    message["sessionId"] = aSessionId;
    if (aStatus == nullptr)
    {
        // The owner was a local connection, which has no exit code of its own.
        message["exitCode"] = Json::Int(0);
    }
    else if (aStatus->mExited)
    {
        message["exitCode"] = aStatus->mCode;
    }
    else
    {
        message["exitCode"] = Json::Value(Json::nullValue);
        message["signal"]   = strsignal(aStatus->mCode);
    }
    message["reason"] = aReason;
    return Encode(message);
}

std::string EncodeAgentSessionError(const std::string &aRequestId,
                                    const std::string &aSessionId,
                                    const std::string &aError)
{
    Json::Value message = MakeMessage("agent_session_error");

    message["requestId"] = JsonUtils::StringOrNull(aRequestId);
    message["sessionId"] = JsonUtils::StringOrNull(aSessionId);
    message["error"]     = aError;
    return Encode(message);
}

std::string EncodeAgentSessionStopping(const std::string &aRequestId, const std::string &aSessionId)
{
    Json::Value message = MakeMessage("agent_session_stopping");

    message["requestId"] = JsonUtils::StringOrNull(aRequestId);
    message["sessionId"] = aSessionId;
    return Encode(message);
}

std::string EncodeAgentSessions(const std::string &aRequestId, const std::vector<SessionSummary> &aSessions)
{
    Json::Value message = MakeMessage("agent_sessions");

    message["requestId"] = JsonUtils::StringOrNull(aRequestId);
    message["sessions"]  = ToJson(aSessions, /* aWithStatus */ true);
    return Encode(message);
}

std::string EncodeWithSessionId(const Json::Value &aMessage, const std::string &aSessionId)
{
    Json::Value message = aMessage;

    if (!message["sessionId"].isString() && !aSessionId.empty())
    {
        message["sessionId"] = aSessionId;
    }
    return Encode(message);
}

std::string EncodeLocalAuthenticated(void)
{
    Json::Value message = MakeMessage("authenticated");

    message["userId"] = "local";
    message["email"]  = "via-agent";
    return Encode(message);
}

std::string EncodeAttachSuccess(const std::string &aSessionId, const std::string &aName, const std::string &aPath)
{
    Json::Value message = MakeMessage("attach_success");

    message["sessionId"] = aSessionId;
    message["name"]      = aName;
    message["path"]      = aPath;
    return Encode(message);
}

std::string EncodeAttachError(const std::string &aSessionId, const std::string &aError)
{
    Json::Value message = MakeMessage("attach_error");

    message["sessionId"] = JsonUtils::StringOrNull(aSessionId);
    message["error"]     = aError;
    return Encode(message);
}

std::string EncodeSessionsList(const std::vector<SessionSummary> &aSessions)
{
    Json::Value message = MakeMessage("sessions_list");

    message["sessions"] = ToJson(aSessions, /* aWithStatus */ false);
    return Encode(message);
}

std::string EncodeTerminalInput(const Json::Value &aData)
{
    Json::Value message = MakeMessage("terminal_input");

    message["data"] = aData;
    return Encode(message);
}

std::string EncodeSessionStop(const std::string &aSessionId, const std::string &aReason)
{
    Json::Value message = MakeMessage("session_stop");

    message["sessionId"] = aSessionId;
    message["reason"]    = aReason;
    return Encode(message);
}

std::string EncodeSessionEnded(const std::string &aSessionId, const std::string &aReason)
{
    Json::Value message = MakeMessage("session_ended");

    message["sessionId"] = aSessionId;
    message["reason"]    = aReason;
    return Encode(message);
}

std::string EncodeBridgeDisconnected(void)
{
    Json::Value message = MakeMessage("bridge_disconnected");

    message["message"] = "Bridge connection lost, reconnecting...";
    return Encode(message);
}

std::string EncodeBridgeReconnected(void)
{
    Json::Value message = MakeMessage("bridge_reconnected");

    message["message"] = "Bridge connection restored";
    return Encode(message);
}

std::string EncodeError(const std::string &aMessage)
{
    Json::Value message = MakeMessage("error");

    message["message"] = aMessage;
    return Encode(message);
}

std::string Encode(const Json::Value &aMessage)
{
    return JsonUtils::Write(aMessage);
}

} // namespace Protocol
} // namespace vibe
