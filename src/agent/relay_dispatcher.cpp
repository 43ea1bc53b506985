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

#define VIBE_LOG_TAG "RELAY"

#include "agent/relay_dispatcher.hpp"

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"
#include "utils/uuid.hpp"

namespace vibe {

namespace {
const char   kCliNotFound[]              = "vibe-cli not found on this host";
const char   kSessionAlreadyRunning[]    = "Session is already running";
const char   kSessionStopping[]          = "Session is currently stopping. Please wait a moment and try again.";
const char   kResumeRequiresSessionId[]  = "sessionId is required to resume a session";
const char   kResumePathUnknown[]        = "Cannot resume session: working directory path unknown. Please provide a path.";
const char   kSessionNotFound[]          = "Session not found";
const char   kReasonStoppedByUser[]      = "stopped_by_user";
const char   kReasonDisconnected[]       = "disconnected";
const char   kReasonExited[]             = "exited";
const size_t kMessagePreviewLength       = 150;
} // namespace

RelayDispatcher::RelayDispatcher(SessionRegistry   &aRegistry,
                                 SessionHistory    &aHistory,
                                 ProcessSupervisor &aSupervisor,
                                 BridgeConnection  &aBridge,
                                 LocalListener     &aListener,
                                 AgentConfig       &aConfig,
                                 const Settings    &aSettings)
    : mRegistry(aRegistry)
    , mHistory(aHistory)
    , mSupervisor(aSupervisor)
    , mBridge(aBridge)
    , mListener(aListener)
    , mConfig(aConfig)
    , mSettings(aSettings)
    , mShuttingDown(false)
{
}

void RelayDispatcher::Shutdown(void)
{
    mShuttingDown = true;

    for (const std::string &id : mRegistry.GetSessionIds())
    {
        std::unique_ptr<Session> session = mRegistry.Remove(id);

        RecordHistory(*session);
    }
}

void RelayDispatcher::SendSessionError(const std::string &aRequestId,
                                       const std::string &aSessionId,
                                       const std::string &aError)
{
    vibeLogWarn("Session %s: %s", aSessionId.empty() ? "-" : StringUtils::ShortId(aSessionId).c_str(), aError.c_str());
    mBridge.Send(Protocol::EncodeAgentSessionError(aRequestId, aSessionId, aError));
}

bool RelayDispatcher::CheckAvailable(const std::string &aRequestId, const std::string &aSessionId)
{
    bool available = false;

    switch (mRegistry.CheckAvailable(aSessionId))
    {
    case VIBE_ERROR_NONE:
        available = true;
        break;
    case VIBE_ERROR_BUSY:
        SendSessionError(aRequestId, aSessionId, kSessionStopping);
        break;
    default:
        SendSessionError(aRequestId, aSessionId, kSessionAlreadyRunning);
        break;
    }

    return available;
}

std::vector<std::string> RelayDispatcher::BuildArguments(const std::string &aSessionId,
                                                         const std::string &aName,
                                                         const std::string &aPrompt,
                                                         bool               aResume) const
{
    std::vector<std::string> args;

    args.push_back("--agent");
    args.push_back("ws://localhost:" + std::to_string(mSettings.mLocalPort));

    if (aResume)
    {
        args.push_back("--resume");
        args.push_back(aSessionId);
    }

    if (mSettings.mE2e)
    {
        args.push_back("--e2e");
    }

    if (!aName.empty())
    {
        args.push_back("--name");
        args.push_back(aName);
    }

    if (!aPrompt.empty())
    {
        args.push_back(aPrompt);
    }

    return args;
}

void RelayDispatcher::LaunchSession(const std::string &aRequestId,
                                    const std::string &aSessionId,
                                    const std::string &aPath,
                                    const std::string &aName,
                                    const std::string &aPrompt,
                                    bool               aResume)
{
    std::string executable;
    std::string errorMessage;
    std::string name = aName.empty() ? Utils::GetBaseName(aPath) : aName;
    pid_t       pid;
    Session    *session = nullptr;

    VerifyOrExit(Utils::FindExecutable(mSettings.mCliExecutable, executable),
                 SendSessionError(aRequestId, aSessionId, kCliNotFound));

    if (mSupervisor.Spawn(aSessionId, executable, BuildArguments(aSessionId, aName, aPrompt, aResume), aPath, pid,
                          errorMessage) != VIBE_ERROR_NONE)
    {
        // A later resume still knows where the session lives.
        vibeLogResult(mHistory.Record(aSessionId, aPath, name), "Record session %s to history",
                      StringUtils::ShortId(aSessionId).c_str());
        SendSessionError(aRequestId, aSessionId, errorMessage);
        ExitNow();
    }

    if (mRegistry.Add(aSessionId, aPath, name, SessionOwner::FromProcess(pid), &session) != VIBE_ERROR_NONE)
    {
        vibeLogCrit("Session %s appeared while spawning", StringUtils::ShortId(aSessionId).c_str());
        vibeLogResult(mSupervisor.Signal(pid, /* aForce */ true), "Kill pid %d", pid);
        ExitNow();
    }

    session->SetRequestId(aRequestId);

    vibeLogInfo("Session %s %s in %s", StringUtils::ShortId(aSessionId).c_str(), aResume ? "resumed" : "started",
                aPath.c_str());
    mBridge.Send(Protocol::EncodeAgentSessionStarted(aRequestId, aSessionId, aPath, name, aResume));

exit:
    return;
}

void RelayDispatcher::HandleStartSession(const Protocol::StartSession &aMessage)
{
    std::string sessionId = aMessage.mSessionId.empty() ? Uuid::NewRandomString() : aMessage.mSessionId;
    std::string path;

    vibeLogInfo("Starting session %s", aMessage.mName.empty() ? aMessage.mPath.c_str() : aMessage.mName.c_str());

    VerifyOrExit(CheckAvailable(aMessage.mRequestId, sessionId));

    path = aMessage.mPath.empty() ? mSettings.mHomeDirectory : Utils::ExpandHomeDirectory(aMessage.mPath);
    VerifyOrExit(Utils::IsDirectory(path), SendSessionError(aMessage.mRequestId, sessionId, "Path does not exist: " + path));

    LaunchSession(aMessage.mRequestId, sessionId, path, aMessage.mName, aMessage.mPrompt, /* aResume */ false);

exit:
    return;
}

void RelayDispatcher::HandleResumeSession(const Protocol::ResumeSession &aMessage)
{
    const SessionHistoryEntry *entry = nullptr;
    std::string                path  = aMessage.mPath;
    std::string                name  = aMessage.mName;

    VerifyOrExit(!aMessage.mSessionId.empty(), SendSessionError(aMessage.mRequestId, "", kResumeRequiresSessionId));
    vibeLogInfo("Resuming session %s", StringUtils::ShortId(aMessage.mSessionId).c_str());
    VerifyOrExit(CheckAvailable(aMessage.mRequestId, aMessage.mSessionId));

    if (path.empty())
    {
        entry = mHistory.Lookup(aMessage.mSessionId);
        VerifyOrExit(entry != nullptr, SendSessionError(aMessage.mRequestId, aMessage.mSessionId, kResumePathUnknown));

        path = entry->mPath;
        if (name.empty())
        {
            name = entry->mName;
        }
        vibeLogInfo("Using path from session history: %s", path.c_str());
    }

    path = Utils::ExpandHomeDirectory(path);
    VerifyOrExit(Utils::IsDirectory(path),
                 SendSessionError(aMessage.mRequestId, aMessage.mSessionId, "Path does not exist: " + path));

    LaunchSession(aMessage.mRequestId, aMessage.mSessionId, path, name, "", /* aResume */ true);

exit:
    return;
}

void RelayDispatcher::HandleStopSession(const Protocol::StopSession &aMessage)
{
    VerifyOrExit(mRegistry.Stop(aMessage.mSessionId) == VIBE_ERROR_NONE,
                 SendSessionError(aMessage.mRequestId, aMessage.mSessionId, kSessionNotFound));

    // Acknowledged before teardown completes; `agent_session_ended` follows.
    mBridge.Send(Protocol::EncodeAgentSessionStopping(aMessage.mRequestId, aMessage.mSessionId));

exit:
    return;
}

void RelayDispatcher::HandleListAgentSessions(const Protocol::ListAgentSessions &aMessage)
{
    mBridge.Send(Protocol::EncodeAgentSessions(aMessage.mRequestId, mRegistry.GetSummaries()));
}

void RelayDispatcher::RelayToOwner(const std::string &aSessionId, const Json::Value &aMessage)
{
    const Session *session = mRegistry.Find(aSessionId);

    VerifyOrExit(session != nullptr && session->GetOwner().IsConnection(),
                 vibeLogInfo("[%s] No local client to relay %s to", StringUtils::ShortId(aSessionId).c_str(),
                             aMessage["type"].asCString()));

    mListener.SendTo(session->GetOwner().GetConnection(), Protocol::Encode(aMessage));

exit:
    return;
}

void RelayDispatcher::HandleSessionRelay(const Protocol::SessionRelay &aMessage)
{
    if (aMessage.mType == "send_message")
    {
        const Json::Value &content = aMessage.mRaw["content"];
        std::string        text;

        if (content.isString())
        {
            text = content.asString();
        }
        else if (content.isObject() && content.isMember("ciphertext"))
        {
            text = "[encrypted]";
        }
        else
        {
            text = Protocol::Encode(content);
        }

        vibeLogInfo("[%s] User: %s", StringUtils::ShortId(aMessage.mSessionId).c_str(),
                    StringUtils::Truncate(text, kMessagePreviewLength).c_str());
    }

    RelayToOwner(aMessage.mSessionId, aMessage.mRaw);
}

void RelayDispatcher::HandleBridgeError(const Protocol::BridgeError &aMessage)
{
    if (!aMessage.mSessionId.empty())
    {
        RelayToOwner(aMessage.mSessionId, aMessage.mRaw);
    }
}

void RelayDispatcher::HandleAgentIdAssigned(const std::string &aAgentId)
{
    mConfig.SetAgentId(aAgentId);
    if (mConfig.Save() != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Agent id %s is not persisted", StringUtils::ShortId(aAgentId).c_str());
    }
}

void RelayDispatcher::HandleBridgeRegistered(void)
{
    mListener.Broadcast(Protocol::EncodeBridgeReconnected());
}

void RelayDispatcher::HandleBridgeDisconnected(void)
{
    mListener.Broadcast(Protocol::EncodeBridgeDisconnected());
}

void RelayDispatcher::HandleBridgeFatalError(const std::string &aReason)
{
    if (mFatalErrorHandler)
    {
        mFatalErrorHandler(aReason);
    }
}

void RelayDispatcher::RecordHistory(const Session &aSession)
{
    vibeLogResult(mHistory.Record(aSession.GetId(), aSession.GetPath(), aSession.GetName()),
                  "Record session %s to history", StringUtils::ShortId(aSession.GetId()).c_str());
}

void RelayDispatcher::EndSession(const std::string         &aSessionId,
                                 const std::string         &aReason,
                                 const Protocol::ExitStatus *aStatus)
{
    std::unique_ptr<Session> session = mRegistry.Remove(aSessionId);

    VerifyOrExit(session != nullptr);

    RecordHistory(*session);
    mListener.NotifySessionEnded(*session, aReason);
    vibeLogInfo("Session %s ended: %s", StringUtils::ShortId(aSessionId).c_str(), aReason.c_str());
    mBridge.Send(Protocol::EncodeAgentSessionEnded(aSessionId, aStatus, aReason));

exit:
    return;
}

void RelayDispatcher::HandleOwnerDisconnected(const std::string &aSessionId)
{
    const Session *session = mRegistry.Find(aSessionId);

    VerifyOrExit(!mShuttingDown && session != nullptr);

    EndSession(aSessionId, session->IsStopping() ? kReasonStoppedByUser : kReasonDisconnected, nullptr);

exit:
    return;
}

void RelayDispatcher::HandleProcessExit(const std::string          &aSessionId,
                                        pid_t                       aPid,
                                        const Protocol::ExitStatus &aStatus)
{
    const Session *session = mRegistry.Find(aSessionId);

    VerifyOrExit(!mShuttingDown && session != nullptr);
    VerifyOrExit(session->GetOwner().IsProcess(aPid),
                 vibeLogInfo("Pid %d of session %s exited after handing the session over", aPid,
                             StringUtils::ShortId(aSessionId).c_str()));

    EndSession(aSessionId, session->IsStopping() ? kReasonStoppedByUser : kReasonExited, &aStatus);

exit:
    return;
}

void RelayDispatcher::HandleProcessError(const std::string &aSessionId, pid_t aPid, const std::string &aError)
{
    Session                 *session = mRegistry.Find(aSessionId);
    std::unique_ptr<Session> removed;
    std::string              requestId;

    VerifyOrExit(!mShuttingDown && session != nullptr && session->GetOwner().IsProcess(aPid));

    requestId = session->GetRequestId();
    removed   = mRegistry.Remove(aSessionId);
    RecordHistory(*removed);
    mListener.NotifySessionEnded(*removed, aError);
    SendSessionError(requestId, aSessionId, aError);

exit:
    return;
}

vibeError RelayDispatcher::SignalProcess(pid_t aPid, bool aForce)
{
    return mSupervisor.Signal(aPid, aForce);
}

void RelayDispatcher::SendStopNotice(ConnectionId aConnection, const std::string &aSessionId)
{
    mListener.SendStopNotice(aConnection, aSessionId);
}

void RelayDispatcher::CloseConnection(ConnectionId aConnection, uint16_t aCode, const std::string &aReason)
{
    mListener.CloseConnection(aConnection, aCode, aReason);
}

} // namespace vibe
