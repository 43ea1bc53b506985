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

#define VIBE_LOG_TAG "LOCAL"

#include "agent/local_listener.hpp"

#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"

namespace vibe {

namespace {
const char kNotConnectedToBridge[] = "Not connected to bridge";
const char kSessionIdRequired[]    = "sessionId is required";
const char kAttachStopping[]       = "Session is currently stopping. Cannot attach.";
const char kAttachNotFound[]       = "Session not found. It may have ended or is running on a different agent.";
} // namespace

LocalListener::LocalListener(WebSocketServer  &aServer,
                             SessionRegistry  &aRegistry,
                             BridgeConnection &aBridge,
                             const Settings   &aSettings)
    : mServer(aServer)
    , mRegistry(aRegistry)
    , mBridge(aBridge)
    , mSettings(aSettings)
    , mDelegate(nullptr)
{
    mServer.SetDelegate(*this);
}

LocalListener::Client *LocalListener::FindClient(ConnectionId aConnection)
{
    auto it = mClients.find(aConnection);

    return it == mClients.end() ? nullptr : &it->second;
}

Session *LocalListener::FindOwnedSession(ConnectionId aConnection)
{
    Client  *client  = FindClient(aConnection);
    Session *session = nullptr;

    VerifyOrExit(client != nullptr && !client->mIsAttached && !client->mSessionId.empty());
    session = mRegistry.Find(client->mSessionId);
    VerifyOrExit(session != nullptr && session->GetOwner().IsConnection(aConnection), session = nullptr);

exit:
    return session;
}

bool LocalListener::SendTo(ConnectionId aConnection, const std::string &aMessage)
{
    bool sent = mServer.Send(aConnection, aMessage);

    if (!sent)
    {
        vibeLogDebg("Dropped message to closed connection %llu", static_cast<unsigned long long>(aConnection));
    }

    return sent;
}

void LocalListener::Broadcast(const std::string &aMessage)
{
    for (const auto &entry : mClients)
    {
        SendTo(entry.first, aMessage);
    }
}

void LocalListener::FanOut(const Session &aSession, const std::string &aMessage)
{
    // Sends never close a connection synchronously, but the viewer set is copied anyway.
    for (ConnectionId viewer : aSession.GetViewers())
    {
        SendTo(viewer, aMessage);
    }
}

void LocalListener::NotifySessionEnded(const Session &aSession, const std::string &aReason)
{
    std::string message = Protocol::EncodeSessionEnded(aSession.GetId(), aReason);

    FanOut(aSession, message);

    for (auto &entry : mClients)
    {
        if (entry.second.mSessionId == aSession.GetId())
        {
            entry.second.mSessionId.clear();
            entry.second.mIsAttached = false;
        }
    }
}

void LocalListener::SendStopNotice(ConnectionId aConnection, const std::string &aSessionId)
{
    SendTo(aConnection, Protocol::EncodeSessionStop(aSessionId, "stopped_by_user"));
}

void LocalListener::CloseConnection(ConnectionId aConnection, uint16_t aCode, const std::string &aReason)
{
    vibeLogInfo("Closing connection %llu: %s", static_cast<unsigned long long>(aConnection), aReason.c_str());
    mServer.Close(aConnection, aCode, aReason);
}

void LocalListener::CloseAll(uint16_t aCode, const std::string &aReason)
{
    for (const auto &entry : mClients)
    {
        mServer.Close(entry.first, aCode, aReason);
    }
}

void LocalListener::HandleConnectionOpened(ConnectionId aConnection)
{
    Client client;

    client.mIsAttached    = false;
    mClients[aConnection] = client;
    vibeLogInfo("Local client %llu connected (%zu total)", static_cast<unsigned long long>(aConnection),
                mClients.size());
}

void LocalListener::HandleConnectionMessage(ConnectionId aConnection, const std::string &aText)
{
    vibeError error;

    VerifyOrExit(mClients.count(aConnection) != 0);

    // Malformed messages are logged by the decoder; the connection stays open.
    error = Protocol::DecodeLocalMessage(aText, aConnection, *this);
    VIBE_UNUSED_VARIABLE(error);

exit:
    return;
}

void LocalListener::HandleConnectionClosed(ConnectionId aConnection)
{
    auto     it = mClients.find(aConnection);
    Client   client;
    Session *session;

    VerifyOrExit(it != mClients.end());

    client = it->second;
    mClients.erase(it);
    vibeLogInfo("Local client %llu disconnected (%zu left)", static_cast<unsigned long long>(aConnection),
                mClients.size());

    VerifyOrExit(!client.mSessionId.empty());

    if (client.mIsAttached)
    {
        mRegistry.Detach(client.mSessionId, aConnection);
        ExitNow();
    }

    session = mRegistry.Find(client.mSessionId);
    VerifyOrExit(session != nullptr && session->GetOwner().IsConnection(aConnection));

    if (mDelegate != nullptr)
    {
        mDelegate->HandleOwnerDisconnected(client.mSessionId);
    }

exit:
    return;
}

void LocalListener::HandleAuthenticate(ConnectionId aConnection, const Protocol::LocalAuthenticate &aMessage)
{
    VIBE_UNUSED_VARIABLE(aMessage);

    // Local clients run as the same user and inherit the agent's credentials.
    SendTo(aConnection, Protocol::EncodeLocalAuthenticated());
}

vibeError LocalListener::BindOwner(ConnectionId                     aConnection,
                                   const Protocol::RegisterSession &aMessage,
                                   std::string                     &aError)
{
    vibeError   error   = VIBE_ERROR_NONE;
    Client     *client  = FindClient(aConnection);
    Session    *session = mRegistry.Find(aMessage.mSessionId);
    std::string id      = aMessage.mSessionId;

    VerifyOrExit(!client->mIsAttached, error = VIBE_ERROR_INVALID_STATE,
                 aError = "Attached viewers cannot register a session");
    VerifyOrExit(client->mSessionId.empty() || client->mSessionId == id, error = VIBE_ERROR_INVALID_STATE,
                 aError = "Connection is already registered as session " + client->mSessionId);

    if (session == nullptr)
    {
        std::string path = aMessage.mPath.empty() ? mSettings.mDefaultPath : aMessage.mPath;
        std::string name = aMessage.mName.empty() ? Utils::GetBaseName(path) : aMessage.mName;

        SuccessOrExit(error = mRegistry.Add(id, path, name, SessionOwner::FromConnection(aConnection)));
    }
    else if (session->GetOwner().IsConnection(aConnection))
    {
        vibeLogInfo("Session %s registered again by its owner", StringUtils::ShortId(id).c_str());
    }
    else if (session->IsStopping())
    {
        ExitNow(error = VIBE_ERROR_BUSY, aError = "Session " + id + " is currently stopping");
    }
    else if (session->GetOwner().IsProcess())
    {
        SuccessOrExit(error = mRegistry.TransferToConnection(id, aConnection));
    }
    else
    {
        ExitNow(error = VIBE_ERROR_ALREADY, aError = "Session " + id + " is already registered");
    }

    client->mSessionId  = id;
    client->mIsAttached = false;

exit:
    if (error != VIBE_ERROR_NONE && aError.empty())
    {
        aError = "Failed to register session " + id + ": " + vibeErrorString(error);
    }
    return error;
}

void LocalListener::HandleRegisterSession(ConnectionId aConnection, const Protocol::RegisterSession &aMessage)
{
    std::string errorMessage;
    Session    *session;

    if (BindOwner(aConnection, aMessage, errorMessage) != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Rejected registration from connection %llu: %s", static_cast<unsigned long long>(aConnection),
                    errorMessage.c_str());
        SendTo(aConnection, Protocol::EncodeError(errorMessage));
        ExitNow();
    }

    session = mRegistry.Find(aMessage.mSessionId);
    vibeLogInfo("Local session registered: %s (%s)", StringUtils::ShortId(session->GetId()).c_str(),
                session->GetName().c_str());

    if (!mBridge.SendRegisterSession(aMessage.mRaw, session->GetId(), session->GetPath(), session->GetName()))
    {
        SendTo(aConnection, Protocol::EncodeError(kNotConnectedToBridge));
    }

exit:
    return;
}

void LocalListener::HandleAttachSession(ConnectionId aConnection, const Protocol::AttachSession &aMessage)
{
    Client        *client = FindClient(aConnection);
    const Session *session;
    vibeError      error;

    VerifyOrExit(!aMessage.mSessionId.empty(), SendTo(aConnection, Protocol::EncodeAttachError("", kSessionIdRequired)));
    VerifyOrExit(client->mIsAttached || client->mSessionId.empty(),
                 SendTo(aConnection, Protocol::EncodeAttachError(aMessage.mSessionId,
                                                                 "Session owners cannot attach to a session")));

    if (client->mIsAttached && client->mSessionId != aMessage.mSessionId)
    {
        mRegistry.Detach(client->mSessionId, aConnection);
        client->mSessionId.clear();
        client->mIsAttached = false;
    }

    error = mRegistry.Attach(aMessage.mSessionId, aConnection);
    switch (error)
    {
    case VIBE_ERROR_NONE:
        break;
    case VIBE_ERROR_BUSY:
        SendTo(aConnection, Protocol::EncodeAttachError(aMessage.mSessionId, kAttachStopping));
        ExitNow(vibeLogInfo("Attach failed: session %s is stopping", StringUtils::ShortId(aMessage.mSessionId).c_str()));
    default:
        SendTo(aConnection, Protocol::EncodeAttachError(aMessage.mSessionId, kAttachNotFound));
        ExitNow(vibeLogInfo("Attach failed: session %s not found", StringUtils::ShortId(aMessage.mSessionId).c_str()));
    }

    client->mSessionId  = aMessage.mSessionId;
    client->mIsAttached = true;

    session = mRegistry.Find(aMessage.mSessionId);
    SendTo(aConnection, Protocol::EncodeAttachSuccess(session->GetId(), session->GetName(), session->GetPath()));

exit:
    return;
}

void LocalListener::HandleListSessions(ConnectionId aConnection, const Protocol::ListSessions &aMessage)
{
    std::vector<Protocol::SessionSummary> summaries = mRegistry.GetSummaries();

    VIBE_UNUSED_VARIABLE(aMessage);

    SendTo(aConnection, Protocol::EncodeSessionsList(summaries));
    vibeLogDebg("Listed %zu running sessions", summaries.size());
}

void LocalListener::HandleTerminalInput(ConnectionId aConnection, const Protocol::TerminalInput &aMessage)
{
    Client        *client = FindClient(aConnection);
    const Session *session;

    VerifyOrExit(client->mIsAttached);
    session = mRegistry.Find(client->mSessionId);
    VerifyOrExit(session != nullptr && session->GetOwner().IsConnection(),
                 vibeLogDebg("No owner connection for input of viewer %llu", static_cast<unsigned long long>(aConnection)));

    SendTo(session->GetOwner().GetConnection(), Protocol::EncodeTerminalInput(aMessage.mRaw["data"]));

exit:
    return;
}

void LocalListener::HandleTerminalOutput(ConnectionId aConnection, const Protocol::TerminalOutput &aMessage)
{
    const Session *session = FindOwnedSession(aConnection);

    VerifyOrExit(session != nullptr);

    FanOut(*session, Protocol::Encode(aMessage.mRaw));

    if (mSettings.mForwardTerminalOutput)
    {
        mBridge.Send(Protocol::EncodeWithSessionId(aMessage.mRaw, session->GetId()));
    }

exit:
    return;
}

void LocalListener::HandleSessionEvent(ConnectionId aConnection, const Protocol::SessionEvent &aMessage)
{
    Client        *client  = FindClient(aConnection);
    const Session *session = FindOwnedSession(aConnection);
    std::string    message = Protocol::EncodeWithSessionId(aMessage.mRaw, client->mSessionId);

    if (session != nullptr && aMessage.IsMirroredToViewers())
    {
        FanOut(*session, message);
    }

    if (!mBridge.Send(message))
    {
        vibeLogInfo("Bridge not connected, dropped %s from connection %llu", aMessage.mType.c_str(),
                    static_cast<unsigned long long>(aConnection));
        SendTo(aConnection, Protocol::EncodeError(kNotConnectedToBridge));
    }
}

} // namespace vibe
