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

#define VIBE_LOG_TAG "BRIDGE"

#include "agent/bridge_connection.hpp"

#include "utils/string_utils.hpp"
#include "utils/uuid.hpp"

namespace vibe {

namespace {
const double kDefaultReconnectJitter = 0.1;
const char  *kAuthErrorKeywords[]    = {"token", "auth", "unauthorized"};

bool IsAuthenticationError(const std::string &aMessage)
{
    bool        matched = false;
    std::string lower   = StringUtils::ToLowercase(aMessage);

    for (const char *keyword : kAuthErrorKeywords)
    {
        if (lower.find(keyword) != std::string::npos)
        {
            ExitNow(matched = true);
        }
    }

exit:
    return matched;
}
} // namespace

BridgeConnection::Settings::Settings(void)
    : mUrl(VIBE_CONFIG_DEFAULT_BRIDGE_URL)
    , mPlatform("linux")
    , mReconnectBaseDelay(VIBE_CONFIG_RECONNECT_BASE_DELAY_MS)
    , mReconnectFactor(2)
    , mReconnectMaxDelay(VIBE_CONFIG_RECONNECT_MAX_DELAY_MS)
    , mReconnectJitter(kDefaultReconnectJitter)
    , mHeartbeatInterval(VIBE_CONFIG_HEARTBEAT_INTERVAL_MS)
{
}

BridgeConnection::BridgeConnection(WebSocketClient       &aClient,
                                   TokenProvider         &aTokenProvider,
                                   const SessionRegistry &aRegistry,
                                   const Settings        &aSettings)
    : mClient(aClient)
    , mTokenProvider(aTokenProvider)
    , mRegistry(aRegistry)
    , mSettings(aSettings)
    , mDelegate(nullptr)
    , mState(State::kDisconnected)
    , mBackoff(aSettings.mReconnectBaseDelay,
               aSettings.mReconnectFactor,
               aSettings.mReconnectMaxDelay,
               aSettings.mReconnectJitter)
    , mLastReconnectDelay(0)
    , mRefreshAttempted(false)
    , mShuttingDown(false)
    , mFatal(false)
    , mReconnectTimer([this](Timer &) { StartAttempt(); })
    , mHeartbeatTimer([this](Timer &) { HandleHeartbeatTimer(); })
{
    mClient.SetDelegate(*this);
}

BridgeConnection::~BridgeConnection(void)
{
    mReconnectTimer.Stop();
    mHeartbeatTimer.Stop();
}

const char *BridgeConnection::StateToString(State aState)
{
    const char *str = "unknown";

    switch (aState)
    {
    case State::kDisconnected:
        str = "disconnected";
        break;
    case State::kConnecting:
        str = "connecting";
        break;
    case State::kOpen:
        str = "open";
        break;
    case State::kAuthenticating:
        str = "authenticating";
        break;
    case State::kRegistered:
        str = "registered";
        break;
    }

    return str;
}

void BridgeConnection::SetState(State aState)
{
    VerifyOrExit(mState != aState);

    vibeLogDebg("State %s -> %s", StateToString(mState), StateToString(aState));
    mState = aState;

exit:
    return;
}

void BridgeConnection::Connect(void)
{
    mShuttingDown = false;
    mFatal        = false;
    mReconnectTimer.Stop();
    StartAttempt();
}

void BridgeConnection::StartAttempt(void)
{
    VerifyOrExit(!mShuttingDown && !mFatal);

    vibeLogInfo("Connecting to %s", mSettings.mUrl.c_str());
    SetState(State::kConnecting);

    if (mClient.Connect(mSettings.mUrl) != VIBE_ERROR_NONE)
    {
        Fail("Invalid bridge URL " + mSettings.mUrl);
    }

exit:
    return;
}

void BridgeConnection::Shutdown(void)
{
    mShuttingDown = true;
    mReconnectTimer.Stop();
    mHeartbeatTimer.Stop();
    mClient.Close();
    SetState(State::kDisconnected);
}

bool BridgeConnection::Send(const std::string &aMessage)
{
    bool sent = false;

    VerifyOrExit(mState != State::kDisconnected && mState != State::kConnecting);
    sent = mClient.Send(aMessage);

exit:
    return sent;
}

bool BridgeConnection::SendRegisterSession(const Json::Value &aBase,
                                           const std::string &aSessionId,
                                           const std::string &aPath,
                                           const std::string &aName)
{
    if (mSettings.mAgentId.empty())
    {
        vibeLogWarn("Agent not registered yet, session %s stays unmanaged until re-announced",
                    StringUtils::ShortId(aSessionId).c_str());
    }

    return Send(Protocol::EncodeSessionRegistration(aBase, aSessionId, aPath, aName, mSettings.mAgentId,
                                                    mSettings.mHostName));
}

void BridgeConnection::ScheduleReconnect(void)
{
    VerifyOrExit(!mShuttingDown && !mFatal && !mReconnectTimer.IsRunning());

    mLastReconnectDelay = mBackoff.Next();
    vibeLogInfo("Reconnecting in %lld ms (attempt %u)", static_cast<long long>(mLastReconnectDelay.count()),
                mBackoff.GetAttempt());
    mReconnectTimer.Start(mLastReconnectDelay);

exit:
    return;
}

void BridgeConnection::Fail(const std::string &aReason)
{
    vibeLogCrit("%s", aReason.c_str());

    mFatal = true;
    mReconnectTimer.Stop();
    mHeartbeatTimer.Stop();
    mClient.Close();
    SetState(State::kDisconnected);

    if (mDelegate != nullptr)
    {
        mDelegate->HandleBridgeFatalError(aReason);
    }
}

void BridgeConnection::HandleClientOpened(void)
{
    std::string token;

    vibeLogInfo("Connected to bridge");
    SetState(State::kOpen);
    mBackoff.Reset();
    mReconnectTimer.Stop();
    mRefreshAttempted = false;

    if (mTokenProvider.EnsureValidToken(token) != VIBE_ERROR_NONE)
    {
        Fail("No auth token available, sign in first");
        ExitNow();
    }

    SetState(State::kAuthenticating);
    Send(Protocol::EncodeAuthenticate(token));

exit:
    return;
}

void BridgeConnection::HandleClientMessage(const std::string &aText)
{
    vibeError error = Protocol::DecodeBridgeMessage(aText, *this);

    // Malformed and unknown messages are logged and discarded by the decoder.
    VIBE_UNUSED_VARIABLE(error);
}

void BridgeConnection::HandleClientClosed(const std::string &aReason)
{
    bool wasOpen = (mState != State::kDisconnected && mState != State::kConnecting);

    vibeLogWarn("Disconnected from bridge: %s", aReason.c_str());
    SetState(State::kDisconnected);
    mHeartbeatTimer.Stop();

    if (wasOpen && mDelegate != nullptr)
    {
        mDelegate->HandleBridgeDisconnected();
    }

    ScheduleReconnect();
}

void BridgeConnection::HandleAuthenticated(const Protocol::Authenticated &aMessage)
{
    VerifyOrExit(mState == State::kAuthenticating || mState == State::kRegistered,
                 vibeLogWarn("Ignoring authenticated in state %s", StateToString(mState)));

    vibeLogInfo("Authenticated as %s", aMessage.mEmail.empty() ? aMessage.mUserId.c_str() : aMessage.mEmail.c_str());
    mRefreshAttempted = false;

    if (mSettings.mAgentId.empty())
    {
        mSettings.mAgentId = Uuid::NewRandomString();
        vibeLogNote("Generated new agent id %s", StringUtils::ShortId(mSettings.mAgentId).c_str());
        if (mDelegate != nullptr)
        {
            mDelegate->HandleAgentIdAssigned(mSettings.mAgentId);
        }
    }

    Send(Protocol::EncodeAgentRegister(mSettings.mAgentId, mSettings.mHostName, mSettings.mPlatform,
                                       mRegistry.GetSessionIds()));
    AnnounceSessions();

    SetState(State::kRegistered);
    mHeartbeatTimer.Start(mSettings.mHeartbeatInterval);

    if (mDelegate != nullptr)
    {
        mDelegate->HandleBridgeRegistered();
    }

exit:
    return;
}

void BridgeConnection::AnnounceSessions(void)
{
    for (const Protocol::SessionSummary &summary : mRegistry.GetSummaries())
    {
        vibeLogInfo("Re-registering session %s (%s)", StringUtils::ShortId(summary.mSessionId).c_str(),
                    summary.mSource == "ios" ? "spawned" : "managed");
        SendRegisterSession(Json::Value(Json::objectValue), summary.mSessionId, summary.mPath, summary.mName);
    }
}

void BridgeConnection::HandleAuthError(const Protocol::AuthError &aMessage)
{
    vibeLogWarn("Authentication failed: %s", aMessage.mMessage.c_str());
    RetryAuthentication(aMessage.mMessage);
}

void BridgeConnection::RetryAuthentication(const std::string &aReason)
{
    std::string token;

    if (mState == State::kRegistered)
    {
        mHeartbeatTimer.Stop();
    }
    SetState(State::kAuthenticating);

    VerifyOrExit(!mRefreshAttempted, Fail("Authentication rejected after token refresh (" + aReason +
                                          "), sign in again"));
    mRefreshAttempted = true;

    VerifyOrExit(mTokenProvider.RefreshIdToken(token) == VIBE_ERROR_NONE,
                 Fail("Token refresh failed (" + aReason + "), sign in again"));

    vibeLogInfo("Token refreshed, re-authenticating");
    Send(Protocol::EncodeAuthenticate(token));

exit:
    return;
}

void BridgeConnection::HandleAgentRegistered(const Protocol::AgentRegistered &aMessage)
{
    vibeLogInfo("Agent registered: %s (host %s)", aMessage.mAgentId.c_str(), mSettings.mHostName.c_str());
}

void BridgeConnection::HandleStartSession(const Protocol::StartSession &aMessage)
{
    if (mDelegate != nullptr)
    {
        mDelegate->HandleStartSession(aMessage);
    }
}

void BridgeConnection::HandleResumeSession(const Protocol::ResumeSession &aMessage)
{
    if (mDelegate != nullptr)
    {
        mDelegate->HandleResumeSession(aMessage);
    }
}

void BridgeConnection::HandleStopSession(const Protocol::StopSession &aMessage)
{
    if (mDelegate != nullptr)
    {
        mDelegate->HandleStopSession(aMessage);
    }
}

void BridgeConnection::HandleListAgentSessions(const Protocol::ListAgentSessions &aMessage)
{
    if (mDelegate != nullptr)
    {
        mDelegate->HandleListAgentSessions(aMessage);
    }
}

void BridgeConnection::HandleBridgeError(const Protocol::BridgeError &aMessage)
{
    vibeLogWarn("Bridge error: %s", aMessage.mMessage.c_str());

    if (mDelegate != nullptr)
    {
        mDelegate->HandleBridgeError(aMessage);
    }

    if (IsAuthenticationError(aMessage.mMessage) && !mFatal)
    {
        RetryAuthentication(aMessage.mMessage);
    }
}

void BridgeConnection::HandleSessionRelay(const Protocol::SessionRelay &aMessage)
{
    if (mDelegate != nullptr)
    {
        mDelegate->HandleSessionRelay(aMessage);
    }
}

void BridgeConnection::HandleHeartbeatTimer(void)
{
    VerifyOrExit(mState == State::kRegistered);

    Send(Protocol::EncodeAgentHeartbeat());
    mHeartbeatTimer.Start(mSettings.mHeartbeatInterval);

exit:
    return;
}

} // namespace vibe
