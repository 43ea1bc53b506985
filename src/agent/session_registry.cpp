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

#define VIBE_LOG_TAG "REGISTRY"

#include "agent/session_registry.hpp"

#include "utils/string_utils.hpp"

namespace vibe {

const SessionRegistry::Timeouts SessionRegistry::kDefaultTimeouts = {
    Milliseconds(VIBE_CONFIG_FORCE_KILL_TIMEOUT_MS),
    Milliseconds(VIBE_CONFIG_STOP_GRACE_PERIOD_MS),
    Milliseconds(VIBE_CONFIG_STOP_SAFETY_TIMEOUT_MS),
};

Session::Session(const std::string &aId, const std::string &aPath, const std::string &aName, const SessionOwner &aOwner)
    : mId(aId)
    , mPath(aPath)
    , mName(aName)
    , mOwner(aOwner)
    , mStartedAt(WallClock::now())
    , mStopping(false)
{
}

Protocol::SessionSummary Session::GetSummary(void) const
{
    Protocol::SessionSummary summary;

    summary.mSessionId = mId;
    summary.mName      = mName;
    summary.mPath      = mPath;
    summary.mStartedAt = FormatUtcTime(mStartedAt);
    summary.mSource    = mOwner.IsProcess() ? "ios" : "cli";

    return summary;
}

void Session::CancelTimers(void)
{
    mStopTimer.reset();
    mStoppingGuardTimer.reset();
}

SessionRegistry::SessionRegistry(const Timeouts &aTimeouts)
    : mDeps(nullptr)
    , mTimeouts(aTimeouts)
{
}

SessionRegistry::SessionRegistry(Dependencies &aDependencies, const Timeouts &aTimeouts)
    : mDeps(&aDependencies)
    , mTimeouts(aTimeouts)
{
}

vibeError SessionRegistry::CheckAvailable(const std::string &aSessionId) const
{
    vibeError      error   = VIBE_ERROR_NONE;
    const Session *session = Find(aSessionId);

    VerifyOrExit(session != nullptr);
    error = session->IsStopping() ? VIBE_ERROR_BUSY : VIBE_ERROR_ALREADY;

exit:
    return error;
}

vibeError SessionRegistry::Add(const std::string  &aSessionId,
                               const std::string  &aPath,
                               const std::string  &aName,
                               const SessionOwner &aOwner,
                               Session           **aSession)
{
    vibeError                error;
    std::unique_ptr<Session> session;

    SuccessOrExit(error = CheckAvailable(aSessionId));

    session = MakeUnique<Session>(aSessionId, aPath, aName, aOwner);
    if (aSession != nullptr)
    {
        *aSession = session.get();
    }
    mSessions[aSessionId] = std::move(session);

    vibeLogInfo("Added %s session %s (%s) in %s", aOwner.IsProcess() ? "spawned" : "managed",
                StringUtils::ShortId(aSessionId).c_str(), aName.c_str(), aPath.c_str());

exit:
    return error;
}

vibeError SessionRegistry::TransferToConnection(const std::string &aSessionId, ConnectionId aConnection)
{
    vibeError error   = VIBE_ERROR_NONE;
    Session  *session = Find(aSessionId);

    VerifyOrExit(session != nullptr, error = VIBE_ERROR_NOT_FOUND);
    VerifyOrExit(!session->IsStopping(), error = VIBE_ERROR_BUSY);
    VerifyOrExit(session->GetOwner().IsProcess(), error = VIBE_ERROR_INVALID_STATE);

    vibeLogInfo("Session %s handed over from pid %d to connection %llu", StringUtils::ShortId(aSessionId).c_str(),
                session->GetOwner().GetPid(), static_cast<unsigned long long>(aConnection));
    session->mOwner = SessionOwner::FromConnection(aConnection);
    session->mViewers.erase(aConnection);

exit:
    return error;
}

vibeError SessionRegistry::Attach(const std::string &aSessionId, ConnectionId aViewer)
{
    vibeError error   = VIBE_ERROR_NONE;
    Session  *session = Find(aSessionId);

    VerifyOrExit(session != nullptr, error = VIBE_ERROR_NOT_FOUND);
    VerifyOrExit(!session->IsStopping(), error = VIBE_ERROR_BUSY);
    VerifyOrExit(!session->GetOwner().IsConnection(aViewer), error = VIBE_ERROR_INVALID_ARGS);

    session->mViewers.insert(aViewer);
    vibeLogInfo("Viewer %llu attached to session %s (%zu viewers)", static_cast<unsigned long long>(aViewer),
                StringUtils::ShortId(aSessionId).c_str(), session->mViewers.size());

exit:
    return error;
}

void SessionRegistry::Detach(const std::string &aSessionId, ConnectionId aViewer)
{
    Session *session = Find(aSessionId);

    VerifyOrExit(session != nullptr && session->mViewers.erase(aViewer) > 0);
    vibeLogInfo("Viewer %llu detached from session %s", static_cast<unsigned long long>(aViewer),
                StringUtils::ShortId(aSessionId).c_str());

exit:
    return;
}

vibeError SessionRegistry::Stop(const std::string &aSessionId)
{
    vibeError   error   = VIBE_ERROR_NONE;
    Session    *session = Find(aSessionId);
    std::string id      = aSessionId;

    VerifyOrExit(session != nullptr, error = VIBE_ERROR_NOT_FOUND);
    VerifyOrExit(mDeps != nullptr, error = VIBE_ERROR_INVALID_STATE);
    VerifyOrExit(!session->IsStopping(), vibeLogInfo("Session %s is already stopping", StringUtils::ShortId(id).c_str()));

    session->mStopping = true;

    if (session->GetOwner().IsProcess())
    {
        pid_t pid = session->GetOwner().GetPid();

        vibeLogInfo("Stopping spawned session %s (pid %d)", StringUtils::ShortId(id).c_str(), pid);
        vibeLogResult(mDeps->SignalProcess(pid, /* aForce */ false), "Send SIGTERM to pid %d", pid);

        session->mStopTimer = MakeUnique<Timer>([this, id](Timer &) { HandleForceKill(id); });
        session->mStopTimer->Start(mTimeouts.mForceKill);
    }
    else
    {
        vibeLogInfo("Stopping managed session %s (connection %llu)", StringUtils::ShortId(id).c_str(),
                    static_cast<unsigned long long>(session->GetOwner().GetConnection()));
        mDeps->SendStopNotice(session->GetOwner().GetConnection(), id);

        session->mStopTimer = MakeUnique<Timer>([this, id](Timer &) { HandleStopGrace(id); });
        session->mStopTimer->Start(mTimeouts.mStopGrace);
        session->mStoppingGuardTimer = MakeUnique<Timer>([this, id](Timer &) { HandleStoppingGuard(id); });
        session->mStoppingGuardTimer->Start(mTimeouts.mStoppingGuard);
    }

exit:
    return error;
}

std::unique_ptr<Session> SessionRegistry::Remove(const std::string &aSessionId)
{
    std::unique_ptr<Session> session;
    auto                     it = mSessions.find(aSessionId);

    VerifyOrExit(it != mSessions.end());

    session = std::move(it->second);
    mSessions.erase(it);
    session->CancelTimers();
    vibeLogInfo("Removed session %s", StringUtils::ShortId(aSessionId).c_str());

exit:
    return session;
}

Session *SessionRegistry::Find(const std::string &aSessionId)
{
    auto it = mSessions.find(aSessionId);

    return it == mSessions.end() ? nullptr : it->second.get();
}

const Session *SessionRegistry::Find(const std::string &aSessionId) const
{
    auto it = mSessions.find(aSessionId);

    return it == mSessions.end() ? nullptr : it->second.get();
}

Session *SessionRegistry::FindByOwnerConnection(ConnectionId aConnection)
{
    Session *found = nullptr;

    for (auto &entry : mSessions)
    {
        if (entry.second->GetOwner().IsConnection(aConnection))
        {
            found = entry.second.get();
            break;
        }
    }

    return found;
}

Session *SessionRegistry::FindByProcess(pid_t aPid)
{
    Session *found = nullptr;

    for (auto &entry : mSessions)
    {
        if (entry.second->GetOwner().IsProcess(aPid))
        {
            found = entry.second.get();
            break;
        }
    }

    return found;
}

std::vector<std::string> SessionRegistry::GetSessionIds(void) const
{
    std::vector<std::string> ids;

    for (const auto &entry : mSessions)
    {
        ids.push_back(entry.first);
    }

    return ids;
}

std::vector<Protocol::SessionSummary> SessionRegistry::GetSummaries(void) const
{
    std::vector<Protocol::SessionSummary> summaries;

    for (const auto &entry : mSessions)
    {
        summaries.push_back(entry.second->GetSummary());
    }

    return summaries;
}

std::vector<Session *> SessionRegistry::GetSessions(void)
{
    std::vector<Session *> sessions;

    for (auto &entry : mSessions)
    {
        sessions.push_back(entry.second.get());
    }

    return sessions;
}

void SessionRegistry::HandleForceKill(const std::string &aSessionId)
{
    Session *session = Find(aSessionId);

    VerifyOrExit(session != nullptr && session->GetOwner().IsProcess() && mDeps != nullptr);

    vibeLogWarn("Session %s did not exit in time, sending SIGKILL", StringUtils::ShortId(aSessionId).c_str());
    vibeLogResult(mDeps->SignalProcess(session->GetOwner().GetPid(), /* aForce */ true), "Send SIGKILL to pid %d",
                  session->GetOwner().GetPid());

exit:
    return;
}

void SessionRegistry::HandleStopGrace(const std::string &aSessionId)
{
    Session *session = Find(aSessionId);

    VerifyOrExit(session != nullptr && session->GetOwner().IsConnection() && mDeps != nullptr);
    mDeps->CloseConnection(session->GetOwner().GetConnection(), 1000, "Stopped by agent");

exit:
    return;
}

void SessionRegistry::HandleStoppingGuard(const std::string &aSessionId)
{
    Session *session = Find(aSessionId);

    VerifyOrExit(session != nullptr);
    vibeLogWarn("Session %s never reported its close, clearing the stopping flag",
                StringUtils::ShortId(aSessionId).c_str());
    session->mStopping = false;

exit:
    return;
}

} // namespace vibe
