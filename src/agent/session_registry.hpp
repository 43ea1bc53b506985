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
 *   This file includes definitions for the registry of live sessions and their stop state machine.
 */

#ifndef VIBE_AGENT_SESSION_REGISTRY_HPP_
#define VIBE_AGENT_SESSION_REGISTRY_HPP_

#include "vibe-agent/config.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/timer.hpp"
#include "common/types.hpp"
#include "protocol/messages.hpp"

namespace vibe {

/**
 * This class represents the exclusive owner of a session: either a child process spawned by the agent or a local
 * CLI connection that registered the session.
 *
 */
class SessionOwner
{
public:
    enum class Kind : uint8_t
    {
        kProcess,         ///< The agent spawned the CLI process.
        kLocalConnection, ///< A CLI connected to the local listener and registered itself.
    };

    static SessionOwner FromProcess(pid_t aPid) { return SessionOwner(Kind::kProcess, aPid, kInvalidConnectionId); }
    static SessionOwner FromConnection(ConnectionId aConnection)
    {
        return SessionOwner(Kind::kLocalConnection, -1, aConnection);
    }

    Kind GetKind(void) const { return mKind; }
    bool IsProcess(void) const { return mKind == Kind::kProcess; }
    bool IsConnection(void) const { return mKind == Kind::kLocalConnection; }
    bool IsProcess(pid_t aPid) const { return IsProcess() && mPid == aPid; }
    bool IsConnection(ConnectionId aConnection) const { return IsConnection() && mConnection == aConnection; }

    pid_t GetPid(void) const
    {
        assert(IsProcess());
        return mPid;
    }

    ConnectionId GetConnection(void) const
    {
        assert(IsConnection());
        return mConnection;
    }

private:
    SessionOwner(Kind aKind, pid_t aPid, ConnectionId aConnection)
        : mKind(aKind)
        , mPid(aPid)
        , mConnection(aConnection)
    {
    }

    Kind         mKind;
    pid_t        mPid;
    ConnectionId mConnection;
};

/**
 * This class represents one live session.
 *
 */
class Session : private NonCopyable
{
public:
    Session(const std::string &aId, const std::string &aPath, const std::string &aName, const SessionOwner &aOwner);

    const std::string  &GetId(void) const { return mId; }
    const std::string  &GetPath(void) const { return mPath; }
    const std::string  &GetName(void) const { return mName; }
    const SessionOwner &GetOwner(void) const { return mOwner; }
    WallTime            GetStartedAt(void) const { return mStartedAt; }
    bool                IsStopping(void) const { return mStopping; }

    /**
     * This method returns the request id of the bridge command that spawned the session, if any.
     *
     */
    const std::string &GetRequestId(void) const { return mRequestId; }
    void               SetRequestId(const std::string &aRequestId) { mRequestId = aRequestId; }

    /**
     * This method returns a copy of the attached viewers, safe to iterate while viewers come and go.
     *
     */
    std::vector<ConnectionId> GetViewers(void) const
    {
        return std::vector<ConnectionId>(mViewers.begin(), mViewers.end());
    }
    bool                      HasViewer(ConnectionId aConnection) const { return mViewers.count(aConnection) != 0; }

    Protocol::SessionSummary GetSummary(void) const;

private:
    friend class SessionRegistry;

    void CancelTimers(void);

    std::string            mId;
    std::string            mPath;
    std::string            mName;
    std::string            mRequestId;
    SessionOwner           mOwner;
    std::set<ConnectionId> mViewers;
    WallTime               mStartedAt;
    bool                   mStopping;

    // Force-kill timer of a spawned session, grace timer of a managed session.
    std::unique_ptr<Timer> mStopTimer;
    // Clears `mStopping` of a managed session whose connection never reports the close.
    std::unique_ptr<Timer> mStoppingGuardTimer;
};

/**
 * This class implements the single source of truth of live sessions.
 *
 */
class SessionRegistry : private NonCopyable
{
public:
    /**
     * This class defines the actions the stop state machine takes on session owners.
     *
     */
    class Dependencies
    {
    public:
        virtual ~Dependencies(void) = default;

        /**
         * This method sends SIGTERM, or SIGKILL if @p aForce, to a spawned session.
         *
         */
        virtual vibeError SignalProcess(pid_t aPid, bool aForce) = 0;

        /**
         * This method asks a managed session to exit on its own by sending `session_stop`.
         *
         */
        virtual void SendStopNotice(ConnectionId aConnection, const std::string &aSessionId) = 0;

        /**
         * This method closes the connection of a managed session.
         *
         */
        virtual void CloseConnection(ConnectionId aConnection, uint16_t aCode, const std::string &aReason) = 0;
    };

    struct Timeouts
    {
        Milliseconds mForceKill;       ///< SIGTERM to SIGKILL.
        Milliseconds mStopGrace;       ///< `session_stop` notice to closing the owner connection.
        Milliseconds mStoppingGuard;   ///< `session_stop` notice to clearing the stopping flag.
    };

    static const Timeouts kDefaultTimeouts;

    explicit SessionRegistry(const Timeouts &aTimeouts = kDefaultTimeouts);
    explicit SessionRegistry(Dependencies &aDependencies, const Timeouts &aTimeouts = kDefaultTimeouts);

    /**
     * This method sets the owner actions of the stop state machine.
     *
     * Sessions cannot be stopped until the dependencies are set.
     *
     */
    void SetDependencies(Dependencies &aDependencies) { mDeps = &aDependencies; }

    /**
     * This method checks whether a new session may use @p aSessionId.
     *
     * @retval VIBE_ERROR_NONE     The id is free.
     * @retval VIBE_ERROR_ALREADY  A session with the id is running.
     * @retval VIBE_ERROR_BUSY     A session with the id is being stopped.
     *
     */
    vibeError CheckAvailable(const std::string &aSessionId) const;

    /**
     * This method adds a session.
     *
     * @retval VIBE_ERROR_NONE     The session is added.
     * @retval VIBE_ERROR_ALREADY  A session with the id is running.
     * @retval VIBE_ERROR_BUSY     A session with the id is being stopped.
     *
     */
    vibeError Add(const std::string  &aSessionId,
                  const std::string  &aPath,
                  const std::string  &aName,
                  const SessionOwner &aOwner,
                  Session           **aSession = nullptr);

    /**
     * This method hands a spawned session over to the local connection of the process it spawned.
     *
     * A resumed CLI registers the id it was told to resume; from then on the connection owns the session.
     *
     * @retval VIBE_ERROR_NONE           The connection owns the session.
     * @retval VIBE_ERROR_NOT_FOUND      No such session.
     * @retval VIBE_ERROR_BUSY           The session is being stopped.
     * @retval VIBE_ERROR_INVALID_STATE  The session is not owned by a process.
     *
     */
    vibeError TransferToConnection(const std::string &aSessionId, ConnectionId aConnection);

    /**
     * This method adds a viewer to a session.
     *
     * @retval VIBE_ERROR_NONE       The viewer is attached.
     * @retval VIBE_ERROR_NOT_FOUND  No such session.
     * @retval VIBE_ERROR_BUSY       The session is being stopped.
     *
     */
    vibeError Attach(const std::string &aSessionId, ConnectionId aViewer);

    /**
     * This method removes a viewer from a session. Unknown sessions and viewers are ignored.
     *
     */
    void Detach(const std::string &aSessionId, ConnectionId aViewer);

    /**
     * This method starts stopping a session.
     *
     * A spawned process receives SIGTERM now and SIGKILL if it is still registered when the force-kill timeout
     * expires. A managed connection receives `session_stop` now and is closed after the grace period; its stopping
     * flag is cleared after the guard timeout even if the close is never reported. Stopping a session that is
     * already stopping only acknowledges.
     *
     * @retval VIBE_ERROR_NONE           The session is stopping.
     * @retval VIBE_ERROR_NOT_FOUND      No such session.
     * @retval VIBE_ERROR_INVALID_STATE  No dependencies are set.
     *
     */
    vibeError Stop(const std::string &aSessionId);

    /**
     * This method removes a session, cancelling its timers.
     *
     * @returns The removed session, or nullptr if there is no such session.
     *
     */
    std::unique_ptr<Session> Remove(const std::string &aSessionId);

    Session       *Find(const std::string &aSessionId);
    const Session *Find(const std::string &aSessionId) const;
    Session       *FindByOwnerConnection(ConnectionId aConnection);
    Session       *FindByProcess(pid_t aPid);

    std::vector<std::string>              GetSessionIds(void) const;
    std::vector<Protocol::SessionSummary> GetSummaries(void) const;
    std::vector<Session *>                GetSessions(void);

    size_t GetSize(void) const { return mSessions.size(); }

private:
    void HandleForceKill(const std::string &aSessionId);
    void HandleStopGrace(const std::string &aSessionId);
    void HandleStoppingGuard(const std::string &aSessionId);

    Dependencies                                    *mDeps;
    Timeouts                                         mTimeouts;
    std::map<std::string, std::unique_ptr<Session>> mSessions;
};

} // namespace vibe

#endif // VIBE_AGENT_SESSION_REGISTRY_HPP_
