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
 *   This file includes definitions for the supervisor of spawned CLI processes.
 */

#ifndef VIBE_AGENT_PROCESS_SUPERVISOR_HPP_
#define VIBE_AGENT_PROCESS_SUPERVISOR_HPP_

#include "vibe-agent/config.h"

#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

#include "common/code_utils.hpp"
#include "common/mainloop.hpp"
#include "common/types.hpp"
#include "protocol/messages.hpp"

namespace vibe {

/**
 * This interface spawns and signals one CLI process per session.
 *
 */
class ProcessSupervisor
{
public:
    /**
     * This class receives the asynchronous outcome of spawned processes.
     *
     */
    class Delegate
    {
    public:
        virtual ~Delegate(void) = default;

        /**
         * This method is called once when a spawned process ended.
         *
         */
        virtual void HandleProcessExit(const std::string          &aSessionId,
                                       pid_t                       aPid,
                                       const Protocol::ExitStatus &aStatus) = 0;

        /**
         * This method is called once when a spawned process can no longer be supervised.
         *
         */
        virtual void HandleProcessError(const std::string &aSessionId, pid_t aPid, const std::string &aError) = 0;
    };

    virtual ~ProcessSupervisor(void) = default;

    void SetDelegate(Delegate &aDelegate) { mDelegate = &aDelegate; }

    /**
     * This method spawns @p aExecutable with @p aArgs in @p aWorkingDirectory.
     *
     * @param[in]  aSessionId         The session the process belongs to, reported back with its outcome.
     * @param[in]  aExecutable        The path of the executable.
     * @param[in]  aArgs              The arguments, not including argv[0].
     * @param[in]  aWorkingDirectory  The working directory of the process.
     * @param[out] aPid               The process id on success.
     * @param[out] aErrorMessage      A human readable reason on failure.
     *
     * @retval VIBE_ERROR_NONE   The process is running.
     * @retval VIBE_ERROR_ERRNO  The process could not be started.
     *
     */
    virtual vibeError Spawn(const std::string              &aSessionId,
                            const std::string              &aExecutable,
                            const std::vector<std::string> &aArgs,
                            const std::string              &aWorkingDirectory,
                            pid_t                          &aPid,
                            std::string                    &aErrorMessage) = 0;

    /**
     * This method sends SIGTERM, or SIGKILL if @p aForce, to a spawned process.
     *
     * @retval VIBE_ERROR_NONE       The signal was sent.
     * @retval VIBE_ERROR_NOT_FOUND  The process is not supervised.
     * @retval VIBE_ERROR_ERRNO      kill() failed.
     *
     */
    virtual vibeError Signal(pid_t aPid, bool aForce) = 0;

protected:
    Delegate *mDelegate = nullptr;
};

/**
 * This class implements the ProcessSupervisor with fork()/exec() on the mainloop.
 *
 * The standard output and error of every child are drained into the log; the exit of a child is collected by
 * waitpid() whenever its pipes close or the reap interval expires.
 *
 */
class ChildProcessSupervisor : public ProcessSupervisor, public MainloopProcessor, private NonCopyable
{
public:
    ChildProcessSupervisor(void) = default;
    ~ChildProcessSupervisor(void) override;

    vibeError Spawn(const std::string              &aSessionId,
                    const std::string              &aExecutable,
                    const std::vector<std::string> &aArgs,
                    const std::string              &aWorkingDirectory,
                    pid_t                          &aPid,
                    std::string                    &aErrorMessage) override;
    vibeError Signal(pid_t aPid, bool aForce) override;

    /**
     * This method sends SIGTERM to every supervised process.
     *
     */
    void TerminateAll(void);

    /**
     * This method returns the number of supervised processes.
     *
     */
    size_t GetChildCount(void) const { return mChildren.size(); }

    void Update(MainloopContext &aMainloop) override;
    void Process(const MainloopContext &aMainloop) override;

private:
    static constexpr int kReapIntervalMs = 500;
    static constexpr int kMaxLineLength  = 1024;

    struct Child
    {
        std::string mSessionId;
        int         mStdin;
        int         mStdout;
        int         mStderr;
        std::string mPendingStdout;
        std::string mPendingStderr;
    };

    static void DrainOutput(const std::string     &aSessionId,
                            int                   &aFd,
                            std::string           &aPending,
                            const MainloopContext &aMainloop);
    static void LogLines(const std::string &aSessionId, std::string &aPending, bool aFlush);
    static void CloseChildFds(Child &aChild);

    std::map<pid_t, Child> mChildren;
};

} // namespace vibe

#endif // VIBE_AGENT_PROCESS_SUPERVISOR_HPP_
