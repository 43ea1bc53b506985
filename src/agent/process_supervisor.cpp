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

#define VIBE_LOG_TAG "PROCESS"

#include "agent/process_supervisor.hpp"

#include <algorithm>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/time.hpp"
#include "utils/string_utils.hpp"

namespace vibe {

constexpr int ChildProcessSupervisor::kReapIntervalMs;
constexpr int ChildProcessSupervisor::kMaxLineLength;

namespace {

void ClosePipe(int aFds[2])
{
    for (int i = 0; i < 2; i++)
    {
        if (aFds[i] != -1)
        {
            close(aFds[i]);
            aFds[i] = -1;
        }
    }
}

// Runs in the forked child: only async-signal-safe calls until exec.
void ExecChild(const char  *aExecutable,
               char *const *aArgv,
               const char  *aWorkingDirectory,
               int          aStdin,
               int          aStdout,
               int          aStderr,
               int          aErrorFd)
{
    int childErrno;

    // The agent ignores SIGPIPE; the CLI should not inherit that.
    signal(SIGPIPE, SIG_DFL);

    if (dup2(aStdin, STDIN_FILENO) == -1 || dup2(aStdout, STDOUT_FILENO) == -1 ||
        dup2(aStderr, STDERR_FILENO) == -1 || chdir(aWorkingDirectory) == -1)
    {
        childErrno = errno;
    }
    else
    {
        execvp(aExecutable, aArgv);
        childErrno = errno;
    }

    // The error pipe is close-on-exec: the parent reads nothing if exec succeeded.
    if (write(aErrorFd, &childErrno, sizeof(childErrno)) < 0)
    {
        childErrno = errno;
    }
    _exit(127);
}

} // namespace

ChildProcessSupervisor::~ChildProcessSupervisor(void)
{
    for (auto &entry : mChildren)
    {
        CloseChildFds(entry.second);
    }
}

vibeError ChildProcessSupervisor::Spawn(const std::string              &aSessionId,
                                        const std::string              &aExecutable,
                                        const std::vector<std::string> &aArgs,
                                        const std::string              &aWorkingDirectory,
                                        pid_t                          &aPid,
                                        std::string                    &aErrorMessage)
{
    vibeError           error         = VIBE_ERROR_NONE;
    int                 stdinPipe[2]  = {-1, -1};
    int                 stdoutPipe[2] = {-1, -1};
    int                 stderrPipe[2] = {-1, -1};
    int                 errorPipe[2]  = {-1, -1};
    int                 childErrno    = 0;
    pid_t               pid           = -1;
    ssize_t             rval;
    std::vector<char *> argv;
    Child               child;

    VerifyOrExit(pipe2(stdinPipe, O_CLOEXEC) == 0 && pipe2(stdoutPipe, O_CLOEXEC) == 0 &&
                     pipe2(stderrPipe, O_CLOEXEC) == 0 && pipe2(errorPipe, O_CLOEXEC) == 0,
                 error = VIBE_ERROR_ERRNO, aErrorMessage = std::string("Failed to create pipes: ") + strerror(errno));

    argv.push_back(const_cast<char *>(aExecutable.c_str()));
    for (const std::string &arg : aArgs)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid = fork();
    VerifyOrExit(pid != -1, error = VIBE_ERROR_ERRNO, aErrorMessage = std::string("fork() failed: ") + strerror(errno));

    if (pid == 0)
    {
        ExecChild(aExecutable.c_str(), argv.data(), aWorkingDirectory.c_str(), stdinPipe[0], stdoutPipe[1],
                  stderrPipe[1], errorPipe[1]);
    }

    close(errorPipe[1]);
    errorPipe[1] = -1;

    do
    {
        rval = read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (rval == -1 && errno == EINTR);

    if (rval == static_cast<ssize_t>(sizeof(childErrno)))
    {
        int status;

        while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
        {
        }
        pid           = -1;
        errno         = childErrno;
        aErrorMessage = "Failed to start " + aExecutable + ": " + strerror(childErrno);
        ExitNow(error = VIBE_ERROR_ERRNO);
    }

    child.mSessionId = aSessionId;
    child.mStdin     = stdinPipe[1];
    child.mStdout    = stdoutPipe[0];
    child.mStderr    = stderrPipe[0];
    stdinPipe[1]     = -1;
    stdoutPipe[0]    = -1;
    stderrPipe[0]    = -1;

    fcntl(child.mStdout, F_SETFL, fcntl(child.mStdout, F_GETFL, 0) | O_NONBLOCK);
    fcntl(child.mStderr, F_SETFL, fcntl(child.mStderr, F_GETFL, 0) | O_NONBLOCK);

    mChildren[pid] = child;
    aPid           = pid;
    vibeLogInfo("Spawned %s (pid %d) for session %s in %s", aExecutable.c_str(), pid,
                StringUtils::ShortId(aSessionId).c_str(), aWorkingDirectory.c_str());

exit:
    ClosePipe(stdinPipe);
    ClosePipe(stdoutPipe);
    ClosePipe(stderrPipe);
    ClosePipe(errorPipe);
    if (error != VIBE_ERROR_NONE)
    {
        vibeLogWarn("Failed to spawn session %s: %s", StringUtils::ShortId(aSessionId).c_str(), aErrorMessage.c_str());
    }
    return error;
}

vibeError ChildProcessSupervisor::Signal(pid_t aPid, bool aForce)
{
    vibeError error = VIBE_ERROR_NONE;

    VerifyOrExit(mChildren.count(aPid) != 0, error = VIBE_ERROR_NOT_FOUND);
    VerifyOrExit(kill(aPid, aForce ? SIGKILL : SIGTERM) == 0, error = VIBE_ERROR_ERRNO);

exit:
    return error;
}

void ChildProcessSupervisor::TerminateAll(void)
{
    for (const auto &entry : mChildren)
    {
        vibeLogInfo("Terminating pid %d of session %s", entry.first, StringUtils::ShortId(entry.second.mSessionId).c_str());
        if (kill(entry.first, SIGTERM) != 0)
        {
            vibeLogWarn("Failed to terminate pid %d: %s", entry.first, strerror(errno));
        }
    }
}

void ChildProcessSupervisor::Update(MainloopContext &aMainloop)
{
    for (const auto &entry : mChildren)
    {
        for (int fd : {entry.second.mStdout, entry.second.mStderr})
        {
            if (fd != -1)
            {
                FD_SET(fd, &aMainloop.mReadFdSet);
                aMainloop.mMaxFd = std::max(aMainloop.mMaxFd, fd);
            }
        }
    }

    if (!mChildren.empty() && GetMicroSeconds(aMainloop.mTimeout) > Milliseconds(kReapIntervalMs))
    {
        aMainloop.mTimeout = GetTimeval(Milliseconds(kReapIntervalMs));
    }
}

void ChildProcessSupervisor::Process(const MainloopContext &aMainloop)
{
    std::vector<pid_t> pids;

    for (auto &entry : mChildren)
    {
        DrainOutput(entry.second.mSessionId, entry.second.mStdout, entry.second.mPendingStdout, aMainloop);
        DrainOutput(entry.second.mSessionId, entry.second.mStderr, entry.second.mPendingStderr, aMainloop);
        pids.push_back(entry.first);
    }

    // The delegate may spawn or signal processes, so work on a snapshot.
    for (pid_t pid : pids)
    {
        int                  status;
        pid_t                rval = waitpid(pid, &status, WNOHANG);
        auto                 it   = mChildren.find(pid);
        std::string          sessionId;
        Protocol::ExitStatus exitStatus;

        if (rval == 0 || (rval == -1 && errno == EINTR) || it == mChildren.end())
        {
            continue;
        }

        sessionId = it->second.mSessionId;
        LogLines(sessionId, it->second.mPendingStdout, /* aFlush */ true);
        LogLines(sessionId, it->second.mPendingStderr, /* aFlush */ true);
        CloseChildFds(it->second);
        mChildren.erase(it);

        if (rval == -1)
        {
            std::string reason = std::string("waitpid() failed: ") + strerror(errno);

            vibeLogWarn("Lost track of pid %d: %s", pid, reason.c_str());
            if (mDelegate != nullptr)
            {
                mDelegate->HandleProcessError(sessionId, pid, reason);
            }
            continue;
        }

        exitStatus.mExited = WIFEXITED(status);
        exitStatus.mCode   = exitStatus.mExited ? WEXITSTATUS(status) : WTERMSIG(status);
        vibeLogInfo("Pid %d of session %s %s %d", pid, StringUtils::ShortId(sessionId).c_str(),
                    exitStatus.mExited ? "exited with code" : "was killed by signal", exitStatus.mCode);

        if (mDelegate != nullptr)
        {
            mDelegate->HandleProcessExit(sessionId, pid, exitStatus);
        }
    }
}

void ChildProcessSupervisor::DrainOutput(const std::string     &aSessionId,
                                         int                   &aFd,
                                         std::string           &aPending,
                                         const MainloopContext &aMainloop)
{
    char    buffer[4096];
    ssize_t rval;

    VerifyOrExit(aFd != -1 && FD_ISSET(aFd, &aMainloop.mReadFdSet));

    while ((rval = read(aFd, buffer, sizeof(buffer))) > 0)
    {
        aPending.append(buffer, static_cast<size_t>(rval));
        LogLines(aSessionId, aPending, /* aFlush */ false);
    }

    if (rval == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR))
    {
        LogLines(aSessionId, aPending, /* aFlush */ true);
        close(aFd);
        aFd = -1;
    }

exit:
    return;
}

void ChildProcessSupervisor::LogLines(const std::string &aSessionId, std::string &aPending, bool aFlush)
{
    size_t newline;

    while ((newline = aPending.find('\n')) != std::string::npos ||
           (aPending.size() >= static_cast<size_t>(kMaxLineLength)) || (aFlush && !aPending.empty()))
    {
        size_t      length = std::min(newline == std::string::npos ? aPending.size() : newline,
                                      static_cast<size_t>(kMaxLineLength));
        std::string line   = StringUtils::StripTerminalControl(aPending.substr(0, length));

        aPending.erase(0, std::min(aPending.size(), length + (length == newline ? 1 : 0)));
        if (!line.empty())
        {
            vibeLogInfo("[%s] %s", StringUtils::ShortId(aSessionId).c_str(), line.c_str());
        }
    }
}

void ChildProcessSupervisor::CloseChildFds(Child &aChild)
{
    for (int *fd : {&aChild.mStdin, &aChild.mStdout, &aChild.mStderr})
    {
        if (*fd != -1)
        {
            close(*fd);
            *fd = -1;
        }
    }
}

} // namespace vibe
