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
 *   The file implements the Vibe Agent.
 */

#define VIBE_LOG_TAG "APP"

#include "agent/application.hpp"

#include <errno.h>
#include <string.h>
#include <sys/select.h>
#include <unistd.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/mainloop_manager.hpp"

namespace vibe {

namespace {
const char     kLocalListenAddress[] = "127.0.0.1";
const uint16_t kGoingAwayCode        = 1001;
} // namespace

std::atomic_bool     Application::sShouldTerminate(false);
const struct timeval Application::kPollTimeout = {VIBE_MAINLOOP_POLL_TIMEOUT_SEC, 0};

Application::Application(AgentConfig &aConfig, TokenProvider &aTokenProvider, const Options &aOptions)
    : mConfig(aConfig)
    , mOptions(aOptions)
    , mClient(mIoThread.GetContext(), mTaskRunner)
    , mServer(mIoThread.GetContext(), mTaskRunner)
    , mHistory(aConfig.GetHistoryFilePath(), VIBE_CONFIG_HISTORY_CAPACITY, VIBE_CONFIG_HISTORY_MAX_AGE_DAYS)
    , mRegistry()
    , mBridge(mClient, aTokenProvider, mRegistry, MakeBridgeSettings(aConfig, aOptions))
    , mListener(mServer, mRegistry, mBridge, MakeListenerSettings(aOptions))
    , mDispatcher(mRegistry, mHistory, mSupervisor, mBridge, mListener, aConfig, MakeDispatcherSettings(aOptions))
    , mInitialized(false)
{
}

BridgeConnection::Settings Application::MakeBridgeSettings(const AgentConfig &aConfig, const Options &aOptions)
{
    BridgeConnection::Settings settings;

    settings.mUrl      = aOptions.mBridgeUrl;
    settings.mHostName = aOptions.mHostName;
    settings.mAgentId  = aConfig.GetAgentId();

    return settings;
}

LocalListener::Settings Application::MakeListenerSettings(const Options &aOptions)
{
    LocalListener::Settings settings;

    settings.mDefaultPath           = aOptions.mHomeDirectory;
    settings.mForwardTerminalOutput = aOptions.mForwardTerminalOutput;

    return settings;
}

RelayDispatcher::Settings Application::MakeDispatcherSettings(const Options &aOptions)
{
    RelayDispatcher::Settings settings;

    settings.mCliExecutable = aOptions.mCliExecutable;
    settings.mLocalPort     = aOptions.mLocalPort;
    settings.mE2e           = aOptions.mE2e;
    settings.mHomeDirectory = aOptions.mHomeDirectory;

    return settings;
}

vibeError Application::Init(void)
{
    vibeError        error = VIBE_ERROR_NONE;
    AgentRuntimeInfo info;

    MainloopManager::GetInstance().AddMainloopProcessor(&mTaskRunner);
    MainloopManager::GetInstance().AddMainloopProcessor(&mSupervisor);
    mInitialized = true;

    mRegistry.SetDependencies(mDispatcher);
    mBridge.SetDelegate(mDispatcher);
    mListener.SetDelegate(mDispatcher);
    mSupervisor.SetDelegate(mDispatcher);
    mDispatcher.SetFatalErrorHandler([this](const std::string &aReason) { HandleFatalError(aReason); });

    mHistory.Load();

    SuccessOrExit(error = mServer.Start(kLocalListenAddress, mOptions.mLocalPort),
                  vibeLogCrit("Failed to listen on %s:%u: %s", kLocalListenAddress, mOptions.mLocalPort,
                              vibeErrorString(error)));
    vibeLogNote("Local listener on ws://%s:%u", kLocalListenAddress, mServer.GetPort());

    info.mPort      = mServer.GetPort();
    info.mPid       = getpid();
    info.mStartTime = WallClock::now();
    SuccessOrExit(error = mConfig.WriteRuntimeFiles(info),
                  vibeLogCrit("Failed to write runtime files: %s", vibeErrorString(error)));

    mIoThread.Start();

    vibeLogNote("Connecting to %s as %s", mOptions.mBridgeUrl.c_str(), mOptions.mHostName.c_str());
    mBridge.Connect();

exit:
    return error;
}

void Application::Deinit(void)
{
    VerifyOrExit(mInitialized);
    mInitialized = false;

    vibeLogNote("Shutting down");

    mDispatcher.Shutdown();
    mSupervisor.TerminateAll();
    mListener.CloseAll(kGoingAwayCode, "Agent shutting down");
    mServer.Stop();
    mBridge.Shutdown();
    mConfig.RemoveRuntimeFiles();
    mIoThread.Stop();

    MainloopManager::GetInstance().RemoveMainloopProcessor(&mSupervisor);
    MainloopManager::GetInstance().RemoveMainloopProcessor(&mTaskRunner);

exit:
    return;
}

vibeError Application::Run(void)
{
    vibeError error = VIBE_ERROR_NONE;

    // allow quitting elegantly
    signal(SIGTERM, HandleSignal);
    signal(SIGINT, HandleSignal);
    // Peers going away are reported by the socket calls instead.
    signal(SIGPIPE, SIG_IGN);

    while (!sShouldTerminate)
    {
        MainloopContext mainloop;
        int             rval;

        MainloopManager::InitContext(mainloop, GetMicroSeconds(kPollTimeout));
        MainloopManager::GetInstance().Update(mainloop);

        rval = select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
                      &mainloop.mTimeout);

        if (rval >= 0)
        {
            MainloopManager::GetInstance().Process(mainloop);

            if (!mFatalError.empty())
            {
                vibeLogCrit("%s", mFatalError.c_str());
                error = VIBE_ERROR_AUTH;
                break;
            }
        }
        else if (errno != EINTR)
        {
            error = VIBE_ERROR_ERRNO;
            vibeLogCrit("select() failed: %s", strerror(errno));
            break;
        }
    }

    return error;
}

void Application::HandleSignal(int aSignal)
{
    sShouldTerminate = true;
    signal(aSignal, SIG_DFL);
}

void Application::HandleFatalError(const std::string &aReason)
{
    mFatalError = aReason.empty() ? "Bridge connection failed" : aReason;
}

} // namespace vibe
