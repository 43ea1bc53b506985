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
 *   This file includes definition for the Vibe Agent application.
 */

#ifndef VIBE_AGENT_APPLICATION_HPP_
#define VIBE_AGENT_APPLICATION_HPP_

#include "vibe-agent/config.h"

#include <atomic>
#include <signal.h>
#include <stdint.h>
#include <string>

#include "agent/agent_config.hpp"
#include "agent/bridge_connection.hpp"
#include "agent/local_listener.hpp"
#include "agent/process_supervisor.hpp"
#include "agent/relay_dispatcher.hpp"
#include "agent/session_history.hpp"
#include "agent/session_registry.hpp"
#include "agent/token_provider.hpp"
#include "common/code_utils.hpp"
#include "common/task_runner.hpp"
#include "transport/beast_websocket_client.hpp"
#include "transport/beast_websocket_server.hpp"
#include "transport/io_thread.hpp"

namespace vibe {

/**
 * @addtogroup vibe-agent
 *
 * @brief
 *   This module includes definition for the Vibe Agent application.
 *
 * @{
 */

/**
 * This class implements the agent daemon: the bridge link, the local listener and the sessions between them.
 */
class Application : private NonCopyable
{
public:
    /**
     * This structure holds the effective settings after the command line has been merged over `config.json`.
     */
    struct Options
    {
        std::string mBridgeUrl;
        std::string mHostName;
        std::string mCliExecutable;
        std::string mHomeDirectory;
        uint16_t    mLocalPort;
        bool        mE2e;
        bool        mForwardTerminalOutput;
    };

    /**
     * This constructor initializes the Application instance.
     *
     * @param[in] aConfig         The loaded agent configuration. The agent id is written back to it.
     * @param[in] aTokenProvider  The source of bridge credentials.
     * @param[in] aOptions        The effective settings.
     */
    Application(AgentConfig &aConfig, TokenProvider &aTokenProvider, const Options &aOptions);

    /**
     * This method initializes the Application instance.
     *
     * @retval VIBE_ERROR_NONE  The local listener is up and the bridge connection has been started.
     * @retval ...              The local listener or the runtime files could not be set up.
     */
    vibeError Init(void);

    /**
     * This method performs the shutdown sequence.
     */
    void Deinit(void);

    /**
     * This method runs the application until exit.
     *
     * @retval VIBE_ERROR_NONE   The application was asked to terminate.
     * @retval VIBE_ERROR_AUTH   The bridge rejected the credentials.
     * @retval VIBE_ERROR_ERRNO  The application exited with some system error.
     */
    vibeError Run(void);

private:
    static void HandleSignal(int aSignal);

    void HandleFatalError(const std::string &aReason);

    static BridgeConnection::Settings MakeBridgeSettings(const AgentConfig &aConfig, const Options &aOptions);
    static LocalListener::Settings    MakeListenerSettings(const Options &aOptions);
    static RelayDispatcher::Settings  MakeDispatcherSettings(const Options &aOptions);

    static const struct timeval kPollTimeout;
    static std::atomic_bool     sShouldTerminate;

    AgentConfig           &mConfig;
    Options                mOptions;
    TaskRunner             mTaskRunner;
    IoThread               mIoThread;
    BeastWebSocketClient   mClient;
    BeastWebSocketServer   mServer;
    SessionHistory         mHistory;
    ChildProcessSupervisor mSupervisor;
    SessionRegistry        mRegistry;
    BridgeConnection       mBridge;
    LocalListener          mListener;
    RelayDispatcher        mDispatcher;
    bool                   mInitialized;
    std::string            mFatalError;
};

/**
 * @}
 */

} // namespace vibe

#endif // VIBE_AGENT_APPLICATION_HPP_
