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

#define VIBE_LOG_TAG "AGENT"

#include <vibe-agent/config.h>

#include <errno.h>
#include <getopt.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <new>
#include <string>

#include "agent/agent_config.hpp"
#include "agent/application.hpp"
#include "agent/token_provider.hpp"
#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/time.hpp"
#include "utils/file_utils.hpp"

static const char kAgentDirectoryName[]       = ".vibe-agent";
static const char kCredentialsDirectoryName[] = ".vibe";
static const char kStatusCommand[]            = "status";

enum
{
    VIBE_OPT_DEBUG_LEVEL    = 'd',
    VIBE_OPT_HELP           = 'h',
    VIBE_OPT_VERBOSE        = 'v',
    VIBE_OPT_SYSLOG_DISABLE = 's',
    VIBE_OPT_VERSION        = 'V',
    VIBE_OPT_SHORTMAX       = 128,
    VIBE_OPT_BRIDGE,
    VIBE_OPT_TOKEN,
    VIBE_OPT_NAME,
    VIBE_OPT_E2E,
    VIBE_OPT_PORT,
    VIBE_OPT_CLI,
    VIBE_OPT_FORWARD_TERMINAL_OUTPUT,
};

static const struct option kOptions[] = {{"debug-level", required_argument, nullptr, VIBE_OPT_DEBUG_LEVEL},
                                         {"help", no_argument, nullptr, VIBE_OPT_HELP},
                                         {"verbose", no_argument, nullptr, VIBE_OPT_VERBOSE},
                                         {"syslog-disable", no_argument, nullptr, VIBE_OPT_SYSLOG_DISABLE},
                                         {"version", no_argument, nullptr, VIBE_OPT_VERSION},
                                         {"bridge", required_argument, nullptr, VIBE_OPT_BRIDGE},
                                         {"token", required_argument, nullptr, VIBE_OPT_TOKEN},
                                         {"name", required_argument, nullptr, VIBE_OPT_NAME},
                                         {"e2e", no_argument, nullptr, VIBE_OPT_E2E},
                                         {"port", required_argument, nullptr, VIBE_OPT_PORT},
                                         {"cli", required_argument, nullptr, VIBE_OPT_CLI},
                                         {"forward-terminal-output", no_argument, nullptr,
                                          VIBE_OPT_FORWARD_TERMINAL_OUTPUT},
                                         {0, 0, 0, 0}};

static bool ParseInteger(const char *aStr, long &aOutResult)
{
    bool  successful = true;
    char *strEnd;
    long  result;

    VerifyOrExit(aStr != nullptr, successful = false);
    errno  = 0;
    result = strtol(aStr, &strEnd, 0);
    VerifyOrExit(errno != ERANGE, successful = false);
    VerifyOrExit(aStr != strEnd && *strEnd == '\0', successful = false);

    aOutResult = result;

exit:
    return successful;
}

static void PrintHelp(const char *aProgramName)
{
    fprintf(stderr,
            "Usage: %s [--bridge URL] [--token TOKEN] [--name NAME] [--e2e] [--port PORT] [--cli PATH] "
            "[--forward-terminal-output] [-d DEBUG_LEVEL] [-v] [-s] [status]\n"
            "     --bridge                   Bridge server URL (default: " VIBE_CONFIG_DEFAULT_BRIDGE_URL ").\n"
            "     --token                    Store an auth token before connecting.\n"
            "     --name                     Host name shown on the phone (default: the system host name).\n"
            "     --e2e                      Start sessions with end-to-end encryption.\n"
            "     --port                     Local listener port (default: %d).\n"
            "     --cli                      Session CLI executable (default: " VIBE_CONFIG_CLI_EXECUTABLE ").\n"
            "     --forward-terminal-output  Also forward terminal output of sessions to the bridge.\n"
            "     -d, --debug-level          The log level (CRIT=0, WARN=1, NOTE=2, INFO=3, DEBG=4).\n"
            "     -v, --verbose              Enable verbose logging.\n"
            "     -s, --syslog-disable       Disable syslog and print to standard out.\n"
            "     -h, --help                 Show this help text.\n"
            "     -V, --version              Print the application's version and exit.\n"
            "     status                     Print whether an agent is running on this host and exit.\n"
            "\n",
            aProgramName, VIBE_CONFIG_LOCAL_PORT);
}

static void PrintVersion(void)
{
    printf("%s\n", VIBE_PACKAGE_VERSION);
}

static void OnAllocateFailed(void)
{
    vibeLogCrit("Allocate failure, exiting...");
    exit(1);
}

static std::string FormatUptime(std::chrono::seconds aUptime)
{
    long long total   = aUptime.count() < 0 ? 0 : static_cast<long long>(aUptime.count());
    long long hours   = total / 3600;
    long long minutes = (total % 3600) / 60;
    char      buffer[64];

    if (hours > 0)
    {
        snprintf(buffer, sizeof(buffer), "%lldh %lldm", hours, minutes);
    }
    else
    {
        snprintf(buffer, sizeof(buffer), "%lldm %llds", minutes, total % 60);
    }

    return buffer;
}

static int PrintStatus(const vibe::AgentConfig &aConfig, const vibe::StoredTokenProvider &aTokenProvider)
{
    vibe::AgentRuntimeInfo info;
    bool                   running = false;

    if (aConfig.ReadRuntimeInfo(info) == VIBE_ERROR_NONE)
    {
        running = kill(info.mPid, 0) == 0 || errno == EPERM;
    }

    if (running)
    {
        printf("Agent:       running (pid %d)\n", static_cast<int>(info.mPid));
        if (info.mStartTime != vibe::WallTime())
        {
            printf("Uptime:      %s\n",
                   FormatUptime(std::chrono::duration_cast<std::chrono::seconds>(vibe::WallClock::now() -
                                                                                  info.mStartTime))
                       .c_str());
        }
        printf("Port:        %u\n", info.mPort);
    }
    else
    {
        printf("Agent:       not running\n");
    }

    printf("Bridge:      %s\n", aConfig.GetBridgeUrl().c_str());
    printf("Host name:   %s\n", aConfig.GetHostName().c_str());
    printf("Agent ID:    %s\n", aConfig.GetAgentId().empty() ? "(not registered)" : aConfig.GetAgentId().c_str());
    printf("Credentials: %s\n", aTokenProvider.HasCredentials() ? "present" : "missing");

    return running ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int realmain(int argc, char *argv[])
{
    vibeLogLevel               logLevel              = VIBE_LOG_LEVEL_INFO;
    int                        opt;
    int                        ret                   = EXIT_SUCCESS;
    bool                       verbose               = false;
    bool                       syslogDisable         = false;
    bool                       e2e                   = false;
    bool                       forwardTerminalOutput = false;
    bool                       saveConfig            = false;
    const char                *bridgeUrl             = nullptr;
    const char                *token                 = nullptr;
    const char                *hostName              = nullptr;
    const char                *cliExecutable         = VIBE_CONFIG_CLI_EXECUTABLE;
    long                       localPort             = VIBE_CONFIG_LOCAL_PORT;
    long                       parseResult;
    std::string                homeDirectory         = vibe::Utils::GetHomeDirectory();
    vibe::AgentConfig          config(vibe::Utils::JoinPath(homeDirectory, kAgentDirectoryName));
    vibe::StoredTokenProvider  tokenProvider(vibe::Utils::JoinPath(homeDirectory, kCredentialsDirectoryName));
    vibe::Application::Options options;
    vibeError                  error;

    std::set_new_handler(OnAllocateFailed);

    while ((opt = getopt_long(argc, argv, "d:hVvs", kOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case VIBE_OPT_DEBUG_LEVEL:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(VIBE_LOG_LEVEL_CRIT <= parseResult && parseResult <= VIBE_LOG_LEVEL_DEBG, ret = EXIT_FAILURE);
            logLevel = static_cast<vibeLogLevel>(parseResult);
            break;

        case VIBE_OPT_VERBOSE:
            verbose = true;
            break;

        case VIBE_OPT_SYSLOG_DISABLE:
            syslogDisable = true;
            break;

        case VIBE_OPT_VERSION:
            PrintVersion();
            ExitNow();
            break;

        case VIBE_OPT_HELP:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_SUCCESS);
            break;

        case VIBE_OPT_BRIDGE:
            bridgeUrl = optarg;
            break;

        case VIBE_OPT_TOKEN:
            token = optarg;
            break;

        case VIBE_OPT_NAME:
            hostName = optarg;
            break;

        case VIBE_OPT_E2E:
            e2e = true;
            break;

        case VIBE_OPT_PORT:
            VerifyOrExit(ParseInteger(optarg, parseResult) && 0 < parseResult && parseResult <= UINT16_MAX,
                         fprintf(stderr, "Invalid port: %s\n", optarg), ret = EXIT_FAILURE);
            localPort = parseResult;
            break;

        case VIBE_OPT_CLI:
            cliExecutable = optarg;
            break;

        case VIBE_OPT_FORWARD_TERMINAL_OUTPUT:
            forwardTerminalOutput = true;
            break;

        default:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_FAILURE);
            break;
        }
    }

    if (config.Load() != VIBE_ERROR_NONE)
    {
        fprintf(stderr, "Ignoring malformed %s/config.json\n", config.GetDirectory().c_str());
    }

    if (optind < argc)
    {
        VerifyOrExit(strcmp(argv[optind], kStatusCommand) == 0 && optind + 1 == argc, PrintHelp(argv[0]),
                     ret = EXIT_FAILURE);
        ExitNow(ret = PrintStatus(config, tokenProvider));
    }

    vibeLogInit(argv[0], logLevel, verbose, syslogDisable);
    vibeLogNote("Running %s", VIBE_PACKAGE_VERSION);

    if (token != nullptr)
    {
        SuccessOrExit(error = tokenProvider.StoreToken(token), vibeLogCrit("Failed to store the auth token: %s",
                                                                           vibeErrorString(error)),
                      ret = EXIT_FAILURE);
        vibeLogNote("Auth token stored");
    }

    if (bridgeUrl != nullptr)
    {
        config.SetBridgeUrl(bridgeUrl);
        saveConfig = true;
    }

    if (hostName != nullptr)
    {
        config.SetHostName(hostName);
        saveConfig = true;
    }

    if (e2e)
    {
        config.SetE2eEnabled(true);
        saveConfig = true;
    }

    if (saveConfig)
    {
        vibeLogResult(config.Save(), "Save %s/config.json", config.GetDirectory().c_str());
    }

    VerifyOrExit(tokenProvider.HasCredentials(), vibeLogCrit("No auth token available, sign in first"),
                 ret = EXIT_FAILURE);

    options.mBridgeUrl             = config.GetBridgeUrl();
    options.mHostName              = config.GetHostName();
    options.mCliExecutable         = cliExecutable;
    options.mHomeDirectory         = homeDirectory;
    options.mLocalPort             = static_cast<uint16_t>(localPort);
    options.mE2e                   = config.IsE2eEnabled();
    options.mForwardTerminalOutput = forwardTerminalOutput;

    vibeLogNote("Bridge: %s", options.mBridgeUrl.c_str());
    vibeLogNote("Host name: %s", options.mHostName.c_str());
    vibeLogNote("E2E: %s", options.mE2e ? "enabled" : "disabled");

    {
        vibe::Application app(config, tokenProvider, options);

        error = app.Init();
        if (error == VIBE_ERROR_NONE)
        {
            error = app.Run();
        }
        app.Deinit();

        ret = error == VIBE_ERROR_NONE ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    vibeLogDeinit();

exit:
    return ret;
}

int main(int argc, char *argv[])
{
    return realmain(argc, argv);
}
