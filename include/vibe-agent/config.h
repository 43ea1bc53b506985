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
 *   This file includes the compile-time configuration of the vibe agent.
 */

#ifndef VIBE_AGENT_CONFIG_H_
#define VIBE_AGENT_CONFIG_H_

#ifdef VIBE_CONFIG_FILE
#include VIBE_CONFIG_FILE
#endif

#ifndef VIBE_PACKAGE_NAME
#define VIBE_PACKAGE_NAME "vibe-agent"
#endif

#ifndef VIBE_PACKAGE_VERSION
#define VIBE_PACKAGE_VERSION "0.0.0"
#endif

/**
 * The TCP port the local listener binds on the loopback interface.
 */
#ifndef VIBE_CONFIG_LOCAL_PORT
#define VIBE_CONFIG_LOCAL_PORT 9999
#endif

/**
 * The bridge endpoint used when neither the command line nor the config file name one.
 */
#ifndef VIBE_CONFIG_DEFAULT_BRIDGE_URL
#define VIBE_CONFIG_DEFAULT_BRIDGE_URL "wss://ws.minivibeapp.com"
#endif

/**
 * The name of the CLI executable spawned for bridge-initiated sessions.
 */
#ifndef VIBE_CONFIG_CLI_EXECUTABLE
#define VIBE_CONFIG_CLI_EXECUTABLE "vibe"
#endif

#ifndef VIBE_CONFIG_HISTORY_CAPACITY
#define VIBE_CONFIG_HISTORY_CAPACITY 100
#endif

#ifndef VIBE_CONFIG_HISTORY_MAX_AGE_DAYS
#define VIBE_CONFIG_HISTORY_MAX_AGE_DAYS 30
#endif

#ifndef VIBE_CONFIG_HEARTBEAT_INTERVAL_MS
#define VIBE_CONFIG_HEARTBEAT_INTERVAL_MS 30000
#endif

#ifndef VIBE_CONFIG_RECONNECT_BASE_DELAY_MS
#define VIBE_CONFIG_RECONNECT_BASE_DELAY_MS 2000
#endif

#ifndef VIBE_CONFIG_RECONNECT_MAX_DELAY_MS
#define VIBE_CONFIG_RECONNECT_MAX_DELAY_MS 30000
#endif

#ifndef VIBE_CONFIG_FORCE_KILL_TIMEOUT_MS
#define VIBE_CONFIG_FORCE_KILL_TIMEOUT_MS 5000
#endif

#ifndef VIBE_CONFIG_STOP_GRACE_PERIOD_MS
#define VIBE_CONFIG_STOP_GRACE_PERIOD_MS 100
#endif

#ifndef VIBE_CONFIG_STOP_SAFETY_TIMEOUT_MS
#define VIBE_CONFIG_STOP_SAFETY_TIMEOUT_MS 5000
#endif

#ifndef VIBE_MAINLOOP_POLL_TIMEOUT_SEC
#define VIBE_MAINLOOP_POLL_TIMEOUT_SEC 10
#endif

#endif // VIBE_AGENT_CONFIG_H_
