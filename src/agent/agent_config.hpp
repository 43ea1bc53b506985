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
 *   This file includes definitions for the persisted agent configuration and runtime advertisement files.
 */

#ifndef VIBE_AGENT_AGENT_CONFIG_HPP_
#define VIBE_AGENT_AGENT_CONFIG_HPP_

#include "vibe-agent/config.h"

#include <string>

#include <stdint.h>
#include <sys/types.h>

#include <json/json.h>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/types.hpp"

namespace vibe {

/**
 * This structure represents the contents of the `port`, `pid` and `start_time` files of a running agent.
 *
 */
struct AgentRuntimeInfo
{
    uint16_t mPort;
    pid_t    mPid;
    WallTime mStartTime;
};

/**
 * This class manages the agent directory (normally `~/.vibe-agent`).
 *
 * `config.json` holds the agent id, bridge URL, host name and E2E flag. Keys this class does not know are kept
 * when the file is saved.
 *
 */
class AgentConfig : private NonCopyable
{
public:
    explicit AgentConfig(const std::string &aDirectory);

    /**
     * This method loads `config.json`.
     *
     * @retval VIBE_ERROR_NONE   Loaded the file, or the file does not exist yet.
     * @retval VIBE_ERROR_PARSE  The file is malformed; defaults are in effect.
     *
     */
    vibeError Load(void);

    /**
     * This method writes `config.json` with mode 0600, creating the directory with mode 0700.
     *
     */
    vibeError Save(void);

    const std::string &GetDirectory(void) const { return mDirectory; }
    std::string        GetHistoryFilePath(void) const;

    const std::string &GetAgentId(void) const { return mAgentId; }
    void               SetAgentId(const std::string &aAgentId) { mAgentId = aAgentId; }

    /**
     * This method returns the configured bridge URL, or the default one.
     *
     */
    std::string GetBridgeUrl(void) const;
    void        SetBridgeUrl(const std::string &aBridgeUrl) { mBridgeUrl = aBridgeUrl; }

    /**
     * This method returns the configured host name, or the system host name.
     *
     */
    std::string GetHostName(void) const;
    void        SetHostName(const std::string &aHostName) { mHostName = aHostName; }

    bool IsE2eEnabled(void) const { return mE2e; }
    void SetE2eEnabled(bool aEnabled) { mE2e = aEnabled; }

    /**
     * This method writes the `port`, `pid` and `start_time` files.
     *
     */
    vibeError WriteRuntimeFiles(const AgentRuntimeInfo &aInfo) const;

    /**
     * This method removes the `port`, `pid` and `start_time` files.
     *
     */
    void RemoveRuntimeFiles(void) const;

    /**
     * This method reads the runtime files of a (possibly) running agent.
     *
     * @retval VIBE_ERROR_NONE       @p aInfo holds the pid and port; the start time is the epoch if unknown.
     * @retval VIBE_ERROR_NOT_FOUND  No agent advertised itself.
     * @retval VIBE_ERROR_PARSE      A runtime file is malformed.
     *
     */
    vibeError ReadRuntimeInfo(AgentRuntimeInfo &aInfo) const;

private:
    std::string GetFilePath(const char *aName) const;

    std::string mDirectory;
    Json::Value mDocument;
    std::string mAgentId;
    std::string mBridgeUrl;
    std::string mHostName;
    bool        mE2e;
};

} // namespace vibe

#endif // VIBE_AGENT_AGENT_CONFIG_HPP_
