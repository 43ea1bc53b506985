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

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "agent/agent_config.hpp"
#include "agent/token_provider.hpp"
#include "utils/file_utils.hpp"
#include "utils/json_utils.hpp"

using namespace vibe;

namespace {

std::string MakeTempDirectory(void)
{
    char pattern[] = "/tmp/vibe-config-XXXXXX";

    return Utils::JoinPath(mkdtemp(pattern), "state");
}

mode_t GetMode(const std::string &aPath)
{
    struct stat info;

    return stat(aPath.c_str(), &info) == 0 ? (info.st_mode & 0777) : 0;
}

} // namespace

TEST(AgentConfig, TestMissingFileGivesDefaults)
{
    AgentConfig config(MakeTempDirectory());

    EXPECT_EQ(VIBE_ERROR_NONE, config.Load());
    EXPECT_TRUE(config.GetAgentId().empty());
    EXPECT_EQ(VIBE_CONFIG_DEFAULT_BRIDGE_URL, config.GetBridgeUrl());
    EXPECT_FALSE(config.GetHostName().empty());
    EXPECT_FALSE(config.IsE2eEnabled());
}

TEST(AgentConfig, TestSaveAndLoad)
{
    std::string directory = MakeTempDirectory();
    AgentConfig config(directory);
    AgentConfig reloaded(directory);

    config.SetAgentId("agent-1");
    config.SetBridgeUrl("wss://bridge.example.com");
    config.SetHostName("laptop");
    config.SetE2eEnabled(true);
    ASSERT_EQ(VIBE_ERROR_NONE, config.Save());

    EXPECT_EQ(0700u, GetMode(directory));
    EXPECT_EQ(0600u, GetMode(Utils::JoinPath(directory, "config.json")));

    ASSERT_EQ(VIBE_ERROR_NONE, reloaded.Load());
    EXPECT_EQ("agent-1", reloaded.GetAgentId());
    EXPECT_EQ("wss://bridge.example.com", reloaded.GetBridgeUrl());
    EXPECT_EQ("laptop", reloaded.GetHostName());
    EXPECT_TRUE(reloaded.IsE2eEnabled());
}

TEST(AgentConfig, TestSaveKeepsUnknownKeys)
{
    std::string directory = MakeTempDirectory();
    AgentConfig config(directory);
    Json::Value document;

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::EnsureDirectory(directory, 0700));
    ASSERT_EQ(VIBE_ERROR_NONE,
              Utils::WriteFile(Utils::JoinPath(directory, "config.json"), R"({"agentId":"a","theme":"dark"})", 0600));

    ASSERT_EQ(VIBE_ERROR_NONE, config.Load());
    config.SetHostName("laptop");
    ASSERT_EQ(VIBE_ERROR_NONE, config.Save());

    ASSERT_EQ(VIBE_ERROR_NONE, JsonUtils::ReadFile(Utils::JoinPath(directory, "config.json"), document));
    EXPECT_EQ("dark", document["theme"].asString());
    EXPECT_EQ("a", document["agentId"].asString());
    EXPECT_EQ("laptop", document["hostName"].asString());
}

TEST(AgentConfig, TestMalformedFile)
{
    std::string directory = MakeTempDirectory();
    AgentConfig config(directory);

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::EnsureDirectory(directory, 0700));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(directory, "config.json"), "{oops", 0600));

    EXPECT_EQ(VIBE_ERROR_PARSE, config.Load());
    EXPECT_TRUE(config.GetAgentId().empty());
}

TEST(AgentConfig, TestRuntimeFiles)
{
    AgentConfig      config(MakeTempDirectory());
    AgentRuntimeInfo info;
    AgentRuntimeInfo read;
    std::string      port;

    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, config.ReadRuntimeInfo(read));

    info.mPort      = 9800;
    info.mPid       = getpid();
    info.mStartTime = WallClock::from_time_t(1700000000);
    ASSERT_EQ(VIBE_ERROR_NONE, config.WriteRuntimeFiles(info));

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::ReadFile(Utils::JoinPath(config.GetDirectory(), "port"), port));
    EXPECT_EQ("9800", port);

    ASSERT_EQ(VIBE_ERROR_NONE, config.ReadRuntimeInfo(read));
    EXPECT_EQ(9800, read.mPort);
    EXPECT_EQ(getpid(), read.mPid);
    EXPECT_TRUE(read.mStartTime == info.mStartTime);

    config.RemoveRuntimeFiles();
    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, config.ReadRuntimeInfo(read));
}

TEST(AgentConfig, TestMalformedRuntimeFiles)
{
    AgentConfig      config(MakeTempDirectory());
    AgentRuntimeInfo info;

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::EnsureDirectory(config.GetDirectory(), 0700));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(config.GetDirectory(), "pid"), "12x", 0644));
    EXPECT_EQ(VIBE_ERROR_PARSE, config.ReadRuntimeInfo(info));

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(config.GetDirectory(), "pid"), "123\n", 0644));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(config.GetDirectory(), "port"), "70000", 0644));
    EXPECT_EQ(VIBE_ERROR_PARSE, config.ReadRuntimeInfo(info));

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(config.GetDirectory(), "port"), "9800", 0644));
    ASSERT_EQ(VIBE_ERROR_NONE, config.ReadRuntimeInfo(info));
    EXPECT_EQ(123, info.mPid);
    EXPECT_TRUE(info.mStartTime == WallTime());
}

TEST(StoredTokenProvider, TestNoCredentials)
{
    StoredTokenProvider tokens(MakeTempDirectory());
    std::string         token;

    EXPECT_FALSE(tokens.HasCredentials());
    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, tokens.EnsureValidToken(token));
    EXPECT_EQ(VIBE_ERROR_AUTH, tokens.RefreshIdToken(token));
}

TEST(StoredTokenProvider, TestStoreToken)
{
    std::string         directory = MakeTempDirectory();
    StoredTokenProvider tokens(directory);
    std::string         token;
    Json::Value         auth;

    ASSERT_EQ(VIBE_ERROR_NONE, tokens.StoreToken("abc"));
    EXPECT_TRUE(tokens.HasCredentials());
    EXPECT_EQ(0600u, GetMode(Utils::JoinPath(directory, "auth.json")));

    ASSERT_EQ(VIBE_ERROR_NONE, tokens.EnsureValidToken(token));
    EXPECT_EQ("abc", token);

    ASSERT_EQ(VIBE_ERROR_NONE, JsonUtils::ReadFile(Utils::JoinPath(directory, "auth.json"), auth));
    EXPECT_EQ("abc", auth["idToken"].asString());
}

TEST(StoredTokenProvider, TestLegacyTokenFile)
{
    std::string         directory = MakeTempDirectory();
    StoredTokenProvider tokens(directory);
    std::string         token;

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::EnsureDirectory(directory, 0700));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(Utils::JoinPath(directory, "token"), "  legacy\n", 0600));

    ASSERT_EQ(VIBE_ERROR_NONE, tokens.EnsureValidToken(token));
    EXPECT_EQ("legacy", token);
}

TEST(StoredTokenProvider, TestRefreshNeedsNewToken)
{
    std::string         directory = MakeTempDirectory();
    StoredTokenProvider tokens(directory);
    std::string         token;

    ASSERT_EQ(VIBE_ERROR_NONE, tokens.StoreToken("first"));
    ASSERT_EQ(VIBE_ERROR_NONE, tokens.EnsureValidToken(token));

    EXPECT_EQ(VIBE_ERROR_AUTH, tokens.RefreshIdToken(token));

    ASSERT_EQ(VIBE_ERROR_NONE, tokens.StoreToken("second"));
    ASSERT_EQ(VIBE_ERROR_NONE, tokens.RefreshIdToken(token));
    EXPECT_EQ("second", token);
    EXPECT_EQ(VIBE_ERROR_AUTH, tokens.RefreshIdToken(token));
}
