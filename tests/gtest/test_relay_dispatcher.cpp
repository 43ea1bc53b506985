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

#include <signal.h>
#include <stdlib.h>
#include <string.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "agent/agent_config.hpp"
#include "agent/bridge_connection.hpp"
#include "agent/local_listener.hpp"
#include "agent/process_supervisor.hpp"
#include "agent/relay_dispatcher.hpp"
#include "agent/session_history.hpp"
#include "agent/session_registry.hpp"
#include "fake_transport.hpp"
#include "utils/file_utils.hpp"

using namespace vibe;
using vibe::Test::FakeTokenProvider;
using vibe::Test::FakeWebSocketClient;
using vibe::Test::FakeWebSocketServer;
using vibe::Test::FilterByType;
using ::testing::_;
using ::testing::DoAll;
using ::testing::InvokeWithoutArgs;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::SetArgReferee;

namespace {

const pid_t    kPid       = 4242;
const uint16_t kLocalPort = 4567;

class MockProcessSupervisor : public ProcessSupervisor
{
public:
    MOCK_METHOD6(Spawn,
                 vibeError(const std::string &,
                           const std::string &,
                           const std::vector<std::string> &,
                           const std::string &,
                           pid_t &,
                           std::string &));
    MOCK_METHOD2(Signal, vibeError(pid_t, bool));
};

std::string MakeTempDirectory(void)
{
    char pattern[] = "/tmp/vibe-relay-XXXXXX";

    return mkdtemp(pattern);
}

class RelayDispatcherTest : public ::testing::Test
{
protected:
    explicit RelayDispatcherTest(const std::string &aCliExecutable = "/bin/sh", bool aE2e = false)
        : mDirectory(MakeTempDirectory())
        , mConfig(Utils::JoinPath(mDirectory, ".vibe-agent"))
        , mHistory(Utils::JoinPath(mDirectory, "session-history.json"))
        , mRegistry()
        , mBridge(mClient, mTokens, mRegistry, BridgeConnection::Settings())
        , mListener(mServer, mRegistry, mBridge, MakeListenerSettings(mDirectory))
        , mDispatcher(mRegistry,
                      mHistory,
                      mSupervisor,
                      mBridge,
                      mListener,
                      mConfig,
                      MakeDispatcherSettings(aCliExecutable, aE2e, mDirectory))
    {
        mRegistry.SetDependencies(mDispatcher);
        mBridge.SetDelegate(mDispatcher);
        mListener.SetDelegate(mDispatcher);
        mSupervisor.SetDelegate(mDispatcher);

        ON_CALL(mSupervisor, Spawn(_, _, _, _, _, _))
            .WillByDefault(DoAll(SetArgReferee<4>(kPid), Return(VIBE_ERROR_NONE)));
    }

    static LocalListener::Settings MakeListenerSettings(const std::string &aHome)
    {
        LocalListener::Settings settings;

        settings.mDefaultPath           = aHome;
        settings.mForwardTerminalOutput = false;

        return settings;
    }

    static RelayDispatcher::Settings MakeDispatcherSettings(const std::string &aCliExecutable,
                                                            bool               aE2e,
                                                            const std::string &aHome)
    {
        RelayDispatcher::Settings settings;

        settings.mCliExecutable = aCliExecutable;
        settings.mLocalPort     = kLocalPort;
        settings.mE2e           = aE2e;
        settings.mHomeDirectory = aHome;

        return settings;
    }

    void SetUp(void) override
    {
        mBridge.Connect();
        mClient.Open();
        mClient.Receive(R"({"type":"authenticated"})");
        mClient.TakeSent();
    }

    Json::Value TakeOne(const std::string &aType)
    {
        std::vector<Json::Value> sent = FilterByType(mClient.TakeSent(), aType);

        EXPECT_EQ(1u, sent.size()) << "expected one " << aType;
        return sent.empty() ? Json::Value() : sent[0];
    }

    void StartSession(const std::string &aSessionId)
    {
        mClient.Receive(R"({"type":"start_session","requestId":"r1","sessionId":")" + aSessionId + R"(","path":")" +
                        mDirectory + R"("})");
    }

    std::string                     mDirectory;
    AgentConfig                     mConfig;
    SessionHistory                  mHistory;
    NiceMock<MockProcessSupervisor> mSupervisor;
    FakeWebSocketServer             mServer;
    FakeWebSocketClient             mClient;
    FakeTokenProvider               mTokens;
    SessionRegistry                 mRegistry;
    BridgeConnection                mBridge;
    LocalListener                   mListener;
    RelayDispatcher                 mDispatcher;
};

class MissingCliRelayDispatcherTest : public RelayDispatcherTest
{
protected:
    MissingCliRelayDispatcherTest(void)
        : RelayDispatcherTest("vibe-cli-that-does-not-exist")
    {
    }
};

class E2eRelayDispatcherTest : public RelayDispatcherTest
{
protected:
    E2eRelayDispatcherTest(void)
        : RelayDispatcherTest("/bin/sh", true)
    {
    }
};

} // namespace

TEST_F(RelayDispatcherTest, TestAgentIdIsPersisted)
{
    EXPECT_FALSE(mBridge.GetAgentId().empty());
    EXPECT_EQ(mBridge.GetAgentId(), mConfig.GetAgentId());
}

TEST_F(RelayDispatcherTest, TestStartSessionSpawnsCli)
{
    std::vector<std::string> args;
    std::vector<std::string> expected = {"--agent", "ws://localhost:4567", "--name", "proj", "fix the build"};
    Json::Value              started;
    const Session           *session;

    EXPECT_CALL(mSupervisor, Spawn("s1", "/bin/sh", _, mDirectory, _, _))
        .WillOnce(DoAll(SaveArg<2>(&args), SetArgReferee<4>(kPid), Return(VIBE_ERROR_NONE)));

    mClient.Receive(R"({"type":"start_session","requestId":"r1","sessionId":"s1","path":")" + mDirectory +
                    R"(","name":"proj","prompt":"fix the build"})");

    EXPECT_EQ(expected, args);

    started = TakeOne("agent_session_started");
    EXPECT_EQ("r1", started["requestId"].asString());
    EXPECT_EQ("s1", started["sessionId"].asString());
    EXPECT_EQ(mDirectory, started["path"].asString());
    EXPECT_EQ("proj", started["name"].asString());

    session = mRegistry.Find("s1");
    ASSERT_TRUE(session != nullptr);
    EXPECT_TRUE(session->GetOwner().IsProcess(kPid));
    EXPECT_EQ("r1", session->GetRequestId());
}

TEST_F(RelayDispatcherTest, TestStartSessionDefaults)
{
    Json::Value started;

    EXPECT_CALL(mSupervisor, Spawn(_, _, _, mDirectory, _, _)).Times(1);

    mClient.Receive(R"({"type":"start_session","requestId":"r1"})");

    started = TakeOne("agent_session_started");
    EXPECT_EQ(36u, started["sessionId"].asString().size());
    EXPECT_EQ(mDirectory, started["path"].asString());
    EXPECT_EQ(Utils::GetBaseName(mDirectory), started["name"].asString());
}

TEST_F(E2eRelayDispatcherTest, TestE2eFlagIsPassed)
{
    std::vector<std::string> args;
    std::vector<std::string> expected = {"--agent", "ws://localhost:4567", "--e2e"};

    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&args), SetArgReferee<4>(kPid), Return(VIBE_ERROR_NONE)));

    StartSession("s1");
    EXPECT_EQ(expected, args);
}

TEST_F(RelayDispatcherTest, TestStartSessionInMissingPath)
{
    Json::Value error;

    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _)).Times(0);

    mClient.Receive(R"({"type":"start_session","requestId":"r1","sessionId":"s1","path":"/nonexistent/vibe"})");

    error = TakeOne("agent_session_error");
    EXPECT_EQ("r1", error["requestId"].asString());
    EXPECT_EQ("s1", error["sessionId"].asString());
    EXPECT_EQ("Path does not exist: /nonexistent/vibe", error["error"].asString());
    EXPECT_EQ(0u, mRegistry.GetSize());
}

TEST_F(MissingCliRelayDispatcherTest, TestStartSessionWithoutCli)
{
    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _)).Times(0);

    StartSession("s1");
    EXPECT_EQ("vibe-cli not found on this host", TakeOne("agent_session_error")["error"].asString());
}

TEST_F(RelayDispatcherTest, TestStartRunningSessionIsRejected)
{
    ASSERT_EQ(VIBE_ERROR_NONE, mRegistry.Add("s1", mDirectory, "s1", SessionOwner::FromProcess(100)));
    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _)).Times(0);

    StartSession("s1");
    EXPECT_EQ("Session is already running", TakeOne("agent_session_error")["error"].asString());
}

TEST_F(RelayDispatcherTest, TestStartStoppingSessionIsRejected)
{
    ConnectionId owner = mServer.Connect();

    mServer.Receive(owner, R"({"type":"register_session","sessionId":"s1"})");
    mClient.Receive(R"({"type":"stop_session","requestId":"r0","sessionId":"s1"})");
    EXPECT_EQ("session_stop", mServer.TakeSent(owner).at(0)["type"].asString());
    mClient.TakeSent();

    StartSession("s1");
    EXPECT_EQ("Session is currently stopping. Please wait a moment and try again.",
              TakeOne("agent_session_error")["error"].asString());
}

TEST_F(RelayDispatcherTest, TestSpawnFailureIsRecorded)
{
    const SessionHistoryEntry *entry;

    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _))
        .WillOnce(DoAll(SetArgReferee<5>(std::string("Failed to start /bin/sh: Permission denied")),
                        Return(VIBE_ERROR_ERRNO)));

    StartSession("s1");

    EXPECT_EQ("Failed to start /bin/sh: Permission denied", TakeOne("agent_session_error")["error"].asString());
    EXPECT_EQ(0u, mRegistry.GetSize());

    entry = mHistory.Lookup("s1");
    ASSERT_TRUE(entry != nullptr);
    EXPECT_EQ(mDirectory, entry->mPath);
}

TEST_F(RelayDispatcherTest, TestSessionRegisteredDuringSpawnKillsChild)
{
    EXPECT_CALL(mSupervisor, Spawn("s1", _, _, _, _, _))
        .WillOnce(DoAll(InvokeWithoutArgs([this]() {
                            mRegistry.Add("s1", "/elsewhere", "elsewhere", SessionOwner::FromConnection(77));
                        }),
                        SetArgReferee<4>(kPid), Return(VIBE_ERROR_NONE)));
    EXPECT_CALL(mSupervisor, Signal(kPid, true)).WillOnce(Return(VIBE_ERROR_NONE));

    StartSession("s1");

    EXPECT_TRUE(FilterByType(mClient.TakeSent(), "agent_session_started").empty());
    ASSERT_TRUE(mRegistry.Find("s1") != nullptr);
    EXPECT_TRUE(mRegistry.Find("s1")->GetOwner().IsConnection(77));

    mRegistry.Remove("s1");
}

TEST_F(RelayDispatcherTest, TestResumeUsesHistory)
{
    std::vector<std::string> args;
    std::vector<std::string> expected = {"--agent", "ws://localhost:4567", "--resume", "s1", "--name", "old name"};
    Json::Value              resumed;

    ASSERT_EQ(VIBE_ERROR_NONE, mHistory.Record("s1", mDirectory, "old name"));
    EXPECT_CALL(mSupervisor, Spawn("s1", _, _, mDirectory, _, _))
        .WillOnce(DoAll(SaveArg<2>(&args), SetArgReferee<4>(kPid), Return(VIBE_ERROR_NONE)));

    mClient.Receive(R"({"type":"resume_session","requestId":"r2","sessionId":"s1"})");

    EXPECT_EQ(expected, args);
    resumed = TakeOne("agent_session_resumed");
    EXPECT_EQ("r2", resumed["requestId"].asString());
    EXPECT_EQ("old name", resumed["name"].asString());
}

TEST_F(RelayDispatcherTest, TestResumeErrors)
{
    std::vector<Json::Value> errors;

    EXPECT_CALL(mSupervisor, Spawn(_, _, _, _, _, _)).Times(0);

    mClient.Receive(R"({"type":"resume_session","requestId":"r1"})");
    mClient.Receive(R"({"type":"resume_session","requestId":"r2","sessionId":"unknown"})");

    errors = FilterByType(mClient.TakeSent(), "agent_session_error");
    ASSERT_EQ(2u, errors.size());
    EXPECT_TRUE(errors[0]["sessionId"].isNull());
    EXPECT_EQ("sessionId is required to resume a session", errors[0]["error"].asString());
    EXPECT_EQ("unknown", errors[1]["sessionId"].asString());
    EXPECT_EQ("Cannot resume session: working directory path unknown. Please provide a path.",
              errors[1]["error"].asString());
}

TEST_F(RelayDispatcherTest, TestStopSpawnedSession)
{
    Json::Value          ended;
    Protocol::ExitStatus status = {false, SIGTERM};

    StartSession("s1");
    mClient.TakeSent();

    EXPECT_CALL(mSupervisor, Signal(kPid, false)).WillOnce(Return(VIBE_ERROR_NONE));
    mClient.Receive(R"({"type":"stop_session","requestId":"r9","sessionId":"s1"})");
    EXPECT_EQ("r9", TakeOne("agent_session_stopping")["requestId"].asString());

    mDispatcher.HandleProcessExit("s1", kPid, status);

    ended = TakeOne("agent_session_ended");
    EXPECT_EQ("s1", ended["sessionId"].asString());
    EXPECT_EQ("stopped_by_user", ended["reason"].asString());
    EXPECT_TRUE(ended["exitCode"].isNull());
    EXPECT_EQ(strsignal(SIGTERM), ended["signal"].asString());
    EXPECT_EQ(0u, mRegistry.GetSize());
    EXPECT_TRUE(mHistory.Lookup("s1") != nullptr);
}

TEST_F(RelayDispatcherTest, TestStopUnknownSession)
{
    Json::Value error;

    mClient.Receive(R"({"type":"stop_session","requestId":"r9","sessionId":"nope"})");

    error = TakeOne("agent_session_error");
    EXPECT_EQ("Session not found", error["error"].asString());
    EXPECT_EQ("nope", error["sessionId"].asString());
}

TEST_F(RelayDispatcherTest, TestProcessExitReportsCode)
{
    Json::Value          ended;
    ConnectionId         viewer;
    Protocol::ExitStatus status = {true, 3};

    StartSession("s1");
    viewer = mServer.Connect();
    mServer.Receive(viewer, R"({"type":"attach_session","sessionId":"s1"})");
    mServer.TakeSent(viewer);
    mClient.TakeSent();

    mDispatcher.HandleProcessExit("s1", kPid, status);

    ended = TakeOne("agent_session_ended");
    EXPECT_EQ(3, ended["exitCode"].asInt());
    EXPECT_EQ("exited", ended["reason"].asString());
    EXPECT_EQ("session_ended", mServer.TakeSent(viewer).at(0)["type"].asString());
}

TEST_F(RelayDispatcherTest, TestExitAfterHandoverIsIgnored)
{
    ConnectionId         owner;
    Protocol::ExitStatus status = {true, 0};

    StartSession("s1");
    owner = mServer.Connect();
    mServer.Receive(owner, R"({"type":"register_session","sessionId":"s1"})");
    ASSERT_TRUE(mRegistry.Find("s1")->GetOwner().IsConnection(owner));
    mClient.TakeSent();

    mDispatcher.HandleProcessExit("s1", kPid, status);

    EXPECT_TRUE(mRegistry.Find("s1") != nullptr);
    EXPECT_TRUE(FilterByType(mClient.TakeSent(), "agent_session_ended").empty());
}

TEST_F(RelayDispatcherTest, TestOwnerDisconnectEndsSession)
{
    ConnectionId owner = mServer.Connect();
    Json::Value  ended;

    mServer.Receive(owner, R"({"type":"register_session","sessionId":"s1","path":"/work","name":"work"})");
    mClient.TakeSent();

    mServer.Drop(owner);

    ended = TakeOne("agent_session_ended");
    EXPECT_EQ("disconnected", ended["reason"].asString());
    EXPECT_EQ(0, ended["exitCode"].asInt());
    EXPECT_EQ(0u, mRegistry.GetSize());
    ASSERT_TRUE(mHistory.Lookup("s1") != nullptr);
    EXPECT_EQ("work", mHistory.Lookup("s1")->mName);
}

TEST_F(RelayDispatcherTest, TestProcessErrorEndsSession)
{
    Json::Value error;

    StartSession("s1");
    mClient.TakeSent();

    mDispatcher.HandleProcessError("s1", kPid, "Lost track of pid 4242");

    error = TakeOne("agent_session_error");
    EXPECT_EQ("r1", error["requestId"].asString());
    EXPECT_EQ("Lost track of pid 4242", error["error"].asString());
    EXPECT_EQ(0u, mRegistry.GetSize());
    EXPECT_TRUE(mHistory.Lookup("s1") != nullptr);
}

TEST_F(RelayDispatcherTest, TestListAgentSessions)
{
    Json::Value reply;

    StartSession("s1");
    mClient.TakeSent();

    mClient.Receive(R"({"type":"list_agent_sessions","requestId":"r5"})");

    reply = TakeOne("agent_sessions");
    EXPECT_EQ("r5", reply["requestId"].asString());
    ASSERT_EQ(1u, reply["sessions"].size());
    EXPECT_EQ("s1", reply["sessions"][0]["sessionId"].asString());
    EXPECT_EQ("ios", reply["sessions"][0]["source"].asString());
}

TEST_F(RelayDispatcherTest, TestRelayToOwner)
{
    ConnectionId             owner = mServer.Connect();
    std::vector<Json::Value> received;

    mServer.Receive(owner, R"({"type":"register_session","sessionId":"s1"})");
    mServer.TakeSent(owner);

    mClient.Receive(R"({"type":"send_message","sessionId":"s1","content":{"ciphertext":"abc"}})");
    mClient.Receive(R"({"type":"error","sessionId":"s1","message":"Session is busy"})");
    mClient.Receive(R"({"type":"claude_message","sessionId":"other"})");

    received = mServer.TakeSent(owner);
    ASSERT_EQ(2u, received.size());
    EXPECT_EQ("send_message", received[0]["type"].asString());
    EXPECT_EQ("abc", received[0]["content"]["ciphertext"].asString());
    EXPECT_EQ("error", received[1]["type"].asString());
}

TEST_F(RelayDispatcherTest, TestBridgeStateIsBroadcast)
{
    ConnectionId client = mServer.Connect();

    mClient.Drop();
    EXPECT_EQ("bridge_disconnected", mServer.TakeSent(client).at(0)["type"].asString());

    mClient.Open();
    mClient.Receive(R"({"type":"authenticated"})");
    EXPECT_EQ("bridge_reconnected", mServer.TakeSent(client).at(0)["type"].asString());
}

TEST_F(RelayDispatcherTest, TestFatalErrorReachesHandler)
{
    std::string reason;

    mDispatcher.SetFatalErrorHandler([&reason](const std::string &aReason) { reason = aReason; });
    mTokens.mRefreshedToken.clear();

    mClient.Receive(R"({"type":"auth_error","message":"expired"})");
    EXPECT_EQ("Token refresh failed (expired), sign in again", reason);
}

TEST_F(RelayDispatcherTest, TestShutdownRecordsSessions)
{
    Protocol::ExitStatus status = {true, 0};

    StartSession("s1");
    mClient.TakeSent();

    mDispatcher.Shutdown();

    EXPECT_EQ(0u, mRegistry.GetSize());
    EXPECT_TRUE(mHistory.Lookup("s1") != nullptr);

    mDispatcher.HandleProcessExit("s1", kPid, status);
    EXPECT_TRUE(mClient.TakeSent().empty());
}
