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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "agent/session_registry.hpp"
#include "common/timer_scheduler.hpp"

using namespace vibe;
using ::testing::_;
using ::testing::Return;

namespace {

class MockDependencies : public SessionRegistry::Dependencies
{
public:
    MOCK_METHOD2(SignalProcess, vibeError(pid_t aPid, bool aForce));
    MOCK_METHOD2(SendStopNotice, void(ConnectionId aConnection, const std::string &aSessionId));
    MOCK_METHOD3(CloseConnection, void(ConnectionId aConnection, uint16_t aCode, const std::string &aReason));
};

void AdvanceTime(Milliseconds aDelay)
{
    TimerScheduler::Get().Process(Clock::now() + aDelay);
}

class SessionRegistryTest : public ::testing::Test
{
protected:
    SessionRegistryTest(void)
        : mRegistry(mDeps)
    {
    }

    ::testing::StrictMock<MockDependencies> mDeps;
    SessionRegistry                         mRegistry;
};

} // namespace

TEST_F(SessionRegistryTest, TestAddRejectsDuplicateIds)
{
    Session *session = nullptr;

    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Add("s1", "/work", "work", SessionOwner::FromProcess(100), &session));
    ASSERT_NE(nullptr, session);
    EXPECT_EQ("s1", session->GetId());
    EXPECT_EQ(VIBE_ERROR_ALREADY, mRegistry.CheckAvailable("s1"));
    EXPECT_EQ(VIBE_ERROR_ALREADY, mRegistry.Add("s1", "/other", "other", SessionOwner::FromConnection(1)));
    EXPECT_EQ(1u, mRegistry.GetSize());
    EXPECT_EQ("/work", mRegistry.Find("s1")->GetPath());
}

TEST_F(SessionRegistryTest, TestSummariesReportSource)
{
    std::vector<Protocol::SessionSummary> summaries;

    mRegistry.Add("spawned", "/a", "a", SessionOwner::FromProcess(100));
    mRegistry.Add("managed", "/b", "b", SessionOwner::FromConnection(7));

    summaries = mRegistry.GetSummaries();
    ASSERT_EQ(2u, summaries.size());
    for (const Protocol::SessionSummary &summary : summaries)
    {
        EXPECT_EQ(summary.mSessionId == "spawned" ? "ios" : "cli", summary.mSource);
        EXPECT_FALSE(summary.mStartedAt.empty());
    }

    EXPECT_EQ("managed", mRegistry.FindByOwnerConnection(7)->GetId());
    EXPECT_EQ("spawned", mRegistry.FindByProcess(100)->GetId());
    EXPECT_EQ(nullptr, mRegistry.FindByOwnerConnection(8));
}

TEST_F(SessionRegistryTest, TestAttachAndDetachViewers)
{
    mRegistry.Add("s1", "/work", "work", SessionOwner::FromConnection(1));

    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, mRegistry.Attach("missing", 2));
    EXPECT_EQ(VIBE_ERROR_INVALID_ARGS, mRegistry.Attach("s1", 1));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Attach("s1", 2));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Attach("s1", 3));
    EXPECT_EQ(2u, mRegistry.Find("s1")->GetViewers().size());

    mRegistry.Detach("s1", 2);
    mRegistry.Detach("s1", 2);
    mRegistry.Detach("missing", 3);
    EXPECT_FALSE(mRegistry.Find("s1")->HasViewer(2));
    EXPECT_TRUE(mRegistry.Find("s1")->HasViewer(3));
}

TEST_F(SessionRegistryTest, TestStopSpawnedSessionEscalatesToKill)
{
    mRegistry.Add("s1", "/work", "work", SessionOwner::FromProcess(100));

    EXPECT_CALL(mDeps, SignalProcess(100, false)).WillOnce(Return(VIBE_ERROR_NONE));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Stop("s1"));
    EXPECT_TRUE(mRegistry.Find("s1")->IsStopping());
    EXPECT_EQ(VIBE_ERROR_BUSY, mRegistry.CheckAvailable("s1"));
    EXPECT_EQ(VIBE_ERROR_BUSY, mRegistry.Attach("s1", 5));

    // A second stop is acknowledged without signalling again.
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Stop("s1"));

    AdvanceTime(Milliseconds(4000));
    ::testing::Mock::VerifyAndClearExpectations(&mDeps);

    EXPECT_CALL(mDeps, SignalProcess(100, true)).WillOnce(Return(VIBE_ERROR_NONE));
    AdvanceTime(Milliseconds(5100));
}

TEST_F(SessionRegistryTest, TestRemoveCancelsForceKill)
{
    std::unique_ptr<Session> removed;

    mRegistry.Add("s1", "/work", "work", SessionOwner::FromProcess(100));

    EXPECT_CALL(mDeps, SignalProcess(100, false)).WillOnce(Return(VIBE_ERROR_NONE));
    mRegistry.Stop("s1");

    removed = mRegistry.Remove("s1");
    ASSERT_TRUE(removed != nullptr);
    EXPECT_EQ(nullptr, mRegistry.Find("s1"));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.CheckAvailable("s1"));

    // StrictMock fails on any SIGKILL.
    AdvanceTime(Milliseconds(10000));
    EXPECT_TRUE(mRegistry.Remove("s1") == nullptr);
}

TEST_F(SessionRegistryTest, TestStopManagedSessionClosesAfterGrace)
{
    mRegistry.Add("s1", "/work", "work", SessionOwner::FromConnection(4));

    EXPECT_CALL(mDeps, SendStopNotice(4, "s1"));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.Stop("s1"));
    ::testing::Mock::VerifyAndClearExpectations(&mDeps);

    EXPECT_CALL(mDeps, CloseConnection(4, 1000, "Stopped by agent"));
    AdvanceTime(Milliseconds(150));
    ::testing::Mock::VerifyAndClearExpectations(&mDeps);

    EXPECT_TRUE(mRegistry.Find("s1")->IsStopping());
}

TEST_F(SessionRegistryTest, TestStoppingFlagClearsWhenCloseIsNeverReported)
{
    mRegistry.Add("s1", "/work", "work", SessionOwner::FromConnection(4));

    EXPECT_CALL(mDeps, SendStopNotice(4, "s1"));
    EXPECT_CALL(mDeps, CloseConnection(4, _, _));
    mRegistry.Stop("s1");

    AdvanceTime(Milliseconds(5100));
    EXPECT_FALSE(mRegistry.Find("s1")->IsStopping());
    EXPECT_EQ(VIBE_ERROR_ALREADY, mRegistry.CheckAvailable("s1"));
}

TEST_F(SessionRegistryTest, TestStopUnknownSession)
{
    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, mRegistry.Stop("missing"));
}

TEST(SessionRegistry, TestDependenciesMayBeSetAfterConstruction)
{
    ::testing::StrictMock<MockDependencies> deps;
    SessionRegistry                         registry;

    registry.Add("s1", "/work", "work", SessionOwner::FromProcess(100));
    EXPECT_EQ(VIBE_ERROR_INVALID_STATE, registry.Stop("s1"));
    EXPECT_FALSE(registry.Find("s1")->IsStopping());

    registry.SetDependencies(deps);
    EXPECT_CALL(deps, SignalProcess(100, false)).WillOnce(Return(VIBE_ERROR_NONE));
    EXPECT_EQ(VIBE_ERROR_NONE, registry.Stop("s1"));
    EXPECT_TRUE(registry.Find("s1")->IsStopping());

    registry.Remove("s1");
}

TEST_F(SessionRegistryTest, TestTransferToConnection)
{
    mRegistry.Add("s1", "/work", "work", SessionOwner::FromProcess(100));
    mRegistry.Attach("s1", 9);

    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, mRegistry.TransferToConnection("missing", 9));
    EXPECT_EQ(VIBE_ERROR_NONE, mRegistry.TransferToConnection("s1", 9));
    EXPECT_TRUE(mRegistry.Find("s1")->GetOwner().IsConnection(9));
    EXPECT_FALSE(mRegistry.Find("s1")->HasViewer(9));
    EXPECT_EQ(nullptr, mRegistry.FindByProcess(100));
    EXPECT_EQ(VIBE_ERROR_INVALID_STATE, mRegistry.TransferToConnection("s1", 10));
}
