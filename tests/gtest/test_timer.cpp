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

#include <gtest/gtest.h>

#include <string>

#include "common/time.hpp"
#include "common/timer.hpp"
#include "common/timer_scheduler.hpp"
#include "utils/backoff.hpp"

using vibe::Clock;
using vibe::Milliseconds;
using vibe::TimePoint;
using vibe::Timer;
using vibe::TimerScheduler;

TEST(Timer, TestFiresInOrderOfFireTime)
{
    std::string str;
    TimePoint   now = Clock::now();
    Timer       a([&](Timer &) { str.push_back('a'); });
    Timer       b([&](Timer &) { str.push_back('b'); });
    Timer       c([&](Timer &) { str.push_back('c'); });

    a.Start(now + Milliseconds(30));
    b.Start(now + Milliseconds(10));
    c.Start(now + Milliseconds(20));

    TimerScheduler::Get().Process(now + Milliseconds(15));
    EXPECT_EQ("b", str);
    EXPECT_FALSE(b.IsRunning());
    EXPECT_TRUE(a.IsRunning());

    TimerScheduler::Get().Process(now + Milliseconds(100));
    EXPECT_EQ("bca", str);
}

TEST(Timer, TestStoppedTimerNeverFires)
{
    int       fired = 0;
    TimePoint now   = Clock::now();
    Timer     timer([&](Timer &) { ++fired; });

    timer.Start(now + Milliseconds(10));
    timer.Stop();
    TimerScheduler::Get().Process(now + Milliseconds(100));

    EXPECT_EQ(0, fired);
    EXPECT_EQ(TimePoint::max(), TimerScheduler::Get().GetEarliestFireTime());
}

TEST(Timer, TestDestroyedTimerNeverFires)
{
    int       fired = 0;
    TimePoint now   = Clock::now();

    {
        Timer timer([&](Timer &) { ++fired; });

        timer.Start(now + Milliseconds(10));
    }

    TimerScheduler::Get().Process(now + Milliseconds(100));
    EXPECT_EQ(0, fired);
}

TEST(Timer, TestCallbackMayRestartTimer)
{
    int       fired = 0;
    TimePoint now   = Clock::now();
    Timer     timer([&](Timer &aTimer) {
        if (++fired < 3)
        {
            aTimer.Start(aTimer.GetFireTime() + Milliseconds(10));
        }
    });

    timer.Start(now + Milliseconds(10));
    TimerScheduler::Get().Process(now + Milliseconds(15));
    EXPECT_EQ(1, fired);
    EXPECT_TRUE(timer.IsRunning());

    // A restarted timer waits for the next round even when it is already due.
    TimerScheduler::Get().Process(now + Milliseconds(100));
    EXPECT_EQ(2, fired);
    EXPECT_TRUE(timer.IsRunning());
    EXPECT_EQ(now + Milliseconds(30), timer.GetFireTime());

    TimerScheduler::Get().Process(now + Milliseconds(100));
    EXPECT_EQ(3, fired);
    EXPECT_FALSE(timer.IsRunning());
}

TEST(Timer, TestCallbackMayStopAnotherTimer)
{
    std::string str;
    TimePoint   now = Clock::now();
    Timer       second([&](Timer &) { str.push_back('2'); });
    Timer       first([&](Timer &) {
        str.push_back('1');
        second.Stop();
    });

    first.Start(now + Milliseconds(10));
    second.Start(now + Milliseconds(10));
    TimerScheduler::Get().Process(now + Milliseconds(20));

    EXPECT_EQ("1", str);
}

TEST(ExponentialBackoff, TestDoublesUpToTheCap)
{
    vibe::ExponentialBackoff backoff(Milliseconds(2000), 2, Milliseconds(30000), 0);

    EXPECT_EQ(Milliseconds(2000), backoff.Next());
    EXPECT_EQ(Milliseconds(4000), backoff.Next());
    EXPECT_EQ(Milliseconds(8000), backoff.Next());
    EXPECT_EQ(Milliseconds(16000), backoff.Next());
    EXPECT_EQ(Milliseconds(30000), backoff.Next());
    EXPECT_EQ(Milliseconds(30000), backoff.Next());
    EXPECT_EQ(6u, backoff.GetAttempt());
}

TEST(ExponentialBackoff, TestResetStartsOver)
{
    vibe::ExponentialBackoff backoff(Milliseconds(2000), 2, Milliseconds(30000), 0);

    backoff.Next();
    backoff.Next();
    backoff.Reset();

    EXPECT_EQ(0u, backoff.GetAttempt());
    EXPECT_EQ(Milliseconds(2000), backoff.Next());
}

TEST(ExponentialBackoff, TestHugeAttemptStaysAtTheCap)
{
    vibe::ExponentialBackoff backoff(Milliseconds(2000), 2, Milliseconds(30000), 0);

    EXPECT_EQ(Milliseconds(30000), backoff.GetDelay(1000));
}

TEST(ExponentialBackoff, TestJitterStaysWithinBounds)
{
    vibe::ExponentialBackoff backoff(Milliseconds(2000), 2, Milliseconds(30000), 0.1);

    for (int i = 0; i < 50; i++)
    {
        Milliseconds expected = backoff.GetDelay(backoff.GetAttempt() + 1);
        Milliseconds delay    = backoff.Next();

        EXPECT_GE(delay.count(), expected.count() * 9 / 10 - 1);
        EXPECT_LE(delay.count(), expected.count() * 11 / 10);
    }
}
