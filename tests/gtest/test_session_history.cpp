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

#include <stdlib.h>

#include <string>

#include "agent/session_history.hpp"
#include "common/time.hpp"
#include "utils/file_utils.hpp"
#include "utils/json_utils.hpp"

using vibe::SessionHistory;
using vibe::SessionHistoryEntry;

namespace {

std::string MakeHistoryPath(void)
{
    char pattern[] = "/tmp/vibe-history-XXXXXX";

    return vibe::Utils::JoinPath(mkdtemp(pattern), "session-history.json");
}

} // namespace

TEST(SessionHistory, TestRecordAndLookup)
{
    SessionHistory             history("");
    const SessionHistoryEntry *entry;

    EXPECT_EQ(nullptr, history.Lookup("s1"));
    EXPECT_EQ(VIBE_ERROR_NONE, history.Record("s1", "/work/one", "one"));

    entry = history.Lookup("s1");
    ASSERT_NE(nullptr, entry);
    EXPECT_EQ("/work/one", entry->mPath);
    EXPECT_EQ("one", entry->mName);
}

TEST(SessionHistory, TestRecordingAgainMovesToNewest)
{
    SessionHistory history("", 3);

    history.Record("a", "/a", "a");
    history.Record("b", "/b", "b");
    history.Record("a", "/a2", "a2");

    ASSERT_EQ(2u, history.GetSize());
    EXPECT_EQ("b", history.GetEntries().front().mSessionId);
    EXPECT_EQ("a", history.GetEntries().back().mSessionId);
    EXPECT_EQ("/a2", history.Lookup("a")->mPath);
}

TEST(SessionHistory, TestEvictsOldestBeyondCapacity)
{
    SessionHistory history("", 100);

    for (int i = 0; i < 101; i++)
    {
        history.Record("s" + std::to_string(i), "/p", "n");
    }

    EXPECT_EQ(100u, history.GetSize());
    EXPECT_EQ(nullptr, history.Lookup("s0"));
    EXPECT_NE(nullptr, history.Lookup("s1"));
    EXPECT_NE(nullptr, history.Lookup("s100"));
}

TEST(SessionHistory, TestPersistsAcrossLoads)
{
    std::string    path = MakeHistoryPath();
    SessionHistory writer(path);
    SessionHistory reader(path);

    writer.Record("first", "/one", "one");
    writer.Record("second", "/two", "two");

    reader.Load();
    ASSERT_EQ(2u, reader.GetSize());
    EXPECT_EQ("first", reader.GetEntries().front().mSessionId);
    EXPECT_EQ("/two", reader.Lookup("second")->mPath);
}

TEST(SessionHistory, TestLoadDropsExpiredEntries)
{
    std::string    path = MakeHistoryPath();
    Json::Value    root(Json::objectValue);
    SessionHistory history(path, 100, 30);

    root["old"]["path"]    = "/old";
    root["old"]["name"]    = "old";
    root["old"]["endedAt"] = vibe::FormatUtcTime(vibe::WallClock::now() - std::chrono::hours(24 * 31));
    root["new"]["path"]    = "/new";
    root["new"]["name"]    = "new";
    root["new"]["endedAt"] = vibe::FormatUtcTime(vibe::WallClock::now() - std::chrono::hours(24));
    root["bad"]["path"]    = "/bad";
    ASSERT_EQ(VIBE_ERROR_NONE, vibe::JsonUtils::WriteFile(path, root, 0600));

    history.Load();

    EXPECT_EQ(1u, history.GetSize());
    EXPECT_EQ(nullptr, history.Lookup("old"));
    EXPECT_EQ(nullptr, history.Lookup("bad"));
    EXPECT_NE(nullptr, history.Lookup("new"));
}

TEST(SessionHistory, TestMalformedFileYieldsEmptyHistory)
{
    std::string    path = MakeHistoryPath();
    SessionHistory history(path);

    ASSERT_EQ(VIBE_ERROR_NONE, vibe::Utils::WriteFile(path, "{not json", 0600));
    history.Record("s", "/p", "n");

    history.Load();
    EXPECT_EQ(1u, history.GetSize());

    ASSERT_EQ(VIBE_ERROR_NONE, vibe::Utils::WriteFile(path, "{not json", 0600));
    history.Load();
    EXPECT_EQ(0u, history.GetSize());
}
