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
#include <sys/stat.h>

#include <set>
#include <string>

#include "common/time.hpp"
#include "utils/file_utils.hpp"
#include "utils/json_utils.hpp"
#include "utils/string_utils.hpp"
#include "utils/uuid.hpp"

using namespace vibe;

namespace {

std::string MakeTempDirectory(void)
{
    char pattern[] = "/tmp/vibe-test-XXXXXX";

    return mkdtemp(pattern);
}

mode_t GetMode(const std::string &aPath)
{
    struct stat st;

    return stat(aPath.c_str(), &st) == 0 ? (st.st_mode & 0777) : 0;
}

} // namespace

TEST(StringUtils, TestShortId)
{
    EXPECT_EQ("12345678", StringUtils::ShortId("12345678-aaaa-bbbb"));
    EXPECT_EQ("abc", StringUtils::ShortId("abc"));
}

TEST(StringUtils, TestStripTerminalControl)
{
    EXPECT_EQ("hello world", StringUtils::StripTerminalControl("\x1b[1;32mhello\x1b[0m\tworld\r\n"));
    EXPECT_EQ("title gone", StringUtils::StripTerminalControl("\x1b]0;my title\atitle gone"));
    EXPECT_EQ("bell", StringUtils::StripTerminalControl("be\all"));
    EXPECT_EQ("", StringUtils::StripTerminalControl("\x1b[2K\r\n"));
}

TEST(StringUtils, TestTruncate)
{
    EXPECT_EQ("short", StringUtils::Truncate("short", 10));
    EXPECT_EQ("0123456789...", StringUtils::Truncate("0123456789abc", 10));
}

TEST(Uuid, TestRandomStringsAreDistinctVersion4)
{
    std::set<std::string> seen;

    for (int i = 0; i < 100; i++)
    {
        std::string uuid = Uuid::NewRandomString();

        ASSERT_EQ(36u, uuid.size());
        EXPECT_EQ('-', uuid[8]);
        EXPECT_EQ('4', uuid[14]);
        seen.insert(uuid);
    }

    EXPECT_EQ(100u, seen.size());
}

TEST(Time, TestUtcRoundTrip)
{
    WallTime    time = WallClock::from_time_t(1700000000) + Milliseconds(123);
    WallTime    parsed;
    std::string text = FormatUtcTime(time);

    EXPECT_EQ("2023-11-14T22:13:20.123Z", text);
    ASSERT_TRUE(ParseUtcTime(text, parsed));
    EXPECT_EQ(time, parsed);
    EXPECT_FALSE(ParseUtcTime("yesterday", parsed));
}

TEST(FileUtils, TestPathHelpers)
{
    EXPECT_EQ("project", Utils::GetBaseName("/home/me/project"));
    EXPECT_EQ("project", Utils::GetBaseName("/home/me/project/"));
    EXPECT_EQ("/", Utils::GetBaseName("/"));
    EXPECT_EQ("/a/b", Utils::JoinPath("/a", "b"));
    EXPECT_EQ("/a/b", Utils::JoinPath("/a/", "b"));
    EXPECT_EQ(Utils::JoinPath(Utils::GetHomeDirectory(), "work"), Utils::ExpandHomeDirectory("~/work"));
    EXPECT_EQ("/tmp/~", Utils::ExpandHomeDirectory("/tmp/~"));
}

TEST(FileUtils, TestWriteAndReadFile)
{
    std::string directory = MakeTempDirectory();
    std::string nested    = Utils::JoinPath(directory, "nested");
    std::string path      = Utils::JoinPath(nested, "file");
    std::string content;

    ASSERT_EQ(VIBE_ERROR_NONE, Utils::EnsureDirectory(nested, 0700));
    EXPECT_TRUE(Utils::IsDirectory(nested));
    EXPECT_EQ(0700u, GetMode(nested));

    EXPECT_EQ(VIBE_ERROR_NOT_FOUND, Utils::ReadFile(path, content));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::WriteFile(path, "secret", 0600));
    EXPECT_EQ(0600u, GetMode(path));
    ASSERT_EQ(VIBE_ERROR_NONE, Utils::ReadFile(path, content));
    EXPECT_EQ("secret", content);

    EXPECT_EQ(VIBE_ERROR_NONE, Utils::RemoveFile(path));
    EXPECT_FALSE(Utils::IsDirectory(path));
}

TEST(FileUtils, TestFindExecutable)
{
    std::string path;

    EXPECT_TRUE(Utils::FindExecutable("sh", path));
    EXPECT_EQ("sh", Utils::GetBaseName(path));
    EXPECT_TRUE(Utils::FindExecutable("/bin/sh", path));
    EXPECT_EQ("/bin/sh", path);
    EXPECT_FALSE(Utils::FindExecutable("surely-not-an-installed-command", path));
    EXPECT_FALSE(Utils::FindExecutable("/tmp", path));
}

TEST(JsonUtils, TestParseAndAccessors)
{
    Json::Value value;

    ASSERT_EQ(VIBE_ERROR_NONE, JsonUtils::Parse("{\"type\":\"x\",\"n\":1}", value));
    EXPECT_EQ("x", JsonUtils::GetString(value, "type"));
    EXPECT_EQ("fallback", JsonUtils::GetString(value, "n", "fallback"));
    EXPECT_EQ("fallback", JsonUtils::GetString(value, "missing", "fallback"));
    EXPECT_EQ(VIBE_ERROR_PARSE, JsonUtils::Parse("{\"type\":", value));
    EXPECT_TRUE(JsonUtils::StringOrNull("").isNull());
    EXPECT_EQ("a", JsonUtils::StringOrNull("a").asString());
}
