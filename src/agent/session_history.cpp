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

#define VIBE_LOG_TAG "HISTORY"

#include "agent/session_history.hpp"

#include <algorithm>
#include <vector>

#include <json/json.h>

#include "utils/json_utils.hpp"
#include "utils/string_utils.hpp"

namespace vibe {

constexpr size_t SessionHistory::kDefaultCapacity;
constexpr int    SessionHistory::kDefaultMaxAgeDays;

SessionHistory::SessionHistory(const std::string &aFilePath, size_t aCapacity, int aMaxAgeDays)
    : mFilePath(aFilePath)
    , mCapacity(aCapacity)
    , mMaxAgeDays(aMaxAgeDays)
{
}

void SessionHistory::Load(void)
{
    vibeError                        error;
    Json::Value                      root;
    WallTime                         cutoff = WallClock::now() - std::chrono::hours(24 * mMaxAgeDays);
    std::vector<SessionHistoryEntry> entries;

    mEntries.clear();
    VerifyOrExit(!mFilePath.empty());

    error = JsonUtils::ReadFile(mFilePath, root);
    VerifyOrExit(error != VIBE_ERROR_NOT_FOUND);
    VerifyOrExit(error == VIBE_ERROR_NONE && root.isObject(),
                 vibeLogWarn("Ignoring unreadable session history %s", mFilePath.c_str()));

    for (const std::string &sessionId : root.getMemberNames())
    {
        const Json::Value  &value = root[sessionId];
        SessionHistoryEntry entry;

        if (!value.isObject() || !ParseUtcTime(JsonUtils::GetString(value, "endedAt"), entry.mEndedAt))
        {
            vibeLogDebg("Skipping malformed history entry %s", StringUtils::ShortId(sessionId).c_str());
            continue;
        }

        if (entry.mEndedAt < cutoff)
        {
            continue;
        }

        entry.mSessionId = sessionId;
        entry.mPath      = JsonUtils::GetString(value, "path");
        entry.mName      = JsonUtils::GetString(value, "name");
        entries.push_back(entry);
    }

    // The file is an object keyed by id; the insertion order is restored from the end times.
    std::stable_sort(entries.begin(), entries.end(),
                     [](const SessionHistoryEntry &aLhs, const SessionHistoryEntry &aRhs) {
                         return aLhs.mEndedAt < aRhs.mEndedAt;
                     });

    if (entries.size() > mCapacity)
    {
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(mCapacity));
    }

    mEntries.assign(entries.begin(), entries.end());
    vibeLogInfo("Loaded %zu session history entries", mEntries.size());

exit:
    return;
}

vibeError SessionHistory::Record(const std::string &aSessionId, const std::string &aPath, const std::string &aName)
{
    SessionHistoryEntry entry;

    mEntries.remove_if([&aSessionId](const SessionHistoryEntry &aEntry) { return aEntry.mSessionId == aSessionId; });

    while (mCapacity > 0 && mEntries.size() >= mCapacity)
    {
        vibeLogDebg("Evicting history entry %s", StringUtils::ShortId(mEntries.front().mSessionId).c_str());
        mEntries.pop_front();
    }

    entry.mSessionId = aSessionId;
    entry.mPath      = aPath;
    entry.mName      = aName;
    entry.mEndedAt   = WallClock::now();
    mEntries.push_back(entry);

    return Save();
}

const SessionHistoryEntry *SessionHistory::Lookup(const std::string &aSessionId) const
{
    const SessionHistoryEntry *found = nullptr;

    for (const SessionHistoryEntry &entry : mEntries)
    {
        if (entry.mSessionId == aSessionId)
        {
            found = &entry;
            break;
        }
    }

    return found;
}

vibeError SessionHistory::Save(void) const
{
    vibeError   error = VIBE_ERROR_NONE;
    Json::Value root(Json::objectValue);

    VerifyOrExit(!mFilePath.empty());

    for (const SessionHistoryEntry &entry : mEntries)
    {
        Json::Value value(Json::objectValue);

        value["path"]    = entry.mPath;
        value["name"]    = entry.mName;
        value["endedAt"] = FormatUtcTime(entry.mEndedAt);
        root[entry.mSessionId] = value;
    }

    error = JsonUtils::WriteFile(mFilePath, root, 0600);

exit:
    vibeLogResult(error, "Save session history");
    return error;
}

} // namespace vibe
