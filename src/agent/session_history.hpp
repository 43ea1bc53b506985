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
 *   This file includes definitions for the history of ended sessions.
 */

#ifndef VIBE_AGENT_SESSION_HISTORY_HPP_
#define VIBE_AGENT_SESSION_HISTORY_HPP_

#include "vibe-agent/config.h"

#include <list>
#include <string>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/types.hpp"

namespace vibe {

/**
 * This structure represents one ended session.
 *
 */
struct SessionHistoryEntry
{
    std::string mSessionId;
    std::string mPath;
    std::string mName;
    WallTime    mEndedAt;
};

/**
 * This class implements a bounded, write-through record of ended sessions.
 *
 * The store only exists so that a session can be resumed in its original working directory. Entries are kept in
 * insertion order; recording an id that is already present moves it to the newest position.
 *
 */
class SessionHistory : private NonCopyable
{
public:
    static constexpr size_t kDefaultCapacity   = VIBE_CONFIG_HISTORY_CAPACITY;
    static constexpr int    kDefaultMaxAgeDays = VIBE_CONFIG_HISTORY_MAX_AGE_DAYS;

    /**
     * This constructor initializes an empty history backed by @p aFilePath.
     *
     * @param[in] aFilePath    The JSON file the history is persisted to. Empty disables persistence.
     * @param[in] aCapacity    The maximum number of entries.
     * @param[in] aMaxAgeDays  Entries older than this are dropped by Load().
     *
     */
    explicit SessionHistory(const std::string &aFilePath,
                            size_t             aCapacity   = kDefaultCapacity,
                            int                aMaxAgeDays = kDefaultMaxAgeDays);

    /**
     * This method loads the persisted history, replacing the entries in memory.
     *
     * A missing or unreadable file yields an empty history.
     *
     */
    void Load(void);

    /**
     * This method records that a session ended now and persists the whole history.
     *
     * @param[in] aSessionId  The session id.
     * @param[in] aPath       The working directory of the session.
     * @param[in] aName       The display name of the session.
     *
     * @retval VIBE_ERROR_NONE   Successfully recorded and persisted the entry.
     * @retval VIBE_ERROR_ERRNO  The entry is recorded in memory but could not be persisted.
     *
     */
    vibeError Record(const std::string &aSessionId, const std::string &aPath, const std::string &aName);

    /**
     * This method looks up the last recorded entry of a session.
     *
     * @returns A pointer to the entry, or nullptr if the session is unknown.
     *
     */
    const SessionHistoryEntry *Lookup(const std::string &aSessionId) const;

    /**
     * This method returns the number of entries.
     *
     */
    size_t GetSize(void) const { return mEntries.size(); }

    /**
     * This method returns the entries from the oldest to the newest.
     *
     */
    const std::list<SessionHistoryEntry> &GetEntries(void) const { return mEntries; }

private:
    vibeError Save(void) const;

    std::string                    mFilePath;
    size_t                         mCapacity;
    int                            mMaxAgeDays;
    std::list<SessionHistoryEntry> mEntries;
};

} // namespace vibe

#endif // VIBE_AGENT_SESSION_HISTORY_HPP_
