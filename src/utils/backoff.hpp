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
 *   This file includes definitions for the jittered exponential backoff.
 */

#ifndef VIBE_UTILS_BACKOFF_HPP_
#define VIBE_UTILS_BACKOFF_HPP_

#include <random>

#include <stdint.h>

#include "common/time.hpp"

namespace vibe {

/**
 * This class computes reconnect delays growing exponentially from a base delay up to a cap.
 *
 * The n-th delay after a reset is `min(base * factor^(n-1), max)` scaled by a random factor in
 * `[1 - jitter, 1 + jitter]`.
 *
 */
class ExponentialBackoff
{
public:
    static constexpr uint32_t kMaxExponent = 20;

    /**
     * This constructor initializes the backoff.
     *
     * @param[in] aBaseDelay  The first delay.
     * @param[in] aFactor     The growth factor between two consecutive delays.
     * @param[in] aMaxDelay   The cap of the delay before jitter is applied.
     * @param[in] aJitter     The relative jitter, 0.1 means +/-10%. Zero disables jitter.
     *
     */
    ExponentialBackoff(Milliseconds aBaseDelay, uint32_t aFactor, Milliseconds aMaxDelay, double aJitter);

    /**
     * This method counts one more attempt and returns the delay to wait before it.
     *
     */
    Milliseconds Next(void);

    /**
     * This method resets the attempt counter, so the next delay is the base delay again.
     *
     */
    void Reset(void) { mAttempt = 0; }

    /**
     * This method returns the number of attempts since the last reset.
     *
     */
    uint32_t GetAttempt(void) const { return mAttempt; }

    /**
     * This method returns the delay of attempt @p aAttempt (starting at 1) without jitter.
     *
     */
    Milliseconds GetDelay(uint32_t aAttempt) const;

private:
    Milliseconds mBaseDelay;
    uint32_t     mFactor;
    Milliseconds mMaxDelay;
    double       mJitter;
    uint32_t     mAttempt;
    std::mt19937 mRandom;
};

} // namespace vibe

#endif // VIBE_UTILS_BACKOFF_HPP_
