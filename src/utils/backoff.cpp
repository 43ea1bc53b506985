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

#include "utils/backoff.hpp"

#include <algorithm>

namespace vibe {

constexpr uint32_t ExponentialBackoff::kMaxExponent;

ExponentialBackoff::ExponentialBackoff(Milliseconds aBaseDelay,
                                       uint32_t     aFactor,
                                       Milliseconds aMaxDelay,
                                       double       aJitter)
    : mBaseDelay(aBaseDelay)
    , mFactor(aFactor)
    , mMaxDelay(aMaxDelay)
    , mJitter(aJitter)
    , mAttempt(0)
    , mRandom(std::random_device()())
{
}

Milliseconds ExponentialBackoff::Next(void)
{
    Milliseconds delay;

    ++mAttempt;
    delay = GetDelay(mAttempt);

    if (mJitter > 0)
    {
        std::uniform_real_distribution<double> dist(1.0 - mJitter, 1.0 + mJitter);

        delay = Milliseconds(static_cast<Milliseconds::rep>(delay.count() * dist(mRandom)));
    }

    return delay;
}

Milliseconds ExponentialBackoff::GetDelay(uint32_t aAttempt) const
{
    uint32_t     exponent = std::min(aAttempt > 0 ? aAttempt - 1 : 0, kMaxExponent);
    Milliseconds delay    = mBaseDelay;

    for (uint32_t i = 0; i < exponent && delay < mMaxDelay; i++)
    {
        delay *= mFactor;
    }

    return std::min(delay, mMaxDelay);
}

} // namespace vibe
