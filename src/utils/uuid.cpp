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

#include "utils/uuid.hpp"

#include <cstdio>
#include <cstring>
#include <random>

namespace vibe {

constexpr size_t Uuid::kLength;
constexpr size_t Uuid::kStringLen;

Uuid::Uuid(void)
{
    std::memset(mBuf, 0, sizeof(mBuf));
}

void Uuid::GenerateRandom(void)
{
    std::random_device              rd;
    std::mt19937                    gen(rd());
    std::uniform_int_distribution<> dist(0, 255);

    for (size_t i = 0; i < kLength; ++i)
    {
        mBuf[i] = static_cast<uint8_t>(dist(gen));
    }

    // Mark off appropriate bits as per RFC4122 section 4.4
    mClockSeqHiAndReserved = (mClockSeqHiAndReserved & 0x3F) | 0x80;
    mTimeHiAndVersion      = (mTimeHiAndVersion & 0x0FFF) | 0x4000;
}

std::string Uuid::ToString(void) const
{
    char out[kStringLen];

    std::snprintf(out, sizeof(out), "%08x-%04x-%04x-%02x%02x-%02x%02x%02x%02x%02x%02x", mTimeLow, mTimeMid,
                  mTimeHiAndVersion, mClockSeqHiAndReserved, mClockSeqLow, mNode[0], mNode[1], mNode[2], mNode[3],
                  mNode[4], mNode[5]);
    return std::string(out);
}

std::string Uuid::NewRandomString(void)
{
    Uuid uuid;

    uuid.GenerateRandom();
    return uuid.ToString();
}

} // namespace vibe
