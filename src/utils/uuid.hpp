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
 *   This file includes definitions for random (version 4) UUIDs.
 */

#ifndef VIBE_UTILS_UUID_HPP_
#define VIBE_UTILS_UUID_HPP_

#include <stdint.h>
#include <string>

namespace vibe {

/**
 * This class represents a RFC 4122 UUID.
 *
 */
class Uuid
{
public:
    static constexpr size_t kLength    = 16;
    static constexpr size_t kStringLen = 37; ///< Including the null terminator.

    Uuid(void);

    /**
     * This method fills the UUID with random bits and marks it as version 4.
     *
     */
    void GenerateRandom(void);

    /**
     * This method returns the canonical lower case representation, e.g. "1b4e28ba-2fa1-11d2-883f-0016d3cca427".
     *
     */
    std::string ToString(void) const;

    /**
     * This function returns the string form of a freshly generated random UUID.
     *
     */
    static std::string NewRandomString(void);

private:
    union
    {
        struct
        {
            uint32_t mTimeLow;
            uint16_t mTimeMid;
            uint16_t mTimeHiAndVersion;
            uint8_t  mClockSeqHiAndReserved;
            uint8_t  mClockSeqLow;
            uint8_t  mNode[6];
        };
        uint8_t mBuf[kLength];
    };
};

} // namespace vibe

#endif // VIBE_UTILS_UUID_HPP_
