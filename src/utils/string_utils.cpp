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

#include "utils/string_utils.hpp"

#include <ctype.h>

namespace vibe {
namespace StringUtils {

std::string ToLowercase(const std::string &aString)
{
    std::string lower(aString);

    for (char &c : lower)
    {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }

    return lower;
}

std::string ShortId(const std::string &aId)
{
    return aId.substr(0, 8);
}

std::string StripTerminalControl(const std::string &aText)
{
    std::string result;
    size_t      i = 0;

    result.reserve(aText.size());

    while (i < aText.size())
    {
        unsigned char c = static_cast<unsigned char>(aText[i]);

        if (c == 0x1b)
        {
            ++i;
            if (i < aText.size() && aText[i] == '[')
            {
                // CSI: parameters and intermediates up to a final byte in 0x40-0x7e.
                ++i;
                while (i < aText.size() && !(aText[i] >= 0x40 && aText[i] <= 0x7e))
                {
                    ++i;
                }
                ++i;
            }
            else if (i < aText.size() && aText[i] == ']')
            {
                // OSC: terminated by BEL or ESC '\'.
                ++i;
                while (i < aText.size() && aText[i] != '\a' && aText[i] != 0x1b)
                {
                    ++i;
                }
                i += (i < aText.size() && aText[i] == 0x1b) ? 2 : 1;
            }
            else
            {
                ++i;
            }
            continue;
        }

        if (c == '\t' || c == '\n' || c == '\r' || c == ' ')
        {
            if (!result.empty() && result.back() != ' ')
            {
                result.push_back(' ');
            }
        }
        else if (c >= 0x20 && c != 0x7f)
        {
            result.push_back(static_cast<char>(c));
        }

        ++i;
    }

    while (!result.empty() && result.back() == ' ')
    {
        result.pop_back();
    }

    return result;
}

std::string Truncate(const std::string &aText, size_t aMaxLength)
{
    return aText.size() <= aMaxLength ? aText : aText.substr(0, aMaxLength) + "...";
}

} // namespace StringUtils
} // namespace vibe
