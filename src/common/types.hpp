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
 *   This file includes definition for data types used by the vibe agent.
 */

#ifndef VIBE_COMMON_TYPES_HPP_
#define VIBE_COMMON_TYPES_HPP_

#include "vibe-agent/config.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * This enumeration represents error codes used throughout the vibe agent.
 */
enum vibeError
{
    VIBE_ERROR_NONE = 0, ///< No error.

    VIBE_ERROR_ERRNO         = -1,  ///< Error defined by errno.
    VIBE_ERROR_INVALID_ARGS  = -2,  ///< Invalid arguments.
    VIBE_ERROR_INVALID_STATE = -3,  ///< The operation is not allowed in the current state.
    VIBE_ERROR_NOT_FOUND     = -4,  ///< The requested item was not found.
    VIBE_ERROR_ALREADY       = -5,  ///< The item already exists.
    VIBE_ERROR_BUSY          = -6,  ///< The item is being torn down.
    VIBE_ERROR_PARSE         = -7,  ///< Malformed input.
    VIBE_ERROR_NOT_CONNECTED = -8,  ///< The transport is not open.
    VIBE_ERROR_AUTH          = -9,  ///< Authentication failed.
    VIBE_ERROR_UNSUPPORTED   = -10, ///< Unknown or unsupported request.
};

namespace vibe {

/**
 * This type identifies one connection accepted by the local listener.
 *
 * Identifiers are never reused within a process lifetime. Zero is never a valid identifier.
 *
 */
typedef uint64_t ConnectionId;

enum : ConnectionId
{
    kInvalidConnectionId = 0,
};

} // namespace vibe

#endif // VIBE_COMMON_TYPES_HPP_
