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
 *   This file includes definitions for the source of the bridge bearer token.
 */

#ifndef VIBE_AGENT_TOKEN_PROVIDER_HPP_
#define VIBE_AGENT_TOKEN_PROVIDER_HPP_

#include "vibe-agent/config.h"

#include <string>

#include "common/code_utils.hpp"
#include "common/types.hpp"

namespace vibe {

/**
 * This interface provides the bearer token sent in `authenticate`.
 *
 */
class TokenProvider
{
public:
    virtual ~TokenProvider(void) = default;

    /**
     * This method returns the current token.
     *
     * @retval VIBE_ERROR_NONE       @p aToken holds a token.
     * @retval VIBE_ERROR_NOT_FOUND  No credentials are stored.
     *
     */
    virtual vibeError EnsureValidToken(std::string &aToken) = 0;

    /**
     * This method obtains a token different from the one the bridge rejected.
     *
     * @retval VIBE_ERROR_NONE  @p aToken holds a new token.
     * @retval VIBE_ERROR_AUTH  No new token is available; the operator must sign in again.
     *
     */
    virtual vibeError RefreshIdToken(std::string &aToken) = 0;
};

/**
 * This class reads the token from `~/.vibe/auth.json`, falling back to the legacy `~/.vibe/token`.
 *
 * The token is refreshed out of band by the CLI sign-in, which rewrites `auth.json`; a refresh succeeds when the file
 * holds a token other than the last one handed out.
 *
 */
class StoredTokenProvider : public TokenProvider, private NonCopyable
{
public:
    /**
     * This constructor creates a provider for the credentials directory @p aDirectory (normally `~/.vibe`).
     *
     */
    explicit StoredTokenProvider(const std::string &aDirectory);

    vibeError EnsureValidToken(std::string &aToken) override;
    vibeError RefreshIdToken(std::string &aToken) override;

    /**
     * This method stores @p aToken as the id token, keeping an existing refresh token.
     *
     */
    vibeError StoreToken(const std::string &aToken);

    /**
     * This method tells whether any credentials are stored.
     *
     */
    bool HasCredentials(void) const;

private:
    vibeError ReadToken(std::string &aToken) const;

    std::string mDirectory;
    std::string mAuthFile;
    std::string mLegacyTokenFile;
    std::string mLastToken;
};

} // namespace vibe

#endif // VIBE_AGENT_TOKEN_PROVIDER_HPP_
