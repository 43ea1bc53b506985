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
 *   This file includes definitions for file system helpers.
 */

#ifndef VIBE_UTILS_FILE_UTILS_HPP_
#define VIBE_UTILS_FILE_UTILS_HPP_

#include <string>

#include <sys/types.h>

#include "common/types.hpp"

namespace vibe {
namespace Utils {

/**
 * This function returns the home directory of the current user.
 *
 * $HOME wins over the password database.
 *
 */
std::string GetHomeDirectory(void);

/**
 * This function returns the current working directory, or an empty string on failure.
 *
 */
std::string GetCurrentDirectory(void);

/**
 * This function expands a leading "~" or "~/" in @p aPath to the home directory.
 *
 */
std::string ExpandHomeDirectory(const std::string &aPath);

/**
 * This function returns the last component of @p aPath, ignoring trailing slashes.
 *
 */
std::string GetBaseName(const std::string &aPath);

/**
 * This function joins two path components with a single slash.
 *
 */
std::string JoinPath(const std::string &aDirectory, const std::string &aName);

/**
 * This function tells whether @p aPath names an existing directory.
 *
 */
bool IsDirectory(const std::string &aPath);

/**
 * This function creates @p aPath with @p aMode if it does not exist yet.
 *
 * @retval VIBE_ERROR_NONE   The directory exists.
 * @retval VIBE_ERROR_ERRNO  Failed to create the directory.
 *
 */
vibeError EnsureDirectory(const std::string &aPath, mode_t aMode);

/**
 * This function reads the whole content of @p aPath.
 *
 * @retval VIBE_ERROR_NONE       Successfully read the file.
 * @retval VIBE_ERROR_NOT_FOUND  The file does not exist.
 * @retval VIBE_ERROR_ERRNO      Failed to read the file.
 *
 */
vibeError ReadFile(const std::string &aPath, std::string &aContent);

/**
 * This function replaces the content of @p aPath atomically.
 *
 * The content is written to a temporary file with @p aMode and renamed over @p aPath.
 *
 * @retval VIBE_ERROR_NONE   Successfully wrote the file.
 * @retval VIBE_ERROR_ERRNO  Failed to write the file.
 *
 */
vibeError WriteFile(const std::string &aPath, const std::string &aContent, mode_t aMode);

/**
 * This function removes @p aPath, treating a missing file as success.
 *
 */
vibeError RemoveFile(const std::string &aPath);

/**
 * This function resolves @p aName to an executable path.
 *
 * A name containing a slash is used as is, otherwise the directories in $PATH are searched.
 *
 * @retval TRUE   @p aPath holds an executable file.
 * @retval FALSE  No executable was found.
 *
 */
bool FindExecutable(const std::string &aName, std::string &aPath);

} // namespace Utils
} // namespace vibe

#endif // VIBE_UTILS_FILE_UTILS_HPP_
