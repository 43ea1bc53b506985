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

#define VIBE_LOG_TAG "UTILS"

#include "utils/file_utils.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <sstream>

#include "common/code_utils.hpp"

namespace vibe {
namespace Utils {

std::string GetHomeDirectory(void)
{
    const char    *home = getenv("HOME");
    struct passwd *pw;

    if (home == nullptr || home[0] == '\0')
    {
        pw   = getpwuid(getuid());
        home = (pw != nullptr) ? pw->pw_dir : "/";
    }

    return home;
}

std::string GetCurrentDirectory(void)
{
    char buffer[PATH_MAX];

    return getcwd(buffer, sizeof(buffer)) != nullptr ? std::string(buffer) : std::string();
}

std::string ExpandHomeDirectory(const std::string &aPath)
{
    std::string expanded = aPath;

    if (aPath == "~")
    {
        expanded = GetHomeDirectory();
    }
    else if (aPath.compare(0, 2, "~/") == 0)
    {
        expanded = JoinPath(GetHomeDirectory(), aPath.substr(2));
    }

    return expanded;
}

std::string GetBaseName(const std::string &aPath)
{
    std::string path = aPath;
    size_t      slash;

    while (path.size() > 1 && path.back() == '/')
    {
        path.pop_back();
    }

    slash = path.rfind('/');

    return (slash == std::string::npos || path.size() == 1) ? path : path.substr(slash + 1);
}

std::string JoinPath(const std::string &aDirectory, const std::string &aName)
{
    std::string path = aDirectory;

    if (path.empty() || path.back() != '/')
    {
        path.push_back('/');
    }

    return path + aName;
}

bool IsDirectory(const std::string &aPath)
{
    struct stat st;

    return !aPath.empty() && stat(aPath.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

vibeError EnsureDirectory(const std::string &aPath, mode_t aMode)
{
    vibeError error = VIBE_ERROR_NONE;

    VerifyOrExit(!IsDirectory(aPath));
    VerifyOrExit(mkdir(aPath.c_str(), aMode) == 0 || errno == EEXIST, error = VIBE_ERROR_ERRNO);

exit:
    return error;
}

vibeError ReadFile(const std::string &aPath, std::string &aContent)
{
    vibeError error = VIBE_ERROR_NONE;
    int       fd    = open(aPath.c_str(), O_RDONLY | O_CLOEXEC);
    char      buffer[4096];
    ssize_t   rval;

    VerifyOrExit(fd != -1, error = (errno == ENOENT ? VIBE_ERROR_NOT_FOUND : VIBE_ERROR_ERRNO));

    aContent.clear();
    while ((rval = read(fd, buffer, sizeof(buffer))) != 0)
    {
        if (rval < 0)
        {
            VerifyOrExit(errno == EINTR, error = VIBE_ERROR_ERRNO);
            continue;
        }
        aContent.append(buffer, static_cast<size_t>(rval));
    }

exit:
    if (fd != -1)
    {
        close(fd);
    }
    return error;
}

vibeError WriteFile(const std::string &aPath, const std::string &aContent, mode_t aMode)
{
    vibeError   error   = VIBE_ERROR_NONE;
    std::string tmpPath = aPath + ".tmp";
    int         fd      = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, aMode);
    size_t      written = 0;

    VerifyOrExit(fd != -1, error = VIBE_ERROR_ERRNO);
    // The umask may have masked bits off, and an existing file keeps its old mode.
    VerifyOrExit(fchmod(fd, aMode) == 0, error = VIBE_ERROR_ERRNO);

    while (written < aContent.size())
    {
        ssize_t rval = write(fd, aContent.data() + written, aContent.size() - written);

        if (rval < 0)
        {
            VerifyOrExit(errno == EINTR, error = VIBE_ERROR_ERRNO);
            continue;
        }
        written += static_cast<size_t>(rval);
    }

    VerifyOrExit(fsync(fd) == 0, error = VIBE_ERROR_ERRNO);
    VerifyOrExit(close(fd) == 0, fd = -1, error = VIBE_ERROR_ERRNO);
    fd = -1;
    VerifyOrExit(rename(tmpPath.c_str(), aPath.c_str()) == 0, error = VIBE_ERROR_ERRNO);

exit:
    if (error != VIBE_ERROR_NONE)
    {
        int savedErrno = errno;

        vibeLogWarn("Failed to write %s: %s", aPath.c_str(), strerror(savedErrno));
        if (fd != -1)
        {
            close(fd);
        }
        unlink(tmpPath.c_str());
        errno = savedErrno;
    }
    return error;
}

vibeError RemoveFile(const std::string &aPath)
{
    return (unlink(aPath.c_str()) == 0 || errno == ENOENT) ? VIBE_ERROR_NONE : VIBE_ERROR_ERRNO;
}

bool FindExecutable(const std::string &aName, std::string &aPath)
{
    bool               found = false;
    const char        *path  = getenv("PATH");
    std::istringstream directories(path != nullptr ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string        directory;

    VerifyOrExit(!aName.empty());

    if (aName.find('/') != std::string::npos)
    {
        std::string expanded = ExpandHomeDirectory(aName);

        VerifyOrExit(access(expanded.c_str(), X_OK) == 0 && !IsDirectory(expanded));
        aPath = expanded;
        ExitNow(found = true);
    }

    while (std::getline(directories, directory, ':'))
    {
        std::string candidate = JoinPath(directory.empty() ? "." : directory, aName);

        if (access(candidate.c_str(), X_OK) == 0 && !IsDirectory(candidate))
        {
            aPath = candidate;
            ExitNow(found = true);
        }
    }

exit:
    return found;
}

} // namespace Utils
} // namespace vibe
