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
 * This file implements the Task Runner that executes tasks on the mainloop.
 */

#define VIBE_LOG_TAG "TASK"

#include "common/task_runner.hpp"

#include <algorithm>

#include <errno.h>
#include <string.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"

namespace vibe {

TaskRunner::TaskRunner(void)
    : mEventFd(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK))
{
    // We do not handle failures when creating the eventfd, simply die.
    VerifyOrDie(mEventFd != -1, strerror(errno));
}

TaskRunner::~TaskRunner(void)
{
    if (mEventFd != -1)
    {
        close(mEventFd);
        mEventFd = -1;
    }
}

void TaskRunner::Post(Task<void> aTask)
{
    const uint64_t kOne = 1;
    ssize_t        rval;

    {
        std::lock_guard<std::mutex> _(mTaskQueueMutex);

        mTaskQueue.push_back(std::move(aTask));
    }

    do
    {
        rval = write(mEventFd, &kOne, sizeof(kOne));
    } while (rval == -1 && errno == EINTR);

    // EAGAIN means the counter is saturated, so the mainloop is woken up anyway.
    VerifyOrDie(rval == sizeof(kOne) || errno == EAGAIN, strerror(errno));
}

size_t TaskRunner::GetPendingCount(void) const
{
    std::lock_guard<std::mutex> _(mTaskQueueMutex);

    return mTaskQueue.size();
}

void TaskRunner::Update(MainloopContext &aMainloop)
{
    FD_SET(mEventFd, &aMainloop.mReadFdSet);
    aMainloop.mMaxFd = std::max(mEventFd, aMainloop.mMaxFd);
}

void TaskRunner::Process(const MainloopContext &aMainloop)
{
    uint64_t count;

    VerifyOrExit(FD_ISSET(mEventFd, &aMainloop.mReadFdSet));

    if (read(mEventFd, &count, sizeof(count)) != sizeof(count) && errno != EAGAIN)
    {
        vibeLogWarn("Failed to read eventfd %d: %s", mEventFd, strerror(errno));
    }

    RunPendingTasks();

exit:
    return;
}

void TaskRunner::RunPendingTasks(void)
{
    std::deque<Task<void>> batch;

    // Tasks posted by a running task join the next batch of the same round.
    while (true)
    {
        {
            std::lock_guard<std::mutex> _(mTaskQueueMutex);

            VerifyOrExit(!mTaskQueue.empty());
            batch.swap(mTaskQueue);
        }

        while (!batch.empty())
        {
            Task<void> task = std::move(batch.front());

            batch.pop_front();
            task();
        }
    }

exit:
    return;
}

} // namespace vibe
