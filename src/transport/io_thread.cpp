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

#define VIBE_LOG_TAG "IO"

#include "transport/io_thread.hpp"

#include <exception>

namespace vibe {

IoThread::IoThread(void)
    : mContext(1)
    , mWorkGuard(boost::asio::make_work_guard(mContext))
{
}

IoThread::~IoThread(void)
{
    Stop();
}

void IoThread::Start(void)
{
    VerifyOrExit(!mThread.joinable());

    mThread = std::thread(&IoThread::Run, this);

exit:
    return;
}

void IoThread::Stop(void)
{
    VerifyOrExit(mThread.joinable());

    mWorkGuard.reset();
    mContext.stop();
    mThread.join();
    vibeLogInfo("I/O thread stopped");

exit:
    return;
}

void IoThread::Run(void)
{
    vibeLogInfo("I/O thread started");

    while (!mContext.stopped())
    {
        try
        {
            mContext.run();
        } catch (const std::exception &e)
        {
            vibeLogCrit("Unhandled exception in I/O handler: %s", e.what());
        }
    }
}

} // namespace vibe
