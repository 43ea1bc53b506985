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
 *   This file includes definitions for the network I/O thread.
 */

#ifndef VIBE_TRANSPORT_IO_THREAD_HPP_
#define VIBE_TRANSPORT_IO_THREAD_HPP_

#include "vibe-agent/config.h"

#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "common/code_utils.hpp"

namespace vibe {

/**
 * This class runs one Boost.Asio io_context on a dedicated thread.
 *
 * The io_context is run by exactly one thread, so handlers never run concurrently with each other.
 *
 */
class IoThread : private NonCopyable
{
public:
    IoThread(void);
    ~IoThread(void);

    boost::asio::io_context &GetContext(void) { return mContext; }

    /**
     * This method starts the thread.
     *
     */
    void Start(void);

    /**
     * This method stops the io_context and joins the thread, abandoning pending handlers.
     *
     */
    void Stop(void);

    bool IsRunning(void) const { return mThread.joinable(); }

private:
    typedef boost::asio::executor_work_guard<boost::asio::io_context::executor_type> WorkGuard;

    void Run(void);

    boost::asio::io_context mContext;
    WorkGuard               mWorkGuard;
    std::thread             mThread;
};

} // namespace vibe

#endif // VIBE_TRANSPORT_IO_THREAD_HPP_
