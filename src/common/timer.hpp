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
 *   This file includes definition for the one-shot Timer.
 */

#ifndef VIBE_COMMON_TIMER_HPP_
#define VIBE_COMMON_TIMER_HPP_

#include <functional>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/timer_scheduler.hpp"

namespace vibe {

/**
 * This class implements a one-shot timer fired from the mainloop.
 *
 * A timer is cancelled when it is stopped or destroyed, so the owner of a timer never needs to guard against a
 * callback running after the owner went away.
 *
 */
class Timer : private NonCopyable
{
public:
    friend class TimerScheduler;

    /**
     * This type represents the function bound to a Timer object.
     *
     */
    using Callback = std::function<void(Timer &aTimer)>;

    /**
     * This constructor binds the callback.
     *
     * @param  aCallback  A function to be called when the timer fires.
     *
     */
    explicit Timer(Callback aCallback)
        : mCallback(std::move(aCallback))
        , mFireTime(TimePoint::max())
        , mIsRunning(false)
    {
    }

    ~Timer(void) { Stop(); }

    /**
     * This method starts the timer with given delay.
     *
     * @param  aDelay  The delay which the timer will fire after.
     *
     */
    void Start(Duration aDelay) { Start(Clock::now() + aDelay); }

    /**
     * This method starts the timer with given fire time.
     *
     * A running timer is rescheduled.
     *
     * @param  aFireTime  The time point the timer will fire at.
     *
     */
    void Start(TimePoint aFireTime)
    {
        Stop();
        mFireTime  = aFireTime;
        mIsRunning = true;
        TimerScheduler::Get().Add(this);
    }

    /**
     * This method stops a timer.
     *
     */
    void Stop(void)
    {
        if (mIsRunning)
        {
            mIsRunning = false;
            TimerScheduler::Get().Remove(this);
        }
    }

    /**
     * This method devices if the timer is running.
     *
     * @returns A boolean indicates if the timer is running.
     *
     */
    bool IsRunning(void) const { return mIsRunning; }

    /**
     * this method returns the time point the timer will fire at.
     *
     * @returns The fire time point.
     *
     */
    TimePoint GetFireTime(void) const { return mFireTime; }

private:
    void Fire(void)
    {
        // The callback may restart or destroy this timer.
        mIsRunning = false;

        if (mCallback != nullptr)
        {
            mCallback(*this);
        }
    }

    Callback  mCallback;
    TimePoint mFireTime;
    bool      mIsRunning;
};

} // namespace vibe

#endif // VIBE_COMMON_TIMER_HPP_
