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
 *   This file includes definition for the Timer Scheduler.
 */

#ifndef VIBE_COMMON_TIMER_SCHEDULER_HPP_
#define VIBE_COMMON_TIMER_SCHEDULER_HPP_

#include <list>

#include "common/time.hpp"

namespace vibe {

class Timer;

/**
 * This class implements the Timer Scheduler which fires expired timers in the mainloop.
 *
 */
class TimerScheduler
{
public:
    /**
     * This method returns the singleton.
     *
     */
    static TimerScheduler &Get(void);

    /**
     * This method adds a timer to the scheduler.
     *
     * @param[in] aTimer  The timer to be scheduled.
     *
     */
    void Add(Timer *aTimer);

    /**
     * This method removes a timer from the scheduler.
     *
     * @param[in] aTimer  The timer to be removed.
     *
     */
    void Remove(Timer *aTimer);

    /**
     * This method returns the earliest fire time of all running timers.
     *
     * @returns The earliest fire time, or TimePoint::max() when no timer is running.
     *
     */
    TimePoint GetEarliestFireTime(void) const;

    /**
     * This method fires every timer whose fire time is not later than @p aNow.
     *
     * Tests drive time by passing a time point in the future.
     *
     * @param[in] aNow  The current time point.
     *
     * @returns The delay until the next timer fires.
     *
     */
    MicroSeconds Process(TimePoint aNow);

private:
    TimerScheduler(void) = default;

    std::list<Timer *> mSortedTimerList;
    std::list<Timer *> mExpiredTimerList;
};

} // namespace vibe

#endif // VIBE_COMMON_TIMER_SCHEDULER_HPP_
