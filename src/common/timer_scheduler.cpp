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

#include "common/timer_scheduler.hpp"

#include "common/timer.hpp"

namespace vibe {

TimerScheduler &TimerScheduler::Get(void)
{
    static TimerScheduler sScheduler;
    return sScheduler;
}

void TimerScheduler::Add(Timer *aTimer)
{
    mSortedTimerList.remove(aTimer);

    for (auto it = mSortedTimerList.begin();; ++it)
    {
        if (it == mSortedTimerList.end() || (*it)->GetFireTime() > aTimer->GetFireTime())
        {
            mSortedTimerList.insert(it, aTimer);
            break;
        }
    }
}

void TimerScheduler::Remove(Timer *aTimer)
{
    mSortedTimerList.remove(aTimer);
    mExpiredTimerList.remove(aTimer);
}

TimePoint TimerScheduler::GetEarliestFireTime(void) const
{
    return mSortedTimerList.empty() ? TimePoint::max() : mSortedTimerList.front()->GetFireTime();
}

MicroSeconds TimerScheduler::Process(TimePoint aNow)
{
    while (!mSortedTimerList.empty() && mSortedTimerList.front()->GetFireTime() <= aNow)
    {
        mExpiredTimerList.push_back(mSortedTimerList.front());
        mSortedTimerList.pop_front();
    }

    // A callback may start, stop or destroy any other timer. Timers restarted by a callback
    // wait for the next round.
    while (!mExpiredTimerList.empty())
    {
        Timer *timer = mExpiredTimerList.front();

        mExpiredTimerList.pop_front();
        timer->Fire();
    }

    return mSortedTimerList.empty()
               ? MicroSeconds::max()
               : std::chrono::duration_cast<MicroSeconds>(mSortedTimerList.front()->GetFireTime() - aNow);
}

} // namespace vibe
