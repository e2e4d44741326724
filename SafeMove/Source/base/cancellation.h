// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef CANCELLATION_H_2390847502983745
#define CANCELLATION_H_2390847502983745

#include <atomic>


namespace sm
{
/*  cooperative stop request: set asynchronously (signal handler, other thread),
    observed by the migration only between two journal commits => every entry stays in a resumable stage */
class CancellationToken
{
public:
    void requestStop() noexcept { stopRequested_ = true; } //async-signal-safe
    bool stopRequested() const noexcept { return stopRequested_; }

private:
    static_assert(std::atomic<bool>::is_always_lock_free); //required for use in a signal handler

    std::atomic<bool> stopRequested_{false};
};
}

#endif //CANCELLATION_H_2390847502983745
