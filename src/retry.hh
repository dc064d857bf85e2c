/*
 * Copyright (C) 2024  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of Rosesong.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#ifndef RETRY_HH
#define RETRY_HH

#include <chrono>
#include <algorithm>
#include <functional>

namespace Retry
{

/*!
 * Bounded exponential backoff.
 */
class Policy
{
  public:
    const unsigned int max_attempts_;
    const std::chrono::milliseconds initial_delay_;
    const unsigned int multiplier_;

    /*! Upper bound for delays, zero means unlimited. */
    const std::chrono::milliseconds max_delay_;

    explicit Policy(unsigned int max_attempts,
                    std::chrono::milliseconds initial_delay,
                    unsigned int multiplier,
                    std::chrono::milliseconds max_delay = std::chrono::milliseconds::zero()):
        max_attempts_(max_attempts > 0 ? max_attempts : 1),
        initial_delay_(initial_delay),
        multiplier_(multiplier > 0 ? multiplier : 1),
        max_delay_(max_delay)
    {}

    /*!
     * Delay to wait after the given failed attempt (counting from 1).
     *
     * Without an upper bound, the delay saturates at the largest
     * representable value.
     */
    std::chrono::milliseconds delay_after_attempt(unsigned int attempt) const
    {
        const std::chrono::milliseconds limit =
            max_delay_ > max_delay_.zero() ? max_delay_ : std::chrono::milliseconds::max();

        std::chrono::milliseconds delay = std::min(initial_delay_, limit);

        if(multiplier_ < 2)
            return delay;

        for(unsigned int i = 1; i < attempt && delay < limit; ++i)
        {
            if(delay.count() > limit.count() / multiplier_)
                return limit;

            delay *= multiplier_;
        }

        return delay;
    }
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

/*!
 * Call \p attempt_fn until it succeeds or the attempts are used up.
 *
 * \param policy
 *     Attempt count and delays.
 *
 * \param attempt_fn
 *     Function object taking the attempt number (counting from 1) and a
 *     reference to the result object. Returns true on success.
 *
 * \param sleep_fn
 *     Called between failed attempts. It is not called after the last
 *     attempt.
 *
 * \param result
 *     Result filled in by a successful attempt.
 *
 * \returns
 *     True if one of the attempts succeeded, false if all attempts failed.
 */
template <typename T, typename AttemptFn>
static bool run(const Policy &policy, const AttemptFn &attempt_fn,
                const SleepFn &sleep_fn, T &result)
{
    for(unsigned int attempt = 1; attempt <= policy.max_attempts_; ++attempt)
    {
        if(attempt_fn(attempt, result))
            return true;

        if(attempt < policy.max_attempts_ && sleep_fn != nullptr)
            sleep_fn(policy.delay_after_attempt(attempt));
    }

    return false;
}

}

#endif /* !RETRY_HH */
