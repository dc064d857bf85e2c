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

#ifndef GUARD_HH
#define GUARD_HH

#include <functional>

/*!
 * Call a function when the guard object is destroyed.
 *
 * Used for completing D-Bus method invocations: the completion function is
 * wrapped into a #Guard which travels along with the command, and the
 * remote caller gets its answer as soon as the command object has been
 * consumed, no matter how it has been consumed (processed, rejected, or
 * thrown away on shutdown).
 *
 * \note
 *     The wrapped function must not throw exceptions.
 */
class Guard
{
  private:
    std::function<void()> fn_;

  public:
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard(Guard &&) = default;

    explicit Guard(std::function<void()> &&fn):
        fn_(std::move(fn))
    {}

    /*!
     * Forget the wrapped function without calling it.
     */
    void dismiss() { fn_ = nullptr; }

    ~Guard()
    {
        if(fn_ != nullptr)
            fn_();
    }
};

#endif /* !GUARD_HH */
