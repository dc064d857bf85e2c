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

#ifndef DBUS_DUMMIES_HH
#define DBUS_DUMMIES_HH

#include <string>
#include <vector>

#include <glib.h>

/*!
 * What the D-Bus dummies have been called for.
 */
class DBusCallLog
{
  public:
    class ErrorReturn
    {
      public:
        const gint code_;
        const std::string message_;

        explicit ErrorReturn(gint code, std::string &&message):
            code_(code),
            message_(std::move(message))
        {}
    };

    std::vector<std::string> completed_;
    std::vector<ErrorReturn> errors_;

    void clear()
    {
        completed_.clear();
        errors_.clear();
    }
};

extern DBusCallLog dbus_call_log;

#endif /* !DBUS_DUMMIES_HH */
