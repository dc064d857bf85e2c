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

#ifndef DBUS_HANDLERS_HH
#define DBUS_HANDLERS_HH

#include "command_queue.hh"

/*!
 * \addtogroup dbus_handlers DBus handlers for method calls
 * \ingroup dbus
 */
/*!@{*/

namespace DBus
{

/*!
 * Data used in all D-Bus method handlers.
 */
class HandlerData
{
  public:
    HandlerData(const HandlerData &) = delete;
    HandlerData &operator=(const HandlerData &) = delete;

    Player::CommandQueue &command_queue_;

    explicit HandlerData(Player::CommandQueue &command_queue):
        command_queue_(command_queue)
    {}
};

}

/*!@}*/

#endif /* !DBUS_HANDLERS_HH */
