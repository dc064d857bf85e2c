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

#ifndef DBUS_IFACE_H
#define DBUS_IFACE_H

#include <stdbool.h>
#include <glib.h>

/*!
 * \addtogroup dbus DBus handling
 */
/*!@{*/

#define ROSESONG_DBUS_SERVICE_NAME  "org.rosesong.Player"
#define ROSESONG_DBUS_OBJECT_PATH   "/org/rosesong/Player"

#ifdef __cplusplus
extern "C" {
#endif

/*!
 * Connect to D-Bus, export player object, acquire service name.
 *
 * This function iterates the default main context until the bus name has
 * been acquired or lost.
 *
 * \param loop
 *     The main loop, quit when the bus name is lost later on.
 *
 * \param connect_to_session_bus
 *     Use session bus if true, system bus otherwise.
 *
 * \param dbus_handler_data
 *     Pointer to a \c DBus::HandlerData object, passed to all method
 *     handlers.
 *
 * \returns
 *     0 on success, -1 if the name could not be acquired.
 */
int dbus_setup(GMainLoop *loop, bool connect_to_session_bus,
               void *dbus_handler_data);

void dbus_shutdown(void);

#ifdef __cplusplus
}
#endif

/*!@}*/

#endif /* !DBUS_IFACE_H */
