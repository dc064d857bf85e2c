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

#ifndef DBUS_HANDLERS_H
#define DBUS_HANDLERS_H

#include <gio/gio.h>

#include "rosesong_dbus.h"

/*!
 * \addtogroup dbus_handlers
 */
/*!@{*/

#ifdef __cplusplus
extern "C" {
#endif

gboolean dbusmethod_player_test_connection(tdbusPlayer *object,
                                           GDBusMethodInvocation *invocation,
                                           gpointer user_data);
gboolean dbusmethod_player_play(tdbusPlayer *object,
                                GDBusMethodInvocation *invocation,
                                gpointer user_data);
gboolean dbusmethod_player_pause(tdbusPlayer *object,
                                 GDBusMethodInvocation *invocation,
                                 gpointer user_data);
gboolean dbusmethod_player_next(tdbusPlayer *object,
                                GDBusMethodInvocation *invocation,
                                gpointer user_data);
gboolean dbusmethod_player_previous(tdbusPlayer *object,
                                    GDBusMethodInvocation *invocation,
                                    gpointer user_data);
gboolean dbusmethod_player_stop(tdbusPlayer *object,
                                GDBusMethodInvocation *invocation,
                                gpointer user_data);
gboolean dbusmethod_player_play_bvid(tdbusPlayer *object,
                                     GDBusMethodInvocation *invocation,
                                     const gchar *bvid, gpointer user_data);
gboolean dbusmethod_player_set_mode(tdbusPlayer *object,
                                    GDBusMethodInvocation *invocation,
                                    const gchar *mode, gpointer user_data);
gboolean dbusmethod_player_playlist_change(tdbusPlayer *object,
                                           GDBusMethodInvocation *invocation,
                                           gpointer user_data);
gboolean dbusmethod_player_playlist_is_empty(tdbusPlayer *object,
                                             GDBusMethodInvocation *invocation,
                                             gpointer user_data);

#ifdef __cplusplus
}
#endif

/*!@}*/

#endif /* !DBUS_HANDLERS_H */
