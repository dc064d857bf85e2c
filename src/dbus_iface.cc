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

#if HAVE_CONFIG_H
#include <config.h>
#endif /* HAVE_CONFIG_H */

#include <cstring>
#include <gio/gio.h>

#include "dbus_iface.h"
#include "dbus_handlers.h"
#include "dbus_common.h"
#include "messages.h"

struct dbus_data_t
{
    GMainLoop *loop;
    guint owner_id;
    int acquired;
    bool export_failed;
    tdbusPlayer *player_iface;
    void *handler_data;
};

static void bus_acquired(GDBusConnection *connection,
                         const gchar *name, gpointer user_data)
{
    auto *data = static_cast<struct dbus_data_t *>(user_data);

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "D-Bus \"%s\" acquired", name);

    data->player_iface = tdbus_player_skeleton_new();

    g_signal_connect(data->player_iface, "handle-test-connection",
                     G_CALLBACK(dbusmethod_player_test_connection), data->handler_data);
    g_signal_connect(data->player_iface, "handle-play",
                     G_CALLBACK(dbusmethod_player_play), data->handler_data);
    g_signal_connect(data->player_iface, "handle-pause",
                     G_CALLBACK(dbusmethod_player_pause), data->handler_data);
    g_signal_connect(data->player_iface, "handle-next",
                     G_CALLBACK(dbusmethod_player_next), data->handler_data);
    g_signal_connect(data->player_iface, "handle-previous",
                     G_CALLBACK(dbusmethod_player_previous), data->handler_data);
    g_signal_connect(data->player_iface, "handle-stop",
                     G_CALLBACK(dbusmethod_player_stop), data->handler_data);
    g_signal_connect(data->player_iface, "handle-play-bvid",
                     G_CALLBACK(dbusmethod_player_play_bvid), data->handler_data);
    g_signal_connect(data->player_iface, "handle-set-mode",
                     G_CALLBACK(dbusmethod_player_set_mode), data->handler_data);
    g_signal_connect(data->player_iface, "handle-playlist-change",
                     G_CALLBACK(dbusmethod_player_playlist_change), data->handler_data);
    g_signal_connect(data->player_iface, "handle-playlist-is-empty",
                     G_CALLBACK(dbusmethod_player_playlist_is_empty), data->handler_data);

    GError *error = NULL;
    g_dbus_interface_skeleton_export(G_DBUS_INTERFACE_SKELETON(data->player_iface),
                                     connection, ROSESONG_DBUS_OBJECT_PATH, &error);
    if(dbus_common_handle_error(&error, "Export player interface") < 0)
        data->export_failed = true;
}

static void name_acquired(GDBusConnection *connection,
                          const gchar *name, gpointer user_data)
{
    auto *data = static_cast<struct dbus_data_t *>(user_data);

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "D-Bus name \"%s\" acquired", name);
    data->acquired = 1;
}

static void name_lost(GDBusConnection *connection,
                      const gchar *name, gpointer user_data)
{
    auto *data = static_cast<struct dbus_data_t *>(user_data);

    if(data->acquired == 0)
    {
        msg_error(0, LOG_EMERG,
                  "D-Bus name \"%s\" not acquired, daemon already running?",
                  name);
        data->acquired = -1;
        return;
    }

    msg_error(0, LOG_EMERG, "D-Bus name \"%s\" lost", name);
    data->acquired = -1;
    g_main_loop_quit(data->loop);
}

static struct dbus_data_t dbus_data;

int dbus_setup(GMainLoop *loop, bool connect_to_session_bus,
               void *dbus_handler_data)
{
    memset(&dbus_data, 0, sizeof(dbus_data));

    dbus_data.loop = loop;
    dbus_data.handler_data = dbus_handler_data;

    GBusType bus_type =
        connect_to_session_bus ? G_BUS_TYPE_SESSION : G_BUS_TYPE_SYSTEM;

    dbus_data.owner_id =
        g_bus_own_name(bus_type, ROSESONG_DBUS_SERVICE_NAME,
                       G_BUS_NAME_OWNER_FLAGS_NONE,
                       bus_acquired, name_acquired, name_lost, &dbus_data,
                       NULL);

    while(dbus_data.acquired == 0)
    {
        /* do whatever has to be done behind the scenes until one of the
         * guaranteed callbacks gets called */
        g_main_context_iteration(NULL, TRUE);
    }

    if(dbus_data.acquired < 0 || dbus_data.export_failed)
    {
        dbus_shutdown();
        return -1;
    }

    return 0;
}

void dbus_shutdown(void)
{
    if(dbus_data.owner_id == 0)
        return;

    g_bus_unown_name(dbus_data.owner_id);
    dbus_data.owner_id = 0;

    if(dbus_data.player_iface != NULL)
    {
        g_dbus_interface_skeleton_unexport(G_DBUS_INTERFACE_SKELETON(dbus_data.player_iface));
        g_object_unref(dbus_data.player_iface);
        dbus_data.player_iface = NULL;
    }
}
