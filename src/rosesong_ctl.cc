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

#include <iostream>
#include <cstring>
#include <cstdlib>

#include <gio/gio.h>

#include "rosesong_dbus.h"
#include "dbus_iface.h"
#include "playback_modes.hh"

static void usage(const char *program_name)
{
    std::cout <<
        "Usage: " << program_name << " [--system-dbus] <command> [argument]\n"
        "\n"
        "Commands:\n"
        "  play           Resume playback.\n"
        "  pause          Pause playback.\n"
        "  next           Skip to next track.\n"
        "  previous       Skip to previous track.\n"
        "  stop           Stop playback and terminate the daemon.\n"
        "  mode <mode>    Set play mode (Loop, Shuffle, Repeat).\n"
        "  jump <bvid>    Play track with given ID.\n"
        "  reload         Tell the daemon the playlist has changed.\n"
        "  empty          Tell the daemon the playlist is empty.\n"
        "  ping           Check whether the daemon is running.\n"
        ;
}

static bool report_result(gboolean ok, GError *&error, const char *what)
{
    if(ok)
        return true;

    std::cerr << what << " failed: "
              << (error != nullptr ? error->message : "unknown error") << "\n";
    g_clear_error(&error);

    return false;
}

static bool execute(tdbusPlayer *proxy, const char *command,
                    const char *argument)
{
    GError *error = nullptr;

    if(strcmp(command, "play") == 0)
        return report_result(tdbus_player_call_play_sync(proxy, nullptr, &error),
                             error, "Play");
    else if(strcmp(command, "pause") == 0)
        return report_result(tdbus_player_call_pause_sync(proxy, nullptr, &error),
                             error, "Pause");
    else if(strcmp(command, "next") == 0)
        return report_result(tdbus_player_call_next_sync(proxy, nullptr, &error),
                             error, "Next");
    else if(strcmp(command, "previous") == 0)
        return report_result(tdbus_player_call_previous_sync(proxy, nullptr, &error),
                             error, "Previous");
    else if(strcmp(command, "stop") == 0)
        return report_result(tdbus_player_call_stop_sync(proxy, nullptr, &error),
                             error, "Stop");
    else if(strcmp(command, "reload") == 0)
        return report_result(tdbus_player_call_playlist_change_sync(proxy, nullptr, &error),
                             error, "Reload");
    else if(strcmp(command, "empty") == 0)
        return report_result(tdbus_player_call_playlist_is_empty_sync(proxy, nullptr, &error),
                             error, "Empty");
    else if(strcmp(command, "ping") == 0)
    {
        std::cout << "daemon is running\n";
        return true;
    }
    else if(strcmp(command, "mode") == 0)
    {
        Playlist::Mode mode;

        if(argument == nullptr || !Playlist::mode_from_string(argument, mode))
        {
            std::cerr << "Command \"mode\" requires one of Loop, Shuffle, Repeat.\n";
            return false;
        }

        return report_result(tdbus_player_call_set_mode_sync(proxy, argument,
                                                             nullptr, &error),
                             error, "SetMode");
    }
    else if(strcmp(command, "jump") == 0)
    {
        if(argument == nullptr || argument[0] == '\0')
        {
            std::cerr << "Command \"jump\" requires a track ID.\n";
            return false;
        }

        return report_result(tdbus_player_call_play_bvid_sync(proxy, argument,
                                                              nullptr, &error),
                             error, "PlayBvid");
    }

    std::cerr << "Unknown command \"" << command << "\". Please try --help.\n";

    return false;
}

int main(int argc, char *argv[])
{
    GBusType bus_type = G_BUS_TYPE_SESSION;
    int i = 1;

    if(i < argc && strcmp(argv[i], "--system-dbus") == 0)
    {
        bus_type = G_BUS_TYPE_SYSTEM;
        ++i;
    }

    if(i >= argc || strcmp(argv[i], "--help") == 0)
    {
        usage(argv[0]);
        return i >= argc ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if(strcmp(argv[i], "--version") == 0)
    {
        std::cout << PACKAGE_STRING << "\n";
        return EXIT_SUCCESS;
    }

    const char *command = argv[i];
    const char *argument = i + 1 < argc ? argv[i + 1] : nullptr;

    GError *error = nullptr;
    tdbusPlayer *proxy =
        tdbus_player_proxy_new_for_bus_sync(bus_type,
                                            G_DBUS_PROXY_FLAGS_DO_NOT_LOAD_PROPERTIES,
                                            ROSESONG_DBUS_SERVICE_NAME,
                                            ROSESONG_DBUS_OBJECT_PATH,
                                            nullptr, &error);

    if(proxy == nullptr)
    {
        std::cerr << "daemon not running ("
                  << (error != nullptr ? error->message : "no bus") << ")\n";
        g_clear_error(&error);
        return EXIT_FAILURE;
    }

    if(!tdbus_player_call_test_connection_sync(proxy, nullptr, &error))
    {
        std::cerr << "daemon not running\n";
        g_clear_error(&error);
        g_object_unref(proxy);
        return EXIT_FAILURE;
    }

    const bool ok = execute(proxy, command, argument);

    g_object_unref(proxy);

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
