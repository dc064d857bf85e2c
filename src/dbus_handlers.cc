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

#include "dbus_handlers.h"
#include "dbus_handlers.hh"
#include "messages.h"

static void enter_player_handler(GDBusMethodInvocation *invocation)
{
    static const char iface_name[] = "org.rosesong.Player";

    msg_vinfo(MESSAGE_LEVEL_TRACE, "%s method invocation from '%s': %s",
              iface_name, g_dbus_method_invocation_get_sender(invocation),
              g_dbus_method_invocation_get_method_name(invocation));
}

/*!
 * Queue command, complete invocation when the command is taken.
 *
 * If the command cannot be queued, then the invocation is completed with an
 * error right away.
 */
static gboolean post_command(std::unique_ptr<Player::Command> command,
                             std::function<void()> &&complete,
                             GDBusMethodInvocation *invocation,
                             gpointer user_data)
{
    auto *data = static_cast<DBus::HandlerData *>(user_data);

    command->set_completion(std::move(complete));

    const auto id = command->id_;

    switch(data->command_queue_.post(command))
    {
      case Player::CommandQueue::PostResult::OK:
        break;

      case Player::CommandQueue::PostResult::FULL:
        command->dismiss_completion();
        msg_error(0, LOG_NOTICE, "Command queue full, rejecting %s",
                  Player::command_to_string(id));
        g_dbus_method_invocation_return_error(invocation,
                                              G_DBUS_ERROR,
                                              G_DBUS_ERROR_LIMITS_EXCEEDED,
                                              "Too many pending commands");
        break;

      case Player::CommandQueue::PostResult::SHUT_DOWN:
        command->dismiss_completion();
        g_dbus_method_invocation_return_error(invocation,
                                              G_DBUS_ERROR,
                                              G_DBUS_ERROR_FAILED,
                                              "Shutting down");
        break;
    }

    return TRUE;
}

gboolean dbusmethod_player_test_connection(tdbusPlayer *object,
                                           GDBusMethodInvocation *invocation,
                                           gpointer user_data)
{
    enter_player_handler(invocation);
    tdbus_player_complete_test_connection(object, invocation);
    return TRUE;
}

#define SIMPLE_COMMAND_HANDLER(NAME, ID) \
    gboolean dbusmethod_player_ ## NAME(tdbusPlayer *object, \
                                        GDBusMethodInvocation *invocation, \
                                        gpointer user_data) \
    { \
        enter_player_handler(invocation); \
        return post_command(Player::Command::make(Player::CommandID::ID), \
                            [object, invocation] \
                            { tdbus_player_complete_ ## NAME(object, invocation); }, \
                            invocation, user_data); \
    }

SIMPLE_COMMAND_HANDLER(play, PLAY)
SIMPLE_COMMAND_HANDLER(pause, PAUSE)
SIMPLE_COMMAND_HANDLER(next, NEXT)
SIMPLE_COMMAND_HANDLER(previous, PREVIOUS)
SIMPLE_COMMAND_HANDLER(stop, STOP)
SIMPLE_COMMAND_HANDLER(playlist_change, RELOAD_PLAYLIST)
SIMPLE_COMMAND_HANDLER(playlist_is_empty, PLAYLIST_BECAME_EMPTY)

#undef SIMPLE_COMMAND_HANDLER

gboolean dbusmethod_player_play_bvid(tdbusPlayer *object,
                                     GDBusMethodInvocation *invocation,
                                     const gchar *bvid, gpointer user_data)
{
    enter_player_handler(invocation);

    if(bvid == nullptr || bvid[0] == '\0')
    {
        g_dbus_method_invocation_return_error(invocation,
                                              G_DBUS_ERROR,
                                              G_DBUS_ERROR_INVALID_ARGS,
                                              "Empty track ID");
        return TRUE;
    }

    return post_command(Player::Command::make_jump(bvid),
                        [object, invocation]
                        { tdbus_player_complete_play_bvid(object, invocation); },
                        invocation, user_data);
}

gboolean dbusmethod_player_set_mode(tdbusPlayer *object,
                                    GDBusMethodInvocation *invocation,
                                    const gchar *mode, gpointer user_data)
{
    enter_player_handler(invocation);

    Playlist::Mode parsed_mode;

    if(!Playlist::mode_from_string(mode, parsed_mode))
    {
        g_dbus_method_invocation_return_error(invocation,
                                              G_DBUS_ERROR,
                                              G_DBUS_ERROR_INVALID_ARGS,
                                              "Invalid play mode \"%s\"", mode);
        return TRUE;
    }

    return post_command(Player::Command::make_set_mode(parsed_mode),
                        [object, invocation]
                        { tdbus_player_complete_set_mode(object, invocation); },
                        invocation, user_data);
}
