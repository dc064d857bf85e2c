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

#include <cstdarg>

/*
 * Prototypes for the dummies used in here.
 */
#include "rosesong_dbus.h"

#include "dbus_dummies.hh"

DBusCallLog dbus_call_log;

/*
 * Dummy for the linker.
 */
GQuark g_dbus_error_quark(void)
{
    return 1;
}

/*
 * Dummy for the linker.
 */
const gchar *g_dbus_method_invocation_get_sender(GDBusMethodInvocation *invocation)
{
    return ":1.23";
}

/*
 * Dummy for the linker.
 */
const gchar *g_dbus_method_invocation_get_method_name(GDBusMethodInvocation *invocation)
{
    return "Dummy";
}

void g_dbus_method_invocation_return_error(GDBusMethodInvocation *invocation,
                                           GQuark domain, gint code,
                                           const gchar *format, ...)
{
    va_list ap;
    va_start(ap, format);
    gchar *message = g_strdup_vprintf(format, ap);
    va_end(ap);

    dbus_call_log.errors_.emplace_back(code, std::string(message));
    g_free(message);
}

#define COMPLETE_DUMMY(NAME) \
    void tdbus_player_complete_ ## NAME(tdbusPlayer *object, \
                                        GDBusMethodInvocation *invocation) \
    { \
        dbus_call_log.completed_.emplace_back(#NAME); \
    }

COMPLETE_DUMMY(test_connection)
COMPLETE_DUMMY(play)
COMPLETE_DUMMY(pause)
COMPLETE_DUMMY(next)
COMPLETE_DUMMY(previous)
COMPLETE_DUMMY(stop)
COMPLETE_DUMMY(play_bvid)
COMPLETE_DUMMY(set_mode)
COMPLETE_DUMMY(playlist_change)
COMPLETE_DUMMY(playlist_is_empty)

#undef COMPLETE_DUMMY
