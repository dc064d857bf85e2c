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

#include <exception>
#include <glib.h>

#include "main_context.hh"
#include "messages.h"

static gboolean do_call_in_main_context(gpointer user_data)
{
    auto *fn = static_cast<std::function<void()> *>(user_data);
    msg_log_assert(fn != nullptr);

    try
    {
        (*fn)();
    }
    catch(const std::exception &e)
    {
        msg_error(0, LOG_ERR, "Exception in deferred call: %s", e.what());
    }

    return G_SOURCE_REMOVE;
}

static void do_call_in_main_context_dtor(gpointer user_data)
{
    auto *fn = static_cast<std::function<void()> *>(user_data);
    delete fn;
}

void MainContext::deferred_call(std::function<void()> *fn_object,
                                bool allow_direct_call)
{
    if(fn_object == nullptr)
    {
        msg_out_of_memory("function object");
        return;
    }

    if(allow_direct_call)
        g_main_context_invoke_full(NULL, G_PRIORITY_DEFAULT,
                                   do_call_in_main_context, fn_object,
                                   do_call_in_main_context_dtor);
    else
    {
        GSource *const source = g_idle_source_new();

        g_source_set_priority(source, G_PRIORITY_DEFAULT);
        g_source_set_callback(source, do_call_in_main_context, fn_object,
                              do_call_in_main_context_dtor);
        g_source_attach(source, g_main_context_default());
        g_source_unref(source);
    }
}
