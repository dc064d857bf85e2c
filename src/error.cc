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

#include <array>

#include "error.hh"

const char *Error::code_to_string(Code code)
{
    static const std::array<const char *const,
                            size_t(Code::LAST_CODE) + 1> names
    {
        "Network",
        "I/O",
        "DataParsing",
        "EmptyPlaylist",
        "IndexOutOfBounds",
        "Fetch",
        "PipelineState",
        "PipelineElement",
        "PipelineLink",
        "Init",
        "DBus",
    };

    static_assert(names.size() == size_t(Code::LAST_CODE) + 1,
                  "Array has wrong size");

    const size_t idx = size_t(code);

    return idx < names.size() ? names[idx] : "Unknown";
}
