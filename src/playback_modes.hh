/*
 * Copyright (C) 2017, 2024  T+A elektroakustik GmbH & Co. KG
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

#ifndef PLAYBACK_MODES_HH
#define PLAYBACK_MODES_HH

#include <cstring>

namespace Playlist
{

enum class Mode
{
    LOOP,
    SHUFFLE,
    SINGLE_REPEAT,

    LAST_MODE = SINGLE_REPEAT,
};

/*!
 * Names of modes as used on D-Bus and in the configuration file.
 */
static inline const char *mode_to_string(Mode mode)
{
    switch(mode)
    {
      case Mode::LOOP:
        return "Loop";

      case Mode::SHUFFLE:
        return "Shuffle";

      case Mode::SINGLE_REPEAT:
        return "Repeat";
    }

    return "(invalid)";
}

/*!
 * Parse mode name.
 *
 * \returns True if the name is known, false otherwise (in which case
 *     \p mode is left untouched).
 */
static inline bool mode_from_string(const char *name, Mode &mode)
{
    if(name == nullptr)
        return false;

    if(strcmp(name, "Loop") == 0)
        mode = Mode::LOOP;
    else if(strcmp(name, "Shuffle") == 0)
        mode = Mode::SHUFFLE;
    else if(strcmp(name, "Repeat") == 0 || strcmp(name, "SingleRepeat") == 0)
        mode = Mode::SINGLE_REPEAT;
    else
        return false;

    return true;
}

}

#endif /* !PLAYBACK_MODES_HH */
