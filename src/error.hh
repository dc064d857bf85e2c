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

#ifndef ERROR_HH
#define ERROR_HH

#include <string>

/*!
 * \addtogroup errors Error handling
 *
 * Exception thrown by the playback core.
 */
/*!@{*/

namespace Error
{

enum class Code
{
    NETWORK,
    IO,
    DATA_PARSING,
    EMPTY_PLAYLIST,
    INDEX_OUT_OF_BOUNDS,
    FETCH,
    PIPELINE_STATE,
    PIPELINE_ELEMENT,
    PIPELINE_LINK,
    INIT,
    DBUS,

    LAST_CODE = DBUS,
};

const char *code_to_string(Code code);

class Error
{
  private:
    const Code code_;
    const std::string message_;

  public:
    Error(const Error &) = default;
    Error &operator=(const Error &) = delete;
    Error(Error &&) = default;

    explicit Error(Code code, std::string &&message):
        code_(code),
        message_(std::move(message))
    {}

    explicit Error(Code code, const char *message):
        code_(code),
        message_(message)
    {}

    Code get() const noexcept { return code_; }

    const char *what() const noexcept { return message_.c_str(); }
};

}

/*!@}*/

#endif /* !ERROR_HH */
