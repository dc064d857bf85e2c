/*
 * Copyright (C) 2015, 2016, 2019, 2024  T+A elektroakustik GmbH & Co. KG
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

#ifndef MESSAGES_H
#define MESSAGES_H

#include <stdbool.h>
#include <syslog.h>

#include "os.h"

/*!
 * \addtogroup messages Logging
 */
/*!@{*/

/*!
 * Verbosity levels for #msg_vinfo().
 *
 * Messages are emitted if their level is less than or equal to the level
 * configured by #msg_set_verbose_level().
 */
enum MessageVerboseLevel
{
    MESSAGE_LEVEL_IMPOSSIBLE = -2,
    MESSAGE_LEVEL_QUIET = -1,
    MESSAGE_LEVEL_IMPORTANT = 0,
    MESSAGE_LEVEL_NORMAL,
    MESSAGE_LEVEL_DIAG,
    MESSAGE_LEVEL_DEBUG,
    MESSAGE_LEVEL_TRACE,

    MESSAGE_LEVEL_MIN = MESSAGE_LEVEL_QUIET,
    MESSAGE_LEVEL_MAX = MESSAGE_LEVEL_TRACE,
};

#ifdef __cplusplus
extern "C" {
#endif

/*!
 * Whether or not to make use of syslog.
 */
void msg_enable_syslog(bool enable_syslog);

/*!
 * Set verbosity of #msg_vinfo() messages.
 *
 * \returns The previous verbosity level.
 */
enum MessageVerboseLevel msg_set_verbose_level(enum MessageVerboseLevel level);

enum MessageVerboseLevel msg_get_verbose_level(void);

/*!
 * Whether or not messages of given level would be emitted.
 */
bool msg_is_verbose(enum MessageVerboseLevel level);

/*!
 * Map level name to level.
 *
 * \returns #MESSAGE_LEVEL_IMPOSSIBLE if the name is unknown.
 */
enum MessageVerboseLevel msg_verbose_level_name_to_level(const char *name);

/*!
 * NULL-terminated list of known verbosity level names.
 */
const char *const *msg_get_verbose_level_names(void);

/*!
 * Emit error to syslog if enabled, to stderr otherwise.
 *
 * \param error_code The current error code as stored in errno.
 * \param priority A log priority as expected by syslog(3).
 * \param error_format Format string followed by arguments.
 */
void msg_error(int error_code, int priority, const char *error_format, ...)
    __attribute__ ((format (printf, 3, 4)));

/*!
 * Emit log informative message to stderr and syslog.
 */
void msg_info(const char *format_string, ...)
    __attribute__ ((format (printf, 1, 2)));

/*!
 * Emit informative message if verbosity permits it.
 */
void msg_vinfo(enum MessageVerboseLevel level, const char *format_string, ...)
    __attribute__ ((format (printf, 2, 3)));

void msg_out_of_memory(const char *what);

#ifdef __cplusplus
}
#endif

#define MSG_BUG(...) msg_error(0, LOG_CRIT, "BUG: " __VA_ARGS__)

#ifdef NDEBUG
#define msg_log_assert(EXPR) do {} while(0)
#else /* !NDEBUG */
#define msg_log_assert(EXPR) \
    do \
    { \
        if(!(EXPR)) \
        { \
            msg_error(0, LOG_EMERG, "Assertion failed at %s:%d: " #EXPR, \
                      __FILE__, __LINE__); \
            os_abort(); \
        } \
    } \
    while(0)
#endif /* NDEBUG */

/*!@}*/

#endif /* !MESSAGES_H */
