/*
 * Copyright (C) 2015, 2024  T+A elektroakustik GmbH & Co. KG
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

#ifndef OS_H
#define OS_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

void os_abort(void);

/*!
 * Create directory and all its missing parents.
 *
 * \returns True on success or if the directory exists already.
 */
bool os_mkdir_hierarchy(const char *path);

/*!
 * Create an empty regular file if there is no file at given path.
 *
 * \returns True on success or if the file exists already.
 */
bool os_touch_file_if_missing(const char *path);

#ifdef __cplusplus
}
#endif

#endif /* !OS_H */
