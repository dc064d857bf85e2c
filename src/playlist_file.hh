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

#ifndef PLAYLIST_FILE_HH
#define PLAYLIST_FILE_HH

#include <vector>
#include <string>

#include "track.hh"

namespace Playlist
{

namespace File
{

/*!
 * Parse playlist from string.
 *
 * \throws Error::Error
 *     With code #Error::Code::EMPTY_PLAYLIST if the document contains no
 *     tracks at all (this includes empty and whitespace-only input), or
 *     with code #Error::Code::DATA_PARSING if the document is malformed.
 *     Partial results are never returned.
 */
std::vector<Track> parse(const std::string &content);

/*!
 * Read and parse playlist file.
 *
 * \throws Error::Error
 *     With code #Error::Code::IO if the file cannot be read, see also
 *     #Playlist::File::parse().
 */
std::vector<Track> load(const std::string &path);

}

}

#endif /* !PLAYLIST_FILE_HH */
