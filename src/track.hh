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

#ifndef TRACK_HH
#define TRACK_HH

#include <string>

namespace Playlist
{

/*!
 * Identification of a single playable stream, plus some optional meta data.
 *
 * The \c bvid_ is the primary ID of the video resource, the \c cid_ selects
 * the sub-stream within that resource. Tracks are compared by primary ID
 * only. Tracks are never modified after the playlist has been parsed.
 */
class Track
{
  public:
    std::string bvid_;
    std::string cid_;
    std::string title_;
    std::string owner_;

    explicit Track(std::string &&bvid, std::string &&cid,
                   std::string &&title = "", std::string &&owner = ""):
        bvid_(std::move(bvid)),
        cid_(std::move(cid)),
        title_(std::move(title)),
        owner_(std::move(owner))
    {}

    explicit Track(const char *bvid, const char *cid):
        bvid_(bvid),
        cid_(cid)
    {}

    bool has_id(const std::string &bvid) const { return bvid_ == bvid; }

    /*!
     * Short string for log messages.
     */
    std::string get_description() const
    {
        std::string result(bvid_);
        result += '/';
        result += cid_;

        if(!title_.empty())
        {
            result += " \"";
            result += title_;
            result += '"';
        }

        return result;
    }
};

}

#endif /* !TRACK_HH */
