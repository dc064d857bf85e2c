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

#include <algorithm>
#include <cctype>
#include <glib.h>
#include <nlohmann/json.hpp>

#include "playlist_file.hh"
#include "error.hh"
#include "messages.h"

using json = nlohmann::json;

static bool is_blank(const std::string &content)
{
    return std::all_of(content.begin(), content.end(),
                       [] (char ch) { return isspace(static_cast<unsigned char>(ch)); });
}

static std::string get_id_field(const json &entry, const char *key, size_t idx)
{
    const auto it = entry.find(key);

    if(it == entry.end())
        throw Error::Error(Error::Code::DATA_PARSING,
                           "Track " + std::to_string(idx) +
                           " has no field \"" + key + "\"");

    if(it->is_string())
    {
        auto result(it->get<std::string>());

        if(result.empty())
            throw Error::Error(Error::Code::DATA_PARSING,
                               "Track " + std::to_string(idx) +
                               " has empty field \"" + key + "\"");

        return result;
    }

    if(it->is_number_unsigned())
        return std::to_string(it->get<uint64_t>());

    throw Error::Error(Error::Code::DATA_PARSING,
                       "Track " + std::to_string(idx) +
                       " has field \"" + key + "\" of wrong type");
}

static std::string get_optional_string(const json &entry, const char *key)
{
    const auto it = entry.find(key);

    if(it == entry.end() || !it->is_string())
        return "";

    return it->get<std::string>();
}

std::vector<Playlist::Track> Playlist::File::parse(const std::string &content)
{
    if(is_blank(content))
        throw Error::Error(Error::Code::EMPTY_PLAYLIST, "Playlist is empty");

    json doc;

    try
    {
        doc = json::parse(content);
    }
    catch(const json::parse_error &e)
    {
        throw Error::Error(Error::Code::DATA_PARSING,
                           std::string("Playlist is not valid JSON: ") + e.what());
    }

    if(!doc.is_object())
        throw Error::Error(Error::Code::DATA_PARSING,
                           "Playlist document is not an object");

    const auto tracks_it = doc.find("tracks");

    if(tracks_it == doc.end())
        throw Error::Error(Error::Code::EMPTY_PLAYLIST, "Playlist has no tracks");

    if(!tracks_it->is_array())
        throw Error::Error(Error::Code::DATA_PARSING,
                           "Playlist \"tracks\" is not an array");

    std::vector<Track> result;
    result.reserve(tracks_it->size());

    size_t idx = 0;

    for(const auto &entry : *tracks_it)
    {
        if(!entry.is_object())
            throw Error::Error(Error::Code::DATA_PARSING,
                               "Track " + std::to_string(idx) + " is not an object");

        result.emplace_back(get_id_field(entry, "bvid", idx),
                            get_id_field(entry, "cid", idx),
                            get_optional_string(entry, "title"),
                            get_optional_string(entry, "owner"));
        ++idx;
    }

    if(result.empty())
        throw Error::Error(Error::Code::EMPTY_PLAYLIST, "Playlist has no tracks");

    return result;
}

std::vector<Playlist::Track> Playlist::File::load(const std::string &path)
{
    msg_vinfo(MESSAGE_LEVEL_DIAG, "Loading playlist from \"%s\"", path.c_str());

    gchar *contents = nullptr;
    gsize length = 0;
    GError *error = nullptr;

    if(!g_file_get_contents(path.c_str(), &contents, &length, &error))
    {
        std::string message("Failed reading playlist \"" + path + "\": ");
        message += error != nullptr ? error->message : "unknown error";
        g_clear_error(&error);
        throw Error::Error(Error::Code::IO, std::move(message));
    }

    const std::string content(contents, length);
    g_free(contents);

    auto result(parse(content));

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Loaded %zu tracks", result.size());

    return result;
}
