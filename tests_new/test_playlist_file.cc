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

#include <doctest.h>

#include <glib.h>
#include <glib/gstdio.h>

#include "playlist_file.hh"
#include "expect_error.hh"

TEST_SUITE_BEGIN("Playlist file");

TEST_CASE("Tracks are parsed in file order")
{
    const auto tracks = Playlist::File::parse(
        R"({ "tracks": [
               { "bvid": "BV1xx411c7mD", "cid": "12345", "title": "First", "owner": "Someone" },
               { "bvid": "BV1yy411c7mE", "cid": 67890 }
           ] })");

    REQUIRE(tracks.size() == 2);
    CHECK(tracks[0].bvid_ == "BV1xx411c7mD");
    CHECK(tracks[0].cid_ == "12345");
    CHECK(tracks[0].title_ == "First");
    CHECK(tracks[0].owner_ == "Someone");
    CHECK(tracks[1].bvid_ == "BV1yy411c7mE");
    CHECK(tracks[1].cid_ == "67890");
    CHECK(tracks[1].title_.empty());
}

TEST_CASE("Empty and whitespace content means empty playlist")
{
    CHECK(expect_error([] { Playlist::File::parse(""); }) == Error::Code::EMPTY_PLAYLIST);
    CHECK(expect_error([] { Playlist::File::parse(" \n\t\n"); }) == Error::Code::EMPTY_PLAYLIST);
}

TEST_CASE("Document without tracks means empty playlist")
{
    CHECK(expect_error([] { Playlist::File::parse("{}"); }) == Error::Code::EMPTY_PLAYLIST);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": []})"); }) == Error::Code::EMPTY_PLAYLIST);
}

TEST_CASE("Malformed documents are rejected as a whole")
{
    CHECK(expect_error([] { Playlist::File::parse("{"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse("[]"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": 5})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": [{"bvid": "BV1", "cid": "1"}, {"bvid": "BV2"}]})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": [{"bvid": "", "cid": "1"}]})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": [{"bvid": true, "cid": "1"}]})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Playlist::File::parse(R"({"tracks": ["BV1"]})"); }) == Error::Code::DATA_PARSING);
}

TEST_CASE("Missing file is an I/O error")
{
    CHECK(expect_error([] { Playlist::File::load("/nonexistent/rosesong/playlist.json"); }) == Error::Code::IO);
}

TEST_CASE("Playlist can be loaded from file")
{
    gchar *dir = g_dir_make_tmp("rosesong-test-XXXXXX", nullptr);
    REQUIRE(dir != nullptr);

    const std::string path = std::string(dir) + "/playlist.json";
    const char content[] = R"({"tracks": [{"bvid": "BVa", "cid": "1"}]})";

    REQUIRE(g_file_set_contents(path.c_str(), content, -1, nullptr));

    const auto tracks = Playlist::File::load(path);

    g_unlink(path.c_str());
    g_rmdir(dir);
    g_free(dir);

    REQUIRE(tracks.size() == 1);
    CHECK(tracks[0].bvid_ == "BVa");
}

TEST_SUITE_END();
