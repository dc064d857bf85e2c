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

#include <set>

#include "playlist_store.hh"
#include "expect_error.hh"

TEST_SUITE_BEGIN("Playlist store");

static std::vector<Playlist::Track> make_tracks(size_t count,
                                                const char *prefix = "BV")
{
    std::vector<Playlist::Track> result;

    for(size_t i = 0; i < count; ++i)
        result.emplace_back(std::string(prefix) + std::to_string(i),
                            std::to_string(1000 + i));

    return result;
}

TEST_CASE("Fresh store is empty and navigation fails")
{
    Playlist::Store store;

    CHECK(store.empty());
    CHECK(store.size() == 0);
    CHECK(expect_error([&store] { store.current(); }) == Error::Code::INDEX_OUT_OF_BOUNDS);
    CHECK(expect_error([&store] { store.advance(Playlist::Mode::LOOP); }) == Error::Code::INDEX_OUT_OF_BOUNDS);
    CHECK(expect_error([&store] { store.retreat(Playlist::Mode::SHUFFLE); }) == Error::Code::INDEX_OUT_OF_BOUNDS);
}

TEST_CASE("Loop mode visits each track once per cycle and returns to start")
{
    Playlist::Store store;
    store.replace(make_tracks(5));

    CHECK(store.get_cursor() == 0);

    std::set<size_t> seen;

    for(size_t i = 0; i < 5; ++i)
        seen.insert(store.advance(Playlist::Mode::LOOP));

    CHECK(seen.size() == 5);
    CHECK(store.get_cursor() == 0);
    CHECK(store.current().bvid_ == "BV0");
}

TEST_CASE("Loop mode wraps around in both directions")
{
    Playlist::Store store;
    store.replace(make_tracks(3));

    CHECK(store.retreat(Playlist::Mode::LOOP) == 2);
    CHECK(store.current().bvid_ == "BV2");
    CHECK(store.advance(Playlist::Mode::LOOP) == 0);
    CHECK(store.retreat(Playlist::Mode::LOOP) == 2);
    CHECK(store.retreat(Playlist::Mode::LOOP) == 1);
}

TEST_CASE("Single repeat mode leaves cursor alone")
{
    Playlist::Store store;
    store.replace(make_tracks(4));
    store.set_cursor(2);

    CHECK(store.advance(Playlist::Mode::SINGLE_REPEAT) == 2);
    CHECK(store.retreat(Playlist::Mode::SINGLE_REPEAT) == 2);
    CHECK(store.current().bvid_ == "BV2");
}

TEST_CASE("Shuffle mode takes index from random source")
{
    std::vector<size_t> sequence { 3, 3, 0, 1 };
    size_t pos = 0;

    Playlist::Store store(
        [&sequence, &pos] (size_t count)
        {
            REQUIRE(count == 4);
            return sequence[pos++];
        });
    store.replace(make_tracks(4));

    CHECK(store.advance(Playlist::Mode::SHUFFLE) == 3);
    CHECK(store.advance(Playlist::Mode::SHUFFLE) == 3);
    CHECK(store.retreat(Playlist::Mode::SHUFFLE) == 0);
    CHECK(store.advance(Playlist::Mode::SHUFFLE) == 1);
    CHECK(pos == 4);
}

TEST_CASE("Default shuffle stays in range")
{
    Playlist::Store store;
    store.replace(make_tracks(7));

    for(int i = 0; i < 200; ++i)
        CHECK(store.advance(Playlist::Mode::SHUFFLE) < 7);
}

TEST_CASE("Find returns first match")
{
    auto tracks(make_tracks(3));
    tracks.emplace_back("BV1", "9999");

    Playlist::Store store;
    store.replace(std::move(tracks));

    size_t idx = 100;
    CHECK(store.find("BV1", idx));
    CHECK(idx == 1);

    idx = 100;
    CHECK_FALSE(store.find("BVx", idx));
    CHECK(idx == 100);
}

TEST_CASE("Reload keeps cursor on current track at its new position")
{
    Playlist::Store store;
    store.replace(make_tracks(5));
    store.set_cursor(3);

    std::vector<Playlist::Track> tracks;
    tracks.emplace_back("BVnew", "1");
    tracks.emplace_back("BV3", "1003");
    tracks.emplace_back("BV0", "1000");

    const auto result = store.reconcile(std::move(tracks), false);

    CHECK(result == Playlist::ReloadResult::KEPT_CURRENT);
    CHECK_FALSE(Playlist::reload_needs_replay(result));
    CHECK(store.get_cursor() == 1);
    CHECK(store.current().bvid_ == "BV3");
}

TEST_CASE("Reload with current track gone clamps cursor and requests replay")
{
    Playlist::Store store;
    store.replace(make_tracks(5));
    store.set_cursor(4);

    const auto result = store.reconcile(make_tracks(2, "XY"), false);

    CHECK(result == Playlist::ReloadResult::CURRENT_REMOVED);
    CHECK(Playlist::reload_needs_replay(result));
    CHECK(store.get_cursor() == 1);
}

TEST_CASE("Reload with removed current track keeps index if still in range")
{
    Playlist::Store store;
    store.replace(make_tracks(5));
    store.set_cursor(1);

    const auto result = store.reconcile(make_tracks(3, "XY"), false);

    CHECK(result == Playlist::ReloadResult::CURRENT_REMOVED);
    CHECK(store.get_cursor() == 1);
    CHECK(store.current().bvid_ == "XY1");
}

TEST_CASE("Reload after idle starts over from first track")
{
    Playlist::Store store;
    store.replace(make_tracks(5));
    store.set_cursor(3);

    const auto result = store.reconcile(make_tracks(5), true);

    CHECK(result == Playlist::ReloadResult::FRESH_START);
    CHECK(Playlist::reload_needs_replay(result));
    CHECK(store.get_cursor() == 0);
}

TEST_CASE("Reload of empty store has no current track")
{
    Playlist::Store store;

    const auto result = store.reconcile(make_tracks(3), false);

    CHECK(result == Playlist::ReloadResult::NO_CURRENT);
    CHECK_FALSE(Playlist::reload_needs_replay(result));
    CHECK(store.get_cursor() == 0);
    CHECK(store.size() == 3);
}

TEST_CASE("Clearing the store resets the cursor")
{
    Playlist::Store store;
    store.replace(make_tracks(3));
    store.set_cursor(2);
    store.clear();

    CHECK(store.empty());
    CHECK(store.get_cursor() == 0);
}

TEST_SUITE_END();
