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

#include <thread>

#include "command_queue.hh"

TEST_SUITE_BEGIN("Command queue");

TEST_CASE("Commands are taken in order of posting")
{
    Player::CommandQueue queue(8);

    auto c1 = Player::Command::make(Player::CommandID::NEXT);
    auto c2 = Player::Command::make_jump("BV1");
    auto c3 = Player::Command::make_set_mode(Playlist::Mode::SHUFFLE);

    REQUIRE(queue.post(c1) == Player::CommandQueue::PostResult::OK);
    queue.post_internal(Player::Command::make(Player::CommandID::TRACK_FINISHED));
    REQUIRE(queue.post(c2) == Player::CommandQueue::PostResult::OK);
    REQUIRE(queue.post(c3) == Player::CommandQueue::PostResult::OK);

    CHECK(c1 == nullptr);
    CHECK(queue.size() == 4);

    CHECK(queue.take()->id_ == Player::CommandID::NEXT);
    CHECK(queue.take()->id_ == Player::CommandID::TRACK_FINISHED);

    auto jump = queue.take();
    CHECK(jump->id_ == Player::CommandID::JUMP_TO);
    CHECK(jump->arg_ == "BV1");

    auto mode = queue.take();
    CHECK(mode->id_ == Player::CommandID::SET_MODE);
    CHECK(mode->mode_ == Playlist::Mode::SHUFFLE);
}

TEST_CASE("External commands are limited, internal commands are not")
{
    Player::CommandQueue queue(2);

    for(int i = 0; i < 2; ++i)
    {
        auto c = Player::Command::make(Player::CommandID::NEXT);
        CHECK(queue.post(c) == Player::CommandQueue::PostResult::OK);
    }

    auto rejected = Player::Command::make(Player::CommandID::PREVIOUS);
    CHECK(queue.post(rejected) == Player::CommandQueue::PostResult::FULL);
    REQUIRE(rejected != nullptr);
    CHECK(rejected->id_ == Player::CommandID::PREVIOUS);

    for(int i = 0; i < 5; ++i)
        queue.post_internal(Player::Command::make(Player::CommandID::TRACK_FINISHED));

    CHECK(queue.size() == 7);

    CHECK(queue.take()->id_ == Player::CommandID::NEXT);
    CHECK(queue.post(rejected) == Player::CommandQueue::PostResult::OK);
}

TEST_CASE("Completion is called when the command is acknowledged")
{
    Player::CommandQueue queue(1);
    int completed = 0;

    auto c = Player::Command::make(Player::CommandID::PLAY);
    c->set_completion([&completed] { ++completed; });
    REQUIRE(queue.post(c) == Player::CommandQueue::PostResult::OK);
    CHECK(completed == 0);

    auto taken = queue.take();
    CHECK(completed == 0);
    taken->acknowledge();
    CHECK(completed == 1);
    taken.reset();
    CHECK(completed == 1);
}

TEST_CASE("Dismissed completion is never called")
{
    Player::CommandQueue queue(1);
    int completed = 0;

    auto first = Player::Command::make(Player::CommandID::PLAY);
    REQUIRE(queue.post(first) == Player::CommandQueue::PostResult::OK);

    auto c = Player::Command::make(Player::CommandID::PAUSE);
    c->set_completion([&completed] { ++completed; });
    REQUIRE(queue.post(c) == Player::CommandQueue::PostResult::FULL);

    c->dismiss_completion();
    c.reset();
    CHECK(completed == 0);
}

TEST_CASE("Commands discarded on shutdown are completed")
{
    Player::CommandQueue queue(4);
    int completed = 0;

    auto c = Player::Command::make(Player::CommandID::PLAY);
    c->set_completion([&completed] { ++completed; });
    REQUIRE(queue.post(c) == Player::CommandQueue::PostResult::OK);

    queue.shutdown();

    CHECK(completed == 1);
    CHECK(queue.take() == nullptr);

    auto late = Player::Command::make(Player::CommandID::NEXT);
    CHECK(queue.post(late) == Player::CommandQueue::PostResult::SHUT_DOWN);
}

TEST_CASE("Shutdown wakes up blocked consumer")
{
    Player::CommandQueue queue(4);
    bool got_null = false;

    std::thread consumer([&queue, &got_null] { got_null = queue.take() == nullptr; });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    CHECK(got_null);
}

TEST_SUITE_END();
