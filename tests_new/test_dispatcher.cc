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

#include "dispatcher.hh"
#include "mock_engine.hh"

TEST_SUITE_BEGIN("Command dispatcher");

static std::vector<Playlist::Track> make_tracks(std::initializer_list<const char *> ids)
{
    std::vector<Playlist::Track> result;

    for(const char *id : ids)
        result.emplace_back(id, "1");

    return result;
}

class DispatcherFixture
{
  protected:
    Player::CommandQueue queue;
    Playlist::Store store;
    MockEngine engine;

    std::function<std::vector<Playlist::Track>()> load_fn;
    int stop_requests;

    std::unique_ptr<Player::Dispatcher> dispatcher;

  public:
    explicit DispatcherFixture():
        queue(1000),
        stop_requests(0)
    {}

    void make_dispatcher(std::vector<Playlist::Track> &&initial,
                         Playlist::Mode mode = Playlist::Mode::LOOP)
    {
        const bool idle = initial.empty();

        if(!idle)
            store.replace(std::move(initial));

        dispatcher.reset(new Player::Dispatcher(
            queue, store, engine,
            [this] () { return load_fn(); },
            [this] () { ++stop_requests; },
            mode, idle));
    }

    bool process(Player::CommandID id)
    {
        return dispatcher->process(Player::Command(id));
    }

    bool process(std::unique_ptr<Player::Command> command)
    {
        return dispatcher->process(*command);
    }

    /* process commands the dispatcher has queued for itself */
    size_t process_queued()
    {
        size_t count = 0;

        while(queue.size() > 0)
        {
            process(queue.take());
            ++count;
        }

        return count;
    }
};

TEST_CASE_FIXTURE(DispatcherFixture, "Start plays first track")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));

    CHECK(process(Player::CommandID::START));
    REQUIRE(engine.played_.size() == 1);
    CHECK(engine.played_[0] == "A");
}

TEST_CASE_FIXTURE(DispatcherFixture, "Start in idle state plays nothing")
{
    make_dispatcher({});

    CHECK(dispatcher->is_idle());
    CHECK(process(Player::CommandID::START));
    CHECK(process(Player::CommandID::NEXT));
    CHECK(process(Player::CommandID::PLAY));
    CHECK(process(Player::CommandID::TRACK_FINISHED));
    CHECK(engine.played_.empty());
    CHECK(engine.states_.empty());
}

TEST_CASE_FIXTURE(DispatcherFixture, "Play and pause change pipeline state")
{
    make_dispatcher(make_tracks({"A"}));

    process(Player::CommandID::PAUSE);
    process(Player::CommandID::PLAY);

    REQUIRE(engine.states_.size() == 2);
    CHECK(engine.states_[0] == Player::State::PAUSED);
    CHECK(engine.states_[1] == Player::State::PLAYING);
    CHECK(engine.played_.empty());
}

TEST_CASE_FIXTURE(DispatcherFixture, "Next and previous navigate in loop mode")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));

    process(Player::CommandID::NEXT);
    process(Player::CommandID::NEXT);
    process(Player::CommandID::NEXT);
    process(Player::CommandID::PREVIOUS);

    CHECK(engine.played_ == std::vector<std::string>({"B", "C", "A", "C"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Manual skip leaves track in single repeat mode")
{
    make_dispatcher(make_tracks({"A", "B", "C"}), Playlist::Mode::SINGLE_REPEAT);

    process(Player::CommandID::NEXT);
    process(Player::CommandID::PREVIOUS);
    process(Player::CommandID::PREVIOUS);

    CHECK(engine.played_ == std::vector<std::string>({"B", "A", "C"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "End of stream advances in loop mode and repeats in single repeat mode")
{
    make_dispatcher(make_tracks({"A", "B"}));

    process(Player::CommandID::TRACK_FINISHED);
    process(Player::CommandID::TRACK_FINISHED);
    process(Player::Command::make_set_mode(Playlist::Mode::SINGLE_REPEAT));
    CHECK(dispatcher->get_mode() == Playlist::Mode::SINGLE_REPEAT);
    process(Player::CommandID::TRACK_FINISHED);
    process(Player::CommandID::TRACK_FINISHED);

    CHECK(engine.played_ == std::vector<std::string>({"B", "A", "A", "A"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Jump to existing track plays it")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));

    process(Player::Command::make_jump("C"));

    CHECK(store.get_cursor() == 2);
    CHECK(engine.played_ == std::vector<std::string>({"C"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Jump to unknown track does nothing")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    store.set_cursor(1);

    CHECK(process(Player::Command::make_jump("X")));

    CHECK(store.get_cursor() == 1);
    CHECK(engine.played_.empty());
}

TEST_CASE_FIXTURE(DispatcherFixture, "Stop sets pipeline to NULL and requests shutdown")
{
    make_dispatcher(make_tracks({"A"}));

    CHECK_FALSE(process(Player::CommandID::STOP));
    CHECK(stop_requests == 1);
    REQUIRE(engine.states_.size() == 1);
    CHECK(engine.states_[0] == Player::State::NULL_STATE);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Unplayable track is skipped")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    engine.unplayable_.insert("B");

    CHECK(process(Player::CommandID::NEXT));
    CHECK(engine.played_ == std::vector<std::string>({"B"}));
    CHECK(store.get_cursor() == 1);
    REQUIRE(queue.size() == 1);

    CHECK(process_queued() == 1);
    CHECK(engine.played_ == std::vector<std::string>({"B", "C"}));
    CHECK(store.get_cursor() == 2);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Unplayable track after end of stream is skipped in single repeat mode")
{
    make_dispatcher(make_tracks({"A", "B", "C"}), Playlist::Mode::SINGLE_REPEAT);
    engine.unplayable_.insert("A");

    process(Player::CommandID::TRACK_FINISHED);

    CHECK(process_queued() == 1);
    CHECK(engine.played_ == std::vector<std::string>({"A", "B"}));
    CHECK(store.get_cursor() == 1);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Skipping unplayable tracks gives up after one round")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    engine.unplayable_ = {"A", "B", "C"};

    process(Player::CommandID::NEXT);

    CHECK(process_queued() == 2);
    CHECK(engine.played_ == std::vector<std::string>({"B", "C", "A"}));
    CHECK(queue.size() == 0);

    /* user interaction starts another round */
    process(Player::CommandID::NEXT);

    CHECK(process_queued() == 2);
    CHECK(engine.played_.size() == 6);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Playable track resets count of unplayable tracks")
{
    make_dispatcher(make_tracks({"A", "B", "C", "D"}));
    engine.unplayable_ = {"B", "D"};

    process(Player::CommandID::NEXT);
    CHECK(process_queued() == 1);
    process(Player::CommandID::TRACK_FINISHED);
    CHECK(process_queued() == 1);

    CHECK(engine.played_ == std::vector<std::string>({"B", "C", "D", "A"}));
    CHECK(store.get_cursor() == 0);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Unplayable jump target is not skipped")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    engine.unplayable_.insert("B");

    process(Player::Command::make_jump("B"));

    CHECK(queue.size() == 0);
    CHECK(store.get_cursor() == 1);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Pipeline error stops the pipeline")
{
    make_dispatcher(make_tracks({"A"}));

    CHECK(process(Player::Command::make_pipeline_error("broken")));
    REQUIRE(engine.states_.size() == 1);
    CHECK(engine.states_[0] == Player::State::NULL_STATE);
}

TEST_CASE_FIXTURE(DispatcherFixture, "Reload keeping current track does not interrupt playback")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    store.set_cursor(1);

    load_fn = [] { return make_tracks({"X", "Y", "B"}); };
    process(Player::CommandID::RELOAD_PLAYLIST);

    CHECK(store.get_cursor() == 2);
    CHECK(store.size() == 3);
    CHECK(engine.played_.empty());
}

TEST_CASE_FIXTURE(DispatcherFixture, "Reload removing current track plays clamped index")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    store.set_cursor(2);

    load_fn = [] { return make_tracks({"X", "Y"}); };
    process(Player::CommandID::RELOAD_PLAYLIST);

    CHECK(store.get_cursor() == 1);
    CHECK(engine.played_ == std::vector<std::string>({"Y"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Failed reload keeps the old playlist")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    store.set_cursor(1);

    load_fn = [] () -> std::vector<Playlist::Track>
    {
        throw Error::Error(Error::Code::DATA_PARSING, "Mock parse error");
    };
    CHECK(process(Player::CommandID::RELOAD_PLAYLIST));

    CHECK(store.size() == 3);
    CHECK(store.get_cursor() == 1);
    CHECK_FALSE(dispatcher->is_idle());
    CHECK(engine.played_.empty());
}

TEST_CASE_FIXTURE(DispatcherFixture, "Empty playlist enters idle state, next reload starts over")
{
    make_dispatcher(make_tracks({"A", "B", "C"}));
    store.set_cursor(2);

    load_fn = [] () -> std::vector<Playlist::Track>
    {
        throw Error::Error(Error::Code::EMPTY_PLAYLIST, "Mock empty playlist");
    };
    process(Player::CommandID::RELOAD_PLAYLIST);

    CHECK(dispatcher->is_idle());
    CHECK(store.empty());
    REQUIRE(engine.states_.size() == 1);
    CHECK(engine.states_[0] == Player::State::NULL_STATE);

    process(Player::CommandID::TRACK_FINISHED);
    CHECK(engine.played_.empty());

    load_fn = [] { return make_tracks({"D", "E", "F"}); };
    process(Player::CommandID::RELOAD_PLAYLIST);

    CHECK_FALSE(dispatcher->is_idle());
    CHECK(store.get_cursor() == 0);
    CHECK(engine.played_ == std::vector<std::string>({"D"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Playlist becoming empty enters idle state")
{
    make_dispatcher(make_tracks({"A", "B"}));

    process(Player::CommandID::PLAYLIST_BECAME_EMPTY);

    CHECK(dispatcher->is_idle());
    CHECK(store.empty());

    load_fn = [] { return make_tracks({"A", "B"}); };
    process(Player::CommandID::RELOAD_PLAYLIST);

    CHECK_FALSE(dispatcher->is_idle());
    CHECK(engine.played_ == std::vector<std::string>({"A"}));
}

TEST_CASE_FIXTURE(DispatcherFixture, "Concurrent skip and end of stream are processed one at a time")
{
    make_dispatcher(make_tracks({"A", "B", "C", "D"}));
    engine.play_duration_ = std::chrono::microseconds(200);

    dispatcher->start();

    static constexpr int COUNT = 50;

    std::thread skipper([this]
    {
        for(int i = 0; i < COUNT; ++i)
        {
            auto c = Player::Command::make(Player::CommandID::NEXT);
            CHECK(queue.post(c) == Player::CommandQueue::PostResult::OK);
        }
    });

    std::thread bus([this]
    {
        for(int i = 0; i < COUNT; ++i)
            queue.post_internal(Player::Command::make(Player::CommandID::TRACK_FINISHED));
    });

    skipper.join();
    bus.join();

    auto stop = Player::Command::make(Player::CommandID::STOP);
    REQUIRE(queue.post(stop) == Player::CommandQueue::PostResult::OK);

    dispatcher->join();

    CHECK_FALSE(engine.overlapping_calls_);
    CHECK(engine.played_count() == 2 * COUNT);
    CHECK(stop_requests == 1);

    /* each command advanced the cursor by exactly one position */
    CHECK(store.get_cursor() == (2 * COUNT) % 4);
}

TEST_SUITE_END();
