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

#ifndef MOCK_ENGINE_HH
#define MOCK_ENGINE_HH

#include <vector>
#include <set>
#include <string>
#include <mutex>
#include <atomic>
#include <thread>

#include "player_engine.hh"
#include "error.hh"

/*!
 * Engine recording what it has been asked to do.
 */
class MockEngine: public Player::EngineIface
{
  private:
    std::mutex lock_;
    std::atomic<int> active_calls_;

  public:
    std::vector<std::string> played_;
    std::vector<Player::State> states_;
    std::set<std::string> unplayable_;
    bool overlapping_calls_;
    std::chrono::microseconds play_duration_;

    explicit MockEngine():
        active_calls_(0),
        overlapping_calls_(false),
        play_duration_(0)
    {}

    void play_track(const Playlist::Track &track) override
    {
        if(active_calls_++ != 0)
            overlapping_calls_ = true;

        if(play_duration_.count() > 0)
            std::this_thread::sleep_for(play_duration_);

        {
            std::lock_guard<std::mutex> lock(lock_);
            played_.push_back(track.bvid_);
        }

        --active_calls_;

        if(unplayable_.find(track.bvid_) != unplayable_.end())
            throw Error::Error(Error::Code::FETCH, "Mock track unplayable");
    }

    void set_state(Player::State state) override
    {
        std::lock_guard<std::mutex> lock(lock_);
        states_.push_back(state);
    }

    size_t played_count()
    {
        std::lock_guard<std::mutex> lock(lock_);
        return played_.size();
    }
};

#endif /* !MOCK_ENGINE_HH */
