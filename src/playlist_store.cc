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
#include <random>
#include <memory>

#include "playlist_store.hh"
#include "error.hh"
#include "messages.h"

static Playlist::Store::RandomIndexFn make_default_random_source()
{
    auto engine = std::make_shared<std::mt19937>(std::random_device()());

    return
        [engine] (size_t count)
        {
            std::uniform_int_distribution<size_t> dist(0, count - 1);
            return dist(*engine);
        };
}

Playlist::Store::Store(RandomIndexFn &&random_index):
    cursor_(0),
    random_index_(random_index != nullptr
                  ? std::move(random_index)
                  : make_default_random_source())
{
    LoggedLock::configure(lock_, "Playlist::Store", MESSAGE_LEVEL_DEBUG);
}

void Playlist::Store::replace(std::vector<Track> &&tracks)
{
    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);
    tracks_ = std::move(tracks);
    cursor_ = 0;
}

void Playlist::Store::clear()
{
    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);
    tracks_.clear();
    cursor_ = 0;
}

bool Playlist::Store::empty() const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);
    return tracks_.empty();
}

size_t Playlist::Store::size() const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);
    return tracks_.size();
}

size_t Playlist::Store::get_cursor() const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);
    return cursor_;
}

Playlist::Track Playlist::Store::current() const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);

    if(cursor_ >= tracks_.size())
        throw Error::Error(Error::Code::INDEX_OUT_OF_BOUNDS,
                           "Track index " + std::to_string(cursor_) +
                           " out of bounds (have " +
                           std::to_string(tracks_.size()) + " tracks)");

    return tracks_[cursor_];
}

void Playlist::Store::throw_if_empty__unlocked() const
{
    if(tracks_.empty())
        throw Error::Error(Error::Code::INDEX_OUT_OF_BOUNDS,
                           "Cannot navigate in empty playlist");
}

size_t Playlist::Store::pick_random__unlocked()
{
    const size_t idx = random_index_(tracks_.size());

    if(idx < tracks_.size())
        return idx;

    MSG_BUG("Random index %zu out of range [0, %zu)", idx, tracks_.size());

    return idx % tracks_.size();
}

size_t Playlist::Store::advance(Mode mode)
{
    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);

    throw_if_empty__unlocked();

    switch(mode)
    {
      case Mode::LOOP:
        cursor_ = (cursor_ + 1) % tracks_.size();
        break;

      case Mode::SHUFFLE:
        cursor_ = pick_random__unlocked();
        break;

      case Mode::SINGLE_REPEAT:
        break;
    }

    return cursor_;
}

size_t Playlist::Store::retreat(Mode mode)
{
    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);

    throw_if_empty__unlocked();

    switch(mode)
    {
      case Mode::LOOP:
        if(cursor_ == 0 || cursor_ > tracks_.size())
            cursor_ = tracks_.size() - 1;
        else
            --cursor_;

        break;

      case Mode::SHUFFLE:
        cursor_ = pick_random__unlocked();
        break;

      case Mode::SINGLE_REPEAT:
        break;
    }

    return cursor_;
}

bool Playlist::Store::find(const std::string &bvid, size_t &idx) const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);

    const auto it =
        std::find_if(tracks_.begin(), tracks_.end(),
                     [&bvid] (const Track &t) { return t.has_id(bvid); });

    if(it == tracks_.end())
        return false;

    idx = std::distance(tracks_.begin(), it);

    return true;
}

void Playlist::Store::set_cursor(size_t idx)
{
    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);
    cursor_ = idx;
}

Playlist::ReloadResult
Playlist::Store::reconcile(std::vector<Track> &&tracks, bool fresh_start)
{
    msg_log_assert(!tracks.empty());

    LoggedLock::UniqueLock<LoggedLock::SharedMutex> lock(lock_);

    const size_t old_index = cursor_;
    const bool had_current = old_index < tracks_.size();
    const std::string current_id(had_current ? tracks_[old_index].bvid_ : "");

    tracks_ = std::move(tracks);

    if(fresh_start)
    {
        cursor_ = 0;
        return ReloadResult::FRESH_START;
    }

    const size_t clamped = std::min(old_index, tracks_.size() - 1);

    if(!had_current)
    {
        cursor_ = clamped;
        return ReloadResult::NO_CURRENT;
    }

    const auto it =
        std::find_if(tracks_.begin(), tracks_.end(),
                     [&current_id] (const Track &t) { return t.has_id(current_id); });

    if(it != tracks_.end())
    {
        cursor_ = std::distance(tracks_.begin(), it);
        return ReloadResult::KEPT_CURRENT;
    }

    cursor_ = clamped;

    return ReloadResult::CURRENT_REMOVED;
}

std::vector<Playlist::Track> Playlist::Store::get_tracks() const
{
    LoggedLock::SharedLock<LoggedLock::SharedMutex> lock(lock_);
    return tracks_;
}
