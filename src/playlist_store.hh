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

#ifndef PLAYLIST_STORE_HH
#define PLAYLIST_STORE_HH

#include <vector>
#include <functional>

#include "track.hh"
#include "playback_modes.hh"
#include "logged_lock.hh"

/*!
 * \addtogroup playlist_store Playlist store
 *
 * The list of tracks and the cursor pointing at the current track.
 */
/*!@{*/

namespace Playlist
{

/*!
 * Result of #Playlist::Store::reconcile().
 */
enum class ReloadResult
{
    /*! Current track is still there, cursor moved to its new position. */
    KEPT_CURRENT,

    /*! Current track has gone, cursor clamped to new list length. */
    CURRENT_REMOVED,

    /*! Playback starts over from first track. */
    FRESH_START,

    /*! There was no current track before, cursor clamped. */
    NO_CURRENT,
};

static inline bool reload_needs_replay(ReloadResult result)
{
    switch(result)
    {
      case ReloadResult::KEPT_CURRENT:
      case ReloadResult::NO_CURRENT:
        return false;

      case ReloadResult::CURRENT_REMOVED:
      case ReloadResult::FRESH_START:
        return true;
    }

    return false;
}

/*!
 * Thread-safe container for the active playlist.
 *
 * List and cursor are guarded by a single reader/writer lock. Navigation and
 * list replacement take the lock exclusively, so that navigation never sees
 * a list length that does not belong to the list it is navigating.
 */
class Store
{
  public:
    /*!
     * Function returning a random index in range [0, count).
     */
    using RandomIndexFn = std::function<size_t(size_t count)>;

  private:
    mutable LoggedLock::SharedMutex lock_;

    std::vector<Track> tracks_;
    size_t cursor_;

    RandomIndexFn random_index_;

  public:
    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    /*!
     * Constructor.
     *
     * \param random_index
     *     Random source for shuffle mode. If \c nullptr, then a uniformly
     *     distributed pseudo random number generator is used.
     */
    explicit Store(RandomIndexFn &&random_index = nullptr);

    /*!
     * Replace whole playlist, reset cursor to first entry.
     */
    void replace(std::vector<Track> &&tracks);

    /*!
     * Remove all tracks.
     */
    void clear();

    bool empty() const;
    size_t size() const;
    size_t get_cursor() const;

    /*!
     * Copy of the track the cursor points to.
     *
     * \throws Error::Error
     *     With code #Error::Code::INDEX_OUT_OF_BOUNDS if the playlist is
     *     empty or the cursor is stale.
     */
    Track current() const;

    /*!
     * Move cursor to next track according to play mode.
     *
     * In shuffle mode, any track including the current one may be picked.
     *
     * \returns The new cursor position.
     *
     * \throws Error::Error
     *     With code #Error::Code::INDEX_OUT_OF_BOUNDS if the playlist is
     *     empty.
     */
    size_t advance(Mode mode);

    /*!
     * Move cursor to previous track according to play mode.
     *
     * \see #Playlist::Store::advance()
     */
    size_t retreat(Mode mode);

    /*!
     * Find first track with given primary ID.
     */
    bool find(const std::string &bvid, size_t &idx) const;

    /*!
     * Overwrite cursor position. Caller must keep it in range.
     */
    void set_cursor(size_t idx);

    /*!
     * Replace playlist and fix up cursor in one atomic step.
     *
     * \param tracks
     *     The new list of tracks, must not be empty.
     *
     * \param fresh_start
     *     If true, then the cursor is reset to the first track regardless of
     *     the previous state.
     */
    ReloadResult reconcile(std::vector<Track> &&tracks, bool fresh_start);

    /*!
     * Copy of all tracks for inspection.
     */
    std::vector<Track> get_tracks() const;

  private:
    size_t pick_random__unlocked();
    void throw_if_empty__unlocked() const;
};

}

/*!@}*/

#endif /* !PLAYLIST_STORE_HH */
