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

#ifndef DISPATCHER_HH
#define DISPATCHER_HH

#include <thread>
#include <vector>
#include <functional>

#include "command_queue.hh"
#include "playlist_store.hh"
#include "player_engine.hh"

namespace Player
{

/*!
 * The single consumer of the command queue.
 *
 * All playback-affecting operations are executed by the dispatcher thread,
 * one after the other. The play mode and the idle flag are owned by that
 * thread.
 */
class Dispatcher
{
  public:
    using LoadPlaylistFn = std::function<std::vector<Playlist::Track>()>;
    using StopFn = std::function<void()>;

  private:
    CommandQueue &queue_;
    Playlist::Store &store_;
    EngineIface &engine_;
    const LoadPlaylistFn load_playlist_fn_;
    const StopFn stop_fn_;

    Playlist::Mode mode_;
    bool is_idle_;

    /*! Number of tracks skipped in a row because they were unplayable. */
    size_t unplayable_in_a_row_;

    std::thread thread_;

  public:
    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    /*!
     * Constructor.
     *
     * \param queue
     *     Where to take commands from.
     *
     * \param store
     *     The playlist.
     *
     * \param engine
     *     The playback engine.
     *
     * \param load_playlist_fn
     *     Read playlist from persistent storage, used for reloads. Throws
     *     #Error::Error like #Playlist::File::load() does.
     *
     * \param stop_fn
     *     Called when a stop command has been processed. Used for requesting
     *     process shutdown.
     *
     * \param mode
     *     Initial play mode.
     *
     * \param start_idle
     *     True if the daemon starts without a playable playlist.
     */
    explicit Dispatcher(CommandQueue &queue, Playlist::Store &store,
                        EngineIface &engine,
                        LoadPlaylistFn &&load_playlist_fn, StopFn &&stop_fn,
                        Playlist::Mode mode, bool start_idle):
        queue_(queue),
        store_(store),
        engine_(engine),
        load_playlist_fn_(std::move(load_playlist_fn)),
        stop_fn_(std::move(stop_fn)),
        mode_(mode),
        is_idle_(start_idle),
        unplayable_in_a_row_(0)
    {}

    ~Dispatcher() { join(); }

    /*!
     * Start dispatcher thread.
     */
    void start();

    /*!
     * Wait for dispatcher thread to terminate.
     *
     * The thread terminates after processing a stop command, or when the
     * queue is shut down.
     */
    void join();

    /*!
     * Process a single command.
     *
     * Errors are logged, never thrown. If the track to be played after
     * navigation or end of stream cannot be resolved, then an internal
     * command for skipping it is queued. Skipping gives up after as many
     * unplayable tracks in a row as there are tracks in the playlist.
     *
     * \returns
     *     False if the dispatcher should stop processing commands.
     */
    bool process(const Command &command);

    /*!
     * Take and process commands until stopped.
     */
    void run();

    Playlist::Mode get_mode() const { return mode_; }
    bool is_idle() const { return is_idle_; }

  private:
    void do_process(const Command &command);
    void play_current();
    void navigate(bool forward);
    void reload_playlist();
    void enter_idle();
    void skip_unplayable(CommandID failed_command);
};

}

#endif /* !DISPATCHER_HH */
