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

#include "dispatcher.hh"
#include "error.hh"
#include "messages.h"

void Player::Dispatcher::start()
{
    msg_log_assert(!thread_.joinable());
    thread_ = std::thread([this] { run(); });
}

void Player::Dispatcher::join()
{
    if(thread_.joinable())
        thread_.join();
}

void Player::Dispatcher::run()
{
    msg_vinfo(MESSAGE_LEVEL_DIAG, "Dispatcher running");

    while(true)
    {
        std::unique_ptr<Command> command = queue_.take();

        if(command == nullptr)
            break;

        command->acknowledge();

        if(!process(*command))
            break;
    }

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Dispatcher terminated");
}

bool Player::Dispatcher::process(const Command &command)
{
    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Processing command %s%s",
              command_to_string(command.id_), is_idle_ ? " (idle)" : "");

    if(!is_internal_command(command.id_))
        unplayable_in_a_row_ = 0;

    try
    {
        do_process(command);
    }
    catch(const Error::Error &e)
    {
        if(e.get() == Error::Code::FETCH)
        {
            msg_error(0, LOG_ERR, "Track unplayable: %s", e.what());
            skip_unplayable(command.id_);
        }
        else
            msg_error(0, LOG_ERR, "Command %s failed: %s (%s)",
                      command_to_string(command.id_), e.what(),
                      Error::code_to_string(e.get()));
    }

    return command.id_ != CommandID::STOP;
}

void Player::Dispatcher::play_current()
{
    engine_.play_track(store_.current());
    unplayable_in_a_row_ = 0;
}

void Player::Dispatcher::skip_unplayable(CommandID failed_command)
{
    switch(failed_command)
    {
      case CommandID::NEXT:
      case CommandID::PREVIOUS:
      case CommandID::RELOAD_PLAYLIST:
      case CommandID::TRACK_FINISHED:
      case CommandID::SKIP_UNPLAYABLE:
        break;

      case CommandID::START:
      case CommandID::PLAY:
      case CommandID::PAUSE:
      case CommandID::JUMP_TO:
      case CommandID::STOP:
      case CommandID::SET_MODE:
      case CommandID::PLAYLIST_BECAME_EMPTY:
      case CommandID::PIPELINE_ERROR:
        return;
    }

    if(is_idle_)
        return;

    if(++unplayable_in_a_row_ >= store_.size())
    {
        msg_error(0, LOG_ERR,
                  "Giving up after %zu unplayable tracks in a row",
                  unplayable_in_a_row_);
        return;
    }

    queue_.post_internal(Command::make(CommandID::SKIP_UNPLAYABLE));
}

void Player::Dispatcher::navigate(bool forward)
{
    /* skipping a track manually must leave it even in single repeat mode */
    const Playlist::Mode mode =
        mode_ == Playlist::Mode::SINGLE_REPEAT ? Playlist::Mode::LOOP : mode_;

    if(forward)
        store_.advance(mode);
    else
        store_.retreat(mode);

    play_current();
}

void Player::Dispatcher::enter_idle()
{
    msg_info("Playlist is empty, waiting for new playlist");

    is_idle_ = true;
    store_.clear();
    engine_.set_state(State::NULL_STATE);
}

void Player::Dispatcher::reload_playlist()
{
    std::vector<Playlist::Track> tracks;

    try
    {
        tracks = load_playlist_fn_();
    }
    catch(const Error::Error &e)
    {
        if(e.get() == Error::Code::EMPTY_PLAYLIST)
        {
            enter_idle();
            return;
        }

        msg_error(0, LOG_ERR, "Failed reloading playlist, keeping old one: %s (%s)",
                  e.what(), Error::code_to_string(e.get()));
        return;
    }

    const bool was_idle = is_idle_;
    const Playlist::ReloadResult result = store_.reconcile(std::move(tracks), was_idle);

    is_idle_ = false;

    msg_vinfo(MESSAGE_LEVEL_DIAG,
              "Reloaded playlist with %zu tracks, cursor at %zu%s",
              store_.size(), store_.get_cursor(),
              was_idle ? " (starting over)" : "");

    if(Playlist::reload_needs_replay(result))
        play_current();
}

void Player::Dispatcher::do_process(const Command &command)
{
    switch(command.id_)
    {
      case CommandID::START:
        if(is_idle_)
            msg_info("No tracks to play");
        else
            play_current();

        break;

      case CommandID::PLAY:
        if(!is_idle_)
            engine_.set_state(State::PLAYING);

        break;

      case CommandID::PAUSE:
        if(!is_idle_)
            engine_.set_state(State::PAUSED);

        break;

      case CommandID::NEXT:
      case CommandID::PREVIOUS:
        if(!is_idle_)
            navigate(command.id_ == CommandID::NEXT);

        break;

      case CommandID::JUMP_TO:
        {
            size_t idx;

            if(!store_.find(command.arg_, idx))
            {
                msg_error(0, LOG_NOTICE, "Track %s not found in playlist",
                          command.arg_.c_str());
                break;
            }

            store_.set_cursor(idx);
            play_current();
        }

        break;

      case CommandID::STOP:
        msg_info("Stopping playback");

        try
        {
            engine_.set_state(State::NULL_STATE);
        }
        catch(const Error::Error &e)
        {
            msg_error(0, LOG_ERR, "Failed stopping pipeline: %s", e.what());
        }

        if(stop_fn_ != nullptr)
            stop_fn_();

        break;

      case CommandID::SET_MODE:
        msg_info("Play mode %s", Playlist::mode_to_string(command.mode_));
        mode_ = command.mode_;
        break;

      case CommandID::RELOAD_PLAYLIST:
        reload_playlist();
        break;

      case CommandID::PLAYLIST_BECAME_EMPTY:
        enter_idle();
        break;

      case CommandID::TRACK_FINISHED:
        if(is_idle_)
            break;

        if(mode_ != Playlist::Mode::SINGLE_REPEAT)
            store_.advance(mode_);

        play_current();

        break;

      case CommandID::SKIP_UNPLAYABLE:
        if(!is_idle_)
            navigate(true);

        break;

      case CommandID::PIPELINE_ERROR:
        msg_error(0, LOG_ERR, "Stopping pipeline after error: %s",
                  command.arg_.c_str());
        engine_.set_state(State::NULL_STATE);
        break;
    }
}
