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

#ifndef COMMAND_HH
#define COMMAND_HH

#include <string>
#include <memory>

#include "playback_modes.hh"
#include "guard.hh"

namespace Player
{

enum class CommandID
{
    START,
    PLAY,
    PAUSE,
    NEXT,
    PREVIOUS,
    JUMP_TO,
    STOP,
    SET_MODE,
    RELOAD_PLAYLIST,
    PLAYLIST_BECAME_EMPTY,

    /* internal commands, never dropped */
    TRACK_FINISHED,
    SKIP_UNPLAYABLE,
    PIPELINE_ERROR,

    LAST_ID = PIPELINE_ERROR,
};

static inline const char *command_to_string(CommandID id)
{
    switch(id)
    {
      case CommandID::START:                 return "Start";
      case CommandID::PLAY:                  return "Play";
      case CommandID::PAUSE:                 return "Pause";
      case CommandID::NEXT:                  return "Next";
      case CommandID::PREVIOUS:              return "Previous";
      case CommandID::JUMP_TO:               return "JumpTo";
      case CommandID::STOP:                  return "Stop";
      case CommandID::SET_MODE:              return "SetMode";
      case CommandID::RELOAD_PLAYLIST:       return "ReloadPlaylist";
      case CommandID::PLAYLIST_BECAME_EMPTY: return "PlaylistBecameEmpty";
      case CommandID::TRACK_FINISHED:        return "TrackFinished";
      case CommandID::SKIP_UNPLAYABLE:       return "SkipUnplayable";
      case CommandID::PIPELINE_ERROR:        return "PipelineError";
    }

    return "(invalid)";
}

/*!
 * Internal commands are generated by the daemon itself.
 */
static inline bool is_internal_command(CommandID id)
{
    return id == CommandID::START ||
           id == CommandID::TRACK_FINISHED ||
           id == CommandID::SKIP_UNPLAYABLE ||
           id == CommandID::PIPELINE_ERROR;
}

class Command
{
  public:
    const CommandID id_;

    /*! Track ID for #Player::CommandID::JUMP_TO, error text otherwise. */
    const std::string arg_;

    /*! Only used for #Player::CommandID::SET_MODE. */
    const Playlist::Mode mode_;

  private:
    std::unique_ptr<Guard> completion_;

  public:
    Command(const Command &) = delete;
    Command &operator=(const Command &) = delete;

    explicit Command(CommandID id, std::string &&arg = "",
                     Playlist::Mode mode = Playlist::Mode::LOOP):
        id_(id),
        arg_(std::move(arg)),
        mode_(mode)
    {}

    /*!
     * Function to call when the command has been taken by the dispatcher.
     */
    void set_completion(std::function<void()> &&fn)
    {
        completion_.reset(new Guard(std::move(fn)));
    }

    /*!
     * Tell the submitter that the command has been accepted.
     */
    void acknowledge() { completion_.reset(); }

    /*!
     * Drop completion function without calling it.
     *
     * For submitters who report failure to enqueue the command by other
     * means.
     */
    void dismiss_completion()
    {
        if(completion_ != nullptr)
        {
            completion_->dismiss();
            completion_.reset();
        }
    }

    bool is_internal() const { return is_internal_command(id_); }

    static std::unique_ptr<Command> make(CommandID id)
    {
        return std::unique_ptr<Command>(new Command(id));
    }

    static std::unique_ptr<Command> make_jump(std::string &&bvid)
    {
        return std::unique_ptr<Command>(new Command(CommandID::JUMP_TO,
                                                    std::move(bvid)));
    }

    static std::unique_ptr<Command> make_set_mode(Playlist::Mode mode)
    {
        return std::unique_ptr<Command>(new Command(CommandID::SET_MODE,
                                                    "", mode));
    }

    static std::unique_ptr<Command> make_pipeline_error(const std::string &message)
    {
        return std::unique_ptr<Command>(new Command(CommandID::PIPELINE_ERROR,
                                                    std::string(message)));
    }
};

}

#endif /* !COMMAND_HH */
