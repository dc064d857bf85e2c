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

#ifndef PLAYER_ENGINE_HH
#define PLAYER_ENGINE_HH

#include "track.hh"

namespace Player
{

enum class State
{
    NULL_STATE,
    READY,
    PAUSED,
    PLAYING,

    LAST_STATE = PLAYING,
};

static inline const char *state_to_string(State state)
{
    switch(state)
    {
      case State::NULL_STATE:
        return "NULL";

      case State::READY:
        return "READY";

      case State::PAUSED:
        return "PAUSED";

      case State::PLAYING:
        return "PLAYING";
    }

    return "(invalid)";
}

/*!
 * Interface to the audio pipeline.
 *
 * All functions are called from the dispatcher thread only.
 */
class EngineIface
{
  protected:
    explicit EngineIface() {}

  public:
    EngineIface(const EngineIface &) = delete;
    EngineIface &operator=(const EngineIface &) = delete;

    virtual ~EngineIface() {}

    /*!
     * Tear down current stream, resolve URL for given track, start playing.
     *
     * On failure, the pipeline is left in NULL state.
     *
     * \throws Error::Error
     *     Codes #Error::Code::FETCH, #Error::Code::PIPELINE_STATE,
     *     #Error::Code::PIPELINE_ELEMENT, #Error::Code::PIPELINE_LINK.
     */
    virtual void play_track(const Playlist::Track &track) = 0;

    /*!
     * Direct state transition without rebuilding the pipeline.
     *
     * \throws Error::Error
     *     With code #Error::Code::PIPELINE_STATE on failure.
     */
    virtual void set_state(State state) = 0;
};

}

#endif /* !PLAYER_ENGINE_HH */
