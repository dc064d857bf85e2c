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

#ifndef CONFIGURATION_ROSESONG_HH
#define CONFIGURATION_ROSESONG_HH

#include <array>
#include <string>
#include <cinttypes>

#include "configuration.hh"
#include "playback_modes.hh"

namespace Configuration
{

class RosesongConfigKey;

struct RosesongValues
{
    static constexpr char CONFIGURATION_SECTION_NAME[] = "rosesong";

    enum class KeyID
    {
        API_BASE_URL,
        USER_AGENT,
        REFERER,
        MAX_FETCH_ATTEMPTS,
        INITIAL_RETRY_DELAY_MS,
        RETRY_BACKOFF_FACTOR,
        MAX_RETRY_DELAY_MS,
        HTTP_TIMEOUT_S,
        AUDIO_SINK,
        PLAY_MODE,
        COMMAND_QUEUE_SIZE,

        LAST_ID = COMMAND_QUEUE_SIZE,
    };

    static constexpr size_t NUMBER_OF_KEYS = static_cast<size_t>(KeyID::LAST_ID) + 1;

    static const std::array<const RosesongConfigKey, NUMBER_OF_KEYS> all_keys;

    std::string api_base_url_;
    std::string user_agent_;
    std::string referer_;
    uint32_t max_fetch_attempts_;
    uint32_t initial_retry_delay_ms_;
    uint32_t retry_backoff_factor_;
    uint32_t max_retry_delay_ms_;
    uint32_t http_timeout_s_;
    std::string audio_sink_;
    Playlist::Mode play_mode_;
    uint32_t command_queue_size_;

    explicit RosesongValues(std::string &&api_base_url,
                            std::string &&user_agent, std::string &&referer,
                            uint32_t max_fetch_attempts,
                            uint32_t initial_retry_delay_ms,
                            uint32_t retry_backoff_factor,
                            uint32_t max_retry_delay_ms,
                            uint32_t http_timeout_s,
                            std::string &&audio_sink,
                            Playlist::Mode play_mode,
                            uint32_t command_queue_size):
        api_base_url_(std::move(api_base_url)),
        user_agent_(std::move(user_agent)),
        referer_(std::move(referer)),
        max_fetch_attempts_(max_fetch_attempts),
        initial_retry_delay_ms_(initial_retry_delay_ms),
        retry_backoff_factor_(retry_backoff_factor),
        max_retry_delay_ms_(max_retry_delay_ms),
        http_timeout_s_(http_timeout_s),
        audio_sink_(std::move(audio_sink)),
        play_mode_(play_mode),
        command_queue_size_(command_queue_size)
    {}

    /*!
     * Built-in defaults.
     */
    static const RosesongValues &defaults();
};

class RosesongConfigKey
{
  public:
    using Deserializer = bool (*)(RosesongValues &dest, const char *src);

    const RosesongValues::KeyID id_;
    const std::string name_;

  private:
    const Deserializer deserialize_;

  public:
    explicit RosesongConfigKey(RosesongValues::KeyID id, const char *name,
                               Deserializer deserializer):
        id_(id),
        name_(name),
        deserialize_(deserializer)
    {}

    bool write(RosesongValues &dest, const char *src) const
    {
        return deserialize_(dest, src);
    }
};

using RosesongConfigManager = ConfigManager<RosesongValues>;

}

#endif /* !CONFIGURATION_ROSESONG_HH */
