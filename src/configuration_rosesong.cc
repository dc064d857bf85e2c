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

#include <cstdlib>
#include <cerrno>
#include <limits>

#include "configuration_rosesong.hh"

constexpr char Configuration::RosesongValues::CONFIGURATION_SECTION_NAME[];

const Configuration::RosesongValues &Configuration::RosesongValues::defaults()
{
    static const RosesongValues values(
        "https://api.bilibili.com",
        "Mozilla/5.0 BiliDroid/..* (bbcallen@gmail.com)",
        "https://www.bilibili.com",
        3, 1000, 2, 16000, 10,
        "autoaudiosink", Playlist::Mode::LOOP, 8);

    return values;
}

template <typename T>
static bool parse_uint(const char *in, T &result, T min_value)
{
    if(in[0] == '\0' || in[0] == '-')
        return false;

    char *endptr = nullptr;
    errno = 0;
    const unsigned long temp = strtoul(in, &endptr, 10);

    if(*endptr != '\0' || errno == ERANGE)
        return false;

    if(temp > std::numeric_limits<T>::max() || temp < min_value)
        return false;

    result = temp;

    return true;
}

static bool parse_string(const char *in, std::string &result)
{
    if(in[0] == '\0')
        return false;

    result = in;

    return true;
}

#define STRING_DESERIALIZER(FIELD) \
    [] (Configuration::RosesongValues &v, const char *src) \
    { return parse_string(src, v.FIELD); }

#define UINT_DESERIALIZER(FIELD, MIN) \
    [] (Configuration::RosesongValues &v, const char *src) \
    { return parse_uint<uint32_t>(src, v.FIELD, MIN); }

const std::array<const Configuration::RosesongConfigKey,
                 Configuration::RosesongValues::NUMBER_OF_KEYS>
Configuration::RosesongValues::all_keys
{
    RosesongConfigKey(KeyID::API_BASE_URL, "api_base_url",
                      STRING_DESERIALIZER(api_base_url_)),
    RosesongConfigKey(KeyID::USER_AGENT, "user_agent",
                      STRING_DESERIALIZER(user_agent_)),
    RosesongConfigKey(KeyID::REFERER, "referer",
                      STRING_DESERIALIZER(referer_)),
    RosesongConfigKey(KeyID::MAX_FETCH_ATTEMPTS, "max_fetch_attempts",
                      UINT_DESERIALIZER(max_fetch_attempts_, 1)),
    RosesongConfigKey(KeyID::INITIAL_RETRY_DELAY_MS, "initial_retry_delay_ms",
                      UINT_DESERIALIZER(initial_retry_delay_ms_, 0)),
    RosesongConfigKey(KeyID::RETRY_BACKOFF_FACTOR, "retry_backoff_factor",
                      UINT_DESERIALIZER(retry_backoff_factor_, 1)),
    RosesongConfigKey(KeyID::MAX_RETRY_DELAY_MS, "max_retry_delay_ms",
                      UINT_DESERIALIZER(max_retry_delay_ms_, 0)),
    RosesongConfigKey(KeyID::HTTP_TIMEOUT_S, "http_timeout_s",
                      UINT_DESERIALIZER(http_timeout_s_, 1)),
    RosesongConfigKey(KeyID::AUDIO_SINK, "audio_sink",
                      STRING_DESERIALIZER(audio_sink_)),
    RosesongConfigKey(KeyID::PLAY_MODE, "play_mode",
                      [] (Configuration::RosesongValues &v, const char *src)
                      { return Playlist::mode_from_string(src, v.play_mode_); }),
    RosesongConfigKey(KeyID::COMMAND_QUEUE_SIZE, "command_queue_size",
                      UINT_DESERIALIZER(command_queue_size_, 1)),
};

#undef STRING_DESERIALIZER
#undef UINT_DESERIALIZER
