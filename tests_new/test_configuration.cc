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

#include <glib/gstdio.h>

#include "configuration_rosesong.hh"

TEST_SUITE_BEGIN("Configuration");

class ConfigFileFixture
{
  protected:
    gchar *dir_;
    std::string path_;

  public:
    explicit ConfigFileFixture():
        dir_(g_dir_make_tmp("rosesong-config-XXXXXX", nullptr)),
        path_(std::string(dir_ != nullptr ? dir_ : "/nonexistent") + "/rosesong.ini")
    {}

    ~ConfigFileFixture()
    {
        g_unlink(path_.c_str());

        if(dir_ != nullptr)
        {
            g_rmdir(dir_);
            g_free(dir_);
        }
    }

    void write(const char *content)
    {
        REQUIRE(dir_ != nullptr);
        REQUIRE(g_file_set_contents(path_.c_str(), content, -1, nullptr));
    }
};

TEST_CASE_FIXTURE(ConfigFileFixture, "Missing file yields defaults")
{
    Configuration::RosesongConfigManager mgr(std::string(path_),
                                             Configuration::RosesongValues::defaults());

    CHECK_FALSE(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.api_base_url_ == "https://api.bilibili.com");
    CHECK(v.user_agent_ == "Mozilla/5.0 BiliDroid/..* (bbcallen@gmail.com)");
    CHECK(v.referer_ == "https://www.bilibili.com");
    CHECK(v.max_fetch_attempts_ == 3);
    CHECK(v.initial_retry_delay_ms_ == 1000);
    CHECK(v.retry_backoff_factor_ == 2);
    CHECK(v.max_retry_delay_ms_ == 16000);
    CHECK(v.http_timeout_s_ == 10);
    CHECK(v.audio_sink_ == "autoaudiosink");
    CHECK(v.play_mode_ == Playlist::Mode::LOOP);
    CHECK(v.command_queue_size_ == 8);
}

TEST_CASE_FIXTURE(ConfigFileFixture, "Values are read from rosesong section")
{
    write("[rosesong]\n"
          "api_base_url = http://localhost:8080\n"
          "max_fetch_attempts = 5\n"
          "audio_sink = fakesink\n"
          "play_mode = Shuffle\n"
          "\n"
          "[other]\n"
          "http_timeout_s = 99\n");

    Configuration::RosesongConfigManager mgr(std::string(path_),
                                             Configuration::RosesongValues::defaults());

    CHECK(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.api_base_url_ == "http://localhost:8080");
    CHECK(v.max_fetch_attempts_ == 5);
    CHECK(v.audio_sink_ == "fakesink");
    CHECK(v.play_mode_ == Playlist::Mode::SHUFFLE);
    CHECK(v.http_timeout_s_ == 10);
}

TEST_CASE_FIXTURE(ConfigFileFixture, "Invalid values are replaced by defaults")
{
    write("[rosesong]\n"
          "max_fetch_attempts = 0\n"
          "retry_backoff_factor = -2\n"
          "initial_retry_delay_ms = soon\n"
          "command_queue_size = 99999999999999999999\n"
          "play_mode = Random\n"
          "referer =\n"
          "max_retry_delay_ms = 0\n");

    Configuration::RosesongConfigManager mgr(std::string(path_),
                                             Configuration::RosesongValues::defaults());

    CHECK(mgr.load());

    const auto &v(mgr.values());
    CHECK(v.max_fetch_attempts_ == 3);
    CHECK(v.retry_backoff_factor_ == 2);
    CHECK(v.initial_retry_delay_ms_ == 1000);
    CHECK(v.command_queue_size_ == 8);
    CHECK(v.play_mode_ == Playlist::Mode::LOOP);
    CHECK(v.referer_ == "https://www.bilibili.com");
    CHECK(v.max_retry_delay_ms_ == 0);
}

TEST_CASE_FIXTURE(ConfigFileFixture, "Repeat mode has two names")
{
    write("[rosesong]\nplay_mode = SingleRepeat\n");

    Configuration::RosesongConfigManager mgr(std::string(path_),
                                             Configuration::RosesongValues::defaults());
    mgr.load();

    CHECK(mgr.values().play_mode_ == Playlist::Mode::SINGLE_REPEAT);
}

TEST_SUITE_END();
