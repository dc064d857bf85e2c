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

#include <vector>
#include <algorithm>

#include "stream_resolver.hh"
#include "mock_http_client.hh"
#include "expect_error.hh"

TEST_SUITE_BEGIN("Stream resolver");

class ResolverFixture
{
  protected:
    MockHttpClient http;
    std::vector<std::chrono::milliseconds> sleeps;
    Stream::Resolver resolver;

  public:
    explicit ResolverFixture():
        resolver(http,
                 Stream::ResolverParameters("https://api.example.com/",
                                            "TestAgent/1.0",
                                            "https://www.example.com"),
                 Retry::Policy(3, std::chrono::milliseconds(1000), 2),
                 [this] (std::chrono::milliseconds d) { sleeps.push_back(d); })
    {}
};

TEST_CASE("Audio URL is taken from first audio stream")
{
    CHECK(Stream::parse_play_url_response(MockHttpClient::good_metadata("http://a/b")) == "http://a/b");
}

TEST_CASE("Malformed play URL responses are parse errors")
{
    CHECK(expect_error([] { Stream::parse_play_url_response("<html>"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Stream::parse_play_url_response(R"({"code": -404, "data": null})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Stream::parse_play_url_response(R"({"data": {"dash": {"audio": []}}})"); }) == Error::Code::DATA_PARSING);
    CHECK(expect_error([] { Stream::parse_play_url_response(R"({"data": {"dash": {"audio": [{"id": 1}]}}})"); }) == Error::Code::DATA_PARSING);
}

TEST_CASE_FIXTURE(ResolverFixture, "Metadata request URL contains both IDs")
{
    CHECK(resolver.make_play_url_request("BV1xx", "123") ==
          "https://api.example.com/x/player/playurl?fnval=16&bvid=BV1xx&cid=123");
}

TEST_CASE_FIXTURE(ResolverFixture, "Immediate success takes one attempt without delay")
{
    CHECK(resolver.resolve("BV1xx", "123") == "https://cdn.example.com/audio.m4s");
    CHECK(http.metadata_requests_ == 1);
    CHECK(http.verify_requests_ == 1);
    CHECK(sleeps.empty());
}

TEST_CASE_FIXTURE(ResolverFixture, "Verification request carries the required headers")
{
    resolver.resolve("BV1xx", "123");

    const auto &h(http.last_verify_headers_);
    const auto has = [&h] (const char *name, const char *value)
    {
        return std::find(h.begin(), h.end(),
                         std::make_pair(std::string(name), std::string(value))) != h.end();
    };

    CHECK(has("User-Agent", "TestAgent/1.0"));
    CHECK(has("Accept", "*/*"));
    CHECK(has("Range", "bytes=0-1024"));
    CHECK(has("Referer", "https://www.example.com"));
}

TEST_CASE_FIXTURE(ResolverFixture, "Two failures then success take three metadata fetches")
{
    http.metadata_answers_.emplace_back(MockHttpClient::Answer::network_error());
    http.metadata_answers_.emplace_back(503);

    CHECK(resolver.resolve("BV1xx", "123") == "https://cdn.example.com/audio.m4s");
    CHECK(http.metadata_requests_ == 3);
    CHECK(http.verify_requests_ == 1);
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0] == std::chrono::milliseconds(1000));
    CHECK(sleeps[1] == std::chrono::milliseconds(2000));
}

TEST_CASE_FIXTURE(ResolverFixture, "Failed verification counts as failed attempt")
{
    http.verify_answers_.emplace_back(403);

    CHECK(resolver.resolve("BV1xx", "123") == "https://cdn.example.com/audio.m4s");
    CHECK(http.metadata_requests_ == 2);
    CHECK(http.verify_requests_ == 2);
    CHECK(sleeps.size() == 1);
}

TEST_CASE_FIXTURE(ResolverFixture, "Persistent failure gives up after maximum number of attempts")
{
    http.default_metadata_answer_ = MockHttpClient::Answer(200, "{}");

    CHECK(expect_error([this] { resolver.resolve("BV1xx", "123"); }) == Error::Code::FETCH);
    CHECK(http.metadata_requests_ == 3);
    CHECK(http.verify_requests_ == 0);
    CHECK(sleeps.size() == 2);
}

TEST_SUITE_END();
