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

#include <glib.h>
#include <nlohmann/json.hpp>

#include "stream_resolver.hh"
#include "error.hh"
#include "messages.h"

using json = nlohmann::json;

/* only need to know that the stream is there, not its content */
static constexpr size_t VERIFY_MAX_BODY_SIZE = 1025;

static std::string uri_escape(const std::string &s)
{
    gchar *temp = g_uri_escape_string(s.c_str(), nullptr, FALSE);
    std::string result(temp);
    g_free(temp);
    return result;
}

std::string Stream::parse_play_url_response(const std::string &body)
{
    json doc;

    try
    {
        doc = json::parse(body);
    }
    catch(const json::parse_error &e)
    {
        throw Error::Error(Error::Code::DATA_PARSING,
                           std::string("Play URL response is not valid JSON: ") +
                           e.what());
    }

    try
    {
        const auto &audio(doc.at("data").at("dash").at("audio"));

        if(!audio.is_array() || audio.empty())
            throw Error::Error(Error::Code::DATA_PARSING,
                               "Play URL response contains no audio streams");

        const auto &url(audio[0].at("baseUrl"));

        if(!url.is_string() || url.get<std::string>().empty())
            throw Error::Error(Error::Code::DATA_PARSING,
                               "Play URL response contains no base URL");

        return url.get<std::string>();
    }
    catch(const json::exception &e)
    {
        throw Error::Error(Error::Code::DATA_PARSING,
                           std::string("Play URL response malformed: ") +
                           e.what());
    }
}

std::string Stream::Resolver::make_play_url_request(const std::string &bvid,
                                                    const std::string &cid) const
{
    std::string url(parameters_.api_base_url_);

    while(!url.empty() && url.back() == '/')
        url.pop_back();

    url += "/x/player/playurl?fnval=16&bvid=";
    url += uri_escape(bvid);
    url += "&cid=";
    url += uri_escape(cid);

    return url;
}

bool Stream::Resolver::verify(const std::string &url)
{
    const Net::Headers headers
    {
        { "User-Agent", parameters_.user_agent_ },
        { "Accept", "*/*" },
        { "Range", "bytes=0-1024" },
        { "Referer", parameters_.referer_ },
    };

    const auto response(http_.get(url, headers, VERIFY_MAX_BODY_SIZE));

    if(response.is_success())
        return true;

    msg_error(0, LOG_NOTICE, "Stream URL verification failed with HTTP status %ld",
              response.status_);

    return false;
}

bool Stream::Resolver::try_resolve(unsigned int attempt,
                                   const std::string &bvid,
                                   const std::string &cid, std::string &url)
{
    try
    {
        const Net::Headers headers
        {
            { "User-Agent", parameters_.user_agent_ },
            { "Referer", parameters_.referer_ },
        };

        const auto response(http_.get(make_play_url_request(bvid, cid), headers));

        if(!response.is_success())
        {
            msg_error(0, LOG_NOTICE,
                      "Attempt %u/%u: play URL request for %s failed "
                      "with HTTP status %ld",
                      attempt, policy_.max_attempts_, bvid.c_str(),
                      response.status_);
            return false;
        }

        std::string candidate(parse_play_url_response(response.body_));

        if(!verify(candidate))
        {
            msg_error(0, LOG_NOTICE,
                      "Attempt %u/%u: stream for %s not accessible",
                      attempt, policy_.max_attempts_, bvid.c_str());
            return false;
        }

        url = std::move(candidate);

        return true;
    }
    catch(const Error::Error &e)
    {
        msg_error(0, LOG_NOTICE, "Attempt %u/%u: resolving %s failed: %s (%s)",
                  attempt, policy_.max_attempts_, bvid.c_str(), e.what(),
                  Error::code_to_string(e.get()));
    }

    return false;
}

std::string Stream::Resolver::resolve(const std::string &bvid,
                                      const std::string &cid)
{
    msg_vinfo(MESSAGE_LEVEL_DIAG, "Resolving stream for %s/%s",
              bvid.c_str(), cid.c_str());

    std::string url;

    if(Retry::run(policy_,
                  [this, &bvid, &cid] (unsigned int attempt, std::string &result)
                  {
                      return try_resolve(attempt, bvid, cid, result);
                  },
                  sleep_fn_, url))
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Resolved %s/%s to \"%s\"",
                  bvid.c_str(), cid.c_str(), url.c_str());
        return url;
    }

    throw Error::Error(Error::Code::FETCH,
                       "Failed resolving stream for " + bvid + "/" + cid +
                       " after " + std::to_string(policy_.max_attempts_) +
                       " attempts");
}
