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

#ifndef MOCK_HTTP_CLIENT_HH
#define MOCK_HTTP_CLIENT_HH

#include <deque>
#include <string>

#include "http_client.hh"
#include "error.hh"

/*!
 * HTTP client returning canned answers.
 *
 * Requests to the play-URL endpoint are answered from the metadata queue,
 * all other requests from the verification queue. An empty queue repeats
 * the default answer.
 */
class MockHttpClient: public Net::HttpClientIface
{
  public:
    class Answer
    {
      public:
        bool transport_error_;
        long status_;
        std::string body_;

        explicit Answer(long status, std::string &&body = ""):
            transport_error_(false),
            status_(status),
            body_(std::move(body))
        {}

        static Answer network_error()
        {
            Answer a(0);
            a.transport_error_ = true;
            return a;
        }
    };

    std::deque<Answer> metadata_answers_;
    std::deque<Answer> verify_answers_;
    Answer default_metadata_answer_;
    Answer default_verify_answer_;

    unsigned int metadata_requests_;
    unsigned int verify_requests_;
    std::string last_metadata_url_;
    Net::Headers last_verify_headers_;

    explicit MockHttpClient():
        default_metadata_answer_(200, good_metadata()),
        default_verify_answer_(206),
        metadata_requests_(0),
        verify_requests_(0)
    {}

    static std::string good_metadata(const char *url = "https://cdn.example.com/audio.m4s")
    {
        return std::string(R"({"code": 0, "data": {"dash": {"audio": [{"baseUrl": ")") +
               url + R"("}, {"baseUrl": "https://cdn.example.com/other.m4s"}]}}})";
    }

    Net::Response get(const std::string &url, const Net::Headers &headers,
                      size_t max_body_size) override
    {
        const bool is_metadata = url.find("/x/player/playurl?") != std::string::npos;
        std::deque<Answer> &queue(is_metadata ? metadata_answers_ : verify_answers_);
        Answer answer(is_metadata ? default_metadata_answer_ : default_verify_answer_);

        if(is_metadata)
        {
            ++metadata_requests_;
            last_metadata_url_ = url;
        }
        else
        {
            ++verify_requests_;
            last_verify_headers_ = headers;
        }

        if(!queue.empty())
        {
            answer = queue.front();
            queue.pop_front();
        }

        if(answer.transport_error_)
            throw Error::Error(Error::Code::NETWORK, "Mock network failure");

        Net::Response response;
        response.status_ = answer.status_;
        response.body_ = answer.body_;

        return response;
    }
};

#endif /* !MOCK_HTTP_CLIENT_HH */
