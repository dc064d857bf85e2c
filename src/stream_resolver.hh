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

#ifndef STREAM_RESOLVER_HH
#define STREAM_RESOLVER_HH

#include <string>

#include "http_client.hh"
#include "retry.hh"

namespace Stream
{

/*!
 * Parameters for talking to the remote metadata API.
 */
class ResolverParameters
{
  public:
    const std::string api_base_url_;
    const std::string user_agent_;
    const std::string referer_;

    explicit ResolverParameters(std::string &&api_base_url,
                                std::string &&user_agent,
                                std::string &&referer):
        api_base_url_(std::move(api_base_url)),
        user_agent_(std::move(user_agent)),
        referer_(std::move(referer))
    {}
};

/*!
 * Turn a track ID pair into a playable stream URL.
 */
class ResolverIface
{
  protected:
    explicit ResolverIface() {}

  public:
    ResolverIface(const ResolverIface &) = delete;
    ResolverIface &operator=(const ResolverIface &) = delete;

    virtual ~ResolverIface() {}

    /*!
     * Find a verified stream URL for given track.
     *
     * May block for a long time (network I/O, retry delays). Must not be
     * called with any locks held.
     *
     * \throws Error::Error
     *     With code #Error::Code::FETCH if no URL could be obtained.
     */
    virtual std::string resolve(const std::string &bvid,
                                const std::string &cid) = 0;

    virtual const ResolverParameters &get_parameters() const = 0;
};

/*!
 * Extract audio stream URL from play-URL API response.
 *
 * \throws Error::Error
 *     With code #Error::Code::DATA_PARSING if the document is malformed or
 *     contains no audio stream.
 */
std::string parse_play_url_response(const std::string &body);

/*!
 * Resolver using the play-URL endpoint and a verification request.
 */
class Resolver: public ResolverIface
{
  private:
    Net::HttpClientIface &http_;
    const ResolverParameters parameters_;
    const Retry::Policy policy_;
    const Retry::SleepFn sleep_fn_;

  public:
    Resolver(const Resolver &) = delete;
    Resolver &operator=(const Resolver &) = delete;

    explicit Resolver(Net::HttpClientIface &http,
                      ResolverParameters &&parameters,
                      const Retry::Policy &policy,
                      Retry::SleepFn &&sleep_fn):
        http_(http),
        parameters_(std::move(parameters)),
        policy_(policy),
        sleep_fn_(std::move(sleep_fn))
    {}

    std::string resolve(const std::string &bvid,
                        const std::string &cid) final override;

    const ResolverParameters &get_parameters() const final override
    {
        return parameters_;
    }

    std::string make_play_url_request(const std::string &bvid,
                                      const std::string &cid) const;

  private:
    bool try_resolve(unsigned int attempt, const std::string &bvid,
                     const std::string &cid, std::string &url);
    bool verify(const std::string &url);
};

}

#endif /* !STREAM_RESOLVER_HH */
