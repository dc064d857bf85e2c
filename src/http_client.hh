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

#ifndef HTTP_CLIENT_HH
#define HTTP_CLIENT_HH

#include <string>
#include <vector>
#include <utility>

namespace Net
{

using Headers = std::vector<std::pair<std::string, std::string>>;

class Response
{
  public:
    long status_;
    std::string body_;

    explicit Response(): status_(0) {}

    bool is_success() const { return status_ >= 200 && status_ < 300; }
};

/*!
 * Minimal HTTP GET interface.
 */
class HttpClientIface
{
  protected:
    explicit HttpClientIface() {}

  public:
    HttpClientIface(const HttpClientIface &) = delete;
    HttpClientIface &operator=(const HttpClientIface &) = delete;

    virtual ~HttpClientIface() {}

    /*!
     * Perform GET request.
     *
     * \param url
     *     Where to send the request to.
     *
     * \param headers
     *     Additional request headers.
     *
     * \param max_body_size
     *     Stop reading the body after this many bytes, 0 for no limit.
     *
     * \throws Error::Error
     *     With code #Error::Code::NETWORK on transport errors. HTTP error
     *     status codes are not reported as exceptions.
     */
    virtual Response get(const std::string &url, const Headers &headers,
                         size_t max_body_size = 0) = 0;
};

}

#endif /* !HTTP_CLIENT_HH */
