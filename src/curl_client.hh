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

#ifndef CURL_CLIENT_HH
#define CURL_CLIENT_HH

#include <chrono>

#include "http_client.hh"

namespace Net
{

/*!
 * HTTP client based on libcurl easy interface.
 *
 * One handle is reused for all requests to keep connections alive. Objects
 * of this class must be used from a single thread at a time.
 */
class CurlClient: public HttpClientIface
{
  private:
    void *handle_;
    const std::chrono::seconds timeout_;

  public:
    CurlClient(const CurlClient &) = delete;
    CurlClient &operator=(const CurlClient &) = delete;

    /*!
     * \throws Error::Error
     *     With code #Error::Code::INIT if libcurl cannot be initialized.
     */
    explicit CurlClient(std::chrono::seconds timeout);
    ~CurlClient();

    Response get(const std::string &url, const Headers &headers,
                 size_t max_body_size) final override;

    /*!
     * Process-wide libcurl initialization, call once from main thread.
     */
    static bool global_init();
    static void global_cleanup();
};

}

#endif /* !CURL_CLIENT_HH */
