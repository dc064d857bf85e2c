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

#include <curl/curl.h>

#include "curl_client.hh"
#include "error.hh"
#include "messages.h"

namespace
{

class BodyBuffer
{
  public:
    std::string data_;
    const size_t limit_;
    bool truncated_;

    BodyBuffer(const BodyBuffer &) = delete;
    BodyBuffer &operator=(const BodyBuffer &) = delete;

    explicit BodyBuffer(size_t limit):
        limit_(limit),
        truncated_(false)
    {}
};

/*!
 * Wrapper around \c curl_slist which frees the list on destruction.
 */
class HeaderList
{
  private:
    struct curl_slist *list_;

  public:
    HeaderList(const HeaderList &) = delete;
    HeaderList &operator=(const HeaderList &) = delete;

    explicit HeaderList(): list_(nullptr) {}

    ~HeaderList()
    {
        if(list_ != nullptr)
            curl_slist_free_all(list_);
    }

    bool append(const std::string &name, const std::string &value)
    {
        const std::string line(name + ": " + value);
        auto *temp = curl_slist_append(list_, line.c_str());

        if(temp == nullptr)
            return false;

        list_ = temp;
        return true;
    }

    struct curl_slist *get() const { return list_; }
};

}

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *buffer = static_cast<BodyBuffer *>(userdata);
    const size_t total = size * nmemb;

    if(buffer->limit_ > 0 && buffer->data_.size() + total > buffer->limit_)
    {
        buffer->data_.append(ptr, buffer->limit_ - buffer->data_.size());
        buffer->truncated_ = true;

        /* returning less than requested aborts the transfer */
        return 0;
    }

    buffer->data_.append(ptr, total);

    return total;
}

bool Net::CurlClient::global_init()
{
    const CURLcode ret = curl_global_init(CURL_GLOBAL_DEFAULT);

    if(ret == CURLE_OK)
        return true;

    msg_error(0, LOG_EMERG, "Failed initializing libcurl: %s",
              curl_easy_strerror(ret));

    return false;
}

void Net::CurlClient::global_cleanup()
{
    curl_global_cleanup();
}

Net::CurlClient::CurlClient(std::chrono::seconds timeout):
    handle_(curl_easy_init()),
    timeout_(timeout)
{
    if(handle_ == nullptr)
        throw Error::Error(Error::Code::INIT, "Failed creating libcurl handle");
}

Net::CurlClient::~CurlClient()
{
    curl_easy_cleanup(static_cast<CURL *>(handle_));
}

Net::Response Net::CurlClient::get(const std::string &url,
                                   const Headers &headers,
                                   size_t max_body_size)
{
    CURL *const curl = static_cast<CURL *>(handle_);

    curl_easy_reset(curl);

    HeaderList header_list;

    for(const auto &h : headers)
    {
        if(!header_list.append(h.first, h.second))
            throw Error::Error(Error::Code::NETWORK,
                               "Failed building header list");
    }

    BodyBuffer body(max_body_size);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    if(header_list.get() != nullptr)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    msg_vinfo(MESSAGE_LEVEL_TRACE, "HTTP GET %s", url.c_str());

    const CURLcode ret = curl_easy_perform(curl);

    if(ret != CURLE_OK && !(ret == CURLE_WRITE_ERROR && body.truncated_))
        throw Error::Error(Error::Code::NETWORK,
                           std::string("HTTP request failed: ") +
                           curl_easy_strerror(ret));

    Response response;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_);
    response.body_ = std::move(body.data_);

    msg_vinfo(MESSAGE_LEVEL_TRACE, "HTTP GET %s -> %ld, %zu bytes",
              url.c_str(), response.status_, response.body_.size());

    return response;
}
