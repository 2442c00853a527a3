/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_HTTPCLIENT_HPP_
#define DEPLOYMON_CLOUD_HTTPCLIENT_HPP_

#include <monitor/itf/httpclient.hpp>

namespace deploymon::cloud {

/**
 * Plain HTTP client used to poll instance endpoints.
 */
class HTTPClient : public monitor::HTTPClientItf {
public:
    /**
     * Initializes HTTP client.
     *
     * @param timeout connection and receive timeout.
     * @return Error.
     */
    Error Init(Duration timeout);

    /**
     * Performs GET request.
     *
     * @param url URL.
     * @return RetWithError<monitor::HTTPResponse>.
     */
    RetWithError<monitor::HTTPResponse> Get(const std::string& url) override;

private:
    Duration mTimeout;
};

} // namespace deploymon::cloud

#endif
