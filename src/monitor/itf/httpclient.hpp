/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_ITF_HTTPCLIENT_HPP_
#define DEPLOYMON_MONITOR_ITF_HTTPCLIENT_HPP_

#include <string>

#include <common/types.hpp>

namespace deploymon::monitor {

/**
 * HTTP response.
 */
struct HTTPResponse {
    int         mStatus = 0;
    std::string mBody;
};

/**
 * HTTP client interface.
 */
class HTTPClientItf {
public:
    /**
     * Performs GET request. Response body is always read completely.
     *
     * @param url URL.
     * @return RetWithError<HTTPResponse> error on transport failure.
     */
    virtual RetWithError<HTTPResponse> Get(const std::string& url) = 0;

    /**
     * Destructor.
     */
    virtual ~HTTPClientItf() = default;
};

} // namespace deploymon::monitor

#endif
