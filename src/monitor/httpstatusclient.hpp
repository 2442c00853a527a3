/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_HTTPSTATUSCLIENT_HPP_
#define DEPLOYMON_MONITOR_HTTPSTATUSCLIENT_HPP_

#include <optional>
#include <string>

#include "itf/httpclient.hpp"
#include "types.hpp"

namespace deploymon::monitor {

/**
 * Best effort client for instance self reported status endpoints.
 */
class HTTPStatusClient {
public:
    /**
     * Initializes status client.
     *
     * @param httpClient HTTP client.
     * @return Error.
     */
    Error Init(HTTPClientItf& httpClient);

    /**
     * Checks whether URL responds with HTTP 200.
     *
     * @param url URL.
     * @return bool false on transport failure.
     */
    bool Reachable(const std::string& url);

    /**
     * Fetches otp-runner status.
     *
     * @param url status file URL.
     * @return std::optional<RunnerStatus> empty if status is not available yet.
     */
    std::optional<RunnerStatus> FetchRunnerStatus(const std::string& url);

private:
    HTTPClientItf* mHTTPClient {};
};

/**
 * Parses otp-runner status JSON.
 *
 * @param json JSON document.
 * @return RetWithError<RunnerStatus>.
 */
RetWithError<RunnerStatus> ParseRunnerStatus(const std::string& json);

/**
 * Returns true if runner status satisfies completion rule.
 *
 * Build only servers complete once graph is uploaded, others once OTP server is started.
 *
 * @param status runner status.
 * @param buildOnly build only server.
 * @return bool.
 */
bool IsRunnerCompleted(const RunnerStatus& status, bool buildOnly);

} // namespace deploymon::monitor

#endif
