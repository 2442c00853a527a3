/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_TESTS_MOCKS_HTTPCLIENTMOCK_HPP_
#define DEPLOYMON_MONITOR_TESTS_MOCKS_HTTPCLIENTMOCK_HPP_

#include <gmock/gmock.h>

#include <monitor/itf/httpclient.hpp>

namespace deploymon::monitor {

class HTTPClientMock : public HTTPClientItf {
public:
    MOCK_METHOD(RetWithError<HTTPResponse>, Get, (const std::string& url), (override));
};

} // namespace deploymon::monitor

#endif
