/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_TESTS_MOCKS_LOADBALANCERMOCK_HPP_
#define DEPLOYMON_MONITOR_TESTS_MOCKS_LOADBALANCERMOCK_HPP_

#include <gmock/gmock.h>

#include <monitor/itf/loadbalancer.hpp>

namespace deploymon::monitor {

class LoadBalancerMock : public LoadBalancerItf {
public:
    MOCK_METHOD(Error, RegisterTarget, (const std::string& targetGroup, const std::string& instanceID), (override));
    MOCK_METHOD(RetWithError<std::vector<TargetHealth>>, GetTargetHealth, (const std::string& targetGroup), (override));
};

} // namespace deploymon::monitor

#endif
