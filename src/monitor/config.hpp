/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_CONFIG_HPP_
#define DEPLOYMON_MONITOR_CONFIG_HPP_

#include <common/types.hpp>

namespace deploymon::monitor {

/**
 * Monitor timing configuration.
 */
struct Config {
    Duration mPollDelay         = Time::cSeconds * 4;
    Duration mStatusFileTimeout = Time::cMinutes * 5;
    Duration mGraphBuildTimeout = Time::cHours * 1;
    Duration mGraphLoadTimeout  = Time::cHours * 5;
    Duration mRouterTimeout     = Time::cMinutes * 20;
    Duration mRegisterTimeout   = Time::cMinutes * 2;
};

} // namespace deploymon::monitor

#endif
