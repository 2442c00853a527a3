/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_ITF_SERVERCOUNTER_HPP_
#define DEPLOYMON_MONITOR_ITF_SERVERCOUNTER_HPP_

namespace deploymon::monitor {

/**
 * Completed servers counter owned by deployment.
 */
class ServerCounterItf {
public:
    /**
     * Increments number of servers that completed deployment. Called concurrently by monitors.
     */
    virtual void IncrementCompletedServers() = 0;

    /**
     * Destructor.
     */
    virtual ~ServerCounterItf() = default;
};

} // namespace deploymon::monitor

#endif
