/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_ITF_CLOCK_HPP_
#define DEPLOYMON_MONITOR_ITF_CLOCK_HPP_

#include <common/types.hpp>

namespace deploymon::monitor {

/**
 * Clock interface.
 */
class ClockItf {
public:
    /**
     * Returns current time.
     *
     * @return Time.
     */
    virtual Time Now() const = 0;

    /**
     * Blocks calling thread for duration.
     *
     * @param duration duration.
     */
    virtual void Sleep(Duration duration) = 0;

    /**
     * Destructor.
     */
    virtual ~ClockItf() = default;
};

} // namespace deploymon::monitor

#endif
