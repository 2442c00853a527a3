/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_CLOCK_HPP_
#define DEPLOYMON_MONITOR_CLOCK_HPP_

#include "itf/clock.hpp"

namespace deploymon::monitor {

/**
 * Wall clock.
 */
class SystemClock : public ClockItf {
public:
    /**
     * Returns current time.
     *
     * @return Time.
     */
    Time Now() const override;

    /**
     * Sleeps for duration.
     *
     * @param duration duration.
     */
    void Sleep(Duration duration) override;
};

} // namespace deploymon::monitor

#endif
