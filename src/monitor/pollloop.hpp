/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_POLLLOOP_HPP_
#define DEPLOYMON_MONITOR_POLLLOOP_HPP_

#include <atomic>
#include <functional>
#include <optional>
#include <string>

#include "itf/clock.hpp"
#include "types.hpp"

namespace deploymon::monitor {

/**
 * Health checked bounded retry loop.
 */
class PollLoop {
public:
    /**
     * Poll action. Returns true when awaited condition is reached, error to stop polling with failure.
     */
    using Action = std::function<RetWithError<bool>()>;

    /**
     * Instance health check.
     */
    using HealthCheck = std::function<RetWithError<HealthResult>()>;

    /**
     * Initializes poll loop.
     *
     * @param clock clock.
     * @param cancelled optional cancellation flag.
     * @return Error.
     */
    Error Init(ClockItf& clock, const std::atomic<bool>* cancelled = nullptr);

    /**
     * Runs action until it succeeds, deadline elapses or instance becomes unhealthy.
     *
     * Each attempt checks health, sleeps for delay, checks health again and then runs action.
     *
     * @param action poll action.
     * @param healthCheck instance health check.
     * @param delay delay between attempts.
     * @param deadline max loop duration.
     * @param description what is awaited, for logging.
     * @return PollResult.
     */
    PollResult Run(const Action& action, const HealthCheck& healthCheck, Duration delay, Duration deadline,
        const std::string& description);

private:
    std::optional<PollResult> CheckInterruption(const HealthCheck& healthCheck) const;

    ClockItf*                mClock {};
    const std::atomic<bool>* mCancelled {};
};

} // namespace deploymon::monitor

#endif
