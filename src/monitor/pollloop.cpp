/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "pollloop.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error PollLoop::Init(ClockItf& clock, const std::atomic<bool>* cancelled)
{
    mClock     = &clock;
    mCancelled = cancelled;

    return ErrorEnum::eNone;
}

PollResult PollLoop::Run(const Action& action, const HealthCheck& healthCheck, Duration delay, Duration deadline,
    const std::string& description)
{
    const auto startTime = mClock->Now();

    for (size_t attempt = 1;; attempt++) {
        if (auto result = CheckInterruption(healthCheck); result.has_value()) {
            return *result;
        }

        LOG_INF() << "Waiting for " << description.c_str() << Log::Field("attempt", attempt)
                  << Log::Field("delay", delay);

        mClock->Sleep(delay);

        if (auto result = CheckInterruption(healthCheck); result.has_value()) {
            return *result;
        }

        auto [done, err] = action();
        if (!err.IsNone()) {
            LOG_ERR() << "Poll action failed" << Log::Field("description", description.c_str()) << Log::Field(err);

            return {PollStatusEnum::eFailed, err.Message()};
        }

        if (done) {
            LOG_DBG() << "Poll completed" << Log::Field("description", description.c_str())
                      << Log::Field("attempt", attempt);

            return {PollStatusEnum::eCompleted, ""};
        }

        if (mClock->Now().Sub(startTime) >= deadline) {
            LOG_WRN() << "Poll timed out" << Log::Field("description", description.c_str())
                      << Log::Field("deadline", deadline);

            return {PollStatusEnum::eTimedOut, ""};
        }
    }
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::optional<PollResult> PollLoop::CheckInterruption(const HealthCheck& healthCheck) const
{
    if (mCancelled && mCancelled->load()) {
        return PollResult {PollStatusEnum::eCancelled, "cancelled"};
    }

    auto [health, err] = healthCheck();
    if (!err.IsNone()) {
        LOG_WRN() << "Instance health check failed" << Log::Field(err);

        return std::nullopt;
    }

    if (health.mStatus.GetValue() == HealthStatusEnum::eTerminal) {
        return PollResult {PollStatusEnum::eAborted, health.mStateName};
    }

    return std::nullopt;
}

} // namespace deploymon::monitor
