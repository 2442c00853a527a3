/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_HEALTHPROBE_HPP_
#define DEPLOYMON_MONITOR_HEALTHPROBE_HPP_

#include <string>

#include "itf/instancecontrol.hpp"
#include "types.hpp"

namespace deploymon::monitor {

/**
 * Classifies monitored instance lifecycle state.
 */
class HealthProbe {
public:
    /**
     * Initializes health probe.
     *
     * @param instanceControl compute control plane.
     * @return Error.
     */
    Error Init(InstanceControlItf& instanceControl);

    /**
     * Checks instance health.
     *
     * Instance missing from control plane response is considered healthy.
     *
     * @param instanceID instance ID.
     * @return RetWithError<HealthResult> error on control plane failure.
     */
    RetWithError<HealthResult> Check(const std::string& instanceID);

    /**
     * Returns true if state is stopping, stopped, shutting down or terminated.
     *
     * @param state instance state.
     * @return bool.
     */
    static bool IsTerminal(const InstanceState& state);

private:
    InstanceControlItf* mInstanceControl {};
};

} // namespace deploymon::monitor

#endif
