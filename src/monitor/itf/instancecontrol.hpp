/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_ITF_INSTANCECONTROL_HPP_
#define DEPLOYMON_MONITOR_ITF_INSTANCECONTROL_HPP_

#include <optional>
#include <string>

#include <monitor/types.hpp>

namespace deploymon::monitor {

/**
 * Compute instance control plane interface.
 */
class InstanceControlItf {
public:
    /**
     * Returns current instance state.
     *
     * @param instanceID instance ID.
     * @return RetWithError<std::optional<InstanceState>> empty optional if instance is not in response.
     */
    virtual RetWithError<std::optional<InstanceState>> GetInstanceState(const std::string& instanceID) = 0;

    /**
     * Terminates instance.
     *
     * @param instanceID instance ID.
     * @return RetWithError<InstanceState> instance state after termination request.
     */
    virtual RetWithError<InstanceState> TerminateInstance(const std::string& instanceID) = 0;

    /**
     * Destructor.
     */
    virtual ~InstanceControlItf() = default;
};

} // namespace deploymon::monitor

#endif
