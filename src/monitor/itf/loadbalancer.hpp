/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_ITF_LOADBALANCER_HPP_
#define DEPLOYMON_MONITOR_ITF_LOADBALANCER_HPP_

#include <string>
#include <vector>

#include <monitor/types.hpp>

namespace deploymon::monitor {

/**
 * Load balancer control plane interface.
 */
class LoadBalancerItf {
public:
    /**
     * Registers instance in target group. Repeated calls are allowed.
     *
     * @param targetGroup target group ARN.
     * @param instanceID instance ID.
     * @return Error.
     */
    virtual Error RegisterTarget(const std::string& targetGroup, const std::string& instanceID) = 0;

    /**
     * Returns health of targets registered in target group.
     *
     * @param targetGroup target group ARN.
     * @return RetWithError<std::vector<TargetHealth>>.
     */
    virtual RetWithError<std::vector<TargetHealth>> GetTargetHealth(const std::string& targetGroup) = 0;

    /**
     * Destructor.
     */
    virtual ~LoadBalancerItf() = default;
};

} // namespace deploymon::monitor

#endif
