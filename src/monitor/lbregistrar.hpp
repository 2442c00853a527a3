/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_LBREGISTRAR_HPP_
#define DEPLOYMON_MONITOR_LBREGISTRAR_HPP_

#include <string>

#include "itf/loadbalancer.hpp"
#include "pollloop.hpp"

namespace deploymon::monitor {

/**
 * Registers instance in load balancer target group and confirms registration.
 */
class LBRegistrar {
public:
    /**
     * Initializes registrar.
     *
     * @param loadBalancer load balancer control plane.
     * @param pollLoop poll loop.
     * @return Error.
     */
    Error Init(LoadBalancerItf& loadBalancer, PollLoop& pollLoop);

    /**
     * Registers instance and waits until it appears in target group health description.
     *
     * @param targetGroup target group ARN.
     * @param instanceID instance ID.
     * @param healthCheck instance health check.
     * @param delay delay between attempts.
     * @param deadline registration deadline.
     * @return PollResult.
     */
    PollResult RegisterAndConfirm(const std::string& targetGroup, const std::string& instanceID,
        const PollLoop::HealthCheck& healthCheck, Duration delay, Duration deadline);

private:
    bool IsRegistered(const std::string& targetGroup, const std::string& instanceID);

    LoadBalancerItf* mLoadBalancer {};
    PollLoop*        mPollLoop {};
};

} // namespace deploymon::monitor

#endif
