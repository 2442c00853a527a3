/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_DEPLOYMENT_ITF_CLIENTFACTORY_HPP_
#define DEPLOYMON_DEPLOYMENT_ITF_CLIENTFACTORY_HPP_

#include <memory>
#include <string>

#include <monitor/itf/instancecontrol.hpp>
#include <monitor/itf/loadbalancer.hpp>

namespace deploymon::deployment {

/**
 * Control plane clients owned by one monitor.
 */
struct MonitorClients {
    std::shared_ptr<monitor::InstanceControlItf> mInstanceControl;
    std::shared_ptr<monitor::LoadBalancerItf>    mLoadBalancer;
};

/**
 * Creates control plane clients scoped to credentials of one monitor.
 */
class ClientFactoryItf {
public:
    /**
     * Creates clients for monitor of instance.
     *
     * @param instanceID instance ID.
     * @param[out] clients created clients.
     * @return Error.
     */
    virtual Error CreateClients(const std::string& instanceID, MonitorClients& clients) = 0;

    /**
     * Destructor.
     */
    virtual ~ClientFactoryItf() = default;
};

} // namespace deploymon::deployment

#endif
