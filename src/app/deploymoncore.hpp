/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_APP_DEPLOYMONCORE_HPP_
#define DEPLOYMON_APP_DEPLOYMONCORE_HPP_

#include <string>

#include <cloud/clientfactory.hpp>
#include <cloud/httpclient.hpp>
#include <config/config.hpp>
#include <deployment/deployment.hpp>
#include <monitor/clock.hpp>

namespace deploymon::app {

/**
 * Deploymon core instance: owns clients and deployment.
 */
class DeploymonCore {
public:
    /**
     * Initializes deploymon core.
     *
     * @param configFile path to config file.
     */
    void Init(const std::string& configFile);

    /**
     * Starts monitoring of configured instances.
     */
    void Start();

    /**
     * Cancels running monitors. Use Wait to wait for them.
     */
    void Stop();

    /**
     * Blocks until all monitors are finished.
     */
    void Wait();

    /**
     * Logs monitoring results.
     *
     * @return true if all monitors succeeded.
     */
    bool ReportResults() const;

private:
    static constexpr auto cDefaultConfigFile = "deploymon.json";

    config::Config         mConfig;
    cloud::ClientFactory   mClientFactory;
    cloud::HTTPClient      mHTTPClient;
    monitor::SystemClock   mClock;
    deployment::Deployment mDeployment;
};

} // namespace deploymon::app

#endif
