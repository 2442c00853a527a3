/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_DEPLOYMENT_DEPLOYMENT_HPP_
#define DEPLOYMON_DEPLOYMENT_DEPLOYMENT_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <monitor/monitor.hpp>

#include "itf/clientfactory.hpp"

namespace deploymon::deployment {

/**
 * Monitoring result of one instance.
 */
struct ServerResult {
    std::string            mInstanceID;
    monitor::Phase         mPhase = monitor::PhaseEnum::eIdle;
    monitor::JobStatusData mStatus;
    std::string            mRunnerLogPath;
};

/**
 * Deployment: runs one monitor per launched instance and counts servers that completed deployment.
 *
 * Each monitor gets its own control plane clients created by client factory.
 */
class Deployment : public monitor::ServerCounterItf {
public:
    /**
     * Destructor.
     */
    ~Deployment();

    /**
     * Initializes deployment.
     *
     * @param config monitor timing configuration.
     * @param deployment deployment descriptor.
     * @param clientFactory creates control plane clients for each monitor.
     * @param httpClient HTTP client.
     * @param clock clock.
     * @return Error.
     */
    Error Init(const monitor::Config& config, const monitor::DeploymentInfo& deployment,
        ClientFactoryItf& clientFactory, monitor::HTTPClientItf& httpClient, monitor::ClockItf& clock);

    /**
     * Starts monitoring of instances. Each instance is monitored on its own thread.
     *
     * @param instances instances to monitor.
     * @return Error.
     */
    Error Start(const std::vector<monitor::InstanceInfo>& instances);

    /**
     * Blocks until all monitors are finished.
     */
    void Wait();

    /**
     * Requests running monitors to stop. Stopped monitors fail their jobs.
     */
    void Cancel();

    /**
     * Increments number of servers that completed deployment.
     */
    void IncrementCompletedServers() override;

    /**
     * Returns number of servers that completed deployment.
     *
     * @return size_t.
     */
    size_t GetCompletedServers() const { return mCompletedServers.load(); }

    /**
     * Returns results of all monitors.
     *
     * @return std::vector<ServerResult>.
     */
    std::vector<ServerResult> GetResults() const;

    /**
     * Returns true if any monitor failed.
     *
     * @return bool.
     */
    bool HasFailures() const;

private:
    monitor::Config         mConfig;
    monitor::DeploymentInfo mDeployment;
    ClientFactoryItf*       mClientFactory {};
    monitor::HTTPClientItf* mHTTPClient {};
    monitor::ClockItf*      mClock {};

    mutable std::mutex                             mMutex;
    std::vector<MonitorClients>                    mClients;
    std::vector<std::unique_ptr<monitor::Monitor>> mMonitors;
    std::vector<std::thread>                       mThreads;
    std::atomic<size_t>                            mCompletedServers {0};
    std::atomic<bool>                              mCancelled {false};
};

} // namespace deploymon::deployment

#endif
