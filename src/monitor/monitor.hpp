/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_MONITOR_HPP_
#define DEPLOYMON_MONITOR_MONITOR_HPP_

#include <atomic>
#include <mutex>
#include <string>

#include "config.hpp"
#include "healthprobe.hpp"
#include "httpstatusclient.hpp"
#include "itf/clock.hpp"
#include "itf/httpclient.hpp"
#include "itf/instancecontrol.hpp"
#include "itf/loadbalancer.hpp"
#include "itf/servercounter.hpp"
#include "jobstatus.hpp"
#include "lbregistrar.hpp"
#include "pollloop.hpp"
#include "types.hpp"

namespace deploymon::monitor {

/**
 * Monitors a freshly launched OTP server until it serves traffic behind the load balancer.
 *
 * Terminates the instance if monitoring fails for any reason.
 */
class Monitor {
public:
    /**
     * Initializes monitor.
     *
     * @param config timing configuration.
     * @param deployment deployment descriptor.
     * @param instance monitored instance.
     * @param instanceControl compute control plane.
     * @param loadBalancer load balancer control plane.
     * @param httpClient HTTP client.
     * @param clock clock.
     * @param serverCounter completed servers counter.
     * @param cancelled optional cancellation flag.
     * @return Error.
     */
    Error Init(const Config& config, const DeploymentInfo& deployment, const InstanceInfo& instance,
        InstanceControlItf& instanceControl, LoadBalancerItf& loadBalancer, HTTPClientItf& httpClient,
        ClockItf& clock, ServerCounterItf& serverCounter, const std::atomic<bool>* cancelled = nullptr);

    /**
     * Runs monitoring sequence and finalization. Blocks until done.
     */
    void Run();

    /**
     * Returns job status snapshot.
     *
     * @return JobStatusData.
     */
    JobStatusData GetJobStatus() const { return mJobStatus.GetSnapshot(); }

    /**
     * Returns current phase.
     *
     * @return Phase.
     */
    Phase GetPhase() const;

    /**
     * Returns monitored instance ID.
     *
     * @return const std::string&.
     */
    const std::string& GetInstanceID() const { return mInstance.mID; }

    /**
     * Returns deployment name.
     *
     * @return const std::string&.
     */
    const std::string& GetDeploymentName() const { return mDeployment.mName; }

    /**
     * Returns graph build or download duration.
     *
     * @return Duration.
     */
    Duration GetGraphTaskDuration() const { return mGraphTaskDuration; }

    /**
     * Returns expected location of otp-runner log uploaded by the instance.
     *
     * @return std::string.
     */
    std::string GetRunnerLogPath() const;

private:
    static constexpr auto cInitialMessage = "Checking server status...";
    static constexpr auto cGraphLoadedPct = 90.0;

    void               RunPhases();
    void               Finalize();
    bool               HandlePollResult(const PollResult& result, const std::string& timeoutMessage);
    void               FailJob(const std::string& message);
    void               SetPhase(Phase phase);
    RetWithError<bool> CheckRunnerCompletion(const std::string& url);
    std::string        GetBaseURL() const;

    Config              mConfig;
    DeploymentInfo      mDeployment;
    InstanceInfo        mInstance;
    InstanceControlItf* mInstanceControl {};
    ClockItf*           mClock {};
    ServerCounterItf*   mServerCounter {};

    HealthProbe           mHealthProbe;
    PollLoop              mPollLoop;
    HTTPStatusClient      mStatusClient;
    LBRegistrar           mRegistrar;
    JobStatus             mJobStatus;
    PollLoop::HealthCheck mHealthCheck;

    mutable std::mutex mMutex;
    Phase              mPhase = PhaseEnum::eIdle;
    Duration           mGraphTaskDuration {};
    std::string        mRunnerError;
};

} // namespace deploymon::monitor

#endif
