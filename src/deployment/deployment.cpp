/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <common/logger/logmodule.hpp>

#include "deployment.hpp"

namespace deploymon::deployment {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Deployment::~Deployment()
{
    Cancel();
    Wait();
}

Error Deployment::Init(const monitor::Config& config, const monitor::DeploymentInfo& deployment,
    ClientFactoryItf& clientFactory, monitor::HTTPClientItf& httpClient, monitor::ClockItf& clock)
{
    LOG_DBG() << "Initialize deployment" << Log::Field("name", deployment.mName.c_str());

    mConfig        = config;
    mDeployment    = deployment;
    mClientFactory = &clientFactory;
    mHTTPClient    = &httpClient;
    mClock         = &clock;

    return ErrorEnum::eNone;
}

Error Deployment::Start(const std::vector<monitor::InstanceInfo>& instances)
{
    std::lock_guard lock {mMutex};

    LOG_INF() << "Start deployment" << Log::Field("name", mDeployment.mName.c_str())
              << Log::Field("instances", instances.size());

    if (!mMonitors.empty()) {
        return Error(ErrorEnum::eWrongState, "deployment already started");
    }

    if (instances.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "no instances to monitor");
    }

    for (const auto& instance : instances) {
        MonitorClients clients;

        if (auto err = mClientFactory->CreateClients(instance.mID, clients); !err.IsNone()) {
            mMonitors.clear();
            mClients.clear();

            return AOS_ERROR_WRAP(err);
        }

        auto monitor = std::make_unique<monitor::Monitor>();

        if (auto err = monitor->Init(mConfig, mDeployment, instance, *clients.mInstanceControl,
                *clients.mLoadBalancer, *mHTTPClient, *mClock, *this, &mCancelled);
            !err.IsNone()) {
            mMonitors.clear();
            mClients.clear();

            return AOS_ERROR_WRAP(err);
        }

        mClients.push_back(std::move(clients));
        mMonitors.push_back(std::move(monitor));
    }

    for (auto& monitor : mMonitors) {
        mThreads.emplace_back([monitor = monitor.get()]() { monitor->Run(); });
    }

    return ErrorEnum::eNone;
}

void Deployment::Wait()
{
    std::vector<std::thread> threads;

    {
        std::lock_guard lock {mMutex};

        threads.swap(mThreads);
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    if (!threads.empty()) {
        LOG_INF() << "Deployment finished" << Log::Field("name", mDeployment.mName.c_str())
                  << Log::Field("completedServers", GetCompletedServers());
    }
}

void Deployment::Cancel()
{
    if (!mCancelled.exchange(true)) {
        LOG_DBG() << "Cancel deployment" << Log::Field("name", mDeployment.mName.c_str());
    }
}

void Deployment::IncrementCompletedServers()
{
    const auto completed = ++mCompletedServers;

    LOG_DBG() << "Server completed" << Log::Field("name", mDeployment.mName.c_str())
              << Log::Field("completedServers", completed);
}

std::vector<ServerResult> Deployment::GetResults() const
{
    std::lock_guard lock {mMutex};

    std::vector<ServerResult> results;

    for (const auto& monitor : mMonitors) {
        results.push_back(
            {monitor->GetInstanceID(), monitor->GetPhase(), monitor->GetJobStatus(), monitor->GetRunnerLogPath()});
    }

    return results;
}

bool Deployment::HasFailures() const
{
    const auto results = GetResults();

    return std::any_of(
        results.begin(), results.end(), [](const ServerResult& result) { return result.mStatus.mError; });
}

} // namespace deploymon::deployment
