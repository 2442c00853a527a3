/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <common/logger/logmodule.hpp>

#include "monitor.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Monitor::Init(const Config& config, const DeploymentInfo& deployment, const InstanceInfo& instance,
    InstanceControlItf& instanceControl, LoadBalancerItf& loadBalancer, HTTPClientItf& httpClient, ClockItf& clock,
    ServerCounterItf& serverCounter, const std::atomic<bool>* cancelled)
{
    LOG_DBG() << "Initialize monitor" << Log::Field("instanceID", instance.mID.c_str())
              << Log::Field("publicIP", instance.mPublicIP.c_str());

    if (instance.mID.empty() || instance.mPublicIP.empty()) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "instance ID and public IP are required"));
    }

    mConfig          = config;
    mDeployment      = deployment;
    mInstance        = instance;
    mInstanceControl = &instanceControl;
    mClock           = &clock;
    mServerCounter   = &serverCounter;

    if (auto err = mHealthProbe.Init(instanceControl); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mPollLoop.Init(clock, cancelled); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mStatusClient.Init(httpClient); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = mRegistrar.Init(loadBalancer, mPollLoop); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    mHealthCheck = [this]() { return mHealthProbe.Check(mInstance.mID); };

    mJobStatus.Update(cInitialMessage, 0);

    return ErrorEnum::eNone;
}

void Monitor::Run()
{
    LOG_INF() << "Monitor server setup" << Log::Field("instanceID", mInstance.mID.c_str())
              << Log::Field("publicIP", mInstance.mPublicIP.c_str());

    RunPhases();
    Finalize();

    const auto status = mJobStatus.GetSnapshot();

    LOG_INF() << "Monitor finished" << Log::Field("instanceID", mInstance.mID.c_str())
              << Log::Field("phase", GetPhase()) << Log::Field("error", status.mError);
}

Phase Monitor::GetPhase() const
{
    std::lock_guard lock {mMutex};

    return mPhase;
}

std::string Monitor::GetRunnerLogPath() const
{
    return mDeployment.mLogFolderURI + "/" + mInstance.mID + "-otp-runner.log";
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Monitor::RunPhases()
{
    if (mDeployment.mTargetGroupARN.empty()) {
        FailJob("There is no load balancer under which to register ec2 instance.");

        return;
    }

    const auto baseURL   = GetBaseURL();
    const auto statusURL = baseURL + "/" + mDeployment.mStatusFile;

    // Wait for otp-runner to produce first status file.

    SetPhase(PhaseEnum::eAwaitingStatusFile);

    auto result = mPollLoop.Run(
        [&]() -> RetWithError<bool> { return {mStatusClient.Reachable(statusURL), ErrorEnum::eNone}; }, mHealthCheck,
        mConfig.mPollDelay, mConfig.mStatusFileTimeout, "otp-runner status file availability check: " + statusURL);

    if (!HandlePollResult(result, "Job timed out while waiting for otp-runner to produce a status file!")) {
        return;
    }

    // Wait for otp-runner to report graph build/upload or server start.

    SetPhase(PhaseEnum::eAwaitingRunnerCompletion);

    const auto runnerStartTime = mClock->Now();
    const auto runnerTimeout
        = mDeployment.mGraphAlreadyBuilt ? mConfig.mGraphLoadTimeout : mConfig.mGraphBuildTimeout;

    result = mPollLoop.Run([&]() { return CheckRunnerCompletion(statusURL); }, mHealthCheck, mConfig.mPollDelay,
        runnerTimeout, "otp-runner completion check: " + statusURL);

    if (!HandlePollResult(result, "Job timed out while waiting for otp-runner to finish!")) {
        return;
    }

    mGraphTaskDuration = mClock->Now().Sub(runnerStartTime);

    std::ostringstream graphMessage;

    graphMessage << "Graph build/download completed in " << mGraphTaskDuration.Seconds() << " seconds!";

    LOG_INF() << graphMessage.str().c_str() << Log::Field("instanceID", mInstance.mID.c_str());

    if (mDeployment.IsBuildOnly()) {
        SetPhase(PhaseEnum::eBuildCompleted);
        mJobStatus.CompleteSuccessfully(graphMessage.str());

        LOG_INF() << "View logs at" << Log::Field("path", GetRunnerLogPath().c_str());

        return;
    }

    // Wait for router, it indicates that graph is loaded.

    SetPhase(PhaseEnum::eAwaitingRouter);

    const auto routerURL = baseURL + "/" + cRouterPath;

    result = mPollLoop.Run(
        [&]() -> RetWithError<bool> { return {mStatusClient.Reachable(routerURL), ErrorEnum::eNone}; }, mHealthCheck,
        mConfig.mPollDelay, mConfig.mRouterTimeout, "router to become available: " + routerURL);

    if (!HandlePollResult(result, "Job timed out while waiting for trip planner to start up.")) {
        return;
    }

    mJobStatus.Update("Graph loaded!", cGraphLoadedPct);

    // Register instance with load balancer.

    SetPhase(PhaseEnum::eRegisteringWithLB);

    result = mRegistrar.RegisterAndConfirm(
        mDeployment.mTargetGroupARN, mInstance.mID, mHealthCheck, mConfig.mPollDelay, mConfig.mRegisterTimeout);

    if (!HandlePollResult(
            result, "Job timed out while waiting to register EC2 instance with load balancer target group.")) {
        return;
    }

    SetPhase(PhaseEnum::eSucceeded);

    mJobStatus.CompleteSuccessfully("Server successfully registered with load balancer " + mDeployment.mTargetGroupARN
        + ". OTP running at " + routerURL);

    LOG_INF() << "View logs at" << Log::Field("path", GetRunnerLogPath().c_str());

    mServerCounter->IncrementCompletedServers();
}

void Monitor::Finalize()
{
    if (!mJobStatus.IsError()) {
        return;
    }

    LOG_WRN() << "Terminate instance" << Log::Field("instanceID", mInstance.mID.c_str());

    auto [state, err] = mInstanceControl->TerminateInstance(mInstance.mID);
    if (!err.IsNone()) {
        LOG_ERR() << "Can't terminate instance" << Log::Field("instanceID", mInstance.mID.c_str()) << Log::Field(err);

        return;
    }

    LOG_DBG() << "Instance terminate requested" << Log::Field("instanceID", mInstance.mID.c_str())
              << Log::Field("state", state.mName.c_str()) << Log::Field("code", state.mCode);

    if (state.mCode == cInstanceStateTerminated) {
        LOG_INF() << "Instance is terminated!" << Log::Field("instanceID", mInstance.mID.c_str());

        mJobStatus.SetInstanceTerminated();
    }
}

bool Monitor::HandlePollResult(const PollResult& result, const std::string& timeoutMessage)
{
    switch (result.mStatus.GetValue()) {
    case PollStatusEnum::eCompleted:
        return true;

    case PollStatusEnum::eTimedOut:
        FailJob(timeoutMessage);
        break;

    case PollStatusEnum::eAborted:
        FailJob("Instance state no longer healthy! It changed to: " + result.mReason
            + ". Ec2 Instance was stopped or terminated before job could complete!");
        break;

    case PollStatusEnum::eCancelled:
        FailJob("Server monitoring was cancelled before job could complete!");
        break;

    case PollStatusEnum::eFailed:
    default:
        FailJob(result.mReason);
        break;
    }

    return false;
}

void Monitor::FailJob(const std::string& message)
{
    SetPhase(PhaseEnum::eFailed);

    LOG_ERR() << "Server setup failed" << Log::Field("instanceID", mInstance.mID.c_str())
              << Log::Field("message", message.c_str());

    mJobStatus.Fail(message + " Check logs at: " + GetRunnerLogPath());
}

void Monitor::SetPhase(Phase phase)
{
    std::lock_guard lock {mMutex};

    LOG_DBG() << "Phase changed" << Log::Field("instanceID", mInstance.mID.c_str()) << Log::Field("from", mPhase)
              << Log::Field("to", phase);

    mPhase = phase;
}

RetWithError<bool> Monitor::CheckRunnerCompletion(const std::string& url)
{
    const auto status = mStatusClient.FetchRunnerStatus(url);
    if (!status.has_value()) {
        return {false, ErrorEnum::eNone};
    }

    if (status->mError) {
        // Error keeps message pointer only, so message should outlive the poll loop result.
        mRunnerError = status->mMessage;

        return {false, Error(ErrorEnum::eFailed, mRunnerError.c_str())};
    }

    mJobStatus.Update(status->mMessage, status->mPctProgress);

    return {IsRunnerCompleted(*status, mDeployment.IsBuildOnly()), ErrorEnum::eNone};
}

std::string Monitor::GetBaseURL() const
{
    return "http://" + mInstance.mPublicIP;
}

} // namespace deploymon::monitor
