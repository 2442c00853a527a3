/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>

#include "deploymoncore.hpp"

namespace deploymon::app {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void DeploymonCore::Init(const std::string& configFile)
{
    LOG_DBG() << "Deploymon core size" << Log::Field("size", sizeof(DeploymonCore));

    auto err = config::ParseConfig(configFile.empty() ? cDefaultConfigFile : configFile, mConfig);
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't parse config");

    // Initialize cloud clients

    const auto&            aws = mConfig.mAWS;
    cloud::AWSClientConfig awsConfig;

    awsConfig.mCredentials      = {aws.mAccessKeyID, aws.mSecretAccessKey, aws.mSessionToken};
    awsConfig.mRegion           = config::GetRegion(mConfig);
    awsConfig.mEndpointOverride = aws.mEndpointOverride;
    awsConfig.mRequestTimeout   = aws.mRequestTimeout;

    err = mClientFactory.Init(awsConfig, mConfig.mDeployment.mRole);
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't initialize client factory");

    err = mHTTPClient.Init(mConfig.mHTTPTimeout);
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't initialize HTTP client");

    // Initialize deployment

    err = mDeployment.Init(mConfig.mMonitor, mConfig.mDeployment, mClientFactory, mHTTPClient, mClock);
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't initialize deployment");
}

void DeploymonCore::Start()
{
    LOG_INF() << "Start deployment monitoring" << Log::Field("deployment", mConfig.mDeployment.mName.c_str())
              << Log::Field("instances", mConfig.mInstances.size());

    auto err = mDeployment.Start(mConfig.mInstances);
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't start deployment");
}

void DeploymonCore::Stop()
{
    LOG_INF() << "Stop deployment monitoring";

    mDeployment.Cancel();
}

void DeploymonCore::Wait()
{
    mDeployment.Wait();
}

bool DeploymonCore::ReportResults() const
{
    for (const auto& result : mDeployment.GetResults()) {
        if (result.mStatus.mError) {
            LOG_ERR() << "Server deployment failed" << Log::Field("instanceID", result.mInstanceID.c_str())
                      << Log::Field("phase", result.mPhase) << Log::Field("message", result.mStatus.mMessage.c_str());

            continue;
        }

        LOG_INF() << "Server deployment finished" << Log::Field("instanceID", result.mInstanceID.c_str())
                  << Log::Field("phase", result.mPhase) << Log::Field("completed", result.mStatus.mCompleted)
                  << Log::Field("message", result.mStatus.mMessage.c_str());
    }

    LOG_INF() << "Deployment monitoring finished" << Log::Field("deployment", mConfig.mDeployment.mName.c_str())
              << Log::Field("completedServers", mDeployment.GetCompletedServers());

    return !mDeployment.HasFailures();
}

} // namespace deploymon::app
