/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "clientfactory.hpp"

namespace deploymon::cloud {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ClientFactory::Init(const AWSClientConfig& config, const std::string& roleARN)
{
    LOG_DBG() << "Initialize client factory" << Log::Field("role", roleARN.c_str());

    mConfig  = config;
    mRoleARN = roleARN;

    if (mRoleARN.empty()) {
        return ErrorEnum::eNone;
    }

    if (auto err = mSTSClient.Init(config); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error ClientFactory::CreateClients(const std::string& instanceID, deployment::MonitorClients& clients)
{
    LOG_DBG() << "Create monitor clients" << Log::Field("instanceID", instanceID.c_str());

    auto                    session             = std::make_shared<MonitorSession>();
    CredentialsProviderItf* credentialsProvider = nullptr;

    if (!mRoleARN.empty()) {
        if (auto err = session->mCredentialsProvider.Init(mSTSClient, mRoleARN, cSessionPrefix + instanceID);
            !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        // Assume role now to report access errors before monitoring starts.
        auto [credentials, err] = session->mCredentialsProvider.GetCredentials();
        if (!err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }

        LOG_DBG() << "Monitor credentials ready" << Log::Field("instanceID", instanceID.c_str())
                  << Log::Field("accessKeyID", credentials.mAccessKeyID.c_str());

        credentialsProvider = &session->mCredentialsProvider;
    }

    if (auto err = session->mEC2Client.Init(mConfig, credentialsProvider); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    if (auto err = session->mELBClient.Init(mConfig, credentialsProvider); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    clients.mInstanceControl = std::shared_ptr<monitor::InstanceControlItf>(session, &session->mEC2Client);
    clients.mLoadBalancer    = std::shared_ptr<monitor::LoadBalancerItf>(session, &session->mELBClient);

    return ErrorEnum::eNone;
}

} // namespace deploymon::cloud
