/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_CLIENTFACTORY_HPP_
#define DEPLOYMON_CLOUD_CLIENTFACTORY_HPP_

#include <string>

#include <deployment/itf/clientfactory.hpp>

#include "ec2client.hpp"
#include "elbclient.hpp"
#include "stsclient.hpp"

namespace deploymon::cloud {

/**
 * Creates EC2 and ELB clients per monitor. If role is set, each monitor signs its calls with credentials of its own
 * role session.
 */
class ClientFactory : public deployment::ClientFactoryItf {
public:
    /**
     * Initializes factory.
     *
     * @param config AWS client config.
     * @param roleARN role to assume for each monitor, config credentials are used if empty.
     * @return Error.
     */
    Error Init(const AWSClientConfig& config, const std::string& roleARN);

    /**
     * Creates clients for instance monitor.
     *
     * @param instanceID instance ID.
     * @param[out] clients created clients.
     * @return Error.
     */
    Error CreateClients(const std::string& instanceID, deployment::MonitorClients& clients) override;

private:
    static constexpr auto cSessionPrefix = "monitor-";

    struct MonitorSession {
        AssumeRoleCredentialsProvider mCredentialsProvider;
        EC2Client                     mEC2Client;
        ELBClient                     mELBClient;
    };

    AWSClientConfig mConfig;
    std::string     mRoleARN;
    STSClient       mSTSClient;
};

} // namespace deploymon::cloud

#endif
