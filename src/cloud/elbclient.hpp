/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_ELBCLIENT_HPP_
#define DEPLOYMON_CLOUD_ELBCLIENT_HPP_

#include <string>
#include <vector>

#include <monitor/itf/loadbalancer.hpp>

#include "awsclient.hpp"

namespace deploymon::cloud {

/**
 * Elastic load balancing (v2) control plane client.
 */
class ELBClient : public monitor::LoadBalancerItf {
public:
    /**
     * Initializes client.
     *
     * @param config AWS client config.
     * @param credentialsProvider credentials provider, config credentials are used if not set.
     * @return Error.
     */
    Error Init(const AWSClientConfig& config, CredentialsProviderItf* credentialsProvider = nullptr);

    /**
     * Registers instance in target group.
     *
     * @param targetGroup target group ARN.
     * @param instanceID instance ID.
     * @return Error.
     */
    Error RegisterTarget(const std::string& targetGroup, const std::string& instanceID) override;

    /**
     * Returns health of targets registered in target group.
     *
     * @param targetGroup target group ARN.
     * @return RetWithError<std::vector<monitor::TargetHealth>>.
     */
    RetWithError<std::vector<monitor::TargetHealth>> GetTargetHealth(const std::string& targetGroup) override;

private:
    static constexpr auto cService    = "elasticloadbalancing";
    static constexpr auto cAPIVersion = "2015-12-01";

    AWSClient mClient;
};

/**
 * Parses DescribeTargetHealth response.
 *
 * @param xml response body.
 * @return RetWithError<std::vector<monitor::TargetHealth>>.
 */
RetWithError<std::vector<monitor::TargetHealth>> ParseDescribeTargetHealthResponse(const std::string& xml);

} // namespace deploymon::cloud

#endif
