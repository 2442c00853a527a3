/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_EC2CLIENT_HPP_
#define DEPLOYMON_CLOUD_EC2CLIENT_HPP_

#include <optional>
#include <string>

#include <monitor/itf/instancecontrol.hpp>

#include "awsclient.hpp"

namespace deploymon::cloud {

/**
 * EC2 compute control plane client.
 */
class EC2Client : public monitor::InstanceControlItf {
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
     * Returns current instance state.
     *
     * @param instanceID instance ID.
     * @return RetWithError<std::optional<monitor::InstanceState>>.
     */
    RetWithError<std::optional<monitor::InstanceState>> GetInstanceState(const std::string& instanceID) override;

    /**
     * Terminates instance.
     *
     * @param instanceID instance ID.
     * @return RetWithError<monitor::InstanceState>.
     */
    RetWithError<monitor::InstanceState> TerminateInstance(const std::string& instanceID) override;

private:
    static constexpr auto cService    = "ec2";
    static constexpr auto cAPIVersion = "2016-11-15";

    AWSClient mClient;
};

/**
 * Parses DescribeInstances response.
 *
 * @param xml response body.
 * @param instanceID instance ID.
 * @return RetWithError<std::optional<monitor::InstanceState>> empty optional if instance is not in response.
 */
RetWithError<std::optional<monitor::InstanceState>> ParseDescribeInstancesResponse(
    const std::string& xml, const std::string& instanceID);

/**
 * Parses TerminateInstances response.
 *
 * @param xml response body.
 * @param instanceID instance ID.
 * @return RetWithError<monitor::InstanceState> current instance state.
 */
RetWithError<monitor::InstanceState> ParseTerminateInstancesResponse(
    const std::string& xml, const std::string& instanceID);

} // namespace deploymon::cloud

#endif
