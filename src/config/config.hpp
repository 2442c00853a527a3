/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CONFIG_CONFIG_HPP_
#define DEPLOYMON_CONFIG_CONFIG_HPP_

#include <string>
#include <vector>

#include <common/types.hpp>
#include <monitor/config.hpp>
#include <monitor/types.hpp>

namespace deploymon::config {

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/*
 * AWS access configuration.
 */
struct AWS {
    std::string mRegion;
    std::string mAccessKeyID;
    std::string mSecretAccessKey;
    std::string mSessionToken;
    std::string mEndpointOverride;
    Duration    mRequestTimeout;
};

/*
 * Deploymon configuration.
 */
struct Config {
    AWS                                mAWS;
    monitor::DeploymentInfo            mDeployment;
    monitor::Config                    mMonitor;
    Duration                           mHTTPTimeout;
    std::vector<monitor::InstanceInfo> mInstances;
};

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses config from file.
 *
 * @param filename config file name.
 * @param[out] config config instance.
 * @return Error.
 */
Error ParseConfig(const std::string& filename, Config& config);

/**
 * Parses config from stream.
 *
 * @param in input stream.
 * @param[out] config config instance.
 * @return Error.
 */
Error ParseConfig(std::istream& in, Config& config);

/**
 * Returns region of control plane endpoints: deployment custom region if set, AWS region otherwise.
 *
 * @param config config.
 * @return std::string.
 */
std::string GetRegion(const Config& config);

} // namespace deploymon::config

#endif // DEPLOYMON_CONFIG_CONFIG_HPP_
