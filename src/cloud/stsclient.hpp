/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_STSCLIENT_HPP_
#define DEPLOYMON_CLOUD_STSCLIENT_HPP_

#include <mutex>
#include <optional>
#include <string>

#include <Poco/Timestamp.h>

#include "awsclient.hpp"
#include "itf/credentialsprovider.hpp"

namespace deploymon::cloud {

/**
 * Temporary credentials of assumed role.
 */
struct AssumedRole {
    Credentials     mCredentials;
    Poco::Timestamp mExpiration;
};

/**
 * Security token service client.
 */
class STSClient {
public:
    /**
     * Initializes client.
     *
     * @param config AWS client config. Config credentials are used to assume roles.
     * @return Error.
     */
    Error Init(const AWSClientConfig& config);

    /**
     * Assumes role.
     *
     * @param roleARN role ARN.
     * @param sessionName role session name.
     * @return RetWithError<AssumedRole>.
     */
    RetWithError<AssumedRole> AssumeRole(const std::string& roleARN, const std::string& sessionName);

private:
    static constexpr auto cService    = "sts";
    static constexpr auto cAPIVersion = "2011-06-15";

    AWSClient mClient;
};

/**
 * Provides credentials of assumed role and renews them before they expire.
 */
class AssumeRoleCredentialsProvider : public CredentialsProviderItf {
public:
    /**
     * Initializes provider.
     *
     * @param stsClient STS client.
     * @param roleARN role ARN.
     * @param sessionName role session name.
     * @return Error.
     */
    Error Init(STSClient& stsClient, const std::string& roleARN, const std::string& sessionName);

    /**
     * Returns credentials of assumed role.
     *
     * @return RetWithError<Credentials>.
     */
    RetWithError<Credentials> GetCredentials() override;

private:
    static constexpr auto cRenewBeforeExpirationSec = 5 * 60;

    std::mutex                 mMutex;
    STSClient*                 mSTSClient {};
    std::string                mRoleARN;
    std::string                mSessionName;
    std::optional<AssumedRole> mAssumedRole;
};

/**
 * Parses AssumeRole response.
 *
 * @param xml response body.
 * @return RetWithError<AssumedRole>.
 */
RetWithError<AssumedRole> ParseAssumeRoleResponse(const std::string& xml);

} // namespace deploymon::cloud

#endif
