/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_AWSCLIENT_HPP_
#define DEPLOYMON_CLOUD_AWSCLIENT_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <Poco/Net/HTTPClientSession.h>
#include <Poco/URI.h>

#include "awssigner.hpp"
#include "itf/credentialsprovider.hpp"

namespace deploymon::cloud {

/**
 * Query API request parameters.
 */
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * AWS query API client config.
 */
struct AWSClientConfig {
    Credentials mCredentials;
    std::string mRegion;
    std::string mEndpointOverride;
    Duration    mRequestTimeout;
};

/**
 * Error returned by AWS query API.
 */
struct AWSError {
    std::string mCode;
    std::string mMessage;
};

/**
 * AWS query protocol client.
 */
class AWSClient {
public:
    /**
     * Initializes client.
     *
     * @param config client config.
     * @param service service name used in endpoint and signature scope.
     * @param apiVersion API version.
     * @param credentialsProvider provides credentials for each call. Config credentials are used if not set.
     * @return Error.
     */
    Error Init(const AWSClientConfig& config, const std::string& service, const std::string& apiVersion,
        CredentialsProviderItf* credentialsProvider = nullptr);

    /**
     * Calls API action.
     *
     * @param action action name.
     * @param params action parameters.
     * @return RetWithError<std::string> response body. eNotFound error is returned if AWS error code ends with
     * NotFound.
     */
    RetWithError<std::string> Call(const std::string& action, const QueryParams& params);

    /**
     * Returns endpoint URI.
     *
     * @return const Poco::URI&.
     */
    const Poco::URI& GetEndpoint() const { return mEndpoint; }

private:
    static constexpr auto cContentType = "application/x-www-form-urlencoded; charset=utf-8";

    std::unique_ptr<Poco::Net::HTTPClientSession> CreateSession() const;

    RetWithError<AWSSigner> GetSigner() const;

    AWSClientConfig         mConfig;
    CredentialsProviderItf* mCredentialsProvider {};
    AWSSigner               mSigner;
    Poco::URI               mEndpoint;
    std::string             mService;
    std::string             mAPIVersion;
};

/**
 * Encodes query parameters as form body.
 *
 * @param params parameters.
 * @return std::string.
 */
std::string EncodeQuery(const QueryParams& params);

/**
 * Parses AWS query API error response.
 *
 * @param xml response body.
 * @return AWSError.
 */
AWSError ParseErrorResponse(const std::string& xml);

} // namespace deploymon::cloud

#endif
