/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_AWSSIGNER_HPP_
#define DEPLOYMON_CLOUD_AWSSIGNER_HPP_

#include <map>
#include <string>

#include <Poco/Net/HTTPRequest.h>
#include <Poco/Timestamp.h>

#include <common/types.hpp>

namespace deploymon::cloud {

/**
 * AWS credentials.
 */
struct Credentials {
    std::string mAccessKeyID;
    std::string mSecretAccessKey;
    std::string mSessionToken;
};

/**
 * Request part covered by signature.
 */
struct CanonicalRequest {
    std::string                        mMethod;
    std::string                        mPath;
    std::string                        mQuery;
    std::map<std::string, std::string> mHeaders;
    std::string                        mPayload;
};

/**
 * AWS Signature Version 4 signer.
 */
class AWSSigner {
public:
    /**
     * Initializes signer.
     *
     * @param credentials credentials.
     * @param region region.
     * @param service service name.
     * @return Error.
     */
    Error Init(const Credentials& credentials, const std::string& region, const std::string& service);

    /**
     * Signs HTTP request: sets x-amz-date, x-amz-security-token and Authorization headers.
     *
     * @param request HTTP request with host and content type set.
     * @param payload request payload.
     * @param now signing time.
     */
    void Sign(Poco::Net::HTTPRequest& request, const std::string& payload, const Poco::Timestamp& now) const;

    /**
     * Returns Authorization header value.
     *
     * @param request canonical request. Header names should be lower case and include x-amz-date.
     * @param amzDate request date in ISO 8601 basic format.
     * @return std::string.
     */
    std::string GetAuthorization(const CanonicalRequest& request, const std::string& amzDate) const;

    /**
     * Returns canonical request string.
     *
     * @param request canonical request.
     * @return std::string.
     */
    static std::string FormatCanonicalRequest(const CanonicalRequest& request);

    /**
     * Returns hex encoded signing key.
     *
     * @param date date in YYYYMMDD format.
     * @return std::string.
     */
    std::string GetSigningKeyHex(const std::string& date) const;

    /**
     * Returns hex encoded SHA256 of data.
     *
     * @param data data.
     * @return std::string.
     */
    static std::string SHA256Hex(const std::string& data);

private:
    static constexpr auto cAlgorithm  = "AWS4-HMAC-SHA256";
    static constexpr auto cTerminator = "aws4_request";

    static std::string HMACSHA256(const std::string& key, const std::string& data);
    static std::string ToHex(const std::string& data);

    std::string GetSigningKey(const std::string& date) const;
    std::string GetScope(const std::string& date) const;

    Credentials mCredentials;
    std::string mRegion;
    std::string mService;
};

} // namespace deploymon::cloud

#endif
