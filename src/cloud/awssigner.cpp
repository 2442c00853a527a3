/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <Poco/DateTimeFormatter.h>
#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/String.h>

#include <common/utils/exception.hpp>

#include "awssigner.hpp"

namespace deploymon::cloud {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error AWSSigner::Init(const Credentials& credentials, const std::string& region, const std::string& service)
{
    if (credentials.mAccessKeyID.empty() || credentials.mSecretAccessKey.empty()) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "AWS credentials are not set"));
    }

    mCredentials = credentials;
    mRegion      = region;
    mService     = service;

    return ErrorEnum::eNone;
}

void AWSSigner::Sign(Poco::Net::HTTPRequest& request, const std::string& payload, const Poco::Timestamp& now) const
{
    const auto amzDate = Poco::DateTimeFormatter::format(now, "%Y%m%dT%H%M%SZ");

    request.set("X-Amz-Date", amzDate);

    if (!mCredentials.mSessionToken.empty()) {
        request.set("X-Amz-Security-Token", mCredentials.mSessionToken);
    }

    CanonicalRequest canonical;

    canonical.mMethod  = request.getMethod();
    canonical.mPayload = payload;

    const auto& uri = request.getURI();

    if (auto pos = uri.find('?'); pos != std::string::npos) {
        canonical.mPath  = uri.substr(0, pos);
        canonical.mQuery = uri.substr(pos + 1);
    } else {
        canonical.mPath = uri;
    }

    for (const auto& [name, value] : request) {
        canonical.mHeaders[Poco::toLower(name)] = Poco::trim(value);
    }

    request.set("Authorization", GetAuthorization(canonical, amzDate));
}

std::string AWSSigner::GetAuthorization(const CanonicalRequest& request, const std::string& amzDate) const
{
    const auto date  = amzDate.substr(0, 8);
    const auto scope = GetScope(date);

    const auto stringToSign = std::string(cAlgorithm) + "\n" + amzDate + "\n" + scope + "\n"
        + SHA256Hex(FormatCanonicalRequest(request));

    const auto signature = ToHex(HMACSHA256(GetSigningKey(date), stringToSign));

    std::string signedHeaders;

    for (const auto& [name, value] : request.mHeaders) {
        (void)value;

        signedHeaders += (signedHeaders.empty() ? "" : ";") + name;
    }

    return std::string(cAlgorithm) + " Credential=" + mCredentials.mAccessKeyID + "/" + scope
        + ", SignedHeaders=" + signedHeaders + ", Signature=" + signature;
}

std::string AWSSigner::FormatCanonicalRequest(const CanonicalRequest& request)
{
    std::string headers;
    std::string signedHeaders;

    for (const auto& [name, value] : request.mHeaders) {
        headers += name + ":" + value + "\n";
        signedHeaders += (signedHeaders.empty() ? "" : ";") + name;
    }

    return request.mMethod + "\n" + (request.mPath.empty() ? "/" : request.mPath) + "\n" + request.mQuery + "\n"
        + headers + "\n" + signedHeaders + "\n" + SHA256Hex(request.mPayload);
}

std::string AWSSigner::GetSigningKeyHex(const std::string& date) const
{
    return ToHex(GetSigningKey(date));
}

std::string AWSSigner::SHA256Hex(const std::string& data)
{
    Poco::SHA2Engine engine;

    engine.update(data);

    return Poco::DigestEngine::digestToHex(engine.digest());
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

std::string AWSSigner::HMACSHA256(const std::string& key, const std::string& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digestLen = 0;

    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digestLen)) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eFailed, "can't calculate HMAC");
    }

    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}

std::string AWSSigner::ToHex(const std::string& data)
{
    return Poco::DigestEngine::digestToHex(Poco::DigestEngine::Digest(data.begin(), data.end()));
}

std::string AWSSigner::GetSigningKey(const std::string& date) const
{
    const auto dateKey    = HMACSHA256("AWS4" + mCredentials.mSecretAccessKey, date);
    const auto regionKey  = HMACSHA256(dateKey, mRegion);
    const auto serviceKey = HMACSHA256(regionKey, mService);

    return HMACSHA256(serviceKey, cTerminator);
}

std::string AWSSigner::GetScope(const std::string& date) const
{
    return date + "/" + mRegion + "/" + mService + "/" + cTerminator;
}

} // namespace deploymon::cloud
