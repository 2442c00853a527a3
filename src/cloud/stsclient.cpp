/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/AutoPtr.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/NodeList.h>
#include <Poco/DateTime.h>
#include <Poco/DateTimeParser.h>
#include <Poco/String.h>
#include <Poco/Timespan.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>

#include "stsclient.hpp"

namespace deploymon::cloud {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string GetCredentialsField(const Poco::XML::Document& document, const std::string& name)
{
    Poco::AutoPtr<Poco::XML::NodeList> nodes = document.getElementsByTagName(name);

    if (nodes->length() == 0) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "missing " + name + " in AssumeRole response");
    }

    return Poco::trim(nodes->item(0)->innerText());
}

} // namespace

/***********************************************************************************************************************
 * STSClient
 **********************************************************************************************************************/

Error STSClient::Init(const AWSClientConfig& config)
{
    LOG_DBG() << "Initialize STS client";

    if (auto err = mClient.Init(config, cService, cAPIVersion); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<AssumedRole> STSClient::AssumeRole(const std::string& roleARN, const std::string& sessionName)
{
    LOG_INF() << "Assume role" << Log::Field("role", roleARN.c_str()) << Log::Field("session", sessionName.c_str());

    auto [response, err] = mClient.Call("AssumeRole", {{"RoleArn", roleARN}, {"RoleSessionName", sessionName}});
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    return ParseAssumeRoleResponse(response);
}

/***********************************************************************************************************************
 * AssumeRoleCredentialsProvider
 **********************************************************************************************************************/

Error AssumeRoleCredentialsProvider::Init(
    STSClient& stsClient, const std::string& roleARN, const std::string& sessionName)
{
    std::lock_guard lock {mMutex};

    if (roleARN.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "empty role ARN");
    }

    mSTSClient   = &stsClient;
    mRoleARN     = roleARN;
    mSessionName = sessionName;
    mAssumedRole.reset();

    return ErrorEnum::eNone;
}

RetWithError<Credentials> AssumeRoleCredentialsProvider::GetCredentials()
{
    std::lock_guard lock {mMutex};

    const auto renewAt = Poco::Timestamp() + Poco::Timespan(cRenewBeforeExpirationSec, 0);

    if (mAssumedRole.has_value() && renewAt < mAssumedRole->mExpiration) {
        return {mAssumedRole->mCredentials, ErrorEnum::eNone};
    }

    auto [assumedRole, err] = mSTSClient->AssumeRole(mRoleARN, mSessionName);
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    LOG_DBG() << "Role credentials received" << Log::Field("session", mSessionName.c_str())
              << Log::Field("accessKeyID", assumedRole.mCredentials.mAccessKeyID.c_str());

    mAssumedRole = assumedRole;

    return {mAssumedRole->mCredentials, ErrorEnum::eNone};
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

RetWithError<AssumedRole> ParseAssumeRoleResponse(const std::string& xml)
{
    try {
        Poco::XML::DOMParser               parser;
        Poco::AutoPtr<Poco::XML::Document> document = parser.parseString(xml);
        AssumedRole                        assumedRole;
        int                                tzd = 0;

        assumedRole.mCredentials.mAccessKeyID     = GetCredentialsField(*document, "AccessKeyId");
        assumedRole.mCredentials.mSecretAccessKey = GetCredentialsField(*document, "SecretAccessKey");
        assumedRole.mCredentials.mSessionToken    = GetCredentialsField(*document, "SessionToken");
        auto expiration = Poco::DateTimeParser::parse(GetCredentialsField(*document, "Expiration"), tzd);

        expiration.makeUTC(tzd);
        assumedRole.mExpiration = expiration.timestamp();

        if (assumedRole.mCredentials.mAccessKeyID.empty() || assumedRole.mCredentials.mSecretAccessKey.empty()) {
            return {{}, Error(ErrorEnum::eInvalidArgument, "empty credentials in AssumeRole response")};
        }

        return {assumedRole, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

} // namespace deploymon::cloud
