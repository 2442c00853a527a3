/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/AutoPtr.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/Element.h>
#include <Poco/DOM/NodeList.h>
#include <Poco/String.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>

#include "elbclient.hpp"

namespace deploymon::cloud {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ELBClient::Init(const AWSClientConfig& config, CredentialsProviderItf* credentialsProvider)
{
    LOG_DBG() << "Initialize ELB client";

    if (auto err = mClient.Init(config, cService, cAPIVersion, credentialsProvider); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

Error ELBClient::RegisterTarget(const std::string& targetGroup, const std::string& instanceID)
{
    LOG_DBG() << "Register target" << Log::Field("targetGroup", targetGroup.c_str())
              << Log::Field("instanceID", instanceID.c_str());

    auto [response, err] = mClient.Call(
        "RegisterTargets", {{"TargetGroupArn", targetGroup}, {"Targets.member.1.Id", instanceID}});
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<std::vector<monitor::TargetHealth>> ELBClient::GetTargetHealth(const std::string& targetGroup)
{
    LOG_DBG() << "Describe target health" << Log::Field("targetGroup", targetGroup.c_str());

    auto [response, err] = mClient.Call("DescribeTargetHealth", {{"TargetGroupArn", targetGroup}});
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    return ParseDescribeTargetHealthResponse(response);
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

RetWithError<std::vector<monitor::TargetHealth>> ParseDescribeTargetHealthResponse(const std::string& xml)
{
    try {
        Poco::XML::DOMParser               parser;
        Poco::AutoPtr<Poco::XML::Document> document = parser.parseString(xml);
        Poco::AutoPtr<Poco::XML::NodeList> members  = document->getElementsByTagName("member");

        std::vector<monitor::TargetHealth> targets;

        for (unsigned long i = 0; i < members->length(); i++) {
            auto member = dynamic_cast<Poco::XML::Element*>(members->item(i));
            if (!member) {
                continue;
            }

            auto target = member->getChildElement("Target");
            if (!target) {
                continue;
            }

            auto id = target->getChildElement("Id");
            if (!id) {
                DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "target without Id");
            }

            monitor::TargetHealth targetHealth;

            targetHealth.mTargetID = Poco::trim(id->innerText());

            if (auto health = member->getChildElement("TargetHealth"); health) {
                if (auto state = health->getChildElement("State"); state) {
                    targetHealth.mState = Poco::trim(state->innerText());
                }
            }

            targets.push_back(std::move(targetHealth));
        }

        return {targets, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

} // namespace deploymon::cloud
