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
#include <Poco/NumberParser.h>
#include <Poco/String.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>

#include "ec2client.hpp"

namespace deploymon::cloud {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::optional<monitor::InstanceState> FindInstanceState(
    const std::string& xml, const std::string& instanceID, const std::string& stateTag)
{
    Poco::XML::DOMParser               parser;
    Poco::AutoPtr<Poco::XML::Document> document = parser.parseString(xml);
    Poco::AutoPtr<Poco::XML::NodeList> ids      = document->getElementsByTagName("instanceId");

    for (unsigned long i = 0; i < ids->length(); i++) {
        auto idNode = ids->item(i);

        if (Poco::trim(idNode->innerText()) != instanceID) {
            continue;
        }

        auto item = dynamic_cast<Poco::XML::Element*>(idNode->parentNode());
        if (!item) {
            continue;
        }

        auto state = item->getChildElement(stateTag);
        if (!state) {
            continue;
        }

        auto code = state->getChildElement("code");
        auto name = state->getChildElement("name");

        if (!code || !name) {
            DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "malformed " + stateTag + " element");
        }

        return monitor::InstanceState {
            Poco::NumberParser::parse(Poco::trim(code->innerText())), Poco::trim(name->innerText())};
    }

    return std::nullopt;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error EC2Client::Init(const AWSClientConfig& config, CredentialsProviderItf* credentialsProvider)
{
    LOG_DBG() << "Initialize EC2 client";

    if (auto err = mClient.Init(config, cService, cAPIVersion, credentialsProvider); !err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    return ErrorEnum::eNone;
}

RetWithError<std::optional<monitor::InstanceState>> EC2Client::GetInstanceState(const std::string& instanceID)
{
    LOG_DBG() << "Describe instance" << Log::Field("instanceID", instanceID.c_str());

    auto [response, err] = mClient.Call("DescribeInstances", {{"InstanceId.1", instanceID}});
    if (err.Is(ErrorEnum::eNotFound)) {
        return {std::nullopt, ErrorEnum::eNone};
    }

    if (!err.IsNone()) {
        return {std::nullopt, AOS_ERROR_WRAP(err)};
    }

    return ParseDescribeInstancesResponse(response, instanceID);
}

RetWithError<monitor::InstanceState> EC2Client::TerminateInstance(const std::string& instanceID)
{
    LOG_INF() << "Terminate instance" << Log::Field("instanceID", instanceID.c_str());

    auto [response, err] = mClient.Call("TerminateInstances", {{"InstanceId.1", instanceID}});
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    return ParseTerminateInstancesResponse(response, instanceID);
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

RetWithError<std::optional<monitor::InstanceState>> ParseDescribeInstancesResponse(
    const std::string& xml, const std::string& instanceID)
{
    try {
        return {FindInstanceState(xml, instanceID, "instanceState"), ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {std::nullopt, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

RetWithError<monitor::InstanceState> ParseTerminateInstancesResponse(
    const std::string& xml, const std::string& instanceID)
{
    try {
        auto state = FindInstanceState(xml, instanceID, "currentState");
        if (!state.has_value()) {
            return {{}, Error(ErrorEnum::eNotFound, "instance not found in terminate response")};
        }

        return {*state, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

} // namespace deploymon::cloud
