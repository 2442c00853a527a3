/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/AutoPtr.h>
#include <Poco/DOM/DOMParser.h>
#include <Poco/DOM/Document.h>
#include <Poco/DOM/NodeList.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/StreamCopier.h>
#include <Poco/String.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>

#include "awsclient.hpp"

namespace deploymon::cloud {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cReservedChars  = "!#$&'()*+,/:;=?@[]";
constexpr auto cNotFoundSuffix = "NotFound";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::string GetElementText(const Poco::XML::Document& document, const std::string& name)
{
    Poco::AutoPtr<Poco::XML::NodeList> nodes = document.getElementsByTagName(name);

    if (nodes->length() == 0) {
        return "";
    }

    return Poco::trim(nodes->item(0)->innerText());
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error AWSClient::Init(const AWSClientConfig& config, const std::string& service, const std::string& apiVersion,
    CredentialsProviderItf* credentialsProvider)
{
    LOG_DBG() << "Initialize AWS client" << Log::Field("service", service.c_str())
              << Log::Field("region", config.mRegion.c_str());

    mConfig              = config;
    mCredentialsProvider = credentialsProvider;
    mService             = service;
    mAPIVersion          = apiVersion;

    if (!mCredentialsProvider) {
        if (auto err = mSigner.Init(config.mCredentials, config.mRegion, service); !err.IsNone()) {
            return AOS_ERROR_WRAP(err);
        }
    }

    try {
        mEndpoint = Poco::URI(config.mEndpointOverride.empty()
                ? "https://" + service + "." + config.mRegion + ".amazonaws.com/"
                : config.mEndpointOverride);
    } catch (const std::exception& e) {
        return AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument));
    }

    return ErrorEnum::eNone;
}

RetWithError<std::string> AWSClient::Call(const std::string& action, const QueryParams& params)
{
    LOG_DBG() << "Call AWS action" << Log::Field("action", action.c_str())
              << Log::Field("endpoint", mEndpoint.toString().c_str());

    QueryParams allParams {{"Action", action}, {"Version", mAPIVersion}};

    allParams.insert(allParams.end(), params.begin(), params.end());

    auto [signer, err] = GetSigner();
    if (!err.IsNone()) {
        return {"", AOS_ERROR_WRAP(err)};
    }

    try {
        const auto body    = EncodeQuery(allParams);
        auto       session = CreateSession();

        Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_POST,
            mEndpoint.getPathEtc().empty() ? "/" : mEndpoint.getPathEtc(), Poco::Net::HTTPMessage::HTTP_1_1);

        if (mEndpoint.getPort() == mEndpoint.getWellKnownPort()) {
            request.setHost(mEndpoint.getHost());
        } else {
            request.setHost(mEndpoint.getHost(), mEndpoint.getPort());
        }

        request.setKeepAlive(false);
        request.setContentType(cContentType);
        request.setContentLength64(static_cast<Poco::Int64>(body.length()));

        signer.Sign(request, body, Poco::Timestamp());

        session->sendRequest(request) << body;

        Poco::Net::HTTPResponse response;
        std::string             responseBody;

        Poco::StreamCopier::copyToString(session->receiveResponse(response), responseBody);

        if (response.getStatus() == Poco::Net::HTTPResponse::HTTP_OK) {
            return {responseBody, ErrorEnum::eNone};
        }

        const auto awsError = ParseErrorResponse(responseBody);

        LOG_WRN() << "AWS action failed" << Log::Field("action", action.c_str())
                  << Log::Field("status", static_cast<int>(response.getStatus()))
                  << Log::Field("code", awsError.mCode.c_str()) << Log::Field("message", awsError.mMessage.c_str());

        if (EndsWith(awsError.mCode, cNotFoundSuffix)) {
            return {"", Error(ErrorEnum::eNotFound, "resource not found")};
        }

        DEPLOYMON_ERROR_THROW(ErrorEnum::eRuntime, action + " failed: " + awsError.mCode + ": " + awsError.mMessage);
    } catch (const std::exception& e) {
        return {"", AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eRuntime))};
    }
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<AWSSigner> AWSClient::GetSigner() const
{
    if (!mCredentialsProvider) {
        return {mSigner, ErrorEnum::eNone};
    }

    auto [credentials, err] = mCredentialsProvider->GetCredentials();
    if (!err.IsNone()) {
        return {mSigner, err};
    }

    AWSSigner signer;

    if (auto initErr = signer.Init(credentials, mConfig.mRegion, mService); !initErr.IsNone()) {
        return {mSigner, initErr};
    }

    return {signer, ErrorEnum::eNone};
}

std::unique_ptr<Poco::Net::HTTPClientSession> AWSClient::CreateSession() const
{
    std::unique_ptr<Poco::Net::HTTPClientSession> session;

    if (mEndpoint.getScheme() == "https") {
        auto context = Poco::makeAuto<Poco::Net::Context>(
            Poco::Net::Context::TLS_CLIENT_USE, "", Poco::Net::Context::VERIFY_RELAXED, 9, true);

        session = std::make_unique<Poco::Net::HTTPSClientSession>(mEndpoint.getHost(), mEndpoint.getPort(), context);
    } else {
        session = std::make_unique<Poco::Net::HTTPClientSession>(mEndpoint.getHost(), mEndpoint.getPort());
    }

    session->setTimeout(Poco::Timespan(mConfig.mRequestTimeout.Milliseconds() * Poco::Timespan::MILLISECONDS));

    return session;
}

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

std::string EncodeQuery(const QueryParams& params)
{
    std::string query;

    for (const auto& [name, value] : params) {
        if (!query.empty()) {
            query += "&";
        }

        Poco::URI::encode(name, cReservedChars, query);
        query += "=";
        Poco::URI::encode(value, cReservedChars, query);
    }

    return query;
}

AWSError ParseErrorResponse(const std::string& xml)
{
    AWSError awsError {"Unknown", xml};

    try {
        Poco::XML::DOMParser               parser;
        Poco::AutoPtr<Poco::XML::Document> document = parser.parseString(xml);

        if (auto code = GetElementText(*document, "Code"); !code.empty()) {
            awsError.mCode = code;
        }

        awsError.mMessage = GetElementText(*document, "Message");
    } catch (const std::exception& e) {
        LOG_DBG() << "Can't parse AWS error response" << Log::Field(common::utils::ToAosError(e));
    }

    return awsError;
}

} // namespace deploymon::cloud
