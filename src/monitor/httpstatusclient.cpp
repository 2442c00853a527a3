/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Net/HTTPResponse.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

#include "httpstatusclient.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error HTTPStatusClient::Init(HTTPClientItf& httpClient)
{
    mHTTPClient = &httpClient;

    return ErrorEnum::eNone;
}

bool HTTPStatusClient::Reachable(const std::string& url)
{
    auto [response, err] = mHTTPClient->Get(url);
    if (!err.IsNone()) {
        LOG_ERR() << "Could not complete request" << Log::Field("url", url.c_str()) << Log::Field(err);

        return false;
    }

    LOG_DBG() << "Request completed" << Log::Field("url", url.c_str()) << Log::Field("status", response.mStatus);

    return response.mStatus == Poco::Net::HTTPResponse::HTTP_OK;
}

std::optional<RunnerStatus> HTTPStatusClient::FetchRunnerStatus(const std::string& url)
{
    auto [response, err] = mHTTPClient->Get(url);
    if (!err.IsNone()) {
        LOG_ERR() << "Could not get otp-runner status" << Log::Field("url", url.c_str()) << Log::Field(err);

        return std::nullopt;
    }

    if (response.mStatus != Poco::Net::HTTPResponse::HTTP_OK) {
        LOG_WRN() << "Otp-runner status not available" << Log::Field("url", url.c_str())
                  << Log::Field("status", response.mStatus);

        return std::nullopt;
    }

    auto [status, parseErr] = ParseRunnerStatus(response.mBody);
    if (!parseErr.IsNone()) {
        LOG_ERR() << "Could not parse otp-runner status" << Log::Field("url", url.c_str()) << Log::Field(parseErr);

        return std::nullopt;
    }

    return status;
}

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

RetWithError<RunnerStatus> ParseRunnerStatus(const std::string& json)
{
    auto [jsonVar, err] = common::utils::ParseJson(json);
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    try {
        common::utils::CaseInsensitiveObjectWrapper object(jsonVar);

        RunnerStatus status;

        status.mError         = object.GetValue<bool>("error");
        status.mMessage       = object.GetValue<std::string>("message");
        status.mPctProgress   = object.GetValue<double>("pctProgress");
        status.mServerStarted = object.GetValue<bool>("serverStarted");
        status.mGraphUploaded = object.GetValue<bool>("graphUploaded");

        return {status, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eInvalidArgument))};
    }
}

bool IsRunnerCompleted(const RunnerStatus& status, bool buildOnly)
{
    return buildOnly ? status.mGraphUploaded : status.mServerStarted;
}

} // namespace deploymon::monitor
