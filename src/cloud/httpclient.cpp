/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>
#include <Poco/URI.h>

#include <common/utils/exception.hpp>

#include "httpclient.hpp"

namespace deploymon::cloud {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error HTTPClient::Init(Duration timeout)
{
    if (timeout.Nanoseconds() <= 0) {
        return AOS_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "HTTP timeout should be positive"));
    }

    mTimeout = timeout;

    return ErrorEnum::eNone;
}

RetWithError<monitor::HTTPResponse> HTTPClient::Get(const std::string& url)
{
    try {
        Poco::URI                    uri(url);
        Poco::Net::HTTPClientSession session(uri.getHost(), uri.getPort());

        session.setTimeout(Poco::Timespan(mTimeout.Milliseconds() * Poco::Timespan::MILLISECONDS));

        Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_GET,
            uri.getPathEtc().empty() ? "/" : uri.getPathEtc(), Poco::Net::HTTPMessage::HTTP_1_1);

        request.setKeepAlive(false);

        session.sendRequest(request);

        Poco::Net::HTTPResponse httpResponse;
        monitor::HTTPResponse   response;

        // Body is read completely even for error statuses to release connection.
        Poco::StreamCopier::copyToString(session.receiveResponse(httpResponse), response.mBody);

        response.mStatus = static_cast<int>(httpResponse.getStatus());

        return {response, ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {{}, AOS_ERROR_WRAP(common::utils::ToAosError(e, ErrorEnum::eRuntime))};
    }
}

} // namespace deploymon::cloud
