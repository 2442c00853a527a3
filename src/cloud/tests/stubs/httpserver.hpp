/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_TESTS_STUBS_HTTPSERVER_HPP_
#define DEPLOYMON_CLOUD_TESTS_STUBS_HTTPSERVER_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <Poco/Net/HTTPRequestHandler.h>
#include <Poco/Net/HTTPRequestHandlerFactory.h>
#include <Poco/Net/HTTPServer.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/HTTPServerRequest.h>
#include <Poco/Net/HTTPServerResponse.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/StreamCopier.h>

namespace deploymon::cloud {

/**
 * Request received by HTTP server stub.
 */
struct ReceivedRequest {
    std::string                        mMethod;
    std::string                        mURI;
    std::map<std::string, std::string> mHeaders;
    std::string                        mBody;
};

/**
 * Response returned by HTTP server stub.
 */
struct StubResponse {
    int         mStatus = Poco::Net::HTTPResponse::HTTP_OK;
    std::string mBody;
};

/**
 * Shared state of HTTP server stub.
 */
class HTTPServerState {
public:
    void SetResponse(const std::string& path, const StubResponse& response)
    {
        std::lock_guard lock {mMutex};

        mResponses[path] = response;
    }

    void SetActionResponse(const std::string& action, const StubResponse& response)
    {
        std::lock_guard lock {mMutex};

        mActionResponses[action] = response;
    }

    StubResponse HandleRequest(const ReceivedRequest& request)
    {
        std::lock_guard lock {mMutex};

        mRequests.push_back(request);

        if (auto it = mActionResponses.find(GetAction(request.mBody)); it != mActionResponses.end()) {
            return it->second;
        }

        auto path = request.mURI.substr(0, request.mURI.find('?'));

        if (auto it = mResponses.find(path); it != mResponses.end()) {
            return it->second;
        }

        return {Poco::Net::HTTPResponse::HTTP_NOT_FOUND, ""};
    }

    std::vector<ReceivedRequest> GetRequests() const
    {
        std::lock_guard lock {mMutex};

        return mRequests;
    }

private:
    static std::string GetAction(const std::string& body)
    {
        constexpr std::string_view cActionParam = "Action=";

        if (body.compare(0, cActionParam.size(), cActionParam) != 0) {
            return "";
        }

        return body.substr(cActionParam.size(), body.find('&') - cActionParam.size());
    }

    mutable std::mutex                  mMutex;
    std::map<std::string, StubResponse> mActionResponses;
    std::map<std::string, StubResponse> mResponses;
    std::vector<ReceivedRequest>        mRequests;
};

/**
 * HTTP server stub request handler.
 */
class StubRequestHandler : public Poco::Net::HTTPRequestHandler {
public:
    explicit StubRequestHandler(HTTPServerState& state)
        : mState(state)
    {
    }

    void handleRequest(Poco::Net::HTTPServerRequest& request, Poco::Net::HTTPServerResponse& response) override
    {
        ReceivedRequest received;

        received.mMethod = request.getMethod();
        received.mURI    = request.getURI();

        for (const auto& [name, value] : request) {
            received.mHeaders[name] = value;
        }

        Poco::StreamCopier::copyToString(request.stream(), received.mBody);

        const auto stubResponse = mState.HandleRequest(received);

        response.setStatus(static_cast<Poco::Net::HTTPResponse::HTTPStatus>(stubResponse.mStatus));
        response.setContentLength64(stubResponse.mBody.size());
        response.send() << stubResponse.mBody;
    }

private:
    HTTPServerState& mState;
};

/**
 * HTTP server stub request handler factory.
 */
class StubRequestHandlerFactory : public Poco::Net::HTTPRequestHandlerFactory {
public:
    explicit StubRequestHandlerFactory(HTTPServerState& state)
        : mState(state)
    {
    }

    Poco::Net::HTTPRequestHandler* createRequestHandler(const Poco::Net::HTTPServerRequest&) override
    {
        return new StubRequestHandler(mState);
    }

private:
    HTTPServerState& mState;
};

/**
 * HTTP server stub listening on random local port.
 */
class HTTPServerStub {
public:
    HTTPServerStub()
        : mSocket(Poco::Net::SocketAddress("127.0.0.1", 0))
        , mServer(new StubRequestHandlerFactory(mState), mSocket, new Poco::Net::HTTPServerParams)
    {
        mServer.start();
    }

    ~HTTPServerStub() { mServer.stopAll(true); }

    std::string GetURL() const { return "http://127.0.0.1:" + std::to_string(mSocket.address().port()); }

    HTTPServerState& GetState() { return mState; }

private:
    HTTPServerState         mState;
    Poco::Net::ServerSocket mSocket;
    Poco::Net::HTTPServer   mServer;
};

} // namespace deploymon::cloud

#endif
