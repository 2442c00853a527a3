/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fstream>

#include <Poco/Environment.h>
#include <Poco/JSON/Object.h>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>
#include <common/utils/time.hpp>

#include "config.hpp"

namespace deploymon::config {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

constexpr auto cDefaultRegion            = "us-east-1";
constexpr auto cDefaultRequestTimeout    = "30s";
constexpr auto cDefaultHTTPTimeout       = "10s";
constexpr auto cDefaultPollDelay         = "4s";
constexpr auto cDefaultStatusFileTimeout = "5m";
constexpr auto cDefaultGraphBuildTimeout = "1h";
constexpr auto cDefaultGraphLoadTimeout  = "5h";
constexpr auto cDefaultRouterTimeout     = "20m";
constexpr auto cDefaultRegisterTimeout   = "2m";

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

std::string GetValueOrEnv(
    const common::utils::CaseInsensitiveObjectWrapper& object, const std::string& key, const std::string& envName)
{
    auto value = object.GetValue<std::string>(key);
    if (!value.empty()) {
        return value;
    }

    return Poco::Environment::get(envName, "");
}

Duration ParseDurationValue(
    const common::utils::CaseInsensitiveObjectWrapper& object, const std::string& key, const std::string& defaultValue)
{
    auto [duration, err] = common::utils::ParseDuration(object.GetValue<std::string>(key, defaultValue));
    DEPLOYMON_ERROR_CHECK_AND_THROW(err, "error parsing " + key + " tag");

    if (duration.Nanoseconds() <= 0) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, key + " should be positive");
    }

    return duration;
}

void ParseAWSConfig(const common::utils::CaseInsensitiveObjectWrapper& object, AWS& config)
{
    config.mRegion = GetValueOrEnv(object, "region", "AWS_REGION");
    if (config.mRegion.empty()) {
        config.mRegion = cDefaultRegion;
    }

    config.mAccessKeyID      = GetValueOrEnv(object, "accessKeyId", "AWS_ACCESS_KEY_ID");
    config.mSecretAccessKey  = GetValueOrEnv(object, "secretAccessKey", "AWS_SECRET_ACCESS_KEY");
    config.mSessionToken     = GetValueOrEnv(object, "sessionToken", "AWS_SESSION_TOKEN");
    config.mEndpointOverride = object.GetValue<std::string>("endpoint");
    config.mRequestTimeout   = ParseDurationValue(object, "requestTimeout", cDefaultRequestTimeout);
}

void ParseDeploymentConfig(const common::utils::CaseInsensitiveObjectWrapper& object, monitor::DeploymentInfo& config)
{
    config.mName               = object.GetValue<std::string>("name");
    config.mTargetGroupARN     = object.GetValue<std::string>("targetGroupArn");
    config.mCustomRegion       = object.GetValue<std::string>("customRegion");
    config.mRole               = object.GetValue<std::string>("role");
    config.mLogFolderURI       = object.GetValue<std::string>("logFolderUri");
    config.mStatusFile         = object.GetValue<std::string>("statusFile", monitor::cDefaultStatusFile);
    config.mBuildGraphOnly     = object.GetValue<bool>("buildGraphOnly");
    config.mGraphAlreadyBuilt  = object.GetValue<bool>("graphAlreadyBuilt");
    config.mSeparateGraphBuild = object.GetValue<bool>("separateGraphBuild");
}

void ParseMonitorConfig(
    const common::utils::CaseInsensitiveObjectWrapper& object, monitor::Config& config, Duration& httpTimeout)
{
    config.mPollDelay         = ParseDurationValue(object, "pollDelay", cDefaultPollDelay);
    config.mStatusFileTimeout = ParseDurationValue(object, "statusFileTimeout", cDefaultStatusFileTimeout);
    config.mGraphBuildTimeout = ParseDurationValue(object, "graphBuildTimeout", cDefaultGraphBuildTimeout);
    config.mGraphLoadTimeout  = ParseDurationValue(object, "graphLoadTimeout", cDefaultGraphLoadTimeout);
    config.mRouterTimeout     = ParseDurationValue(object, "routerTimeout", cDefaultRouterTimeout);
    config.mRegisterTimeout   = ParseDurationValue(object, "registerTimeout", cDefaultRegisterTimeout);
    httpTimeout               = ParseDurationValue(object, "httpTimeout", cDefaultHTTPTimeout);
}

monitor::InstanceInfo ParseInstance(const Poco::Dynamic::Var& value)
{
    common::utils::CaseInsensitiveObjectWrapper object(value);
    monitor::InstanceInfo                       instance;

    instance.mID       = object.GetValue<std::string>("id");
    instance.mPublicIP = object.GetValue<std::string>("publicIp");

    if (instance.mID.empty() || instance.mPublicIP.empty()) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "instance id and publicIp are required");
    }

    return instance;
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

Error ParseConfig(const std::string& filename, Config& config)
{
    LOG_DBG() << "Parsing config file" << Log::Field("file", filename.c_str());

    std::ifstream file(filename);

    if (!file.is_open()) {
        return ErrorEnum::eNotFound;
    }

    return ParseConfig(file, config);
}

Error ParseConfig(std::istream& in, Config& config)
{
    auto [result, err] = common::utils::ParseJson(in);
    if (!err.IsNone()) {
        return AOS_ERROR_WRAP(err);
    }

    try {
        common::utils::CaseInsensitiveObjectWrapper object(result);
        auto empty = common::utils::CaseInsensitiveObjectWrapper(Poco::makeShared<Poco::JSON::Object>());

        ParseAWSConfig(object.Has("aws") ? object.GetObject("aws") : empty, config.mAWS);
        ParseDeploymentConfig(object.Has("deployment") ? object.GetObject("deployment") : empty, config.mDeployment);
        ParseMonitorConfig(
            object.Has("monitor") ? object.GetObject("monitor") : empty, config.mMonitor, config.mHTTPTimeout);

        config.mInstances.clear();

        common::utils::ForEach(object, "instances",
            [&config](const Poco::Dynamic::Var& value) { config.mInstances.push_back(ParseInstance(value)); });
    } catch (const std::exception& e) {
        return common::utils::ToAosError(e);
    }

    return ErrorEnum::eNone;
}

std::string GetRegion(const Config& config)
{
    return config.mDeployment.mCustomRegion.empty() ? config.mAWS.mRegion : config.mDeployment.mCustomRegion;
}

} // namespace deploymon::config
