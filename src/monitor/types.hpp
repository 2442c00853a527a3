/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_TYPES_HPP_
#define DEPLOYMON_MONITOR_TYPES_HPP_

#include <string>

#include <common/types.hpp>

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Constants
 **********************************************************************************************************************/

/**
 * Instance state codes reported by compute control plane.
 */
constexpr int cInstanceStatePending      = 0;
constexpr int cInstanceStateRunning      = 16;
constexpr int cInstanceStateShuttingDown = 32;
constexpr int cInstanceStateTerminated   = 48;
constexpr int cInstanceStateStopping     = 64;
constexpr int cInstanceStateStopped      = 80;

/**
 * Default otp-runner status file name.
 */
constexpr auto cDefaultStatusFile = "status.json";

/**
 * OTP router path.
 */
constexpr auto cRouterPath = "otp/routers/default";

/***********************************************************************************************************************
 * Types
 **********************************************************************************************************************/

/**
 * Instance lifecycle state.
 */
struct InstanceState {
    int         mCode = cInstanceStatePending;
    std::string mName;

    bool operator==(const InstanceState& rhs) const { return mCode == rhs.mCode && mName == rhs.mName; }
};

/**
 * Monitored instance.
 */
struct InstanceInfo {
    std::string   mID;
    std::string   mPublicIP;
    InstanceState mState;
};

/**
 * Load balancer target health description.
 */
struct TargetHealth {
    std::string mTargetID;
    std::string mState;
};

/**
 * Deployment descriptor.
 */
struct DeploymentInfo {
    std::string mName;
    std::string mTargetGroupARN;
    std::string mCustomRegion;
    std::string mRole;
    std::string mLogFolderURI;
    std::string mStatusFile         = cDefaultStatusFile;
    bool        mBuildGraphOnly     = false;
    bool        mGraphAlreadyBuilt  = false;
    bool        mSeparateGraphBuild = false;

    /**
     * Returns true if instance job ends once graph is built and uploaded.
     *
     * @return bool.
     */
    bool IsBuildOnly() const { return mBuildGraphOnly || (!mGraphAlreadyBuilt && mSeparateGraphBuild); }
};

/**
 * Status published by otp-runner on the instance.
 */
struct RunnerStatus {
    bool        mError = false;
    std::string mMessage;
    double      mPctProgress   = 0.0;
    bool        mServerStarted = false;
    bool        mGraphUploaded = false;
};

/**
 * Instance health type.
 */
class HealthStatusType {
public:
    enum class Enum {
        eHealthy,
        eTerminal,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "healthy",
            "terminal",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using HealthStatusEnum = HealthStatusType::Enum;
using HealthStatus     = EnumStringer<HealthStatusType>;

/**
 * Instance health check result.
 */
struct HealthResult {
    HealthStatus mStatus = HealthStatusEnum::eHealthy;
    std::string  mStateName;
};

/**
 * Poll loop outcome type.
 */
class PollStatusType {
public:
    enum class Enum {
        eCompleted,
        eTimedOut,
        eAborted,
        eCancelled,
        eFailed,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "completed",
            "timed out",
            "aborted",
            "cancelled",
            "failed",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using PollStatusEnum = PollStatusType::Enum;
using PollStatus     = EnumStringer<PollStatusType>;

/**
 * Poll loop result.
 *
 * mReason holds instance state name for eAborted and failure message for eFailed.
 */
struct PollResult {
    PollStatus  mStatus = PollStatusEnum::eCompleted;
    std::string mReason;
};

/**
 * Monitor phase type.
 */
class PhaseType {
public:
    enum class Enum {
        eIdle,
        eAwaitingStatusFile,
        eAwaitingRunnerCompletion,
        eBuildCompleted,
        eAwaitingRouter,
        eRegisteringWithLB,
        eSucceeded,
        eFailed,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sStrings[] = {
            "idle",
            "awaiting status file",
            "awaiting runner completion",
            "build completed",
            "awaiting router",
            "registering with load balancer",
            "succeeded",
            "failed",
        };

        return Array<const char* const>(sStrings, ArraySize(sStrings));
    };
};

using PhaseEnum = PhaseType::Enum;
using Phase     = EnumStringer<PhaseType>;

} // namespace deploymon::monitor

#endif
