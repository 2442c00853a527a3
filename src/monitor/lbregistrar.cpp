/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include <common/logger/logmodule.hpp>

#include "lbregistrar.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error LBRegistrar::Init(LoadBalancerItf& loadBalancer, PollLoop& pollLoop)
{
    mLoadBalancer = &loadBalancer;
    mPollLoop     = &pollLoop;

    return ErrorEnum::eNone;
}

PollResult LBRegistrar::RegisterAndConfirm(const std::string& targetGroup, const std::string& instanceID,
    const PollLoop::HealthCheck& healthCheck, Duration delay, Duration deadline)
{
    LOG_DBG() << "Register target" << Log::Field("targetGroup", targetGroup.c_str())
              << Log::Field("instanceID", instanceID.c_str());

    return mPollLoop->Run(
        [&]() -> RetWithError<bool> {
            if (auto err = mLoadBalancer->RegisterTarget(targetGroup, instanceID); !err.IsNone()) {
                LOG_ERR() << "Can't register target" << Log::Field("instanceID", instanceID.c_str())
                          << Log::Field(err);

                return {false, ErrorEnum::eNone};
            }

            return {IsRegistered(targetGroup, instanceID), ErrorEnum::eNone};
        },
        healthCheck, delay, deadline, "instance to register with ELB target group");
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

bool LBRegistrar::IsRegistered(const std::string& targetGroup, const std::string& instanceID)
{
    auto [targets, err] = mLoadBalancer->GetTargetHealth(targetGroup);
    if (!err.IsNone()) {
        LOG_ERR() << "Can't get target health" << Log::Field("targetGroup", targetGroup.c_str()) << Log::Field(err);

        return false;
    }

    const auto it = std::find_if(targets.begin(), targets.end(),
        [&instanceID](const TargetHealth& target) { return target.mTargetID == instanceID; });
    if (it == targets.end()) {
        return false;
    }

    LOG_INF() << "Instance successfully added to target group" << Log::Field("instanceID", instanceID.c_str())
              << Log::Field("state", it->mState.c_str());

    return true;
}

} // namespace deploymon::monitor
