/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <common/logger/logmodule.hpp>

#include "healthprobe.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error HealthProbe::Init(InstanceControlItf& instanceControl)
{
    mInstanceControl = &instanceControl;

    return ErrorEnum::eNone;
}

RetWithError<HealthResult> HealthProbe::Check(const std::string& instanceID)
{
    if (!mInstanceControl) {
        return {{}, Error(ErrorEnum::eWrongState, "health probe is not initialized")};
    }

    auto [state, err] = mInstanceControl->GetInstanceState(instanceID);
    if (!err.IsNone()) {
        return {{}, AOS_ERROR_WRAP(err)};
    }

    HealthResult result;

    if (!state.has_value()) {
        LOG_DBG() << "Instance not found in control plane response" << Log::Field("instanceID", instanceID.c_str());

        return {result, ErrorEnum::eNone};
    }

    result.mStateName = state->mName;

    if (IsTerminal(*state)) {
        LOG_WRN() << "Instance is not healthy" << Log::Field("instanceID", instanceID.c_str())
                  << Log::Field("state", state->mName.c_str()) << Log::Field("code", state->mCode);

        result.mStatus = HealthStatusEnum::eTerminal;
    }

    return {result, ErrorEnum::eNone};
}

bool HealthProbe::IsTerminal(const InstanceState& state)
{
    return state.mCode > cInstanceStateRunning;
}

} // namespace deploymon::monitor
