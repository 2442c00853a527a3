/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include "jobstatus.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

void JobStatus::Update(const std::string& message, double percent)
{
    std::lock_guard lock {mMutex};

    mData.mMessage = message;
    mData.mPercent = std::clamp(percent, 0.0, cMaxPercent);
}

void JobStatus::Fail(const std::string& message)
{
    std::lock_guard lock {mMutex};

    mData.mMessage   = message;
    mData.mError     = true;
    mData.mCompleted = true;
}

void JobStatus::CompleteSuccessfully(const std::string& message)
{
    std::lock_guard lock {mMutex};

    mData.mMessage   = message;
    mData.mPercent   = cMaxPercent;
    mData.mCompleted = true;
}

void JobStatus::SetInstanceTerminated()
{
    std::lock_guard lock {mMutex};

    mData.mInstanceTerminated = true;
}

bool JobStatus::IsError() const
{
    std::lock_guard lock {mMutex};

    return mData.mError;
}

JobStatusData JobStatus::GetSnapshot() const
{
    std::lock_guard lock {mMutex};

    return mData;
}

} // namespace deploymon::monitor
