/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <common/utils/time.hpp>

#include "clock.hpp"

namespace deploymon::monitor {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Time SystemClock::Now() const
{
    return Time::Now();
}

void SystemClock::Sleep(Duration duration)
{
    std::this_thread::sleep_for(common::utils::ToChronoMilliseconds(duration));
}

} // namespace deploymon::monitor
