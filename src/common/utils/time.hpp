/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_UTILS_TIME_HPP_
#define DEPLOYMON_COMMON_UTILS_TIME_HPP_

#include <chrono>
#include <string>

#include <common/types.hpp>

namespace deploymon::common::utils {

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

/**
 * Parses duration from string.
 *
 * Accepts sequence of decimal numbers with unit suffix: "300ms", "4s", "1h30m", "2d". A bare number is treated as
 * seconds.
 *
 * @param duration duration string.
 * @return parsed duration.
 */
RetWithError<Duration> ParseDuration(const std::string& duration);

/**
 * Converts duration to std::chrono milliseconds.
 *
 * @param duration duration.
 * @return std::chrono::milliseconds.
 */
std::chrono::milliseconds ToChronoMilliseconds(Duration duration);

} // namespace deploymon::common::utils

#endif
