/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <cstdint>
#include <limits>

#include <Poco/NumberParser.h>

#include "time.hpp"

namespace deploymon::common::utils {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cMaxDuration = std::numeric_limits<int64_t>::max();

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

RetWithError<int64_t> UnitToNanoseconds(const std::string& unit)
{
    if (unit == "ns") {
        return {1, ErrorEnum::eNone};
    }

    if (unit == "us") {
        return {Time::cMilliseconds.Nanoseconds() / 1000, ErrorEnum::eNone};
    }

    if (unit == "ms") {
        return {Time::cMilliseconds.Nanoseconds(), ErrorEnum::eNone};
    }

    if (unit == "s" || unit.empty()) {
        return {Time::cSeconds.Nanoseconds(), ErrorEnum::eNone};
    }

    if (unit == "m") {
        return {Time::cMinutes.Nanoseconds(), ErrorEnum::eNone};
    }

    if (unit == "h") {
        return {Time::cHours.Nanoseconds(), ErrorEnum::eNone};
    }

    if (unit == "d") {
        return {Time::cDay.Nanoseconds(), ErrorEnum::eNone};
    }

    return {0, Error(ErrorEnum::eInvalidArgument, "unknown duration unit")};
}

} // namespace

/***********************************************************************************************************************
 * Public functions
 **********************************************************************************************************************/

RetWithError<Duration> ParseDuration(const std::string& duration)
{
    if (duration.empty()) {
        return {Duration(0), Error(ErrorEnum::eInvalidArgument, "empty duration")};
    }

    int64_t total = 0;
    size_t  pos   = 0;

    while (pos < duration.size()) {
        const auto numberStart = pos;

        while (pos < duration.size() && std::isdigit(static_cast<unsigned char>(duration[pos]))) {
            pos++;
        }

        if (pos == numberStart) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, "invalid duration format")};
        }

        Poco::Int64 value = 0;

        if (!Poco::NumberParser::tryParse64(duration.substr(numberStart, pos - numberStart), value)) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, "duration value out of range")};
        }

        const auto unitStart = pos;

        while (pos < duration.size() && !std::isdigit(static_cast<unsigned char>(duration[pos]))) {
            pos++;
        }

        auto [multiplier, err] = UnitToNanoseconds(duration.substr(unitStart, pos - unitStart));
        if (!err.IsNone()) {
            return {Duration(0), AOS_ERROR_WRAP(err)};
        }

        if (value > (cMaxDuration - total) / multiplier) {
            return {Duration(0), Error(ErrorEnum::eInvalidArgument, "duration out of range")};
        }

        total += value * multiplier;
    }

    return {Duration(total), ErrorEnum::eNone};
}

std::chrono::milliseconds ToChronoMilliseconds(Duration duration)
{
    return std::chrono::milliseconds(duration.Milliseconds());
}

} // namespace deploymon::common::utils
