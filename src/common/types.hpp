/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_TYPES_HPP_
#define DEPLOYMON_COMMON_TYPES_HPP_

#include <core/common/tools/array.hpp>
#include <core/common/tools/enum.hpp>
#include <core/common/tools/error.hpp>
#include <core/common/tools/log.hpp>
#include <core/common/tools/string.hpp>
#include <core/common/tools/time.hpp>

namespace deploymon {

/***********************************************************************************************************************
 * Aos core types used across deploymon
 **********************************************************************************************************************/

using aos::Array;
using aos::ArraySize;
using aos::Duration;
using aos::EnumStringer;
using aos::Error;
using aos::ErrorEnum;
using aos::Log;
using aos::LogLevel;
using aos::LogLevelEnum;
using aos::RetWithError;
using aos::String;
using aos::Tie;
using aos::Time;

} // namespace deploymon

#endif
