/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_LOGGER_LOGMODULE_HPP_
#define DEPLOYMON_COMMON_LOGGER_LOGMODULE_HPP_

#ifdef LOG_MODULE
#undef LOG_MODULE
#endif

#define LOG_MODULE "deploymon"

#include <core/common/tools/logger.hpp>

#endif
