/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <Poco/Util/ServerApplication.h>

#include "app.hpp"

POCO_SERVER_MAIN(deploymon::app::App);
