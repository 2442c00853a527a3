/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_LOGGER_LOGGER_HPP_
#define DEPLOYMON_COMMON_LOGGER_LOGGER_HPP_

#include <mutex>

#include <common/types.hpp>

namespace deploymon::common::logger {

/**
 * Process wide logger.
 *
 * Installs Aos log callback and routes messages either to stdout or to systemd journal.
 */
class Logger {
public:
    /**
     * Log backend.
     */
    enum class Backend {
        eStdIO,
        eJournald,
    };

    /**
     * Initializes logger.
     *
     * @return Error.
     */
    Error Init();

    /**
     * Sets log backend.
     *
     * @param backend log backend.
     */
    void SetBackend(Backend backend);

    /**
     * Sets log level.
     *
     * @param level log level.
     */
    void SetLogLevel(LogLevel level);

private:
    static void StdIOCallback(const char* module, LogLevel level, const String& message);
    static void JournaldCallback(const char* module, LogLevel level, const String& message);
    static bool IsFiltered(LogLevel level);
    static int  ToSyslogPriority(LogLevel level);

    static std::mutex sMutex;
    static LogLevel   sLogLevel;

    Backend mBackend = Backend::eStdIO;
};

} // namespace deploymon::common::logger

#endif
