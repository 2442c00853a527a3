/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <syslog.h>
#include <systemd/sd-journal.h>

#include "logger.hpp"

namespace deploymon::common::logger {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

std::mutex Logger::sMutex;
LogLevel   Logger::sLogLevel = LogLevelEnum::eInfo;

namespace {

std::string GetCurrentTime()
{
    const auto now  = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm {};

    gmtime_r(&time, &tm);

    std::ostringstream oss;

    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Logger::Init()
{
    SetBackend(mBackend);

    return ErrorEnum::eNone;
}

void Logger::SetBackend(Backend backend)
{
    std::lock_guard lock {sMutex};

    mBackend = backend;

    switch (mBackend) {
    case Backend::eJournald:
        Log::SetCallback(JournaldCallback);
        break;

    case Backend::eStdIO:
    default:
        Log::SetCallback(StdIOCallback);
        break;
    }
}

void Logger::SetLogLevel(LogLevel level)
{
    std::lock_guard lock {sMutex};

    sLogLevel = level;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void Logger::StdIOCallback(const char* module, LogLevel level, const String& message)
{
    std::lock_guard lock {sMutex};

    if (IsFiltered(level)) {
        return;
    }

    std::cout << GetCurrentTime() << " " << level.ToString().CStr() << " [" << (module ? module : "") << "] "
              << message.CStr() << std::endl;
}

void Logger::JournaldCallback(const char* module, LogLevel level, const String& message)
{
    std::lock_guard lock {sMutex};

    if (IsFiltered(level)) {
        return;
    }

    sd_journal_send("PRIORITY=%d", ToSyslogPriority(level), "MODULE=%s", module ? module : "", "MESSAGE=%s",
        message.CStr(), nullptr);
}

bool Logger::IsFiltered(LogLevel level)
{
    return level.GetValue() < sLogLevel.GetValue();
}

int Logger::ToSyslogPriority(LogLevel level)
{
    switch (level.GetValue()) {
    case LogLevelEnum::eDebug:
        return LOG_DEBUG;

    case LogLevelEnum::eInfo:
        return LOG_INFO;

    case LogLevelEnum::eWarning:
        return LOG_WARNING;

    case LogLevelEnum::eError:
        return LOG_ERR;

    default:
        return LOG_NOTICE;
    }
}

} // namespace deploymon::common::logger
