/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_UTILS_EXCEPTION_HPP_
#define DEPLOYMON_COMMON_UTILS_EXCEPTION_HPP_

#include <string>

#include <Poco/Exception.h>

#include <common/types.hpp>

/**
 * Helper macros for argument counting
 */
#define DEPLOYMON_GET_NTH_ARG(_1, _2, NAME, ...) NAME

/**
 * Error throw with and without message
 */
#define DEPLOYMON_ERROR_THROW_1(err) throw deploymon::common::utils::DeploymonException(AOS_ERROR_WRAP(err))
#define DEPLOYMON_ERROR_THROW_2(err, message)                                                                          \
    throw deploymon::common::utils::DeploymonException(AOS_ERROR_WRAP(err), message)
#define DEPLOYMON_ERROR_THROW(...)                                                                                     \
    DEPLOYMON_GET_NTH_ARG(__VA_ARGS__, DEPLOYMON_ERROR_THROW_2, DEPLOYMON_ERROR_THROW_1)(__VA_ARGS__)

/**
 * Error check and throw with and without message
 */
#define DEPLOYMON_ERROR_CHECK_AND_THROW_1(err)                                                                         \
    if (!deploymon::Error(err).IsNone()) {                                                                             \
        DEPLOYMON_ERROR_THROW_1(err);                                                                                  \
    }
#define DEPLOYMON_ERROR_CHECK_AND_THROW_2(err, message)                                                                \
    if (!deploymon::Error(err).IsNone()) {                                                                             \
        DEPLOYMON_ERROR_THROW_2(err, message);                                                                         \
    }
#define DEPLOYMON_ERROR_CHECK_AND_THROW(...)                                                                           \
    DEPLOYMON_GET_NTH_ARG(__VA_ARGS__, DEPLOYMON_ERROR_CHECK_AND_THROW_2, DEPLOYMON_ERROR_CHECK_AND_THROW_1)         \
    (__VA_ARGS__)

namespace deploymon::common::utils {

/**
 * Deploymon exception.
 */
class DeploymonException : public Poco::Exception {
public:
    /**
     * Creates exception instance.
     *
     * @param err error.
     * @param message message.
     */
    explicit DeploymonException(const Error& err, const std::string& message = "");

    /**
     * Returns error.
     *
     * @return Error.
     */
    Error GetError() const { return mError; }

    /**
     * Returns a static string describing the exception.
     *
     * @return const char*
     */
    const char* name() const noexcept override { return "Deploymon exception"; }

private:
    Error mError;
};

/**
 * Converts exception to error.
 *
 * @param e exception.
 * @param err error.
 *
 * @return Error.
 */
Error ToAosError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed);

/**
 * Converts error to human readable string.
 *
 * @param err error.
 * @return std::string.
 */
std::string ErrorToString(const Error& err);

} // namespace deploymon::common::utils

#endif
