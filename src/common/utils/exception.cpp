/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "exception.hpp"

namespace deploymon::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

DeploymonException::DeploymonException(const Error& err, const std::string& message)
    : Poco::Exception(message, err.Message(), err.Errno())
    , mError(err, message.empty() ? nullptr : message.c_str())
{
    const auto errStr = ErrorToString(err);

    if (message.empty()) {
        Poco::Exception::message(errStr);

        return;
    }

    Poco::Exception::message(errStr.empty() ? message : message + ": " + errStr);
}

Error ToAosError(const std::exception& e, ErrorEnum err)
{
    if (const auto* deploymonExc = dynamic_cast<const DeploymonException*>(&e)) {
        return deploymonExc->GetError();
    }

    if (const auto* pocoExc = dynamic_cast<const Poco::Exception*>(&e)) {
        return Error {err, pocoExc->displayText().c_str()};
    }

    return Error {err, e.what()};
}

std::string ErrorToString(const Error& err)
{
    aos::StaticString<aos::cMaxErrorStrLen> errStr;

    if (!errStr.Convert(err).IsNone()) {
        return err.Message();
    }

    return errStr.CStr();
}

} // namespace deploymon::common::utils
