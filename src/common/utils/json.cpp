/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/JSON/Parser.h>
#include <Poco/String.h>

#include "exception.hpp"
#include "json.hpp"

namespace deploymon::common::utils {

/***********************************************************************************************************************
 * CaseInsensitiveObjectWrapper
 **********************************************************************************************************************/

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var)
    : mObject(var.extract<Poco::JSON::Object::Ptr>())
{
}

CaseInsensitiveObjectWrapper::CaseInsensitiveObjectWrapper(Poco::JSON::Object::Ptr object)
    : mObject(std::move(object))
{
    if (mObject.isNull()) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "null JSON object");
    }
}

bool CaseInsensitiveObjectWrapper::Has(const std::string& key) const
{
    return FindKey(key).has_value();
}

Poco::Dynamic::Var CaseInsensitiveObjectWrapper::Get(const std::string& key) const
{
    const auto name = FindKey(key);
    if (!name.has_value()) {
        return {};
    }

    return mObject->get(*name);
}

CaseInsensitiveObjectWrapper CaseInsensitiveObjectWrapper::GetObject(const std::string& key) const
{
    const auto name = FindKey(key);
    if (!name.has_value()) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eNotFound, "key not found: " + key);
    }

    const auto object = mObject->getObject(*name);
    if (object.isNull()) {
        DEPLOYMON_ERROR_THROW(ErrorEnum::eInvalidArgument, "value is not an object: " + key);
    }

    return CaseInsensitiveObjectWrapper(object);
}

Poco::JSON::Array::Ptr CaseInsensitiveObjectWrapper::GetArray(const std::string& key) const
{
    const auto name = FindKey(key);
    if (!name.has_value()) {
        return {};
    }

    return mObject->getArray(*name);
}

std::optional<std::string> CaseInsensitiveObjectWrapper::FindKey(const std::string& key) const
{
    if (mObject->has(key)) {
        return key;
    }

    for (const auto& [name, value] : *mObject) {
        (void)value;

        if (Poco::icompare(name, key) == 0) {
            return name;
        }
    }

    return std::nullopt;
}

/***********************************************************************************************************************
 * Functions
 **********************************************************************************************************************/

RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json)
{
    std::istringstream in(json);

    return ParseJson(in);
}

RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in)
{
    try {
        Poco::JSON::Parser parser;

        return RetWithError<Poco::Dynamic::Var>(parser.parse(in), ErrorEnum::eNone);
    } catch (const std::exception& e) {
        return RetWithError<Poco::Dynamic::Var>({}, AOS_ERROR_WRAP(ToAosError(e, ErrorEnum::eInvalidArgument)));
    }
}

} // namespace deploymon::common::utils
