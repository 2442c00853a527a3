/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_COMMON_UTILS_JSON_HPP_
#define DEPLOYMON_COMMON_UTILS_JSON_HPP_

#include <istream>
#include <optional>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include <common/types.hpp>

namespace deploymon::common::utils {

/**
 * Read-only accessor to JSON object with case insensitive key lookup.
 */
class CaseInsensitiveObjectWrapper {
public:
    /**
     * Creates wrapper from dynamic var holding JSON object.
     *
     * @param var dynamic var.
     */
    explicit CaseInsensitiveObjectWrapper(const Poco::Dynamic::Var& var);

    /**
     * Creates wrapper from JSON object.
     *
     * @param object JSON object.
     */
    explicit CaseInsensitiveObjectWrapper(Poco::JSON::Object::Ptr object);

    /**
     * Checks if key exists.
     *
     * @param key key.
     * @return bool.
     */
    bool Has(const std::string& key) const;

    /**
     * Returns raw value.
     *
     * @param key key.
     * @return Poco::Dynamic::Var empty if key not found.
     */
    Poco::Dynamic::Var Get(const std::string& key) const;

    /**
     * Returns value converted to T or default value if key not found or value is null.
     *
     * @param key key.
     * @param defaultValue default value.
     * @return T.
     */
    template <typename T>
    T GetValue(const std::string& key, const T& defaultValue = T {}) const
    {
        return GetOptionalValue<T>(key).value_or(defaultValue);
    }

    /**
     * Returns optional value converted to T.
     *
     * @param key key.
     * @return std::optional<T>.
     */
    template <typename T>
    std::optional<T> GetOptionalValue(const std::string& key) const
    {
        const auto value = Get(key);

        if (value.isEmpty()) {
            return std::nullopt;
        }

        return value.convert<T>();
    }

    /**
     * Returns nested object.
     *
     * @param key key.
     * @return CaseInsensitiveObjectWrapper.
     */
    CaseInsensitiveObjectWrapper GetObject(const std::string& key) const;

    /**
     * Returns nested array.
     *
     * @param key key.
     * @return Poco::JSON::Array::Ptr null if key not found.
     */
    Poco::JSON::Array::Ptr GetArray(const std::string& key) const;

private:
    std::optional<std::string> FindKey(const std::string& key) const;

    Poco::JSON::Object::Ptr mObject;
};

/**
 * Parses JSON string.
 *
 * @param json JSON string.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(const std::string& json);

/**
 * Parses JSON stream.
 *
 * @param in input stream.
 * @return RetWithError<Poco::Dynamic::Var>.
 */
RetWithError<Poco::Dynamic::Var> ParseJson(std::istream& in);

/**
 * Calls functor for each element of array under key.
 *
 * @param object JSON object.
 * @param key array key.
 * @param func functor.
 */
template <typename F>
void ForEach(const CaseInsensitiveObjectWrapper& object, const std::string& key, F&& func)
{
    const auto array = object.GetArray(key);
    if (array.isNull()) {
        return;
    }

    for (const auto& item : *array) {
        func(item);
    }
}

} // namespace deploymon::common::utils

#endif
