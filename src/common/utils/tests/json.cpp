/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <common/utils/exception.hpp>
#include <common/utils/json.hpp>

using namespace testing;

namespace deploymon::common::utils {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cStatusJSON = R"({
    "Message": "Building graph",
    "pctProgress": 42.5,
    "serverStarted": false,
    "nested": {"Nonce": "abc"},
    "instances": [{"id": "i-1"}, {"id": "i-2"}],
    "empty": null
})";

} // namespace

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(JSONTest, ParseJson)
{
    auto [var, err] = ParseJson(cStatusJSON);
    ASSERT_TRUE(err.IsNone());

    CaseInsensitiveObjectWrapper object(var);

    EXPECT_TRUE(object.Has("message"));
    EXPECT_TRUE(object.Has("PCTPROGRESS"));
    EXPECT_FALSE(object.Has("graphUploaded"));

    EXPECT_EQ(object.GetValue<std::string>("message"), "Building graph");
    EXPECT_DOUBLE_EQ(object.GetValue<double>("pctProgress"), 42.5);
    EXPECT_FALSE(object.GetValue<bool>("serverStarted", true));
    EXPECT_TRUE(object.GetValue<bool>("graphUploaded", true));
    EXPECT_FALSE(object.GetOptionalValue<std::string>("empty").has_value());

    EXPECT_EQ(object.GetObject("Nested").GetValue<std::string>("nonce"), "abc");
    EXPECT_THROW(object.GetObject("missing"), DeploymonException);
    EXPECT_THROW(object.GetObject("message"), DeploymonException);
}

TEST(JSONTest, ForEach)
{
    auto [var, err] = ParseJson(cStatusJSON);
    ASSERT_TRUE(err.IsNone());

    CaseInsensitiveObjectWrapper object(var);
    std::vector<std::string>     ids;

    ForEach(object, "Instances", [&ids](const Poco::Dynamic::Var& item) {
        ids.push_back(CaseInsensitiveObjectWrapper(item).GetValue<std::string>("id"));
    });

    EXPECT_EQ(ids, std::vector<std::string>({"i-1", "i-2"}));

    ForEach(object, "missing", [](const Poco::Dynamic::Var&) { FAIL() << "unexpected item"; });
}

TEST(JSONTest, ParseInvalidJson)
{
    auto [var, err] = ParseJson("{\"message\": ");

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument));
}

} // namespace deploymon::common::utils
