/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>

#include <monitor/jobstatus.hpp>

using namespace testing;

namespace deploymon::monitor::tests {

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST(JobStatusTest, Update)
{
    JobStatus status;

    status.Update("Building graph", 42.0);

    auto data = status.GetSnapshot();

    EXPECT_EQ(data.mMessage, "Building graph");
    EXPECT_DOUBLE_EQ(data.mPercent, 42.0);
    EXPECT_FALSE(data.mCompleted);
    EXPECT_FALSE(data.mError);

    status.Update("over", 150.0);
    EXPECT_DOUBLE_EQ(status.GetSnapshot().mPercent, 100.0);

    status.Update("under", -1.0);
    EXPECT_DOUBLE_EQ(status.GetSnapshot().mPercent, 0.0);
}

TEST(JobStatusTest, Fail)
{
    JobStatus status;

    status.Update("Building graph", 42.0);
    status.Fail("failed");

    auto data = status.GetSnapshot();

    EXPECT_TRUE(status.IsError());
    EXPECT_TRUE(data.mError);
    EXPECT_TRUE(data.mCompleted);
    EXPECT_EQ(data.mMessage, "failed");
    EXPECT_DOUBLE_EQ(data.mPercent, 42.0);
}

TEST(JobStatusTest, CompleteSuccessfully)
{
    JobStatus status;

    status.CompleteSuccessfully("done");

    auto data = status.GetSnapshot();

    EXPECT_FALSE(status.IsError());
    EXPECT_TRUE(data.mCompleted);
    EXPECT_DOUBLE_EQ(data.mPercent, 100.0);
    EXPECT_EQ(data.mMessage, "done");
    EXPECT_FALSE(data.mInstanceTerminated);

    status.SetInstanceTerminated();
    EXPECT_TRUE(status.GetSnapshot().mInstanceTerminated);
}

TEST(JobStatusTest, ConcurrentReaders)
{
    JobStatus         status;
    std::atomic<bool> done {false};

    std::thread reader([&]() {
        while (!done) {
            auto data = status.GetSnapshot();

            EXPECT_GE(data.mPercent, 0.0);
            EXPECT_LE(data.mPercent, 100.0);
        }
    });

    for (int i = 0; i <= 100; i++) {
        status.Update("progress " + std::to_string(i), i);
    }

    status.CompleteSuccessfully("done");

    done = true;
    reader.join();

    EXPECT_TRUE(status.GetSnapshot().mCompleted);
}

} // namespace deploymon::monitor::tests
