/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <gtest/gtest.h>

#include <core/common/tests/utils/log.hpp>
#include <core/common/tests/utils/utils.hpp>

#include <monitor/monitor.hpp>

#include "mocks/httpclientmock.hpp"
#include "mocks/instancecontrolmock.hpp"
#include "mocks/loadbalancermock.hpp"
#include "mocks/servercountermock.hpp"
#include "stubs/clockstub.hpp"

using namespace testing;

namespace deploymon::monitor::tests {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr auto cInstanceID  = "i-0123456789abcdef0";
constexpr auto cPublicIP    = "10.0.0.1";
constexpr auto cTargetGroup = "arn:aws:elasticloadbalancing:us-east-1:123456789012:targetgroup/otp/6d0ecf831eec9f09";
constexpr auto cLogFolder   = "s3://datatools-bucket/deployment-1";
constexpr auto cStatusURL   = "http://10.0.0.1/status.json";
constexpr auto cRouterURL   = "http://10.0.0.1/otp/routers/default";
constexpr auto cLogPath     = "s3://datatools-bucket/deployment-1/i-0123456789abcdef0-otp-runner.log";

const InstanceState cRunning {cInstanceStateRunning, "running"};
const InstanceState cStopped {cInstanceStateStopped, "stopped"};
const InstanceState cTerminated {cInstanceStateTerminated, "terminated"};

/***********************************************************************************************************************
 * Utils
 **********************************************************************************************************************/

RetWithError<HTTPResponse> Response(int status, const std::string& body = "")
{
    return {HTTPResponse {status, body}, ErrorEnum::eNone};
}

std::string RunnerStatusJSON(bool error, const std::string& message, double pct, bool serverStarted, bool graphUploaded)
{
    std::ostringstream os;

    os << std::boolalpha << R"({"error":)" << error << R"(,"message":")" << message << R"(","pctProgress":)" << pct
       << R"(,"serverStarted":)" << serverStarted << R"(,"graphUploaded":)" << graphUploaded << "}";

    return os.str();
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class MonitorTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        mDeployment.mName           = "deployment-1";
        mDeployment.mTargetGroupARN = cTargetGroup;
        mDeployment.mLogFolderURI   = cLogFolder;

        mInstance.mID       = cInstanceID;
        mInstance.mPublicIP = cPublicIP;

        EXPECT_CALL(mInstanceControl, GetInstanceState(cInstanceID)).WillRepeatedly(Invoke([this](const std::string&) {
            return RetWithError<std::optional<InstanceState>>(mInstanceState, ErrorEnum::eNone);
        }));
    }

    void InitMonitor()
    {
        auto err = mMonitor.Init(mConfig, mDeployment, mInstance, mInstanceControl, mLoadBalancer, mHTTPClient, mClock,
            mServerCounter, &mCancelled);
        ASSERT_TRUE(err.IsNone()) << aos::tests::utils::ErrorToStr(err);
    }

    void ExpectTermination(const InstanceState& state = cTerminated)
    {
        EXPECT_CALL(mInstanceControl, TerminateInstance(cInstanceID))
            .WillOnce(Return(RetWithError<InstanceState>(state, ErrorEnum::eNone)));
    }

    void ExpectFailure(const std::string& messagePart)
    {
        const auto status = mMonitor.GetJobStatus();

        EXPECT_TRUE(status.mError);
        EXPECT_TRUE(status.mCompleted);
        EXPECT_NE(status.mMessage.find(messagePart), std::string::npos) << status.mMessage;
        EXPECT_NE(status.mMessage.find(std::string("Check logs at: ") + cLogPath), std::string::npos)
            << status.mMessage;
        EXPECT_EQ(mMonitor.GetPhase().GetValue(), PhaseEnum::eFailed);
    }

    Config                          mConfig;
    DeploymentInfo                  mDeployment;
    InstanceInfo                    mInstance;
    InstanceState                   mInstanceState = cRunning;
    std::atomic<bool>               mCancelled {false};
    ClockStub                       mClock;
    StrictMock<InstanceControlMock> mInstanceControl;
    StrictMock<LoadBalancerMock>    mLoadBalancer;
    StrictMock<HTTPClientMock>      mHTTPClient;
    StrictMock<ServerCounterMock>   mServerCounter;
    Monitor                         mMonitor;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(MonitorTest, InitRequiresInstanceAddress)
{
    mInstance.mPublicIP.clear();

    auto err = mMonitor.Init(mConfig, mDeployment, mInstance, mInstanceControl, mLoadBalancer, mHTTPClient, mClock,
        mServerCounter);

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument)) << aos::tests::utils::ErrorToStr(err);
}

TEST_F(MonitorTest, ServerRegisteredWithLoadBalancer)
{
    InitMonitor();

    EXPECT_EQ(mMonitor.GetJobStatus().mMessage, "Checking server status...");
    EXPECT_EQ(mMonitor.GetRunnerLogPath(), cLogPath);

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(404)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Building graph", 10, false, false))))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Building graph", 50, false, false))))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Server started", 80, true, false))));
    EXPECT_CALL(mHTTPClient, Get(cRouterURL)).WillOnce(Return(Response(503))).WillOnce(Return(Response(200)));
    EXPECT_CALL(mLoadBalancer, RegisterTarget(cTargetGroup, cInstanceID)).WillRepeatedly(Return(ErrorEnum::eNone));
    EXPECT_CALL(mLoadBalancer, GetTargetHealth(cTargetGroup))
        .WillOnce(Return(RetWithError<std::vector<TargetHealth>>({}, ErrorEnum::eNone)))
        .WillOnce(Return(RetWithError<std::vector<TargetHealth>>({{cInstanceID, "initial"}}, ErrorEnum::eNone)));
    EXPECT_CALL(mServerCounter, IncrementCompletedServers()).Times(1);
    EXPECT_CALL(mInstanceControl, TerminateInstance(_)).Times(0);

    mMonitor.Run();

    const auto status = mMonitor.GetJobStatus();

    EXPECT_FALSE(status.mError);
    EXPECT_TRUE(status.mCompleted);
    EXPECT_DOUBLE_EQ(status.mPercent, 100.0);
    EXPECT_NE(status.mMessage.find(cTargetGroup), std::string::npos) << status.mMessage;
    EXPECT_NE(status.mMessage.find(cRouterURL), std::string::npos) << status.mMessage;
    EXPECT_EQ(mMonitor.GetPhase().GetValue(), PhaseEnum::eSucceeded);
    EXPECT_EQ(mMonitor.GetGraphTaskDuration(), Time::cSeconds * 8);
    EXPECT_EQ(mMonitor.GetInstanceID(), cInstanceID);
    EXPECT_EQ(mMonitor.GetDeploymentName(), "deployment-1");
}

TEST_F(MonitorTest, StatusFileTimeout)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL)).WillRepeatedly(Return(Response(404)));
    EXPECT_CALL(mServerCounter, IncrementCompletedServers()).Times(0);
    ExpectTermination();

    const auto start = mClock.Now();

    mMonitor.Run();

    const auto elapsed = mClock.Now().Sub(start);

    EXPECT_GE(elapsed.Nanoseconds(), mConfig.mStatusFileTimeout.Nanoseconds());
    EXPECT_LT(elapsed.Nanoseconds(), mConfig.mStatusFileTimeout.Nanoseconds() + mConfig.mPollDelay.Nanoseconds());

    ExpectFailure("Job timed out while waiting for otp-runner to produce a status file!");
    EXPECT_TRUE(mMonitor.GetJobStatus().mInstanceTerminated);
}

TEST_F(MonitorTest, RunnerErrorFailsImmediately)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(true, "Failed to load OSM extract", 99, true, true))));
    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("Failed to load OSM extract");
    EXPECT_EQ(mClock.GetSleepCount(), 2);
}

TEST_F(MonitorTest, BuildOnlyCompletesOnGraphUpload)
{
    mDeployment.mBuildGraphOnly = true;

    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Uploading graph", 95, false, false))))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Graph uploaded", 100, false, true))));
    EXPECT_CALL(mServerCounter, IncrementCompletedServers()).Times(0);

    mMonitor.Run();

    const auto status = mMonitor.GetJobStatus();

    EXPECT_FALSE(status.mError);
    EXPECT_TRUE(status.mCompleted);
    EXPECT_DOUBLE_EQ(status.mPercent, 100.0);
    EXPECT_EQ(status.mMessage, "Graph build/download completed in 8 seconds!");
    EXPECT_EQ(mMonitor.GetPhase().GetValue(), PhaseEnum::eBuildCompleted);
}

TEST_F(MonitorTest, ServingDeploymentIgnoresGraphUpload)
{
    mDeployment.mGraphAlreadyBuilt = true;
    mConfig.mGraphBuildTimeout     = Time::cSeconds * 30;
    mConfig.mGraphLoadTimeout      = Time::cMinutes * 2;

    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillRepeatedly(Return(Response(200, RunnerStatusJSON(false, "Graph uploaded", 100, false, true))));
    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("Job timed out while waiting for otp-runner to finish!");
    EXPECT_GE(mMonitor.GetJobStatus().mPercent, 100.0);
    EXPECT_GE(mClock.GetTotalSleep().Nanoseconds(), mConfig.mGraphLoadTimeout.Nanoseconds());
}

TEST_F(MonitorTest, RouterTimeout)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Server started", 80, true, false))));
    EXPECT_CALL(mHTTPClient, Get(cRouterURL))
        .WillRepeatedly(Return(RetWithError<HTTPResponse>({}, Error(ErrorEnum::eRuntime, "connection refused"))));
    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("Job timed out while waiting for trip planner to start up.");
}

TEST_F(MonitorTest, RegistrationTimeout)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Server started", 80, true, false))));
    EXPECT_CALL(mHTTPClient, Get(cRouterURL)).WillOnce(Return(Response(200)));
    EXPECT_CALL(mLoadBalancer, RegisterTarget(cTargetGroup, cInstanceID)).WillRepeatedly(Return(ErrorEnum::eNone));
    EXPECT_CALL(mLoadBalancer, GetTargetHealth(cTargetGroup))
        .WillRepeatedly(Return(RetWithError<std::vector<TargetHealth>>({{"i-other", "healthy"}}, ErrorEnum::eNone)));
    EXPECT_CALL(mServerCounter, IncrementCompletedServers()).Times(0);
    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("Job timed out while waiting to register EC2 instance with load balancer target group.");
    EXPECT_DOUBLE_EQ(mMonitor.GetJobStatus().mPercent, 90.0);
}

TEST_F(MonitorTest, InstanceStoppedWhileWaitingForRouter)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL))
        .WillOnce(Return(Response(200)))
        .WillOnce(Return(Response(200, RunnerStatusJSON(false, "Server started", 80, true, false))));
    EXPECT_CALL(mHTTPClient, Get(cRouterURL)).WillOnce(Invoke([this](const std::string&) {
        mInstanceState = cStopped;

        return Response(503);
    }));
    EXPECT_CALL(mServerCounter, IncrementCompletedServers()).Times(0);
    ExpectTermination(cStopped);

    mMonitor.Run();

    ExpectFailure("Instance state no longer healthy! It changed to: stopped.");
    EXPECT_FALSE(mMonitor.GetJobStatus().mInstanceTerminated);
}

TEST_F(MonitorTest, MissingTargetGroupFailsBeforePolling)
{
    mDeployment.mTargetGroupARN.clear();

    InitMonitor();

    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("There is no load balancer under which to register ec2 instance.");
    EXPECT_EQ(mClock.GetSleepCount(), 0);
}

TEST_F(MonitorTest, TerminationErrorIsNotEscalated)
{
    mDeployment.mTargetGroupARN.clear();

    InitMonitor();

    EXPECT_CALL(mInstanceControl, TerminateInstance(cInstanceID))
        .WillOnce(Return(RetWithError<InstanceState>({}, Error(ErrorEnum::eRuntime, "access denied"))));

    mMonitor.Run();

    ExpectFailure("There is no load balancer");
    EXPECT_FALSE(mMonitor.GetJobStatus().mInstanceTerminated);
}

TEST_F(MonitorTest, Cancelled)
{
    InitMonitor();

    EXPECT_CALL(mHTTPClient, Get(cStatusURL)).WillRepeatedly(Invoke([this](const std::string&) {
        mCancelled = true;

        return Response(404);
    }));
    ExpectTermination();

    mMonitor.Run();

    ExpectFailure("cancelled");
    EXPECT_EQ(mClock.GetSleepCount(), 1);
}

} // namespace deploymon::monitor::tests
