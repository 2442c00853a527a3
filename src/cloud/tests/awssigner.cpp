/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <Poco/DateTimeParser.h>

#include <core/common/tests/utils/log.hpp>

#include <cloud/awssigner.hpp>

using namespace testing;

namespace deploymon::cloud::tests {

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

// AWS Signature Version 4 reference example (IAM ListUsers).
const Credentials cCredentials {"AKIDEXAMPLE", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", ""};

constexpr auto cAmzDate      = "20150830T123600Z";
constexpr auto cContentType  = "application/x-www-form-urlencoded; charset=utf-8";
constexpr auto cEmptyHash    = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr auto cRequestHash  = "f536975d06c0309214f805bb90ccff089219ecd68b2577efef23edd43b7e1a59";
constexpr auto cSigningKey   = "c4afb1cc5771d871763a393e44b703571b55cc28424d1a5e86da6ed3c154a4b9";
constexpr auto cSignature    = "5d672d79c15b13162d9279b0855cfba6789a8edb4c82c400e06b5924a6f2b5d7";
constexpr auto cSignedHeader = "content-type;host;x-amz-date";

CanonicalRequest ListUsersRequest()
{
    CanonicalRequest request;

    request.mMethod  = "GET";
    request.mPath    = "/";
    request.mQuery   = "Action=ListUsers&Version=2010-05-08";
    request.mHeaders = {{"content-type", cContentType}, {"host", "iam.amazonaws.com"}, {"x-amz-date", cAmzDate}};

    return request;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class AWSSignerTest : public Test {
protected:
    void SetUp() override
    {
        aos::tests::utils::InitLog();

        ASSERT_TRUE(mSigner.Init(cCredentials, "us-east-1", "iam").IsNone());
    }

    AWSSigner mSigner;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(AWSSignerTest, CanonicalRequest)
{
    const auto canonical = AWSSigner::FormatCanonicalRequest(ListUsersRequest());

    EXPECT_EQ(canonical,
        std::string("GET\n/\nAction=ListUsers&Version=2010-05-08\ncontent-type:") + cContentType
            + "\nhost:iam.amazonaws.com\nx-amz-date:" + cAmzDate + "\n\n" + cSignedHeader + "\n" + cEmptyHash);
    EXPECT_EQ(AWSSigner::SHA256Hex(canonical), cRequestHash);
}

TEST_F(AWSSignerTest, SigningKey)
{
    EXPECT_EQ(mSigner.GetSigningKeyHex("20150830"), cSigningKey);
}

TEST_F(AWSSignerTest, Authorization)
{
    EXPECT_EQ(mSigner.GetAuthorization(ListUsersRequest(), cAmzDate),
        std::string("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/iam/aws4_request, SignedHeaders=")
            + cSignedHeader + ", Signature=" + cSignature);
}

TEST_F(AWSSignerTest, SignHTTPRequest)
{
    Poco::Net::HTTPRequest request(
        Poco::Net::HTTPRequest::HTTP_GET, "/?Action=ListUsers&Version=2010-05-08", Poco::Net::HTTPMessage::HTTP_1_1);

    request.setHost("iam.amazonaws.com");
    request.setContentType(cContentType);

    int  tzd  = 0;
    auto date = Poco::DateTimeParser::parse("%Y%m%dT%H%M%SZ", cAmzDate, tzd);

    mSigner.Sign(request, "", date.timestamp());

    EXPECT_EQ(request.get("X-Amz-Date"), cAmzDate);
    EXPECT_FALSE(request.has("X-Amz-Security-Token"));
    EXPECT_NE(request.get("Authorization").find(std::string("Signature=") + cSignature), std::string::npos)
        << request.get("Authorization");
}

TEST_F(AWSSignerTest, SessionTokenIsSigned)
{
    AWSSigner signer;

    ASSERT_TRUE(signer.Init({"AKIDEXAMPLE", "secret", "session-token"}, "us-east-1", "ec2").IsNone());

    Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_POST, "/", Poco::Net::HTTPMessage::HTTP_1_1);

    request.setHost("ec2.us-east-1.amazonaws.com");

    signer.Sign(request, "Action=DescribeInstances", Poco::Timestamp());

    EXPECT_EQ(request.get("X-Amz-Security-Token"), "session-token");
    EXPECT_NE(request.get("Authorization").find("host;x-amz-date;x-amz-security-token"), std::string::npos)
        << request.get("Authorization");
}

TEST_F(AWSSignerTest, MissingCredentials)
{
    AWSSigner signer;

    EXPECT_TRUE(signer.Init({"", "", ""}, "us-east-1", "ec2").Is(ErrorEnum::eInvalidArgument));
}

} // namespace deploymon::cloud::tests
