// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "placeholder.hpp"

using namespace cfnsan;
using namespace std::literals;

namespace {

TEST(TestPlaceholder, SecretPlaceholder)
{
    EXPECT_STR(secret_placeholder("generic_secret", "Password"),
        "{{resolve:secretsmanager:generic_secret:SecretString:Password}}");
    EXPECT_STR(secret_placeholder("rds_master_password", "MasterUsername"),
        "{{resolve:secretsmanager:rds_master_password:SecretString:MasterUsername}}");
}

TEST(TestPlaceholder, ValuePlaceholder)
{
    EXPECT_STR(value_placeholder("aws_access_key_id"), "SANITIZED-AWS_ACCESS_KEY_ID-VALUE");
    EXPECT_STR(value_placeholder("generic_secret", 0), "SANITIZED-GENERIC_SECRET-VALUE-0");
    EXPECT_STR(value_placeholder("generic_password", 12), "SANITIZED-GENERIC_PASSWORD-VALUE-12");
}

TEST(TestPlaceholder, IsPlaceholder)
{
    EXPECT_TRUE(is_placeholder("{{resolve:secretsmanager:generic_secret:SecretString:Password}}"));
    EXPECT_TRUE(is_placeholder("{{resolve:ssm-secure:/db/password:1}}"));
    EXPECT_TRUE(is_placeholder("SANITIZED-PARAMETER-VALUE"));
    EXPECT_TRUE(is_placeholder("SANITIZED-AWS_ACCESS_KEY_ID-VALUE"));
    EXPECT_TRUE(is_placeholder("SANITIZED-GENERIC_SECRET-VALUE-3"));

    EXPECT_FALSE(is_placeholder(""));
    EXPECT_FALSE(is_placeholder("SANITIZED-CREDENTIAL"));
    EXPECT_FALSE(is_placeholder("SANITIZED--VALUE"));
    EXPECT_FALSE(is_placeholder("SANITIZED-lower-VALUE"));
    EXPECT_FALSE(is_placeholder("SANITIZED-GENERIC_SECRET-VALUE-"));
    EXPECT_FALSE(is_placeholder("SANITIZED-GENERIC_SECRET-VALUE-1a"));
    EXPECT_FALSE(is_placeholder("SANITIZED-GENERIC_SECRET-VALUES"));
    EXPECT_FALSE(is_placeholder("{{resolve:unterminated"));
    EXPECT_FALSE(is_placeholder("P@ssw0rd123!"));
}

} // namespace
