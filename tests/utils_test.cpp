// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"

using namespace cfnsan;
using namespace std::literals;

namespace {

TEST(TestUtils, Utf8Length)
{
    EXPECT_EQ(utf8_length(""), 0);
    EXPECT_EQ(utf8_length("password"), 8);
    // Seven code points, eleven bytes
    EXPECT_EQ(utf8_length("p\xC3\xA4ssw\xE2\x82\xACr"), 7);
}

TEST(TestUtils, Utf8Truncate)
{
    EXPECT_STR(utf8_truncate("short", 10), "short");
    EXPECT_STR(utf8_truncate("exactly10!", 10), "exactly10!");
    EXPECT_STR(utf8_truncate("longer than ten", 10), "longer tha...");
    // Never splits a multi-byte sequence
    EXPECT_STR(utf8_truncate("\xC3\xA4\xC3\xA4\xC3\xA4", 2), "\xC3\xA4\xC3\xA4...");
}

TEST(TestUtils, Split)
{
    auto parts = split("Resources.Instance.Properties", '.');
    ASSERT_EQ(parts.size(), 3);
    EXPECT_STR(parts[0], "Resources");
    EXPECT_STR(parts[2], "Properties");

    EXPECT_EQ(split("Parameters", '.').size(), 1);
}

TEST(TestUtils, CaseConversion)
{
    EXPECT_STR(to_lower("InstanceKeyName"), "instancekeyname");
    EXPECT_STR(to_upper("aws_access_key_id"), "AWS_ACCESS_KEY_ID");
    EXPECT_TRUE(string_iequals("TRUE", "true"));
    EXPECT_FALSE(string_iequals("true", "truex"));
}

TEST(TestUtils, IsBlank)
{
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\n"));
    EXPECT_FALSE(is_blank("  x "));
}

TEST(TestUtils, FromString)
{
    auto [res, value] = from_string<int64_t>("-12");
    EXPECT_TRUE(res);
    EXPECT_EQ(value, -12);

    EXPECT_FALSE(from_string<int64_t>("12a").first);
    EXPECT_FALSE(from_string<uint64_t>("-1").first);
    EXPECT_TRUE(from_string<double>("1.5").first);
}

TEST(TestRegexUtils, InitAndMatch)
{
    auto regex = regex_init("[a-z]+[0-9]");
    EXPECT_TRUE(regex_match(*regex, "--abc1--"));
    EXPECT_FALSE(regex_match(*regex, "--abc1--", re2::RE2::ANCHOR_START));
    EXPECT_TRUE(regex_match(*regex, "abc1--", re2::RE2::ANCHOR_START));

    auto insensitive = regex_init("secret", false);
    EXPECT_TRUE(regex_match(*insensitive, "TopSECRET"));
}

TEST(TestRegexUtils, InvalidRegex)
{
    EXPECT_THROW(regex_init("(unclosed"), std::runtime_error);
    EXPECT_EQ(regex_init_nothrow("(unclosed"), nullptr);
}

TEST(TestRegexUtils, ReplaceAll)
{
    auto regex = regex_init("token=[a-z]+");
    std::string subject{"a token=abc and token=def"};
    EXPECT_EQ(regex_replace_all(*regex, subject, "MASKED"), 2);
    EXPECT_STR(subject, "a MASKED and MASKED");

    std::string untouched{"nothing here"};
    EXPECT_EQ(regex_replace_all(*regex, untouched, "MASKED"), 0);
    EXPECT_STR(untouched, "nothing here");
}

} // namespace
