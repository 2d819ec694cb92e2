// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "exception.hpp"
#include "json_utils.hpp"

using namespace cfnsan;
using namespace std::literals;

namespace {

TEST(TestJsonUtils, ParseTypes)
{
    auto root = json_to_node(
        R"({"s": "text", "i": -3, "u": 18446744073709551615, "l": 4294967296, "d": 1.5, "b": false, "n": null,
            "a": [1, "two"], "m": {"k": "v"}})");

    ASSERT_TRUE(root.is_map());
    EXPECT_EQ(*root.find("s"), node{"text"});
    EXPECT_EQ(*root.find("i"), node{int64_t{-3}});
    EXPECT_EQ(*root.find("u"), node{uint64_t{18446744073709551615ULL}});
    EXPECT_EQ(*root.find("l"), node{int64_t{4294967296}});
    EXPECT_EQ(*root.find("d"), node{1.5});
    EXPECT_EQ(*root.find("b"), node{false});
    EXPECT_TRUE(root.find("n")->is_null());
    EXPECT_EQ(root.find("a")->size(), 2);
    EXPECT_EQ(*root.find("m")->find("k"), node{"v"});
}

TEST(TestJsonUtils, PreservesKeyOrder)
{
    auto root = json_to_node(
        R"({"Resources": {}, "Parameters": {}, "AWSTemplateFormatVersion": "2010-09-09"})");
    const auto &entries = *root.as_map();
    ASSERT_EQ(entries.size(), 3);
    EXPECT_STR(entries[0].first, "Resources");
    EXPECT_STR(entries[1].first, "Parameters");
    EXPECT_STR(entries[2].first, "AWSTemplateFormatVersion");
}

TEST(TestJsonUtils, MalformedDocument)
{
    EXPECT_THROW(json_to_node(R"({"a": )"), template_error);
    EXPECT_THROW(json_to_node(R"({"a": 1} trailing)"), template_error);
    EXPECT_THROW(json_to_node(""), template_error);
}

TEST(TestJsonUtils, DepthLimit)
{
    std::string deep(300, '[');
    deep.append(300, ']');
    EXPECT_THROW(json_to_node(deep), template_error);

    std::string shallow(100, '[');
    shallow.append(100, ']');
    EXPECT_NO_THROW(json_to_node(shallow));
}

TEST(TestJsonUtils, Serialise)
{
    auto root = node::make_map();
    root.emplace("Ref", "Param");
    root.emplace("List", node::make_array()).push_back(int64_t{1});

    EXPECT_STR(node_to_json(root, false), R"({"Ref":"Param","List":[1]})");
    EXPECT_STR(node_to_json(root), "{\n  \"Ref\": \"Param\",\n  \"List\": [\n    1\n  ]\n}");
}

TEST(TestJsonUtils, Findings)
{
    finding_list findings{{"Parameters.ApiKey.Default", "parameter_defaults", "abc\"def"}};
    EXPECT_STR(findings_to_json(findings), R"([
  {
    "path": "Parameters.ApiKey.Default",
    "pattern": "parameter_defaults",
    "original": "abc\"def"
  }
])");

    EXPECT_STR(findings_to_json({}), "[]");
}

} // namespace
