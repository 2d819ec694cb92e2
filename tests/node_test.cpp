// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "common/gtest_utils.hpp"
#include "node.hpp"

using namespace cfnsan;
using namespace std::literals;

namespace {

TEST(TestNode, ScalarTypes)
{
    EXPECT_EQ(node{}.type(), node_type::null);
    EXPECT_EQ(node{nullptr}.type(), node_type::null);
    EXPECT_EQ(node{true}.type(), node_type::boolean);
    EXPECT_EQ(node{int64_t{-5}}.type(), node_type::int64);
    EXPECT_EQ(node{uint64_t{5}}.type(), node_type::uint64);
    EXPECT_EQ(node{1.5}.type(), node_type::float64);
    EXPECT_EQ(node{"value"}.type(), node_type::string);
    EXPECT_EQ(node{"value"sv}.type(), node_type::string);
    EXPECT_EQ(node::make_array().type(), node_type::array);
    EXPECT_EQ(node::make_map().type(), node_type::map);

    EXPECT_TRUE(node{"value"}.is_scalar());
    EXPECT_FALSE(node{}.is_scalar());
    EXPECT_TRUE(node::make_map().is_container());
}

TEST(TestNode, TypedAccessorsOnMismatch)
{
    node value{"text"};
    EXPECT_EQ(value.as_array(), nullptr);
    EXPECT_EQ(value.as_map(), nullptr);
    EXPECT_FALSE(value.as_bool().has_value());
    EXPECT_FALSE(value.as_int64().has_value());
    EXPECT_FALSE(value.as_uint64().has_value());
    EXPECT_FALSE(value.as_float64().has_value());
    ASSERT_NE(value.as_string(), nullptr);
    EXPECT_STR(*value.as_string(), "text");

    EXPECT_EQ(node{int64_t{3}}.as_string(), nullptr);
    EXPECT_EQ(*node{int64_t{3}}.as_int64(), 3);
}

TEST(TestNode, EmplaceKeepsInsertionOrder)
{
    auto map = node::make_map();
    map.emplace("b", "1");
    map.emplace("a", "2");
    map.emplace("c", "3");
    map.emplace("a", "4");

    ASSERT_EQ(map.size(), 3);
    const auto &entries = *map.as_map();
    EXPECT_STR(entries[0].first, "b");
    EXPECT_STR(entries[1].first, "a");
    EXPECT_STR(entries[2].first, "c");
    EXPECT_EQ(entries[1].second, node{"4"});
}

TEST(TestNode, EmplaceOnScalarCreatesMap)
{
    node value{"scalar"};
    value.emplace("key", true);
    ASSERT_TRUE(value.is_map());
    EXPECT_TRUE(value.contains("key"));
    EXPECT_FALSE(value.contains("other"));
}

TEST(TestNode, FindOnNonMap)
{
    node value{"scalar"};
    EXPECT_EQ(value.find("key"), nullptr);

    auto array = node::make_array();
    array.push_back("key");
    EXPECT_EQ(array.find("key"), nullptr);
    EXPECT_EQ(array.size(), 1);
}

TEST(TestNode, DeepCopy)
{
    auto original = node::make_map();
    original.emplace("nested", node::make_map()).emplace("secret", "hunter2");

    node copy = original;
    copy.find("nested")->emplace("secret", "redacted");

    EXPECT_EQ(*original.find("nested")->find("secret"), node{"hunter2"});
    EXPECT_EQ(*copy.find("nested")->find("secret"), node{"redacted"});
    EXPECT_NE(original, copy);
}

TEST(TestNode, EqualityIsOrderSensitive)
{
    auto first = node::make_map();
    first.emplace("a", int64_t{1});
    first.emplace("b", int64_t{2});

    auto second = node::make_map();
    second.emplace("b", int64_t{2});
    second.emplace("a", int64_t{1});

    EXPECT_NE(first, second);
    EXPECT_EQ(first, node{first});

    EXPECT_NE(node{int64_t{1}}, node{uint64_t{1}});
}

TEST(TestNode, ToString)
{
    EXPECT_STR(to_string(node{"plain text"}), "plain text");
    EXPECT_STR(to_string(node{true}), "true");
    EXPECT_STR(to_string(node{int64_t{-42}}), "-42");

    auto sub = node::make_map();
    sub.emplace("Fn::Sub", "echo ${Password}");
    EXPECT_STR(to_string(sub), R"({"Fn::Sub":"echo ${Password}"})");

    auto list = node::make_array();
    list.push_back("a");
    list.push_back(node{});
    EXPECT_STR(to_string(list), R"(["a",null])");
}

TEST(TestNode, TypeToString)
{
    EXPECT_STR(node_type_to_str(node_type::null), "null");
    EXPECT_STR(node_type_to_str(node_type::string), "string");
    EXPECT_STR(node_type_to_str(node_type::map), "map");
}

} // namespace
