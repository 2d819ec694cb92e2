// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cfnsan {

enum class node_type : uint8_t { null, boolean, int64, uint64, float64, string, array, map };

std::string_view node_type_to_str(node_type type);

// A parsed template: a tree of insertion-ordered maps, arrays and scalars.
// Nodes own their children, copying a node performs a deep copy.
class node {
public:
    using array_type = std::vector<node>;
    using map_type = std::vector<std::pair<std::string, node>>;

    node() = default;
    // NOLINTBEGIN(google-explicit-constructor,hicpp-explicit-conversions)
    node(std::nullptr_t) {}
    node(bool value) : value_(value) {}
    node(int64_t value) : value_(value) {}
    node(uint64_t value) : value_(value) {}
    node(double value) : value_(value) {}
    node(std::string value) : value_(std::move(value)) {}
    node(std::string_view value) : value_(std::string{value}) {}
    node(const char *value) : value_(std::string{value}) {}
    node(array_type value) : value_(std::move(value)) {}
    node(map_type value) : value_(std::move(value)) {}
    // NOLINTEND(google-explicit-constructor,hicpp-explicit-conversions)

    ~node() = default;
    node(const node &) = default;
    node(node &&) noexcept = default;
    node &operator=(const node &) = default;
    node &operator=(node &&) noexcept = default;

    static node make_array() { return node{array_type{}}; }
    static node make_map() { return node{map_type{}}; }

    [[nodiscard]] node_type type() const { return static_cast<node_type>(value_.index()); }

    [[nodiscard]] bool is_null() const { return type() == node_type::null; }
    [[nodiscard]] bool is_bool() const { return type() == node_type::boolean; }
    [[nodiscard]] bool is_string() const { return type() == node_type::string; }
    [[nodiscard]] bool is_array() const { return type() == node_type::array; }
    [[nodiscard]] bool is_map() const { return type() == node_type::map; }
    [[nodiscard]] bool is_container() const { return is_array() || is_map(); }
    [[nodiscard]] bool is_scalar() const { return !is_container() && !is_null(); }

    // Typed accessors, nullptr or nullopt on type mismatch
    [[nodiscard]] const std::string *as_string() const { return std::get_if<std::string>(&value_); }
    [[nodiscard]] std::string *as_string() { return std::get_if<std::string>(&value_); }
    [[nodiscard]] const array_type *as_array() const { return std::get_if<array_type>(&value_); }
    [[nodiscard]] array_type *as_array() { return std::get_if<array_type>(&value_); }
    [[nodiscard]] const map_type *as_map() const { return std::get_if<map_type>(&value_); }
    [[nodiscard]] map_type *as_map() { return std::get_if<map_type>(&value_); }
    [[nodiscard]] std::optional<bool> as_bool() const;
    [[nodiscard]] std::optional<int64_t> as_int64() const;
    [[nodiscard]] std::optional<uint64_t> as_uint64() const;
    [[nodiscard]] std::optional<double> as_float64() const;

    // Number of children for containers, zero for scalars
    [[nodiscard]] std::size_t size() const;

    // Map lookup, first entry with the given key; nullptr if absent or not a map
    [[nodiscard]] const node *find(std::string_view key) const;
    [[nodiscard]] node *find(std::string_view key);
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    // Replaces the value of an existing key in place or appends a new entry,
    // a non-map node is first turned into an empty map.
    node &emplace(std::string key, node value);

    // Appends to an array, a non-array node is first turned into an empty array.
    node &push_back(node value);

    bool operator==(const node &other) const;
    bool operator!=(const node &other) const { return !(*this == other); }

protected:
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, array_type,
        map_type>
        value_;
};

// Strings are rendered verbatim, anything else as compact JSON
std::string to_string(const node &value);

} // namespace cfnsan
