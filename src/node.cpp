// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "json_utils.hpp"
#include "node.hpp"

namespace cfnsan {

std::string_view node_type_to_str(node_type type)
{
    switch (type) {
    case node_type::null:
        return "null";
    case node_type::boolean:
        return "bool";
    case node_type::int64:
        return "int64";
    case node_type::uint64:
        return "uint64";
    case node_type::float64:
        return "float64";
    case node_type::string:
        return "string";
    case node_type::array:
        return "array";
    case node_type::map:
        return "map";
    }
    return "unknown";
}

std::optional<bool> node::as_bool() const
{
    if (const auto *value = std::get_if<bool>(&value_); value != nullptr) {
        return *value;
    }
    return std::nullopt;
}

std::optional<int64_t> node::as_int64() const
{
    if (const auto *value = std::get_if<int64_t>(&value_); value != nullptr) {
        return *value;
    }
    return std::nullopt;
}

std::optional<uint64_t> node::as_uint64() const
{
    if (const auto *value = std::get_if<uint64_t>(&value_); value != nullptr) {
        return *value;
    }
    return std::nullopt;
}

std::optional<double> node::as_float64() const
{
    if (const auto *value = std::get_if<double>(&value_); value != nullptr) {
        return *value;
    }
    return std::nullopt;
}

std::size_t node::size() const
{
    if (const auto *array = as_array(); array != nullptr) {
        return array->size();
    }
    if (const auto *map = as_map(); map != nullptr) {
        return map->size();
    }
    return 0;
}

const node *node::find(std::string_view key) const
{
    const auto *map = as_map();
    if (map == nullptr) {
        return nullptr;
    }

    for (const auto &[child_key, child] : *map) {
        if (child_key == key) {
            return &child;
        }
    }
    return nullptr;
}

node *node::find(std::string_view key)
{
    return const_cast<node *>(std::as_const(*this).find(key));
}

node &node::emplace(std::string key, node value)
{
    if (!is_map()) {
        value_ = map_type{};
    }

    if (auto *existing = find(key); existing != nullptr) {
        *existing = std::move(value);
        return *existing;
    }

    auto &map = std::get<map_type>(value_);
    map.emplace_back(std::move(key), std::move(value));
    return map.back().second;
}

node &node::push_back(node value)
{
    if (!is_array()) {
        value_ = array_type{};
    }

    auto &array = std::get<array_type>(value_);
    array.emplace_back(std::move(value));
    return array.back();
}

bool node::operator==(const node &other) const { return value_ == other.value_; }

std::string to_string(const node &value)
{
    if (const auto *str = value.as_string(); str != nullptr) {
        return *str;
    }
    return node_to_json(value, /*pretty=*/false);
}

} // namespace cfnsan
