// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <type_traits>
#include <yaml-cpp/yaml.h>

#include "exception.hpp"

namespace cfnsan {

template <typename T> constexpr const char *expected_type_name()
{
    if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<T, bool>) {
        return "boolean";
    } else {
        return "scalar";
    }
}

template <typename T> T at(const YAML::Node &map, const std::string &key)
{
    auto value = map[key];
    if (!value.IsDefined()) {
        throw missing_key(key);
    }

    if (!value.IsScalar()) {
        throw invalid_type(key, expected_type_name<T>());
    }

    try {
        return value.as<T>();
    } catch (const YAML::BadConversion &) {
        throw invalid_type(key, expected_type_name<T>());
    }
}

template <typename T> T at(const YAML::Node &map, const std::string &key, const T &default_)
{
    auto value = map[key];
    if (!value.IsDefined() || value.IsNull()) {
        return default_;
    }
    return at<T>(map, key);
}

inline YAML::Node at_sequence(const YAML::Node &map, const std::string &key)
{
    auto value = map[key];
    if (!value.IsDefined() || value.IsNull()) {
        return YAML::Node{YAML::NodeType::Sequence};
    }

    if (!value.IsSequence()) {
        throw invalid_type(key, "sequence");
    }
    return value;
}

} // namespace cfnsan
