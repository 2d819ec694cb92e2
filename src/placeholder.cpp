// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "placeholder.hpp"
#include "utils.hpp"

namespace cfnsan {

std::string secret_placeholder(std::string_view rule, std::string_view key)
{
    return fmt::format("{{{{resolve:secretsmanager:{}:SecretString:{}}}}}", rule, key);
}

std::string value_placeholder(std::string_view rule)
{
    return fmt::format("SANITIZED-{}-VALUE", to_upper(rule));
}

std::string value_placeholder(std::string_view rule, std::size_t index)
{
    return fmt::format("SANITIZED-{}-VALUE-{}", to_upper(rule), index);
}

bool is_placeholder(std::string_view value)
{
    if (value.starts_with("{{resolve:") && value.ends_with("}}")) {
        return true;
    }

    static constexpr std::string_view prefix{"SANITIZED-"};
    static constexpr std::string_view suffix{"-VALUE"};
    if (!value.starts_with(prefix)) {
        return false;
    }
    value.remove_prefix(prefix.size());

    auto suffix_pos = value.find(suffix);
    if (suffix_pos == 0 || suffix_pos == std::string_view::npos) {
        return false;
    }

    auto name = value.substr(0, suffix_pos);
    if (!std::all_of(name.begin(), name.end(),
            [](char c) { return isupper(c) || isdigit(c) || c == '_'; })) {
        return false;
    }

    auto index = value.substr(suffix_pos + suffix.size());
    if (index.empty()) {
        return true;
    }

    if (index.front() != '-' || index.size() == 1) {
        return false;
    }
    index.remove_prefix(1);
    return std::all_of(index.begin(), index.end(), [](char c) { return isdigit(c); });
}

} // namespace cfnsan
