// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <string>
#include <string_view>

#include "log.hpp"
#include "node.hpp"
#include "parameter_scanner.hpp"
#include "utils.hpp"
#include "value_classifier.hpp"

namespace cfnsan {

namespace {

// Any of these in a name means the parameter is not sensitive, whatever else
constexpr std::array<std::string_view, 13> strong_non_sensitive_terms{"bucket", "domain", "path",
    "url", "endpoint", "address", "name", "file", "region", "zone", "id", "arn", "identifier"};

// These only hint at a non-sensitive parameter, a standalone sensitive word still wins
constexpr std::array<std::string_view, 14> weak_non_sensitive_terms{"type", "instance", "size",
    "region", "az", "availability", "zone", "count", "number", "name", "env", "environment",
    "stage", "class"};

constexpr std::array<std::string_view, 11> sensitive_terms{"password", "secret", "key", "token",
    "apikey", "accesskey", "privatekey", "pwd", "credential", "auth", "passwd"};

template <std::size_t N>
bool contains_any(std::string_view str, const std::array<std::string_view, N> &terms)
{
    for (auto term : terms) {
        if (str.find(term) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

// Word boundaries of an identifier: separators, lower to upper case
// transitions, letter and digit transitions, and the end of an acronym
// (the "K" in "APIKey").
bool is_word_boundary(std::string_view name, std::size_t pos)
{
    if (pos == 0 || pos >= name.size()) {
        return true;
    }

    const char prev = name[pos - 1];
    const char curr = name[pos];
    if (!isalnum(prev) || !isalnum(curr)) {
        return true;
    }

    if (isdigit(prev) != isdigit(curr)) {
        return true;
    }

    if (islower(prev) && isupper(curr)) {
        return true;
    }

    return isupper(prev) && isupper(curr) && pos + 1 < name.size() && islower(name[pos + 1]);
}

bool contains_word(std::string_view name, std::string_view lowered, std::string_view term)
{
    for (auto pos = lowered.find(term); pos != std::string_view::npos;
         pos = lowered.find(term, pos + 1)) {
        if (is_word_boundary(name, pos) && is_word_boundary(name, pos + term.size())) {
            return true;
        }
    }
    return false;
}

} // namespace

bool is_sensitive_parameter_name(std::string_view name)
{
    auto lowered = to_lower(name);

    if (contains_any(lowered, strong_non_sensitive_terms)) {
        return false;
    }

    if (contains_any(lowered, weak_non_sensitive_terms)) {
        for (auto term : sensitive_terms) {
            if (contains_word(name, lowered, term)) {
                return true;
            }
        }
        return false;
    }

    return contains_any(lowered, sensitive_terms);
}

bool is_no_echo(const node &definition)
{
    const auto *no_echo = definition.find("NoEcho");
    if (no_echo == nullptr) {
        return false;
    }

    if (auto flag = no_echo->as_bool(); flag.has_value()) {
        return *flag;
    }

    const auto *str = no_echo->as_string();
    return str != nullptr && string_iequals(*str, "true");
}

sensitivity_set prescan_parameters(const node &parameters, const value_classifier &classifier)
{
    sensitivity_set sensitive;

    const auto *declarations = parameters.as_map();
    if (declarations == nullptr) {
        return sensitive;
    }

    for (const auto &[name, definition] : *declarations) {
        if (is_no_echo(definition)) {
            CFNSAN_DEBUG("Parameter '{}' is sensitive: NoEcho", name);
            sensitive.emplace(name);
            continue;
        }

        if (is_sensitive_parameter_name(name)) {
            CFNSAN_DEBUG("Parameter '{}' is sensitive: name", name);
            sensitive.emplace(name);
            continue;
        }

        const auto *default_value = definition.find("Default");
        if (default_value != nullptr && classifier.is_sensitive(*default_value)) {
            CFNSAN_DEBUG("Parameter '{}' is sensitive: default value", name);
            sensitive.emplace(name);
        }
    }

    return sensitive;
}

} // namespace cfnsan
