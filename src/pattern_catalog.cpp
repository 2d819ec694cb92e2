// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <exception>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "log.hpp"
#include "pattern_catalog.hpp"
#include "placeholder.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"

namespace cfnsan {

namespace {

bool is_valid_rule_name(std::string_view name)
{
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                [](char c) { return isalnum(c) || c == '_'; });
}

// Every placeholder the sanitizer may synthesise with this rule set, the
// catalog must not be able to detect any of them.
std::vector<std::string> synthesisable_placeholders(const std::vector<pattern_rule> &rules)
{
    std::unordered_set<std::string> keys{"Description", "Name", "Value", "Password", "UserData"};
    std::vector<std::string_view> names{generic_secret_pattern};
    for (const auto &rule : rules) {
        names.emplace_back(rule.name());
        keys.insert(rule.keys().begin(), rule.keys().end());
    }

    std::vector<std::string> placeholders{
        std::string{parameter_placeholder}, std::string{credential_marker}};
    for (auto name : names) {
        placeholders.emplace_back(value_placeholder(name));
        placeholders.emplace_back(value_placeholder(name, 0));
        for (const auto &key : keys) { placeholders.emplace_back(secret_placeholder(name, key)); }
    }
    return placeholders;
}

} // namespace

pattern_rule::pattern_rule(
    std::string name, std::string_view regex_str, std::vector<std::string> keys)
    : name_(std::move(name)), keys_(std::move(keys))
{
    try {
        regex_ = regex_init(regex_str);
    } catch (const std::exception &e) {
        throw configuration_error("rule '" + name_ + "': " + e.what());
    }
}

pattern_rule::pattern_rule(std::string name, std::vector<std::string> keys)
    : name_(std::move(name)), keys_(std::move(keys))
{}

bool pattern_rule::match(std::string_view value) const
{
    return regex_ != nullptr && regex_match(*regex_, value);
}

bool pattern_rule::has_key(std::string_view key) const
{
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

pattern_catalog::pattern_catalog(std::vector<pattern_rule> rules) : rules_(std::move(rules))
{
    validate();
}

void pattern_catalog::validate() const
{
    std::unordered_set<std::string_view> names;
    for (const auto &rule : rules_) {
        if (!is_valid_rule_name(rule.name())) {
            throw configuration_error("invalid rule name '" + rule.name() +
                                      "', expected alphanumeric characters or underscores");
        }

        if (!names.emplace(rule.name()).second) {
            throw configuration_error("duplicate rule '" + rule.name() + "'");
        }

        if (!rule.has_regex() && rule.keys().empty()) {
            throw configuration_error("rule '" + rule.name() + "' has neither regex nor keys");
        }
    }

    for (const auto &placeholder : synthesisable_placeholders(rules_)) {
        for (const auto &rule : rules_) {
            if (rule.match(placeholder)) {
                throw configuration_error("rule '" + rule.name() +
                                          "' matches the placeholder '" + placeholder + "'");
            }
        }
    }

    CFNSAN_DEBUG("Validated pattern catalog with {} rules", rules_.size());
}

const pattern_rule *pattern_catalog::match_content(std::string_view value) const
{
    for (const auto &rule : rules_) {
        if (rule.match(value)) {
            CFNSAN_TRACE("Rule '{}' matched on content", rule.name());
            return &rule;
        }
    }
    return nullptr;
}

const pattern_rule *pattern_catalog::find_by_key(std::string_view key) const
{
    for (const auto &rule : rules_) {
        if (rule.has_key(key)) {
            return &rule;
        }
    }
    return nullptr;
}

const pattern_rule *pattern_catalog::find(std::string_view name) const
{
    for (const auto &rule : rules_) {
        if (rule.name() == name) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace cfnsan
