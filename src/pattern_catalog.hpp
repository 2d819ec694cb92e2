// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <vector>

namespace cfnsan {

// A named detection rule: a content regular expression, a set of property
// keys which imply sensitivity regardless of content, or both.
class pattern_rule {
public:
    // Throws configuration_error if the regex fails to compile
    pattern_rule(std::string name, std::string_view regex_str, std::vector<std::string> keys = {});
    pattern_rule(std::string name, std::vector<std::string> keys);

    pattern_rule(const pattern_rule &) = delete;
    pattern_rule &operator=(const pattern_rule &) = delete;
    pattern_rule(pattern_rule &&) noexcept = default;
    pattern_rule &operator=(pattern_rule &&) noexcept = default;
    ~pattern_rule() = default;

    [[nodiscard]] const std::string &name() const { return name_; }
    [[nodiscard]] bool has_regex() const { return regex_ != nullptr; }
    [[nodiscard]] const re2::RE2 *regex() const { return regex_.get(); }
    [[nodiscard]] const std::vector<std::string> &keys() const { return keys_; }

    // Unanchored search, always false for rules without a regex
    [[nodiscard]] bool match(std::string_view value) const;
    [[nodiscard]] bool has_key(std::string_view key) const;

protected:
    std::string name_;
    std::unique_ptr<re2::RE2> regex_;
    std::vector<std::string> keys_;
};

// Ordered, immutable collection of rules. The declaration order is the
// evaluation order, the first matching rule always wins. Once built, the
// catalog can be shared by concurrent sanitizers without synchronisation.
class pattern_catalog {
public:
    using const_iterator = std::vector<pattern_rule>::const_iterator;

    // Validates the rule set, throws configuration_error on duplicate or
    // invalid names, rules without regex and keys, or any rule whose regex
    // matches a placeholder the sanitizer may produce.
    explicit pattern_catalog(std::vector<pattern_rule> rules);

    pattern_catalog(const pattern_catalog &) = delete;
    pattern_catalog &operator=(const pattern_catalog &) = delete;
    pattern_catalog(pattern_catalog &&) noexcept = default;
    pattern_catalog &operator=(pattern_catalog &&) noexcept = default;
    ~pattern_catalog() = default;

    // First rule whose regex matches the value
    [[nodiscard]] const pattern_rule *match_content(std::string_view value) const;
    // First rule listing the key among its triggers
    [[nodiscard]] const pattern_rule *find_by_key(std::string_view key) const;
    [[nodiscard]] const pattern_rule *find(std::string_view name) const;

    [[nodiscard]] const_iterator begin() const { return rules_.begin(); }
    [[nodiscard]] const_iterator end() const { return rules_.end(); }
    [[nodiscard]] std::size_t size() const { return rules_.size(); }
    [[nodiscard]] bool empty() const { return rules_.empty(); }

protected:
    void validate() const;

    std::vector<pattern_rule> rules_;
};

} // namespace cfnsan
