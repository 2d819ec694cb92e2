// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <string_view>

#include "log.hpp"
#include "node.hpp"
#include "pattern_catalog.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"
#include "value_classifier.hpp"

namespace cfnsan {

value_classifier::value_classifier(const pattern_catalog &catalog)
    : catalog_(catalog),
      instance_type_(
          regex_init(R"([a-z]+\d+\.(?:micro|small|medium|large|[0-9]?xl|metal))")),
      db_instance_type_(
          regex_init(R"(db\.[a-z]+\d+\.(?:micro|small|medium|large|[0-9]?xl|metal))")),
      password_shape_(
          regex_init(R"([A-Z].*[0-9].*[!@#$%^&*()]|[0-9].*[A-Z].*[!@#$%^&*()])"))
{}

bool value_classifier::is_instance_type(std::string_view value) const
{
    return regex_match(*instance_type_, value, re2::RE2::ANCHOR_START) ||
           regex_match(*db_instance_type_, value, re2::RE2::ANCHOR_START);
}

bool value_classifier::looks_like_password(std::string_view value) const
{
    return regex_match(*password_shape_, value);
}

bool value_classifier::is_sensitive(std::string_view value) const
{
    if (utf8_length(value) < min_length || is_instance_type(value)) {
        return false;
    }

    const auto *rule = catalog_.match_content(value);
    if (rule != nullptr) {
        CFNSAN_TRACE("Value classified as sensitive by rule '{}'", rule->name());
        return true;
    }

    return looks_like_password(value);
}

bool value_classifier::is_sensitive(const node &value) const
{
    const auto *str = value.as_string();
    return str != nullptr && is_sensitive(std::string_view{*str});
}

bool value_classifier::is_simple_token(std::string_view value)
{
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](char c) { return isalnum(c) || c == '-'; });
}

} // namespace cfnsan
