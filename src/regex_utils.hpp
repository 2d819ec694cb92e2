// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>

namespace cfnsan {

// Throws std::runtime_error when the pattern fails to compile
std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive = true);
std::unique_ptr<re2::RE2> regex_init_nothrow(std::string_view pattern, bool case_sensitive = true);

bool regex_match(const re2::RE2 &regex, std::string_view subject,
    re2::RE2::Anchor anchor = re2::RE2::UNANCHORED);

// Replaces every non-overlapping match in subject, returns the number of replacements
int regex_replace_all(const re2::RE2 &regex, std::string &subject, std::string_view replacement);

} // namespace cfnsan
