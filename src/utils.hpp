// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cfnsan {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool islower(char c) { return static_cast<unsigned>(c) - 'a' < 26; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
inline char toupper(char c) { return islower(c) ? static_cast<char>(c & ~32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

template <typename T> std::string to_string(T value);
template <typename T> std::pair<bool, T> from_string(std::string_view str);

std::vector<std::string_view> split(std::string_view str, char sep);

std::string to_lower(std::string_view str);
std::string to_upper(std::string_view str);

bool string_iequals(std::string_view left, std::string_view right);

inline bool is_blank(std::string_view str)
{
    for (auto c : str) {
        if (!isspace(c)) {
            return false;
        }
    }
    return true;
}

// Number of code points in a UTF-8 string, continuation bytes are not counted
std::size_t utf8_length(std::string_view str);

// Keep the first max_length code points, appending an ellipsis when truncated
std::string utf8_truncate(std::string_view str, std::size_t max_length);

} // namespace cfnsan
