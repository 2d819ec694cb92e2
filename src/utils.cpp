// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "utils.hpp"

namespace cfnsan {
namespace {

template <typename T>
concept has_from_chars = requires(T v) { std::from_chars(nullptr, nullptr, std::declval<T &>()); };

// NOLINTNEXTLINE(readability-magic-numbers)
inline bool is_continuation_byte(char c) { return (static_cast<uint8_t>(c) & 0xC0) == 0x80; }

} // namespace

std::vector<std::string_view> split(std::string_view str, char sep)
{
    std::vector<std::string_view> components;

    std::size_t start = 0;
    while (start < str.size()) {
        const std::size_t end = str.find(sep, start);

        if (end == start) {
            // Ignore zero-sized strings
            start = end + 1;
            continue;
        }

        if (end == std::string_view::npos) {
            // Last element
            components.emplace_back(str.substr(start));
            start = str.size();
        } else {
            components.emplace_back(str.substr(start, end - start));
            start = end + 1;
        }
    }

    return components;
}

std::string to_lower(std::string_view str)
{
    std::string result{str};
    std::transform(
        result.begin(), result.end(), result.begin(), [](char c) { return tolower(c); });
    return result;
}

std::string to_upper(std::string_view str)
{
    std::string result{str};
    std::transform(
        result.begin(), result.end(), result.begin(), [](char c) { return toupper(c); });
    return result;
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

std::size_t utf8_length(std::string_view str)
{
    return static_cast<std::size_t>(
        std::count_if(str.begin(), str.end(), [](char c) { return !is_continuation_byte(c); }));
}

std::string utf8_truncate(std::string_view str, std::size_t max_length)
{
    std::size_t count = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (is_continuation_byte(str[i])) {
            continue;
        }

        if (count++ == max_length) {
            std::string result{str.substr(0, i)};
            result.append("...");
            return result;
        }
    }
    return std::string{str};
}

template <typename T> std::string to_string(T value) { return fmt::format("{}", value); }

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result;
    if constexpr (has_from_chars<T>) {
        const auto *end = str.data() + str.size();
        auto [endConv, err] = std::from_chars(str.data(), end, result);
        if (err == std::errc{} && endConv == end) {
            return {true, result};
        }
    } else {
        // NOLINTNEXTLINE(misc-const-correctness)
        std::istringstream iss(std::string{str});
        iss >> result;
        if (!iss.fail() && iss.eof()) {
            return {true, result};
        }
    }

    return {false, {}};
}

template std::string to_string<bool>(bool value);
template std::string to_string<int64_t>(int64_t value);
template std::string to_string<uint64_t>(uint64_t value);
template std::string to_string<double>(double value);

template std::pair<bool, int64_t> from_string<int64_t>(std::string_view str);
template std::pair<bool, uint64_t> from_string<uint64_t>(std::string_view str);
template std::pair<bool, double> from_string<double>(std::string_view str);

} // namespace cfnsan
