// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "cfnsan.hpp"

namespace cfnsan {

constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
        if (*path++ == '/') {
            base = path;
        }
    }
    return base;
}

// Where a message was emitted
struct log_source {
    const char *function;
    const char *file;
    unsigned line;
};

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        break;
    }
    return "off";
}

class logger {
public:
    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb_ != nullptr && level >= min_level_; }
    static log_cb_type callback() { return cb_; }
    static log_level min_level() { return min_level_; }

    // Format strings are checked at compile time, formatting can't fail here
    template <typename... Args>
    static void log(log_level level, const log_source &source,
        fmt::format_string<Args...> format, Args &&...args)
    {
        auto message = fmt::format(format, std::forward<Args>(args)...);
        relay(level, source, message);
    }

private:
    static void relay(log_level level, const log_source &source, const std::string &message);

    static log_cb_type cb_;
    static log_level min_level_;
};

} // namespace cfnsan

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CFNSAN_LOG(level, fmt_str, ...)                                                            \
    do {                                                                                           \
        if (cfnsan::logger::valid(level)) {                                                        \
            cfnsan::logger::log(level,                                                             \
                cfnsan::log_source{__func__, cfnsan::base_name(__FILE__), __LINE__}, fmt_str,      \
                ##__VA_ARGS__);                                                                    \
        }                                                                                          \
    } while (0)

#define CFNSAN_TRACE(fmt, ...) CFNSAN_LOG(cfnsan::log_level::trace, fmt, ##__VA_ARGS__)
#define CFNSAN_DEBUG(fmt, ...) CFNSAN_LOG(cfnsan::log_level::debug, fmt, ##__VA_ARGS__)
#define CFNSAN_INFO(fmt, ...) CFNSAN_LOG(cfnsan::log_level::info, fmt, ##__VA_ARGS__)
#define CFNSAN_WARN(fmt, ...) CFNSAN_LOG(cfnsan::log_level::warn, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
