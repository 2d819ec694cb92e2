// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <iostream>

#include "cfnsan.hpp"
#include "common/utils.hpp"

const char *level_to_str(cfnsan::log_level level)
{
    switch (level) {
    case cfnsan::log_level::trace:
        return "trace";
    case cfnsan::log_level::debug:
        return "debug";
    case cfnsan::log_level::error:
        return "error";
    case cfnsan::log_level::warn:
        return "warn";
    case cfnsan::log_level::info:
        return "info";
    case cfnsan::log_level::off:
        break;
    }

    return "off";
}

// Logs go to stderr, stdout is kept for the tool's own output
void log_cb(cfnsan::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}
