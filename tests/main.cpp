// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "cfnsan.hpp"
#include "common/gtest_utils.hpp"
#include "log.hpp"

using namespace std::literals;

namespace {

cfnsan::log_level str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return cfnsan::log_level::trace;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return cfnsan::log_level::debug;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return cfnsan::log_level::error;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return cfnsan::log_level::warn;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return cfnsan::log_level::info;
    }

    return cfnsan::log_level::off;
}

void log_cb(cfnsan::log_level level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    fmt::print("[{}][{}:{}:{}]: {}\n", cfnsan::log_level_to_str(level), file, function, line,
        message);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
cfnsan::log_level find_log_level(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("CFNSAN_TEST_LOG_LEVEL");
    if (env_level != nullptr) {
        return str_to_level(env_level);
    }

    cfnsan::log_level level = cfnsan::log_level::off;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log_level" || arg == "--log-level") {
            if (i + 1 < argc) {
                level = str_to_level(argv[i + 1]);
            }
            break;
        }
    }
    return level;
}

} // namespace

int main(int argc, char *argv[])
{
    cfnsan::set_log_cb(log_cb, find_log_level(argc, argv));

    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
