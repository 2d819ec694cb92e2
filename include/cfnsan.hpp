// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef CFNSAN_HPP
#define CFNSAN_HPP

#include <cstdint>

namespace cfnsan {

/**
 * @enum log_level
 *
 * Logging levels, in increasing order of severity.
 **/
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

/**
 * @typedef log_cb_type
 *
 * Callback invoked for every log message at or above the configured level.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The formatted message. (nonnull)
 * @param message_len The length of the formatted message.
 **/
using log_cb_type = void (*)(log_level level, const char *function, const char *file,
    unsigned line, const char *message, uint64_t message_len);

/**
 * set_log_cb
 *
 * Sets the callback to relay logging messages to the host application.
 *
 * @param cb The callback to call. (nonnull)
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool set_log_cb(log_cb_type cb, log_level min_level);

/**
 * get_version
 *
 * Get the version of the library as a string, e.g. "0.1.0".
 *
 * @return NULL-terminated version string
 **/
const char *get_version();

} // namespace cfnsan

#endif /* CFNSAN_HPP */
