// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>

#include "cfnsan.hpp"

const char *level_to_str(cfnsan::log_level level);

void log_cb(cfnsan::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);
