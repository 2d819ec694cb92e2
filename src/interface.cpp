// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "cfnsan.hpp"
#include "log.hpp"

#ifndef CFNSAN_VERSION
#  define CFNSAN_VERSION "0.0.0"
#endif

namespace cfnsan {

const char *get_version() { return CFNSAN_VERSION; }

bool set_log_cb(log_cb_type cb, log_level min_level)
{
    if (cb == nullptr) {
        return false;
    }

    logger::init(cb, min_level);
    CFNSAN_INFO("Sending log messages to binding, min level {}", log_level_to_str(min_level));
    return true;
}

} // namespace cfnsan
