// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>

#include "log.hpp"

namespace cfnsan {

log_cb_type logger::cb_ = nullptr;
log_level logger::min_level_ = log_level::off;

void logger::init(log_cb_type cb, log_level min_level)
{
    cb_ = cb;
    min_level_ = min_level;
}

void logger::relay(log_level level, const log_source &source, const std::string &message)
{
    cb_(level, source.function, source.file, source.line, message.c_str(), message.size());
}

} // namespace cfnsan
