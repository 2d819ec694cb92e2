// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

#include "pattern_catalog.hpp"

namespace cfnsan {

// All functions throw configuration_error on any malformed input
pattern_catalog parse_pattern_catalog(const YAML::Node &root);
pattern_catalog parse_pattern_catalog(std::string_view document);
pattern_catalog load_pattern_catalog_file(const std::string &path);

} // namespace cfnsan
