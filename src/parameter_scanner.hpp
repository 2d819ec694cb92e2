// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "node.hpp"
#include "value_classifier.hpp"

namespace cfnsan {

using sensitivity_set = std::unordered_set<std::string>;

// Name heuristic, independent of the parameter definition
bool is_sensitive_parameter_name(std::string_view name);

// NoEcho set to boolean true or to the string "true", in any case
bool is_no_echo(const node &definition);

// Names of the declared parameters deemed to hold secret material, the
// parameters node is the value of the template's "Parameters" section.
sensitivity_set prescan_parameters(const node &parameters, const value_classifier &classifier);

} // namespace cfnsan
