// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "finding.hpp"
#include "node.hpp"

namespace cfnsan {

// Throws template_error on malformed input
node json_to_node(std::string_view json);

std::string node_to_json(const node &value, bool pretty = true);

// Array of {path, pattern, original} objects
std::string findings_to_json(const finding_list &findings);

} // namespace cfnsan
