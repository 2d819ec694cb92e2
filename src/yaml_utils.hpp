// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "node.hpp"

namespace cfnsan {

// Parses a YAML template, CloudFormation short-form tags such as !Ref or
// !GetAtt are expanded into their long-form mappings. Plain scalars are
// resolved using the YAML 1.2 core schema. Throws template_error.
node yaml_to_node(std::string_view yaml);

// Emits a template as YAML, intrinsic functions are written back in short
// form where possible and top-level sections in their conventional order.
std::string node_to_yaml(const node &value);

// Type a plain (unquoted, untagged) YAML scalar resolves to
node resolve_plain_scalar(const std::string &scalar);

} // namespace cfnsan
