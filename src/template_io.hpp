// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "finding.hpp"
#include "node.hpp"

namespace cfnsan {

enum class template_format : uint8_t { json, yaml };

// Deduced from the file extension (.json, .yaml, .yml), throws template_error otherwise
template_format format_from_path(std::string_view path);

node parse_template(std::string_view contents, template_format format);
std::string serialize_template(const node &tree, template_format format);

// File variants, the output directory is created when missing. All of
// these throw template_error.
node load_template(const std::string &path);
void save_template(const node &tree, const std::string &path);
void save_report(const finding_list &findings, const std::string &path);

std::string read_file(const std::string &path);
void write_file(const std::string &path, std::string_view contents);

} // namespace cfnsan
