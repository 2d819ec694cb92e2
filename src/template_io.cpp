// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <string_view>
#include <system_error>

#include "exception.hpp"
#include "finding.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "node.hpp"
#include "template_io.hpp"
#include "utils.hpp"
#include "yaml_utils.hpp"

namespace fs = std::filesystem;

namespace cfnsan {

template_format format_from_path(std::string_view path)
{
    auto extension = to_lower(fs::path{path}.extension().string());
    if (extension == ".json") {
        return template_format::json;
    }

    if (extension == ".yaml" || extension == ".yml") {
        return template_format::yaml;
    }

    throw template_error("unsupported template format '" + extension +
                         "', expected .json, .yaml or .yml");
}

node parse_template(std::string_view contents, template_format format)
{
    auto tree = format == template_format::json ? json_to_node(contents) : yaml_to_node(contents);
    if (!tree.is_map()) {
        throw template_error("template root is not a mapping");
    }
    return tree;
}

std::string serialize_template(const node &tree, template_format format)
{
    if (format == template_format::json) {
        auto json = node_to_json(tree, true);
        json.append(1, '\n');
        return json;
    }
    return node_to_yaml(tree);
}

node load_template(const std::string &path)
{
    auto format = format_from_path(path);
    auto tree = parse_template(read_file(path), format);
    CFNSAN_DEBUG("Loaded template {} with {} sections", path, tree.size());
    return tree;
}

void save_template(const node &tree, const std::string &path)
{
    write_file(path, serialize_template(tree, format_from_path(path)));
}

void save_report(const finding_list &findings, const std::string &path)
{
    auto json = findings_to_json(findings);
    json.append(1, '\n');
    write_file(path, json);
}

std::string read_file(const std::string &path)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw template_error("unable to open " + path);
    }

    file.seekg(0, std::ios::end);
    const auto size = file.tellg();
    if (size < 0) {
        throw template_error("unable to read " + path);
    }

    std::string buffer;
    buffer.resize(static_cast<std::size_t>(size));
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        throw template_error("unable to read " + path);
    }
    return buffer;
}

void write_file(const std::string &path, std::string_view contents)
{
    auto parent = fs::path{path}.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw template_error("unable to create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw template_error("unable to open " + path + " for writing");
    }

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!file) {
        throw template_error("unable to write " + path);
    }
    CFNSAN_DEBUG("Wrote {} bytes to {}", contents.size(), path);
}

} // namespace cfnsan
