// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "configuration/catalog_parser.hpp"
#include "configuration/common/common.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "pattern_catalog.hpp"

namespace cfnsan {

namespace {

std::vector<std::string> parse_keys(const YAML::Node &rule)
{
    std::vector<std::string> keys;
    for (const auto &key : at_sequence(rule, "keys")) {
        if (!key.IsScalar()) {
            throw invalid_type("keys", "sequence of strings");
        }
        keys.emplace_back(key.Scalar());
    }
    return keys;
}

pattern_rule parse_rule(const std::string &name, const YAML::Node &rule)
{
    if (!rule.IsMap()) {
        throw parsing_error("rule '" + name + "' is not a mapping");
    }

    auto keys = parse_keys(rule);
    auto regex = at<std::string>(rule, "regex", {});
    if (regex.empty()) {
        return pattern_rule{name, std::move(keys)};
    }
    return pattern_rule{name, regex, std::move(keys)};
}

} // namespace

pattern_catalog parse_pattern_catalog(const YAML::Node &root)
{
    if (!root.IsMap()) {
        throw configuration_error("pattern catalog is not a mapping");
    }

    auto patterns = root["patterns"];
    if (!patterns.IsDefined()) {
        throw configuration_error("pattern catalog has no 'patterns' key");
    }

    if (!patterns.IsMap()) {
        throw configuration_error("'patterns' is not a mapping");
    }

    std::vector<pattern_rule> rules;
    rules.reserve(patterns.size());
    try {
        for (const auto &entry : patterns) {
            if (!entry.first.IsScalar()) {
                throw configuration_error("pattern rule name is not a string");
            }

            const auto &name = entry.first.Scalar();
            try {
                rules.emplace_back(parse_rule(name, entry.second));
                CFNSAN_DEBUG("Parsed pattern rule '{}'", name);
            } catch (const parsing_error &e) {
                CFNSAN_WARN("Failed to parse pattern rule '{}': {}", name, e.what());
                throw configuration_error("rule '" + name + "': " + e.what());
            }
        }
    } catch (const YAML::Exception &e) {
        throw configuration_error(std::string{"malformed pattern catalog: "} + e.what());
    }

    return pattern_catalog{std::move(rules)};
}

pattern_catalog parse_pattern_catalog(std::string_view document)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string{document});
    } catch (const YAML::Exception &e) {
        throw configuration_error(std::string{"malformed pattern catalog: "} + e.what());
    }
    return parse_pattern_catalog(root);
}

pattern_catalog load_pattern_catalog_file(const std::string &path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw configuration_error("unable to read pattern catalog '" + path + "'");
    } catch (const YAML::Exception &e) {
        throw configuration_error("malformed pattern catalog '" + path + "': " + e.what());
    }

    auto catalog = parse_pattern_catalog(root);
    CFNSAN_INFO("Loaded {} pattern rules from {}", catalog.size(), path);
    return catalog;
}

} // namespace cfnsan
