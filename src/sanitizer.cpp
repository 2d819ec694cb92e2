// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "finding.hpp"
#include "log.hpp"
#include "node.hpp"
#include "parameter_scanner.hpp"
#include "pattern_catalog.hpp"
#include "placeholder.hpp"
#include "regex_utils.hpp"
#include "sanitizer.hpp"
#include "utils.hpp"
#include "value_classifier.hpp"

namespace cfnsan {

namespace {

constexpr std::string_view parameters_section{"Parameters"};
constexpr std::string_view resources_section{"Resources"};

constexpr std::string_view base64_function{"Fn::Base64"};
constexpr std::string_view sub_function{"Fn::Sub"};

// Only these keys have their content scanned by the catalog regexes
bool is_content_scanned_key(std::string_view key)
{
    return key == "Description" || key == "Name" || key == "Value";
}

bool is_prose_key(std::string_view key) { return key == "Description" || key == "Name"; }

// Keys holding a list of secrets, each element is redacted on its own
bool is_secret_list_key(std::string_view key) { return key == "Passwords"; }

node make_intrinsic(std::string_view function, std::string value)
{
    auto result = node::make_map();
    result.emplace(std::string{function}, node{std::move(value)});
    return result;
}

std::string child_path(const std::string &path, std::string_view key)
{
    if (path.empty()) {
        return std::string{key};
    }

    std::string result;
    result.reserve(path.size() + key.size() + 1);
    result.append(path).append(1, '.').append(key);
    return result;
}

std::string index_path(const std::string &path, std::size_t index)
{
    return path + '[' + to_string<uint64_t>(index) + ']';
}

class rewriter {
public:
    rewriter(const pattern_catalog &catalog, const value_classifier &classifier,
        const sanitizer_config &config, const sensitivity_set &sensitive,
        const std::unordered_set<std::string> &parameter_names)
        : catalog_(catalog), classifier_(classifier), config_(config), sensitive_(sensitive),
          parameter_names_(parameter_names)
    {}

    // Depth-first, pre-order walk. The section is inferred from the first
    // path segment once and inherited by the whole subtree.
    void visit(node &current, const std::string &path, const std::string &parent,
        const std::string &section);

    finding_list &&get_findings() { return std::move(findings_); }

protected:
    bool sanitize_default(const std::string &parameter, node &value, const std::string &path);
    bool sanitize_property(std::string_view key, node &value, const std::string &path);
    bool sanitize_string(std::string_view key, node &value, const std::string &path);
    bool sanitize_nested_construct(std::string_view key, node &value, const std::string &path);
    bool sanitize_string_list(std::string_view key, node &value, const std::string &path);
    void sanitize_login_profile(node &value, const std::string &path);

    void report(std::string path, std::string_view pattern, std::string original)
    {
        CFNSAN_DEBUG("Redacted '{}' using pattern '{}'", path, pattern);
        findings_.push_back({std::move(path), std::string{pattern}, std::move(original)});
    }

    [[nodiscard]] bool is_simple_and_harmless(std::string_view value) const
    {
        return value_classifier::is_simple_token(value) && !classifier_.is_sensitive(value);
    }

    const pattern_catalog &catalog_;
    const value_classifier &classifier_;
    const sanitizer_config &config_;
    const sensitivity_set &sensitive_;
    const std::unordered_set<std::string> &parameter_names_;
    finding_list findings_;
};

void rewriter::visit(
    node &current, const std::string &path, const std::string &parent, const std::string &section)
{
    std::string current_section = section;
    if (current_section.empty() && !path.empty()) {
        current_section = path.substr(0, path.find('.'));
    }

    if (auto *entries = current.as_map(); entries != nullptr) {
        for (auto &[key, value] : *entries) {
            auto loc = child_path(path, key);

            if (current_section == parameters_section) {
                if (key == "Default" && parameter_names_.contains(parent)) {
                    sanitize_default(parent, value, loc);
                }
            } else if (current_section == resources_section) {
                if (sanitize_property(key, value, loc)) {
                    // The replacement is final
                    continue;
                }
            }

            if (key == "LoginProfile") {
                sanitize_login_profile(value, loc);
            }

            if (value.is_map()) {
                visit(value, loc, key, current_section);
            } else if (auto *items = value.as_array(); items != nullptr) {
                for (std::size_t i = 0; i < items->size(); ++i) {
                    auto &item = (*items)[i];
                    if (item.is_container()) {
                        visit(item, index_path(loc, i), key, current_section);
                    }
                }
            }
        }
    } else if (auto *items = current.as_array(); items != nullptr) {
        for (std::size_t i = 0; i < items->size(); ++i) {
            auto &item = (*items)[i];
            if (item.is_container()) {
                visit(item, index_path(path, i), parent, current_section);
            }
        }
    }
}

bool rewriter::sanitize_default(const std::string &parameter, node &value, const std::string &path)
{
    const auto *str = value.as_string();
    if (str == nullptr || is_blank(*str) || is_placeholder(*str)) {
        return false;
    }

    const bool sensitive_parameter = sensitive_.contains(parameter);
    if (!sensitive_parameter && !classifier_.is_sensitive(std::string_view{*str})) {
        return false;
    }

    const auto *rule = catalog_.match_content(*str);
    if (rule != nullptr) {
        report(path, rule->name(), *str);
        value = value_placeholder(rule->name());
        return true;
    }

    if (sensitive_parameter) {
        report(path, parameter_defaults_pattern, *str);
        value = std::string{parameter_placeholder};
        return true;
    }

    return false;
}

bool rewriter::sanitize_property(std::string_view key, node &value, const std::string &path)
{
    switch (value.type()) {
    case node_type::string:
        return sanitize_string(key, value, path);
    case node_type::map:
        return sanitize_nested_construct(key, value, path);
    case node_type::array:
        return sanitize_string_list(key, value, path);
    case node_type::null:
    case node_type::boolean:
    case node_type::int64:
    case node_type::uint64:
    case node_type::float64:
    default:
        break;
    }
    return false;
}

bool rewriter::sanitize_string(std::string_view key, node &value, const std::string &path)
{
    std::string original = *value.as_string();
    if (is_placeholder(original)) {
        return false;
    }

    // Plain identifiers used as tag values
    if (key == "Value" && path.find("Tags") != std::string::npos &&
        is_simple_and_harmless(original)) {
        return false;
    }

    for (const auto &rule : catalog_) {
        if (rule.has_key(key)) {
            if (key == "Value" && is_simple_and_harmless(original)) {
                return false;
            }

            value = secret_placeholder(rule.name(), key);
            report(path, rule.name(), std::move(original));
            return true;
        }

        if (is_content_scanned_key(key) && rule.match(original)) {
            value = secret_placeholder(rule.name(), key);
            report(path, rule.name(), std::move(original));
            return true;
        }

        // Only the credential span is replaced, the surrounding prose is kept
        if (rule.name() == general_credentials_pattern && is_prose_key(key) && rule.has_regex()) {
            std::string sanitized = original;
            if (regex_replace_all(*rule.regex(), sanitized, credential_marker) > 0) {
                value = std::move(sanitized);
                report(path, rule.name(), std::move(original));
                return true;
            }
        }
    }

    return false;
}

bool rewriter::sanitize_nested_construct(
    std::string_view key, node &value, const std::string &path)
{
    if (key != "UserData") {
        return false;
    }

    if (const auto *encoded = value.find(base64_function); encoded != nullptr) {
        if (const auto *content = encoded->as_string(); content != nullptr) {
            if (is_placeholder(*content)) {
                return false;
            }

            const auto *rule = catalog_.find_by_key(key);
            if (rule == nullptr) {
                return false;
            }

            report(path, rule->name(), *content);
            value = make_intrinsic(base64_function, secret_placeholder(rule->name(), key));
            return true;
        }

        if (encoded->is_map() && encoded->contains(sub_function)) {
            report(path, generic_secret_pattern,
                utf8_truncate(to_string(*encoded), config_.max_original_length));
            value = make_intrinsic(base64_function, secret_placeholder(generic_secret_pattern, key));
            return true;
        }

        return false;
    }

    if (const auto *content = value.find(sub_function); content != nullptr) {
        if (const auto *str = content->as_string(); str != nullptr && is_placeholder(*str)) {
            return false;
        }

        report(path, generic_secret_pattern,
            utf8_truncate(to_string(*content), config_.max_original_length));
        value = make_intrinsic(sub_function, secret_placeholder(generic_secret_pattern, key));
        return true;
    }

    return false;
}

bool rewriter::sanitize_string_list(std::string_view key, node &value, const std::string &path)
{
    if (!is_secret_list_key(key)) {
        return false;
    }

    auto &items = *value.as_array();
    if (!std::all_of(items.begin(), items.end(), [](const node &item) { return item.is_string(); })) {
        return false;
    }

    bool changed = false;
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::string original = *items[i].as_string();
        if (is_placeholder(original)) {
            continue;
        }

        const auto *rule = catalog_.match_content(original);
        std::string_view pattern = rule != nullptr ? rule->name() : generic_secret_pattern;

        items[i] = value_placeholder(pattern, i);
        report(index_path(path, i), pattern, std::move(original));
        changed = true;
    }

    return changed;
}

void rewriter::sanitize_login_profile(node &value, const std::string &path)
{
    auto *password = value.find("Password");
    if (password == nullptr || !password->is_string() || is_placeholder(*password->as_string())) {
        return;
    }

    const auto *rule = catalog_.find_by_key("Password");
    if (rule == nullptr) {
        return;
    }

    auto placeholder = secret_placeholder(rule->name(), "Password");
    // By default the finding records the placeholder rather than the password
    std::string original =
        config_.report_login_profile_original ? *password->as_string() : placeholder;

    *password = placeholder;
    report(child_path(path, "Password"), rule->name(), std::move(original));
}

} // namespace

sanitizer::sanitizer(const pattern_catalog &catalog, sanitizer_config config)
    : catalog_(catalog), classifier_(catalog), config_(config)
{}

sanitize_result sanitizer::sanitize(const node &tree) const
{
    sanitize_result result{tree, {}};

    sensitivity_set sensitive;
    std::unordered_set<std::string> parameter_names;
    if (const auto *parameters = tree.find(parameters_section); parameters != nullptr) {
        sensitive = prescan_parameters(*parameters, classifier_);
        if (const auto *declarations = parameters->as_map(); declarations != nullptr) {
            for (const auto &entry : *declarations) { parameter_names.emplace(entry.first); }
        }
    }
    CFNSAN_DEBUG("{} of {} parameters are sensitive", sensitive.size(), parameter_names.size());

    rewriter walker{catalog_, classifier_, config_, sensitive, parameter_names};
    walker.visit(result.tree, {}, {}, {});
    result.findings = walker.get_findings();

    CFNSAN_INFO("Sanitization produced {} findings", result.findings.size());
    return result;
}

} // namespace cfnsan
