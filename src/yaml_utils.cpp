// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "exception.hpp"
#include "log.hpp"
#include "node.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"
#include "yaml_utils.hpp"

namespace cfnsan {

namespace {

constexpr std::array<std::string_view, 9> section_order{"AWSTemplateFormatVersion",
    "Description", "Metadata", "Parameters", "Mappings", "Conditions", "Transform", "Resources",
    "Outputs"};

// Sections whose entries are separated by a blank line
constexpr std::array<std::string_view, 4> spaced_sections{
    "Parameters", "Resources", "Mappings", "Outputs"};

// Sequences up to this size and made of scalars only are written inline
constexpr std::size_t max_flow_sequence_size = 10;

struct scalar_shapes {
    std::unique_ptr<re2::RE2> integer{regex_init("[-+]?(?:0|[1-9][0-9]*)")};
    std::unique_ptr<re2::RE2> floating{
        regex_init(R"([-+]?(?:\.[0-9]+|[0-9]+(?:\.[0-9]*)?)(?:[eE][-+]?[0-9]+)?)")};
    std::unique_ptr<re2::RE2> special_float{
        regex_init(R"([-+]?\.(?:inf|Inf|INF)|\.(?:nan|NaN|NAN))")};
    std::unique_ptr<re2::RE2> numeric_like{regex_init(R"([-+]?\.?[0-9][0-9a-fA-FxXoO._:+-]*)")};
    std::unique_ptr<re2::RE2> date_like{regex_init(R"([0-9]{4}-[0-9]{1,2}-[0-9]{1,2})")};
};

const scalar_shapes &shapes()
{
    static const scalar_shapes instance;
    return instance;
}

bool full_match(const re2::RE2 &regex, std::string_view str)
{
    return re2::RE2::FullMatch(re2::StringPiece(str.data(), str.size()), regex);
}

bool is_null_word(std::string_view str)
{
    return str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL";
}

std::optional<bool> as_bool_word(std::string_view str)
{
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }
    return std::nullopt;
}

// Words a YAML 1.1 reader would turn into booleans
bool is_legacy_bool_word(std::string_view str)
{
    static constexpr std::array<std::string_view, 8> words{
        "y", "n", "yes", "no", "on", "off", "true", "false"};
    auto lowered = to_lower(str);
    return std::find(words.begin(), words.end(), lowered) != words.end();
}

/////////////////////////////////////////////////////////////////////////////
// Parsing
/////////////////////////////////////////////////////////////////////////////

// Short-form tag name, empty for untagged, quoted and core schema tags
std::string_view cfn_tag(const YAML::Node &value)
{
    const std::string &tag = value.Tag();
    if (tag.size() < 2 || tag[0] != '!' || tag[1] == '!') {
        return {};
    }
    return std::string_view{tag}.substr(1);
}

node expand_intrinsic(std::string_view name, node argument)
{
    auto result = node::make_map();

    if (name == "Ref" || name == "Condition") {
        result.emplace(std::string{name}, std::move(argument));
        return result;
    }

    std::string function{"Fn::"};
    function.append(name);

    if (name == "GetAtt") {
        if (const auto *str = argument.as_string(); str != nullptr) {
            auto dot = str->find('.');
            if (dot != std::string::npos) {
                node::array_type parts{node{str->substr(0, dot)}, node{str->substr(dot + 1)}};
                result.emplace(std::move(function), node{std::move(parts)});
                return result;
            }
        }
    }

    result.emplace(std::move(function), std::move(argument));
    return result;
}

// NOLINTNEXTLINE(misc-no-recursion)
node convert(const YAML::Node &value)
{
    node result;

    switch (value.Type()) {
    case YAML::NodeType::Sequence:
        result = node::make_array();
        for (const auto &child : value) { result.push_back(convert(child)); }
        break;
    case YAML::NodeType::Map:
        result = node::make_map();
        for (auto it = value.begin(); it != value.end(); ++it) {
            result.emplace(it->first.Scalar(), convert(it->second));
        }
        break;
    case YAML::NodeType::Scalar:
        if (value.Tag() == "?") {
            result = resolve_plain_scalar(value.Scalar());
        } else {
            result = value.Scalar();
        }
        break;
    case YAML::NodeType::Null:
        // An argument-less tag, e.g. "!GetAZs", still carries an empty string
        if (!cfn_tag(value).empty()) {
            result = std::string{};
        }
        break;
    case YAML::NodeType::Undefined:
        break;
    }

    auto tag = cfn_tag(value);
    if (!tag.empty()) {
        return expand_intrinsic(tag, std::move(result));
    }
    return result;
}

/////////////////////////////////////////////////////////////////////////////
// Emission
/////////////////////////////////////////////////////////////////////////////

std::optional<std::string> short_form_tag(const node &value)
{
    const auto *entries = value.as_map();
    if (entries == nullptr || entries->size() != 1) {
        return std::nullopt;
    }

    const auto &function = entries->front().first;
    if (function == "Ref") {
        return function;
    }

    if (function.size() > 4 && function.starts_with("Fn::")) {
        return function.substr(4);
    }
    return std::nullopt;
}

bool needs_quotes(const std::string &str)
{
    if (str.empty() || is_null_word(str) || is_legacy_bool_word(str)) {
        return true;
    }

    if (!resolve_plain_scalar(str).is_string()) {
        return true;
    }

    const auto &s = shapes();
    return full_match(*s.numeric_like, str) || full_match(*s.special_float, str) ||
           regex_match(*s.date_like, str, re2::RE2::ANCHOR_START);
}

// Literal blocks are emitted with the default "clip" chomping and without an
// indentation indicator, only strings that survive both can use them.
bool fits_literal_block(std::string_view str)
{
    return str.size() > 1 && str.back() == '\n' && str[str.size() - 2] != '\n' &&
           !isspace(str.front());
}

std::string format_double(double value)
{
    if (std::isnan(value)) {
        return ".nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-.inf" : ".inf";
    }

    auto str = to_string<double>(value);
    if (str.find_first_of(".eE") == std::string::npos) {
        str.append(".0");
    }
    return str;
}

std::string clean_description(std::string_view description)
{
    std::string result;
    result.reserve(description.size());
    for (std::size_t i = 0; i < description.size(); ++i) {
        if (description.substr(i).starts_with("\xE2\x80\x91")) {
            result.append(1, '-');
            i += 2;
        } else if (description.substr(i).starts_with("\\n")) {
            result.append(1, '\n');
            ++i;
        } else {
            result.append(1, description[i]);
        }
    }
    return result;
}

class yaml_writer {
public:
    yaml_writer()
    {
        out_.SetIndent(2);
        out_.SetBoolFormat(YAML::TrueFalseBool);
    }

    std::string write(const node &root)
    {
        if (const auto *sections = root.as_map(); sections != nullptr) {
            write_template(*sections);
        } else {
            emit(root, false);
        }

        if (!out_.good()) {
            throw template_error("failed to emit YAML: " + out_.GetLastError());
        }
        return std::string{out_.c_str()};
    }

protected:
    void write_template(const node::map_type &sections);
    void write_resources(const node &resources);
    void emit(const node &value, bool flow);
    void emit_map(const node::map_type &entries, bool flow);
    void emit_sequence(const node::array_type &items, bool flow);
    void emit_string(const std::string &str, bool flow);
    bool emit_short_form(const node &value);

    YAML::Emitter out_;
};

void yaml_writer::write_template(const node::map_type &sections)
{
    std::vector<const node::map_type::value_type *> ordered;
    ordered.reserve(sections.size());
    for (auto name : section_order) {
        for (const auto &entry : sections) {
            if (entry.first == name) {
                ordered.emplace_back(&entry);
            }
        }
    }
    for (const auto &entry : sections) {
        if (std::find(section_order.begin(), section_order.end(), entry.first) ==
            section_order.end()) {
            ordered.emplace_back(&entry);
        }
    }

    out_ << YAML::BeginMap;
    for (const auto *entry : ordered) {
        const auto &[name, value] = *entry;
        out_ << YAML::Key << name << YAML::Value;

        if (name == "Description" && value.is_string()) {
            emit_string(clean_description(*value.as_string()), false);
        } else if (name == "Resources" && value.is_map()) {
            write_resources(value);
        } else {
            emit(value, false);
        }
    }
    out_ << YAML::EndMap;
}

// Each resource starts with its Type and Properties
void yaml_writer::write_resources(const node &resources)
{
    out_ << YAML::BeginMap;
    for (const auto &[logical_id, resource] : *resources.as_map()) {
        out_ << YAML::Key << logical_id << YAML::Value;

        const auto *attributes = resource.as_map();
        if (attributes == nullptr || attributes->empty()) {
            emit(resource, false);
            continue;
        }

        out_ << YAML::BeginMap;
        for (std::string_view first : {"Type", "Properties"}) {
            if (const auto *value = resource.find(first); value != nullptr) {
                out_ << YAML::Key << std::string{first} << YAML::Value;
                emit(*value, false);
            }
        }
        for (const auto &[key, value] : *attributes) {
            if (key != "Type" && key != "Properties") {
                out_ << YAML::Key << key << YAML::Value;
                emit(value, false);
            }
        }
        out_ << YAML::EndMap;
    }
    out_ << YAML::EndMap;
}

// NOLINTNEXTLINE(misc-no-recursion)
void yaml_writer::emit(const node &value, bool flow)
{
    switch (value.type()) {
    case node_type::null:
        out_ << YAML::Null;
        break;
    case node_type::boolean:
        out_ << *value.as_bool();
        break;
    case node_type::int64:
        out_ << static_cast<long long>(*value.as_int64());
        break;
    case node_type::uint64:
        out_ << static_cast<unsigned long long>(*value.as_uint64());
        break;
    case node_type::float64:
        out_ << format_double(*value.as_float64());
        break;
    case node_type::string:
        emit_string(*value.as_string(), flow);
        break;
    case node_type::array:
        emit_sequence(*value.as_array(), flow);
        break;
    case node_type::map:
        if (!emit_short_form(value)) {
            emit_map(*value.as_map(), flow);
        }
        break;
    }
}

// NOLINTNEXTLINE(misc-no-recursion)
void yaml_writer::emit_map(const node::map_type &entries, bool flow)
{
    if (flow || entries.empty()) {
        out_ << YAML::Flow;
    }

    out_ << YAML::BeginMap;
    for (const auto &[key, value] : entries) {
        out_ << YAML::Key << key << YAML::Value;
        emit(value, flow);
    }
    out_ << YAML::EndMap;
}

// NOLINTNEXTLINE(misc-no-recursion)
void yaml_writer::emit_sequence(const node::array_type &items, bool flow)
{
    const bool inline_scalars =
        items.size() <= max_flow_sequence_size &&
        std::all_of(items.begin(), items.end(), [](const node &item) {
            return item.is_scalar() && !(item.is_string() && item.as_string()->find('\n') !=
                                                                 std::string::npos);
        });

    if (flow || inline_scalars) {
        out_ << YAML::Flow;
    }

    out_ << YAML::BeginSeq;
    for (const auto &item : items) { emit(item, flow || inline_scalars); }
    out_ << YAML::EndSeq;
}

void yaml_writer::emit_string(const std::string &str, bool flow)
{
    if (str.find('\n') != std::string::npos) {
        out_ << (!flow && fits_literal_block(str) ? YAML::Literal : YAML::DoubleQuoted);
    } else if (needs_quotes(str)) {
        out_ << YAML::DoubleQuoted;
    }
    out_ << str;
}

// Writes !Ref, !GetAtt and the other intrinsic functions in short form, the
// long form is kept when the argument is itself a short-form candidate as
// short forms cannot be directly nested.
// NOLINTNEXTLINE(misc-no-recursion)
bool yaml_writer::emit_short_form(const node &value)
{
    auto tag = short_form_tag(value);
    if (!tag.has_value()) {
        return false;
    }

    const auto &argument = value.as_map()->front().second;
    if (short_form_tag(argument).has_value()) {
        return false;
    }

    out_ << YAML::LocalTag(*tag);

    if (*tag == "GetAtt") {
        const auto *parts = argument.as_array();
        if (parts != nullptr && !parts->empty() &&
            std::all_of(parts->begin(), parts->end(),
                [](const node &part) { return part.is_string(); })) {
            std::string joined;
            for (const auto &part : *parts) {
                if (!joined.empty()) {
                    joined.append(1, '.');
                }
                joined.append(*part.as_string());
            }
            out_ << joined;
            return true;
        }
    }

    emit(argument, argument.is_container());
    return true;
}

bool is_top_level_key(std::string_view line)
{
    return !line.empty() && !isspace(line[0]) && line[0] != '-' && line[0] != '#';
}

bool is_second_level_key(std::string_view line)
{
    return line.size() > 2 && line.starts_with("  ") && !isspace(line[2]) && line[2] != '-' &&
           line[2] != '#';
}

// Blank lines between top-level sections and between the entries of the
// sections listing parameters, resources, mappings and outputs.
std::string space_out_sections(const std::string &yaml)
{
    std::istringstream input{yaml};
    std::string output;
    output.reserve(yaml.size() + yaml.size() / 16);

    std::string line;
    std::string section;
    bool first_section = true;
    bool first_entry = true;
    while (std::getline(input, line)) {
        if (is_top_level_key(line)) {
            if (!first_section) {
                output.append(1, '\n');
            }
            first_section = false;
            first_entry = true;
            section = line.substr(0, line.find(':'));
        } else if (is_second_level_key(line) &&
                   std::find(spaced_sections.begin(), spaced_sections.end(), section) !=
                       spaced_sections.end()) {
            if (!first_entry) {
                output.append(1, '\n');
            }
            first_entry = false;
        }

        output.append(line).append(1, '\n');
    }
    return output;
}

} // namespace

node resolve_plain_scalar(const std::string &scalar)
{
    if (is_null_word(scalar)) {
        return {};
    }

    if (auto flag = as_bool_word(scalar); flag.has_value()) {
        return *flag;
    }

    const auto &s = shapes();
    if (full_match(*s.integer, scalar)) {
        std::string_view digits{scalar};
        if (digits.front() == '+') {
            digits.remove_prefix(1);
        }

        if (auto [res, value] = from_string<int64_t>(digits); res) {
            return value;
        }

        if (auto [res, value] = from_string<uint64_t>(digits); res) {
            return value;
        }
        return scalar;
    }

    if (full_match(*s.floating, scalar)) {
        std::string_view digits{scalar};
        if (digits.front() == '+') {
            digits.remove_prefix(1);
        }

        if (auto [res, value] = from_string<double>(digits); res) {
            return value;
        }
        return scalar;
    }

    if (full_match(*s.special_float, scalar)) {
        if (scalar.find_first_of("nN") != std::string::npos &&
            scalar.find_first_of("iI") == std::string::npos) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return scalar.front() == '-' ? -std::numeric_limits<double>::infinity()
                                     : std::numeric_limits<double>::infinity();
    }

    return scalar;
}

node yaml_to_node(std::string_view yaml)
{
    try {
        auto root = YAML::Load(std::string{yaml});
        return convert(root);
    } catch (const YAML::Exception &e) {
        throw template_error(std::string{"malformed YAML: "} + e.what());
    }
}

std::string node_to_yaml(const node &value)
{
    yaml_writer writer;
    auto yaml = writer.write(value);
    if (!value.is_map()) {
        return yaml + '\n';
    }
    return space_out_sections(yaml);
}

} // namespace cfnsan
