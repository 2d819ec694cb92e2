// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <rapidjson/encodings.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "node.hpp"

namespace cfnsan {

namespace {

struct string_view_stream {
    using Ch = std::string_view::value_type;

    explicit string_view_stream(std::string_view str) : src(str) {}

    [[nodiscard]] char Peek() const
    {
        if (idx < src.size()) [[likely]] {
            return src[idx];
        }
        return '\0';
    }
    char Take()
    {
        if (idx < src.size()) [[likely]] {
            return src[idx++];
        }
        return '\0';
    }
    [[nodiscard]] size_t Tell() const { return idx; }

    static char *PutBegin()
    {
        assert(false);
        return nullptr;
    }
    static void Put(Ch /*unused*/) { assert(false); }
    static void Flush() { assert(false); }
    static size_t PutEnd(Ch * /*unused*/)
    {
        assert(false);
        return 0;
    }

    std::string_view src;
    std::size_t idx{0};
};

class node_reader_handler
    : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, node_reader_handler> {
public:
    node_reader_handler() { stack_.reserve(max_depth + 1); }
    ~node_reader_handler() = default;
    node_reader_handler(node_reader_handler &&) = delete;
    node_reader_handler(const node_reader_handler &) = delete;
    node_reader_handler &operator=(node_reader_handler &&) = delete;
    node_reader_handler &operator=(const node_reader_handler &) = delete;

    bool Null() { return emplace(node{}); }
    bool Bool(bool b) { return emplace(node{b}); }
    bool Int(int i) { return emplace(node{static_cast<int64_t>(i)}); }
    bool Uint(unsigned u) { return emplace(node{static_cast<int64_t>(u)}); }
    bool Int64(int64_t i) { return emplace(node{i}); }
    bool Uint64(uint64_t u)
    {
        if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return emplace(node{static_cast<int64_t>(u)});
        }
        return emplace(node{u});
    }
    bool Double(double d) { return emplace(node{d}); }

    bool String(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        return emplace(node{std::string_view{str, length}});
    }

    bool Key(const char *str, rapidjson::SizeType length, bool /*copy*/)
    {
        key_.assign(str, length);
        return true;
    }

    bool StartObject() { return emplace(node::make_map()); }

    bool EndObject(rapidjson::SizeType /*memberCount*/)
    {
        assert(!stack_.empty());
        stack_.pop_back();
        return true;
    }

    bool StartArray() { return emplace(node::make_array()); }

    bool EndArray(rapidjson::SizeType /*elementCount*/)
    {
        assert(!stack_.empty());
        stack_.pop_back();
        return true;
    }

    node finalize()
    {
        stack_.clear();
        return std::move(root_);
    }

    [[nodiscard]] bool depth_exceeded() const { return depth_exceeded_; }

private:
    // Only the innermost open container is ever appended to, so the pointers
    // held by the stack remain valid until their container is closed.
    bool emplace(node &&value)
    {
        node *child = nullptr;
        if (stack_.empty()) {
            root_ = std::move(value);
            child = &root_;
        } else {
            auto &container = *stack_.back();
            child = container.is_map() ? &container.emplace(std::move(key_), std::move(value))
                                       : &container.push_back(std::move(value));
        }

        if (child->is_container()) {
            if (stack_.size() >= max_depth) {
                depth_exceeded_ = true;
                return false;
            }
            stack_.push_back(child);
        }
        return true;
    }

    node root_;
    std::vector<node *> stack_;
    std::string key_;
    bool depth_exceeded_{false};

    static constexpr std::size_t max_depth = 256;
};

template <typename Writer>
// NOLINTNEXTLINE(misc-no-recursion)
void write_node(Writer &writer, const node &value)
{
    switch (value.type()) {
    case node_type::null:
        writer.Null();
        break;
    case node_type::boolean:
        writer.Bool(*value.as_bool());
        break;
    case node_type::int64:
        writer.Int64(*value.as_int64());
        break;
    case node_type::uint64:
        writer.Uint64(*value.as_uint64());
        break;
    case node_type::float64:
        writer.Double(*value.as_float64());
        break;
    case node_type::string: {
        const auto &str = *value.as_string();
        writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
        break;
    }
    case node_type::array:
        writer.StartArray();
        for (const auto &child : *value.as_array()) { write_node(writer, child); }
        writer.EndArray();
        break;
    case node_type::map:
        writer.StartObject();
        for (const auto &[key, child] : *value.as_map()) {
            writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
            write_node(writer, child);
        }
        writer.EndObject();
        break;
    }
}

using compact_writer = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>,
    rapidjson::UTF8<>, rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;
using pretty_writer = rapidjson::PrettyWriter<rapidjson::StringBuffer, rapidjson::UTF8<>,
    rapidjson::UTF8<>, rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

} // namespace

node json_to_node(std::string_view json)
{
    node_reader_handler handler;
    string_view_stream ss(json);

    rapidjson::Reader reader;
    const rapidjson::ParseResult res = reader.Parse(ss, handler);
    if (handler.depth_exceeded()) {
        throw template_error("invalid json document: maximum nesting depth exceeded");
    }

    if (res.IsError()) {
        throw template_error(std::string("invalid json document: ") +
                             rapidjson::GetParseError_En(res.Code()) + " (offset " +
                             std::to_string(res.Offset()) + ")");
    }

    return handler.finalize();
}

std::string node_to_json(const node &value, bool pretty)
{
    rapidjson::StringBuffer buffer;
    if (pretty) {
        pretty_writer writer(buffer);
        writer.SetIndent(' ', 2);
        write_node(writer, value);
    } else {
        compact_writer writer(buffer);
        write_node(writer, value);
    }
    return {buffer.GetString(), buffer.GetSize()};
}

std::string findings_to_json(const finding_list &findings)
{
    rapidjson::StringBuffer buffer;
    pretty_writer writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartArray();
    for (const auto &entry : findings) {
        writer.StartObject();
        writer.Key("path");
        writer.String(entry.path.data(), static_cast<rapidjson::SizeType>(entry.path.size()));
        writer.Key("pattern");
        writer.String(
            entry.pattern.data(), static_cast<rapidjson::SizeType>(entry.pattern.size()));
        writer.Key("original");
        writer.String(
            entry.original.data(), static_cast<rapidjson::SizeType>(entry.original.size()));
        writer.EndObject();
    }
    writer.EndArray();

    CFNSAN_DEBUG("Serialised {} findings", findings.size());
    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace cfnsan
