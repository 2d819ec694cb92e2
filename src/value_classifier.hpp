// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string_view>

#include "node.hpp"
#include "pattern_catalog.hpp"

namespace cfnsan {

// Decides whether a standalone string looks like secret material. The
// classifier is stateless beyond its compiled shapes, and can be shared.
class value_classifier {
public:
    static constexpr std::size_t min_length = 8;

    explicit value_classifier(const pattern_catalog &catalog);

    value_classifier(const value_classifier &) = delete;
    value_classifier &operator=(const value_classifier &) = delete;
    value_classifier(value_classifier &&) noexcept = default;
    value_classifier &operator=(value_classifier &&) noexcept = delete;
    ~value_classifier() = default;

    [[nodiscard]] bool is_sensitive(std::string_view value) const;
    // Non-string nodes are never sensitive
    [[nodiscard]] bool is_sensitive(const node &value) const;

    // Instance class names such as t3.micro or db.r5.2xlarge
    [[nodiscard]] bool is_instance_type(std::string_view value) const;
    [[nodiscard]] bool looks_like_password(std::string_view value) const;

    // Alphanumerics and dashes only, e.g. tag values such as "prod-eu"
    [[nodiscard]] static bool is_simple_token(std::string_view value);

protected:
    const pattern_catalog &catalog_;
    std::unique_ptr<re2::RE2> instance_type_;
    std::unique_ptr<re2::RE2> db_instance_type_;
    std::unique_ptr<re2::RE2> password_shape_;
};

} // namespace cfnsan
