// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>

#include "finding.hpp"
#include "node.hpp"
#include "pattern_catalog.hpp"
#include "value_classifier.hpp"

namespace cfnsan {

struct sanitizer_config {
    // Report the password found under a LoginProfile rather than the
    // placeholder which replaced it.
    bool report_login_profile_original{false};
    // Length, in code points, of the string form of nested constructs
    // recorded as the original value of a finding.
    std::size_t max_original_length{100};
};

struct sanitize_result {
    node tree;
    finding_list findings;
};

// Detects and redacts secret material in a template tree. The input tree is
// never modified, each call works on its own copy and its own findings, so a
// single sanitizer can serve concurrent callers.
class sanitizer {
public:
    explicit sanitizer(const pattern_catalog &catalog, sanitizer_config config = {});

    sanitizer(const sanitizer &) = delete;
    sanitizer &operator=(const sanitizer &) = delete;
    sanitizer(sanitizer &&) noexcept = default;
    sanitizer &operator=(sanitizer &&) noexcept = delete;
    ~sanitizer() = default;

    [[nodiscard]] sanitize_result sanitize(const node &tree) const;

    [[nodiscard]] const value_classifier &classifier() const { return classifier_; }
    [[nodiscard]] const sanitizer_config &config() const { return config_; }

protected:
    const pattern_catalog &catalog_;
    value_classifier classifier_;
    sanitizer_config config_;
};

} // namespace cfnsan
