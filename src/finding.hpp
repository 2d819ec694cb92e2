// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <vector>

namespace cfnsan {

// A single replacement performed on the template
struct finding {
    // Dotted path with bracketed indices, e.g. Resources.Db.Properties.Passwords[0]
    std::string path;
    // Name of the matching rule or a sentinel such as parameter_defaults
    std::string pattern;
    std::string original;

    bool operator==(const finding &other) const = default;
};

using finding_list = std::vector<finding>;

} // namespace cfnsan
