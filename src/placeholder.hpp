// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cfnsan {

// Pattern names reported when no catalog rule provides one
inline constexpr std::string_view generic_secret_pattern{"generic_secret"};
inline constexpr std::string_view parameter_defaults_pattern{"parameter_defaults"};

// Rule name that enables in-prose credential substitution
inline constexpr std::string_view general_credentials_pattern{"general_credentials"};

inline constexpr std::string_view parameter_placeholder{"SANITIZED-PARAMETER-VALUE"};
inline constexpr std::string_view credential_marker{"SANITIZED-CREDENTIAL"};

// {{resolve:secretsmanager:<rule>:SecretString:<key>}}
std::string secret_placeholder(std::string_view rule, std::string_view key);

// SANITIZED-<RULE>-VALUE
std::string value_placeholder(std::string_view rule);

// SANITIZED-<RULE>-VALUE-<index>
std::string value_placeholder(std::string_view rule, std::size_t index);

// Whether the value is a dynamic reference or a value placeholder, such
// values are never redacted again.
bool is_placeholder(std::string_view value);

} // namespace cfnsan
