// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cfnsan.hpp"
#include "common/utils.hpp"
#include "configuration/catalog_parser.hpp"
#include "exception.hpp"
#include "sanitizer.hpp"
#include "template_io.hpp"

#ifndef CFNSAN_DEFAULT_PATTERNS
#  define CFNSAN_DEFAULT_PATTERNS "patterns.yaml"
#endif

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-i", "--input"},
        {"--input", "--input"}, {"-o", "--output"}, {"--output", "--output"}, {"-r", "--report"},
        {"--report", "--report"}, {"-p", "--patterns"}, {"--patterns", "--patterns"},
        {"--report-login-profile-original", "--report-login-profile-original"},
        {"-v", "--verbose"}, {"--verbose", "--verbose"}, {"-h", "--help"}, {"--help", "--help"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                std::cerr << "Unknown option: " << arg << '\n';
                continue;
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program << " --input <template> --output <path>"
              << " [--report <path>] [--patterns <catalog>]"
              << " [--report-login-profile-original] [--verbose]\n";
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    if (args.contains("--verbose")) {
        cfnsan::set_log_cb(log_cb, cfnsan::log_level::debug);
    } else {
        cfnsan::set_log_cb(log_cb, cfnsan::log_level::warn);
    }

    const std::vector<std::string> inputs = args["--input"];
    const std::vector<std::string> outputs = args["--output"];
    const std::vector<std::string> reports = args["--report"];
    const std::vector<std::string> patterns = args["--patterns"];
    if (args.contains("--help") || inputs.size() != 1 || outputs.size() != 1 ||
        reports.size() > 1 || patterns.size() > 1) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    cfnsan::sanitizer_config config;
    config.report_login_profile_original = args.contains("--report-login-profile-original");

    try {
        auto catalog = cfnsan::load_pattern_catalog_file(
            patterns.empty() ? std::string{CFNSAN_DEFAULT_PATTERNS} : patterns.front());

        auto tree = cfnsan::load_template(inputs.front());

        const cfnsan::sanitizer engine{catalog, config};
        auto [sanitized, findings] = engine.sanitize(tree);

        cfnsan::save_template(sanitized, outputs.front());
        std::cout << "Sanitized template: " << outputs.front() << '\n';

        if (!reports.empty()) {
            cfnsan::save_report(findings, reports.front());
            std::cout << "Report saved to: " << reports.front() << '\n';
        }
    } catch (const cfnsan::configuration_error &e) {
        std::cerr << "Invalid pattern catalog: " << e.what() << '\n';
        return EXIT_FAILURE;
    } catch (const cfnsan::template_error &e) {
        std::cerr << "Template error: " << e.what() << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << "Sanitization failed: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
