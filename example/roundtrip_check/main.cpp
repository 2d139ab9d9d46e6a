// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Round-trip check of one OOXML part against its converted copy
///
/// Usage:
///   roundtrip_check <original.xml> <converted.xml> [options]
///
/// Options:
///   --type word|powerpoint|excel    document type (default: word)
///   --platform <name>               platform that produced the copy (default: microsoft_office)
///   --profile <name>                tolerance profile (default: normal)
///   --fail-threshold <0-100>        minimum overall survival rate (default: 70)
///   --critical-threshold <0-100>    minimum critical carrier success (default: 90)
///   --exit-on-failure               exit with 1 when the check fails
///   --json                          print the full result record after the banner
///
/// Exit codes: 0 normal run, 1 failed check with --exit-on-failure,
/// 2 missing input file, 3 bad arguments or configuration.

#include <ooxml_fidelity/errors.h>
#include <ooxml_fidelity/records.h>
#include <ooxml_fidelity/serialization.h>
#include <ooxml_fidelity/verdict.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace ooxml_fidelity;

namespace {

constexpr int kExitUsage = 3;

struct Options {
    std::string original_path;
    std::string converted_path;
    DocumentType document_type = DocumentType::Word;
    PlatformType platform = PlatformType::MicrosoftOffice;
    std::string profile = "normal";
    RoundTripThresholds thresholds;
    bool exit_on_failure = false;
    bool json = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <original.xml> <converted.xml> [--type word|powerpoint|excel]\n"
              << "       [--platform name] [--profile name] [--fail-threshold N] [--critical-threshold N]\n"
              << "       [--exit-on-failure] [--json]\n";
}

std::optional<double> parse_percentage(const std::string& text) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

/// Returns an error message, or nothing when the arguments are usable
std::optional<std::string> parse_options(int argc, char* argv[], Options& options) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--exit-on-failure") {
            options.exit_on_failure = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--type") {
            auto value = next();
            auto type = value ? parse_document_type(*value) : std::nullopt;
            if (!type) return "--type expects word, powerpoint or excel";
            options.document_type = *type;
        } else if (arg == "--platform") {
            auto value = next();
            auto platform = value ? parse_platform_type(*value) : std::nullopt;
            if (!platform) return "--platform expects a platform name such as libreoffice";
            options.platform = *platform;
        } else if (arg == "--profile") {
            auto value = next();
            if (!value) return "--profile expects a profile name";
            options.profile = *value;
        } else if (arg == "--fail-threshold" || arg == "--critical-threshold") {
            auto value = next();
            auto number = value ? parse_percentage(*value) : std::nullopt;
            if (!number) return std::string(arg) + " expects a number";
            if (arg == "--fail-threshold") {
                options.thresholds.fail_threshold = *number;
            } else {
                options.thresholds.critical_threshold = *number;
            }
        } else if (!arg.empty() && arg.front() == '-') {
            return "unknown option " + std::string(arg);
        } else if (positional == 0) {
            options.original_path = arg;
            ++positional;
        } else if (positional == 1) {
            options.converted_path = arg;
            ++positional;
        } else {
            return "unexpected argument " + std::string(arg);
        }
    }
    if (positional != 2) {
        return "expected an original and a converted file";
    }
    return std::nullopt;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (auto error = parse_options(argc, argv, options)) {
        std::cerr << "Error: " << *error << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    // Reject thresholds before touching any input
    try {
        options.thresholds.validate();
    } catch (const ThresholdError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    }

    auto original = read_file(options.original_path);
    if (!original) {
        std::cerr << "Error: cannot read original document '" << options.original_path << "'\n";
        return kExitMissingInput;
    }
    auto converted = read_file(options.converted_path);
    if (!converted) {
        std::cerr << "Error: cannot read converted document '" << options.converted_path << "'\n";
        return kExitMissingInput;
    }

    ToleranceConfiguration configuration;
    try {
        const auto result = check_round_trip(*original, *converted, options.document_type, options.thresholds,
                                             options.profile, configuration, options.platform);

        std::cout << format_banner(result);
        if (options.json) {
            std::cout << "\n" << to_json(to_value(result)) << "\n";
        }
        return exit_code_for(result, options.exit_on_failure);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitUsage;
    }
}
