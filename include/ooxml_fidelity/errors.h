// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Configuration error hierarchy.
///
/// Only configuration mistakes are raised. Unparseable documents are reported
/// through optional returns, and failed tolerance checks are plain result data.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>

namespace ooxml_fidelity {

/// Base of every error raised for a bad profile name, threshold or profile record
class OOXML_FIDELITY_API ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class OOXML_FIDELITY_API UnknownProfileError : public ConfigurationError {
public:
    explicit UnknownProfileError(std::string name)
        : ConfigurationError("Unknown tolerance profile: '" + name + "'")
        , name_(std::move(name)) {}

    [[nodiscard]] const std::string& profile_name() const noexcept { return name_; }

private:
    std::string name_;
};

/// A percentage threshold outside [0, 100]
class OOXML_FIDELITY_API ThresholdError : public ConfigurationError {
public:
    ThresholdError(std::string field, double value)
        : ConfigurationError("Threshold '" + field + "' must be within [0, 100], got " +
                             std::to_string(value))
        , field_(std::move(field))
        , value_(value) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] double value() const noexcept { return value_; }

private:
    std::string field_;
    double value_;
};

/// A persisted profile record that is not valid JSON or misses/mistypes a field
class OOXML_FIDELITY_API ProfileFormatError : public ConfigurationError {
public:
    ProfileFormatError(std::string field, const std::string& reason)
        : ConfigurationError("Invalid profile record field '" + field + "': " + reason)
        , field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// A registry change that is never allowed (e.g. removing a built-in profile)
class OOXML_FIDELITY_API ProfileMutationError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

} // namespace ooxml_fidelity
