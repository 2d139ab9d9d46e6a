// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON rendering and parsing for Value records.
///
/// Usage:
/// @code
///   #include <ooxml_fidelity/serialization.h>
///
///   std::string json = to_json(to_value(summary), false);  // pretty-printed
///
///   std::string error;
///   Value parsed = from_json(json, &error);
///   if (!error.empty()) { ... }
/// @endcode
///
/// Object keys are written in sorted order, so equal records always render
/// to identical text.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace ooxml_fidelity {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
OOXML_FIDELITY_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
OOXML_FIDELITY_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace ooxml_fidelity
