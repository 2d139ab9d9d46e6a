// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file xml_reader.h
/// @brief Turns XML part bytes into a ParsedDocument (libxml2 backed).
///
/// Namespace prefixes are resolved to URIs during parsing. Comments,
/// processing instructions and namespace declarations are not retained.
/// External entities and network access are disabled.

#pragma once

#include "api.h"
#include "document.h"

#include <optional>
#include <string>
#include <string_view>

namespace ooxml_fidelity {

/// Parse one XML part.
/// @param bytes Raw part content (UTF-8 or with an encoding declaration)
/// @param error_out If provided, receives the parser message on failure
/// @return The document, or std::nullopt for malformed or empty input
[[nodiscard]] OOXML_FIDELITY_API std::optional<ParsedDocument>
parse_document(std::string_view bytes, std::string* error_out = nullptr);

} // namespace ooxml_fidelity
