// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file namespaces.h
/// @brief Well-known OOXML namespace URIs and their canonical prefixes.
///
/// Documents bind prefixes freely; the library never compares prefix strings.
/// Canonical prefixes are only used to render locations and to resolve the
/// prefixes written in carrier patterns.

#pragma once

#include "api.h"

#include <optional>
#include <string_view>

namespace ooxml_fidelity {

namespace ns {

inline constexpr std::string_view wordprocessingml =
    "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
inline constexpr std::string_view word2010 =
    "http://schemas.microsoft.com/office/word/2010/wordml";
inline constexpr std::string_view drawingml =
    "http://schemas.openxmlformats.org/drawingml/2006/main";
inline constexpr std::string_view presentationml =
    "http://schemas.openxmlformats.org/presentationml/2006/main";
inline constexpr std::string_view spreadsheetml =
    "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
inline constexpr std::string_view relationships =
    "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
inline constexpr std::string_view wordprocessing_drawing =
    "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
inline constexpr std::string_view picture =
    "http://schemas.openxmlformats.org/drawingml/2006/picture";
inline constexpr std::string_view chart =
    "http://schemas.openxmlformats.org/drawingml/2006/chart";
inline constexpr std::string_view spreadsheet_drawing =
    "http://schemas.openxmlformats.org/drawingml/2006/spreadsheetDrawing";
inline constexpr std::string_view markup_compatibility =
    "http://schemas.openxmlformats.org/markup-compatibility/2006";
inline constexpr std::string_view core_properties =
    "http://schemas.openxmlformats.org/package/2006/metadata/core-properties";
inline constexpr std::string_view dublin_core = "http://purl.org/dc/elements/1.1/";
inline constexpr std::string_view dublin_core_terms = "http://purl.org/dc/terms/";
inline constexpr std::string_view extended_properties =
    "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties";
inline constexpr std::string_view doc_props_vtypes =
    "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes";
inline constexpr std::string_view xml = "http://www.w3.org/XML/1998/namespace";

} // namespace ns

/// Canonical prefix for a namespace URI.
/// @return "" for the spreadsheet main namespace (rendered unprefixed),
///         std::nullopt for URIs outside the table
[[nodiscard]] OOXML_FIDELITY_API std::optional<std::string_view>
canonical_prefix(std::string_view uri) noexcept;

/// Namespace URI bound to a canonical prefix ("w", "a", "p", ...).
/// "x" resolves to the spreadsheet main namespace.
[[nodiscard]] OOXML_FIDELITY_API std::optional<std::string_view>
namespace_uri(std::string_view prefix) noexcept;

/// True for namespaces that only carry package metadata (core and extended
/// properties); changes there never affect appearance or content.
[[nodiscard]] OOXML_FIDELITY_API bool is_metadata_namespace(std::string_view uri) noexcept;

} // namespace ooxml_fidelity
