// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file types.h
/// @brief Closed vocabularies shared by every component.
///
/// Each vocabulary is an enum class with:
/// - a constexpr `all_xxx` array listing every tag in canonical order
///   (used wherever a result must enumerate every tag, never a partial map)
/// - `to_string()` returning the lowercase record name
/// - `parse_xxx()` returning std::nullopt for unknown names

#pragma once

#include "api.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ooxml_fidelity {

// ============================================================
// Document types
// ============================================================

enum class DocumentType : uint8_t { Word, PowerPoint, Excel };

inline constexpr std::array<DocumentType, 3> all_document_types{
    DocumentType::Word, DocumentType::PowerPoint, DocumentType::Excel};

OOXML_FIDELITY_API std::string_view to_string(DocumentType type) noexcept;
OOXML_FIDELITY_API std::optional<DocumentType> parse_document_type(std::string_view name) noexcept;

// ============================================================
// Diff vocabulary
// ============================================================

enum class DiffCategory : uint8_t { Added, Dropped, Modified };

inline constexpr std::array<DiffCategory, 3> all_diff_categories{
    DiffCategory::Added, DiffCategory::Dropped, DiffCategory::Modified};

/// Declared from most to least severe; smaller underlying value = more severe.
enum class DiffSeverity : uint8_t { Critical, Major, Minor, Ignorable };

inline constexpr std::array<DiffSeverity, 4> all_diff_severities{
    DiffSeverity::Critical, DiffSeverity::Major, DiffSeverity::Minor, DiffSeverity::Ignorable};

/// True if `severity` is `threshold` or more severe
[[nodiscard]] constexpr bool at_least(DiffSeverity severity, DiffSeverity threshold) noexcept {
    return static_cast<uint8_t>(severity) <= static_cast<uint8_t>(threshold);
}

OOXML_FIDELITY_API std::string_view to_string(DiffCategory category) noexcept;
OOXML_FIDELITY_API std::string_view to_string(DiffSeverity severity) noexcept;
OOXML_FIDELITY_API std::optional<DiffCategory> parse_diff_category(std::string_view name) noexcept;
OOXML_FIDELITY_API std::optional<DiffSeverity> parse_diff_severity(std::string_view name) noexcept;

// ============================================================
// Carrier vocabulary
// ============================================================

enum class CarrierKind : uint8_t {
    ColorScheme,
    FontScheme,
    ParagraphStyle,
    CharacterStyle,
    TableStyle,
    ListStyle,
    ThemeVariant,
    LayoutMaster,
    CellStyle
};

inline constexpr std::array<CarrierKind, 9> all_carrier_kinds{
    CarrierKind::ColorScheme,  CarrierKind::FontScheme,   CarrierKind::ParagraphStyle,
    CarrierKind::CharacterStyle, CarrierKind::TableStyle, CarrierKind::ListStyle,
    CarrierKind::ThemeVariant, CarrierKind::LayoutMaster, CarrierKind::CellStyle};

/// Importance of a carrier; declared from most to least important.
enum class Significance : uint8_t { Critical, Important, Moderate, Cosmetic };

inline constexpr std::array<Significance, 4> all_significances{
    Significance::Critical, Significance::Important, Significance::Moderate,
    Significance::Cosmetic};

OOXML_FIDELITY_API std::string_view to_string(CarrierKind kind) noexcept;
OOXML_FIDELITY_API std::string_view to_string(Significance significance) noexcept;
OOXML_FIDELITY_API std::optional<CarrierKind> parse_carrier_kind(std::string_view name) noexcept;
OOXML_FIDELITY_API std::optional<Significance> parse_significance(std::string_view name) noexcept;

// ============================================================
// Tolerance vocabulary
// ============================================================

enum class ChangeType : uint8_t {
    ContentLoss,
    FormattingLoss,
    ColorShift,
    SpacingChange,
    FontSubstitution,
    MetadataChange,
    StructureChange,
    ResolutionLoss
};

inline constexpr std::array<ChangeType, 8> all_change_types{
    ChangeType::ContentLoss,      ChangeType::FormattingLoss, ChangeType::ColorShift,
    ChangeType::SpacingChange,    ChangeType::FontSubstitution, ChangeType::MetadataChange,
    ChangeType::StructureChange,  ChangeType::ResolutionLoss};

enum class ToleranceLevel : uint8_t { Strict, Normal, Lenient, Permissive };

OOXML_FIDELITY_API std::string_view to_string(ChangeType type) noexcept;
OOXML_FIDELITY_API std::string_view to_string(ToleranceLevel level) noexcept;
OOXML_FIDELITY_API std::optional<ChangeType> parse_change_type(std::string_view name) noexcept;
OOXML_FIDELITY_API std::optional<ToleranceLevel> parse_tolerance_level(std::string_view name) noexcept;

// ============================================================
// Platforms
// ============================================================

enum class PlatformType : uint8_t {
    MicrosoftOffice,
    LibreOffice,
    GoogleWorkspace,
    ApplePages,
    WpsOffice
};

inline constexpr std::array<PlatformType, 5> all_platform_types{
    PlatformType::MicrosoftOffice, PlatformType::LibreOffice, PlatformType::GoogleWorkspace,
    PlatformType::ApplePages,      PlatformType::WpsOffice};

OOXML_FIDELITY_API std::string_view to_string(PlatformType platform) noexcept;
OOXML_FIDELITY_API std::optional<PlatformType> parse_platform_type(std::string_view name) noexcept;

} // namespace ooxml_fidelity
