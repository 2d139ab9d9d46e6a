// types.cpp - Vocabulary names

#include <ooxml_fidelity/types.h>

namespace ooxml_fidelity {

namespace {

// Linear lookup over the `all_xxx` table; vocabularies are tiny.
template <typename Enum, std::size_t N>
std::optional<Enum> parse_by_name(std::string_view name, const std::array<Enum, N>& all) noexcept {
    for (auto value : all) {
        if (to_string(value) == name) {
            return value;
        }
    }
    return std::nullopt;
}

constexpr std::array<ToleranceLevel, 4> all_tolerance_levels{
    ToleranceLevel::Strict, ToleranceLevel::Normal, ToleranceLevel::Lenient,
    ToleranceLevel::Permissive};

} // anonymous namespace

std::string_view to_string(DocumentType type) noexcept {
    switch (type) {
        case DocumentType::Word:       return "word";
        case DocumentType::PowerPoint: return "powerpoint";
        case DocumentType::Excel:      return "excel";
    }
    return "unknown";
}

std::string_view to_string(DiffCategory category) noexcept {
    switch (category) {
        case DiffCategory::Added:    return "added";
        case DiffCategory::Dropped:  return "dropped";
        case DiffCategory::Modified: return "modified";
    }
    return "unknown";
}

std::string_view to_string(DiffSeverity severity) noexcept {
    switch (severity) {
        case DiffSeverity::Critical:  return "critical";
        case DiffSeverity::Major:     return "major";
        case DiffSeverity::Minor:     return "minor";
        case DiffSeverity::Ignorable: return "ignorable";
    }
    return "unknown";
}

std::string_view to_string(CarrierKind kind) noexcept {
    switch (kind) {
        case CarrierKind::ColorScheme:    return "color_scheme";
        case CarrierKind::FontScheme:     return "font_scheme";
        case CarrierKind::ParagraphStyle: return "paragraph_style";
        case CarrierKind::CharacterStyle: return "character_style";
        case CarrierKind::TableStyle:     return "table_style";
        case CarrierKind::ListStyle:      return "list_style";
        case CarrierKind::ThemeVariant:   return "theme_variant";
        case CarrierKind::LayoutMaster:   return "layout_master";
        case CarrierKind::CellStyle:      return "cell_style";
    }
    return "unknown";
}

std::string_view to_string(Significance significance) noexcept {
    switch (significance) {
        case Significance::Critical:  return "critical";
        case Significance::Important: return "important";
        case Significance::Moderate:  return "moderate";
        case Significance::Cosmetic:  return "cosmetic";
    }
    return "unknown";
}

std::string_view to_string(ChangeType type) noexcept {
    switch (type) {
        case ChangeType::ContentLoss:      return "content_loss";
        case ChangeType::FormattingLoss:   return "formatting_loss";
        case ChangeType::ColorShift:       return "color_shift";
        case ChangeType::SpacingChange:    return "spacing_change";
        case ChangeType::FontSubstitution: return "font_substitution";
        case ChangeType::MetadataChange:   return "metadata_change";
        case ChangeType::StructureChange:  return "structure_change";
        case ChangeType::ResolutionLoss:   return "resolution_loss";
    }
    return "unknown";
}

std::string_view to_string(ToleranceLevel level) noexcept {
    switch (level) {
        case ToleranceLevel::Strict:     return "strict";
        case ToleranceLevel::Normal:     return "normal";
        case ToleranceLevel::Lenient:    return "lenient";
        case ToleranceLevel::Permissive: return "permissive";
    }
    return "unknown";
}

std::string_view to_string(PlatformType platform) noexcept {
    switch (platform) {
        case PlatformType::MicrosoftOffice: return "microsoft_office";
        case PlatformType::LibreOffice:     return "libreoffice";
        case PlatformType::GoogleWorkspace: return "google_workspace";
        case PlatformType::ApplePages:      return "apple_pages";
        case PlatformType::WpsOffice:       return "wps_office";
    }
    return "unknown";
}

std::optional<DocumentType> parse_document_type(std::string_view name) noexcept {
    return parse_by_name(name, all_document_types);
}

std::optional<DiffCategory> parse_diff_category(std::string_view name) noexcept {
    return parse_by_name(name, all_diff_categories);
}

std::optional<DiffSeverity> parse_diff_severity(std::string_view name) noexcept {
    return parse_by_name(name, all_diff_severities);
}

std::optional<CarrierKind> parse_carrier_kind(std::string_view name) noexcept {
    return parse_by_name(name, all_carrier_kinds);
}

std::optional<Significance> parse_significance(std::string_view name) noexcept {
    return parse_by_name(name, all_significances);
}

std::optional<ChangeType> parse_change_type(std::string_view name) noexcept {
    return parse_by_name(name, all_change_types);
}

std::optional<ToleranceLevel> parse_tolerance_level(std::string_view name) noexcept {
    return parse_by_name(name, all_tolerance_levels);
}

std::optional<PlatformType> parse_platform_type(std::string_view name) noexcept {
    return parse_by_name(name, all_platform_types);
}

} // namespace ooxml_fidelity
