// change_records.cpp - SemanticDifference -> ChangeRecord classification

#include <ooxml_fidelity/change_records.h>
#include <ooxml_fidelity/namespaces.h>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <array>
#include <string_view>

namespace ooxml_fidelity {

namespace {

constexpr std::array<std::string_view, 11> kColorElements{
    "color", "srgbClr", "schemeClr", "sysClr", "prstClr", "scrgbClr", "hslClr",
    "shd", "highlight", "fgColor", "bgColor"};

constexpr std::array<std::string_view, 4> kColorAttributes{"fill", "rgb", "lastClr", "themeColor"};

constexpr std::array<std::string_view, 7> kFontElements{
    "rFonts", "latin", "ea", "cs", "sym", "font", "rFont"};

constexpr std::array<std::string_view, 5> kFontAttributes{"ascii", "hAnsi", "eastAsia", "typeface", "asciiTheme"};

constexpr std::array<std::string_view, 10> kSpacingElements{
    "spacing", "ind", "pgMar", "spcBef", "spcAft", "lnSpc", "spcPts", "spcPct", "tblCellMar", "tblInd"};

constexpr std::array<std::string_view, 5> kResolutionElements{"blip", "blipFill", "extent", "srcRect", "stretch"};

template <std::size_t N>
bool one_of(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_text_difference(const SemanticDifference& d) {
    return !d.attribute && boost::algorithm::ends_with(d.location, "/text()");
}

} // anonymous namespace

ChangeType classify_change(const SemanticDifference& d) {
    if (d.severity == DiffSeverity::Ignorable || is_metadata_namespace(d.element.ns_uri)) {
        return ChangeType::MetadataChange;
    }
    if (is_text_difference(d)) {
        return ChangeType::ContentLoss;
    }

    const std::string_view element = d.element.local;
    if (!d.attribute) {
        if (d.category == DiffCategory::Dropped && d.context.affects_content) {
            return ChangeType::ContentLoss;
        }
        if (d.context.affects_structure && !d.context.affects_styling &&
            !one_of(kResolutionElements, element)) {
            return ChangeType::StructureChange;
        }
    }

    const std::string_view attribute = d.attribute ? std::string_view(d.attribute->local) : std::string_view{};
    if (one_of(kResolutionElements, element)) {
        return ChangeType::ResolutionLoss;
    }
    if (one_of(kColorElements, element) || one_of(kColorAttributes, attribute)) {
        return ChangeType::ColorShift;
    }
    if (one_of(kFontElements, element) || one_of(kFontAttributes, attribute)) {
        return ChangeType::FontSubstitution;
    }
    if (one_of(kSpacingElements, element)) {
        return ChangeType::SpacingChange;
    }
    return ChangeType::FormattingLoss;
}

std::vector<ChangeRecord> to_change_records(const std::vector<SemanticDifference>& differences) {
    std::vector<ChangeRecord> records;
    records.reserve(differences.size());
    for (const auto& d : differences) {
        records.push_back(ChangeRecord{classify_change(d), d.location, d.severity, d.description});
    }
    return records;
}

} // namespace ooxml_fidelity
