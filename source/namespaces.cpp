// namespaces.cpp - Canonical OOXML namespace table

#include <ooxml_fidelity/namespaces.h>

#include <array>
#include <utility>

namespace ooxml_fidelity {

namespace {

using PrefixEntry = std::pair<std::string_view, std::string_view>;  // prefix, uri

constexpr std::array<PrefixEntry, 17> kPrefixes{{
    {"w", ns::wordprocessingml},
    {"w14", ns::word2010},
    {"a", ns::drawingml},
    {"p", ns::presentationml},
    {"x", ns::spreadsheetml},
    {"r", ns::relationships},
    {"wp", ns::wordprocessing_drawing},
    {"pic", ns::picture},
    {"c", ns::chart},
    {"xdr", ns::spreadsheet_drawing},
    {"mc", ns::markup_compatibility},
    {"cp", ns::core_properties},
    {"dc", ns::dublin_core},
    {"dcterms", ns::dublin_core_terms},
    {"app", ns::extended_properties},
    {"vt", ns::doc_props_vtypes},
    {"xml", ns::xml},
}};

} // anonymous namespace

std::optional<std::string_view> canonical_prefix(std::string_view uri) noexcept {
    if (uri == ns::spreadsheetml) {
        return std::string_view{};
    }
    for (const auto& [prefix, entry_uri] : kPrefixes) {
        if (entry_uri == uri) {
            return prefix;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> namespace_uri(std::string_view prefix) noexcept {
    for (const auto& [entry_prefix, uri] : kPrefixes) {
        if (entry_prefix == prefix) {
            return uri;
        }
    }
    return std::nullopt;
}

bool is_metadata_namespace(std::string_view uri) noexcept {
    return uri == ns::core_properties || uri == ns::dublin_core ||
           uri == ns::dublin_core_terms || uri == ns::extended_properties ||
           uri == ns::doc_props_vtypes;
}

} // namespace ooxml_fidelity
