// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file carrier_catalog.h
/// @brief Static catalog mapping markup locations to design-token identities.
///
/// Each CarrierMapping names a location pattern such as
///
///   //a:clrScheme//a:srgbClr/@val
///   //w:tcPr//w:shd/@w:fill
///   //cellXfs//xf/@numFmtId
///
/// Patterns are compiled once, when the catalog is built, into steps whose
/// names are resolved to namespace URIs through the canonical prefix table.
/// Matching runs in two tiers:
///   1. qualified: namespace URI and local name must both match
///   2. local-name only: used for a mapping only when tier 1 found nothing
///      in the document, so a pattern authored with one prefix convention
///      (p:spPr) still finds the same carrier under another (pic:spPr, xdr:spPr)
///
/// Unprefixed element names match any namespace in both tiers; unprefixed
/// attribute names mean "no namespace", as in XML itself.

#pragma once

#include "api.h"
#include "document.h"
#include "types.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ooxml_fidelity {

// ============================================================
// Compiled location patterns
// ============================================================

enum class MatchTier : uint8_t { Qualified, LocalName };

class OOXML_FIDELITY_API CarrierPattern {
public:
    struct Step {
        bool descendant = false;            ///< "//" axis rather than "/"
        std::optional<std::string> ns_uri;  ///< nullopt: any namespace
        std::string local;                  ///< "*" matches any element

        bool operator==(const Step&) const = default;
    };

    /// Compile a pattern.
    /// @throws ConfigurationError on syntax errors or unknown prefixes
    static CarrierPattern compile(std::string_view text);

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] const std::vector<Step>& element_steps() const noexcept { return steps_; }
    [[nodiscard]] const std::optional<Step>& attribute_step() const noexcept { return attribute_; }
    [[nodiscard]] bool targets_attribute() const noexcept { return attribute_.has_value(); }

    /// Namespace URIs named by the pattern's prefixes
    [[nodiscard]] std::set<std::string> namespaces() const;

    /// Elements selected by the element steps, in document order
    [[nodiscard]] std::vector<NodeId> select(const ParsedDocument& doc, MatchTier tier) const;

private:
    std::string source_;
    std::vector<Step> steps_;
    std::optional<Step> attribute_;
};

/// One place where a pattern matched
struct CarrierMatch {
    NodeId node = kNoNode;
    std::optional<QName> attribute;    ///< Set when the pattern targets an attribute
    std::optional<std::string> value;  ///< Extracted token value
    MatchTier tier = MatchTier::Qualified;
};

/// Find every match of `pattern`, falling back to tier 2 when tier 1 finds nothing.
///
/// Value extraction: an attribute pattern yields the attribute value; an element
/// pattern yields its val/value attribute, else its direct text, else nothing.
[[nodiscard]] OOXML_FIDELITY_API std::vector<CarrierMatch>
find_carrier_matches(const CarrierPattern& pattern, const ParsedDocument& doc);

// ============================================================
// Catalog
// ============================================================

struct CarrierMapping {
    std::string location_pattern;
    CarrierKind carrier_kind = CarrierKind::ColorScheme;
    Significance significance = Significance::Important;
    std::string design_token_path;
    std::string description;
    std::set<DocumentType> applicable_document_types;
    std::set<std::string> namespace_identities;  ///< Namespace URIs relevant to matching
    CarrierPattern pattern;                       ///< Compiled form of location_pattern

    [[nodiscard]] bool applies_to(DocumentType type) const {
        return applicable_document_types.count(type) > 0;
    }
};

/// Build a mapping, compiling its pattern and resolving its namespace identities.
/// @throws ConfigurationError for an invalid pattern
[[nodiscard]] OOXML_FIDELITY_API CarrierMapping make_carrier_mapping(
    std::string_view location_pattern, CarrierKind kind, Significance significance,
    std::string design_token_path, std::string description,
    std::set<DocumentType> document_types);

class OOXML_FIDELITY_API CarrierCatalog {
public:
    explicit CarrierCatalog(std::vector<CarrierMapping> mappings);

    /// The built-in OOXML catalog, built on first use and shared read-only
    static const CarrierCatalog& standard();

    [[nodiscard]] const std::vector<CarrierMapping>& mappings() const noexcept { return mappings_; }

    /// Mappings evaluated for a document type; every mapping when `type` is absent
    [[nodiscard]] std::vector<const CarrierMapping*>
    applicable(std::optional<DocumentType> type) const;

    /// First mapping with the given design token path, or nullptr
    [[nodiscard]] const CarrierMapping* find_by_token(std::string_view token_path) const noexcept;

private:
    std::vector<CarrierMapping> mappings_;
};

} // namespace ooxml_fidelity
