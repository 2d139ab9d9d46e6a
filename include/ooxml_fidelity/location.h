// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file location.h
/// @brief Namespace-normalized locations and location-pattern matching.
///
/// A location names one element, attribute or text node of a document:
///
///   /w:document[1]/w:body[1]/w:p[2]/w:pPr[1]/w:color[1]/@w:val
///   /w:styles[1]/w:style[@w:styleId='Heading1']/w:rPr[1]
///   /w:document[1]/w:body[1]/w:p[1]/w:r[1]/w:t[1]/text()
///
/// Element steps carry their 1-based position among siblings with the same
/// key. Elements that carry an identity attribute (style id, numbering id,
/// cell reference) are keyed by that value instead of their position, so a
/// reordered style table still aligns. Prefixes are canonical (namespaces.h).
///
/// Location patterns (tolerance critical/ignorable paths and rule scopes)
/// are matched by segment-aligned containment:
///   - leading '/' are ignored; the pattern may match anywhere in the location
///   - each pattern segment matches one location segment name (predicates
///     like "[1]" are ignored); a segment without '*' matches any name it is
///     a prefix of, and '*' matches any run of characters
///   - a segment without ':' also matches a prefixed name with that local name
///   - a segment without '@' also matches an attribute segment
///   - an inner "//" allows any number of intermediate segments

#pragma once

#include "api.h"
#include "document.h"

#include <string>
#include <string_view>
#include <vector>

namespace ooxml_fidelity {

/// Alignment key of an element within its parent
struct SiblingKey {
    QName name;
    std::string identity;        ///< Identity attribute value, empty if none
    QName identity_attribute;    ///< Name of the identity attribute, if any
    std::uint32_t occurrence = 1;

    bool operator==(const SiblingKey& other) const {
        return name == other.name && identity == other.identity && occurrence == other.occurrence;
    }
};

/// Identity attribute of an element (w:styleId, w:abstractNumId, w:numId, r),
/// or nullptr when it is keyed by position
[[nodiscard]] OOXML_FIDELITY_API const Attribute* identity_attribute(const Node& node) noexcept;

/// Keys of every child of `parent`, in child order
[[nodiscard]] OOXML_FIDELITY_API std::vector<SiblingKey>
child_keys(const ParsedDocument& doc, NodeId parent);

/// Key of the document element (always occurrence 1)
[[nodiscard]] OOXML_FIDELITY_API SiblingKey root_key(const ParsedDocument& doc);

/// One location step, e.g. "w:p[2]" or "w:style[@w:styleId='Title']"
[[nodiscard]] OOXML_FIDELITY_API std::string format_step(const SiblingKey& key);

/// Full location of an element
[[nodiscard]] OOXML_FIDELITY_API std::string node_location(const ParsedDocument& doc, NodeId id);

/// Location of an attribute below an element location
[[nodiscard]] OOXML_FIDELITY_API std::string
attribute_location(const std::string& element_location, const QName& attribute);

/// Location of an element's direct text below its location
[[nodiscard]] OOXML_FIDELITY_API std::string text_location(const std::string& element_location);

/// Match a location pattern against a location (see file comment)
[[nodiscard]] OOXML_FIDELITY_API bool
location_matches(std::string_view pattern, std::string_view location);

} // namespace ooxml_fidelity
