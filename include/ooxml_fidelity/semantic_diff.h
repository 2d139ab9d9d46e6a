// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file semantic_diff.h
/// @brief Namespace-aware structural diff between two versions of a document.
///
/// Both trees are aligned parent by parent. A child is keyed by its qualified
/// name plus, when present, an identity attribute (style id, numbering id,
/// cell reference); otherwise by its position among same-named siblings.
/// Matched pairs are compared attribute by attribute and on their direct text;
/// unmatched children are reported once per subtree as DROPPED (original only)
/// or ADDED (converted only).
///
/// Severity rules:
///   - bookkeeping (revision ids, proofing markers, page-break caches,
///     bookmarks, package metadata) is IGNORABLE
///   - text changes are CRITICAL
///   - attributes flagged by the carrier catalog take the carrier's weight
///     (critical -> CRITICAL, important/moderate -> MAJOR, cosmetic -> MINOR);
///     any other attribute change is MINOR
///   - added/dropped content-bearing elements (paragraphs, runs, rows, cells,
///     shapes...) are CRITICAL when they hold text and MAJOR otherwise, and are
///     never IGNORABLE
///
/// Prefix strings never take part in the comparison.

#pragma once

#include "api.h"
#include "carrier_catalog.h"
#include "document.h"
#include "types.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ooxml_fidelity {

struct DiffContext {
    bool affects_content = false;
    bool affects_styling = false;
    bool affects_structure = false;

    bool operator==(const DiffContext&) const = default;
};

struct SemanticDifference {
    std::string location;
    DiffCategory category = DiffCategory::Modified;
    DiffSeverity severity = DiffSeverity::Minor;
    std::string description;
    std::optional<std::string> old_value;
    std::optional<std::string> new_value;
    DiffContext context;
    QName element;                  ///< Element the difference belongs to
    std::optional<QName> attribute; ///< Set for attribute differences
};

struct DiffSummary {
    std::size_t total_differences = 0;
    std::map<DiffCategory, std::size_t> by_category;   ///< Every category present
    std::map<DiffSeverity, std::size_t> by_severity;   ///< Every severity present
    std::vector<SemanticDifference> critical_changes;
    double preservation_rate = 100.0;                   ///< [0, 100]
    std::size_t comparable_units = 0;                   ///< Units in the original
    std::size_t affected_units = 0;                     ///< Units changed beyond IGNORABLE
};

struct DiffResult {
    std::vector<SemanticDifference> differences;
    DiffSummary summary;
    std::optional<std::string> parse_error;  ///< Set when byte input could not be parsed
};

struct PreservationMetrics {
    double overall_preservation = 1.0;
    double content_preservation = 1.0;
    double style_preservation = 1.0;
    double structure_preservation = 1.0;
    double change_ratio = 0.0;  ///< Not clamped; may exceed 1
};

class OOXML_FIDELITY_API SemanticDiffEngine {
public:
    explicit SemanticDiffEngine(const CarrierCatalog& catalog = CarrierCatalog::standard())
        : catalog_(&catalog) {}

    /// Diff two parsed documents. Never throws for valid trees, empty ones included.
    /// @param document_type Selects document-specific rules; generic rules when absent
    [[nodiscard]] DiffResult analyze_differences(const ParsedDocument& original,
                                                 const ParsedDocument& converted,
                                                 std::optional<DocumentType> document_type = std::nullopt) const;

    /// Parse both parts and diff them. Unparseable input yields an empty
    /// difference list, preservation_rate 0 and `parse_error` set.
    [[nodiscard]] DiffResult analyze_differences(std::string_view original_bytes,
                                                 std::string_view converted_bytes,
                                                 std::optional<DocumentType> document_type = std::nullopt) const;

    [[nodiscard]] const CarrierCatalog& catalog() const noexcept { return *catalog_; }

private:
    const CarrierCatalog* catalog_;
};

/// Differences at or above `min_severity`, optionally restricted to `categories`
[[nodiscard]] OOXML_FIDELITY_API std::vector<SemanticDifference>
filter_differences(const std::vector<SemanticDifference>& differences, DiffSeverity min_severity,
                   const std::optional<std::vector<DiffCategory>>& categories = std::nullopt);

/// Ratios over `total_elements` (treated as at least 1), partitioned by context flags
[[nodiscard]] OOXML_FIDELITY_API PreservationMetrics
get_preservation_metrics(const std::vector<SemanticDifference>& differences, std::size_t total_elements);

/// Summary over an arbitrary difference list; preservation_rate is derived
/// from `comparable_units` and `affected_units`.
[[nodiscard]] OOXML_FIDELITY_API DiffSummary
summarize_differences(const std::vector<SemanticDifference>& differences,
                      std::size_t comparable_units, std::size_t affected_units);

} // namespace ooxml_fidelity
