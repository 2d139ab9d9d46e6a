// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file carrier_analyzer.h
/// @brief Design-token carrier detection, survival accounting and comparison.
///
/// Usage:
/// @code
///   CarrierAnalyzer analyzer;  // standard catalog
///   auto comparison = analyzer.compare_carriers(original_xml, converted_xml,
///                                               DocumentType::Word);
///   auto critical = get_critical_carrier_survival(comparison.converted_analysis);
///   std::cout << generate_carrier_report(comparison);
/// @endcode
///
/// Results refer to catalog mappings by pointer; the catalog must outlive them.
/// The standard catalog lives for the whole process.

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

/// One place where a mapping matched
struct DetectedCarrier {
    const CarrierMapping* mapping = nullptr;
    std::string location;              ///< Location of the matched element or attribute
    std::optional<std::string> value;  ///< Extracted value, if any
};

struct CategoryStats {
    std::size_t detected = 0;   ///< Distinct mappings of this level found
    std::size_t missing = 0;    ///< Mappings of this level with no match
    std::size_t total = 0;
    double survival_rate = 0.0;
};

struct CarrierAnalysisResult {
    std::vector<DetectedCarrier> detected_carriers;
    std::vector<const CarrierMapping*> missing_carriers;
    double survival_rate = 0.0;                   ///< [0, 100]; 0 for unparseable input
    std::vector<std::string> critical_failures;   ///< Descriptions of missing critical mappings
    std::map<Significance, CategoryStats> category_breakdown;  ///< Every level present
    std::optional<std::string> parse_error;

    /// Number of distinct mappings found
    [[nodiscard]] std::size_t detected_mapping_count() const;
};

// ============================================================
// Comparison
// ============================================================

struct TokenValueChange {
    std::string original;
    std::string converted;
};

/// Token path -> joined value(s) per outcome
struct TokenChanges {
    std::map<std::string, std::string> preserved;
    std::map<std::string, TokenValueChange> modified;
    std::map<std::string, std::string> lost;
    std::map<std::string, std::string> gained;
};

struct CarrierPreservationMetrics {
    std::size_t total_original_tokens = 0;
    std::size_t preserved_tokens = 0;
    std::size_t modified_tokens = 0;
    std::size_t lost_tokens = 0;
    std::size_t gained_tokens = 0;
    double preservation_rate = 0.0;  ///< 100 * preserved / (preserved + modified + lost)
    double modification_rate = 0.0;
    double loss_rate = 0.0;
    double change_ratio = 0.0;       ///< (modified + lost + gained) / max(1, distinct tokens)
};

struct CarrierComparison {
    CarrierAnalysisResult original_analysis;
    CarrierAnalysisResult converted_analysis;
    CarrierPreservationMetrics preservation_metrics;
    TokenChanges token_changes;
};

struct CarrierTokenInfo {
    CarrierKind carrier_kind = CarrierKind::ColorScheme;
    std::string token_path;
    std::optional<std::string> value;  ///< Unset for missing tokens
    std::string description;
};

struct CriticalCarrierSurvival {
    std::size_t detected_count = 0;
    std::size_t missing_count = 0;
    double survival_rate = 0.0;
    std::vector<CarrierTokenInfo> detected_tokens;
    std::vector<CarrierTokenInfo> missing_tokens;
};

// ============================================================
// CarrierAnalyzer
// ============================================================

class OOXML_FIDELITY_API CarrierAnalyzer {
public:
    explicit CarrierAnalyzer(const CarrierCatalog& catalog = CarrierCatalog::standard())
        : catalog_(&catalog) {}

    /// Scan one document. Unparseable bytes give an empty result with
    /// survival_rate 0 and `parse_error` set; nothing is thrown.
    [[nodiscard]] CarrierAnalysisResult analyze_carriers(std::string_view document_bytes,
                                                         DocumentType document_type) const;

    [[nodiscard]] CarrierAnalysisResult analyze_carriers(const ParsedDocument& doc,
                                                         DocumentType document_type) const;

    /// Analyze both versions and classify every token path seen in either
    [[nodiscard]] CarrierComparison compare_carriers(std::string_view original_bytes,
                                                     std::string_view converted_bytes,
                                                     DocumentType document_type) const;

    [[nodiscard]] const CarrierCatalog& catalog() const noexcept { return *catalog_; }

private:
    const CarrierCatalog* catalog_;
};

/// Survival of CRITICAL mappings only
[[nodiscard]] OOXML_FIDELITY_API CriticalCarrierSurvival
get_critical_carrier_survival(const CarrierAnalysisResult& result);

/// Multi-line text summary. Section headers "Preservation Rate:" and
/// "Category Breakdown:" are stable.
[[nodiscard]] OOXML_FIDELITY_API std::string generate_carrier_report(const CarrierComparison& comparison);

} // namespace ooxml_fidelity
