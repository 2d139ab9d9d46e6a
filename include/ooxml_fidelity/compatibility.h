// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compatibility.h
/// @brief Multi-platform aggregation of carrier comparisons into one report.
///
/// Pipeline:
///   PlatformJob            (bytes of one original/converted pair per platform)
///     -> run_platform_batch  (parallel carrier comparisons)
///   PlatformResult         (comparison or error per job)
///     -> collect_platform_results / collect_carrier_results
///   PlatformCompatibility + CarrierCompatibility
///     -> generate_matrix
///   CompatibilityReport
///
/// A failed job is kept in the report's input_errors and left out of the
/// statistics; the report is always produced.

#pragma once

#include "api.h"
#include "carrier_analyzer.h"
#include "carrier_catalog.h"
#include "types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ooxml_fidelity {

// ============================================================
// Inputs
// ============================================================

/// One round trip to measure; owns both documents
struct PlatformJob {
    PlatformType platform = PlatformType::MicrosoftOffice;
    std::optional<std::string> platform_version;
    DocumentType document_type = DocumentType::Word;
    std::string original_bytes;
    std::string converted_bytes;
};

struct PlatformResult {
    PlatformType platform = PlatformType::MicrosoftOffice;
    std::optional<std::string> platform_version;
    DocumentType document_type = DocumentType::Word;
    std::optional<CarrierComparison> comparison;  ///< Unset when the job failed
    std::optional<std::string> error;
};

// ============================================================
// Aggregates
// ============================================================

struct PlatformCompatibility {
    PlatformType platform = PlatformType::MicrosoftOffice;
    std::optional<std::string> version;
    DocumentType document_format = DocumentType::Word;
    std::size_t total_carriers = 0;
    std::size_t preserved_carriers = 0;
    std::size_t modified_carriers = 0;
    std::size_t lost_carriers = 0;
    double survival_rate = 0.0;                ///< 100 * preserved / total; [0, 100]
    std::vector<std::string> critical_failures;
};

struct CarrierCompatibility {
    CarrierKind carrier_kind = CarrierKind::ColorScheme;
    Significance category = Significance::Cosmetic;  ///< Highest significance of the kind's mappings
    std::size_t total_tests = 0;
    std::size_t successful_tests = 0;                 ///< Token preserved or modified, not lost
    std::map<PlatformType, bool> platform_results;
    std::vector<std::string> common_failures;

    [[nodiscard]] double success_rate() const noexcept {
        if (total_tests == 0) return 0.0;
        return 100.0 * static_cast<double>(successful_tests) / static_cast<double>(total_tests);
    }
};

/// Per carrier kind x platform view of the carrier results
struct CarrierMatrix {
    std::map<CarrierKind, std::map<PlatformType, double>> carrier_survival_rates;
    std::map<CarrierKind, std::map<PlatformType, bool>> platform_carrier_matrix;  ///< rate >= 75
    std::map<CarrierKind, std::string> critical_carrier_status;  ///< stable / warning / critical / non-critical
    std::map<CarrierKind, std::vector<std::string>> design_token_mapping;
    std::map<CarrierKind, std::string> risk_assessment;          ///< low / medium / high
};

struct ReportConfiguration {
    std::string report_id = "compatibility_report";
    std::string tolerance_profile = "normal";
    std::vector<PlatformType> platforms;
    std::optional<DocumentType> document_type;
};

struct CompatibilityReport {
    std::string report_id;
    ReportConfiguration test_configuration;
    std::vector<PlatformCompatibility> platform_results;
    std::map<CarrierKind, CarrierCompatibility> carrier_results;  ///< Every carrier kind present
    CarrierMatrix carrier_matrix;
    std::map<std::string, double> overall_metrics;
    std::string summary;
    std::vector<std::string> recommendations;
    std::vector<std::string> input_errors;
};

/// Keys always present in CompatibilityReport::overall_metrics
namespace metric_names {
inline constexpr const char* overall_survival_rate = "overall_survival_rate";
inline constexpr const char* best_platform_rate = "best_platform_rate";
inline constexpr const char* worst_platform_rate = "worst_platform_rate";
inline constexpr const char* platform_variance = "platform_variance";
inline constexpr const char* critical_carrier_success = "critical_carrier_success";
inline constexpr const char* overall_carrier_success = "overall_carrier_success";
inline constexpr const char* reliability_score = "reliability_score";
} // namespace metric_names

// ============================================================
// Operations
// ============================================================

/// Run every job's carrier comparison on its own task. Results keep job order.
[[nodiscard]] OOXML_FIDELITY_API std::vector<PlatformResult>
run_platform_batch(std::vector<PlatformJob> jobs, const CarrierAnalyzer& analyzer);

/// Fold results per (platform, document format); failed results are skipped
[[nodiscard]] OOXML_FIDELITY_API std::vector<PlatformCompatibility>
collect_platform_results(const std::vector<PlatformResult>& results);

/// Per-kind test counts from token changes; every carrier kind is present
[[nodiscard]] OOXML_FIDELITY_API std::map<CarrierKind, CarrierCompatibility>
collect_carrier_results(const std::vector<PlatformResult>& results,
                        const CarrierCatalog& catalog = CarrierCatalog::standard());

[[nodiscard]] OOXML_FIDELITY_API CompatibilityReport
generate_matrix(std::vector<PlatformCompatibility> platform_results,
                std::map<CarrierKind, CarrierCompatibility> carrier_results,
                const ReportConfiguration& configuration,
                const CarrierCatalog& catalog = CarrierCatalog::standard());

/// collect_* + generate_matrix, with failed results listed in input_errors
[[nodiscard]] OOXML_FIDELITY_API CompatibilityReport
build_compatibility_report(const std::vector<PlatformResult>& results,
                           const ReportConfiguration& configuration,
                           const CarrierCatalog& catalog = CarrierCatalog::standard());

} // namespace ooxml_fidelity
