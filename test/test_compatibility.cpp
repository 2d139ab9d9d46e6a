// test_compatibility.cpp - Tests for platform batches and compatibility reports

#include <catch2/catch_all.hpp>
#include <ooxml_fidelity/compatibility.h>

#include "sample_parts.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace ooxml_fidelity;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

// ============================================================
// Helper Functions
// ============================================================

namespace {

PlatformJob make_job(PlatformType platform, const std::string& converted) {
    PlatformJob job;
    job.platform = platform;
    job.platform_version = "1.0";
    job.document_type = DocumentType::Word;
    job.original_bytes = samples::kTheme;
    job.converted_bytes = converted;
    return job;
}

/// Office keeps the theme, LibreOffice drops its colors, Google's output is unreadable
std::vector<PlatformResult> three_platform_run() {
    std::vector<PlatformJob> jobs;
    jobs.push_back(make_job(PlatformType::MicrosoftOffice, samples::kTheme));
    jobs.push_back(make_job(PlatformType::LibreOffice, samples::kThemeWithoutColors));
    jobs.push_back(make_job(PlatformType::GoogleWorkspace, samples::kMalformed));
    return run_platform_batch(std::move(jobs), CarrierAnalyzer{});
}

bool contains(const std::vector<std::string>& items, const std::string& text) {
    return std::find(items.begin(), items.end(), text) != items.end();
}

} // namespace

// ============================================================
// run_platform_batch
// ============================================================

TEST_CASE("run_platform_batch keeps job order and isolates failures", "[compat][batch]") {
    const auto results = three_platform_run();
    REQUIRE(results.size() == 3);

    REQUIRE(results[0].platform == PlatformType::MicrosoftOffice);
    REQUIRE(results[0].comparison.has_value());
    REQUIRE_FALSE(results[0].error.has_value());
    REQUIRE(results[0].platform_version == std::optional<std::string>{"1.0"});

    REQUIRE(results[1].platform == PlatformType::LibreOffice);
    REQUIRE(results[1].comparison.has_value());
    REQUIRE(results[1].comparison->preservation_metrics.lost_tokens == 3);

    REQUIRE(results[2].platform == PlatformType::GoogleWorkspace);
    REQUIRE_FALSE(results[2].comparison.has_value());
    REQUIRE(results[2].error.has_value());
    REQUIRE_THAT(*results[2].error, StartsWith("converted document unreadable"));

    SECTION("an empty batch") {
        REQUIRE(run_platform_batch({}, CarrierAnalyzer{}).empty());
    }
}

// ============================================================
// Collection
// ============================================================

TEST_CASE("collect_platform_results", "[compat][collect]") {
    const auto platforms = collect_platform_results(three_platform_run());
    REQUIRE(platforms.size() == 2);

    const auto& office = platforms[0];
    REQUIRE(office.platform == PlatformType::MicrosoftOffice);
    REQUIRE(office.document_format == DocumentType::Word);
    REQUIRE(office.version == std::optional<std::string>{"1.0"});
    REQUIRE(office.total_carriers == 7);
    REQUIRE(office.preserved_carriers == 7);
    REQUIRE(office.survival_rate == 100.0);
    REQUIRE(office.critical_failures.empty());

    const auto& libre = platforms[1];
    REQUIRE(libre.lost_carriers == 3);
    REQUIRE_THAT(libre.survival_rate, WithinAbs(400.0 / 7.0, 1e-9));
    REQUIRE(libre.critical_failures.size() == 2);

    SECTION("runs on the same platform and format are folded") {
        auto results = three_platform_run();
        results.push_back(results[0]);
        const auto folded = collect_platform_results(results);
        REQUIRE(folded.size() == 2);
        REQUIRE(folded[0].total_carriers == 14);
        REQUIRE(folded[0].survival_rate == 100.0);
    }
}

TEST_CASE("collect_carrier_results", "[compat][collect]") {
    const auto carriers = collect_carrier_results(three_platform_run());
    REQUIRE(carriers.size() == all_carrier_kinds.size());

    const auto& colors = carriers.at(CarrierKind::ColorScheme);
    REQUIRE(colors.category == Significance::Critical);
    REQUIRE(colors.total_tests == 4);
    REQUIRE(colors.successful_tests == 2);
    REQUIRE(colors.success_rate() == 50.0);
    REQUIRE(colors.platform_results.at(PlatformType::MicrosoftOffice));
    REQUIRE_FALSE(colors.platform_results.at(PlatformType::LibreOffice));
    REQUIRE(colors.platform_results.count(PlatformType::GoogleWorkspace) == 0);
    REQUIRE(colors.common_failures == std::vector<std::string>{"Lost on libreoffice"});

    const auto& fonts = carriers.at(CarrierKind::FontScheme);
    REQUIRE(fonts.total_tests == 4);
    REQUIRE(fonts.success_rate() == 100.0);

    const auto& variants = carriers.at(CarrierKind::ThemeVariant);
    REQUIRE(variants.category == Significance::Moderate);
    REQUIRE(variants.total_tests == 6);
    REQUIRE(variants.successful_tests == 5);

    const auto& layout = carriers.at(CarrierKind::LayoutMaster);
    REQUIRE(layout.total_tests == 0);
    REQUIRE(layout.success_rate() == 0.0);

    SECTION("no results still lists every kind") {
        const auto empty = collect_carrier_results({});
        REQUIRE(empty.size() == all_carrier_kinds.size());
        REQUIRE(std::all_of(empty.begin(), empty.end(),
                            [](const auto& entry) { return entry.second.total_tests == 0; }));
    }
}

// ============================================================
// Report
// ============================================================

TEST_CASE("build_compatibility_report", "[compat][report]") {
    ReportConfiguration config;
    config.report_id = "theme_round_trip";
    config.platforms = {PlatformType::MicrosoftOffice, PlatformType::LibreOffice, PlatformType::GoogleWorkspace};
    config.document_type = DocumentType::Word;

    const auto report = build_compatibility_report(three_platform_run(), config);

    REQUIRE(report.report_id == "theme_round_trip");
    REQUIRE(report.test_configuration.platforms.size() == 3);
    REQUIRE(report.platform_results.size() == 2);
    REQUIRE(report.carrier_results.size() == all_carrier_kinds.size());

    SECTION("failed jobs are listed, not counted") {
        REQUIRE(report.input_errors.size() == 1);
        REQUIRE_THAT(report.input_errors.front(), StartsWith("google_workspace: converted document unreadable"));
    }

    SECTION("overall metrics") {
        const auto& m = report.overall_metrics;
        REQUIRE(m.size() == 7);
        REQUIRE_THAT(m.at(metric_names::overall_survival_rate), WithinAbs((100.0 + 400.0 / 7.0) / 2.0, 1e-9));
        REQUIRE(m.at(metric_names::best_platform_rate) == 100.0);
        REQUIRE_THAT(m.at(metric_names::worst_platform_rate), WithinAbs(400.0 / 7.0, 1e-9));
        REQUIRE_THAT(m.at(metric_names::platform_variance), WithinAbs(300.0 / 7.0, 1e-9));
        REQUIRE_THAT(m.at(metric_names::critical_carrier_success), WithinAbs(75.0, 1e-9));
        REQUIRE_THAT(m.at(metric_names::overall_carrier_success), WithinAbs((50.0 + 100.0 + 500.0 / 6.0) / 3.0, 1e-9));
        REQUIRE(m.at(metric_names::reliability_score) == 50.0);
    }

    SECTION("carrier matrix") {
        const auto& matrix = report.carrier_matrix;
        REQUIRE(matrix.carrier_survival_rates.at(CarrierKind::ColorScheme).at(PlatformType::MicrosoftOffice) == 50.0);
        REQUIRE(matrix.carrier_survival_rates.at(CarrierKind::ColorScheme).at(PlatformType::LibreOffice) == 0.0);
        REQUIRE_FALSE(matrix.platform_carrier_matrix.at(CarrierKind::ColorScheme).at(PlatformType::MicrosoftOffice));
        REQUIRE(matrix.platform_carrier_matrix.at(CarrierKind::FontScheme).at(PlatformType::LibreOffice));
        REQUIRE(matrix.critical_carrier_status.at(CarrierKind::ColorScheme) == "critical");
        REQUIRE(matrix.critical_carrier_status.at(CarrierKind::FontScheme) == "stable");
        REQUIRE(matrix.critical_carrier_status.at(CarrierKind::ThemeVariant) == "non-critical");
        REQUIRE(matrix.risk_assessment.at(CarrierKind::FontScheme) == "low");
        REQUIRE(matrix.risk_assessment.at(CarrierKind::ColorScheme) == "high");
        REQUIRE(contains(matrix.design_token_mapping.at(CarrierKind::ColorScheme), "tokens.color.primary"));
        REQUIRE(matrix.carrier_survival_rates.at(CarrierKind::ColorScheme).count(PlatformType::GoogleWorkspace) == 0);
    }

    SECTION("summary and recommendations") {
        REQUIRE_THAT(report.summary, StartsWith("Compatibility Analysis Summary:"));
        REQUIRE_THAT(report.summary, ContainsSubstring("Overall Design Token Survival Rate: 78.6% (Good)"));
        REQUIRE_THAT(report.summary, ContainsSubstring("good compatibility"));
        REQUIRE(contains(report.recommendations,
                         "Consider optimizing templates for libreoffice (current survival rate: 57.1%)"));
        REQUIRE(contains(report.recommendations,
                         "CRITICAL: Fix color_scheme compatibility issues (success rate: 50.0%)"));
    }
}

TEST_CASE("generate_matrix with nothing tested", "[compat][report]") {
    const auto report = generate_matrix({}, {}, ReportConfiguration{});

    REQUIRE(report.report_id == "compatibility_report");
    REQUIRE(report.carrier_results.size() == all_carrier_kinds.size());
    REQUIRE(report.overall_metrics.size() == 7);
    REQUIRE(report.overall_metrics.at(metric_names::overall_survival_rate) == 0.0);
    REQUIRE(report.overall_metrics.at(metric_names::critical_carrier_success) == 0.0);
    REQUIRE_THAT(report.summary, ContainsSubstring("(Poor)"));
    REQUIRE(report.recommendations.size() == 1);
    REQUIRE(report.input_errors.empty());
}
