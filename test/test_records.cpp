// test_records.cpp - Tests for vocabulary names and structured result records

#include <catch2/catch_all.hpp>
#include <ooxml_fidelity/records.h>
#include <ooxml_fidelity/serialization.h>
#include <ooxml_fidelity/verdict.h>

#include "sample_parts.h"

#include <string>

using namespace ooxml_fidelity;
using Catch::Matchers::ContainsSubstring;

// ============================================================
// Vocabularies
// ============================================================

TEST_CASE("Vocabulary names parse back", "[records][types]") {
    SECTION("document types") {
        for (auto type : all_document_types) {
            REQUIRE(parse_document_type(to_string(type)) == type);
        }
        REQUIRE(to_string(DocumentType::PowerPoint) == "powerpoint");
        REQUIRE_FALSE(parse_document_type("visio").has_value());
    }

    SECTION("diff categories and severities") {
        for (auto category : all_diff_categories) {
            REQUIRE(parse_diff_category(to_string(category)) == category);
        }
        for (auto severity : all_diff_severities) {
            REQUIRE(parse_diff_severity(to_string(severity)) == severity);
        }
        REQUIRE(to_string(DiffSeverity::Ignorable) == "ignorable");
        REQUIRE_FALSE(parse_diff_severity("CRITICAL").has_value());
    }

    SECTION("carrier kinds and significance") {
        for (auto kind : all_carrier_kinds) {
            REQUIRE(parse_carrier_kind(to_string(kind)) == kind);
        }
        for (auto level : all_significances) {
            REQUIRE(parse_significance(to_string(level)) == level);
        }
        REQUIRE(to_string(CarrierKind::LayoutMaster) == "layout_master");
    }

    SECTION("change types, levels and platforms") {
        for (auto type : all_change_types) {
            REQUIRE(parse_change_type(to_string(type)) == type);
        }
        for (auto level : {ToleranceLevel::Strict, ToleranceLevel::Normal, ToleranceLevel::Lenient,
                           ToleranceLevel::Permissive}) {
            REQUIRE(parse_tolerance_level(to_string(level)) == level);
        }
        for (auto platform : all_platform_types) {
            REQUIRE(parse_platform_type(to_string(platform)) == platform);
        }
        REQUIRE(to_string(ChangeType::FontSubstitution) == "font_substitution");
        REQUIRE(to_string(PlatformType::WpsOffice) == "wps_office");
    }

    SECTION("severity ordering") {
        REQUIRE(at_least(DiffSeverity::Critical, DiffSeverity::Major));
        REQUIRE(at_least(DiffSeverity::Major, DiffSeverity::Major));
        REQUIRE_FALSE(at_least(DiffSeverity::Minor, DiffSeverity::Major));
    }
}

// ============================================================
// Diff records
// ============================================================

TEST_CASE("SemanticDifference record", "[records][diff]") {
    SemanticDifference difference;
    difference.location = "/w:document[1]/w:body[1]/w:p[1]/w:r[1]/w:rPr[1]/w:color[1]/@w:val";
    difference.category = DiffCategory::Modified;
    difference.severity = DiffSeverity::Major;
    difference.description = "Attribute changed";
    difference.old_value = "FF0000";
    difference.context.affects_styling = true;

    const Value record = to_value(difference);
    REQUIRE(record.at("category").as_string() == "modified");
    REQUIRE(record.at("severity").as_string() == "major");
    REQUIRE(record.at("old_value").as_string() == "FF0000");
    REQUIRE(record.contains("new_value"));
    REQUIRE(record.at("new_value").is_null());
    REQUIRE(record.at("context").at("affects_styling").as_bool());
    REQUIRE_FALSE(record.at("context").at("affects_content").as_bool());
}

TEST_CASE("DiffSummary record lists every tag", "[records][diff]") {
    DiffSummary summary;
    summary.total_differences = 1;
    summary.by_category[DiffCategory::Dropped] = 1;

    const Value record = to_value(summary);
    REQUIRE(record.at("by_category").size() == all_diff_categories.size());
    REQUIRE(record.at("by_category").at("dropped").as_int64() == 1);
    REQUIRE(record.at("by_category").at("added").as_int64() == 0);
    REQUIRE(record.at("by_severity").size() == all_diff_severities.size());
    REQUIRE(record.at("preservation_rate").as_number() == 100.0);
    REQUIRE(record.at("critical_changes").is_vector());
}

TEST_CASE("DiffResult record from a real comparison", "[records][diff]") {
    SemanticDiffEngine engine;
    const auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocumentBlueHeading,
                                                   DocumentType::Word);
    const Value record = to_value(result);

    REQUIRE(record.at("differences").size() == result.differences.size());
    REQUIRE(record.at("parse_error").is_null());
    REQUIRE(record.at("summary").at("comparable_units").as_int64() == 25);

    SECTION("unreadable input keeps the error") {
        const auto broken = engine.analyze_differences(samples::kMalformed, samples::kWordDocument,
                                                       DocumentType::Word);
        REQUIRE(to_value(broken).at("parse_error").is_string());
    }
}

// ============================================================
// Tolerance and report records
// ============================================================

TEST_CASE("ToleranceEvaluation record", "[records][tolerance]") {
    ToleranceConfiguration config;
    std::vector<ChangeRecord> changes{
        {ChangeType::ContentLoss, "/w:document[1]/w:body[1]/w:p[2]", DiffSeverity::Critical, "Element dropped"},
    };
    const auto evaluation = evaluate_changes(changes, config.profile("strict"), std::size_t{25});
    const Value record = to_value(evaluation);

    REQUIRE_FALSE(record.at("passed").as_bool());
    REQUIRE(record.at("profile_used").as_string() == "strict");
    REQUIRE(record.at("total_changes").as_int64() == 1);
    REQUIRE(record.at("changes_by_type").size() == all_change_types.size());
    REQUIRE(record.at("changes_by_type").at("content_loss").size() == 1);
    REQUIRE(record.at("changes_by_type").at("resolution_loss").size() == 0);

    const Value violation = record.at("rule_violations").at(std::size_t{0});
    REQUIRE(violation.at("rule").at("change_type").as_string() == "content_loss");
    REQUIRE(violation.at("rule").at("max_absolute").as_int64() == 0);
    REQUIRE(violation.at("rule").at("location_pattern").is_null());
    REQUIRE(violation.at("change_count").as_int64() == 1);
}

TEST_CASE("RoundTripResult record renders as JSON", "[records][verdict]") {
    ToleranceConfiguration config;
    const auto result = check_round_trip(samples::kTheme, samples::kThemeWithoutColors, DocumentType::Word,
                                         RoundTripThresholds{}, "normal", config);
    const Value record = to_value(result);

    REQUIRE(record.at("document_type").as_string() == "word");
    REQUIRE(record.at("platform").as_string() == "microsoft_office");
    REQUIRE(record.at("passed").as_bool() == result.passed());
    REQUIRE(record.at("thresholds").at("critical_threshold").as_number() == 90.0);
    REQUIRE(record.at("carriers").at("preservation_metrics").at("lost_tokens").as_int64() == 3);

    const Value report = record.at("report");
    REQUIRE(report.at("carrier_results").size() == all_carrier_kinds.size());
    REQUIRE(report.at("carrier_results").at("color_scheme").at("category").as_string() == "critical");
    REQUIRE(report.at("test_configuration").at("tolerance_profile").as_string() == "normal");
    REQUIRE(report.at("overall_metrics").contains("reliability_score"));

    const std::string json = to_json(record);
    REQUIRE_THAT(json, ContainsSubstring("\"verdict\""));
    std::string error;
    const Value parsed = from_json(json, &error);
    REQUIRE(error.empty());
    REQUIRE(parsed.at("report").at("report_id").as_string() == "round_trip_word");
}
