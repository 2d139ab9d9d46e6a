// records.cpp - Structured-record form of result types

#include <ooxml_fidelity/records.h>
#include <ooxml_fidelity/builders.h>

namespace ooxml_fidelity {

namespace {

Value string_list(const std::vector<std::string>& items) {
    VectorBuilder builder;
    for (const auto& item : items) {
        builder.push_back(item);
    }
    return builder.finish();
}

template <typename T>
Value record_list(const std::vector<T>& items) {
    VectorBuilder builder;
    for (const auto& item : items) {
        builder.push_back(to_value(item));
    }
    return builder.finish();
}

Value rule_value(const ToleranceRule& rule) {
    return MapBuilder()
        .set("change_type", to_string(rule.change_type))
        .set_optional("max_absolute", rule.max_absolute)
        .set_optional("max_percentage", rule.max_percentage)
        .set_optional("location_pattern", rule.location_pattern)
        .set("description", rule.description)
        .finish();
}

Value violation_value(const RuleViolation& violation) {
    return MapBuilder()
        .set("rule", rule_value(violation.rule))
        .set("change_count", violation.change_count)
        .set("total_count", violation.total_count)
        .set("measured_percentage", violation.measured_percentage)
        .finish();
}

Value detected_value(const DetectedCarrier& carrier) {
    MapBuilder builder;
    if (carrier.mapping) {
        builder.set("carrier_kind", to_string(carrier.mapping->carrier_kind))
            .set("significance", to_string(carrier.mapping->significance))
            .set("design_token_path", carrier.mapping->design_token_path);
    }
    builder.set("location", carrier.location).set_optional("value", carrier.value);
    return builder.finish();
}

Value mapping_value(const CarrierMapping& mapping) {
    return MapBuilder()
        .set("location_pattern", mapping.location_pattern)
        .set("carrier_kind", to_string(mapping.carrier_kind))
        .set("significance", to_string(mapping.significance))
        .set("design_token_path", mapping.design_token_path)
        .set("description", mapping.description)
        .finish();
}

Value token_info_value(const CarrierTokenInfo& info) {
    return MapBuilder()
        .set("carrier_kind", to_string(info.carrier_kind))
        .set("token_path", info.token_path)
        .set_optional("value", info.value)
        .set("description", info.description)
        .finish();
}

Value string_map(const std::map<std::string, std::string>& entries) {
    MapBuilder builder;
    for (const auto& [key, value] : entries) {
        builder.set(key, value);
    }
    return builder.finish();
}

Value token_changes_value(const TokenChanges& changes) {
    MapBuilder modified;
    for (const auto& [path, change] : changes.modified) {
        modified.set(path, MapBuilder()
                               .set("original", change.original)
                               .set("converted", change.converted)
                               .finish());
    }
    return MapBuilder()
        .set("preserved", string_map(changes.preserved))
        .set("modified", modified.finish())
        .set("lost", string_map(changes.lost))
        .set("gained", string_map(changes.gained))
        .finish();
}

Value carrier_metrics_value(const CarrierPreservationMetrics& metrics) {
    return MapBuilder()
        .set("total_original_tokens", metrics.total_original_tokens)
        .set("preserved_tokens", metrics.preserved_tokens)
        .set("modified_tokens", metrics.modified_tokens)
        .set("lost_tokens", metrics.lost_tokens)
        .set("gained_tokens", metrics.gained_tokens)
        .set("preservation_rate", metrics.preservation_rate)
        .set("modification_rate", metrics.modification_rate)
        .set("loss_rate", metrics.loss_rate)
        .set("change_ratio", metrics.change_ratio)
        .finish();
}

Value configuration_value(const ReportConfiguration& configuration) {
    VectorBuilder platforms;
    for (auto platform : configuration.platforms) {
        platforms.push_back(to_string(platform));
    }
    MapBuilder builder;
    builder.set("report_id", configuration.report_id)
        .set("tolerance_profile", configuration.tolerance_profile)
        .set("platforms", platforms.finish());
    if (configuration.document_type) {
        builder.set("document_type", to_string(*configuration.document_type));
    } else {
        builder.set("document_type", Value{});
    }
    return builder.finish();
}

template <typename T, typename F>
Value platform_map(const std::map<PlatformType, T>& entries, F&& convert) {
    MapBuilder builder;
    for (const auto& [platform, value] : entries) {
        builder.set(std::string(to_string(platform)), convert(value));
    }
    return builder.finish();
}

Value matrix_value(const CarrierMatrix& matrix) {
    MapBuilder rates, passing, status, tokens, risk;
    for (const auto& [kind, per_platform] : matrix.carrier_survival_rates) {
        rates.set(std::string(to_string(kind)),
                  platform_map(per_platform, [](double rate) { return Value{rate}; }));
    }
    for (const auto& [kind, per_platform] : matrix.platform_carrier_matrix) {
        passing.set(std::string(to_string(kind)),
                    platform_map(per_platform, [](bool ok) { return Value{ok}; }));
    }
    for (const auto& [kind, text] : matrix.critical_carrier_status) {
        status.set(std::string(to_string(kind)), text);
    }
    for (const auto& [kind, paths] : matrix.design_token_mapping) {
        tokens.set(std::string(to_string(kind)), string_list(paths));
    }
    for (const auto& [kind, text] : matrix.risk_assessment) {
        risk.set(std::string(to_string(kind)), text);
    }
    return MapBuilder()
        .set("carrier_survival_rates", rates.finish())
        .set("platform_carrier_matrix", passing.finish())
        .set("critical_carrier_status", status.finish())
        .set("design_token_mapping", tokens.finish())
        .set("risk_assessment", risk.finish())
        .finish();
}

} // anonymous namespace

// ============================================================
// Diff engine
// ============================================================

Value to_value(const SemanticDifference& difference) {
    return MapBuilder()
        .set("location", difference.location)
        .set("category", to_string(difference.category))
        .set("severity", to_string(difference.severity))
        .set("description", difference.description)
        .set_optional("old_value", difference.old_value)
        .set_optional("new_value", difference.new_value)
        .set("context", MapBuilder()
                            .set("affects_content", difference.context.affects_content)
                            .set("affects_styling", difference.context.affects_styling)
                            .set("affects_structure", difference.context.affects_structure)
                            .finish())
        .finish();
}

Value to_value(const DiffSummary& summary) {
    MapBuilder by_category;
    for (auto category : all_diff_categories) {
        auto it = summary.by_category.find(category);
        by_category.set(std::string(to_string(category)),
                        it != summary.by_category.end() ? it->second : std::size_t{0});
    }
    MapBuilder by_severity;
    for (auto severity : all_diff_severities) {
        auto it = summary.by_severity.find(severity);
        by_severity.set(std::string(to_string(severity)),
                        it != summary.by_severity.end() ? it->second : std::size_t{0});
    }
    return MapBuilder()
        .set("total_differences", summary.total_differences)
        .set("by_category", by_category.finish())
        .set("by_severity", by_severity.finish())
        .set("critical_changes", record_list(summary.critical_changes))
        .set("preservation_rate", summary.preservation_rate)
        .set("comparable_units", summary.comparable_units)
        .set("affected_units", summary.affected_units)
        .finish();
}

Value to_value(const DiffResult& result) {
    return MapBuilder()
        .set("differences", record_list(result.differences))
        .set("summary", to_value(result.summary))
        .set_optional("parse_error", result.parse_error)
        .finish();
}

Value to_value(const PreservationMetrics& metrics) {
    return MapBuilder()
        .set("overall_preservation", metrics.overall_preservation)
        .set("content_preservation", metrics.content_preservation)
        .set("style_preservation", metrics.style_preservation)
        .set("structure_preservation", metrics.structure_preservation)
        .set("change_ratio", metrics.change_ratio)
        .finish();
}

// ============================================================
// Carriers
// ============================================================

Value to_value(const CarrierAnalysisResult& result) {
    VectorBuilder detected;
    for (const auto& carrier : result.detected_carriers) {
        detected.push_back(detected_value(carrier));
    }
    VectorBuilder missing;
    for (const auto* mapping : result.missing_carriers) {
        missing.push_back(mapping_value(*mapping));
    }
    MapBuilder breakdown;
    for (auto level : all_significances) {
        CategoryStats stats;
        if (auto it = result.category_breakdown.find(level); it != result.category_breakdown.end()) {
            stats = it->second;
        }
        breakdown.set(std::string(to_string(level)), MapBuilder()
                                                         .set("detected", stats.detected)
                                                         .set("missing", stats.missing)
                                                         .set("total", stats.total)
                                                         .set("survival_rate", stats.survival_rate)
                                                         .finish());
    }
    return MapBuilder()
        .set("detected_carriers", detected.finish())
        .set("missing_carriers", missing.finish())
        .set("survival_rate", result.survival_rate)
        .set("critical_failures", string_list(result.critical_failures))
        .set("category_breakdown", breakdown.finish())
        .set_optional("parse_error", result.parse_error)
        .finish();
}

Value to_value(const CarrierComparison& comparison) {
    return MapBuilder()
        .set("original_analysis", to_value(comparison.original_analysis))
        .set("converted_analysis", to_value(comparison.converted_analysis))
        .set("preservation_metrics", carrier_metrics_value(comparison.preservation_metrics))
        .set("token_changes", token_changes_value(comparison.token_changes))
        .finish();
}

Value to_value(const CriticalCarrierSurvival& survival) {
    VectorBuilder detected;
    for (const auto& info : survival.detected_tokens) {
        detected.push_back(token_info_value(info));
    }
    VectorBuilder missing;
    for (const auto& info : survival.missing_tokens) {
        missing.push_back(token_info_value(info));
    }
    return MapBuilder()
        .set("detected_count", survival.detected_count)
        .set("missing_count", survival.missing_count)
        .set("survival_rate", survival.survival_rate)
        .set("detected_tokens", detected.finish())
        .set("missing_tokens", missing.finish())
        .finish();
}

// ============================================================
// Tolerance
// ============================================================

Value to_value(const ChangeRecord& change) {
    return MapBuilder()
        .set("type", to_string(change.type))
        .set("location", change.location)
        .set("severity", to_string(change.severity))
        .set("description", change.description)
        .finish();
}

Value to_value(const ToleranceEvaluation& evaluation) {
    VectorBuilder violations;
    for (const auto& violation : evaluation.rule_violations) {
        violations.push_back(violation_value(violation));
    }
    MapBuilder by_type;
    for (auto type : all_change_types) {
        auto it = evaluation.changes_by_type.find(type);
        by_type.set(std::string(to_string(type)),
                    it != evaluation.changes_by_type.end() ? record_list(it->second)
                                                           : VectorBuilder().finish());
    }
    return MapBuilder()
        .set("passed", evaluation.passed)
        .set("profile_used", evaluation.profile_used)
        .set("total_changes", evaluation.total_changes)
        .set("critical_violations", record_list(evaluation.critical_violations))
        .set("rule_violations", violations.finish())
        .set("ignored_changes", record_list(evaluation.ignored_changes))
        .set("changes_by_type", by_type.finish())
        .set("summary", evaluation.summary)
        .finish();
}

// ============================================================
// Aggregation
// ============================================================

Value to_value(const PlatformCompatibility& platform) {
    return MapBuilder()
        .set("platform", to_string(platform.platform))
        .set_optional("version", platform.version)
        .set("document_format", to_string(platform.document_format))
        .set("total_carriers", platform.total_carriers)
        .set("preserved_carriers", platform.preserved_carriers)
        .set("modified_carriers", platform.modified_carriers)
        .set("lost_carriers", platform.lost_carriers)
        .set("survival_rate", platform.survival_rate)
        .set("critical_failures", string_list(platform.critical_failures))
        .finish();
}

Value to_value(const CarrierCompatibility& carrier) {
    return MapBuilder()
        .set("carrier_kind", to_string(carrier.carrier_kind))
        .set("category", to_string(carrier.category))
        .set("total_tests", carrier.total_tests)
        .set("successful_tests", carrier.successful_tests)
        .set("success_rate", carrier.success_rate())
        .set("platform_results", platform_map(carrier.platform_results, [](bool ok) { return Value{ok}; }))
        .set("common_failures", string_list(carrier.common_failures))
        .finish();
}

Value to_value(const CompatibilityReport& report) {
    MapBuilder carriers;
    for (const auto& [kind, carrier] : report.carrier_results) {
        carriers.set(std::string(to_string(kind)), to_value(carrier));
    }
    MapBuilder metrics;
    for (const auto& [name, value] : report.overall_metrics) {
        metrics.set(name, value);
    }
    return MapBuilder()
        .set("report_id", report.report_id)
        .set("test_configuration", configuration_value(report.test_configuration))
        .set("platform_results", record_list(report.platform_results))
        .set("carrier_results", carriers.finish())
        .set("carrier_matrix", matrix_value(report.carrier_matrix))
        .set("overall_metrics", metrics.finish())
        .set("summary", report.summary)
        .set("recommendations", string_list(report.recommendations))
        .set("input_errors", string_list(report.input_errors))
        .finish();
}

// ============================================================
// Verdict
// ============================================================

Value to_value(const ThresholdVerdict& verdict) {
    return MapBuilder()
        .set("passed", verdict.passed)
        .set("meets_overall", verdict.meets_overall)
        .set("meets_critical", verdict.meets_critical)
        .set("overall_survival_rate", verdict.overall_survival_rate)
        .set("critical_carrier_success", verdict.critical_carrier_success)
        .set("failure_reasons", string_list(verdict.failure_reasons))
        .finish();
}

Value to_value(const RoundTripResult& result) {
    return MapBuilder()
        .set("document_type", to_string(result.document_type))
        .set("platform", to_string(result.platform))
        .set("thresholds", MapBuilder()
                               .set("fail_threshold", result.thresholds.fail_threshold)
                               .set("critical_threshold", result.thresholds.critical_threshold)
                               .finish())
        .set("passed", result.passed())
        .set("verdict", to_value(result.verdict))
        .set("diff_summary", to_value(result.diff.summary))
        .set("tolerance", to_value(result.tolerance))
        .set("carriers", to_value(result.carriers))
        .set("report", to_value(result.report))
        .finish();
}

} // namespace ooxml_fidelity
