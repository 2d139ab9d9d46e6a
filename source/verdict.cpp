// verdict.cpp - Round-trip check, threshold verdict and banner

#include <ooxml_fidelity/verdict.h>
#include <ooxml_fidelity/change_records.h>
#include <ooxml_fidelity/errors.h>

#include <iomanip>
#include <sstream>

namespace ooxml_fidelity {

namespace {

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

void check_threshold(const char* field, double value) {
    if (!(value >= 0.0 && value <= 100.0)) {
        throw ThresholdError(field, value);
    }
}

} // anonymous namespace

void RoundTripThresholds::validate() const {
    check_threshold("fail_threshold", fail_threshold);
    check_threshold("critical_threshold", critical_threshold);
}

ThresholdVerdict evaluate_thresholds(const CompatibilityReport& report, const RoundTripThresholds& thresholds) {
    auto metric = [&](const char* name) {
        auto it = report.overall_metrics.find(name);
        return it != report.overall_metrics.end() ? it->second : 0.0;
    };

    ThresholdVerdict verdict;
    verdict.overall_survival_rate = metric(metric_names::overall_survival_rate);
    verdict.critical_carrier_success = metric(metric_names::critical_carrier_success);
    verdict.meets_overall = verdict.overall_survival_rate >= thresholds.fail_threshold;
    verdict.meets_critical = verdict.critical_carrier_success >= thresholds.critical_threshold;

    if (!verdict.meets_overall) {
        verdict.failure_reasons.push_back("Overall survival rate " + percent(verdict.overall_survival_rate) +
                                          " below threshold " + percent(thresholds.fail_threshold));
    }
    if (!verdict.meets_critical) {
        verdict.failure_reasons.push_back("Critical carrier success " + percent(verdict.critical_carrier_success) +
                                          " below threshold " + percent(thresholds.critical_threshold));
    }
    verdict.passed = verdict.meets_overall && verdict.meets_critical;
    return verdict;
}

RoundTripResult check_round_trip(std::string_view original_bytes, std::string_view converted_bytes,
                                 DocumentType document_type, const RoundTripThresholds& thresholds,
                                 std::string_view profile_name, const ToleranceConfiguration& configuration,
                                 PlatformType platform) {
    thresholds.validate();
    const ToleranceProfile profile = configuration.profile(profile_name);

    RoundTripResult result;
    result.document_type = document_type;
    result.platform = platform;
    result.thresholds = thresholds;

    SemanticDiffEngine engine;
    result.diff = engine.analyze_differences(original_bytes, converted_bytes, document_type);
    result.changes = to_change_records(result.diff.differences);
    result.tolerance = evaluate_changes(result.changes, profile, result.diff.summary.comparable_units);

    CarrierAnalyzer analyzer;
    result.carriers = analyzer.compare_carriers(original_bytes, converted_bytes, document_type);

    PlatformResult platform_result;
    platform_result.platform = platform;
    platform_result.document_type = document_type;
    if (result.diff.parse_error) {
        platform_result.error = *result.diff.parse_error;
    } else {
        platform_result.comparison = result.carriers;
    }

    ReportConfiguration report_config;
    report_config.report_id = "round_trip_" + std::string(to_string(document_type));
    report_config.tolerance_profile = profile.name;
    report_config.platforms = {platform};
    report_config.document_type = document_type;
    result.report = build_compatibility_report({platform_result}, report_config, analyzer.catalog());

    result.verdict = evaluate_thresholds(result.report, thresholds);
    return result;
}

std::string describe_violation(const RuleViolation& violation) {
    const auto& rule = violation.rule;
    std::ostringstream oss;
    oss << to_string(rule.change_type);
    if (rule.location_pattern) {
        oss << " at " << *rule.location_pattern;
    }
    oss << ": " << violation.change_count << " changes (" << percent(violation.measured_percentage)
        << ") exceeds";
    if (rule.max_absolute) {
        oss << " max " << *rule.max_absolute << " changes";
    }
    if (rule.max_absolute && rule.max_percentage) {
        oss << " /";
    }
    if (rule.max_percentage) {
        oss << " " << percent(*rule.max_percentage);
    }
    return oss.str();
}

std::string format_banner(const RoundTripResult& result) {
    std::ostringstream out;
    const std::string rule(60, '=');

    out << rule << "\n";
    if (result.passed()) {
        out << "PASS: all thresholds met (" << to_string(result.document_type) << ", "
            << to_string(result.platform) << ")\n";
    } else {
        out << "FAIL: round trip check failed (" << to_string(result.document_type) << ", "
            << to_string(result.platform) << ")\n";
    }
    out << rule << "\n";
    out << "Overall survival rate:     " << percent(result.verdict.overall_survival_rate)
        << " (threshold " << percent(result.thresholds.fail_threshold) << ")\n";
    out << "Critical carrier success:  " << percent(result.verdict.critical_carrier_success)
        << " (threshold " << percent(result.thresholds.critical_threshold) << ")\n";
    out << "Content preservation:      " << percent(result.diff.summary.preservation_rate) << "\n";
    out << "Tolerance profile:         " << result.tolerance.profile_used << " - " << result.tolerance.summary
        << "\n";

    if (result.diff.parse_error) {
        out << "Unreadable input: " << *result.diff.parse_error << "\n";
    }

    if (!result.passed()) {
        out << "\nViolations:\n";
        for (const auto& reason : result.verdict.failure_reasons) {
            out << "  - " << reason << "\n";
        }
        for (const auto& change : result.tolerance.critical_violations) {
            out << "  - Critical path changed at " << change.location << " (" << to_string(change.severity)
                << "): " << change.description << " (limit: no change allowed)\n";
        }
        for (const auto& violation : result.tolerance.rule_violations) {
            out << "  - " << describe_violation(violation) << "\n";
        }
    }
    return out.str();
}

int exit_code_for(const ThresholdVerdict& verdict, bool exit_on_failure) noexcept {
    return (!verdict.passed && exit_on_failure) ? kExitThresholdFailure : kExitSuccess;
}

int exit_code_for(const RoundTripResult& result, bool exit_on_failure) noexcept {
    return (!result.passed() && exit_on_failure) ? kExitThresholdFailure : kExitSuccess;
}

} // namespace ooxml_fidelity
