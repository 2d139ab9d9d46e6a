// compatibility.cpp - Platform batches, per-kind statistics and report assembly

#include <ooxml_fidelity/compatibility.h>
#include <ooxml_fidelity/log.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <system_error>

namespace ooxml_fidelity {

namespace {

constexpr double kPlatformPassRate = 75.0;
constexpr double kStableRate = 90.0;
constexpr double kWarningRate = 75.0;
constexpr double kPoorPlatformRate = 70.0;
constexpr double kFailingCarrierRate = 50.0;
constexpr double kCriticalCarrierRate = 80.0;

std::string format_rate(double rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << rate << "%";
    return oss.str();
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

PlatformResult run_job(const PlatformJob& job, const CarrierAnalyzer& analyzer) {
    PlatformResult result;
    result.platform = job.platform;
    result.platform_version = job.platform_version;
    result.document_type = job.document_type;

    auto comparison = analyzer.compare_carriers(job.original_bytes, job.converted_bytes, job.document_type);
    if (comparison.original_analysis.parse_error) {
        result.error = "original document unreadable: " + *comparison.original_analysis.parse_error;
    } else if (comparison.converted_analysis.parse_error) {
        result.error = "converted document unreadable: " + *comparison.converted_analysis.parse_error;
    } else {
        result.comparison = std::move(comparison);
    }
    return result;
}

PlatformResult failed_job(const PlatformJob& job, std::string error) {
    PlatformResult result;
    result.platform = job.platform;
    result.platform_version = job.platform_version;
    result.document_type = job.document_type;
    result.error = std::move(error);
    return result;
}

/// Highest significance among the catalog mappings of a kind
Significance kind_category(const CarrierCatalog& catalog, CarrierKind kind) {
    Significance best = Significance::Cosmetic;
    for (const auto& mapping : catalog.mappings()) {
        if (mapping.carrier_kind == kind && mapping.significance < best) {
            best = mapping.significance;
        }
    }
    return best;
}

} // anonymous namespace

// ============================================================
// Batch execution
// ============================================================

std::vector<PlatformResult> run_platform_batch(std::vector<PlatformJob> jobs, const CarrierAnalyzer& analyzer) {
    std::vector<std::optional<std::future<PlatformResult>>> pending;
    std::vector<PlatformResult> results(jobs.size());
    pending.reserve(jobs.size());

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        try {
            pending.emplace_back(std::async(std::launch::async,
                                            [&analyzer, &job = jobs[i]] { return run_job(job, analyzer); }));
        } catch (const std::system_error& e) {
            detail::log_input_error("run_platform_batch", to_string(jobs[i].platform), e.what());
            results[i] = failed_job(jobs[i], std::string("could not start analysis: ") + e.what());
            pending.emplace_back(std::nullopt);
        }
    }

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        if (!pending[i]) {
            continue;
        }
        try {
            results[i] = pending[i]->get();
        } catch (const std::exception& e) {
            results[i] = failed_job(jobs[i], std::string("analysis failed: ") + e.what());
        }
        if (results[i].error) {
            detail::log_input_error("run_platform_batch", to_string(jobs[i].platform), *results[i].error);
        }
    }
    return results;
}

// ============================================================
// Collection
// ============================================================

std::vector<PlatformCompatibility> collect_platform_results(const std::vector<PlatformResult>& results) {
    std::vector<PlatformCompatibility> platforms;

    for (const auto& result : results) {
        if (!result.comparison) {
            continue;
        }
        auto it = std::find_if(platforms.begin(), platforms.end(), [&](const PlatformCompatibility& p) {
            return p.platform == result.platform && p.document_format == result.document_type;
        });
        if (it == platforms.end()) {
            PlatformCompatibility fresh;
            fresh.platform = result.platform;
            fresh.version = result.platform_version;
            fresh.document_format = result.document_type;
            platforms.push_back(std::move(fresh));
            it = std::prev(platforms.end());
        }

        const auto& metrics = result.comparison->preservation_metrics;
        it->total_carriers += metrics.total_original_tokens;
        it->preserved_carriers += metrics.preserved_tokens;
        it->modified_carriers += metrics.modified_tokens;
        it->lost_carriers += metrics.lost_tokens;
        if (it->total_carriers > 0) {
            it->survival_rate = std::clamp(100.0 * static_cast<double>(it->preserved_carriers) /
                                               static_cast<double>(it->total_carriers),
                                           0.0, 100.0);
        }
        const auto& failures = result.comparison->converted_analysis.critical_failures;
        it->critical_failures.insert(it->critical_failures.end(), failures.begin(), failures.end());
    }
    return platforms;
}

std::map<CarrierKind, CarrierCompatibility> collect_carrier_results(const std::vector<PlatformResult>& results,
                                                                    const CarrierCatalog& catalog) {
    std::map<CarrierKind, CarrierCompatibility> carriers;
    for (auto kind : all_carrier_kinds) {
        CarrierCompatibility compat;
        compat.carrier_kind = kind;
        compat.category = kind_category(catalog, kind);
        carriers.emplace(kind, std::move(compat));
    }

    auto record = [&](PlatformType platform, const std::string& token_path, bool survived) {
        const CarrierMapping* mapping = catalog.find_by_token(token_path);
        if (!mapping) {
            return;
        }
        auto& compat = carriers[mapping->carrier_kind];
        ++compat.total_tests;
        if (survived) {
            ++compat.successful_tests;
        }
        auto [it, inserted] = compat.platform_results.emplace(platform, survived);
        if (!inserted) {
            it->second = it->second && survived;
        }
        if (!survived) {
            const std::string reason = "Lost on " + std::string(to_string(platform));
            if (std::find(compat.common_failures.begin(), compat.common_failures.end(), reason) ==
                compat.common_failures.end()) {
                compat.common_failures.push_back(reason);
            }
        }
    };

    for (const auto& result : results) {
        if (!result.comparison) {
            continue;
        }
        const auto& changes = result.comparison->token_changes;
        for (const auto& [path, value] : changes.preserved) record(result.platform, path, true);
        for (const auto& [path, value] : changes.modified) record(result.platform, path, true);
        for (const auto& [path, value] : changes.lost) record(result.platform, path, false);
    }
    return carriers;
}

// ============================================================
// Report
// ============================================================

namespace {

std::map<std::string, double> overall_metrics(const std::vector<PlatformCompatibility>& platforms,
                                              const std::map<CarrierKind, CarrierCompatibility>& carriers) {
    std::map<std::string, double> metrics{
        {metric_names::overall_survival_rate, 0.0},
        {metric_names::best_platform_rate, 0.0},
        {metric_names::worst_platform_rate, 0.0},
        {metric_names::platform_variance, 0.0},
        {metric_names::critical_carrier_success, 0.0},
        {metric_names::overall_carrier_success, 0.0},
        {metric_names::reliability_score, 0.0},
    };

    if (!platforms.empty()) {
        std::vector<double> rates;
        std::size_t failing = 0;
        for (const auto& p : platforms) {
            rates.push_back(p.survival_rate);
            if (!p.critical_failures.empty()) ++failing;
        }
        const auto [worst, best] = std::minmax_element(rates.begin(), rates.end());
        metrics[metric_names::overall_survival_rate] = mean(rates);
        metrics[metric_names::best_platform_rate] = *best;
        metrics[metric_names::worst_platform_rate] = *worst;
        metrics[metric_names::platform_variance] = *best - *worst;
        metrics[metric_names::reliability_score] =
            100.0 * static_cast<double>(platforms.size() - failing) / static_cast<double>(platforms.size());
    }

    std::vector<double> critical, tested;
    for (const auto& [kind, c] : carriers) {
        if (c.total_tests == 0) continue;
        tested.push_back(c.success_rate());
        if (c.category == Significance::Critical) critical.push_back(c.success_rate());
    }
    metrics[metric_names::critical_carrier_success] = mean(critical);
    metrics[metric_names::overall_carrier_success] = mean(tested);
    return metrics;
}

CarrierMatrix build_carrier_matrix(const std::vector<PlatformCompatibility>& platforms,
                                   const std::map<CarrierKind, CarrierCompatibility>& carriers,
                                   const CarrierCatalog& catalog) {
    std::set<PlatformType> tested_platforms;
    for (const auto& p : platforms) tested_platforms.insert(p.platform);

    CarrierMatrix matrix;
    for (const auto& [kind, carrier] : carriers) {
        auto& tokens = matrix.design_token_mapping[kind];
        for (const auto& mapping : catalog.mappings()) {
            if (mapping.carrier_kind == kind &&
                std::find(tokens.begin(), tokens.end(), mapping.design_token_path) == tokens.end()) {
                tokens.push_back(mapping.design_token_path);
            }
        }

        auto& rates = matrix.carrier_survival_rates[kind];
        auto& passes = matrix.platform_carrier_matrix[kind];
        std::size_t supported = 0;
        for (auto platform : tested_platforms) {
            double rate = 0.0;
            if (carrier.total_tests > 0) {
                auto it = carrier.platform_results.find(platform);
                rate = (it != carrier.platform_results.end() && it->second) ? carrier.success_rate() : 0.0;
            }
            rates[platform] = rate;
            passes[platform] = rate >= kPlatformPassRate;
            if (passes[platform]) ++supported;
        }

        const double success = carrier.success_rate();
        if (carrier.category == Significance::Critical) {
            if (success >= kStableRate) {
                matrix.critical_carrier_status[kind] = "stable";
            } else if (success >= kWarningRate) {
                matrix.critical_carrier_status[kind] = "warning";
            } else {
                matrix.critical_carrier_status[kind] = "critical";
            }
        } else {
            matrix.critical_carrier_status[kind] = "non-critical";
        }

        const std::size_t total = tested_platforms.size();
        if (success >= kStableRate && supported == total) {
            matrix.risk_assessment[kind] = "low";
        } else if (success >= kWarningRate && static_cast<double>(supported) >= 0.7 * static_cast<double>(total)) {
            matrix.risk_assessment[kind] = "medium";
        } else {
            matrix.risk_assessment[kind] = "high";
        }
    }
    return matrix;
}

std::string grade_for(double rate) {
    if (rate >= 90.0) return "Excellent";
    if (rate >= 75.0) return "Good";
    if (rate >= 60.0) return "Fair";
    return "Poor";
}

std::string build_summary(const std::map<std::string, double>& metrics) {
    const double overall = metrics.at(metric_names::overall_survival_rate);
    const std::string grade = grade_for(overall);
    std::string lower = grade;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::ostringstream oss;
    oss << "Compatibility Analysis Summary:\n\n"
        << "Overall Design Token Survival Rate: " << format_rate(overall) << " (" << grade << ")\n"
        << "Critical Carrier Success Rate: " << format_rate(metrics.at(metric_names::critical_carrier_success)) << "\n"
        << "Platform Reliability Score: " << format_rate(metrics.at(metric_names::reliability_score)) << "\n\n"
        << "The design system shows " << lower << " compatibility across tested platforms.";
    return oss.str();
}

std::vector<std::string> build_recommendations(const std::vector<PlatformCompatibility>& platforms,
                                               const std::map<CarrierKind, CarrierCompatibility>& carriers) {
    std::vector<std::string> out;
    for (const auto& p : platforms) {
        if (p.survival_rate < kPoorPlatformRate) {
            out.push_back("Consider optimizing templates for " + std::string(to_string(p.platform)) +
                          " (current survival rate: " + format_rate(p.survival_rate) + ")");
        }
    }
    for (const auto& [kind, c] : carriers) {
        if (c.total_tests > 0 && c.success_rate() < kFailingCarrierRate) {
            out.push_back("Review " + std::string(to_string(kind)) + " implementation (success rate: " +
                          format_rate(c.success_rate()) + ")");
        }
    }
    for (const auto& [kind, c] : carriers) {
        if (c.category == Significance::Critical && c.total_tests > 0 && c.success_rate() < kCriticalCarrierRate) {
            out.push_back("CRITICAL: Fix " + std::string(to_string(kind)) + " compatibility issues (success rate: " +
                          format_rate(c.success_rate()) + ")");
        }
    }
    if (out.empty()) {
        out.push_back("Compatibility looks good across all tested platforms and carriers.");
    }
    return out;
}

} // anonymous namespace

CompatibilityReport generate_matrix(std::vector<PlatformCompatibility> platform_results,
                                    std::map<CarrierKind, CarrierCompatibility> carrier_results,
                                    const ReportConfiguration& configuration,
                                    const CarrierCatalog& catalog) {
    for (auto kind : all_carrier_kinds) {
        if (carrier_results.find(kind) == carrier_results.end()) {
            CarrierCompatibility compat;
            compat.carrier_kind = kind;
            compat.category = kind_category(catalog, kind);
            carrier_results.emplace(kind, std::move(compat));
        }
    }

    CompatibilityReport report;
    report.report_id = configuration.report_id;
    report.test_configuration = configuration;
    report.overall_metrics = overall_metrics(platform_results, carrier_results);
    report.carrier_matrix = build_carrier_matrix(platform_results, carrier_results, catalog);
    report.summary = build_summary(report.overall_metrics);
    report.recommendations = build_recommendations(platform_results, carrier_results);
    report.platform_results = std::move(platform_results);
    report.carrier_results = std::move(carrier_results);
    return report;
}

CompatibilityReport build_compatibility_report(const std::vector<PlatformResult>& results,
                                               const ReportConfiguration& configuration,
                                               const CarrierCatalog& catalog) {
    auto report = generate_matrix(collect_platform_results(results), collect_carrier_results(results, catalog),
                                  configuration, catalog);
    for (const auto& result : results) {
        if (result.error) {
            report.input_errors.push_back(std::string(to_string(result.platform)) + ": " + *result.error);
        }
    }
    return report;
}

} // namespace ooxml_fidelity
