// carrier_analyzer.cpp - Carrier scanning, survival breakdown and token comparison

#include <ooxml_fidelity/carrier_analyzer.h>
#include <ooxml_fidelity/location.h>
#include <ooxml_fidelity/xml_reader.h>

#include <boost/algorithm/string/join.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace ooxml_fidelity {

namespace {

double percentage(std::size_t part, std::size_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return std::clamp(100.0 * static_cast<double>(part) / static_cast<double>(whole), 0.0, 100.0);
}

std::map<Significance, CategoryStats> empty_breakdown() {
    std::map<Significance, CategoryStats> breakdown;
    for (auto level : all_significances) {
        breakdown[level] = CategoryStats{};
    }
    return breakdown;
}

/// Present token paths of one analysis, each with its extracted values in match order
std::map<std::string, std::vector<std::string>> token_values(const CarrierAnalysisResult& result) {
    std::map<std::string, std::vector<std::string>> tokens;
    for (const auto& carrier : result.detected_carriers) {
        auto& values = tokens[carrier.mapping->design_token_path];
        if (carrier.value) {
            values.push_back(*carrier.value);
        }
    }
    return tokens;
}

std::string title_case(std::string_view name) {
    std::string out(name);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    }
    return out;
}

} // anonymous namespace

std::size_t CarrierAnalysisResult::detected_mapping_count() const {
    std::set<const CarrierMapping*> distinct;
    for (const auto& carrier : detected_carriers) {
        distinct.insert(carrier.mapping);
    }
    return distinct.size();
}

// ============================================================
// Scanning
// ============================================================

CarrierAnalysisResult CarrierAnalyzer::analyze_carriers(std::string_view document_bytes,
                                                        DocumentType document_type) const {
    std::string error;
    auto doc = parse_document(document_bytes, &error);
    if (!doc) {
        CarrierAnalysisResult result;
        result.category_breakdown = empty_breakdown();
        result.parse_error = std::move(error);
        return result;
    }
    return analyze_carriers(*doc, document_type);
}

CarrierAnalysisResult CarrierAnalyzer::analyze_carriers(const ParsedDocument& doc,
                                                        DocumentType document_type) const {
    CarrierAnalysisResult result;
    result.category_breakdown = empty_breakdown();

    const auto mappings = catalog_->applicable(document_type);
    std::size_t detected_mappings = 0;

    for (const CarrierMapping* mapping : mappings) {
        const auto matches = find_carrier_matches(mapping->pattern, doc);
        auto& stats = result.category_breakdown[mapping->significance];
        if (matches.empty()) {
            result.missing_carriers.push_back(mapping);
            ++stats.missing;
            if (mapping->significance == Significance::Critical) {
                result.critical_failures.push_back(mapping->description);
            }
            continue;
        }

        ++detected_mappings;
        ++stats.detected;
        for (const auto& match : matches) {
            std::string location = node_location(doc, match.node);
            if (match.attribute) {
                location = attribute_location(location, *match.attribute);
            }
            result.detected_carriers.push_back(DetectedCarrier{mapping, std::move(location), match.value});
        }
    }

    for (auto& [level, stats] : result.category_breakdown) {
        stats.total = stats.detected + stats.missing;
        stats.survival_rate = percentage(stats.detected, stats.total);
    }
    result.survival_rate = percentage(detected_mappings, mappings.size());
    return result;
}

// ============================================================
// Comparison
// ============================================================

CarrierComparison CarrierAnalyzer::compare_carriers(std::string_view original_bytes,
                                                    std::string_view converted_bytes,
                                                    DocumentType document_type) const {
    CarrierComparison comparison;
    comparison.original_analysis = analyze_carriers(original_bytes, document_type);
    comparison.converted_analysis = analyze_carriers(converted_bytes, document_type);

    const auto original_tokens = token_values(comparison.original_analysis);
    const auto converted_tokens = token_values(comparison.converted_analysis);

    std::set<std::string> all_paths;
    for (const auto& [path, values] : original_tokens) all_paths.insert(path);
    for (const auto& [path, values] : converted_tokens) all_paths.insert(path);

    auto& changes = comparison.token_changes;
    for (const auto& path : all_paths) {
        auto orig = original_tokens.find(path);
        auto conv = converted_tokens.find(path);
        if (orig != original_tokens.end() && conv != converted_tokens.end()) {
            std::string before = boost::algorithm::join(orig->second, ",");
            std::string after = boost::algorithm::join(conv->second, ",");
            if (before == after) {
                changes.preserved.emplace(path, std::move(before));
            } else {
                changes.modified.emplace(path, TokenValueChange{std::move(before), std::move(after)});
            }
        } else if (orig != original_tokens.end()) {
            changes.lost.emplace(path, boost::algorithm::join(orig->second, ","));
        } else {
            changes.gained.emplace(path, boost::algorithm::join(conv->second, ","));
        }
    }

    auto& metrics = comparison.preservation_metrics;
    metrics.total_original_tokens = original_tokens.size();
    metrics.preserved_tokens = changes.preserved.size();
    metrics.modified_tokens = changes.modified.size();
    metrics.lost_tokens = changes.lost.size();
    metrics.gained_tokens = changes.gained.size();

    const std::size_t baseline = metrics.preserved_tokens + metrics.modified_tokens + metrics.lost_tokens;
    metrics.preservation_rate = percentage(metrics.preserved_tokens, baseline);
    metrics.modification_rate = percentage(metrics.modified_tokens, baseline);
    metrics.loss_rate = percentage(metrics.lost_tokens, baseline);
    metrics.change_ratio =
        static_cast<double>(metrics.modified_tokens + metrics.lost_tokens + metrics.gained_tokens) /
        static_cast<double>(std::max<std::size_t>(all_paths.size(), 1));
    return comparison;
}

CriticalCarrierSurvival get_critical_carrier_survival(const CarrierAnalysisResult& result) {
    CriticalCarrierSurvival survival;

    std::set<const CarrierMapping*> seen;
    for (const auto& carrier : result.detected_carriers) {
        const CarrierMapping* mapping = carrier.mapping;
        if (mapping->significance != Significance::Critical) {
            continue;
        }
        seen.insert(mapping);
        survival.detected_tokens.push_back(CarrierTokenInfo{
            mapping->carrier_kind, mapping->design_token_path, carrier.value, mapping->description});
    }
    for (const CarrierMapping* mapping : result.missing_carriers) {
        if (mapping->significance != Significance::Critical) {
            continue;
        }
        survival.missing_tokens.push_back(CarrierTokenInfo{
            mapping->carrier_kind, mapping->design_token_path, std::nullopt, mapping->description});
    }

    survival.detected_count = seen.size();
    survival.missing_count = survival.missing_tokens.size();
    survival.survival_rate = percentage(survival.detected_count,
                                        survival.detected_count + survival.missing_count);
    return survival;
}

// ============================================================
// Report
// ============================================================

std::string generate_carrier_report(const CarrierComparison& comparison) {
    const auto& metrics = comparison.preservation_metrics;
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);

    out << "Design Token Carrier Analysis\n";
    out << std::string(29, '=') << "\n\n";
    out << "Total Original Tokens: " << metrics.total_original_tokens << "\n";
    out << "Preservation Rate: " << metrics.preservation_rate << "%\n";
    out << "Modification Rate: " << metrics.modification_rate << "%\n";
    out << "Loss Rate: " << metrics.loss_rate << "%\n\n";

    out << "Category Breakdown:\n";
    out << std::string(19, '-') << "\n";
    const auto& original = comparison.original_analysis.category_breakdown;
    const auto& converted = comparison.converted_analysis.category_breakdown;
    for (auto level : all_significances) {
        CategoryStats before, after;
        if (auto it = original.find(level); it != original.end()) before = it->second;
        if (auto it = converted.find(level); it != converted.end()) after = it->second;

        out << title_case(to_string(level)) << ":\n";
        out << "  Original: " << before.detected << "/" << before.total << " carriers\n";
        out << "  Converted: " << after.detected << "/" << after.total << " carriers\n";
        out << "  Survival: " << after.survival_rate << "%\n\n";
    }

    const auto& failures = comparison.converted_analysis.critical_failures;
    if (!failures.empty()) {
        out << "Critical Failures:\n";
        out << std::string(18, '-') << "\n";
        for (const auto& failure : failures) {
            out << "  - " << failure << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace ooxml_fidelity
