// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file verdict.h
/// @brief One-document round-trip check: thresholds, verdict, banner, exit code.
///
/// check_round_trip() runs the whole core for one original/converted pair:
///   1. thresholds and profile name are validated (configuration errors throw)
///   2. semantic diff -> change records -> tolerance evaluation
///   3. carrier comparison -> single-platform compatibility report
///   4. report metrics are checked against the thresholds
///
/// Unreadable documents are not errors here; they show up as a zero report
/// and a failed verdict.

#pragma once

#include "api.h"
#include "carrier_analyzer.h"
#include "compatibility.h"
#include "semantic_diff.h"
#include "tolerance.h"
#include "types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ooxml_fidelity {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitThresholdFailure = 1;
inline constexpr int kExitMissingInput = 2;

struct RoundTripThresholds {
    double fail_threshold = 70.0;      ///< Minimum overall survival rate, [0, 100]
    double critical_threshold = 90.0;  ///< Minimum critical carrier success, [0, 100]

    /// @throws ThresholdError naming the offending field
    void validate() const;
};

struct ThresholdVerdict {
    bool passed = false;
    bool meets_overall = false;
    bool meets_critical = false;
    double overall_survival_rate = 0.0;
    double critical_carrier_success = 0.0;
    std::vector<std::string> failure_reasons;  ///< Measured value and limit for each miss
};

[[nodiscard]] OOXML_FIDELITY_API ThresholdVerdict
evaluate_thresholds(const CompatibilityReport& report, const RoundTripThresholds& thresholds);

struct RoundTripResult {
    DocumentType document_type = DocumentType::Word;
    PlatformType platform = PlatformType::MicrosoftOffice;
    RoundTripThresholds thresholds;
    DiffResult diff;
    std::vector<ChangeRecord> changes;
    ToleranceEvaluation tolerance;
    CarrierComparison carriers;
    CompatibilityReport report;
    ThresholdVerdict verdict;

    /// Thresholds met and tolerance profile satisfied
    [[nodiscard]] bool passed() const noexcept { return verdict.passed && tolerance.passed; }
};

/// @throws ThresholdError, UnknownProfileError before any analysis runs
[[nodiscard]] OOXML_FIDELITY_API RoundTripResult
check_round_trip(std::string_view original_bytes, std::string_view converted_bytes,
                 DocumentType document_type, const RoundTripThresholds& thresholds,
                 std::string_view profile_name, const ToleranceConfiguration& configuration,
                 PlatformType platform = PlatformType::MicrosoftOffice);

/// PASS/FAIL banner. On failure every missed threshold, critical-path
/// violation and rule violation is listed with its measured value and limit.
[[nodiscard]] OOXML_FIDELITY_API std::string format_banner(const RoundTripResult& result);

/// One line per violated tolerance rule, e.g.
/// "formatting_loss: 20 changes (20.0%) exceeds max 10 changes / 5.0%"
[[nodiscard]] OOXML_FIDELITY_API std::string describe_violation(const RuleViolation& violation);

/// 0 on a normal run; 1 when the check failed and `exit_on_failure` is set
[[nodiscard]] OOXML_FIDELITY_API int exit_code_for(const ThresholdVerdict& verdict, bool exit_on_failure) noexcept;
[[nodiscard]] OOXML_FIDELITY_API int exit_code_for(const RoundTripResult& result, bool exit_on_failure) noexcept;

} // namespace ooxml_fidelity
