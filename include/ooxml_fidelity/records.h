// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file records.h
/// @brief Structured-record form of every result type.
///
/// Field names are stable; report renderers and persisted files key on them.
/// Enum values are written as their lowercase names (types.h), maps keyed by
/// an enum always list every tag, and optional fields are written as null.
///
/// @code
///   auto result = SemanticDiffEngine{}.analyze_differences(before, after);
///   std::string json = to_json(to_value(result.summary));
/// @endcode

#pragma once

#include "api.h"
#include "carrier_analyzer.h"
#include "compatibility.h"
#include "semantic_diff.h"
#include "tolerance.h"
#include "value.h"
#include "verdict.h"

namespace ooxml_fidelity {

// Diff engine
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const SemanticDifference& difference);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const DiffSummary& summary);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const DiffResult& result);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const PreservationMetrics& metrics);

// Carriers
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const CarrierAnalysisResult& result);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const CarrierComparison& comparison);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const CriticalCarrierSurvival& survival);

// Tolerance
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const ChangeRecord& change);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const ToleranceEvaluation& evaluation);

// Aggregation
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const PlatformCompatibility& platform);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const CarrierCompatibility& carrier);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const CompatibilityReport& report);

// Verdict
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const ThresholdVerdict& verdict);
[[nodiscard]] OOXML_FIDELITY_API Value to_value(const RoundTripResult& result);

} // namespace ooxml_fidelity
