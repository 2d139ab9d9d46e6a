// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tolerance.h
/// @brief Tolerance profiles, the profile registry, and change evaluation.
///
/// A ToleranceProfile is a plain value: name, level, numeric rules per change
/// type, plus critical and ignorable location patterns (location.h syntax).
///
/// ToleranceConfiguration owns the registry of named profiles. The registry is
/// an immer::map held in a lager store; every change is a dispatched action and
/// the reducer returns a new map, so a snapshot() taken earlier never observes
/// later changes. Four built-in profiles are registered on construction:
///
///   strict      zero content loss, formatting capped at 10 changes / 5%
///   normal      zero content loss, moderate formatting/color/spacing budgets
///   lenient     small content-loss budget, formatting up to 30%
///   permissive  no critical paths, widest ignorable set
///
/// Built-ins can be adjusted but never removed, and a custom profile may not
/// take a built-in's name.
///
/// Lookups and evaluations copy the registry under a shared lock, so readers
/// on other threads are never invalidated by create_custom_profile,
/// load_profile or remove_profile. Every lookup returns profiles by value.
/// Concurrent adjust_tolerance calls on the same profile name must still be
/// serialized by the caller.

#pragma once

#include "api.h"
#include "types.h"
#include "value.h"

#include <immer/map.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ooxml_fidelity {

// ============================================================
// Rules and profiles
// ============================================================

struct ToleranceRule {
    ChangeType change_type = ChangeType::FormattingLoss;
    std::optional<std::int64_t> max_absolute;    ///< Unset: no absolute ceiling
    std::optional<double> max_percentage;        ///< Unset: no percentage ceiling; [0, 100]
    std::optional<std::string> location_pattern; ///< Restricts the rule to matching locations
    std::string description;

    /// Both configured limits must hold
    [[nodiscard]] bool is_within_tolerance(std::size_t change_count, std::size_t total_count) const noexcept;

    bool operator==(const ToleranceRule&) const = default;
};

struct ToleranceProfile {
    std::string name;
    ToleranceLevel level = ToleranceLevel::Normal;
    std::vector<ToleranceRule> rules;
    std::set<std::string> critical_paths;
    std::set<std::string> ignorable_paths;

    [[nodiscard]] bool is_critical_path(std::string_view location) const;
    [[nodiscard]] bool is_ignorable_path(std::string_view location) const;

    /// First rule for `type`, or nullptr
    [[nodiscard]] const ToleranceRule* find_rule(ChangeType type) const noexcept;

    bool operator==(const ToleranceProfile&) const = default;
};

/// The four default profiles, in strict..permissive order
[[nodiscard]] OOXML_FIDELITY_API std::vector<ToleranceProfile> builtin_profiles();

// ============================================================
// Evaluation
// ============================================================

/// One change to judge
struct ChangeRecord {
    ChangeType type = ChangeType::FormattingLoss;
    std::string location;
    DiffSeverity severity = DiffSeverity::Minor;
    std::string description;

    bool operator==(const ChangeRecord&) const = default;
};

struct RuleViolation {
    ToleranceRule rule;
    std::size_t change_count = 0;
    std::size_t total_count = 0;        ///< Denominator used for the percentage
    double measured_percentage = 0.0;
};

struct ToleranceEvaluation {
    bool passed = true;
    std::string profile_used;
    std::size_t total_changes = 0;      ///< Every change passed in, ignored ones included
    std::vector<ChangeRecord> critical_violations;
    std::vector<RuleViolation> rule_violations;
    std::vector<ChangeRecord> ignored_changes;
    std::map<ChangeType, std::vector<ChangeRecord>> changes_by_type;  ///< Every type present
    std::string summary;
};

/// Evaluate changes against a profile.
///
/// Ignorable paths are tested first and take the change out of every count.
/// A CRITICAL change on a critical path is a violation by itself. Everything
/// else is counted per change type and checked against the rules. Color,
/// font and spacing changes are counted under the FormattingLoss rule when
/// the profile has no rule for their own type.
/// @param total_elements Percentage denominator; the number of changes when absent
[[nodiscard]] OOXML_FIDELITY_API ToleranceEvaluation
evaluate_changes(const std::vector<ChangeRecord>& changes, const ToleranceProfile& profile,
                 std::optional<std::size_t> total_elements = std::nullopt);

/// Recommended profile for a document type and usage ("production", "draft",
/// "test", "analysis"); "normal" for anything not in the table
[[nodiscard]] OOXML_FIDELITY_API std::string
get_recommended_profile(DocumentType document_type, std::string_view usage_context);

// ============================================================
// Persistence
// ============================================================

/// Record with fields name, level, rules, critical_paths, ignorable_paths
[[nodiscard]] OOXML_FIDELITY_API Value profile_to_value(const ToleranceProfile& profile);

/// @throws ProfileFormatError for a missing or mistyped field
[[nodiscard]] OOXML_FIDELITY_API ToleranceProfile profile_from_value(const Value& record);

[[nodiscard]] OOXML_FIDELITY_API std::string profile_to_json(const ToleranceProfile& profile);

/// @throws ProfileFormatError for invalid JSON or an invalid record
[[nodiscard]] OOXML_FIDELITY_API ToleranceProfile profile_from_json(const std::string& json);

// ============================================================
// Registry state (lager model, actions, reducer)
// ============================================================

using ProfileRegistry = immer::map<std::string, ToleranceProfile>;

struct ToleranceModel {
    ProfileRegistry profiles;

    bool operator==(const ToleranceModel& other) const { return profiles == other.profiles; }
    bool operator!=(const ToleranceModel& other) const { return !(*this == other); }
};

namespace tolerance_actions {

/// Insert or replace a profile under its name
struct PutProfile {
    ToleranceProfile profile;
};

/// Change (or add) the rule for one change type; unset limits stay as they are
struct AdjustRule {
    std::string profile_name;
    ChangeType change_type;
    std::optional<double> max_percentage;
    std::optional<std::int64_t> max_absolute;
};

struct RemoveProfile {
    std::string profile_name;
};

} // namespace tolerance_actions

using ToleranceAction = std::variant<tolerance_actions::PutProfile,
                                     tolerance_actions::AdjustRule,
                                     tolerance_actions::RemoveProfile>;

/// Pure reducer over the registry; actions naming an absent profile are no-ops
[[nodiscard]] OOXML_FIDELITY_API ToleranceModel tolerance_update(ToleranceModel model, ToleranceAction action);

// ============================================================
// ToleranceConfiguration
// ============================================================

class OOXML_FIDELITY_API ToleranceConfiguration {
public:
    ToleranceConfiguration();
    ~ToleranceConfiguration();

    ToleranceConfiguration(ToleranceConfiguration&&) noexcept;
    ToleranceConfiguration& operator=(ToleranceConfiguration&&) noexcept;
    ToleranceConfiguration(const ToleranceConfiguration&) = delete;
    ToleranceConfiguration& operator=(const ToleranceConfiguration&) = delete;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> profile_names() const;

    /// Copy of a profile by name, or nullopt
    [[nodiscard]] std::optional<ToleranceProfile> find_profile(std::string_view name) const;

    /// @throws UnknownProfileError
    [[nodiscard]] ToleranceProfile profile(std::string_view name) const;

    /// The whole registry as an immutable value
    [[nodiscard]] ProfileRegistry snapshot() const;

    [[nodiscard]] static bool is_builtin(std::string_view name) noexcept;

    /// Deep-copy `base_profile` under `name` and register it.
    /// @throws UnknownProfileError if the base does not exist
    /// @throws ProfileMutationError if `name` is a built-in name
    ToleranceProfile create_custom_profile(const std::string& name, std::string_view base_profile = "normal");

    /// Set the limits of the rule for `change_type`, adding the rule if the
    /// profile has none.
    /// @throws UnknownProfileError, ThresholdError (percentage outside [0, 100]),
    ///         ConfigurationError (negative absolute limit)
    void adjust_tolerance(std::string_view profile_name, ChangeType change_type,
                          std::optional<double> new_percentage,
                          std::optional<std::int64_t> new_absolute = std::nullopt);

    /// @throws UnknownProfileError, ProfileMutationError for built-ins
    void remove_profile(std::string_view name);

    /// @throws UnknownProfileError
    [[nodiscard]] ToleranceEvaluation evaluate_changes(const std::vector<ChangeRecord>& changes,
                                                       std::string_view profile_name = "normal",
                                                       std::optional<std::size_t> total_elements = std::nullopt) const;

    /// Serialize a registered profile to JSON.
    /// @throws UnknownProfileError
    [[nodiscard]] std::string save_profile(std::string_view name) const;

    /// Parse a profile record and register it under its own name. A built-in
    /// record identical to the registered built-in is accepted and changes
    /// nothing, so save_profile output always loads back.
    /// @throws ProfileFormatError, ProfileMutationError for a built-in name
    ///         whose record differs from the registered profile
    ToleranceProfile load_profile(const std::string& json);

    /// @throws UnknownProfileError, ConfigurationError if the file cannot be written
    void save_profile_file(std::string_view name, const std::filesystem::path& file) const;

    /// @throws ConfigurationError if the file cannot be read, plus load_profile's errors
    ToleranceProfile load_profile_file(const std::filesystem::path& file);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ooxml_fidelity
