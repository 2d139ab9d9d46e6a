// tolerance.cpp - Tolerance profiles, registry store, evaluation and persistence

#include <ooxml_fidelity/tolerance.h>
#include <ooxml_fidelity/builders.h>
#include <ooxml_fidelity/errors.h>
#include <ooxml_fidelity/location.h>
#include <ooxml_fidelity/log.h>
#include <ooxml_fidelity/serialization.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <utility>

namespace ooxml_fidelity {

// ============================================================
// Rules and profiles
// ============================================================

bool ToleranceRule::is_within_tolerance(std::size_t change_count, std::size_t total_count) const noexcept {
    if (max_absolute && static_cast<std::int64_t>(change_count) > *max_absolute) {
        return false;
    }
    if (max_percentage) {
        double measured = 0.0;
        if (total_count > 0) {
            measured = 100.0 * static_cast<double>(change_count) / static_cast<double>(total_count);
        } else if (change_count > 0) {
            measured = 100.0;
        }
        if (measured > *max_percentage) {
            return false;
        }
    }
    return true;
}

bool ToleranceProfile::is_critical_path(std::string_view location) const {
    return std::any_of(critical_paths.begin(), critical_paths.end(),
                       [&](const std::string& pattern) { return location_matches(pattern, location); });
}

bool ToleranceProfile::is_ignorable_path(std::string_view location) const {
    return std::any_of(ignorable_paths.begin(), ignorable_paths.end(),
                       [&](const std::string& pattern) { return location_matches(pattern, location); });
}

const ToleranceRule* ToleranceProfile::find_rule(ChangeType type) const noexcept {
    for (const auto& rule : rules) {
        if (rule.change_type == type) {
            return &rule;
        }
    }
    return nullptr;
}

namespace {

ToleranceRule make_rule(ChangeType type, std::optional<std::int64_t> max_absolute,
                        std::optional<double> max_percentage, std::string description) {
    ToleranceRule rule;
    rule.change_type = type;
    rule.max_absolute = max_absolute;
    rule.max_percentage = max_percentage;
    rule.description = std::move(description);
    return rule;
}

const std::set<std::string>& revision_noise() {
    static const std::set<std::string> paths{
        "//@w:rsid*",
        "//@w14:paraId",
        "//@w14:textId",
        "//w:proofErr",
        "//w:lastRenderedPageBreak",
        "//cp:lastModifiedBy",
        "//dcterms:modified",
    };
    return paths;
}

constexpr std::array<std::string_view, 4> kBuiltinNames{"strict", "normal", "lenient", "permissive"};

constexpr std::array<ChangeType, 3> kStylingTypes{
    ChangeType::ColorShift, ChangeType::FontSubstitution, ChangeType::SpacingChange};

// Change types a rule counts. Styling changes without a rule of their own
// fall under the formatting rule.
std::vector<ChangeType> counted_types(const ToleranceProfile& profile, ChangeType rule_type) {
    std::vector<ChangeType> types{rule_type};
    if (rule_type != ChangeType::FormattingLoss) {
        return types;
    }
    for (auto styling : kStylingTypes) {
        if (!profile.find_rule(styling)) {
            types.push_back(styling);
        }
    }
    return types;
}

} // anonymous namespace

std::vector<ToleranceProfile> builtin_profiles() {
    ToleranceProfile strict;
    strict.name = "strict";
    strict.level = ToleranceLevel::Strict;
    strict.critical_paths = {"//w:t", "//a:t", "//v", "//f", "//w:tbl", "//w:numPr"};
    strict.rules.push_back(make_rule(ChangeType::ContentLoss, 0, 0.0, "No content loss allowed"));
    strict.rules.push_back(make_rule(ChangeType::FormattingLoss, 10, 5.0, "Minimal formatting changes allowed"));

    ToleranceProfile normal;
    normal.name = "normal";
    normal.level = ToleranceLevel::Normal;
    normal.critical_paths = {"//w:t", "//a:t", "//v"};
    normal.ignorable_paths = revision_noise();
    normal.rules.push_back(make_rule(ChangeType::ContentLoss, 0, 0.0, "No content loss allowed"));
    normal.rules.push_back(make_rule(ChangeType::FormattingLoss, 50, 15.0, "Some formatting changes acceptable"));
    normal.rules.push_back(make_rule(ChangeType::ColorShift, std::nullopt, 20.0, "Minor color shifts acceptable"));
    normal.rules.push_back(make_rule(ChangeType::SpacingChange, std::nullopt, 25.0,
                                     "Spacing changes acceptable within limits"));

    ToleranceProfile lenient;
    lenient.name = "lenient";
    lenient.level = ToleranceLevel::Lenient;
    lenient.critical_paths = {"//w:t", "//v"};
    lenient.ignorable_paths = revision_noise();
    lenient.ignorable_paths.insert({"//cp:coreProperties", "//app:Properties", "//w:spacing", "//w:ind"});
    lenient.rules.push_back(make_rule(ChangeType::ContentLoss, 5, 1.0, "Minimal content loss acceptable"));
    lenient.rules.push_back(make_rule(ChangeType::FormattingLoss, std::nullopt, 30.0,
                                      "Significant formatting changes acceptable"));
    lenient.rules.push_back(make_rule(ChangeType::FontSubstitution, std::nullopt, 50.0,
                                      "Font substitutions acceptable"));

    ToleranceProfile permissive;
    permissive.name = "permissive";
    permissive.level = ToleranceLevel::Permissive;
    permissive.ignorable_paths = lenient.ignorable_paths;
    permissive.ignorable_paths.insert({"//w:color", "//w:sz", "//w:szCs"});
    permissive.rules.push_back(make_rule(ChangeType::ContentLoss, 20, 5.0,
                                         "Some content loss acceptable for testing"));

    return {std::move(strict), std::move(normal), std::move(lenient), std::move(permissive)};
}

// ============================================================
// Evaluation
// ============================================================

ToleranceEvaluation evaluate_changes(const std::vector<ChangeRecord>& changes, const ToleranceProfile& profile,
                                     std::optional<std::size_t> total_elements) {
    ToleranceEvaluation result;
    result.profile_used = profile.name;
    result.total_changes = changes.size();
    for (auto type : all_change_types) {
        result.changes_by_type[type];
    }

    for (const auto& change : changes) {
        if (profile.is_ignorable_path(change.location)) {
            result.ignored_changes.push_back(change);
            continue;
        }
        if (change.severity == DiffSeverity::Critical && profile.is_critical_path(change.location)) {
            result.critical_violations.push_back(change);
            continue;
        }
        result.changes_by_type[change.type].push_back(change);
    }

    const std::size_t denominator = total_elements.value_or(changes.size());
    for (const auto& rule : profile.rules) {
        std::vector<const ChangeRecord*> candidates;
        for (auto type : counted_types(profile, rule.change_type)) {
            for (const auto& change : result.changes_by_type[type]) {
                candidates.push_back(&change);
            }
        }
        std::size_t count = candidates.size();
        if (rule.location_pattern) {
            count = static_cast<std::size_t>(std::count_if(
                candidates.begin(), candidates.end(),
                [&](const ChangeRecord* c) { return location_matches(*rule.location_pattern, c->location); }));
        }
        if (count == 0 || rule.is_within_tolerance(count, denominator)) {
            continue;
        }
        RuleViolation violation;
        violation.rule = rule;
        violation.change_count = count;
        violation.total_count = denominator;
        violation.measured_percentage =
            denominator > 0 ? 100.0 * static_cast<double>(count) / static_cast<double>(denominator) : 100.0;
        result.rule_violations.push_back(std::move(violation));
    }

    result.passed = result.critical_violations.empty() && result.rule_violations.empty();
    if (result.passed) {
        result.summary = "All changes are within tolerance limits.";
    } else {
        std::ostringstream oss;
        oss << "Tolerance check failed: ";
        if (!result.critical_violations.empty()) {
            oss << result.critical_violations.size() << " critical path violations";
            if (!result.rule_violations.empty()) oss << ", ";
        }
        if (!result.rule_violations.empty()) {
            oss << result.rule_violations.size() << " tolerance rule violations";
        }
        result.summary = oss.str();
    }
    return result;
}

std::string get_recommended_profile(DocumentType document_type, std::string_view usage_context) {
    struct Recommendation {
        DocumentType type;
        std::string_view usage;
        std::string_view profile;
    };
    static constexpr std::array<Recommendation, 8> table{{
        {DocumentType::Word, "production", "strict"},
        {DocumentType::Word, "draft", "lenient"},
        {DocumentType::Word, "test", "permissive"},
        {DocumentType::PowerPoint, "production", "normal"},
        {DocumentType::PowerPoint, "draft", "lenient"},
        {DocumentType::Excel, "production", "strict"},
        {DocumentType::Excel, "analysis", "normal"},
        {DocumentType::Excel, "test", "lenient"},
    }};
    for (const auto& entry : table) {
        if (entry.type == document_type && entry.usage == usage_context) {
            return std::string(entry.profile);
        }
    }
    return "normal";
}

// ============================================================
// Persistence
// ============================================================

namespace {

Value string_set_to_value(const std::set<std::string>& paths) {
    VectorBuilder builder;
    for (const auto& path : paths) {
        builder.push_back(path);
    }
    return builder.finish();
}

std::set<std::string> string_set_from_value(const Value& record, const std::string& field) {
    std::set<std::string> paths;
    if (!record.contains(field)) {
        return paths;
    }
    const Value list = record.at(field);
    if (!list.is_vector()) {
        throw ProfileFormatError(field, "expected an array of strings");
    }
    for (const auto& item : list.as_vector()) {
        if (!item->is_string()) {
            throw ProfileFormatError(field, "expected an array of strings");
        }
        paths.insert(item->as_string());
    }
    return paths;
}

ToleranceRule rule_from_value(const Value& record, std::size_t index) {
    const std::string prefix = "rules[" + std::to_string(index) + "].";
    if (!record.is_map()) {
        throw ProfileFormatError("rules[" + std::to_string(index) + "]", "expected an object");
    }

    ToleranceRule rule;
    const auto type = parse_change_type(record.at_or("change_type", Value{}).as_string_view());
    if (!type) {
        throw ProfileFormatError(prefix + "change_type", "unknown change type");
    }
    rule.change_type = *type;

    const Value absolute = record.at_or("max_absolute", Value{});
    if (auto* n = absolute.get_if<int64_t>()) {
        if (*n < 0) throw ProfileFormatError(prefix + "max_absolute", "must not be negative");
        rule.max_absolute = *n;
    } else if (!absolute.is_null()) {
        throw ProfileFormatError(prefix + "max_absolute", "expected an integer or null");
    }

    const Value percentage = record.at_or("max_percentage", Value{});
    if (percentage.is_number()) {
        const double p = percentage.as_number();
        if (p < 0.0 || p > 100.0) throw ProfileFormatError(prefix + "max_percentage", "must be within [0, 100]");
        rule.max_percentage = p;
    } else if (!percentage.is_null()) {
        throw ProfileFormatError(prefix + "max_percentage", "expected a number or null");
    }

    const Value pattern = record.at_or("location_pattern", Value{});
    if (pattern.is_string()) {
        rule.location_pattern = pattern.as_string();
    } else if (!pattern.is_null()) {
        throw ProfileFormatError(prefix + "location_pattern", "expected a string or null");
    }

    const Value description = record.at_or("description", Value{""});
    if (!description.is_string()) {
        throw ProfileFormatError(prefix + "description", "expected a string");
    }
    rule.description = description.as_string();
    return rule;
}

} // anonymous namespace

Value profile_to_value(const ToleranceProfile& profile) {
    VectorBuilder rules;
    for (const auto& rule : profile.rules) {
        rules.push_back(MapBuilder()
                            .set("change_type", to_string(rule.change_type))
                            .set_optional("max_absolute", rule.max_absolute)
                            .set_optional("max_percentage", rule.max_percentage)
                            .set_optional("location_pattern", rule.location_pattern)
                            .set("description", rule.description)
                            .finish());
    }

    return MapBuilder()
        .set("name", profile.name)
        .set("level", to_string(profile.level))
        .set("rules", rules.finish())
        .set("critical_paths", string_set_to_value(profile.critical_paths))
        .set("ignorable_paths", string_set_to_value(profile.ignorable_paths))
        .finish();
}

ToleranceProfile profile_from_value(const Value& record) {
    if (!record.is_map()) {
        throw ProfileFormatError("profile", "expected an object");
    }

    ToleranceProfile profile;
    const Value name = record.at_or("name", Value{});
    if (!name.is_string() || name.as_string_view().empty()) {
        throw ProfileFormatError("name", "expected a non-empty string");
    }
    profile.name = name.as_string();

    const auto level = parse_tolerance_level(record.at_or("level", Value{}).as_string_view());
    if (!level) {
        throw ProfileFormatError("level", "unknown tolerance level");
    }
    profile.level = *level;

    const Value rules = record.at_or("rules", Value{ValueList{}});
    if (!rules.is_vector()) {
        throw ProfileFormatError("rules", "expected an array");
    }
    std::size_t index = 0;
    for (const auto& rule : rules.as_vector()) {
        profile.rules.push_back(rule_from_value(*rule, index++));
    }

    profile.critical_paths = string_set_from_value(record, "critical_paths");
    profile.ignorable_paths = string_set_from_value(record, "ignorable_paths");
    return profile;
}

std::string profile_to_json(const ToleranceProfile& profile) {
    return to_json(profile_to_value(profile));
}

ToleranceProfile profile_from_json(const std::string& json) {
    std::string error;
    Value record = from_json(json, &error);
    if (!error.empty()) {
        throw ProfileFormatError("profile", "invalid JSON: " + error);
    }
    return profile_from_value(record);
}

// ============================================================
// Reducer
// ============================================================

ToleranceModel tolerance_update(ToleranceModel model, ToleranceAction action) {
    return std::visit(
        [&](auto&& act) -> ToleranceModel {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, tolerance_actions::PutProfile>) {
                return ToleranceModel{model.profiles.set(act.profile.name, act.profile)};
            }

            else if constexpr (std::is_same_v<T, tolerance_actions::AdjustRule>) {
                const ToleranceProfile* current = model.profiles.find(act.profile_name);
                if (!current) {
                    return model;
                }
                ToleranceProfile updated = *current;
                auto it = std::find_if(updated.rules.begin(), updated.rules.end(),
                                       [&](const ToleranceRule& r) { return r.change_type == act.change_type; });
                if (it == updated.rules.end()) {
                    ToleranceRule rule;
                    rule.change_type = act.change_type;
                    rule.description = "Adjusted " + std::string(to_string(act.change_type)) + " tolerance";
                    updated.rules.push_back(std::move(rule));
                    it = std::prev(updated.rules.end());
                }
                if (act.max_percentage) it->max_percentage = act.max_percentage;
                if (act.max_absolute) it->max_absolute = act.max_absolute;
                return ToleranceModel{model.profiles.set(act.profile_name, std::move(updated))};
            }

            else if constexpr (std::is_same_v<T, tolerance_actions::RemoveProfile>) {
                return ToleranceModel{model.profiles.erase(act.profile_name)};
            }

            return model;
        },
        action);
}

// ============================================================
// ToleranceConfiguration
// ============================================================

namespace {

ToleranceModel initial_model() {
    auto profiles = ProfileRegistry{}.transient();
    for (auto& profile : builtin_profiles()) {
        auto name = profile.name;
        profiles.set(std::move(name), std::move(profile));
    }
    return ToleranceModel{profiles.persistent()};
}

// Store type deduction helper
inline auto make_tolerance_store_impl(ToleranceModel initial) {
    return lager::make_store<ToleranceAction>(std::move(initial), lager::with_manual_event_loop{},
                                              lager::with_reducer(tolerance_update));
}

using ToleranceStoreType = decltype(make_tolerance_store_impl(std::declval<ToleranceModel>()));

} // anonymous namespace

struct ToleranceConfiguration::Impl {
    // Readers copy the registry under a shared lock; dispatch takes it
    // exclusively. A copied immer map keeps its profiles alive on its own.
    mutable std::shared_mutex mutex;
    ToleranceStoreType store;

    Impl() : store(make_tolerance_store_impl(initial_model())) {}

    ProfileRegistry profiles() const {
        std::shared_lock<std::shared_mutex> lock(mutex);
        return store.get().profiles;
    }

    void dispatch(ToleranceAction action) {
        std::unique_lock<std::shared_mutex> lock(mutex);
        store.dispatch(std::move(action));
    }

    ToleranceProfile require(std::string_view name) const {
        const ProfileRegistry registry = profiles();
        const ToleranceProfile* found = registry.find(std::string(name));
        if (!found) {
            throw UnknownProfileError(std::string(name));
        }
        return *found;
    }
};

ToleranceConfiguration::ToleranceConfiguration() : impl_(std::make_unique<Impl>()) {}
ToleranceConfiguration::~ToleranceConfiguration() = default;
ToleranceConfiguration::ToleranceConfiguration(ToleranceConfiguration&&) noexcept = default;
ToleranceConfiguration& ToleranceConfiguration::operator=(ToleranceConfiguration&&) noexcept = default;

std::vector<std::string> ToleranceConfiguration::profile_names() const {
    std::vector<std::string> names;
    for (const auto& [name, profile] : impl_->profiles()) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<ToleranceProfile> ToleranceConfiguration::find_profile(std::string_view name) const {
    const ProfileRegistry registry = impl_->profiles();
    if (const ToleranceProfile* found = registry.find(std::string(name))) {
        return *found;
    }
    return std::nullopt;
}

ToleranceProfile ToleranceConfiguration::profile(std::string_view name) const {
    return impl_->require(name);
}

ProfileRegistry ToleranceConfiguration::snapshot() const {
    return impl_->profiles();
}

bool ToleranceConfiguration::is_builtin(std::string_view name) noexcept {
    return std::find(kBuiltinNames.begin(), kBuiltinNames.end(), name) != kBuiltinNames.end();
}

ToleranceProfile ToleranceConfiguration::create_custom_profile(const std::string& name,
                                                               std::string_view base_profile) {
    if (is_builtin(name)) {
        throw ProfileMutationError("Cannot replace built-in profile '" + name + "'");
    }
    ToleranceProfile custom = impl_->require(base_profile);
    custom.name = name;
    impl_->dispatch(tolerance_actions::PutProfile{custom});
    return custom;
}

void ToleranceConfiguration::adjust_tolerance(std::string_view profile_name, ChangeType change_type,
                                              std::optional<double> new_percentage,
                                              std::optional<std::int64_t> new_absolute) {
    (void)impl_->require(profile_name);
    if (new_percentage && (*new_percentage < 0.0 || *new_percentage > 100.0)) {
        throw ThresholdError(std::string(to_string(change_type)) + ".max_percentage", *new_percentage);
    }
    if (new_absolute && *new_absolute < 0) {
        throw ConfigurationError("Absolute limit for '" + std::string(to_string(change_type)) +
                                 "' must not be negative, got " + std::to_string(*new_absolute));
    }
    impl_->dispatch(tolerance_actions::AdjustRule{std::string(profile_name), change_type,
                                                  new_percentage, new_absolute});
}

void ToleranceConfiguration::remove_profile(std::string_view name) {
    (void)impl_->require(name);
    if (is_builtin(name)) {
        throw ProfileMutationError("Cannot remove built-in profile '" + std::string(name) + "'");
    }
    impl_->dispatch(tolerance_actions::RemoveProfile{std::string(name)});
}

ToleranceEvaluation ToleranceConfiguration::evaluate_changes(const std::vector<ChangeRecord>& changes,
                                                             std::string_view profile_name,
                                                             std::optional<std::size_t> total_elements) const {
    const ToleranceProfile profile = impl_->require(profile_name);
    return ooxml_fidelity::evaluate_changes(changes, profile, total_elements);
}

std::string ToleranceConfiguration::save_profile(std::string_view name) const {
    return profile_to_json(impl_->require(name));
}

ToleranceProfile ToleranceConfiguration::load_profile(const std::string& json) {
    ToleranceProfile loaded;
    try {
        loaded = profile_from_json(json);
    } catch (const ProfileFormatError& e) {
        detail::log_input_error("ToleranceConfiguration::load_profile", e.field(), e.what());
        throw;
    }
    if (is_builtin(loaded.name)) {
        // Reloading a built-in exactly as registered changes nothing
        if (loaded == impl_->require(loaded.name)) {
            return loaded;
        }
        throw ProfileMutationError("Cannot replace built-in profile '" + loaded.name + "'");
    }
    impl_->dispatch(tolerance_actions::PutProfile{loaded});
    return loaded;
}

void ToleranceConfiguration::save_profile_file(std::string_view name, const std::filesystem::path& file) const {
    const std::string json = save_profile(name);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ConfigurationError("Cannot open profile file for writing: " + file.string());
    }
    out << json;
    if (!out) {
        throw ConfigurationError("Failed to write profile file: " + file.string());
    }
}

ToleranceProfile ToleranceConfiguration::load_profile_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        detail::log_input_error("ToleranceConfiguration::load_profile_file", file.string(), "cannot be opened");
        throw ConfigurationError("Cannot open profile file: " + file.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return load_profile(buffer.str());
}

} // namespace ooxml_fidelity
