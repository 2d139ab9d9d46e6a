// semantic_diff.cpp - Tree alignment, severity classification, and summaries

#include <ooxml_fidelity/semantic_diff.h>
#include <ooxml_fidelity/location.h>
#include <ooxml_fidelity/namespaces.h>
#include <ooxml_fidelity/xml_reader.h>

#include <boost/algorithm/string/predicate.hpp>

#include <zug/into_vector.hpp>
#include <zug/transducer/filter.hpp>

#include <algorithm>
#include <array>
#include <map>
#include <tuple>

namespace ooxml_fidelity {

namespace {

// ============================================================
// Vocabulary
// ============================================================

constexpr std::array<std::string_view, 9> kBookkeepingAttributes{
    "paraId", "textId", "lastPrinted", "uniqueId", "objectId", "id", "created", "modified",
    "rsid"};

constexpr std::array<std::string_view, 4> kBookkeepingElements{
    "proofErr", "lastRenderedPageBreak", "bookmarkStart", "bookmarkEnd"};

constexpr std::array<std::string_view, 7> kWordContent{"p", "r", "t", "tbl", "tr", "tc", "drawing"};
constexpr std::array<std::string_view, 8> kSlideContent{"sp", "txBody", "p", "r", "t", "pic",
                                                         "graphicFrame", "grpSp"};
constexpr std::array<std::string_view, 7> kSheetContent{"row", "c", "v", "f", "is", "si", "t"};

constexpr std::array<std::string_view, 19> kStyleContainers{
    "style", "styles", "docDefaults", "theme", "themeElements", "clrScheme", "fontScheme",
    "fmtScheme", "cellXfs", "cellStyleXfs", "cellStyles", "fills", "fonts", "borders", "numFmts",
    "dxfs", "tableStyles", "numbering", "abstractNum"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_bookkeeping_attribute(const QName& name) {
    return boost::algorithm::starts_with(name.local, "rsid") ||
           contains(kBookkeepingAttributes, name.local) || is_metadata_namespace(name.ns_uri);
}

bool is_bookkeeping_element(const QName& name) {
    return contains(kBookkeepingElements, name.local) || is_metadata_namespace(name.ns_uri);
}

bool is_content_element(const QName& name, std::optional<DocumentType> type) {
    if (!type) {
        return contains(kWordContent, name.local) || contains(kSlideContent, name.local) ||
               contains(kSheetContent, name.local);
    }
    switch (*type) {
        case DocumentType::Word:       return contains(kWordContent, name.local);
        case DocumentType::PowerPoint: return contains(kSlideContent, name.local);
        case DocumentType::Excel:      return contains(kSheetContent, name.local);
    }
    return false;
}

// Property containers (rPr, pPr, spPr, ...) and style/theme tables
bool is_style_element(const QName& name) {
    return boost::algorithm::ends_with(name.local, "Pr") || contains(kStyleContainers, name.local);
}

bool in_style_context(const ParsedDocument& doc, NodeId id) {
    for (NodeId cur = id; cur != kNoNode; cur = doc.node(cur).parent) {
        if (is_style_element(doc.node(cur).name)) {
            return true;
        }
    }
    return false;
}

DiffSeverity severity_for(Significance significance) {
    switch (significance) {
        case Significance::Critical:  return DiffSeverity::Critical;
        case Significance::Important: return DiffSeverity::Major;
        case Significance::Moderate:  return DiffSeverity::Major;
        case Significance::Cosmetic:  return DiffSeverity::Minor;
    }
    return DiffSeverity::Minor;
}

DiffSeverity more_severe(DiffSeverity a, DiffSeverity b) {
    return at_least(a, b) ? a : b;
}

std::string quoted(const std::string& value) {
    return "'" + value + "'";
}

// ============================================================
// Carrier flags
//
// Nodes and attributes that the catalog recognises as design-token carriers
// in one document, with the highest significance of any matching mapping.
// ============================================================

class CarrierFlags {
public:
    CarrierFlags(const ParsedDocument& doc, const CarrierCatalog& catalog,
                 std::optional<DocumentType> type) {
        for (const CarrierMapping* mapping : catalog.applicable(type)) {
            for (const auto& match : find_carrier_matches(mapping->pattern, doc)) {
                Key key{match.node, match.attribute.value_or(QName{})};
                auto [it, inserted] = flags_.emplace(key, mapping->significance);
                if (!inserted && mapping->significance < it->second) {
                    it->second = mapping->significance;
                }
            }
        }
    }

    [[nodiscard]] std::optional<Significance> attribute(NodeId node, const QName& name) const {
        auto it = flags_.find(Key{node, name});
        if (it == flags_.end()) return std::nullopt;
        return it->second;
    }

    /// Most significant flag anywhere in [first, end)
    [[nodiscard]] std::optional<Significance> in_range(NodeId first, NodeId end) const {
        std::optional<Significance> best;
        for (auto it = flags_.lower_bound(Key{first, QName{}}); it != flags_.end() && it->first.first < end; ++it) {
            if (!best || it->second < *best) {
                best = it->second;
            }
        }
        return best;
    }

private:
    using Key = std::pair<NodeId, QName>;
    std::map<Key, Significance> flags_;
};

// ============================================================
// DifferenceCollector
// ============================================================

class DifferenceCollector {
public:
    DifferenceCollector(const ParsedDocument& original, const ParsedDocument& converted,
                        std::optional<DocumentType> type, const CarrierCatalog& catalog)
        : left_(original)
        , right_(converted)
        , type_(type)
        , left_flags_(original, catalog, type)
        , right_flags_(converted, catalog, type) {}

    void run() {
        if (left_.empty() && right_.empty()) {
            return;
        }
        if (left_.empty()) {
            element_added(right_.root(), "/" + format_step(root_key(right_)));
            return;
        }
        if (right_.empty()) {
            element_dropped(left_.root(), "/" + format_step(root_key(left_)));
            return;
        }

        const auto left_key = root_key(left_);
        const auto right_key = root_key(right_);
        if (left_key == right_key) {
            diff_element(left_.root(), right_.root(), "/" + format_step(left_key));
        } else {
            element_dropped(left_.root(), "/" + format_step(left_key));
            element_added(right_.root(), "/" + format_step(right_key));
        }
    }

    [[nodiscard]] std::vector<SemanticDifference> take_differences() { return std::move(diffs_); }
    [[nodiscard]] std::size_t affected_units() const noexcept { return affected_units_; }

private:
    const ParsedDocument& left_;
    const ParsedDocument& right_;
    std::optional<DocumentType> type_;
    CarrierFlags left_flags_;
    CarrierFlags right_flags_;
    std::vector<SemanticDifference> diffs_;
    std::size_t affected_units_ = 0;

    void emit(SemanticDifference diff, std::size_t original_units) {
        if (diff.severity != DiffSeverity::Ignorable) {
            affected_units_ += original_units;
        }
        diffs_.push_back(std::move(diff));
    }

    void diff_element(NodeId l, NodeId r, const std::string& location) {
        diff_attributes(l, r, location);
        diff_text(l, r, location);
        diff_children(l, r, location);
    }

    // ------------------------------------------------------------
    // Attributes
    // ------------------------------------------------------------

    void diff_attributes(NodeId l, NodeId r, const std::string& location) {
        const Node& ln = left_.node(l);
        const Node& rn = right_.node(r);

        for (const auto& attr : ln.attributes) {
            const std::string* new_value = rn.attribute(attr.name);
            if (new_value && *new_value == attr.value) {
                continue;
            }
            SemanticDifference diff;
            diff.location = attribute_location(location, attr.name);
            diff.element = ln.name;
            diff.attribute = attr.name;
            diff.old_value = attr.value;
            if (new_value) {
                diff.category = DiffCategory::Modified;
                diff.new_value = *new_value;
                diff.description = "Attribute " + to_display_string(attr.name) + " of " +
                                   to_display_string(ln.name) + " changed from " +
                                   quoted(attr.value) + " to " + quoted(*new_value);
            } else {
                diff.category = DiffCategory::Dropped;
                diff.description = "Attribute " + to_display_string(attr.name) + " of " +
                                   to_display_string(ln.name) + " removed (was " +
                                   quoted(attr.value) + ")";
            }
            classify_attribute(diff, l, new_value ? std::optional<NodeId>{r} : std::nullopt);
            emit(std::move(diff), 1);
        }

        for (const auto& attr : rn.attributes) {
            if (ln.attribute(attr.name)) {
                continue;
            }
            SemanticDifference diff;
            diff.location = attribute_location(location, attr.name);
            diff.category = DiffCategory::Added;
            diff.element = rn.name;
            diff.attribute = attr.name;
            diff.new_value = attr.value;
            diff.description = "Attribute " + to_display_string(attr.name) + " of " +
                               to_display_string(rn.name) + " added with value " + quoted(attr.value);
            classify_attribute(diff, std::nullopt, r);
            emit(std::move(diff), 0);
        }
    }

    void classify_attribute(SemanticDifference& diff, std::optional<NodeId> l, std::optional<NodeId> r) {
        const QName& name = *diff.attribute;
        if (is_bookkeeping_attribute(name) || is_bookkeeping_element(diff.element)) {
            diff.severity = DiffSeverity::Ignorable;
            return;
        }

        std::optional<Significance> flag;
        if (l) flag = left_flags_.attribute(*l, name);
        if (r) {
            if (auto right_flag = right_flags_.attribute(*r, name); right_flag && (!flag || *right_flag < *flag)) {
                flag = right_flag;
            }
        }

        diff.severity = flag ? severity_for(*flag) : DiffSeverity::Minor;
        const NodeId owner = l ? *l : *r;
        const ParsedDocument& doc = l ? left_ : right_;
        diff.context.affects_styling = flag.has_value() || in_style_context(doc, owner);
    }

    // ------------------------------------------------------------
    // Text
    // ------------------------------------------------------------

    void diff_text(NodeId l, NodeId r, const std::string& location) {
        const Node& ln = left_.node(l);
        const Node& rn = right_.node(r);
        if (ln.text == rn.text) {
            return;
        }

        SemanticDifference diff;
        diff.location = text_location(location);
        diff.element = ln.name;
        if (ln.has_text()) diff.old_value = ln.text;
        if (rn.has_text()) diff.new_value = rn.text;

        if (ln.has_text() && rn.has_text()) {
            diff.category = DiffCategory::Modified;
            diff.description = "Text of " + to_display_string(ln.name) + " changed from " +
                               quoted(ln.text) + " to " + quoted(rn.text);
        } else if (ln.has_text()) {
            diff.category = DiffCategory::Dropped;
            diff.description = "Text of " + to_display_string(ln.name) + " removed (was " +
                               quoted(ln.text) + ")";
        } else {
            diff.category = DiffCategory::Added;
            diff.description = "Text of " + to_display_string(ln.name) + " added: " + quoted(rn.text);
        }

        if (is_bookkeeping_element(ln.name)) {
            diff.severity = DiffSeverity::Ignorable;
        } else {
            diff.severity = DiffSeverity::Critical;
            diff.context.affects_content = true;
        }
        emit(std::move(diff), ln.has_text() ? 1 : 0);
    }

    // ------------------------------------------------------------
    // Children
    // ------------------------------------------------------------

    void diff_children(NodeId l, NodeId r, const std::string& location) {
        const auto& left_children = left_.node(l).children;
        const auto& right_children = right_.node(r).children;
        const auto left_keys = child_keys(left_, l);
        const auto right_keys = child_keys(right_, r);

        // Keys are unique among siblings, so each left key finds at most one partner
        std::map<std::tuple<QName, std::string, std::uint32_t>, std::size_t> right_index;
        for (std::size_t j = 0; j < right_keys.size(); ++j) {
            const auto& key = right_keys[j];
            right_index.emplace(std::make_tuple(key.name, key.identity, key.occurrence), j);
        }

        std::vector<char> right_matched(right_children.size(), 0);
        for (std::size_t i = 0; i < left_children.size(); ++i) {
            const auto& key = left_keys[i];
            const std::string child_location = location + "/" + format_step(key);
            auto found = right_index.find(std::make_tuple(key.name, key.identity, key.occurrence));
            if (found == right_index.end()) {
                element_dropped(left_children[i], child_location);
                continue;
            }
            const std::size_t j = found->second;
            right_matched[j] = 1;
            diff_element(left_children[i], right_children[j], child_location);
        }

        for (std::size_t j = 0; j < right_children.size(); ++j) {
            if (!right_matched[j]) {
                element_added(right_children[j], location + "/" + format_step(right_keys[j]));
            }
        }
    }

    void element_dropped(NodeId id, const std::string& location) {
        const Node& node = left_.node(id);
        SemanticDifference diff;
        diff.location = location;
        diff.category = DiffCategory::Dropped;
        diff.element = node.name;
        const std::size_t units = left_.subtree_units(id);
        if (left_.subtree_has_text(id)) {
            diff.old_value = left_.subtree_text(id);
        }
        diff.description = "Element " + to_display_string(node.name) + " removed (" +
                           std::to_string(units) + " comparable units)";
        classify_element(diff, left_, left_flags_, id);
        emit(std::move(diff), units);
    }

    void element_added(NodeId id, const std::string& location) {
        const Node& node = right_.node(id);
        SemanticDifference diff;
        diff.location = location;
        diff.category = DiffCategory::Added;
        diff.element = node.name;
        if (right_.subtree_has_text(id)) {
            diff.new_value = right_.subtree_text(id);
        }
        diff.description = "Element " + to_display_string(node.name) + " added";
        classify_element(diff, right_, right_flags_, id);
        emit(std::move(diff), 0);
    }

    void classify_element(SemanticDifference& diff, const ParsedDocument& doc,
                          const CarrierFlags& flags, NodeId id) {
        const Node& node = doc.node(id);
        if (is_bookkeeping_element(node.name)) {
            diff.severity = DiffSeverity::Ignorable;
            return;
        }

        const bool has_text = doc.subtree_has_text(id);
        const bool styling = in_style_context(doc, id);
        const auto flag = flags.in_range(id, doc.subtree_end(id));

        if (is_content_element(node.name, type_)) {
            diff.severity = has_text ? DiffSeverity::Critical : DiffSeverity::Major;
            if (flag) {
                diff.severity = more_severe(diff.severity, severity_for(*flag));
            }
            diff.context.affects_structure = true;
            diff.context.affects_content = has_text;
            diff.context.affects_styling = styling;
            return;
        }

        if (flag) {
            diff.severity = severity_for(*flag);
            diff.context.affects_styling = true;
        } else if (styling) {
            diff.severity = DiffSeverity::Minor;
            diff.context.affects_styling = true;
        } else {
            diff.severity = DiffSeverity::Major;
        }
        diff.context.affects_structure = !styling;
        diff.context.affects_content = has_text && !styling;
    }
};

} // anonymous namespace

// ============================================================
// SemanticDiffEngine
// ============================================================

DiffResult SemanticDiffEngine::analyze_differences(const ParsedDocument& original,
                                                   const ParsedDocument& converted,
                                                   std::optional<DocumentType> document_type) const {
    DifferenceCollector collector(original, converted, document_type, *catalog_);
    collector.run();

    DiffResult result;
    result.differences = collector.take_differences();
    result.summary = summarize_differences(result.differences, count_comparable_units(original),
                                           collector.affected_units());
    return result;
}

DiffResult SemanticDiffEngine::analyze_differences(std::string_view original_bytes,
                                                   std::string_view converted_bytes,
                                                   std::optional<DocumentType> document_type) const {
    std::string error;
    auto original = parse_document(original_bytes, &error);
    if (!original) {
        DiffResult result;
        result.summary = summarize_differences({}, 0, 0);
        result.summary.preservation_rate = 0.0;
        result.parse_error = "original: " + error;
        return result;
    }
    auto converted = parse_document(converted_bytes, &error);
    if (!converted) {
        DiffResult result;
        result.summary = summarize_differences({}, 0, 0);
        result.summary.preservation_rate = 0.0;
        result.parse_error = "converted: " + error;
        return result;
    }
    return analyze_differences(*original, *converted, document_type);
}

// ============================================================
// Filtering and metrics
// ============================================================

std::vector<SemanticDifference> filter_differences(const std::vector<SemanticDifference>& differences,
                                                   DiffSeverity min_severity,
                                                   const std::optional<std::vector<DiffCategory>>& categories) {
    return zug::into_vector(
        zug::filter([&](const SemanticDifference& d) {
            if (!at_least(d.severity, min_severity)) {
                return false;
            }
            return !categories ||
                   std::find(categories->begin(), categories->end(), d.category) != categories->end();
        }),
        differences);
}

PreservationMetrics get_preservation_metrics(const std::vector<SemanticDifference>& differences,
                                             std::size_t total_elements) {
    std::size_t content = 0, style = 0, structure = 0;
    for (const auto& d : differences) {
        if (d.context.affects_content) ++content;
        if (d.context.affects_styling) ++style;
        if (d.context.affects_structure) ++structure;
    }

    const double total = static_cast<double>(std::max<std::size_t>(total_elements, 1));
    auto preserved = [total](std::size_t affected) {
        return std::clamp(1.0 - static_cast<double>(affected) / total, 0.0, 1.0);
    };

    PreservationMetrics metrics;
    metrics.overall_preservation = preserved(differences.size());
    metrics.content_preservation = preserved(content);
    metrics.style_preservation = preserved(style);
    metrics.structure_preservation = preserved(structure);
    metrics.change_ratio = static_cast<double>(differences.size()) / total;
    return metrics;
}

DiffSummary summarize_differences(const std::vector<SemanticDifference>& differences,
                                  std::size_t comparable_units, std::size_t affected_units) {
    DiffSummary summary;
    for (auto category : all_diff_categories) summary.by_category[category] = 0;
    for (auto severity : all_diff_severities) summary.by_severity[severity] = 0;

    summary.total_differences = differences.size();
    for (const auto& d : differences) {
        ++summary.by_category[d.category];
        ++summary.by_severity[d.severity];
        if (d.severity == DiffSeverity::Critical) {
            summary.critical_changes.push_back(d);
        }
    }

    summary.comparable_units = comparable_units;
    summary.affected_units = std::min(affected_units, comparable_units);
    if (comparable_units == 0) {
        summary.preservation_rate = 100.0;
    } else {
        const double kept = static_cast<double>(comparable_units - summary.affected_units);
        summary.preservation_rate =
            std::clamp(100.0 * kept / static_cast<double>(comparable_units), 0.0, 100.0);
    }
    return summary;
}

} // namespace ooxml_fidelity
