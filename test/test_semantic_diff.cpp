// test_semantic_diff.cpp - Tests for the semantic diff engine

#include <catch2/catch_all.hpp>
#include <ooxml_fidelity/semantic_diff.h>
#include <ooxml_fidelity/xml_reader.h>

#include "sample_parts.h"

#include <algorithm>
#include <string>

using namespace ooxml_fidelity;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

namespace {

SemanticDifference make_difference(DiffCategory category, DiffSeverity severity, DiffContext context = {}) {
    SemanticDifference d;
    d.location = "/w:document[1]";
    d.category = category;
    d.severity = severity;
    d.context = context;
    return d;
}

const std::string kStyles = R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
  <w:style w:type="paragraph" w:styleId="Heading1"><w:name w:val="heading 1"/></w:style>
  <w:style w:type="paragraph" w:styleId="Title"><w:name w:val="Title"/></w:style>
</w:styles>)";

const std::string kStylesReordered = R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
  <w:style w:type="paragraph" w:styleId="Title"><w:name w:val="Title"/></w:style>
  <w:style w:type="paragraph" w:styleId="Heading1"><w:name w:val="heading 1"/></w:style>
</w:styles>)";

} // namespace

// ============================================================
// Invariance
// ============================================================

TEST_CASE("Diffing a document against itself finds nothing", "[diff][invariance]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocument, DocumentType::Word);

    REQUIRE_FALSE(result.parse_error.has_value());
    REQUIRE(result.differences.empty());
    REQUIRE(result.summary.total_differences == 0);
    REQUIRE(result.summary.preservation_rate == 100.0);
    REQUIRE(result.summary.comparable_units == 25);
}

TEST_CASE("Namespace prefixes do not matter", "[diff][invariance]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocumentRenamedPrefixes,
                                             DocumentType::Word);

    REQUIRE(filter_differences(result.differences, DiffSeverity::Major).empty());
    REQUIRE(result.differences.empty());
    REQUIRE(result.summary.preservation_rate == 100.0);
}

TEST_CASE("Identity attributes align reordered siblings", "[diff][invariance]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(kStyles, kStylesReordered, DocumentType::Word);
    REQUIRE(result.differences.empty());
}

TEST_CASE("Long sibling runs align by key", "[diff][invariance]") {
    auto body = [](int count, int changed) {
        std::string xml = R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)";
        for (int i = 1; i <= count; ++i) {
            xml += "<w:p><w:r><w:t>Line " + std::to_string(i == changed ? -i : i) + "</w:t></w:r></w:p>";
        }
        return xml + "</w:body></w:document>";
    };
    const std::string original = body(3000, 0);

    SemanticDiffEngine engine;
    REQUIRE(engine.analyze_differences(original, original, DocumentType::Word).differences.empty());

    auto result = engine.analyze_differences(original, body(3000, 1500), DocumentType::Word);
    REQUIRE(result.differences.size() == 1);
    REQUIRE(result.differences.front().location == "/w:document[1]/w:body[1]/w:p[1500]/w:r[1]/w:t[1]/text()");
    REQUIRE(result.differences.front().new_value == std::optional<std::string>{"Line -1500"});
}

TEST_CASE("Revision bookkeeping is ignorable", "[diff][severity]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocumentNewRevision,
                                             DocumentType::Word);

    REQUIRE_FALSE(result.differences.empty());
    REQUIRE(std::all_of(result.differences.begin(), result.differences.end(),
                        [](const SemanticDifference& d) { return d.severity == DiffSeverity::Ignorable; }));
    REQUIRE(result.summary.by_severity.at(DiffSeverity::Ignorable) == result.differences.size());
    REQUIRE(result.summary.preservation_rate > 95.0);
    REQUIRE(result.summary.critical_changes.empty());

    SECTION("each kind of noise is reported") {
        auto has = [&](DiffCategory category, const std::string& suffix) {
            return std::any_of(result.differences.begin(), result.differences.end(), [&](const SemanticDifference& d) {
                return d.category == category && d.location.size() >= suffix.size() &&
                       d.location.compare(d.location.size() - suffix.size(), suffix.size(), suffix) == 0;
            });
        };
        REQUIRE(has(DiffCategory::Modified, "/w:p[1]/@w:rsidR"));
        REQUIRE(has(DiffCategory::Added, "/w:p[1]/@w:rsidRDefault"));
        REQUIRE(has(DiffCategory::Modified, "/w:p[1]/@w14:paraId"));
        REQUIRE(has(DiffCategory::Added, "/w:p[2]/w:proofErr[1]"));
    }
}

// ============================================================
// Classification
// ============================================================

TEST_CASE("A carrier attribute change takes the carrier's weight", "[diff][severity]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocumentBlueHeading,
                                             DocumentType::Word);

    REQUIRE(result.differences.size() == 1);
    const auto& d = result.differences.front();
    REQUIRE(d.category == DiffCategory::Modified);
    REQUIRE(at_least(d.severity, DiffSeverity::Major));
    REQUIRE(d.location == "/w:document[1]/w:body[1]/w:p[1]/w:r[1]/w:rPr[1]/w:color[1]/@w:val");
    REQUIRE(d.old_value == std::optional<std::string>{"FF0000"});
    REQUIRE(d.new_value == std::optional<std::string>{"0000FF"});
    REQUIRE(d.context.affects_styling);
    REQUIRE_FALSE(d.context.affects_content);
    REQUIRE(d.attribute.has_value());
    REQUIRE(d.attribute->local == "val");
    REQUIRE(result.summary.affected_units == 1);
    REQUIRE_THAT(result.summary.preservation_rate, WithinAbs(96.0, 1e-9));
}

TEST_CASE("A dropped paragraph is a critical content change", "[diff][severity]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWordDocumentLostParagraph,
                                             DocumentType::Word);

    REQUIRE(result.differences.size() == 1);
    const auto& d = result.differences.front();
    REQUIRE(d.category == DiffCategory::Dropped);
    REQUIRE(d.severity == DiffSeverity::Critical);
    REQUIRE(d.location == "/w:document[1]/w:body[1]/w:p[2]");
    REQUIRE(d.old_value == std::optional<std::string>{"Revenue grew in every region."});
    REQUIRE_FALSE(d.new_value.has_value());
    REQUIRE(d.context.affects_content);
    REQUIRE(d.context.affects_structure);

    REQUIRE(result.summary.critical_changes.size() == 1);
    REQUIRE(result.summary.affected_units == 5);
    REQUIRE_THAT(result.summary.preservation_rate, WithinAbs(80.0, 1e-9));

    SECTION("the reverse direction reports an addition") {
        auto reverse = engine.analyze_differences(samples::kWordDocumentLostParagraph, samples::kWordDocument,
                                                  DocumentType::Word);
        REQUIRE(reverse.differences.size() == 1);
        REQUIRE(reverse.differences.front().category == DiffCategory::Added);
        REQUIRE(reverse.differences.front().severity == DiffSeverity::Critical);
        REQUIRE(reverse.summary.preservation_rate == 100.0);
    }
}

TEST_CASE("Cell value changes are critical text changes", "[diff][severity]") {
    std::string changed = samples::kWorksheet;
    changed.replace(changed.find("<v>42</v>"), 9, "<v>43</v>");

    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWorksheet, changed, DocumentType::Excel);

    REQUIRE(result.differences.size() == 1);
    const auto& d = result.differences.front();
    REQUIRE(d.location == "/worksheet[1]/sheetData[1]/row[@r='1']/c[@r='B1']/v[1]/text()");
    REQUIRE(d.severity == DiffSeverity::Critical);
    REQUIRE(d.context.affects_content);
    REQUIRE_FALSE(d.attribute.has_value());
}

TEST_CASE("Different document elements", "[diff][structure]") {
    SemanticDiffEngine engine;
    auto result = engine.analyze_differences(samples::kWordDocument, samples::kWorksheet);

    REQUIRE(result.differences.size() == 2);
    REQUIRE(result.differences[0].category == DiffCategory::Dropped);
    REQUIRE(result.differences[1].category == DiffCategory::Added);
    REQUIRE(result.summary.preservation_rate == 0.0);
}

TEST_CASE("Empty documents", "[diff][structure]") {
    SemanticDiffEngine engine;

    SECTION("both empty") {
        auto result = engine.analyze_differences(ParsedDocument{}, ParsedDocument{});
        REQUIRE(result.differences.empty());
        REQUIRE(result.summary.preservation_rate == 100.0);
    }

    SECTION("everything removed") {
        auto original = parse_document(samples::kWordDocument);
        REQUIRE(original.has_value());
        auto result = engine.analyze_differences(*original, ParsedDocument{}, DocumentType::Word);
        REQUIRE(result.differences.size() == 1);
        REQUIRE(result.differences.front().category == DiffCategory::Dropped);
        REQUIRE(result.summary.preservation_rate == 0.0);
    }
}

TEST_CASE("Unreadable input", "[diff][parse]") {
    SemanticDiffEngine engine;

    SECTION("original") {
        auto result = engine.analyze_differences(samples::kMalformed, samples::kWordDocument);
        REQUIRE(result.parse_error.has_value());
        REQUIRE_THAT(*result.parse_error, StartsWith("original: "));
        REQUIRE(result.differences.empty());
        REQUIRE(result.summary.preservation_rate == 0.0);
    }

    SECTION("converted") {
        auto result = engine.analyze_differences(samples::kWordDocument, "");
        REQUIRE(result.parse_error.has_value());
        REQUIRE_THAT(*result.parse_error, StartsWith("converted: "));
        REQUIRE(result.summary.preservation_rate == 0.0);
        REQUIRE(result.summary.by_category.size() == all_diff_categories.size());
    }
}

// ============================================================
// Summaries, filters and metrics
// ============================================================

TEST_CASE("summarize_differences lists every category and severity", "[diff][summary]") {
    std::vector<SemanticDifference> diffs{
        make_difference(DiffCategory::Dropped, DiffSeverity::Critical),
        make_difference(DiffCategory::Modified, DiffSeverity::Minor),
    };
    auto summary = summarize_differences(diffs, 10, 3);

    REQUIRE(summary.total_differences == 2);
    REQUIRE(summary.by_category.size() == all_diff_categories.size());
    REQUIRE(summary.by_severity.size() == all_diff_severities.size());
    REQUIRE(summary.by_category.at(DiffCategory::Added) == 0);
    REQUIRE(summary.by_category.at(DiffCategory::Dropped) == 1);
    REQUIRE(summary.by_severity.at(DiffSeverity::Major) == 0);
    REQUIRE(summary.critical_changes.size() == 1);
    REQUIRE_THAT(summary.preservation_rate, WithinAbs(70.0, 1e-9));

    SECTION("affected units are capped by the document size") {
        REQUIRE(summarize_differences(diffs, 4, 10).preservation_rate == 0.0);
    }

    SECTION("an empty document is fully preserved") {
        REQUIRE(summarize_differences({}, 0, 0).preservation_rate == 100.0);
    }
}

TEST_CASE("filter_differences", "[diff][filter]") {
    std::vector<SemanticDifference> diffs{
        make_difference(DiffCategory::Dropped, DiffSeverity::Critical),
        make_difference(DiffCategory::Modified, DiffSeverity::Major),
        make_difference(DiffCategory::Added, DiffSeverity::Minor),
        make_difference(DiffCategory::Modified, DiffSeverity::Ignorable),
    };

    REQUIRE(filter_differences(diffs, DiffSeverity::Ignorable).size() == 4);
    REQUIRE(filter_differences(diffs, DiffSeverity::Major).size() == 2);
    REQUIRE(filter_differences(diffs, DiffSeverity::Critical).size() == 1);

    auto modified = filter_differences(diffs, DiffSeverity::Minor,
                                       std::vector<DiffCategory>{DiffCategory::Modified});
    REQUIRE(modified.size() == 1);
    REQUIRE(modified.front().severity == DiffSeverity::Major);

    REQUIRE(filter_differences(diffs, DiffSeverity::Ignorable, std::vector<DiffCategory>{}).empty());
}

TEST_CASE("get_preservation_metrics", "[diff][metrics]") {
    std::vector<SemanticDifference> diffs{
        make_difference(DiffCategory::Dropped, DiffSeverity::Critical, {true, false, false}),
        make_difference(DiffCategory::Dropped, DiffSeverity::Critical, {true, false, true}),
        make_difference(DiffCategory::Modified, DiffSeverity::Major, {false, true, false}),
    };

    auto metrics = get_preservation_metrics(diffs, 10);
    REQUIRE_THAT(metrics.overall_preservation, WithinAbs(0.7, 1e-9));
    REQUIRE_THAT(metrics.content_preservation, WithinAbs(0.8, 1e-9));
    REQUIRE_THAT(metrics.style_preservation, WithinAbs(0.9, 1e-9));
    REQUIRE_THAT(metrics.structure_preservation, WithinAbs(0.9, 1e-9));
    REQUIRE_THAT(metrics.change_ratio, WithinAbs(0.3, 1e-9));

    SECTION("zero elements clamps instead of dividing by zero") {
        auto empty = get_preservation_metrics(diffs, 0);
        REQUIRE(empty.overall_preservation == 0.0);
        REQUIRE(empty.change_ratio == 3.0);
    }

    SECTION("no differences") {
        auto clean = get_preservation_metrics({}, 10);
        REQUIRE(clean.overall_preservation == 1.0);
        REQUIRE(clean.change_ratio == 0.0);
    }
}
