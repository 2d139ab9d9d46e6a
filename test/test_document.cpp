// test_document.cpp - Tests for parsing, the node arena and locations

#include <catch2/catch_all.hpp>
#include <ooxml_fidelity/document.h>
#include <ooxml_fidelity/location.h>
#include <ooxml_fidelity/namespaces.h>
#include <ooxml_fidelity/xml_reader.h>

#include "sample_parts.h"

#include <stdexcept>
#include <string>

using namespace ooxml_fidelity;

namespace {

QName w(const char* local) {
    return QName{std::string(ns::wordprocessingml), local};
}

} // namespace

// ============================================================
// parse_document
// ============================================================

TEST_CASE("parse_document resolves prefixes to namespace URIs", "[document][parse]") {
    auto doc = parse_document(samples::kWordDocument);
    REQUIRE(doc.has_value());
    REQUIRE_FALSE(doc->empty());

    const Node& root = doc->node(doc->root());
    REQUIRE(root.name == w("document"));
    REQUIRE(root.parent == kNoNode);
    REQUIRE(root.attributes.empty());  // xmlns declarations are not attributes

    SECTION("different prefixes give identical trees") {
        auto renamed = parse_document(samples::kWordDocumentRenamedPrefixes);
        REQUIRE(renamed.has_value());
        REQUIRE(renamed->size() == doc->size());
        for (NodeId id = 0; id < doc->size(); ++id) {
            REQUIRE(renamed->node(id).name == doc->node(id).name);
            REQUIRE(renamed->node(id).attributes == doc->node(id).attributes);
        }
    }

    SECTION("text is kept, whitespace-only text is dropped") {
        const Node& body = doc->node(root.children.at(0));
        REQUIRE(body.name == w("body"));
        REQUIRE_FALSE(body.has_text());
        REQUIRE(doc->subtree_text(doc->root()) == "Quarterly reportRevenue grew in every region.");
    }

    SECTION("attributes keep their namespace") {
        const Node& p = doc->node(doc->node(root.children.at(0)).children.at(0));
        REQUIRE(p.name == w("p"));
        const std::string* rsid = p.attribute(w("rsidR"));
        REQUIRE(rsid != nullptr);
        REQUIRE(*rsid == "00A1B2C3");
        const std::string* para_id = p.attribute(QName{std::string(ns::word2010), "paraId"});
        REQUIRE(para_id != nullptr);
        REQUIRE(p.attribute(QName{"", "rsidR"}) == nullptr);
        REQUIRE(p.attribute_by_local("paraId") == para_id);
    }
}

TEST_CASE("parse_document rejects malformed and empty input", "[document][parse]") {
    std::string error;

    SECTION("unbalanced tags") {
        REQUIRE_FALSE(parse_document(samples::kMalformed, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("empty bytes") {
        REQUIRE_FALSE(parse_document("", &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("no error sink") {
        REQUIRE_FALSE(parse_document("not xml at all").has_value());
    }
}

// ============================================================
// ParsedDocument / DocumentBuilder
// ============================================================

TEST_CASE("count_comparable_units counts elements, attributes and texts", "[document][units]") {
    auto sheet = parse_document(samples::kWorksheet);
    REQUIRE(sheet.has_value());
    // 11 elements, 6 attributes, 4 non-blank texts
    REQUIRE(count_comparable_units(*sheet) == 21);
    REQUIRE(count_comparable_units(ParsedDocument{}) == 0);
}

TEST_CASE("ParsedDocument subtree queries", "[document][subtree]") {
    DocumentBuilder b;
    b.open(w("body"), {});
    const NodeId p1 = b.open(w("p"), {Attribute{w("rsidR"), "00AA"}});
    const NodeId r1 = b.open(w("r"), {});
    b.open(w("t"), {});
    b.append_text("Hello");
    b.close();
    b.close();
    b.close();
    const NodeId p2 = b.open(w("p"), {});
    b.close();
    b.close();
    REQUIRE(b.open_depth() == 0);
    ParsedDocument doc = b.finish();

    REQUIRE(doc.size() == 5);
    REQUIRE(doc.subtree_end(p1) == p2);
    REQUIRE(doc.subtree_end(doc.root()) == 5);
    REQUIRE(doc.subtree_units(p1) == 5);  // p, rsidR, r, t, "Hello"
    REQUIRE(doc.subtree_has_text(p1));
    REQUIRE_FALSE(doc.subtree_has_text(p2));
    REQUIRE(doc.is_within(r1, p1));
    REQUIRE_FALSE(doc.is_within(r1, p2));
    REQUIRE(doc.node(r1).depth == 2);
}

TEST_CASE("DocumentBuilder refuses unfinished trees", "[document][builder]") {
    SECTION("open element") {
        DocumentBuilder b;
        b.open(w("document"), {});
        REQUIRE_THROWS_AS(b.finish(), std::logic_error);
    }

    SECTION("second root") {
        DocumentBuilder b;
        b.open(w("document"), {});
        b.close();
        REQUIRE_THROWS_AS(b.open(w("document"), {}), std::logic_error);
        REQUIRE(b.finish().size() == 1);
    }

    SECTION("nothing opened") {
        DocumentBuilder b;
        REQUIRE(b.finish().empty());
    }
}

TEST_CASE("to_display_string uses canonical prefixes", "[document][names]") {
    REQUIRE(to_display_string(w("color")) == "w:color");
    REQUIRE(to_display_string(QName{std::string(ns::word2010), "paraId"}) == "w14:paraId");
    REQUIRE(to_display_string(QName{std::string(ns::spreadsheetml), "row"}) == "row");
    REQUIRE(to_display_string(QName{"", "val"}) == "val");
    REQUIRE(to_display_string(QName{"urn:example", "thing"}) == "{urn:example}thing");
}

TEST_CASE("namespace table", "[document][namespaces]") {
    REQUIRE(canonical_prefix(ns::drawingml) == std::optional<std::string_view>{"a"});
    REQUIRE(canonical_prefix(ns::spreadsheetml) == std::optional<std::string_view>{""});
    REQUIRE_FALSE(canonical_prefix("urn:unknown").has_value());
    REQUIRE(namespace_uri("w") == std::optional<std::string_view>{ns::wordprocessingml});
    REQUIRE(namespace_uri("x") == std::optional<std::string_view>{ns::spreadsheetml});
    REQUIRE_FALSE(namespace_uri("zz").has_value());
    REQUIRE(is_metadata_namespace(ns::core_properties));
    REQUIRE_FALSE(is_metadata_namespace(ns::wordprocessingml));
}

// ============================================================
// Locations
// ============================================================

TEST_CASE("node_location renders keyed steps", "[location]") {
    auto sheet = parse_document(samples::kWorksheet);
    REQUIRE(sheet.has_value());

    // worksheet > sheetData > row(1) > c(A1) > v
    const Node& sheet_data = sheet->node(sheet->node(sheet->root()).children.at(0));
    const NodeId row1 = sheet_data.children.at(0);
    const NodeId a1 = sheet->node(row1).children.at(0);
    const NodeId v = sheet->node(a1).children.at(0);

    REQUIRE(node_location(*sheet, sheet->root()) == "/worksheet[1]");
    REQUIRE(node_location(*sheet, v) == "/worksheet[1]/sheetData[1]/row[@r='1']/c[@r='A1']/v[1]");
    REQUIRE(text_location(node_location(*sheet, v)) ==
            "/worksheet[1]/sheetData[1]/row[@r='1']/c[@r='A1']/v[1]/text()");
    REQUIRE(attribute_location("/w:document[1]", w("val")) == "/w:document[1]/@w:val");
}

TEST_CASE("child_keys count occurrences per name", "[location]") {
    auto doc = parse_document(samples::kWordDocument);
    REQUIRE(doc.has_value());
    const NodeId body = doc->node(doc->root()).children.at(0);

    const auto keys = child_keys(*doc, body);
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0].occurrence == 1);
    REQUIRE(keys[1].occurrence == 2);
    REQUIRE(format_step(keys[1]) == "w:p[2]");
    REQUIRE(identity_attribute(doc->node(body)) == nullptr);
}

TEST_CASE("location_matches uses segment-aligned containment", "[location][pattern]") {
    const std::string text = "/w:document[1]/w:body[1]/w:p[2]/w:r[1]/w:t[1]/text()";
    const std::string color = "/w:document[1]/w:body[1]/w:p[1]/w:r[1]/w:rPr[1]/w:color[1]/@w:val";
    const std::string rsid = "/w:document[1]/w:body[1]/w:p[1]/@w:rsidRDefault";

    SECTION("descendant patterns") {
        REQUIRE(location_matches("//w:t", text));
        REQUIRE(location_matches("//w:color", color));
        REQUIRE_FALSE(location_matches("//w:tbl", text));
    }

    SECTION("segments match by name prefix") {
        REQUIRE(location_matches("//w:rsid", "/w:document[1]/w:body[1]/w:p[1]/@w:rsidR"));
        REQUIRE(location_matches("//w:rsid", rsid));
        REQUIRE(location_matches("rsid", rsid));
        REQUIRE(location_matches("//lastModified", "/cp:coreProperties[1]/cp:lastModifiedBy[1]/text()"));
        REQUIRE_FALSE(location_matches("//w:rsid", color));
        REQUIRE_FALSE(location_matches("//v", "/worksheet[1]/sheetData[1]/row[@r='1']/c[@r='A1']/@r"));
        REQUIRE(location_matches("//v", "/worksheet[1]/sheetData[1]/row[@r='1']/c[@r='A1']/v[1]/text()"));
    }

    SECTION("attribute globs") {
        REQUIRE(location_matches("//@w:rsid*", rsid));
        REQUIRE_FALSE(location_matches("//@w:rsid*", color));
    }

    SECTION("unprefixed segments match local names") {
        REQUIRE(location_matches("//color", color));
        REQUIRE(location_matches("//w:p//w:t", text));
        REQUIRE_FALSE(location_matches("//w:p/w:t", text));
    }

    SECTION("predicates with slashes do not split") {
        REQUIRE(location_matches("//w:style/w:rPr",
                                 "/w:styles[1]/w:style[@w:styleId='a/b']/w:rPr[1]"));
    }

    SECTION("empty pattern matches nothing") {
        REQUIRE_FALSE(location_matches("", text));
        REQUIRE_FALSE(location_matches("//", text));
    }
}
