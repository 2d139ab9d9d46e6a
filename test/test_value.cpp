// test_value.cpp - Tests for Value records, builders and JSON

#include <catch2/catch_all.hpp>
#include <ooxml_fidelity/builders.h>
#include <ooxml_fidelity/serialization.h>
#include <ooxml_fidelity/value.h>

#include <string>

using namespace ooxml_fidelity;

// ============================================================
// Value
// ============================================================

TEST_CASE("Value holds scalars", "[value][scalar]") {
    SECTION("null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.as_string("fallback") == "fallback");
    }

    SECTION("integers and sizes share one representation") {
        Value a{42};
        Value b{std::size_t{42}};
        REQUIRE(a == b);
        REQUIRE(a.is_number());
        REQUIRE(a.as_int64() == 42);
        REQUIRE(a.as_number() == 42.0);
    }

    SECTION("strings from every source type") {
        std::string owned = "w:color";
        std::string_view view = owned;
        REQUIRE(Value{owned} == Value{"w:color"});
        REQUIRE(Value{view}.as_string_view() == "w:color");
    }

    SECTION("double") {
        Value v{97.5};
        REQUIRE(v.as_double() == 97.5);
        REQUIRE(v.get_if<double>() != nullptr);
        REQUIRE(v.get_if<int64_t>() == nullptr);
    }
}

TEST_CASE("Value containers are persistent", "[value][container]") {
    Value record = Value::map({{"name", Value{"normal"}}, {"level", Value{"normal"}}});
    Value updated = record.set("level", Value{"strict"});

    REQUIRE(record.at("level").as_string() == "normal");
    REQUIRE(updated.at("level").as_string() == "strict");
    REQUIRE(updated.contains("name"));
    REQUIRE_FALSE(updated.contains("rules"));
    REQUIRE(updated.at("rules").is_null());
    REQUIRE(updated.at_or("rules", Value{0}).as_int64() == 0);

    Value list = Value::vector({Value{1}, Value{2}});
    Value longer = list.push_back(Value{3});
    REQUIRE(list.size() == 2);
    REQUIRE(longer.size() == 3);
    REQUIRE(longer.at(std::size_t{2}).as_int64() == 3);
    REQUIRE(longer.at(std::size_t{9}).is_null());
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("MapBuilder and VectorBuilder", "[value][builder]") {
    std::optional<std::string> present = "FF0000";
    std::optional<std::string> absent;

    Value record = MapBuilder()
                       .set("location", "/w:document[1]")
                       .set("count", std::size_t{3})
                       .set_optional("old_value", present)
                       .set_optional("new_value", absent)
                       .finish();

    REQUIRE(record.size() == 4);
    REQUIRE(record.at("old_value").as_string() == "FF0000");
    REQUIRE(record.contains("new_value"));
    REQUIRE(record.at("new_value").is_null());

    VectorBuilder builder;
    builder.push_back("a").push_back(2).push_back(record);
    REQUIRE(builder.size() == 3);
    Value list = builder.finish();
    REQUIRE(list.at(std::size_t{2}).at("count").as_int64() == 3);
}

// ============================================================
// JSON
// ============================================================

TEST_CASE("to_json renders sorted keys", "[value][json]") {
    Value record = MapBuilder().set("zeta", 1).set("alpha", true).set("mid", Value{}).finish();
    REQUIRE(to_json(record, true) == R"({"alpha":true,"mid":null,"zeta":1})");

    SECTION("escapes") {
        Value text{"line\n\"quoted\"\t\\"};
        REQUIRE(to_json(text, true) == R"("line\n\"quoted\"\t\\")");
    }

    SECTION("pretty printing indents nested containers") {
        Value nested = MapBuilder().set("items", Value::vector({Value{1}})).finish();
        REQUIRE(to_json(nested) == "{\n  \"items\": [\n    1\n  ]\n}");
    }
}

TEST_CASE("JSON round trip keeps numbers exact", "[value][json]") {
    const double rates[] = {0.1, 33.333333333333336, 97.5, 1e-9};
    for (double rate : rates) {
        Value parsed = from_json(to_json(Value{rate}, true));
        REQUIRE(parsed.as_number() == rate);
    }

    // whole doubles read back as integers; as_number covers both
    Value whole = from_json(to_json(Value{5.0}, true));
    REQUIRE(whole.as_number() == 5.0);
}

TEST_CASE("from_json decodes unicode escapes to UTF-8", "[value][json]") {
    REQUIRE(from_json(R"("\u00e9")").as_string() == "\xC3\xA9");
    REQUIRE(from_json(R"("\u20ac")").as_string() == "\xE2\x82\xAC");

    // one code point from a surrogate pair, not two 3-byte sequences
    const std::string emoji = from_json(R"("\ud83d\ude00")").as_string();
    REQUIRE(emoji == "\xF0\x9F\x98\x80");
    REQUIRE(emoji.size() == 4);
}

TEST_CASE("from_json reports malformed input", "[value][json]") {
    std::string error;

    SECTION("unterminated object") {
        Value v = from_json(R"({"name": "strict")", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("trailing characters") {
        Value v = from_json("[1, 2] x", &error);
        REQUIRE(v.is_null());
        REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("Trailing"));
    }

    SECTION("empty input") {
        Value v = from_json("   ", &error);
        REQUIRE(v.is_null());
        REQUIRE(error == "Empty JSON input");
    }

    SECTION("unpaired surrogates") {
        Value lone_high = from_json(R"("\ud83d x")", &error);
        REQUIRE(lone_high.is_null());
        REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("Unpaired high surrogate"));

        Value lone_low = from_json(R"("\ude00")", &error);
        REQUIRE(lone_low.is_null());
        REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("Unpaired low surrogate"));
    }

    SECTION("valid input leaves the error untouched") {
        Value v = from_json(R"({"rules": [{"max_absolute": null}]})", &error);
        REQUIRE(error.empty());
        REQUIRE(v.at("rules").at(std::size_t{0}).at("max_absolute").is_null());
    }
}
