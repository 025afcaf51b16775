#include <catch2/catch.hpp>

#include "io/json_reader.hpp"
#include "io/json_writer.hpp"

#include <limits>
#include <optional>
#include <sstream>

using namespace wormsim;

TEST_CASE("Reader parses nested documents in key order", "[json][reader]") {
    auto doc = JsonReader::parse(R"({
        "name": "iridium",
        "planes": 6,
        "beta": 0.25,
        "enabled": true,
        "stations": [{"id": "GS0"}, {"id": "GS1"}],
        "nothing": null
    })");

    REQUIRE(doc.is_object());
    REQUIRE(doc.keys() == std::vector<std::string>{"name", "planes", "beta", "enabled",
                                                    "stations", "nothing"});
    REQUIRE(doc["name"].as_string() == "iridium");
    REQUIRE(doc["planes"].as_int() == 6);
    REQUIRE(doc["beta"].as_number() == Approx(0.25));
    REQUIRE(doc["enabled"].as_bool());
    REQUIRE(doc["stations"].size() == 2);
    REQUIRE(doc["stations"][1]["id"].as_string() == "GS1");
    REQUIRE(doc["nothing"].is_null());

    SECTION("missing members read as null and lenient getters fall back") {
        REQUIRE_FALSE(doc.has("missing"));
        REQUIRE(doc["missing"].is_null());
        REQUIRE(doc["missing"].get_number(3.5) == Approx(3.5));
        REQUIRE(doc["stations"][7].is_null());
    }

    SECTION("strict accessors reject the wrong type") {
        REQUIRE_THROWS_AS(doc["name"].as_number(), std::runtime_error);
        REQUIRE_THROWS_AS(doc["beta"].as_int(), std::runtime_error);
        REQUIRE_THROWS_AS(doc["planes"].as_string(), std::runtime_error);
    }
}

TEST_CASE("Reader reports malformed input with its position", "[json][reader][errors]") {
    SECTION("duplicate keys") {
        try {
            JsonReader::parse("{\n  \"a\": 1,\n  \"a\": 2\n}");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.line() == 3);
            REQUIRE(std::string(e.what()).find("duplicate") != std::string::npos);
        }
    }

    SECTION("trailing content") {
        REQUIRE_THROWS_AS(JsonReader::parse("{} extra"), JsonParseError);
    }

    SECTION("bad literal") {
        try {
            JsonReader::parse("{\"a\": tru}");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.line() == 1);
            REQUIRE(e.column() > 1);
        }
    }

    SECTION("unterminated structures") {
        REQUIRE_THROWS_AS(JsonReader::parse("[1, 2"), JsonParseError);
        REQUIRE_THROWS_AS(JsonReader::parse("{\"a\": \"open"), JsonParseError);
        REQUIRE_THROWS_AS(JsonReader::parse(""), JsonParseError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(JsonReader::parse_file("/nonexistent/scenario.json"),
                          std::runtime_error);
    }
}

TEST_CASE("Writer emits compact JSON lines", "[json][writer]") {
    std::ostringstream os;
    JsonWriter w(os, 0);
    w.begin_object()
        .kv("type", "trial_complete")
        .kv("trial", 3)
        .kv("done", true)
        .kv("churn", std::optional<double>())
        .kv("ratio", 0.5);
    w.key("empty").begin_array().end_array();
    w.key("ids").begin_array().value(1).value(2).end_array();
    w.end_object();

    REQUIRE(os.str() == R"({"type":"trial_complete","trial":3,"done":true,"churn":null,)"
                        R"("ratio":0.5,"empty":[],"ids":[1,2]})");
}

TEST_CASE("Writer escapes strings and nulls non-finite numbers", "[json][writer]") {
    std::ostringstream os;
    JsonWriter w(os, 0);
    w.begin_array()
        .value("a\"b\\c\n")
        .value(std::numeric_limits<double>::infinity())
        .value(std::optional<int>(4))
        .end_array();
    REQUIRE(os.str() == "[\"a\\\"b\\\\c\\n\",null,4]");

    SECTION("written output parses back") {
        auto doc = JsonReader::parse(os.str());
        REQUIRE(doc[0].as_string() == "a\"b\\c\n");
        REQUIRE(doc[1].is_null());
        REQUIRE(doc[2].as_int() == 4);
    }
}

TEST_CASE("Indented output is valid JSON", "[json][writer]") {
    std::ostringstream os;
    JsonWriter w(os);
    w.begin_object().kv("a", 1);
    w.key("b").begin_object().kv("c", "d").end_object();
    w.end_object();

    auto doc = JsonReader::parse(os.str());
    REQUIRE(doc["b"]["c"].as_string() == "d");
    REQUIRE(os.str().find('\n') != std::string::npos);
}
