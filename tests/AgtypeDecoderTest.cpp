#include <catch2/catch_test_macros.hpp>
#include "agtype/AgtypeDecoder.hpp"
#include "errors/Errors.hpp"

using namespace agegraph;
using namespace agegraph::agtype;

TEST_CASE("decodeScalar - object text", "[agtype]") {
    auto value = decodeScalar(R"({"a":1})");

    REQUIRE(value.is_object());
    CHECK(value["a"] == 1);
}

TEST_CASE("decodeScalar - array text", "[agtype]") {
    auto value = decodeScalar("[1,2]");

    REQUIRE(value.is_array());
    CHECK(value == json::array({1, 2}));
}

TEST_CASE("decodeScalar - plain text passes through", "[agtype]") {
    CHECK(decodeScalar("plain") == json("plain"));
    CHECK(decodeScalar("42") == json("42"));
    CHECK(decodeScalar("") == json(""));
    CHECK(decodeScalar("{unbalanced") == json("{unbalanced"));
}

TEST_CASE("decodeScalar - malformed object raises DecodeError with text", "[agtype]") {
    const std::string text = R"({"a":})";

    try {
        decodeScalar(text);
        FAIL("expected DecodeError");
    }
    catch (const errors::DecodeError& e) {
        CHECK(e.text() == text);
    }
}

TEST_CASE("isTagged", "[agtype]") {
    CHECK(isTagged(json("{}::vertex")));
    CHECK(isTagged(json("1::numeric")));
    CHECK_FALSE(isTagged(json("plain")));
    CHECK_FALSE(isTagged(json(1)));
    CHECK_FALSE(isTagged(json(nullptr)));
}

TEST_CASE("stripTags removes vertex and edge tags only", "[agtype]") {
    CHECK(stripTags(R"({"a":1}::vertex)") == R"({"a":1})");
    CHECK(stripTags(R"({"a":1}::edge,{"b":2}::vertex)") == R"({"a":1},{"b":2})");
    CHECK(stripTags("12::numeric") == "12::numeric");
}

TEST_CASE("decodeRow - tagged value replaced by decoded payload", "[agtype]") {
    Row row{{"v", R"({"label":"Person"}::vertex)"}};

    Row decoded = decodeRow(row);

    REQUIRE(decoded.contains("v"));
    CHECK(decoded.at("v") == json{{"label", "Person"}});
}

TEST_CASE("decodeRow - untagged values pass through unchanged", "[agtype]") {
    Row row{{"id", 7}, {"name", "Alice"}, {"missing", nullptr}};

    Row decoded = decodeRow(row);

    CHECK(decoded == row);
    CHECK(decoded.columnNames() == std::vector<std::string>{"id", "name", "missing"});
}

TEST_CASE("decodeRow - other tags are kept as text", "[agtype]") {
    Row row{{"n", "12::numeric"}};

    CHECK(decodeRow(row).at("n") == json("12::numeric"));
}

TEST_CASE("decodeRow - malformed tagged payload raises DecodeError", "[agtype]") {
    Row row{{"v", R"({"label":}::vertex)"}};

    CHECK_THROWS_AS(decodeRow(row), errors::DecodeError);
}

TEST_CASE("decodeBatch - rows without tagged values give an empty result", "[agtype]") {
    std::vector<Row> rows{
        Row{{"id", 1}, {"name", "plain"}},
        Row{{"id", 2}}
    };

    CHECK(decodeBatch(rows).empty());
    CHECK(decodeBatch({}).empty());
}

TEST_CASE("decodeBatch - vertices and edges across rows in order", "[agtype]") {
    std::vector<Row> rows{
        Row{{"a", R"({"id":1,"label":"City","properties":{}}::vertex)"}},
        Row{{"e", R"({"id":3,"label":"ROAD","start_id":1,"end_id":2,"properties":{}}::edge)"},
            {"b", R"({"id":2,"label":"City","properties":{}}::vertex)"}}
    };

    auto decoded = decodeBatch(rows);

    REQUIRE(decoded.size() == 3);
    CHECK(decoded[0]["id"] == 1);
    CHECK(decoded[1]["label"] == "ROAD");
    CHECK(decoded[2]["id"] == 2);
}

TEST_CASE("decodeBatch - path tags are not stripped", "[agtype]") {
    std::vector<Row> rows{
        Row{{"p", R"([{"id":1,"label":"A","properties":{}}::vertex, {"id":2,"label":"B","properties":{}}::vertex]::path)"}}
    };

    // Only ::vertex and ::edge are stripped, so the ::path tag breaks the JSON
    CHECK_THROWS_AS(decodeBatch(rows), errors::DecodeError);
}

TEST_CASE("decodeBatch - malformed payload raises DecodeError", "[agtype]") {
    std::vector<Row> rows{Row{{"v", R"({"label":"X"::vertex)"}}};

    CHECK_THROWS_AS(decodeBatch(rows), errors::DecodeError);
}

TEST_CASE("Row keeps column order and replaces in place", "[agtype]") {
    Row row;
    row.set("b", 1);
    row.set("a", 2);
    row.set("b", 3);

    CHECK(row.size() == 2);
    CHECK(row.columnNames() == std::vector<std::string>{"b", "a"});
    CHECK(row.at("b") == 3);
    CHECK(row.toJson() == json{{"a", 2}, {"b", 3}});
    CHECK_THROWS_AS(row.at("c"), std::out_of_range);
}
