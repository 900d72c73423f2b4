#include <catch2/catch.hpp>
#include <trellis/json_response.hpp>

using namespace trellis;

TEST_CASE("bare JSON object parses", "[json_response]") {
    auto r = parse_json_response(R"({"nodes": [], "complexity": 1})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["complexity"] == 1);
}

TEST_CASE("surrounding whitespace is ignored", "[json_response]") {
    auto r = parse_json_response("\n\n   {\"a\": 1}  \n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["a"] == 1);
}

TEST_CASE("json code fence is stripped", "[json_response]") {
    auto r = parse_json_response("```json\n{\"a\": 1}\n```");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["a"] == 1);
}

TEST_CASE("plain code fence is stripped", "[json_response]") {
    auto r = parse_json_response("```\n{\"a\": [1, 2]}\n```\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["a"].size() == 2);
}

TEST_CASE("unterminated fence still yields the body", "[json_response]") {
    auto r = parse_json_response("```json\n{\"a\": true}");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["a"] == true);
}

TEST_CASE("prose around the object is skipped", "[json_response]") {
    auto r = parse_json_response("Here is the graph:\n{\"a\": {\"b\": 2}}\nHope this helps!");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()["a"]["b"] == 2);
}

TEST_CASE("plain text is MalformedResponse", "[json_response]") {
    auto r = parse_json_response("I cannot draw that flowchart.");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::MalformedResponse);
    REQUIRE(r.error().message.find("I cannot draw") != std::string::npos);
}

TEST_CASE("JSON array is MalformedResponse", "[json_response]") {
    REQUIRE(parse_json_response("[1, 2, 3]").has_code(TrellisError::MalformedResponse));
}

TEST_CASE("truncated object is MalformedResponse", "[json_response]") {
    REQUIRE(parse_json_response("{\"nodes\": [").has_code(TrellisError::MalformedResponse));
}

TEST_CASE("empty text is MalformedResponse", "[json_response]") {
    REQUIRE(parse_json_response("").has_code(TrellisError::MalformedResponse));
    REQUIRE(parse_json_response("   ").has_code(TrellisError::MalformedResponse));
}

TEST_CASE("error preview is capped", "[json_response]") {
    std::string text(500, 'z');
    auto r = parse_json_response(text);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.size() < 200);
}
