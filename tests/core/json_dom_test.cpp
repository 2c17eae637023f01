#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace json = reconkit::core::json;

TEST_CASE("JSON DOM parses nested catalog documents", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({
    "platforms": [
      {"name": "GitHub", "url": "https://github.com/{}", "markers": ["Not Found"]},
      {"name": "Quoted \"Name\"", "url": "https://x/{}", "enabled": true, "weight": -1.5e2}
    ],
    "version": null
  })",
                      root, error));
  REQUIRE(root.is_object());

  const json::Value* platforms = json::FindField(root, "platforms");
  REQUIRE(platforms != nullptr);
  REQUIRE(platforms->is_array());
  REQUIRE(platforms->array_value.size() == 2U);

  const json::Value& second = platforms->array_value[1];
  REQUIRE(json::GetStringOr(second, "name", "") == "Quoted \"Name\"");
  REQUIRE(json::FindField(second, "weight")->number_value == -150.0);
  REQUIRE(json::FindField(second, "enabled")->bool_value);
  REQUIRE(json::FindField(root, "version")->type == json::Value::Type::kNull);
}

TEST_CASE("JSON DOM lookups fall back on missing or mistyped fields", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"city": 42})", root, error));
  REQUIRE(json::GetStringOr(root, "city", "Unknown") == "Unknown");
  REQUIRE(json::GetStringOr(root, "country", "Unknown") == "Unknown");
  REQUIRE(json::FindField(root, "missing") == nullptr);

  json::Value array;
  REQUIRE(json::Parse("[1,2]", array, error));
  REQUIRE(json::FindField(array, "city") == nullptr);
}

TEST_CASE("JSON DOM reports position of malformed input", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse("{\"platforms\": [1, 2,]}", root, error));
  REQUIRE(error.find("line 1") != std::string::npos);

  REQUIRE_FALSE(json::Parse("{\n  \"a\": 1\n  \"b\": 2\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);

  REQUIRE_FALSE(json::Parse("{} trailing", root, error));
  REQUIRE_FALSE(json::Parse("", root, error));
}

TEST_CASE("QuoteJson escapes control characters", "[core][json]") {
  REQUIRE(reconkit::core::QuoteJson("a\"b\\c\n") == R"("a\"b\\c\n")");
}

TEST_CASE("EscapeJson keeps valid UTF-8 and replaces invalid bytes", "[core][json]") {
  using reconkit::core::EscapeJson;
  // "Zürich" and a 4-byte emoji pass through untouched.
  REQUIRE(EscapeJson("Z\xC3\xBCrich \xF0\x9F\x98\x80") == "Z\xC3\xBCrich \xF0\x9F\x98\x80");

  // Stray continuation byte, Latin-1 byte, truncated sequence, overlong form
  // and an encoded surrogate.
  REQUIRE(EscapeJson("a\x80z") == "a\\ufffdz");
  REQUIRE(EscapeJson("caf\xE9") == "caf\\ufffd");
  REQUIRE(EscapeJson("x\xE2\x82") == "x\\ufffd\\ufffd");
  REQUIRE(EscapeJson("\xC0\xAF") == "\\ufffd\\ufffd");
  REQUIRE(EscapeJson("\xED\xA0\x80") == "\\ufffd\\ufffd\\ufffd");

  // A banner with raw binary bytes still exports as parseable JSON.
  const std::string banner = "SSH-2.0-\xFF\xFEserver\x01";
  json::Value root;
  std::string error;
  REQUIRE(json::Parse("{\"banner\":" + reconkit::core::QuoteJson(banner) + "}", root, error));
  REQUIRE(json::GetStringOr(root, "banner", "") ==
          "SSH-2.0-\xEF\xBF\xBD\xEF\xBF\xBDserver\x01");
}
