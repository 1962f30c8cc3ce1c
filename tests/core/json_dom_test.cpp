#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <string>

using relpack::core::json::Parse;
using relpack::core::json::Value;

TEST_CASE("Nested objects arrays and scalars parse", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"name":"demo","uid":1000,"strict":true,"tags":["latest","2.4.1"],"x":null})",
                root, error));
  REQUIRE(root.IsObject());

  const Value* name = root.Find("name");
  REQUIRE(name != nullptr);
  REQUIRE(name->IsString());
  REQUIRE(name->string_value == "demo");

  const Value* uid = root.Find("uid");
  REQUIRE(uid != nullptr);
  REQUIRE(uid->IsNumber());
  REQUIRE(uid->number_value == 1000.0);

  const Value* strict = root.Find("strict");
  REQUIRE(strict != nullptr);
  REQUIRE(strict->IsBool());
  REQUIRE(strict->bool_value);

  const Value* tags = root.Find("tags");
  REQUIRE(tags != nullptr);
  REQUIRE(tags->IsArray());
  REQUIRE(tags->array_value.size() == 2U);
  REQUIRE(tags->array_value[1].string_value == "2.4.1");

  REQUIRE(root.Find("x") != nullptr);
  REQUIRE(root.Find("missing") == nullptr);
  REQUIRE(tags->Find("latest") == nullptr);
}

TEST_CASE("String escapes decode", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"("tab\tquote\"slash\/\u00e9")", root, error));
  REQUIRE(root.string_value == "tab\tquote\"slash/\xc3\xa9");
}

TEST_CASE("Parse errors carry line and column", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse("{\n  \"a\": 1,\n  \"b\" 2\n}", root, error));
  REQUIRE(error.rfind("parse error at line 3, col ", 0) == 0U);
  REQUIRE(error.find("expected ':' after object key") != std::string::npos);

  REQUIRE_FALSE(Parse("[1, 2] trailing", root, error));
  REQUIRE(error.find("unexpected trailing content") != std::string::npos);

  REQUIRE_FALSE(Parse("\"open", root, error));
  REQUIRE(error.find("unterminated string literal") != std::string::npos);
}

TEST_CASE("Excessive nesting is rejected", "[core][json]") {
  Value root;
  std::string error;
  const std::string deep = std::string(100, '[') + std::string(100, ']');
  REQUIRE_FALSE(Parse(deep, root, error));
  REQUIRE(error.find("nesting too deep") != std::string::npos);
}
