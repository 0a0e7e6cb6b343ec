#include "lsp/document_symbol.hpp"

#include <string>
#include <variant>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lsp/basic.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

TEST_CASE("Range serialization", "[lsp]") {
  lsp::Range range{
      .start = {.line = 10, .character = 20},
      .end = {.line = 15, .character = 30}};

  nlohmann::json j = range;
  REQUIRE(j["start"]["line"] == 10);
  REQUIRE(j["start"]["character"] == 20);
  REQUIRE(j["end"]["line"] == 15);
  REQUIRE(j["end"]["character"] == 30);

  auto decoded = j.get<lsp::Range>();
  REQUIRE(decoded == range);
}

TEST_CASE("Range containment is inclusive of both ends", "[lsp]") {
  lsp::Range outer{
      .start = {.line = 1, .character = 0}, .end = {.line = 5, .character = 0}};
  REQUIRE(outer.Contains(lsp::Position{.line = 1, .character = 0}));
  REQUIRE(outer.Contains(lsp::Position{.line = 5, .character = 0}));
  REQUIRE_FALSE(outer.Contains(lsp::Position{.line = 5, .character = 1}));
  REQUIRE(outer.Contains(lsp::Range{
      .start = {.line = 2, .character = 4},
      .end = {.line = 3, .character = 0}}));
}

TEST_CASE("Hierarchical documentSymbol response decodes", "[lsp]") {
  auto j = nlohmann::json::parse(R"([
    {
      "name": "Greeter",
      "kind": 5,
      "range": {"start": {"line": 0, "character": 0},
                "end": {"line": 3, "character": 12}},
      "selectionRange": {"start": {"line": 0, "character": 6},
                         "end": {"line": 0, "character": 13}},
      "children": [
        {
          "name": "greet",
          "kind": 6,
          "detail": "(self)",
          "range": {"start": {"line": 1, "character": 4},
                    "end": {"line": 3, "character": 12}},
          "selectionRange": {"start": {"line": 1, "character": 8},
                             "end": {"line": 1, "character": 13}}
        }
      ]
    }
  ])");

  auto result = lsp::ParseDocumentSymbolResult(j);
  const auto* symbols = std::get_if<std::vector<lsp::DocumentSymbol>>(&result);
  REQUIRE(symbols != nullptr);
  REQUIRE(symbols->size() == 1);
  const auto& greeter = symbols->front();
  REQUIRE(greeter.name == "Greeter");
  REQUIRE(greeter.kind == lsp::SymbolKind::Class);
  REQUIRE(greeter.children.size() == 1);
  REQUIRE(greeter.children[0].kind == lsp::SymbolKind::Method);
  REQUIRE(greeter.children[0].detail == "(self)");
  REQUIRE(greeter.children[0].selectionRange.start.character == 8);
}

TEST_CASE("Flat SymbolInformation response decodes", "[lsp]") {
  auto j = nlohmann::json::parse(R"([
    {
      "name": "main",
      "kind": 12,
      "location": {
        "uri": "file:///src/main.py",
        "range": {"start": {"line": 4, "character": 0},
                  "end": {"line": 6, "character": 0}}
      },
      "containerName": ""
    }
  ])");

  auto result = lsp::ParseDocumentSymbolResult(j);
  const auto* symbols =
      std::get_if<std::vector<lsp::SymbolInformation>>(&result);
  REQUIRE(symbols != nullptr);
  REQUIRE(symbols->size() == 1);
  REQUIRE(symbols->front().kind == lsp::SymbolKind::Function);
  REQUIRE(symbols->front().location.uri == "file:///src/main.py");
  REQUIRE(symbols->front().location.range.start.line == 4);
}

TEST_CASE("Null documentSymbol response is an empty tree", "[lsp]") {
  auto result = lsp::ParseDocumentSymbolResult(nullptr);
  const auto* symbols = std::get_if<std::vector<lsp::DocumentSymbol>>(&result);
  REQUIRE(symbols != nullptr);
  REQUIRE(symbols->empty());
}

TEST_CASE("SymbolKind names round trip", "[lsp]") {
  REQUIRE(lsp::SymbolKindName(lsp::SymbolKind::Function) == "Function");
  REQUIRE(lsp::SymbolKindFromName("class") == lsp::SymbolKind::Class);
  REQUIRE_FALSE(lsp::SymbolKindFromName("NoSuchKind").has_value());
}
