#include "codenav/utils/text_utils.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::utils::ByteOffsetToColumn;
using codenav::utils::ColumnToByteOffset;
using codenav::utils::OffsetToPosition;
using codenav::utils::PositionToOffset;
using codenav::utils::SliceRange;
using codenav::utils::SplitLines;
using Encoding = lsp::PositionEncodingKind;

TEST_CASE("SplitLines handles terminators", "[text_utils]") {
  REQUIRE(SplitLines("") == std::vector<std::string_view>{""});
  REQUIRE(SplitLines("a\n") == std::vector<std::string_view>{"a"});
  REQUIRE(
      SplitLines("a\r\nb\n\nc") ==
      std::vector<std::string_view>{"a", "b", "", "c"});
}

TEST_CASE("Columns convert per encoding", "[text_utils]") {
  // "é" is 2 bytes / 1 UTF-16 unit, "😀" is 4 bytes / 2 UTF-16 units
  const std::string line = "aé😀b";

  REQUIRE(ColumnToByteOffset(line, 2, Encoding::kUtf16) == 3);
  REQUIRE(ColumnToByteOffset(line, 4, Encoding::kUtf16) == 7);
  REQUIRE(ColumnToByteOffset(line, 3, Encoding::kUtf32) == 7);
  REQUIRE(ColumnToByteOffset(line, 3, Encoding::kUtf8) == 3);

  REQUIRE(ByteOffsetToColumn(line, 7, Encoding::kUtf16) == 4);
  REQUIRE(ByteOffsetToColumn(line, 7, Encoding::kUtf32) == 3);
  REQUIRE(ByteOffsetToColumn(line, 7, Encoding::kUtf8) == 7);
}

TEST_CASE("A column inside a surrogate pair resolves to its start",
          "[text_utils]") {
  const std::string line = "😀x";
  REQUIRE(ColumnToByteOffset(line, 1, Encoding::kUtf16) == 0);
  REQUIRE(ColumnToByteOffset(line, 2, Encoding::kUtf16) == 4);
}

TEST_CASE("Columns past the end clamp to the line length", "[text_utils]") {
  REQUIRE(ColumnToByteOffset("abc", 99, Encoding::kUtf16) == 3);
}

TEST_CASE("Positions and offsets convert both ways", "[text_utils]") {
  const std::string text = "def foo():\n    return 'é'\n";
  const lsp::Position position{.line = 1, .character = 12};

  auto offset = PositionToOffset(text, position, Encoding::kUtf16);
  REQUIRE(text.substr(offset, 3) == "é'");
  REQUIRE(OffsetToPosition(text, offset, Encoding::kUtf16) == position);

  // Lines past the end map to the end of the text
  REQUIRE(
      PositionToOffset(text, {.line = 9, .character = 0}, Encoding::kUtf16) ==
      text.size());
}

TEST_CASE("SliceRange extracts the covered text", "[text_utils]") {
  const std::string text = "class A:\n    def f(self):\n        pass\n";
  lsp::Range range{
      .start = {.line = 1, .character = 4},
      .end = {.line = 2, .character = 12}};
  REQUIRE(
      SliceRange(text, range, Encoding::kUtf16) ==
      "def f(self):\n        pass");

  lsp::Range inverted{.start = range.end, .end = range.start};
  REQUIRE(SliceRange(text, inverted, Encoding::kUtf16).empty());
}
