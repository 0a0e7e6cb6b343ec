#include "codenav/utils/text_utils.hpp"

#include <algorithm>

namespace codenav::utils {

namespace {

// Byte length of the UTF-8 sequence starting with `lead`. Invalid lead bytes
// count as a single byte.
auto Utf8SequenceLength(unsigned char lead) -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead >> 5) == 0x6) {
    return 2;
  }
  if ((lead >> 4) == 0xE) {
    return 3;
  }
  if ((lead >> 3) == 0x1E) {
    return 4;
  }
  return 1;
}

auto UnitsFor(std::size_t sequence_length, lsp::PositionEncodingKind encoding)
    -> int {
  switch (encoding) {
    case lsp::PositionEncodingKind::kUtf8:
      return static_cast<int>(sequence_length);
    case lsp::PositionEncodingKind::kUtf16:
      return sequence_length == 4 ? 2 : 1;
    case lsp::PositionEncodingKind::kUtf32:
      return 1;
  }
  return 1;
}

auto LineAt(std::string_view text, const std::vector<std::size_t>& starts,
            std::size_t line) -> std::string_view {
  auto begin = starts[line];
  auto end = line + 1 < starts.size() ? starts[line + 1] : text.size();
  auto content = text.substr(begin, end - begin);
  if (content.ends_with('\n')) {
    content.remove_suffix(1);
  }
  if (content.ends_with('\r')) {
    content.remove_suffix(1);
  }
  return content;
}

}  // namespace

auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  auto starts = LineStartOffsets(text);
  for (std::size_t i = 0; i < starts.size(); ++i) {
    if (i + 1 == starts.size() && starts[i] == text.size() && i > 0) {
      break;
    }
    lines.push_back(LineAt(text, starts, i));
  }
  return lines;
}

auto LineStartOffsets(std::string_view text) -> std::vector<std::size_t> {
  std::vector<std::size_t> starts{0};
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      starts.push_back(i + 1);
    }
  }
  return starts;
}

auto ColumnToByteOffset(
    std::string_view line, int column, lsp::PositionEncodingKind encoding)
    -> std::size_t {
  std::size_t offset = 0;
  int units = 0;
  while (offset < line.size() && units < column) {
    auto length = std::min(
        Utf8SequenceLength(static_cast<unsigned char>(line[offset])),
        line.size() - offset);
    auto width = UnitsFor(length, encoding);
    if (units + width > column) {
      break;
    }
    units += width;
    offset += length;
  }
  return offset;
}

auto ByteOffsetToColumn(
    std::string_view line, std::size_t byte_offset,
    lsp::PositionEncodingKind encoding) -> int {
  byte_offset = std::min(byte_offset, line.size());
  std::size_t offset = 0;
  int units = 0;
  while (offset < byte_offset) {
    auto length = std::min(
        Utf8SequenceLength(static_cast<unsigned char>(line[offset])),
        line.size() - offset);
    units += UnitsFor(length, encoding);
    offset += length;
  }
  return units;
}

auto PositionToOffset(
    std::string_view text, const lsp::Position& position,
    lsp::PositionEncodingKind encoding) -> std::size_t {
  auto starts = LineStartOffsets(text);
  if (position.line < 0) {
    return 0;
  }
  auto line = static_cast<std::size_t>(position.line);
  if (line >= starts.size()) {
    return text.size();
  }
  return starts[line] +
         ColumnToByteOffset(
             LineAt(text, starts, line), std::max(position.character, 0),
             encoding);
}

auto OffsetToPosition(
    std::string_view text, std::size_t offset,
    lsp::PositionEncodingKind encoding) -> lsp::Position {
  offset = std::min(offset, text.size());
  auto starts = LineStartOffsets(text);
  auto it = std::ranges::upper_bound(starts, offset);
  auto line = static_cast<std::size_t>(std::distance(starts.begin(), it) - 1);
  auto line_text = LineAt(text, starts, line);
  return lsp::Position{
      .line = static_cast<int>(line),
      .character = ByteOffsetToColumn(line_text, offset - starts[line], encoding),
  };
}

auto SliceRange(
    std::string_view text, const lsp::Range& range,
    lsp::PositionEncodingKind encoding) -> std::string {
  auto begin = PositionToOffset(text, range.start, encoding);
  auto end = PositionToOffset(text, range.end, encoding);
  if (end <= begin) {
    return {};
  }
  return std::string(text.substr(begin, end - begin));
}

}  // namespace codenav::utils
