#include "codenav/symbols/text_edit.hpp"

#include <algorithm>
#include <cstddef>

#include <fmt/format.h>

#include "codenav/utils/text_utils.hpp"

namespace codenav::symbols {

namespace {

auto AsLines(std::string_view text) -> std::string {
  std::string lines(text);
  if (lines.empty() || lines.back() != '\n') {
    lines += '\n';
  }
  return lines;
}

auto LineStart(std::string_view content, int line) -> std::size_t {
  const auto starts = utils::LineStartOffsets(content);
  if (line < 0) {
    return 0;
  }
  if (static_cast<std::size_t>(line) >= starts.size()) {
    return content.size();
  }
  return starts[line];
}

}  // namespace

auto ApplyTextEdits(
    std::string_view content, std::vector<lsp::TextEdit> edits,
    lsp::PositionEncodingKind encoding) -> Result<std::string> {
  struct ResolvedEdit {
    std::size_t begin;
    std::size_t end;
    std::size_t index;
    std::string text;
  };

  std::vector<ResolvedEdit> resolved;
  resolved.reserve(edits.size());
  for (std::size_t i = 0; i < edits.size(); ++i) {
    auto begin = utils::PositionToOffset(content, edits[i].range.start, encoding);
    auto end = utils::PositionToOffset(content, edits[i].range.end, encoding);
    if (end < begin) {
      return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format("edit {} ends before it starts", i));
    }
    resolved.push_back(ResolvedEdit{
        .begin = begin,
        .end = end,
        .index = i,
        .text = std::move(edits[i].newText),
    });
  }

  std::ranges::sort(resolved, [](const ResolvedEdit& a, const ResolvedEdit& b) {
    if (a.begin != b.begin) {
      return a.begin < b.begin;
    }
    return a.index < b.index;
  });
  for (std::size_t i = 1; i < resolved.size(); ++i) {
    if (resolved[i].begin < resolved[i - 1].end) {
      return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format(
              "overlapping edits at byte offsets {} and {}",
              resolved[i - 1].begin, resolved[i].begin));
    }
  }

  std::string result(content);
  for (auto it = resolved.rbegin(); it != resolved.rend(); ++it) {
    result.replace(it->begin, it->end - it->begin, it->text);
  }
  return result;
}

auto ReplaceRange(
    std::string_view content, const lsp::Range& range, std::string_view text,
    lsp::PositionEncodingKind encoding) -> std::string {
  const auto begin = utils::PositionToOffset(content, range.start, encoding);
  const auto end =
      std::max(begin, utils::PositionToOffset(content, range.end, encoding));
  std::string result(content.substr(0, begin));
  result.append(text);
  result.append(content.substr(end));
  return result;
}

auto InsertBeforeLine(std::string_view content, int line, std::string_view text)
    -> std::string {
  const auto at = LineStart(content, line);
  std::string result(content.substr(0, at));
  if (!result.empty() && result.back() != '\n') {
    result += '\n';
  }
  result += AsLines(text);
  result.append(content.substr(at));
  return result;
}

auto InsertAfterLine(std::string_view content, int line, std::string_view text)
    -> std::string {
  return InsertBeforeLine(content, line + 1, text);
}

}  // namespace codenav::symbols
