#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "lsp/basic.hpp"

namespace codenav::utils {

// Lines of `text` without their terminators. "\r\n" and "\n" both end a
// line; a trailing terminator does not start an extra line.
auto SplitLines(std::string_view text) -> std::vector<std::string_view>;

// Byte offset of the start of every line, including an empty last line after
// a trailing terminator
auto LineStartOffsets(std::string_view text) -> std::vector<std::size_t>;

// Converts a column in `encoding` units to a byte offset within `line`.
// Columns past the end clamp to the line length; a column falling inside a
// multi-unit character resolves to the start of that character.
auto ColumnToByteOffset(
    std::string_view line, int column, lsp::PositionEncodingKind encoding)
    -> std::size_t;

auto ByteOffsetToColumn(
    std::string_view line, std::size_t byte_offset,
    lsp::PositionEncodingKind encoding) -> int;

auto PositionToOffset(
    std::string_view text, const lsp::Position& position,
    lsp::PositionEncodingKind encoding) -> std::size_t;

auto OffsetToPosition(
    std::string_view text, std::size_t offset,
    lsp::PositionEncodingKind encoding) -> lsp::Position;

auto SliceRange(
    std::string_view text, const lsp::Range& range,
    lsp::PositionEncodingKind encoding) -> std::string;

}  // namespace codenav::utils
