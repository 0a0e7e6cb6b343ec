#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codenav/error/error.hpp"
#include "lsp/basic.hpp"

namespace codenav::symbols {

// Applies LSP text edits to `content`. Positions are interpreted in the
// negotiated `encoding`. Edits are applied from the end of the text towards
// the start; edits sharing a start position keep their array order in the
// output. Overlapping edits fail with kInvalidArguments.
auto ApplyTextEdits(
    std::string_view content, std::vector<lsp::TextEdit> edits,
    lsp::PositionEncodingKind encoding) -> Result<std::string>;

auto ReplaceRange(
    std::string_view content, const lsp::Range& range, std::string_view text,
    lsp::PositionEncodingKind encoding) -> std::string;

// Inserts `text` as whole lines at the start of zero-based `line`. A missing
// final newline is added to `text`.
auto InsertBeforeLine(std::string_view content, int line, std::string_view text)
    -> std::string;

// Inserts `text` as whole lines after zero-based `line`
auto InsertAfterLine(std::string_view content, int line, std::string_view text)
    -> std::string;

}  // namespace codenav::symbols
