#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/document_symbol.hpp"

namespace codenav::symbols {

// Server-independent symbol node. Both LSP result shapes normalize into
// this tree.
struct UnifiedSymbol {
  std::string name;
  lsp::SymbolKind kind = lsp::SymbolKind::Null;
  // Names from the top level down to this symbol, joined by '/'
  std::string name_path;
  lsp::Range range;
  lsp::Range selection_range;
  // Source text covered by `range`
  std::string body;
  std::vector<UnifiedSymbol> children;
};

using SymbolTree = std::vector<UnifiedSymbol>;

// Builds the unified tree. Flat SymbolInformation lists are nested by range
// containment; siblings are ordered by position.
auto NormalizeSymbols(
    const lsp::DocumentSymbolResult& result, std::string_view content,
    lsp::PositionEncodingKind encoding) -> SymbolTree;

// Depth-first pre-order walk; return false from `visit` to skip children
void VisitSymbols(
    const SymbolTree& tree,
    const std::function<bool(const UnifiedSymbol&)>& visit);

// Innermost symbol whose range contains `position`, nullptr if none
auto FindEnclosingSymbol(const SymbolTree& tree, const lsp::Position& position)
    -> const UnifiedSymbol*;

// JSON view for tool results. `depth` limits how many levels of children are
// included (0 = none).
auto SymbolToJson(const UnifiedSymbol& symbol, int depth, bool include_body)
    -> nlohmann::json;

}  // namespace codenav::symbols
