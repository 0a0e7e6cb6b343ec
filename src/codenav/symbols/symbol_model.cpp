#include "codenav/symbols/symbol_model.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>

#include "codenav/utils/text_utils.hpp"

namespace codenav::symbols {

namespace {

auto JoinNamePath(std::string_view parent, std::string_view name)
    -> std::string {
  if (parent.empty()) {
    return std::string(name);
  }
  std::string path(parent);
  path += '/';
  path.append(name);
  return path;
}

auto StartsBefore(const UnifiedSymbol& lhs, const UnifiedSymbol& rhs) -> bool {
  return lhs.range.start < rhs.range.start;
}

auto FromDocumentSymbol(
    const lsp::DocumentSymbol& symbol, std::string_view parent_path,
    std::string_view content, lsp::PositionEncodingKind encoding)
    -> UnifiedSymbol {
  UnifiedSymbol node{
      .name = symbol.name,
      .kind = symbol.kind,
      .name_path = JoinNamePath(parent_path, symbol.name),
      .range = symbol.range,
      .selection_range = symbol.selectionRange,
      .body = utils::SliceRange(content, symbol.range, encoding),
  };
  node.children.reserve(symbol.children.size());
  for (const auto& child : symbol.children) {
    node.children.push_back(
        FromDocumentSymbol(child, node.name_path, content, encoding));
  }
  std::ranges::stable_sort(node.children, StartsBefore);
  return node;
}

// Flat list to tree: visit symbols outermost-first and attach each to the
// innermost already-placed symbol that contains it
auto FromSymbolInformation(
    const std::vector<lsp::SymbolInformation>& symbols,
    std::string_view content, lsp::PositionEncodingKind encoding)
    -> SymbolTree {
  std::vector<std::size_t> order(symbols.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }
  std::ranges::stable_sort(order, [&symbols](std::size_t a, std::size_t b) {
    const auto& ra = symbols[a].location.range;
    const auto& rb = symbols[b].location.range;
    if (ra.start != rb.start) {
      return ra.start < rb.start;
    }
    return rb.end < ra.end;
  });

  struct FlatNode {
    std::size_t source;
    std::optional<std::size_t> parent;
    std::vector<std::size_t> children;
  };
  std::vector<FlatNode> nodes;
  nodes.reserve(order.size());
  std::vector<std::size_t> roots;
  std::vector<std::size_t> stack;

  for (auto index : order) {
    const auto& range = symbols[index].location.range;
    while (!stack.empty() &&
           !symbols[nodes[stack.back()].source].location.range.Contains(range)) {
      stack.pop_back();
    }
    const auto node_index = nodes.size();
    nodes.push_back(FlatNode{.source = index, .parent = std::nullopt});
    if (stack.empty()) {
      roots.push_back(node_index);
    } else {
      nodes[node_index].parent = stack.back();
      nodes[stack.back()].children.push_back(node_index);
    }
    stack.push_back(node_index);
  }

  std::function<UnifiedSymbol(std::size_t, std::string_view)> build =
      [&](std::size_t node_index, std::string_view parent_path) {
        const auto& info = symbols[nodes[node_index].source];
        UnifiedSymbol node{
            .name = info.name,
            .kind = info.kind,
            .name_path = JoinNamePath(parent_path, info.name),
            .range = info.location.range,
            .selection_range = info.location.range,
            .body = utils::SliceRange(content, info.location.range, encoding),
        };
        for (auto child : nodes[node_index].children) {
          node.children.push_back(build(child, node.name_path));
        }
        return node;
      };

  SymbolTree tree;
  tree.reserve(roots.size());
  for (auto root : roots) {
    tree.push_back(build(root, ""));
  }
  return tree;
}

auto FindEnclosingIn(
    const std::vector<UnifiedSymbol>& symbols, const lsp::Position& position)
    -> const UnifiedSymbol* {
  for (const auto& symbol : symbols) {
    if (symbol.range.Contains(position)) {
      if (const auto* inner = FindEnclosingIn(symbol.children, position)) {
        return inner;
      }
      return &symbol;
    }
  }
  return nullptr;
}

}  // namespace

auto NormalizeSymbols(
    const lsp::DocumentSymbolResult& result, std::string_view content,
    lsp::PositionEncodingKind encoding) -> SymbolTree {
  if (const auto* hierarchical =
          std::get_if<std::vector<lsp::DocumentSymbol>>(&result)) {
    SymbolTree tree;
    tree.reserve(hierarchical->size());
    for (const auto& symbol : *hierarchical) {
      tree.push_back(FromDocumentSymbol(symbol, "", content, encoding));
    }
    std::ranges::stable_sort(tree, StartsBefore);
    return tree;
  }
  return FromSymbolInformation(
      std::get<std::vector<lsp::SymbolInformation>>(result), content, encoding);
}

void VisitSymbols(
    const SymbolTree& tree,
    const std::function<bool(const UnifiedSymbol&)>& visit) {
  for (const auto& symbol : tree) {
    if (visit(symbol)) {
      VisitSymbols(symbol.children, visit);
    }
  }
}

auto FindEnclosingSymbol(const SymbolTree& tree, const lsp::Position& position)
    -> const UnifiedSymbol* {
  return FindEnclosingIn(tree, position);
}

auto SymbolToJson(const UnifiedSymbol& symbol, int depth, bool include_body)
    -> nlohmann::json {
  nlohmann::json j{
      {"name", symbol.name},
      {"name_path", symbol.name_path},
      {"kind", std::string(lsp::SymbolKindName(symbol.kind))},
      {"start_line", symbol.range.start.line},
      {"end_line", symbol.range.end.line},
      {"range", symbol.range},
  };
  if (include_body) {
    j["body"] = symbol.body;
  }
  if (depth > 0 && !symbol.children.empty()) {
    auto children = nlohmann::json::array();
    for (const auto& child : symbol.children) {
      children.push_back(SymbolToJson(child, depth - 1, include_body));
    }
    j["children"] = std::move(children);
  }
  return j;
}

}  // namespace codenav::symbols
