#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codenav/symbols/symbol_model.hpp"

namespace codenav::symbols {

// Pattern over symbol name paths.
//
// `a/b/c` matches any symbol whose name path ends with the segments a, b, c.
// A leading '/' anchors the pattern at the top level of the file, so `/a/b`
// only matches b directly inside top-level a. With substring matching the
// last segment only has to contain the pattern's last segment.
class NamePathPattern {
 public:
  explicit NamePathPattern(std::string_view pattern);

  [[nodiscard]] auto Matches(
      std::string_view name_path, bool substring_matching = false) const
      -> bool;

  [[nodiscard]] auto IsAbsolute() const -> bool {
    return absolute_;
  }
  [[nodiscard]] auto Segments() const -> const std::vector<std::string>& {
    return segments_;
  }
  [[nodiscard]] auto Empty() const -> bool {
    return segments_.empty();
  }

 private:
  bool absolute_ = false;
  std::vector<std::string> segments_;
};

auto SplitNamePath(std::string_view name_path) -> std::vector<std::string>;

// All symbols of the tree matching the pattern, in pre-order
auto FindMatchingSymbols(
    const SymbolTree& tree, const NamePathPattern& pattern,
    bool substring_matching = false) -> std::vector<const UnifiedSymbol*>;

}  // namespace codenav::symbols
