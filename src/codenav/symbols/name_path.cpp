#include "codenav/symbols/name_path.hpp"

#include <cstddef>

namespace codenav::symbols {

auto SplitNamePath(std::string_view name_path) -> std::vector<std::string> {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= name_path.size()) {
    auto end = name_path.find('/', start);
    if (end == std::string_view::npos) {
      end = name_path.size();
    }
    if (end > start) {
      segments.emplace_back(name_path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

NamePathPattern::NamePathPattern(std::string_view pattern)
    : absolute_(!pattern.empty() && pattern.front() == '/'),
      segments_(SplitNamePath(pattern)) {
}

auto NamePathPattern::Matches(
    std::string_view name_path, bool substring_matching) const -> bool {
  if (segments_.empty()) {
    return false;
  }
  const auto candidate = SplitNamePath(name_path);
  if (candidate.size() < segments_.size()) {
    return false;
  }
  if (absolute_ && candidate.size() != segments_.size()) {
    return false;
  }

  const auto offset = candidate.size() - segments_.size();
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    const auto& expected = segments_[i];
    const auto& actual = candidate[offset + i];
    const bool last = i + 1 == segments_.size();
    if (last && substring_matching) {
      if (actual.find(expected) == std::string::npos) {
        return false;
      }
    } else if (actual != expected) {
      return false;
    }
  }
  return true;
}

auto FindMatchingSymbols(
    const SymbolTree& tree, const NamePathPattern& pattern,
    bool substring_matching) -> std::vector<const UnifiedSymbol*> {
  std::vector<const UnifiedSymbol*> matches;
  VisitSymbols(tree, [&](const UnifiedSymbol& symbol) {
    if (pattern.Matches(symbol.name_path, substring_matching)) {
      matches.push_back(&symbol);
    }
    return true;
  });
  return matches;
}

}  // namespace codenav::symbols
