#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace codenav::utils {

// Shell-style glob.
//
// Name patterns (tool names, file names) support `*` and `?` and match the
// whole subject.
//
// Path patterns follow gitignore conventions: a pattern without `/` matches
// any single path component, so `*.min.js` or `node_modules` exclude matches
// at any depth; a pattern containing `/` is anchored at the root and `**`
// crosses directory separators. A path also matches when one of its parent
// directories matches.
class GlobPattern {
 public:
  enum class Syntax {
    kName,
    kPath,
  };

  explicit GlobPattern(std::string pattern, Syntax syntax = Syntax::kName);

  [[nodiscard]] auto Matches(std::string_view subject) const -> bool;

  // True when the pattern contains no wildcard characters
  [[nodiscard]] auto IsLiteral() const -> bool;

  [[nodiscard]] auto Pattern() const -> const std::string& {
    return pattern_;
  }

 private:
  auto MatchesWhole(std::string_view subject) const -> bool;

  std::string pattern_;
  Syntax syntax_;
  bool component_pattern_ = false;
  std::regex regex_;
};

// Matches if any pattern in the list matches
[[nodiscard]] auto MatchesAny(
    const std::vector<GlobPattern>& patterns, std::string_view subject) -> bool;

[[nodiscard]] auto CompileGlobs(
    const std::vector<std::string>& patterns, GlobPattern::Syntax syntax)
    -> std::vector<GlobPattern>;

}  // namespace codenav::utils
