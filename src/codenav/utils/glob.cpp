#include "codenav/utils/glob.hpp"

#include <algorithm>

namespace codenav::utils {

namespace {

constexpr std::string_view kRegexSpecial = R"(\^$.|+()[]{})";

auto TranslateGlob(std::string_view pattern, GlobPattern::Syntax syntax)
    -> std::string {
  const bool path_syntax = syntax == GlobPattern::Syntax::kPath;
  const std::string any_run = path_syntax ? "[^/]*" : ".*";
  const std::string any_char = path_syntax ? "[^/]" : ".";

  std::string regex;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '*') {
      if (path_syntax && i + 1 < pattern.size() && pattern[i + 1] == '*') {
        // "**/" matches zero or more directories, a trailing "**" anything
        if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
          regex += "(?:.*/)?";
          i += 2;
        } else {
          regex += ".*";
          i += 1;
        }
      } else {
        regex += any_run;
      }
    } else if (c == '?') {
      regex += any_char;
    } else if (kRegexSpecial.find(c) != std::string_view::npos) {
      regex += '\\';
      regex += c;
    } else {
      regex += c;
    }
  }
  return regex;
}

auto SplitComponents(std::string_view path) -> std::vector<std::string_view> {
  std::vector<std::string_view> components;
  while (!path.empty()) {
    auto slash = path.find('/');
    auto component = path.substr(0, slash);
    if (!component.empty() && component != ".") {
      components.push_back(component);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return components;
}

}  // namespace

GlobPattern::GlobPattern(std::string pattern, Syntax syntax)
    : pattern_(std::move(pattern)), syntax_(syntax) {
  std::string_view body = pattern_;
  if (syntax_ == Syntax::kPath) {
    while (body.starts_with("./")) {
      body.remove_prefix(2);
    }
    while (body.ends_with('/')) {
      body.remove_suffix(1);
    }
    component_pattern_ = body.find('/') == std::string_view::npos;
    while (body.starts_with('/')) {
      body.remove_prefix(1);
    }
  }
  regex_ = std::regex(TranslateGlob(body, syntax_), std::regex::ECMAScript);
}

auto GlobPattern::Matches(std::string_view subject) const -> bool {
  if (syntax_ == Syntax::kName) {
    return MatchesWhole(subject);
  }

  auto components = SplitComponents(subject);
  if (component_pattern_) {
    return std::ranges::any_of(components, [this](std::string_view part) {
      return MatchesWhole(part);
    });
  }

  std::string prefix;
  for (const auto& component : components) {
    if (!prefix.empty()) {
      prefix += '/';
    }
    prefix.append(component);
    if (MatchesWhole(prefix)) {
      return true;
    }
  }
  return false;
}

auto GlobPattern::IsLiteral() const -> bool {
  return pattern_.find_first_of("*?") == std::string::npos;
}

auto GlobPattern::MatchesWhole(std::string_view subject) const -> bool {
  return std::regex_match(subject.begin(), subject.end(), regex_);
}

auto MatchesAny(
    const std::vector<GlobPattern>& patterns, std::string_view subject)
    -> bool {
  return std::ranges::any_of(patterns, [subject](const GlobPattern& pattern) {
    return pattern.Matches(subject);
  });
}

auto CompileGlobs(
    const std::vector<std::string>& patterns, GlobPattern::Syntax syntax)
    -> std::vector<GlobPattern> {
  std::vector<GlobPattern> compiled;
  compiled.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    compiled.emplace_back(pattern, syntax);
  }
  return compiled;
}

}  // namespace codenav::utils
