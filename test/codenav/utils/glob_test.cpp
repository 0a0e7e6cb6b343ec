#include "codenav/utils/glob.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::utils::GlobPattern;
using Syntax = codenav::utils::GlobPattern::Syntax;

TEST_CASE("Name globs match the whole subject", "[glob]") {
  GlobPattern pattern("find_*");
  REQUIRE(pattern.Matches("find_symbol"));
  REQUIRE(pattern.Matches("find_"));
  REQUIRE_FALSE(pattern.Matches("refind_symbol"));

  GlobPattern single("read_fil?");
  REQUIRE(single.Matches("read_file"));
  REQUIRE_FALSE(single.Matches("read_files"));
}

TEST_CASE("Name globs treat regex characters literally", "[glob]") {
  GlobPattern pattern("a.b+(c)");
  REQUIRE(pattern.Matches("a.b+(c)"));
  REQUIRE_FALSE(pattern.Matches("axbb(c)"));
}

TEST_CASE("IsLiteral detects wildcard-free patterns", "[glob]") {
  REQUIRE(GlobPattern("write_file").IsLiteral());
  REQUIRE_FALSE(GlobPattern("*_file").IsLiteral());
  REQUIRE_FALSE(GlobPattern("file?").IsLiteral());
}

TEST_CASE("Path globs without a slash match any component", "[glob]") {
  GlobPattern pattern("node_modules", Syntax::kPath);
  REQUIRE(pattern.Matches("node_modules"));
  REQUIRE(pattern.Matches("web/node_modules/react/index.js"));
  REQUIRE_FALSE(pattern.Matches("web/node_modules_backup/x.js"));

  GlobPattern extension("*.min.js", Syntax::kPath);
  REQUIRE(extension.Matches("static/js/app.min.js"));
  REQUIRE_FALSE(extension.Matches("static/js/app.js"));
}

TEST_CASE("Path globs with a slash are anchored at the root", "[glob]") {
  GlobPattern pattern("build/gen", Syntax::kPath);
  REQUIRE(pattern.Matches("build/gen"));
  REQUIRE(pattern.Matches("build/gen/out.py"));
  REQUIRE_FALSE(pattern.Matches("src/build/gen/out.py"));
}

TEST_CASE("Double star crosses directories", "[glob]") {
  GlobPattern pattern("src/**/test_*.py", Syntax::kPath);
  REQUIRE(pattern.Matches("src/test_a.py"));
  REQUIRE(pattern.Matches("src/pkg/sub/test_b.py"));
  REQUIRE_FALSE(pattern.Matches("lib/pkg/test_b.py"));

  GlobPattern single("src/*.py", Syntax::kPath);
  REQUIRE(single.Matches("src/a.py"));
  REQUIRE_FALSE(single.Matches("src/pkg/a.py"));
}

TEST_CASE("MatchesAny over compiled patterns", "[glob]") {
  auto patterns = codenav::utils::CompileGlobs(
      {"*.log", "tmp/**"}, Syntax::kPath);
  REQUIRE(codenav::utils::MatchesAny(patterns, "logs/run.log"));
  REQUIRE(codenav::utils::MatchesAny(patterns, "tmp/a/b.py"));
  REQUIRE_FALSE(codenav::utils::MatchesAny(patterns, "src/main.py"));
  REQUIRE_FALSE(codenav::utils::MatchesAny({}, "anything"));
}
