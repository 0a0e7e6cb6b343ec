#include "codenav/tools/symbol_tools.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "codenav/tools/file_tools.hpp"
#include "test/codenav/common/async_fixture.hpp"
#include "test/codenav/common/fake_server_config.hpp"
#include "test/codenav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::ErrorKind;
using codenav::Result;
using codenav::core::Orchestrator;
using codenav::test::FakeServerConfig;
using codenav::test::FileTestFixture;
using codenav::test::RunAsyncTest;
using codenav::tools::ToolContext;
using nlohmann::json;

namespace {

constexpr std::string_view kUtil =
    "def foo():\n"
    "    return 1\n";

constexpr std::string_view kMain =
    "from util import foo\n"
    "\n"
    "class Worker:\n"
    "    def run(self):\n"
    "        return foo()\n"
    "\n"
    "class Helper:\n"
    "    def run(self):\n"
    "        return 2\n";

class SymbolToolsFixture : public FileTestFixture {
 public:
  explicit SymbolToolsFixture(bool with_sources = true) {
    if (with_sources) {
      CreateFile("util.py", kUtil);
      CreateFile("main.py", kMain);
    }
  }

  auto Activate(asio::any_io_executor executor, std::string_view project_yaml = "")
      -> asio::awaitable<void> {
    if (!project_yaml.empty()) {
      CreateFile(".codenav/project.yml", project_yaml);
    }
    orchestrator_ = std::make_shared<Orchestrator>(
        executor,
        FakeServerConfig(
            {"--request-log=" + (GetTempDir() / "requests.log").String()}));
    auto activated =
        co_await orchestrator_->ActivateProject(GetTempDir().String());
    REQUIRE(activated.has_value());
  }

  auto Run(std::string_view name, json args) -> asio::awaitable<Result<json>> {
    auto tools = codenav::tools::MakeSymbolTools();
    for (auto& tool : codenav::tools::MakeFileTools()) {
      tools.push_back(std::move(tool));
    }
    for (const auto& tool : tools) {
      if (tool->Name() == name) {
        ToolContext context{
            .orchestrator = orchestrator_,
            .logger = spdlog::default_logger(),
        };
        co_return co_await tool->Apply(context, args);
      }
    }
    FAIL("no tool named " << name);
    co_return json();
  }

  auto Shutdown() -> asio::awaitable<void> {
    co_await orchestrator_->Shutdown();
  }

 private:
  std::shared_ptr<Orchestrator> orchestrator_;
};

}  // namespace

TEST_CASE("get_symbols_overview lists top-level symbols per file",
          "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto file =
        co_await fixture.Run("get_symbols_overview", {{"relative_path", "main.py"}});
    REQUIRE(file.has_value());
    REQUIRE(file->size() == 1);
    const auto& entries = (*file)["main.py"];
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0]["name_path"] == "Worker");
    REQUIRE(entries[0]["kind"] == "Class");
    REQUIRE_FALSE(entries[0].contains("children"));
    REQUIRE(entries[1]["name_path"] == "Helper");

    auto directory =
        co_await fixture.Run("get_symbols_overview", {{"relative_path", "."}});
    REQUIRE(directory.has_value());
    REQUIRE(directory->contains("main.py"));
    REQUIRE(directory->contains("util.py"));
    REQUIRE((*directory)["util.py"][0]["name"] == "foo");
    REQUIRE((*directory)["util.py"][0]["kind"] == "Function");

    co_await fixture.Shutdown();
  });
}

TEST_CASE("find_symbol matches name paths", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto exact = co_await fixture.Run(
        "find_symbol", {{"name_path", "Worker/run"},
                        {"relative_path", "main.py"},
                        {"include_body", true}});
    REQUIRE(exact.has_value());
    REQUIRE(exact->size() == 1);
    REQUIRE((*exact)[0]["name_path"] == "Worker/run");
    REQUIRE((*exact)[0]["kind"] == "Method");
    REQUIRE((*exact)[0]["start_line"] == 3);
    REQUIRE((*exact)[0]["relative_path"] == "main.py");
    REQUIRE((*exact)[0]["body"] == "def run(self):\n        return foo()");

    // Without a path the whole project is searched
    auto both = co_await fixture.Run("find_symbol", {{"name_path", "run"}});
    REQUIRE(both.has_value());
    REQUIRE(both->size() == 2);
    REQUIRE((*both)[0]["name_path"] == "Worker/run");
    REQUIRE((*both)[1]["name_path"] == "Helper/run");

    auto with_children = co_await fixture.Run(
        "find_symbol", {{"name_path", "Worker"}, {"depth", 1}});
    REQUIRE(with_children.has_value());
    REQUIRE(with_children->size() == 1);
    REQUIRE((*with_children)[0]["children"].size() == 1);
    REQUIRE((*with_children)[0]["children"][0]["name"] == "run");

    auto substring = co_await fixture.Run(
        "find_symbol", {{"name_path", "Wor"}, {"substring_matching", true}});
    REQUIRE(substring.has_value());
    REQUIRE(substring->size() == 1);
    REQUIRE((*substring)[0]["name"] == "Worker");

    auto absolute =
        co_await fixture.Run("find_symbol", {{"name_path", "/run"}});
    REQUIRE(absolute.has_value());
    REQUIRE(absolute->empty());

    auto top_level =
        co_await fixture.Run("find_symbol", {{"name_path", "/foo"}});
    REQUIRE(top_level.has_value());
    REQUIRE(top_level->size() == 1);
    REQUIRE((*top_level)[0]["relative_path"] == "util.py");

    auto empty = co_await fixture.Run("find_symbol", {{"name_path", ""}});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().Kind() == ErrorKind::kInvalidArguments);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("find_symbol serves unchanged files from the cache",
          "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture(false);
    fixture.CreateFile("main.py", "def foo(): pass\n");
    co_await fixture.Activate(executor);

    auto first = co_await fixture.Run("find_symbol", {{"name_path", "foo"}});
    REQUIRE(first.has_value());
    REQUIRE(first->size() == 1);
    REQUIRE((*first)[0]["kind"] == "Function");
    REQUIRE((*first)[0]["start_line"] == 0);
    REQUIRE((*first)[0]["relative_path"] == "main.py");
    REQUIRE(
        fixture.CountLogged("requests.log", "textDocument/documentSymbol") == 1);

    auto second = co_await fixture.Run("find_symbol", {{"name_path", "foo"}});
    REQUIRE(second.has_value());
    REQUIRE(*second == *first);
    REQUIRE(
        fixture.CountLogged("requests.log", "textDocument/documentSymbol") == 1);

    auto written = co_await fixture.Run(
        "write_file",
        {{"relative_path", "main.py"}, {"content", "def bar(): pass\n"}});
    REQUIRE(written.has_value());

    auto old_name = co_await fixture.Run("find_symbol", {{"name_path", "foo"}});
    REQUIRE(old_name.has_value());
    REQUIRE(old_name->empty());
    REQUIRE(
        fixture.CountLogged("requests.log", "textDocument/documentSymbol") == 2);

    auto new_name = co_await fixture.Run("find_symbol", {{"name_path", "bar"}});
    REQUIRE(new_name.has_value());
    REQUIRE(new_name->size() == 1);
    REQUIRE((*new_name)[0]["kind"] == "Function");
    REQUIRE((*new_name)[0]["start_line"] == 0);
    REQUIRE(
        fixture.CountLogged("requests.log", "textDocument/documentSymbol") == 2);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("find_referencing_symbols reports enclosing symbols",
          "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto references = co_await fixture.Run(
        "find_referencing_symbols",
        {{"name_path", "foo"}, {"relative_path", "util.py"}});
    REQUIRE(references.has_value());
    REQUIRE(references->size() == 2);

    const auto& import = (*references)[0];
    REQUIRE(import["relative_path"] == "main.py");
    REQUIRE(import["line"] == 0);
    REQUIRE(import["column"] == 17);
    REQUIRE(import["snippet"] == "from util import foo");
    REQUIRE_FALSE(import.contains("enclosing_symbol"));

    const auto& call = (*references)[1];
    REQUIRE(call["line"] == 4);
    REQUIRE(call["snippet"] == "return foo()");
    REQUIRE(call["enclosing_symbol"]["name_path"] == "Worker/run");
    REQUIRE(call["enclosing_symbol"]["kind"] == "Method");

    co_await fixture.Shutdown();
  });
}

TEST_CASE("find_definition resolves a position", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto definitions = co_await fixture.Run(
        "find_definition",
        {{"relative_path", "main.py"}, {"line", 4}, {"column", 17}});
    REQUIRE(definitions.has_value());
    REQUIRE(definitions->size() == 1);
    const auto& definition = (*definitions)[0];
    REQUIRE(definition["relative_path"] == "util.py");
    REQUIRE(definition["line"] == 0);
    REQUIRE(definition["column"] == 4);
    REQUIRE(definition["enclosing_symbol"]["name_path"] == "foo");
    REQUIRE(definition["enclosing_symbol"]["kind"] == "Function");

    auto past_end = co_await fixture.Run(
        "find_definition",
        {{"relative_path", "main.py"}, {"line", 40}, {"column", 0}});
    REQUIRE_FALSE(past_end.has_value());
    REQUIRE(past_end.error().Kind() == ErrorKind::kInvalidArguments);

    auto no_column = co_await fixture.Run(
        "find_definition", {{"relative_path", "main.py"}, {"line", 4}});
    REQUIRE_FALSE(no_column.has_value());
    REQUIRE(no_column.error().Kind() == ErrorKind::kInvalidArguments);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("symbol edit tools rewrite the file", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto replaced = co_await fixture.Run(
        "replace_symbol_body",
        {{"name_path", "Helper/run"},
         {"relative_path", "main.py"},
         {"body", "def run(self):\n        return 3"}});
    REQUIRE(replaced.has_value());
    REQUIRE(*replaced == "OK: replaced body of Helper/run in main.py");
    REQUIRE(fixture.ReadFile("main.py").ends_with(
        "class Helper:\n    def run(self):\n        return 3\n"));

    auto after = co_await fixture.Run(
        "insert_after_symbol",
        {{"name_path", "foo"},
         {"relative_path", "util.py"},
         {"body", "def baz():\n    return 0"}});
    REQUIRE(after.has_value());
    REQUIRE(
        fixture.ReadFile("util.py") ==
        "def foo():\n    return 1\ndef baz():\n    return 0\n");

    auto before = co_await fixture.Run(
        "insert_before_symbol",
        {{"name_path", "Helper"},
         {"relative_path", "main.py"},
         {"body", "# helpers"}});
    REQUIRE(before.has_value());
    REQUIRE(fixture.ReadFile("main.py").find("\n# helpers\nclass Helper:\n") !=
            std::string::npos);

    // Later lookups see the rewritten file
    auto baz = co_await fixture.Run(
        "find_symbol", {{"name_path", "baz"}, {"relative_path", "util.py"}});
    REQUIRE(baz.has_value());
    REQUIRE(baz->size() == 1);
    REQUIRE((*baz)[0]["start_line"] == 2);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("symbol lookups require a unique match", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto ambiguous = co_await fixture.Run(
        "replace_symbol_body",
        {{"name_path", "run"}, {"relative_path", "main.py"}, {"body", "x"}});
    REQUIRE_FALSE(ambiguous.has_value());
    REQUIRE(ambiguous.error().Kind() == ErrorKind::kInvalidArguments);
    REQUIRE(ambiguous.error().Message().find("ambiguous") != std::string::npos);

    auto missing = co_await fixture.Run(
        "find_referencing_symbols",
        {{"name_path", "Missing"}, {"relative_path", "main.py"}});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().Kind() == ErrorKind::kInvalidArguments);

    REQUIRE(fixture.ReadFile("main.py") == kMain);
    co_await fixture.Shutdown();
  });
}

TEST_CASE("rename_symbol applies edits across files", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor);

    auto renamed = co_await fixture.Run(
        "rename_symbol", {{"name_path", "foo"},
                          {"relative_path", "util.py"},
                          {"new_name", "bar"}});
    REQUIRE(renamed.has_value());
    REQUIRE((*renamed)["renamed"] == "foo");
    REQUIRE((*renamed)["new_name"] == "bar");
    REQUIRE((*renamed)["changed_files"] == json::array({"main.py", "util.py"}));

    REQUIRE(fixture.ReadFile("util.py") == "def bar():\n    return 1\n");
    const auto main = fixture.ReadFile("main.py");
    REQUIRE(main.starts_with("from util import bar\n"));
    REQUIRE(main.find("return bar()") != std::string::npos);
    REQUIRE(main.find("foo") == std::string::npos);

    auto empty_name = co_await fixture.Run(
        "rename_symbol",
        {{"name_path", "bar"}, {"relative_path", "util.py"}, {"new_name", ""}});
    REQUIRE_FALSE(empty_name.has_value());
    REQUIRE(empty_name.error().Kind() == ErrorKind::kInvalidArguments);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("symbol edit tools fail in a read-only project", "[symbol_tools]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    SymbolToolsFixture fixture;
    co_await fixture.Activate(executor, "ReadOnly: true\n");

    auto replaced = co_await fixture.Run(
        "replace_symbol_body",
        {{"name_path", "foo"}, {"relative_path", "util.py"}, {"body", "pass"}});
    REQUIRE_FALSE(replaced.has_value());
    REQUIRE(replaced.error().Kind() == ErrorKind::kToolExecutionError);

    auto renamed = co_await fixture.Run(
        "rename_symbol", {{"name_path", "foo"},
                          {"relative_path", "util.py"},
                          {"new_name", "bar"}});
    REQUIRE_FALSE(renamed.has_value());
    REQUIRE(renamed.error().Kind() == ErrorKind::kToolExecutionError);

    REQUIRE(fixture.ReadFile("util.py") == kUtil);
    REQUIRE(fixture.ReadFile("main.py") == kMain);

    // Read-only projects still answer queries
    auto found = co_await fixture.Run("find_symbol", {{"name_path", "foo"}});
    REQUIRE(found.has_value());
    REQUIRE(found->size() == 1);

    co_await fixture.Shutdown();
  });
}

TEST_CASE("symbol tools declare their effects", "[symbol_tools]") {
  for (const auto& tool : codenav::tools::MakeSymbolTools()) {
    INFO(tool->Name());
    REQUIRE(tool->RequiresActiveProject());
    const bool edits = tool->Name() == "replace_symbol_body" ||
                       tool->Name() == "insert_after_symbol" ||
                       tool->Name() == "insert_before_symbol" ||
                       tool->Name() == "rename_symbol";
    REQUIRE(tool->MutatesState() == edits);
  }
}
