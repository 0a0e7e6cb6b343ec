#include "codenav/core/project.hpp"

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

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
using codenav::core::LanguageRegistry;
using codenav::core::Project;
using codenav::core::ProjectConfig;
using codenav::core::ServerTimeouts;
using codenav::test::FakeServerConfig;
using codenav::test::FileTestFixture;
using codenav::test::RunAsyncTest;

namespace {

auto MakeProject(
    asio::any_io_executor executor, const FileTestFixture& fixture,
    std::string_view project_yaml = "") -> std::shared_ptr<Project> {
  auto config = ProjectConfig::LoadFromString(project_yaml);
  REQUIRE(config.has_value());
  return std::make_shared<Project>(
      executor, fixture.GetTempDir(), std::move(*config),
      LanguageRegistry(FakeServerConfig().GetLanguages()),
      ServerTimeouts{
          .request_timeout = std::chrono::seconds(5),
          .startup_timeout = std::chrono::seconds(5),
          .shutdown_grace = std::chrono::seconds(1),
      });
}

}  // namespace

TEST_CASE("ResolvePath keeps tools inside the project", "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  fixture.CreateFile("src/app.py", "");
  auto project = MakeProject(io_context.get_executor(), fixture, R"(
ExcludedPaths: [secrets]
)");

  auto relative = project->ResolvePath("src/app.py");
  REQUIRE(relative.has_value());
  REQUIRE(*relative == fixture.GetTempDir() / "src" / "app.py");
  REQUIRE(project->RelativePath(*relative) == "src/app.py");

  auto absolute = project->ResolvePath(relative->String());
  REQUIRE(absolute.has_value());
  REQUIRE(*absolute == *relative);

  auto root = project->ResolvePath(".");
  REQUIRE(root.has_value());
  REQUIRE(project->RelativePath(*root).empty());

  auto outside = project->ResolvePath("../elsewhere.py");
  REQUIRE_FALSE(outside.has_value());
  REQUIRE(outside.error().Kind() == ErrorKind::kInvalidArguments);

  auto excluded = project->ResolvePath("secrets/key.txt");
  REQUIRE_FALSE(excluded.has_value());
  REQUIRE(excluded.error().Kind() == ErrorKind::kInvalidArguments);
}

TEST_CASE("WriteFile and ReadFile round trip content", "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  auto project = MakeProject(io_context.get_executor(), fixture);

  SECTION("Non-ASCII content is written byte for byte") {
    const std::string content = "# caf\xC3\xA9 \xF0\x9F\x98\x80\r\nx = 1\n";
    auto path = fixture.GetTempDir() / "pkg" / "deep" / "unicode.py";
    REQUIRE(project->WriteFile(path, content).has_value());
    auto read = project->ReadFile(path);
    REQUIRE(read.has_value());
    REQUIRE(*read == content);
  }

  SECTION("Empty content truncates") {
    auto path = fixture.CreateFile("old.py", "def old():\n    pass\n");
    REQUIRE(project->WriteFile(path, "").has_value());
    auto read = project->ReadFile(path);
    REQUIRE(read.has_value());
    REQUIRE(read->empty());
  }

  SECTION("Reading a directory fails") {
    auto read = project->ReadFile(fixture.GetTempDir());
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().Kind() == ErrorKind::kInvalidArguments);
  }
}

TEST_CASE("A read-only project refuses writes", "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  auto path = fixture.CreateFile("keep.py", "x = 1\n");
  auto project = MakeProject(io_context.get_executor(), fixture, "ReadOnly: true\n");

  REQUIRE(project->IsReadOnly());
  auto written = project->WriteFile(path, "x = 2\n");
  REQUIRE_FALSE(written.has_value());
  REQUIRE(written.error().Kind() == ErrorKind::kToolExecutionError);
  REQUIRE(fixture.ReadFile("keep.py") == "x = 1\n");
}

TEST_CASE("ListDirectory and EnumerateSourceFiles honor exclusions",
          "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  fixture.CreateFile("main.py", "def main():\n    pass\n");
  fixture.CreateFile("README.md", "# readme\n");
  fixture.CreateFile("pkg/util.py", "def util():\n    pass\n");
  fixture.CreateFile("pkg/big.py", std::string(200, '#'));
  fixture.CreateFile("build/gen.py", "x = 1\n");
  fixture.CreateFile(".git/HEAD", "ref: main\n");
  auto project = MakeProject(io_context.get_executor(), fixture, R"(
ExcludedPaths: [build]
MaxFileSize: 100
)");

  auto flat = project->ListDirectory(fixture.GetTempDir(), false);
  REQUIRE(flat.has_value());
  REQUIRE(flat->directories == std::vector<std::string>{"pkg"});
  REQUIRE(flat->files == std::vector<std::string>{"README.md", "main.py"});

  auto deep = project->ListDirectory(fixture.GetTempDir(), true);
  REQUIRE(deep.has_value());
  REQUIRE(
      deep->files == std::vector<std::string>{
                         "README.md", "main.py", "pkg/big.py", "pkg/util.py"});

  auto sources = project->EnumerateSourceFiles(fixture.GetTempDir());
  REQUIRE(sources.has_value());
  std::vector<std::string> relative;
  for (const auto& path : *sources) {
    relative.push_back(project->RelativePath(path));
  }
  REQUIRE(relative == std::vector<std::string>{"main.py", "pkg/util.py"});

  auto not_a_directory =
      project->ListDirectory(fixture.GetTempDir() / "main.py", false);
  REQUIRE_FALSE(not_a_directory.has_value());
  REQUIRE(not_a_directory.error().Kind() == ErrorKind::kInvalidArguments);
}

TEST_CASE("Language servers are created lazily, one per language",
          "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  auto project = MakeProject(io_context.get_executor(), fixture);

  REQUIRE(project->Servers().empty());
  REQUIRE(project->LanguageFor(fixture.GetTempDir() / "a.py") == "python");

  auto first = project->GetServer("python");
  REQUIRE(first.has_value());
  REQUIRE((*first)->State() == codenav::client::ServerState::kNotStarted);
  auto second = project->GetServer("python");
  REQUIRE(second.has_value());
  REQUIRE(first->get() == second->get());
  REQUIRE(project->FindServer("python") == *first);
  REQUIRE(project->Servers().size() == 1);

  auto unknown = project->GetServer("cobol");
  REQUIRE_FALSE(unknown.has_value());
  REQUIRE(unknown.error().Kind() == ErrorKind::kToolExecutionError);

  REQUIRE(project->GetCache("python") == project->GetCache("python"));
}

TEST_CASE("The project language list restricts servers", "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  auto project =
      MakeProject(io_context.get_executor(), fixture, "Languages: [go]\n");

  REQUIRE(project->EnabledLanguages() == std::vector<std::string>{"go"});
  REQUIRE_FALSE(project->LanguageFor(fixture.GetTempDir() / "a.py").has_value());
  auto disabled = project->GetServer("python");
  REQUIRE_FALSE(disabled.has_value());
}

TEST_CASE("ApplyWorkspaceEdit edits every file or none", "[project]") {
  asio::io_context io_context;
  FileTestFixture fixture;
  auto a = fixture.CreateFile("a.py", "def foo():\n    pass\n");
  auto b = fixture.CreateFile("b.py", "from a import foo\nfoo()\n");
  auto project = MakeProject(io_context.get_executor(), fixture);

  auto edit_at = [](int line, int start, int end) {
    return lsp::TextEdit{
        .range = {.start = {.line = line, .character = start},
                  .end = {.line = line, .character = end}},
        .newText = "bar",
    };
  };

  SECTION("All files are rewritten") {
    std::filesystem::permissions(
        a.Path(),
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    lsp::WorkspaceEdit edit{
        .changes = std::map<lsp::DocumentUri, std::vector<lsp::TextEdit>>{
            {a.ToUri(), {edit_at(0, 4, 7)}},
            {b.ToUri(), {edit_at(0, 14, 17), edit_at(1, 0, 3)}},
        },
    };
    auto written =
        project->ApplyWorkspaceEdit(edit, lsp::PositionEncodingKind::kUtf16);
    REQUIRE(written.has_value());
    REQUIRE(written->size() == 2);
    REQUIRE(fixture.ReadFile("a.py") == "def bar():\n    pass\n");
    REQUIRE(fixture.ReadFile("b.py") == "from a import bar\nbar()\n");
    REQUIRE(
        std::filesystem::status(a.Path()).permissions() ==
        (std::filesystem::perms::owner_read |
         std::filesystem::perms::owner_write));
    REQUIRE_FALSE(std::filesystem::exists(
        a.String() + std::string(codenav::core::kStagedEditSuffix)));
  }

  SECTION("A failing file leaves every file untouched") {
    lsp::WorkspaceEdit edit{
        .changes = std::map<lsp::DocumentUri, std::vector<lsp::TextEdit>>{
            {a.ToUri(), {edit_at(0, 4, 7)}},
            {b.ToUri(), {edit_at(0, 0, 10), edit_at(0, 5, 12)}},
        },
    };
    auto written =
        project->ApplyWorkspaceEdit(edit, lsp::PositionEncodingKind::kUtf16);
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().Kind() == ErrorKind::kInvalidArguments);
    REQUIRE(fixture.ReadFile("a.py") == "def foo():\n    pass\n");
    REQUIRE(fixture.ReadFile("b.py") == "from a import foo\nfoo()\n");
  }

  SECTION("A failing write leaves every file untouched") {
    // A directory in the way of the staged copy of b.py
    const auto blocker = "b.py" + std::string(codenav::core::kStagedEditSuffix);
    fixture.CreateFile(blocker + "/keep", "");
    lsp::WorkspaceEdit edit{
        .changes = std::map<lsp::DocumentUri, std::vector<lsp::TextEdit>>{
            {a.ToUri(), {edit_at(0, 4, 7)}},
            {b.ToUri(), {edit_at(0, 14, 17), edit_at(1, 0, 3)}},
        },
    };
    auto written =
        project->ApplyWorkspaceEdit(edit, lsp::PositionEncodingKind::kUtf16);
    REQUIRE_FALSE(written.has_value());
    REQUIRE(written.error().Kind() == ErrorKind::kToolExecutionError);
    REQUIRE(fixture.ReadFile("a.py") == "def foo():\n    pass\n");
    REQUIRE(fixture.ReadFile("b.py") == "from a import foo\nfoo()\n");
    REQUIRE_FALSE(std::filesystem::exists(
        a.String() + std::string(codenav::core::kStagedEditSuffix)));
    REQUIRE(std::filesystem::exists(fixture.GetTempDir().Path() / blocker / "keep"));
  }
}

TEST_CASE("Shutdown stops every server", "[project]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto project = MakeProject(executor, fixture);

    auto server = project->GetServer("python");
    REQUIRE(server.has_value());
    auto started = co_await (*server)->Start();
    REQUIRE(started.has_value());
    const auto pid = (*server)->Pid();
    REQUIRE(pid.has_value());

    co_await project->Shutdown();
    REQUIRE((*server)->State() == codenav::client::ServerState::kTerminated);
    REQUIRE(project->Servers().empty());
    REQUIRE(::kill(*pid, 0) == -1);
    REQUIRE(errno == ESRCH);
  });
}
