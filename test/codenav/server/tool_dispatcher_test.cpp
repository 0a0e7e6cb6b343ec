#include "codenav/server/tool_dispatcher.hpp"

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "codenav/tools/file_tools.hpp"
#include "test/codenav/common/async_fixture.hpp"
#include "test/codenav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::CodenavError;
using codenav::ErrorKind;
using codenav::Result;
using codenav::core::Orchestrator;
using codenav::core::ServerConfig;
using codenav::server::ToolDispatcher;
using codenav::test::FileTestFixture;
using codenav::test::RunAsyncTest;
using codenav::tools::ToolContext;
using codenav::tools::ToolInfo;
using codenav::tools::ToolRegistry;
using nlohmann::json;

namespace {

// Tool whose behavior is a plain function; counts its calls
class ScriptedTool : public codenav::tools::Tool {
 public:
  using Behavior = std::function<Result<json>(const json& args)>;

  ScriptedTool(ToolInfo info, Behavior behavior)
      : Tool(std::move(info)), behavior_(std::move(behavior)) {
  }

  auto Apply(const ToolContext& /*context*/, const json& args) const
      -> asio::awaitable<Result<json>> override {
    ++calls;
    co_return behavior_(args);
  }

  mutable int calls = 0;

 private:
  Behavior behavior_;
};

struct Session {
  std::shared_ptr<Orchestrator> orchestrator;
  std::shared_ptr<ToolDispatcher> dispatcher;
  std::map<std::string, std::shared_ptr<ScriptedTool>> tools;
};

constexpr std::string_view kConfig = R"(
DefaultContext: agent
DefaultModes: [interactive]
Modes:
  - Name: review
    Prompt: Review only.
    ExcludedTools: [edit]
)";

auto MakeSession(asio::any_io_executor executor) -> Session {
  Session session;
  auto add = [&session](ToolInfo info, ScriptedTool::Behavior behavior) {
    auto name = info.name;
    session.tools[name] =
        std::make_shared<ScriptedTool>(std::move(info), std::move(behavior));
  };
  add({.name = "echo"}, [](const json& args) -> Result<json> { return args; });
  add({.name = "greet"},
      [](const json& /*args*/) -> Result<json> { return json("hello"); });
  add({.name = "boom"}, [](const json& /*args*/) -> Result<json> {
    throw std::runtime_error("exploded");
  });
  add({.name = "throw_int"}, [](const json& /*args*/) -> Result<json> {
    throw 42;
  });
  add({.name = "latin1_text"},
      [](const json& /*args*/) -> Result<json> { return json("caf\xE9"); });
  add({.name = "latin1_match"}, [](const json& /*args*/) -> Result<json> {
    return json::array({{{"line", 0}, {"text", "caf\xE9 = 1"}}});
  });
  add({.name = "latin1_fail"}, [](const json& /*args*/) -> Result<json> {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError, "cannot open caf\xE9.py");
  });
  add({.name = "fail"}, [](const json& /*args*/) -> Result<json> {
    return CodenavError::Unexpected(ErrorKind::kInvalidArguments, "bad input");
  });
  add({.name = "inspect", .requires_active_project = true},
      [](const json& /*args*/) -> Result<json> { return json::object(); });
  add({.name = "edit", .requires_active_project = true, .mutates_state = true},
      [](const json& /*args*/) -> Result<json> { return json("edited"); });

  ToolRegistry registry;
  for (const auto& [_, tool] : session.tools) {
    auto registered = registry.Register(tool);
    REQUIRE(registered.has_value());
  }

  auto config = ServerConfig::LoadFromString(kConfig);
  REQUIRE(config.has_value());
  session.orchestrator =
      std::make_shared<Orchestrator>(executor, std::move(*config));
  session.dispatcher = std::make_shared<ToolDispatcher>(
      executor, std::move(registry), session.orchestrator);
  auto initialized = session.dispatcher->Initialize();
  REQUIRE(initialized.has_value());
  return session;
}

auto Call(ToolDispatcher& dispatcher, std::string name, json arguments = {})
    -> asio::awaitable<mcp::CallToolResult> {
  co_return co_await dispatcher.CallTool(mcp::CallToolParams{
      .name = std::move(name),
      .arguments = std::move(arguments),
  });
}

auto ErrorKindOf(const mcp::CallToolResult& result) -> std::string {
  REQUIRE(result.isError);
  REQUIRE(result.structuredContent.has_value());
  return (*result.structuredContent)["error"]["kind"].get<std::string>();
}

}  // namespace

TEST_CASE("Initialize publishes the resolved tools", "[tool_dispatcher]") {
  asio::io_context io_context;
  auto session = MakeSession(io_context.get_executor());

  auto listed = session.dispatcher->ListTools();
  std::vector<std::string> names;
  for (const auto& tool : listed.tools) {
    names.push_back(tool.name);
  }
  REQUIRE(
      names == std::vector<std::string>{
                   "boom", "echo", "edit", "fail", "greet", "inspect",
                   "latin1_fail", "latin1_match", "latin1_text", "throw_int"});
  REQUIRE(session.dispatcher->ExposedToolNames() == names);

  const auto instructions = session.dispatcher->Instructions();
  const auto* agent = session.orchestrator->Config().FindContext("agent");
  const auto* interactive =
      session.orchestrator->Config().FindMode("interactive");
  REQUIRE(instructions == agent->prompt + "\n\n" + interactive->prompt);
}

TEST_CASE("Initialize rejects an unknown mode", "[tool_dispatcher]") {
  asio::io_context io_context;
  auto config = ServerConfig::LoadFromString("DefaultModes: [missing]\n");
  REQUIRE(config.has_value());
  auto orchestrator = std::make_shared<Orchestrator>(
      io_context.get_executor(), std::move(*config));
  auto dispatcher = std::make_shared<ToolDispatcher>(
      io_context.get_executor(), ToolRegistry{}, orchestrator);

  auto initialized = dispatcher->Initialize();
  REQUIRE_FALSE(initialized.has_value());
  REQUIRE(initialized.error().Kind() == ErrorKind::kConfigResolutionError);
}

TEST_CASE("CallTool reports failures as tool results", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);
    auto& dispatcher = *session.dispatcher;

    auto unknown = co_await Call(dispatcher, "no_such_tool");
    REQUIRE(ErrorKindOf(unknown) == "NoSuchTool");
    REQUIRE(unknown.content.front().text.starts_with("Error (NoSuchTool): "));

    auto failed = co_await Call(dispatcher, "fail");
    REQUIRE(ErrorKindOf(failed) == "InvalidArguments");
    REQUIRE(failed.content.front().text.find("bad input") != std::string::npos);

    auto thrown = co_await Call(dispatcher, "boom");
    REQUIRE(ErrorKindOf(thrown) == "ToolExecutionError");
    REQUIRE(thrown.content.front().text.find("exploded") != std::string::npos);

    auto thrown_int = co_await Call(dispatcher, "throw_int");
    REQUIRE(ErrorKindOf(thrown_int) == "ToolExecutionError");
    REQUIRE(
        (*thrown_int.structuredContent)["error"]["message"] ==
        "unknown exception");

    // The session keeps serving calls afterwards
    auto greeted = co_await Call(dispatcher, "greet");
    REQUIRE_FALSE(greeted.isError);
  });
}

TEST_CASE("Project tools are refused without an active project",
          "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);

    auto result = co_await Call(*session.dispatcher, "inspect");
    REQUIRE(ErrorKindOf(result) == "ProjectNotActive");
    REQUIRE(session.tools["inspect"]->calls == 0);

    FileTestFixture fixture;
    auto activated = co_await session.orchestrator->ActivateProject(
        fixture.GetTempDir().String());
    REQUIRE(activated.has_value());
    auto after = co_await Call(*session.dispatcher, "inspect");
    REQUIRE_FALSE(after.isError);
    REQUIRE(session.tools["inspect"]->calls == 1);

    co_await session.dispatcher->Shutdown();
  });
}

TEST_CASE("Results are rendered as text", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);

    auto text = co_await Call(*session.dispatcher, "greet");
    REQUIRE(text.content.size() == 1);
    REQUIRE(text.content.front().text == "hello");
    REQUIRE_FALSE(text.structuredContent.has_value());

    json arguments{{"name", "value"}, {"count", 2}};
    auto echoed = co_await Call(*session.dispatcher, "echo", arguments);
    REQUIRE(json::parse(echoed.content.front().text) == arguments);

    // Missing arguments reach the tool as an empty object
    auto empty = co_await Call(*session.dispatcher, "echo", nullptr);
    REQUIRE(empty.content.front().text == "{}");
  });
}

TEST_CASE("Invalid UTF-8 in results is replaced", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);
    const std::string replacement = "\xEF\xBF\xBD";

    auto text = co_await Call(*session.dispatcher, "latin1_text");
    REQUIRE_FALSE(text.isError);
    REQUIRE(text.content.front().text == "caf" + replacement);

    auto match = co_await Call(*session.dispatcher, "latin1_match");
    REQUIRE_FALSE(match.isError);
    auto parsed = json::parse(match.content.front().text);
    REQUIRE(parsed[0]["text"] == "caf" + replacement + " = 1");

    auto failed = co_await Call(*session.dispatcher, "latin1_fail");
    REQUIRE(ErrorKindOf(failed) == "ToolExecutionError");
    REQUIRE(
        (*failed.structuredContent)["error"]["message"] ==
        "cannot open caf" + replacement + ".py");
    // Every rendered piece serializes without error
    REQUIRE_NOTHROW(failed.structuredContent->dump());
    REQUIRE_NOTHROW(json(failed.content.front().text).dump());
  });
}

TEST_CASE("search_files over a Latin-1 file yields a readable result",
          "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    fixture.CreateFile("legacy.py", "caf\xE9 = 1\nother = 2\n");

    ToolRegistry registry;
    for (const auto& tool : codenav::tools::MakeFileTools()) {
      auto registered = registry.Register(tool);
      REQUIRE(registered.has_value());
    }
    auto orchestrator = std::make_shared<Orchestrator>(
        executor, ServerConfig::CreateDefault());
    auto dispatcher = std::make_shared<ToolDispatcher>(
        executor, std::move(registry), orchestrator);
    auto initialized = dispatcher->Initialize();
    REQUIRE(initialized.has_value());
    auto activated =
        co_await orchestrator->ActivateProject(fixture.GetTempDir().String());
    REQUIRE(activated.has_value());

    auto found = co_await Call(*dispatcher, "search_files", {{"pattern", "caf"}});
    REQUIRE_FALSE(found.isError);
    auto matches = json::parse(found.content.front().text);
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0]["relative_path"] == "legacy.py");
    REQUIRE(matches[0]["text"] == "caf\xEF\xBF\xBD = 1");

    auto read = co_await Call(
        *dispatcher, "read_file", {{"relative_path", "legacy.py"}});
    REQUIRE_FALSE(read.isError);
    REQUIRE(read.content.front().text.starts_with("caf\xEF\xBF\xBD = 1"));

    co_await dispatcher->Shutdown();
  });
}

TEST_CASE("Every call is reported to the statistics sink", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);
    auto& dispatcher = *session.dispatcher;

    co_await Call(dispatcher, "greet");
    co_await Call(dispatcher, "greet");
    co_await Call(dispatcher, "boom");
    // Rejected before dispatch
    co_await Call(dispatcher, "no_such_tool");

    auto stats = dispatcher.UsageStats();
    REQUIRE(stats["greet"]["calls"] == 2);
    REQUIRE(stats["greet"]["failures"] == 0);
    REQUIRE(stats["boom"]["calls"] == 1);
    REQUIRE(stats["boom"]["failures"] == 1);
    REQUIRE_FALSE(stats.contains("no_such_tool"));

    std::vector<std::pair<std::string, bool>> recorded;
    dispatcher.SetStatisticsSink(
        [&recorded](
            std::string_view tool, std::chrono::milliseconds /*duration*/,
            bool success) { recorded.emplace_back(tool, success); });
    co_await Call(dispatcher, "fail");
    REQUIRE(recorded.size() == 1);
    REQUIRE(recorded.front() == std::pair<std::string, bool>{"fail", false});
  });
}

TEST_CASE("Switching modes republishes the tools", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);
    auto& dispatcher = *session.dispatcher;
    int notifications = 0;
    dispatcher.SetListChangedCallback(
        [&notifications]() -> asio::awaitable<void> {
          ++notifications;
          co_return;
        });

    auto switched = co_await dispatcher.SwitchModes({"review"});
    REQUIRE(switched.has_value());
    REQUIRE(notifications == 1);
    REQUIRE(session.orchestrator->ActiveModes() ==
            std::vector<std::string>{"review"});
    auto removed = co_await Call(dispatcher, "edit");
    REQUIRE(ErrorKindOf(removed) == "NoSuchTool");
    REQUIRE(session.tools["edit"]->calls == 0);

    // Let the change listener's republish run; nothing else changed
    co_await codenav::test::Sleep(executor, std::chrono::milliseconds(20));
    REQUIRE(notifications == 1);

    // An unchanged tool set sends no notification
    auto same = co_await dispatcher.SwitchModes({"review", "interactive"});
    REQUIRE(same.has_value());
    co_await codenav::test::Sleep(executor, std::chrono::milliseconds(20));
    REQUIRE(notifications == 1);

    auto invalid = co_await dispatcher.SwitchModes({"missing"});
    REQUIRE_FALSE(invalid.has_value());
    REQUIRE(invalid.error().Kind() == ErrorKind::kConfigResolutionError);
    REQUIRE(session.orchestrator->ActiveModes() ==
            std::vector<std::string>{"review", "interactive"});

    auto restored = co_await dispatcher.SwitchModes({"interactive"});
    REQUIRE(restored.has_value());
    REQUIRE(notifications == 2);
    REQUIRE(dispatcher.Table()->tools.contains("edit"));
  });
}

TEST_CASE("A read-only project hides mutating tools", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);
    int notifications = 0;
    session.dispatcher->SetListChangedCallback(
        [&notifications]() -> asio::awaitable<void> {
          ++notifications;
          co_return;
        });

    FileTestFixture fixture;
    fixture.CreateFile(".codenav/project.yml", "ReadOnly: true\n");
    auto activated = co_await session.orchestrator->ActivateProject(
        fixture.GetTempDir().String());
    REQUIRE(activated.has_value());

    co_await codenav::test::Sleep(executor, std::chrono::milliseconds(20));
    REQUIRE(notifications == 1);
    REQUIRE_FALSE(session.dispatcher->Table()->tools.contains("edit"));
    REQUIRE(session.dispatcher->Table()->tools.contains("inspect"));

    co_await session.orchestrator->DeactivateProject();
    co_await codenav::test::Sleep(executor, std::chrono::milliseconds(20));
    REQUIRE(notifications == 2);
    REQUIRE(session.dispatcher->Table()->tools.contains("edit"));
  });
}

TEST_CASE("Calls after shutdown are refused", "[tool_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto session = MakeSession(executor);

    co_await session.dispatcher->Shutdown();
    REQUIRE(session.orchestrator->IsShuttingDown());

    auto refused = co_await Call(*session.dispatcher, "greet");
    REQUIRE(ErrorKindOf(refused) == "SessionShuttingDown");
    REQUIRE(session.tools["greet"]->calls == 0);
  });
}
