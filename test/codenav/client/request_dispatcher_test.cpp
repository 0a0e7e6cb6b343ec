#include "codenav/client/request_dispatcher.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "codenav/client/child_process.hpp"
#include "codenav/client/process_transport.hpp"
#include "test/codenav/common/async_fixture.hpp"
#include "test/codenav/common/fake_server_config.hpp"
#include "test/codenav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using codenav::client::ChildProcess;
using codenav::client::LaunchDescriptor;
using codenav::client::ProcessTransport;
using codenav::client::RequestDispatcher;
using codenav::test::FileTestFixture;
using codenav::test::RunAsyncTest;
using lsp::error::LspErrorCode;
using std::chrono::milliseconds;

namespace {

struct Connection {
  std::shared_ptr<ChildProcess> child;
  std::shared_ptr<RequestDispatcher> dispatcher;
};

auto Connect(
    asio::any_io_executor executor, const FileTestFixture& fixture,
    std::vector<std::string> args = {}, std::size_t max_in_flight = 1)
    -> Connection {
  LaunchDescriptor launch{
      .command = codenav::test::kFakeServerPath,
      .args = std::move(args),
      .working_directory = fixture.GetTempDir().Path(),
  };
  auto spawned = ChildProcess::Spawn(executor, launch);
  REQUIRE(spawned.has_value());
  std::shared_ptr<ChildProcess> child(std::move(*spawned));
  auto dispatcher = std::make_shared<RequestDispatcher>(
      executor, std::make_unique<ProcessTransport>(executor, child),
      max_in_flight);
  return {.child = child, .dispatcher = dispatcher};
}

auto InitializeParams(const FileTestFixture& fixture) -> nlohmann::json {
  return {
      {"processId", nullptr},
      {"rootUri", fixture.GetTempDir().ToUri()},
      {"capabilities", nlohmann::json::object()},
  };
}

}  // namespace

TEST_CASE("Call resolves with the server result", "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto connection = Connect(executor, fixture);
    connection.dispatcher->Start();

    auto result = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE(result.has_value());
    REQUIRE((*result)["capabilities"]["documentSymbolProvider"] == true);
    REQUIRE(connection.dispatcher->PendingCount() == 0);

    co_await connection.child->Terminate(milliseconds(500));
  });
}

TEST_CASE("Error responses become errors", "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto connection = Connect(executor, fixture);
    connection.dispatcher->Start();

    auto result = co_await connection.dispatcher->Call(
        "workspace/unknownThing", nlohmann::json::object(), milliseconds(5000));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == LspErrorCode::kMethodNotFound);

    co_await connection.child->Terminate(milliseconds(500));
  });
}

TEST_CASE("Concurrent calls are correlated by id", "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto file = fixture.CreateFile(
        "shapes.py", "class Square:\n    pass\n\ndef area():\n    pass\n");
    auto connection = Connect(executor, fixture, {}, 4);
    connection.dispatcher->Start();

    auto init = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE(init.has_value());

    auto symbols = std::make_shared<int>(0);
    auto definitions = std::make_shared<int>(0);
    auto remaining = std::make_shared<int>(6);
    for (int i = 0; i < 6; ++i) {
      const bool ask_symbols = i % 2 == 0;
      asio::co_spawn(
          executor,
          [dispatcher = connection.dispatcher, file, ask_symbols, symbols,
           definitions, remaining]() -> asio::awaitable<void> {
            if (ask_symbols) {
              auto result = co_await dispatcher->Call(
                  "textDocument/documentSymbol",
                  {{"textDocument", {{"uri", file.ToUri()}}}},
                  milliseconds(5000));
              if (result && result->is_array() && result->size() == 2) {
                ++*symbols;
              }
            } else {
              auto result = co_await dispatcher->Call(
                  "textDocument/definition",
                  {{"textDocument", {{"uri", file.ToUri()}}},
                   {"position", {{"line", 3}, {"character", 5}}}},
                  milliseconds(5000));
              if (result && result->is_array() && result->size() == 1) {
                ++*definitions;
              }
            }
            --*remaining;
          },
          asio::detached);
    }

    for (int i = 0; i < 200 && *remaining > 0; ++i) {
      co_await codenav::test::Sleep(executor, milliseconds(10));
    }
    REQUIRE(*remaining == 0);
    REQUIRE(*symbols == 3);
    REQUIRE(*definitions == 3);

    co_await connection.child->Terminate(milliseconds(500));
  });
}

TEST_CASE("A hung request times out and its id is forgotten",
          "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto connection =
        Connect(executor, fixture, {"--hang-on=textDocument/documentSymbol"});
    connection.dispatcher->Start();

    auto result = co_await connection.dispatcher->Call(
        "textDocument/documentSymbol",
        {{"textDocument", {{"uri", "file:///nowhere.py"}}}}, milliseconds(100));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == LspErrorCode::kTimeoutError);
    REQUIRE(connection.dispatcher->PendingCount() == 0);

    // The connection stays usable
    auto init = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE(init.has_value());

    co_await connection.child->Terminate(milliseconds(500));
  });
}

TEST_CASE("A crash fails pending calls and closes the connection",
          "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto connection = Connect(executor, fixture, {"--crash-on=initialize"});
    auto closed = std::make_shared<bool>(false);
    connection.dispatcher->OnClosed(
        [closed](const lsp::error::LspError&) { *closed = true; });
    connection.dispatcher->Start();

    auto result = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().Code() == LspErrorCode::kServerCrashed);
    REQUIRE(connection.dispatcher->IsClosed());
    REQUIRE(*closed);

    // Later calls fail fast
    auto after = co_await connection.dispatcher->Call(
        "shutdown", nullptr, milliseconds(5000));
    REQUIRE_FALSE(after.has_value());
    REQUIRE(after.error().Code() == LspErrorCode::kServerCrashed);
  });
}

TEST_CASE("Malformed server notifications are dropped",
          "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto file = fixture.CreateFile("app.py", "def main():\n    pass\n");
    auto connection = Connect(executor, fixture, {"--malformed-log"});
    // A handler that trips over the array params of window/showMessage
    auto shown = std::make_shared<int>(0);
    auto last_text = std::make_shared<std::string>();
    connection.dispatcher->OnNotification(
        "window/showMessage", [shown, last_text](const nlohmann::json& params) {
          ++*shown;
          *last_text = params.at("message").get<std::string>();
        });
    connection.dispatcher->Start();

    auto init = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE(init.has_value());
    REQUIRE_FALSE(connection.dispatcher->IsClosed());

    auto symbols = co_await connection.dispatcher->Call(
        "textDocument/documentSymbol", {{"textDocument", {{"uri", file.ToUri()}}}},
        milliseconds(5000));
    REQUIRE(symbols.has_value());
    REQUIRE(symbols->size() == 1);
    REQUIRE(*shown == 2);
    REQUIRE(last_text->empty());
    REQUIRE_FALSE(connection.dispatcher->IsClosed());

    co_await connection.child->Terminate(milliseconds(500));
  });
}

TEST_CASE("Notifications are written before later requests",
          "[request_dispatcher]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture;
    auto connection = Connect(executor, fixture);
    connection.dispatcher->Start();
    auto init = co_await connection.dispatcher->Call(
        "initialize", InitializeParams(fixture), milliseconds(5000));
    REQUIRE(init.has_value());

    const std::string uri = (fixture.GetTempDir() / "unsaved.py").ToUri();
    auto opened = co_await connection.dispatcher->Notify(
        "textDocument/didOpen",
        {{"textDocument",
          {{"uri", uri},
           {"languageId", "python"},
           {"version", 1},
           {"text", "def only_in_memory():\n    pass\n"}}}});
    REQUIRE(opened.has_value());

    auto result = co_await connection.dispatcher->Call(
        "textDocument/documentSymbol", {{"textDocument", {{"uri", uri}}}},
        milliseconds(5000));
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    REQUIRE((*result)[0]["name"] == "only_in_memory");

    co_await connection.child->Terminate(milliseconds(500));
  });
}
