#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "codenav/client/language_server_process.hpp"
#include "codenav/core/language_registry.hpp"
#include "codenav/core/project.hpp"
#include "codenav/core/server_config.hpp"
#include "codenav/error/error.hpp"
#include "codenav/symbols/symbol_cache.hpp"
#include "codenav/utils/async_semaphore.hpp"
#include "codenav/utils/canonical_path.hpp"
#include "lsp/error.hpp"

namespace codenav::core {

// Operation run against a started language server
template <typename T>
using ServerOperation = std::function<
    asio::awaitable<client::LanguageServerProcess::Result<T>>(
        client::LanguageServerProcess& server)>;

// Owns the session state: the active project, the active context and modes,
// and the restart policy for language servers.
//
// Runs on the session io_context; accessors are called from its thread.
class Orchestrator : public std::enable_shared_from_this<Orchestrator> {
 public:
  // Invoked whenever an input of tool resolution changes (project activated
  // or deactivated, modes switched)
  using ChangeListener = std::function<void()>;

  Orchestrator(
      asio::any_io_executor executor, ServerConfig config,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  auto operator=(const Orchestrator&) -> Orchestrator& = delete;
  auto operator=(Orchestrator&&) -> Orchestrator& = delete;
  ~Orchestrator() = default;

  [[nodiscard]] auto Config() const -> const ServerConfig& {
    return config_;
  }
  [[nodiscard]] auto Languages() const -> const LanguageRegistry& {
    return registry_;
  }

  [[nodiscard]] auto ActiveProject() const -> std::shared_ptr<Project> {
    return active_project_;
  }
  // The active project or kProjectNotActive
  [[nodiscard]] auto RequireProject() const -> Result<std::shared_ptr<Project>>;
  [[nodiscard]] auto IsReadOnly() const -> bool;

  [[nodiscard]] auto ActiveContext() const -> const std::string& {
    return active_context_;
  }
  [[nodiscard]] auto ActiveModes() const -> const std::vector<std::string>& {
    return active_modes_;
  }
  auto SetActiveContext(std::string context) -> void;
  auto SetActiveModes(std::vector<std::string> modes) -> void;

  auto SetChangeListener(ChangeListener listener) -> void {
    change_listener_ = std::move(listener);
  }

  [[nodiscard]] auto IsShuttingDown() const -> bool {
    return shutting_down_;
  }

  // Deactivates the current project (if another) and activates the project
  // at `path`. Activating the already active root is a no-op.
  auto ActivateProject(std::string path)
      -> asio::awaitable<Result<std::shared_ptr<Project>>>;

  auto DeactivateProject() -> asio::awaitable<void>;

  // Runs `operation` against the language server of `language` in the active
  // project, starting it on first use. A crash (during the call, or found
  // before it) triggers one restart and one retry; a second crash in the same
  // call is returned as a fatal kCrashError.
  template <typename T>
  auto WithLanguageServer(std::string language, ServerOperation<T> operation)
      -> asio::awaitable<Result<T>>;

  // Symbol tree of a project file through the language's symbol cache
  auto GetSymbols(const CanonicalPath& path)
      -> asio::awaitable<Result<symbols::SymbolCache::TreePtr>>;

  // Propagates a file written by a tool to the servers that have it open.
  // Failures are logged; the write itself already succeeded.
  auto NotifyFileWritten(const CanonicalPath& path, std::string content)
      -> asio::awaitable<void>;

  // Applies a workspace edit to disk and notifies the servers
  auto ApplyWorkspaceEdit(
      const lsp::WorkspaceEdit& edit, lsp::PositionEncodingKind encoding)
      -> asio::awaitable<Result<std::vector<WrittenFile>>>;

  // Restarts the server of `language`, or every started server of the
  // project. Returns the restarted languages.
  auto RestartLanguageServer(std::optional<std::string> language)
      -> asio::awaitable<Result<std::vector<std::string>>>;

  // Ends the session: later activations fail with kSessionShuttingDown and
  // the active project is torn down
  auto Shutdown() -> asio::awaitable<void>;

 private:
  // Starts the server when needed; true when a crashed server was restarted
  auto EnsureStarted(std::shared_ptr<client::LanguageServerProcess> server)
      -> asio::awaitable<Result<bool>>;

  auto NotifyChanged() -> void;
  auto Timeouts() const -> ServerTimeouts;

  asio::any_io_executor executor_;
  ServerConfig config_;
  LanguageRegistry registry_;
  std::shared_ptr<spdlog::logger> logger_;

  utils::AsyncSemaphore activation_lock_;
  std::shared_ptr<Project> active_project_;
  std::string active_context_;
  std::vector<std::string> active_modes_;
  bool shutting_down_ = false;

  ChangeListener change_listener_;
};

template <typename T>
auto Orchestrator::WithLanguageServer(
    std::string language, ServerOperation<T> operation)
    -> asio::awaitable<Result<T>> {
  auto project = RequireProject();
  if (!project) {
    co_return std::unexpected(project.error());
  }
  auto server = (*project)->GetServer(language);
  if (!server) {
    co_return std::unexpected(server.error());
  }
  auto process = *server;

  auto started = co_await EnsureStarted(process);
  if (!started) {
    co_return std::unexpected(started.error());
  }
  bool restarted = *started;

  while (true) {
    const auto start_count = process->StartCount();
    auto result = co_await operation(*process);
    if (result) {
      co_return std::move(*result);
    }
    if (result.error().Code() != lsp::error::LspErrorCode::kServerCrashed) {
      co_return CodenavError::UnexpectedFromLspError(result.error());
    }
    if (restarted) {
      logger_->error(
          "{} language server crashed again after restart", language);
      co_return CodenavError::Unexpected(
          ErrorKind::kCrashError,
          fmt::format(
              "{} language server crashed again after restart: {}", language,
              result.error().Message()));
    }

    restarted = true;
    // Another caller may already have brought up a fresh server
    if (process->StartCount() == start_count ||
        process->State() != client::ServerState::kRunning) {
      logger_->warn(
          "{} language server crashed ({}), restarting", language,
          result.error().Message());
      auto restart = co_await process->Restart();
      if (!restart) {
        co_return CodenavError::UnexpectedFromLspError(restart.error());
      }
    }
  }
}

}  // namespace codenav::core
