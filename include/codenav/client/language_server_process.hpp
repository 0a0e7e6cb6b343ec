#pragma once

#include <atomic>
#include <cstdint>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/client/child_process.hpp"
#include "codenav/client/request_dispatcher.hpp"
#include "codenav/client/server_state.hpp"
#include "codenav/utils/async_semaphore.hpp"
#include "codenav/utils/canonical_path.hpp"
#include "codenav/utils/content_hash.hpp"
#include "lsp/basic.hpp"
#include "lsp/document_symbol.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"

namespace codenav::client {

// Launch and timing configuration of one language server
struct LanguageServerConfig {
  // LSP languageId sent with didOpen
  std::string language;
  LaunchDescriptor launch;
  std::size_t max_concurrent_requests = 1;
  std::optional<nlohmann::json> initialization_options;
  std::chrono::milliseconds request_timeout = std::chrono::seconds(240);
  std::chrono::milliseconds startup_timeout = std::chrono::seconds(60);
  std::chrono::milliseconds shutdown_grace = std::chrono::seconds(2);
};

// Supervises one language server child for one (project root, language).
//
// Owns the child, its dispatcher and the open-document bookkeeping, and
// drives the lifecycle state machine (see ServerState). Every typed request
// fails fast with kServerCrashed when the server is not Running; restarting
// is the caller's decision.
class LanguageServerProcess
    : public std::enable_shared_from_this<LanguageServerProcess> {
 public:
  template <typename T>
  using Result = std::expected<T, lsp::error::LspError>;

  // Applies a server-initiated workspace edit (workspace/applyEdit)
  using EditApplier =
      std::function<Result<void>(const lsp::WorkspaceEdit& edit)>;

  LanguageServerProcess(
      asio::any_io_executor executor, CanonicalPath project_root,
      LanguageServerConfig config,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  LanguageServerProcess(const LanguageServerProcess&) = delete;
  LanguageServerProcess(LanguageServerProcess&&) = delete;
  auto operator=(const LanguageServerProcess&)
      -> LanguageServerProcess& = delete;
  auto operator=(LanguageServerProcess&&) -> LanguageServerProcess& = delete;
  ~LanguageServerProcess();

  [[nodiscard]] auto Language() const -> const std::string& {
    return config_.language;
  }
  [[nodiscard]] auto ProjectRoot() const -> const CanonicalPath& {
    return project_root_;
  }
  [[nodiscard]] auto State() const -> ServerState {
    return state_.load();
  }
  [[nodiscard]] auto Capabilities() const -> const lsp::ServerCapabilities& {
    return capabilities_;
  }
  [[nodiscard]] auto PositionEncoding() const -> lsp::PositionEncodingKind {
    return position_encoding_;
  }
  [[nodiscard]] auto Pid() const -> std::optional<pid_t>;
  [[nodiscard]] auto StartCount() const -> int {
    return start_count_;
  }

  auto SetEditApplier(EditApplier applier) -> void {
    edit_applier_ = std::move(applier);
  }

  // NotStarted or Crashed -> Starting -> Running. Concurrent callers share one
  // start; a Running server returns immediately. Failures leave the process
  // Crashed and report kStartupFailed.
  auto Start() -> asio::awaitable<Result<void>>;

  // Kills the current child (if any) and starts a fresh one. Open-document
  // bookkeeping is reset.
  auto Restart() -> asio::awaitable<Result<void>>;

  // Graceful shutdown: shutdown request, exit notification, wait, SIGTERM,
  // wait, SIGKILL. Terminated is final.
  auto Stop() -> asio::awaitable<void>;

  auto DocumentSymbols(const CanonicalPath& path)
      -> asio::awaitable<Result<lsp::DocumentSymbolResult>>;

  auto FindReferences(
      const CanonicalPath& path, lsp::Position position,
      bool include_declaration)
      -> asio::awaitable<Result<std::vector<lsp::Location>>>;

  auto FindDefinition(const CanonicalPath& path, lsp::Position position)
      -> asio::awaitable<Result<std::vector<lsp::Location>>>;

  auto Rename(
      const CanonicalPath& path, lsp::Position position, std::string new_name)
      -> asio::awaitable<Result<lsp::WorkspaceEdit>>;

  auto NotifyOpened(const CanonicalPath& path, std::string text)
      -> asio::awaitable<Result<void>>;
  auto NotifyChanged(const CanonicalPath& path, std::string text)
      -> asio::awaitable<Result<void>>;
  auto NotifyClosed(const CanonicalPath& path) -> asio::awaitable<Result<void>>;

  // Opens the document, or sends a full-text change when its content differs
  // from what the server last saw, or does nothing. Completes after the
  // notification frame is written.
  auto SyncDocument(const CanonicalPath& path, std::string text)
      -> asio::awaitable<Result<void>>;

  [[nodiscard]] auto IsDocumentOpen(const CanonicalPath& path) const -> bool;
  [[nodiscard]] auto DocumentVersion(const CanonicalPath& path) const
      -> std::optional<int>;

 private:
  struct OpenDocument {
    int version = 0;
    utils::ContentHash hash = 0;
  };

  // Runs `fn` (returning awaitable<T>) on the process strand
  template <typename T, typename F>
  auto OnStrand(F fn) -> asio::awaitable<T> {
    co_return co_await asio::co_spawn(strand_, std::move(fn), asio::use_awaitable);
  }

  auto Transition(ServerState to) -> bool;
  auto CheckRunning(std::string_view operation) const -> Result<void>;

  auto Launch() -> asio::awaitable<Result<void>>;
  auto StopOnStrand() -> asio::awaitable<void>;
  auto Handshake() -> asio::awaitable<Result<void>>;
  auto KillChild() -> void;
  auto DrainStderr(std::shared_ptr<ChildProcess> child)
      -> asio::awaitable<void>;
  auto HandleApplyEdit(const nlohmann::json& params)
      -> RequestDispatcher::Result;

  auto Request(std::string method, nlohmann::json params)
      -> asio::awaitable<RequestDispatcher::Result>;
  auto Notify(std::string method, nlohmann::json params)
      -> asio::awaitable<Result<void>>;

  auto OpenOnStrand(const CanonicalPath& path, std::string text)
      -> asio::awaitable<Result<void>>;
  auto ChangeOnStrand(const CanonicalPath& path, std::string text)
      -> asio::awaitable<Result<void>>;

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  CanonicalPath project_root_;
  LanguageServerConfig config_;

  std::atomic<ServerState> state_{ServerState::kNotStarted};
  utils::AsyncSemaphore lifecycle_lock_;
  int start_count_ = 0;
  std::uint64_t generation_ = 0;

  std::shared_ptr<ChildProcess> child_;
  std::shared_ptr<RequestDispatcher> dispatcher_;
  lsp::ServerCapabilities capabilities_;
  lsp::PositionEncodingKind position_encoding_ =
      lsp::PositionEncodingKind::kUtf16;

  std::unordered_map<CanonicalPath, OpenDocument> open_documents_;
  EditApplier edit_applier_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace codenav::client
