#include "codenav/client/language_server_process.hpp"

#include <algorithm>
#include <array>

#include <asio/buffer.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <fmt/format.h>
#include <unistd.h>

#include "codenav/utils/scoped_timer.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/navigation.hpp"

namespace codenav::client {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

namespace {

constexpr auto kShutdownRequestTimeout = std::chrono::seconds(5);
constexpr std::string_view kClientName = "codenav";
constexpr std::string_view kClientVersion = "0.1.0";

auto ProtocolError(std::string_view method, const std::exception& e)
    -> std::unexpected<LspError> {
  return LspError::UnexpectedFromCode(
      LspErrorCode::kProtocolError,
      fmt::format("Malformed '{}' response: {}", method, e.what()));
}

}  // namespace

LanguageServerProcess::LanguageServerProcess(
    asio::any_io_executor executor, CanonicalPath project_root,
    LanguageServerConfig config, std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      strand_(asio::make_strand(executor)),
      project_root_(std::move(project_root)),
      config_(std::move(config)),
      lifecycle_lock_(executor, 1),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
  if (config_.launch.working_directory.empty()) {
    config_.launch.working_directory = project_root_.Path();
  }
}

LanguageServerProcess::~LanguageServerProcess() {
  if (child_) {
    child_->ClosePipes();
    child_->Kill();
  }
}

auto LanguageServerProcess::Pid() const -> std::optional<pid_t> {
  if (!child_) {
    return std::nullopt;
  }
  return child_->Pid();
}

auto LanguageServerProcess::Transition(ServerState to) -> bool {
  const auto from = state_.load();
  if (!IsValidTransition(from, to)) {
    logger_->debug(
        "LanguageServerProcess[{}]: ignoring transition {} -> {}",
        config_.language, from, to);
    return false;
  }
  state_.store(to);
  logger_->debug(
      "LanguageServerProcess[{}]: {} -> {}", config_.language, from, to);
  return true;
}

auto LanguageServerProcess::CheckRunning(std::string_view operation) const
    -> Result<void> {
  const auto state = State();
  if (state != ServerState::kRunning) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        fmt::format(
            "{} server is {}, cannot run {}", config_.language, state,
            operation));
  }
  return lsp::error::Ok();
}

auto LanguageServerProcess::Start() -> asio::awaitable<Result<void>> {
  if (State() == ServerState::kRunning) {
    co_return lsp::error::Ok();
  }

  auto permit = co_await lifecycle_lock_.Acquire();
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this()]() -> asio::awaitable<Result<void>> {
        switch (self->State()) {
          case ServerState::kRunning:
            co_return lsp::error::Ok();
          case ServerState::kShuttingDown:
          case ServerState::kTerminated:
            co_return LspError::UnexpectedFromCode(
                LspErrorCode::kStartupFailed,
                fmt::format(
                    "{} server has been stopped", self->config_.language));
          default:
            break;
        }
        co_return co_await self->Launch();
      });
}

auto LanguageServerProcess::Restart() -> asio::awaitable<Result<void>> {
  auto permit = co_await lifecycle_lock_.Acquire();
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this()]() -> asio::awaitable<Result<void>> {
        const auto state = self->State();
        if (state == ServerState::kShuttingDown ||
            state == ServerState::kTerminated) {
          co_return LspError::UnexpectedFromCode(
              LspErrorCode::kStartupFailed,
              fmt::format(
                  "{} server has been stopped", self->config_.language));
        }
        self->logger_->info(
            "Restarting {} language server (state {})",
            self->config_.language, state);
        if (state == ServerState::kRunning || state == ServerState::kStarting) {
          self->Transition(ServerState::kCrashed);
        }
        co_return co_await self->Launch();
      });
}

auto LanguageServerProcess::Stop() -> asio::awaitable<void> {
  auto permit = co_await lifecycle_lock_.Acquire();
  co_await asio::co_spawn(
      strand_,
      [self = shared_from_this()]() -> asio::awaitable<void> {
        co_await self->StopOnStrand();
      },
      asio::use_awaitable);
}

auto LanguageServerProcess::Launch() -> asio::awaitable<Result<void>> {
  KillChild();
  open_documents_.clear();
  capabilities_ = {};
  position_encoding_ = lsp::PositionEncodingKind::kUtf16;

  if (!Transition(ServerState::kStarting)) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kStartupFailed,
        fmt::format("{} server cannot start from {}", config_.language, State()));
  }
  ++start_count_;
  const auto generation = ++generation_;
  utils::ScopedTimer timer(
      fmt::format("Starting {} language server", config_.language), logger_);

  auto spawned = ChildProcess::Spawn(executor_, config_.launch);
  if (!spawned) {
    logger_->error(
        "Failed to spawn {} language server: {}", config_.language,
        spawned.error().Message());
    Transition(ServerState::kCrashed);
    co_return std::unexpected(spawned.error());
  }
  child_ = std::shared_ptr<ChildProcess>(std::move(*spawned));

  auto transport = std::make_unique<ProcessTransport>(executor_, child_, logger_);
  dispatcher_ = std::make_shared<RequestDispatcher>(
      executor_, std::move(transport), config_.max_concurrent_requests, logger_);

  std::weak_ptr<LanguageServerProcess> weak_self = shared_from_this();
  dispatcher_->OnRequest(
      "workspace/applyEdit",
      [weak_self](const nlohmann::json& params)
          -> asio::awaitable<RequestDispatcher::Result> {
        auto self = weak_self.lock();
        if (!self) {
          co_return LspError::UnexpectedFromCode(
              LspErrorCode::kInternalError, "Client is shutting down");
        }
        co_return self->HandleApplyEdit(params);
      });
  dispatcher_->OnClosed([weak_self, generation](const LspError& cause) {
    auto self = weak_self.lock();
    if (!self || self->generation_ != generation) {
      return;
    }
    const auto state = self->State();
    if (state == ServerState::kStarting || state == ServerState::kRunning) {
      self->logger_->warn(
          "{} language server connection lost: {}", self->config_.language,
          cause.Message());
      self->Transition(ServerState::kCrashed);
    }
  });
  dispatcher_->Start();

  asio::co_spawn(
      executor_,
      [self = shared_from_this(), child = child_]() -> asio::awaitable<void> {
        co_await self->DrainStderr(child);
      },
      asio::detached);

  auto handshake = co_await Handshake();
  if (!handshake) {
    logger_->error(
        "{} language server failed to initialize: {}", config_.language,
        handshake.error().Message());
    KillChild();
    Transition(ServerState::kCrashed);
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kStartupFailed, handshake.error().Message());
  }

  if (!Transition(ServerState::kRunning)) {
    KillChild();
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kStartupFailed,
        fmt::format(
            "{} language server exited during startup", config_.language));
  }

  logger_->info(
      "{} language server running (pid {}, {} positions)", config_.language,
      child_->Pid(),
      position_encoding_ == lsp::PositionEncodingKind::kUtf8 ? "utf-8"
                                                             : "utf-16");
  co_return lsp::error::Ok();
}

auto LanguageServerProcess::Handshake() -> asio::awaitable<Result<void>> {
  lsp::InitializeParams params{
      .processId = static_cast<int>(::getpid()),
      .clientInfo =
          lsp::InitializeParams::ClientInfo{
              .name = std::string(kClientName),
              .version = std::string(kClientVersion)},
      .rootPath = project_root_.String(),
      .rootUri = project_root_.ToUri(),
      .initializationOptions = config_.initialization_options,
      .capabilities = lsp::DefaultClientCapabilities(),
      .workspaceFolders = std::vector<lsp::WorkspaceFolder>{
          {.uri = project_root_.ToUri(),
           .name = project_root_.Path().filename().string()}},
  };

  auto response = co_await dispatcher_->Call(
      "initialize", nlohmann::json(params), config_.startup_timeout);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  try {
    auto result = response->get<lsp::InitializeResult>();
    capabilities_ = result.capabilities;
    if (result.serverInfo) {
      logger_->debug(
          "{} language server identifies as {} {}", config_.language,
          result.serverInfo->name, result.serverInfo->version.value_or(""));
    }
  } catch (const nlohmann::json::exception& e) {
    co_return ProtocolError("initialize", e);
  }
  position_encoding_ =
      capabilities_.positionEncoding.value_or(lsp::PositionEncodingKind::kUtf16);

  co_return co_await dispatcher_->Notify(
      "initialized", nlohmann::json::object());
}

auto LanguageServerProcess::StopOnStrand() -> asio::awaitable<void> {
  const auto state = State();
  if (state == ServerState::kTerminated) {
    co_return;
  }
  if (state == ServerState::kNotStarted) {
    Transition(ServerState::kTerminated);
    co_return;
  }

  Transition(ServerState::kShuttingDown);
  auto dispatcher = dispatcher_;
  if (state == ServerState::kRunning && dispatcher && !dispatcher->IsClosed()) {
    auto shutdown = co_await dispatcher->Call(
        "shutdown", nullptr,
        std::min<std::chrono::milliseconds>(
            config_.request_timeout, kShutdownRequestTimeout));
    if (shutdown) {
      auto exit = co_await dispatcher->Notify("exit", nullptr);
      if (!exit) {
        logger_->debug(
            "{} server: exit notification failed: {}", config_.language,
            exit.error().Message());
      }
    } else {
      logger_->debug(
          "{} server: shutdown request failed: {}", config_.language,
          shutdown.error().Message());
    }
  }

  if (auto child = child_) {
    if (!co_await child->WaitForExit(config_.shutdown_grace)) {
      logger_->warn(
          "{} language server did not exit, sending SIGTERM", config_.language);
      co_await child->Terminate(config_.shutdown_grace);
    }
    if (auto status = child->ExitStatus()) {
      logger_->debug(
          "{} language server exited with {}", config_.language,
          DescribeExitStatus(*status));
    }
  }

  KillChild();
  open_documents_.clear();
  Transition(ServerState::kTerminated);
  logger_->info("{} language server stopped", config_.language);
}

auto LanguageServerProcess::KillChild() -> void {
  // Invalidate callbacks of the old connection before its pipes close
  ++generation_;
  if (child_) {
    child_->ClosePipes();
    child_->Kill();
  }
  child_.reset();
  dispatcher_.reset();
}

auto LanguageServerProcess::DrainStderr(std::shared_ptr<ChildProcess> child)
    -> asio::awaitable<void> {
  std::array<char, 4096> buffer{};
  std::string pending;
  auto& stream = child->Stderr();

  while (stream.is_open()) {
    std::error_code ec;
    auto bytes = co_await stream.async_read_some(
        asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      break;
    }
    pending.append(buffer.data(), bytes);

    std::size_t newline = 0;
    while ((newline = pending.find('\n')) != std::string::npos) {
      auto line = std::string_view(pending).substr(0, newline);
      if (line.ends_with('\r')) {
        line.remove_suffix(1);
      }
      if (!line.empty()) {
        logger_->debug("[{} stderr] {}", config_.language, line);
      }
      pending.erase(0, newline + 1);
    }
  }
  if (!pending.empty()) {
    logger_->debug("[{} stderr] {}", config_.language, pending);
  }
}

auto LanguageServerProcess::HandleApplyEdit(const nlohmann::json& params)
    -> RequestDispatcher::Result {
  if (!edit_applier_) {
    return nlohmann::json{
        {"applied", false}, {"failureReason", "Edits are not supported"}};
  }

  lsp::WorkspaceEdit edit;
  try {
    edit = params.at("edit").get<lsp::WorkspaceEdit>();
  } catch (const nlohmann::json::exception& e) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams,
        fmt::format("Invalid workspace edit: {}", e.what()));
  }

  auto applied = edit_applier_(edit);
  if (!applied) {
    logger_->warn(
        "Failed to apply server workspace edit: {}", applied.error().Message());
    return nlohmann::json{
        {"applied", false}, {"failureReason", applied.error().Message()}};
  }
  return nlohmann::json{{"applied", true}};
}

auto LanguageServerProcess::Request(std::string method, nlohmann::json params)
    -> asio::awaitable<RequestDispatcher::Result> {
  co_return co_await OnStrand<RequestDispatcher::Result>(
      [self = shared_from_this(), method = std::move(method),
       params = std::move(params)]() mutable
      -> asio::awaitable<RequestDispatcher::Result> {
        if (auto running = self->CheckRunning(method); !running) {
          co_return std::unexpected(running.error());
        }
        auto dispatcher = self->dispatcher_;
        co_return co_await dispatcher->Call(
            std::move(method), std::move(params),
            self->config_.request_timeout);
      });
}

auto LanguageServerProcess::Notify(std::string method, nlohmann::json params)
    -> asio::awaitable<Result<void>> {
  auto dispatcher = dispatcher_;
  if (!dispatcher) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        fmt::format("{} server has no connection", config_.language));
  }
  co_return co_await dispatcher->Notify(std::move(method), std::move(params));
}

auto LanguageServerProcess::DocumentSymbols(const CanonicalPath& path)
    -> asio::awaitable<Result<lsp::DocumentSymbolResult>> {
  if (auto running = CheckRunning("textDocument/documentSymbol"); !running) {
    co_return std::unexpected(running.error());
  }
  if (!capabilities_.documentSymbolProvider) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kCapabilityMissing,
        fmt::format("{} server has no documentSymbolProvider", config_.language));
  }

  lsp::DocumentSymbolParams params{.textDocument = {.uri = path.ToUri()}};
  auto response =
      co_await Request("textDocument/documentSymbol", nlohmann::json(params));
  if (!response) {
    co_return std::unexpected(response.error());
  }
  try {
    co_return lsp::ParseDocumentSymbolResult(*response);
  } catch (const nlohmann::json::exception& e) {
    co_return ProtocolError("textDocument/documentSymbol", e);
  }
}

auto LanguageServerProcess::FindReferences(
    const CanonicalPath& path, lsp::Position position, bool include_declaration)
    -> asio::awaitable<Result<std::vector<lsp::Location>>> {
  if (auto running = CheckRunning("textDocument/references"); !running) {
    co_return std::unexpected(running.error());
  }
  if (!capabilities_.referencesProvider) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kCapabilityMissing,
        fmt::format("{} server has no referencesProvider", config_.language));
  }

  lsp::ReferenceParams params;
  params.textDocument.uri = path.ToUri();
  params.position = position;
  params.context.includeDeclaration = include_declaration;
  auto response =
      co_await Request("textDocument/references", nlohmann::json(params));
  if (!response) {
    co_return std::unexpected(response.error());
  }
  try {
    co_return lsp::ParseLocations(*response);
  } catch (const nlohmann::json::exception& e) {
    co_return ProtocolError("textDocument/references", e);
  }
}

auto LanguageServerProcess::FindDefinition(
    const CanonicalPath& path, lsp::Position position)
    -> asio::awaitable<Result<std::vector<lsp::Location>>> {
  if (auto running = CheckRunning("textDocument/definition"); !running) {
    co_return std::unexpected(running.error());
  }
  if (!capabilities_.definitionProvider) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kCapabilityMissing,
        fmt::format("{} server has no definitionProvider", config_.language));
  }

  lsp::DefinitionParams params;
  params.textDocument.uri = path.ToUri();
  params.position = position;
  auto response =
      co_await Request("textDocument/definition", nlohmann::json(params));
  if (!response) {
    co_return std::unexpected(response.error());
  }
  try {
    co_return lsp::ParseLocations(*response);
  } catch (const nlohmann::json::exception& e) {
    co_return ProtocolError("textDocument/definition", e);
  }
}

auto LanguageServerProcess::Rename(
    const CanonicalPath& path, lsp::Position position, std::string new_name)
    -> asio::awaitable<Result<lsp::WorkspaceEdit>> {
  if (auto running = CheckRunning("textDocument/rename"); !running) {
    co_return std::unexpected(running.error());
  }
  if (!capabilities_.renameProvider) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kCapabilityMissing,
        fmt::format("{} server has no renameProvider", config_.language));
  }

  lsp::RenameParams params;
  params.textDocument.uri = path.ToUri();
  params.position = position;
  params.newName = std::move(new_name);
  auto response =
      co_await Request("textDocument/rename", nlohmann::json(params));
  if (!response) {
    co_return std::unexpected(response.error());
  }
  if (response->is_null()) {
    co_return lsp::WorkspaceEdit{};
  }
  try {
    co_return response->get<lsp::WorkspaceEdit>();
  } catch (const nlohmann::json::exception& e) {
    co_return ProtocolError("textDocument/rename", e);
  }
}

auto LanguageServerProcess::NotifyOpened(
    const CanonicalPath& path, std::string text)
    -> asio::awaitable<Result<void>> {
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this(), path,
       text = std::move(text)]() mutable -> asio::awaitable<Result<void>> {
        co_return co_await self->OpenOnStrand(path, std::move(text));
      });
}

auto LanguageServerProcess::NotifyChanged(
    const CanonicalPath& path, std::string text)
    -> asio::awaitable<Result<void>> {
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this(), path,
       text = std::move(text)]() mutable -> asio::awaitable<Result<void>> {
        co_return co_await self->ChangeOnStrand(path, std::move(text));
      });
}

auto LanguageServerProcess::NotifyClosed(const CanonicalPath& path)
    -> asio::awaitable<Result<void>> {
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this(), path]() -> asio::awaitable<Result<void>> {
        if (auto running = self->CheckRunning("textDocument/didClose");
            !running) {
          co_return std::unexpected(running.error());
        }
        if (self->open_documents_.erase(path) == 0) {
          co_return lsp::error::Ok();
        }
        lsp::DidCloseTextDocumentParams params{
            .textDocument = {.uri = path.ToUri()}};
        co_return co_await self->Notify(
            "textDocument/didClose", nlohmann::json(params));
      });
}

auto LanguageServerProcess::SyncDocument(
    const CanonicalPath& path, std::string text)
    -> asio::awaitable<Result<void>> {
  co_return co_await OnStrand<Result<void>>(
      [self = shared_from_this(), path,
       text = std::move(text)]() mutable -> asio::awaitable<Result<void>> {
        auto it = self->open_documents_.find(path);
        if (it == self->open_documents_.end()) {
          co_return co_await self->OpenOnStrand(path, std::move(text));
        }
        if (it->second.hash == utils::HashContent(text)) {
          if (auto running = self->CheckRunning("document sync"); !running) {
            co_return std::unexpected(running.error());
          }
          co_return lsp::error::Ok();
        }
        co_return co_await self->ChangeOnStrand(path, std::move(text));
      });
}

auto LanguageServerProcess::OpenOnStrand(
    const CanonicalPath& path, std::string text)
    -> asio::awaitable<Result<void>> {
  if (auto running = CheckRunning("textDocument/didOpen"); !running) {
    co_return std::unexpected(running.error());
  }
  if (open_documents_.contains(path)) {
    co_return co_await ChangeOnStrand(path, std::move(text));
  }

  open_documents_[path] =
      OpenDocument{.version = 1, .hash = utils::HashContent(text)};
  lsp::DidOpenTextDocumentParams params{
      .textDocument = {
          .uri = path.ToUri(),
          .languageId = config_.language,
          .version = 1,
          .text = std::move(text)}};
  auto sent =
      co_await Notify("textDocument/didOpen", nlohmann::json(params));
  if (!sent) {
    open_documents_.erase(path);
  }
  co_return sent;
}

auto LanguageServerProcess::ChangeOnStrand(
    const CanonicalPath& path, std::string text)
    -> asio::awaitable<Result<void>> {
  if (auto running = CheckRunning("textDocument/didChange"); !running) {
    co_return std::unexpected(running.error());
  }
  auto it = open_documents_.find(path);
  if (it == open_documents_.end()) {
    co_return co_await OpenOnStrand(path, std::move(text));
  }

  auto& document = it->second;
  document.version += 1;
  document.hash = utils::HashContent(text);

  lsp::DidChangeTextDocumentParams params;
  params.textDocument.uri = path.ToUri();
  params.textDocument.version = document.version;
  params.contentChanges.push_back(
      lsp::TextDocumentContentChangeEvent{.range = std::nullopt, .text = std::move(text)});
  co_return co_await Notify("textDocument/didChange", nlohmann::json(params));
}

auto LanguageServerProcess::IsDocumentOpen(const CanonicalPath& path) const
    -> bool {
  return open_documents_.contains(path);
}

auto LanguageServerProcess::DocumentVersion(const CanonicalPath& path) const
    -> std::optional<int> {
  auto it = open_documents_.find(path);
  if (it == open_documents_.end()) {
    return std::nullopt;
  }
  return it->second.version;
}

}  // namespace codenav::client
