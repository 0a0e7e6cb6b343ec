#include "codenav/core/orchestrator.hpp"

#include <filesystem>

#include <fmt/ranges.h>

#include "codenav/utils/scoped_timer.hpp"

namespace codenav::core {

using client::LanguageServerProcess;
using client::ServerState;

Orchestrator::Orchestrator(
    asio::any_io_executor executor, ServerConfig config,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      config_(std::move(config)),
      registry_(config_.GetLanguages()),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      activation_lock_(executor, 1),
      active_context_(config_.GetDefaultContext()),
      active_modes_(config_.GetDefaultModes()) {
}

auto Orchestrator::RequireProject() const -> Result<std::shared_ptr<Project>> {
  if (!active_project_) {
    return CodenavError::Unexpected(ErrorKind::kProjectNotActive);
  }
  return active_project_;
}

auto Orchestrator::IsReadOnly() const -> bool {
  return active_project_ && active_project_->IsReadOnly();
}

auto Orchestrator::SetActiveContext(std::string context) -> void {
  active_context_ = std::move(context);
  NotifyChanged();
}

auto Orchestrator::SetActiveModes(std::vector<std::string> modes) -> void {
  active_modes_ = std::move(modes);
  logger_->info("Active modes: {}", fmt::join(active_modes_, ", "));
  NotifyChanged();
}

auto Orchestrator::Timeouts() const -> ServerTimeouts {
  return ServerTimeouts{
      .request_timeout = config_.GetToolTimeout(),
      .startup_timeout = config_.GetStartupTimeout(),
      .shutdown_grace = config_.GetShutdownGrace(),
  };
}

auto Orchestrator::NotifyChanged() -> void {
  if (change_listener_) {
    change_listener_();
  }
}

auto Orchestrator::ActivateProject(std::string path)
    -> asio::awaitable<Result<std::shared_ptr<Project>>> {
  if (shutting_down_) {
    co_return CodenavError::Unexpected(ErrorKind::kSessionShuttingDown);
  }
  auto permit = co_await activation_lock_.Acquire();

  std::error_code ec;
  if (path.empty() || !std::filesystem::is_directory(path, ec)) {
    co_return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("'{}' is not a directory", path));
  }
  CanonicalPath root(path);

  if (active_project_ && active_project_->Root() == root) {
    logger_->debug("Project {} is already active", root);
    co_return active_project_;
  }

  auto project_config = ProjectConfig::LoadForRoot(root, logger_);
  if (!project_config) {
    co_return std::unexpected(project_config.error());
  }

  if (auto previous = std::exchange(active_project_, nullptr)) {
    co_await previous->Shutdown();
  }
  if (shutting_down_) {
    co_return CodenavError::Unexpected(ErrorKind::kSessionShuttingDown);
  }

  active_project_ = std::make_shared<Project>(
      executor_, root, std::move(*project_config), registry_, Timeouts(),
      logger_);
  logger_->info(
      "Activated project {} at {}{}", active_project_->Name(), root,
      active_project_->IsReadOnly() ? " (read-only)" : "");
  NotifyChanged();
  co_return active_project_;
}

auto Orchestrator::DeactivateProject() -> asio::awaitable<void> {
  auto permit = co_await activation_lock_.Acquire();
  auto project = std::exchange(active_project_, nullptr);
  if (!project) {
    co_return;
  }
  co_await project->Shutdown();
  logger_->info("Deactivated project {}", project->Name());
  NotifyChanged();
}

auto Orchestrator::EnsureStarted(std::shared_ptr<LanguageServerProcess> server)
    -> asio::awaitable<Result<bool>> {
  switch (server->State()) {
    case ServerState::kRunning:
      co_return false;
    case ServerState::kCrashed: {
      logger_->warn(
          "{} language server is down, restarting", server->Language());
      auto restarted = co_await server->Restart();
      if (!restarted) {
        co_return CodenavError::UnexpectedFromLspError(restarted.error());
      }
      co_return true;
    }
    case ServerState::kShuttingDown:
    case ServerState::kTerminated:
      co_return CodenavError::Unexpected(
          ErrorKind::kSessionShuttingDown,
          fmt::format("{} language server was stopped", server->Language()));
    default:
      break;
  }

  utils::ScopedTimer timer(
      fmt::format("start {} language server", server->Language()), logger_);
  auto started = co_await server->Start();
  if (!started) {
    co_return CodenavError::UnexpectedFromLspError(started.error());
  }
  co_return false;
}

auto Orchestrator::GetSymbols(const CanonicalPath& path)
    -> asio::awaitable<Result<symbols::SymbolCache::TreePtr>> {
  auto project = RequireProject();
  if (!project) {
    co_return std::unexpected(project.error());
  }
  auto language = (*project)->LanguageFor(path);
  if (!language) {
    co_return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format(
            "no language server handles '{}'", (*project)->RelativePath(path)));
  }
  auto content = (*project)->ReadFile(path);
  if (!content) {
    co_return std::unexpected(content.error());
  }

  auto cache = (*project)->GetCache(*language);
  auto fetch = [self = shared_from_this(), language = *language, path,
                content = *content]()
      -> asio::awaitable<Result<symbols::FetchedSymbols>> {
    co_return co_await self->WithLanguageServer<symbols::FetchedSymbols>(
        language,
        [path, content](LanguageServerProcess& server)
            -> asio::awaitable<
                LanguageServerProcess::Result<symbols::FetchedSymbols>> {
          auto synced = co_await server.SyncDocument(path, content);
          if (!synced) {
            co_return std::unexpected(synced.error());
          }
          auto result = co_await server.DocumentSymbols(path);
          if (!result) {
            co_return std::unexpected(result.error());
          }
          co_return symbols::FetchedSymbols{
              .result = std::move(*result),
              .encoding = server.PositionEncoding(),
          };
        });
  };
  co_return co_await cache->Get(path, std::move(*content), std::move(fetch));
}

auto Orchestrator::NotifyFileWritten(
    const CanonicalPath& path, std::string content) -> asio::awaitable<void> {
  auto project = active_project_;
  if (!project) {
    co_return;
  }
  auto synced = co_await project->NotifyFileWritten(path, std::move(content));
  if (!synced) {
    logger_->warn(
        "Language servers may not see the new content of {}: {}", path,
        synced.error());
  }
}

auto Orchestrator::ApplyWorkspaceEdit(
    const lsp::WorkspaceEdit& edit, lsp::PositionEncodingKind encoding)
    -> asio::awaitable<Result<std::vector<WrittenFile>>> {
  auto project = RequireProject();
  if (!project) {
    co_return std::unexpected(project.error());
  }
  auto written = (*project)->ApplyWorkspaceEdit(edit, encoding);
  if (!written) {
    co_return std::unexpected(written.error());
  }
  for (const auto& file : *written) {
    co_await NotifyFileWritten(file.path, file.content);
  }
  co_return written;
}

auto Orchestrator::RestartLanguageServer(std::optional<std::string> language)
    -> asio::awaitable<Result<std::vector<std::string>>> {
  auto project = RequireProject();
  if (!project) {
    co_return std::unexpected(project.error());
  }

  std::vector<std::shared_ptr<LanguageServerProcess>> targets;
  if (language) {
    auto server = (*project)->GetServer(*language);
    if (!server) {
      co_return std::unexpected(server.error());
    }
    targets.push_back(*server);
  } else {
    for (const auto& server : (*project)->Servers()) {
      if (server->State() != ServerState::kNotStarted) {
        targets.push_back(server);
      }
    }
  }

  std::vector<std::string> restarted;
  for (const auto& server : targets) {
    logger_->info("Restarting {} language server", server->Language());
    auto result = co_await server->Restart();
    if (!result) {
      co_return CodenavError::UnexpectedFromLspError(result.error());
    }
    restarted.push_back(server->Language());
  }
  co_return restarted;
}

auto Orchestrator::Shutdown() -> asio::awaitable<void> {
  if (shutting_down_) {
    co_return;
  }
  shutting_down_ = true;
  logger_->debug("Orchestrator shutting down");
  co_await DeactivateProject();
}

}  // namespace codenav::core
