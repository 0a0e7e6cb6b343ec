#include "codenav/core/project.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include "codenav/symbols/text_edit.hpp"

namespace codenav::core {

namespace fs = std::filesystem;

namespace {

auto StagedPath(const CanonicalPath& path) -> fs::path {
  auto staged = path.Path();
  staged += kStagedEditSuffix;
  return staged;
}

auto RemoveStaged(const std::vector<WrittenFile>& files) -> void {
  for (const auto& file : files) {
    std::error_code ec;
    fs::remove(StagedPath(file.path), ec);
  }
}

}  // namespace

Project::Project(
    asio::any_io_executor executor, CanonicalPath root, ProjectConfig config,
    LanguageRegistry registry, ServerTimeouts timeouts,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      root_(std::move(root)),
      config_(std::move(config)),
      registry_(std::move(registry)),
      timeouts_(timeouts),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto Project::Name() const -> std::string {
  auto name = root_.Path().filename().string();
  return name.empty() ? root_.String() : name;
}

auto Project::ResolvePath(std::string_view path) const
    -> Result<CanonicalPath> {
  fs::path raw(path);
  auto resolved = raw.is_absolute() ? CanonicalPath(raw) : root_ / raw;

  auto relative = resolved.RelativeTo(root_);
  if (!relative) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("'{}' is outside the project root {}", path, root_));
  }
  if (config_.IsExcluded(*relative)) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("'{}' is excluded by the project configuration", path));
  }
  return resolved;
}

auto Project::RelativePath(const CanonicalPath& path) const -> std::string {
  return path.RelativeTo(root_).value_or(path.String());
}

auto Project::IsExcluded(const CanonicalPath& path) const -> bool {
  auto relative = path.RelativeTo(root_);
  return !relative || config_.IsExcluded(*relative);
}

auto Project::LanguageFor(const CanonicalPath& path) const
    -> std::optional<std::string> {
  auto language = registry_.LanguageForFile(path);
  if (!language) {
    return std::nullopt;
  }
  const auto& restriction = config_.GetLanguages();
  if (restriction && std::ranges::find(*restriction, *language) ==
                         restriction->end()) {
    return std::nullopt;
  }
  return language;
}

auto Project::EnabledLanguages() const -> std::vector<std::string> {
  auto names = registry_.Names();
  if (const auto& restriction = config_.GetLanguages()) {
    std::erase_if(names, [&restriction](const std::string& name) {
      return std::ranges::find(*restriction, name) == restriction->end();
    });
  }
  return names;
}

auto Project::IsWithinSizeLimit(const CanonicalPath& path) const -> bool {
  std::error_code ec;
  auto size = fs::file_size(path.Path(), ec);
  // Unreadable files are reported by ReadFile
  return ec || size <= config_.GetMaxFileSize();
}

auto Project::ReadFile(const CanonicalPath& path) const -> Result<std::string> {
  std::error_code ec;
  if (!fs::is_regular_file(path.Path(), ec)) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("'{}' is not a file", RelativePath(path)));
  }
  std::ifstream file(path.Path(), std::ios::binary);
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("cannot open '{}'", RelativePath(path)));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

auto Project::WriteFile(const CanonicalPath& path, std::string_view content)
    -> Result<void> {
  if (IsReadOnly()) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("project {} is read-only", Name()));
  }

  std::error_code ec;
  fs::create_directories(path.Path().parent_path(), ec);
  if (ec) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format(
            "cannot create directory for '{}': {}", RelativePath(path),
            ec.message()));
  }

  std::ofstream file(path.Path(), std::ios::binary | std::ios::trunc);
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("cannot write '{}'", RelativePath(path)));
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("write to '{}' failed", RelativePath(path)));
  }
  logger_->debug("Wrote {} bytes to {}", content.size(), path);
  return Ok();
}

auto Project::ListDirectory(const CanonicalPath& dir, bool recursive) const
    -> Result<DirectoryListing> {
  std::error_code ec;
  if (!fs::is_directory(dir.Path(), ec)) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("'{}' is not a directory", RelativePath(dir)));
  }

  DirectoryListing listing;
  auto it = fs::recursive_directory_iterator(
      dir.Path(), fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    CanonicalPath entry(it->path());
    std::error_code entry_ec;
    const bool is_directory = it->is_directory(entry_ec);
    if (IsExcluded(entry)) {
      if (is_directory) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!recursive && is_directory) {
      it.disable_recursion_pending();
    }
    auto relative = RelativePath(entry);
    if (is_directory) {
      listing.directories.push_back(std::move(relative));
    } else {
      listing.files.push_back(std::move(relative));
    }
  }
  if (ec) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("cannot list '{}': {}", RelativePath(dir), ec.message()));
  }

  std::ranges::sort(listing.directories);
  std::ranges::sort(listing.files);
  return listing;
}

auto Project::EnumerateSourceFiles(const CanonicalPath& dir) const
    -> Result<std::vector<CanonicalPath>> {
  std::error_code ec;
  if (fs::is_regular_file(dir.Path(), ec)) {
    return std::vector<CanonicalPath>{dir};
  }

  auto listing = ListDirectory(dir, true);
  if (!listing) {
    return std::unexpected(listing.error());
  }

  std::vector<CanonicalPath> files;
  for (const auto& relative : listing->files) {
    auto path = root_ / relative;
    if (!LanguageFor(path)) {
      continue;
    }
    if (!IsWithinSizeLimit(path)) {
      logger_->debug("Skipping {}: larger than MaxFileSize", relative);
      continue;
    }
    files.push_back(std::move(path));
  }
  return files;
}

auto Project::GetServer(const std::string& language)
    -> Result<std::shared_ptr<client::LanguageServerProcess>> {
  if (auto it = servers_.find(language); it != servers_.end()) {
    return it->second;
  }

  const auto* definition = registry_.Find(language);
  if (definition == nullptr) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("no language server configured for '{}'", language));
  }
  const auto enabled = EnabledLanguages();
  if (std::ranges::find(enabled, language) == enabled.end()) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("language '{}' is disabled for project {}", language,
                    Name()));
  }

  auto server = std::make_shared<client::LanguageServerProcess>(
      executor_, root_,
      registry_.MakeServerConfig(*definition, root_, timeouts_), logger_);
  InstallEditApplier(server);
  servers_.emplace(language, server);
  logger_->debug("Created {} language server for {}", language, root_);
  return server;
}

auto Project::FindServer(std::string_view language) const
    -> std::shared_ptr<client::LanguageServerProcess> {
  auto it = servers_.find(std::string(language));
  return it == servers_.end() ? nullptr : it->second;
}

auto Project::Servers() const
    -> std::vector<std::shared_ptr<client::LanguageServerProcess>> {
  std::vector<std::shared_ptr<client::LanguageServerProcess>> servers;
  servers.reserve(servers_.size());
  for (const auto& [_, server] : servers_) {
    servers.push_back(server);
  }
  return servers;
}

auto Project::GetCache(const std::string& language)
    -> std::shared_ptr<symbols::SymbolCache> {
  auto [it, inserted] = caches_.try_emplace(language);
  if (inserted) {
    it->second = std::make_shared<symbols::SymbolCache>(executor_, logger_);
  }
  return it->second;
}

auto Project::ApplyWorkspaceEdit(
    const lsp::WorkspaceEdit& edit, lsp::PositionEncodingKind encoding)
    -> Result<std::vector<WrittenFile>> {
  if (IsReadOnly()) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("project {} is read-only", Name()));
  }

  std::vector<WrittenFile> edited;
  for (const auto& [uri, edits] : edit.EditsByUri()) {
    auto path = CanonicalPath::FromUri(uri);
    if (IsExcluded(path)) {
      return CodenavError::Unexpected(
          ErrorKind::kToolExecutionError,
          fmt::format("edit targets '{}' outside the project", path));
    }
    auto content = ReadFile(path);
    if (!content) {
      return std::unexpected(content.error());
    }
    auto updated = symbols::ApplyTextEdits(*content, edits, encoding);
    if (!updated) {
      return std::unexpected(updated.error());
    }
    edited.push_back(WrittenFile{.path = path, .content = std::move(*updated)});
  }

  // Stage every file beside its target, then move them all into place
  std::vector<WrittenFile> staged;
  for (const auto& file : edited) {
    if (auto written = StageFile(file.path, file.content); !written) {
      RemoveStaged(staged);
      return std::unexpected(written.error());
    }
    staged.push_back(file);
  }
  for (const auto& file : edited) {
    std::error_code ec;
    fs::rename(StagedPath(file.path), file.path.Path(), ec);
    if (ec) {
      RemoveStaged(staged);
      return CodenavError::Unexpected(
          ErrorKind::kToolExecutionError,
          fmt::format(
              "cannot replace '{}': {}", RelativePath(file.path),
              ec.message()));
    }
  }
  logger_->debug("Applied workspace edit to {} files", edited.size());
  return edited;
}

auto Project::StageFile(const CanonicalPath& path, std::string_view content)
    -> Result<void> {
  const auto staged = StagedPath(path);
  std::ofstream file(staged, std::ios::binary | std::ios::trunc);
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("cannot write '{}'", RelativePath(path)));
  }
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (!file) {
    std::error_code ec;
    fs::remove(staged, ec);
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format("write to '{}' failed", RelativePath(path)));
  }

  std::error_code ec;
  const auto permissions = fs::status(path.Path(), ec).permissions();
  if (!ec) {
    fs::permissions(staged, permissions, ec);
  }
  if (ec) {
    const auto message = ec.message();
    fs::remove(staged, ec);
    return CodenavError::Unexpected(
        ErrorKind::kToolExecutionError,
        fmt::format(
            "cannot copy permissions of '{}': {}", RelativePath(path),
            message));
  }
  return Ok();
}

auto Project::NotifyFileWritten(const CanonicalPath& path, std::string content)
    -> asio::awaitable<Result<void>> {
  for (const auto& server : Servers()) {
    if (server->State() != client::ServerState::kRunning ||
        !server->IsDocumentOpen(path)) {
      continue;
    }
    auto synced = co_await server->SyncDocument(path, content);
    if (!synced) {
      co_return CodenavError::UnexpectedFromLspError(synced.error());
    }
  }
  co_return Ok();
}

auto Project::InstallEditApplier(
    const std::shared_ptr<client::LanguageServerProcess>& server) -> void {
  std::weak_ptr<Project> weak_project = weak_from_this();
  std::weak_ptr<client::LanguageServerProcess> weak_server = server;
  server->SetEditApplier(
      [weak_project, weak_server](const lsp::WorkspaceEdit& edit)
          -> client::LanguageServerProcess::Result<void> {
        auto project = weak_project.lock();
        auto server = weak_server.lock();
        if (!project || !server) {
          return lsp::error::LspError::UnexpectedFromCode(
              lsp::error::LspErrorCode::kInternalError, "project closed");
        }
        auto written =
            project->ApplyWorkspaceEdit(edit, server->PositionEncoding());
        if (!written) {
          return lsp::error::LspError::UnexpectedFromCode(
              lsp::error::LspErrorCode::kInternalError,
              written.error().Message());
        }
        asio::co_spawn(
            project->executor_,
            [project, files = std::move(*written)]() -> asio::awaitable<void> {
              for (const auto& file : files) {
                auto synced =
                    co_await project->NotifyFileWritten(file.path, file.content);
                if (!synced) {
                  project->logger_->warn(
                      "Failed to sync {} after server edit: {}", file.path,
                      synced.error());
                }
              }
            },
            asio::detached);
        return lsp::error::Ok();
      });
}

auto Project::Shutdown() -> asio::awaitable<void> {
  logger_->info("Shutting down project {}", Name());
  auto servers = std::exchange(servers_, {});
  auto caches = std::exchange(caches_, {});
  for (const auto& [language, server] : servers) {
    logger_->debug("Stopping {} language server", language);
    co_await server->Stop();
  }
  for (const auto& [_, cache] : caches) {
    co_await cache->Clear();
  }
}

}  // namespace codenav::core
