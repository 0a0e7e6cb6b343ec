#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "codenav/client/language_server_process.hpp"
#include "codenav/core/language_registry.hpp"
#include "codenav/core/project_config.hpp"
#include "codenav/error/error.hpp"
#include "codenav/symbols/symbol_cache.hpp"
#include "codenav/utils/canonical_path.hpp"
#include "lsp/basic.hpp"

namespace codenav::core {

// Project-relative entries of a directory listing, sorted
struct DirectoryListing {
  std::vector<std::string> directories;
  std::vector<std::string> files;
};

// Suffix of the sibling file a workspace edit writes before renaming it over
// the original
inline constexpr std::string_view kStagedEditSuffix = ".codenav-edit";

// A file rewritten by a workspace edit together with its new content
struct WrittenFile {
  CanonicalPath path;
  std::string content;
};

// One activated code base: root, settings, and a language server plus a
// symbol cache per language in use.
//
// Servers are created lazily in NotStarted state, at most one per language.
// Shutdown stops every server and clears every cache; a Project is not
// reused afterwards.
class Project : public std::enable_shared_from_this<Project> {
 public:
  Project(
      asio::any_io_executor executor, CanonicalPath root, ProjectConfig config,
      LanguageRegistry registry, ServerTimeouts timeouts,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  Project(const Project&) = delete;
  Project(Project&&) = delete;
  auto operator=(const Project&) -> Project& = delete;
  auto operator=(Project&&) -> Project& = delete;
  ~Project() = default;

  [[nodiscard]] auto Root() const -> const CanonicalPath& {
    return root_;
  }
  [[nodiscard]] auto Name() const -> std::string;
  [[nodiscard]] auto Config() const -> const ProjectConfig& {
    return config_;
  }
  [[nodiscard]] auto IsReadOnly() const -> bool {
    return config_.IsReadOnly();
  }

  // Resolves a tool path (relative to the root, or absolute inside it).
  // Paths outside the root or excluded by configuration fail with
  // kInvalidArguments.
  [[nodiscard]] auto ResolvePath(std::string_view path) const
      -> Result<CanonicalPath>;

  // Forward-slash path relative to the root ("" for the root itself)
  [[nodiscard]] auto RelativePath(const CanonicalPath& path) const
      -> std::string;

  [[nodiscard]] auto IsExcluded(const CanonicalPath& path) const -> bool;

  // Language of the file, honoring the project's language restriction
  [[nodiscard]] auto LanguageFor(const CanonicalPath& path) const
      -> std::optional<std::string>;

  [[nodiscard]] auto EnabledLanguages() const -> std::vector<std::string>;

  [[nodiscard]] auto IsWithinSizeLimit(const CanonicalPath& path) const
      -> bool;

  [[nodiscard]] auto ReadFile(const CanonicalPath& path) const
      -> Result<std::string>;

  // Creates or truncates the file, creating parent directories
  auto WriteFile(const CanonicalPath& path, std::string_view content)
      -> Result<void>;

  [[nodiscard]] auto ListDirectory(const CanonicalPath& dir, bool recursive)
      const -> Result<DirectoryListing>;

  // Files below `dir` (or `dir` itself when it is a file) that have a known
  // language, are not excluded and fit the size limit
  [[nodiscard]] auto EnumerateSourceFiles(const CanonicalPath& dir) const
      -> Result<std::vector<CanonicalPath>>;

  // Existing server of `language` or a new NotStarted one
  auto GetServer(const std::string& language)
      -> Result<std::shared_ptr<client::LanguageServerProcess>>;

  [[nodiscard]] auto FindServer(std::string_view language) const
      -> std::shared_ptr<client::LanguageServerProcess>;

  [[nodiscard]] auto Servers() const
      -> std::vector<std::shared_ptr<client::LanguageServerProcess>>;

  auto GetCache(const std::string& language)
      -> std::shared_ptr<symbols::SymbolCache>;

  // Applies the text edits of a workspace edit to files on disk. Every file
  // is edited in memory and written to a staged sibling first, so a failing
  // edit or write leaves the originals untouched.
  auto ApplyWorkspaceEdit(
      const lsp::WorkspaceEdit& edit, lsp::PositionEncodingKind encoding)
      -> Result<std::vector<WrittenFile>>;

  // Sends the new content of a written file to every running server that has
  // the document open
  auto NotifyFileWritten(const CanonicalPath& path, std::string content)
      -> asio::awaitable<Result<void>>;

  auto Shutdown() -> asio::awaitable<void>;

 private:
  auto StageFile(const CanonicalPath& path, std::string_view content)
      -> Result<void>;
  auto InstallEditApplier(
      const std::shared_ptr<client::LanguageServerProcess>& server) -> void;

  asio::any_io_executor executor_;
  CanonicalPath root_;
  ProjectConfig config_;
  LanguageRegistry registry_;
  ServerTimeouts timeouts_;
  std::shared_ptr<spdlog::logger> logger_;

  std::map<std::string, std::shared_ptr<client::LanguageServerProcess>>
      servers_;
  std::map<std::string, std::shared_ptr<symbols::SymbolCache>> caches_;
};

}  // namespace codenav::core
