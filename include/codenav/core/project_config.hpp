#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "codenav/error/error.hpp"
#include "codenav/utils/canonical_path.hpp"
#include "codenav/utils/glob.hpp"

namespace codenav::core {

// Per-project settings read from <root>/.codenav/project.yml
class ProjectConfig {
 public:
  static constexpr std::uintmax_t kDefaultMaxFileSize = 2'000'000;

  explicit ProjectConfig(std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> ProjectConfig;

  // Defaults when the project has no config file; a malformed file fails
  // with kConfigResolutionError
  static auto LoadForRoot(
      const CanonicalPath& root,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> Result<ProjectConfig>;

  static auto LoadFromString(
      std::string_view yaml, std::shared_ptr<spdlog::logger> logger = nullptr)
      -> Result<ProjectConfig>;

  static auto ConfigPathFor(const CanonicalPath& root) -> CanonicalPath;

  [[nodiscard]] auto GetExcludedPaths() const
      -> const std::vector<std::string>& {
    return excluded_paths_;
  }
  [[nodiscard]] auto IsReadOnly() const -> bool {
    return read_only_;
  }
  [[nodiscard]] auto GetMaxFileSize() const -> std::uintmax_t {
    return max_file_size_;
  }
  // Restricts the languages started for this project when set
  [[nodiscard]] auto GetLanguages() const
      -> const std::optional<std::vector<std::string>>& {
    return languages_;
  }

  auto SetReadOnly(bool read_only) -> void {
    read_only_ = read_only;
  }

  // Takes a path relative to the project root with forward slashes. Always
  // excluded directories are checked along with the configured globs.
  [[nodiscard]] auto IsExcluded(std::string_view relative_path) const -> bool;

 private:
  auto Parse(std::string_view source_name, const std::string& text)
      -> Result<void>;
  auto CompilePatterns() -> void;

  std::shared_ptr<spdlog::logger> logger_;

  std::vector<std::string> excluded_paths_;
  bool read_only_ = false;
  std::uintmax_t max_file_size_ = kDefaultMaxFileSize;
  std::optional<std::vector<std::string>> languages_;

  std::vector<utils::GlobPattern> excluded_patterns_;
};

}  // namespace codenav::core
