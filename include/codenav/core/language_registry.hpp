#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codenav/client/language_server_process.hpp"
#include "codenav/core/server_config.hpp"
#include "codenav/utils/canonical_path.hpp"

namespace codenav::core {

// Timing applied to every language server of a session
struct ServerTimeouts {
  std::chrono::milliseconds request_timeout = std::chrono::seconds(240);
  std::chrono::milliseconds startup_timeout = std::chrono::seconds(60);
  std::chrono::milliseconds shutdown_grace = std::chrono::seconds(2);
};

// Maps files to languages and languages to launch configurations
class LanguageRegistry {
 public:
  LanguageRegistry() = default;
  explicit LanguageRegistry(std::vector<LanguageDefinition> languages);

  [[nodiscard]] auto Find(std::string_view name) const
      -> const LanguageDefinition*;

  // First language whose extension list contains the file's extension
  [[nodiscard]] auto LanguageForFile(const CanonicalPath& path) const
      -> std::optional<std::string>;

  [[nodiscard]] auto Names() const -> std::vector<std::string>;

  [[nodiscard]] auto AllExtensions() const -> std::vector<std::string>;

  // Launch configuration of `language` for a project rooted at `root`
  [[nodiscard]] auto MakeServerConfig(
      const LanguageDefinition& language, const CanonicalPath& root,
      const ServerTimeouts& timeouts) const -> client::LanguageServerConfig;

 private:
  std::vector<LanguageDefinition> languages_;
};

}  // namespace codenav::core
