#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/error/error.hpp"

namespace codenav::core {

// Include/exclude tool-name globs. A name is admitted when the include list
// is empty or one include matches, and no exclude matches.
struct ToolPolicy {
  std::vector<std::string> included;
  std::vector<std::string> excluded;
};

// Named policy selected once per session
struct ContextDefinition {
  std::string name;
  std::string prompt;
  ToolPolicy policy;
};

// Named policy that can be switched at runtime; active modes compose
struct ModeDefinition {
  std::string name;
  std::string prompt;
  ToolPolicy policy;
};

// How to run the language server of one language
struct LanguageDefinition {
  std::string name;
  std::vector<std::string> extensions;
  std::string command;
  std::vector<std::string> args;
  // Empty means the project root
  std::string working_directory;
  std::size_t max_concurrent_requests = 1;
  std::optional<nlohmann::json> initialization_options;
};

// Session-wide configuration (codenav.yml)
class ServerConfig {
 public:
  explicit ServerConfig(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Built-in contexts, modes and languages with default timings
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> ServerConfig;

  // Parses a codenav.yml file on top of the defaults. Unreadable or malformed
  // files fail with kConfigResolutionError.
  static auto LoadFromFile(
      const std::filesystem::path& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> Result<ServerConfig>;

  static auto LoadFromString(
      std::string_view yaml, std::shared_ptr<spdlog::logger> logger = nullptr)
      -> Result<ServerConfig>;

  // ~/.codenav/codenav.yml when it exists
  static auto FindUserConfig() -> std::optional<std::filesystem::path>;

  [[nodiscard]] auto GetToolTimeout() const -> std::chrono::seconds {
    return tool_timeout_;
  }
  [[nodiscard]] auto GetStartupTimeout() const -> std::chrono::seconds {
    return startup_timeout_;
  }
  [[nodiscard]] auto GetShutdownGrace() const -> std::chrono::seconds {
    return shutdown_grace_;
  }
  [[nodiscard]] auto GetRecordToolUsage() const -> bool {
    return record_tool_usage_;
  }
  [[nodiscard]] auto GetDefaultContext() const -> const std::string& {
    return default_context_;
  }
  [[nodiscard]] auto GetDefaultModes() const
      -> const std::vector<std::string>& {
    return default_modes_;
  }
  [[nodiscard]] auto GetGlobalPolicy() const -> const ToolPolicy& {
    return global_policy_;
  }
  [[nodiscard]] auto GetContexts() const
      -> const std::map<std::string, ContextDefinition>& {
    return contexts_;
  }
  [[nodiscard]] auto GetModes() const
      -> const std::map<std::string, ModeDefinition>& {
    return modes_;
  }
  [[nodiscard]] auto GetLanguages() const
      -> const std::vector<LanguageDefinition>& {
    return languages_;
  }

  [[nodiscard]] auto FindContext(std::string_view name) const
      -> const ContextDefinition*;
  [[nodiscard]] auto FindMode(std::string_view name) const
      -> const ModeDefinition*;

  // Test and command line overrides
  auto SetToolTimeout(std::chrono::seconds timeout) -> void {
    tool_timeout_ = timeout;
  }
  auto SetStartupTimeout(std::chrono::seconds timeout) -> void {
    startup_timeout_ = timeout;
  }
  auto SetShutdownGrace(std::chrono::seconds grace) -> void {
    shutdown_grace_ = grace;
  }
  auto SetDefaultContext(std::string name) -> void {
    default_context_ = std::move(name);
  }
  auto SetDefaultModes(std::vector<std::string> modes) -> void {
    default_modes_ = std::move(modes);
  }
  // Replaces the language with the same name or appends it
  auto SetLanguage(LanguageDefinition language) -> void;

 private:
  auto LoadBuiltins() -> void;
  auto Parse(std::string_view source_name, const std::string& text)
      -> Result<void>;

  std::shared_ptr<spdlog::logger> logger_;

  std::chrono::seconds tool_timeout_{240};
  std::chrono::seconds startup_timeout_{60};
  std::chrono::seconds shutdown_grace_{2};
  bool record_tool_usage_ = true;

  std::string default_context_ = "desktop-app";
  std::vector<std::string> default_modes_ = {"interactive", "editing"};
  ToolPolicy global_policy_;

  std::map<std::string, ContextDefinition> contexts_;
  std::map<std::string, ModeDefinition> modes_;
  std::vector<LanguageDefinition> languages_;
};

}  // namespace codenav::core
