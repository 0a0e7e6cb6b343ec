#include "codenav/core/project_config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace codenav::core {

namespace {

const std::vector<std::string> kAlwaysExcluded = {
    ".git", ".codenav", "node_modules", "__pycache__", ".venv",
};

}  // namespace

ProjectConfig::ProjectConfig(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
  CompilePatterns();
}

auto ProjectConfig::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> ProjectConfig {
  return ProjectConfig(std::move(logger));
}

auto ProjectConfig::ConfigPathFor(const CanonicalPath& root) -> CanonicalPath {
  return root / ".codenav" / "project.yml";
}

auto ProjectConfig::LoadForRoot(
    const CanonicalPath& root, std::shared_ptr<spdlog::logger> logger)
    -> Result<ProjectConfig> {
  ProjectConfig config(std::move(logger));
  const auto config_path = ConfigPathFor(root);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_path.Path(), ec)) {
    config.logger_->debug("No project configuration at {}", config_path);
    return config;
  }

  std::ifstream file(config_path.Path());
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("cannot read {}", config_path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (auto parsed = config.Parse(config_path.String(), buffer.str()); !parsed) {
    return std::unexpected(parsed.error());
  }
  config.logger_->debug("Loaded project configuration from {}", config_path);
  return config;
}

auto ProjectConfig::LoadFromString(
    std::string_view yaml, std::shared_ptr<spdlog::logger> logger)
    -> Result<ProjectConfig> {
  ProjectConfig config(std::move(logger));
  if (auto parsed = config.Parse("<string>", std::string(yaml)); !parsed) {
    return std::unexpected(parsed.error());
  }
  return config;
}

auto ProjectConfig::Parse(std::string_view source_name, const std::string& text)
    -> Result<void> {
  try {
    YAML::Node yaml = YAML::Load(text);
    if (!yaml || yaml.IsNull()) {
      return Ok();
    }
    if (!yaml.IsMap()) {
      return CodenavError::Unexpected(
          ErrorKind::kConfigResolutionError,
          fmt::format("{}: top level must be a mapping", source_name));
    }

    if (yaml["ExcludedPaths"]) {
      for (const auto& pattern : yaml["ExcludedPaths"]) {
        excluded_paths_.push_back(pattern.as<std::string>());
      }
      logger_->debug(
          "Loaded ExcludedPaths with {} patterns", excluded_paths_.size());
    }
    if (yaml["ReadOnly"]) {
      read_only_ = yaml["ReadOnly"].as<bool>();
    }
    if (yaml["MaxFileSize"]) {
      max_file_size_ = yaml["MaxFileSize"].as<std::uintmax_t>();
    }
    if (yaml["Languages"]) {
      std::vector<std::string> languages;
      for (const auto& language : yaml["Languages"]) {
        languages.push_back(language.as<std::string>());
      }
      languages_ = std::move(languages);
    }
  } catch (const YAML::Exception& e) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("{}: {}", source_name, e.what()));
  }

  CompilePatterns();
  return Ok();
}

auto ProjectConfig::CompilePatterns() -> void {
  excluded_patterns_ =
      utils::CompileGlobs(kAlwaysExcluded, utils::GlobPattern::Syntax::kPath);
  auto configured =
      utils::CompileGlobs(excluded_paths_, utils::GlobPattern::Syntax::kPath);
  excluded_patterns_.insert(
      excluded_patterns_.end(), std::make_move_iterator(configured.begin()),
      std::make_move_iterator(configured.end()));
}

auto ProjectConfig::IsExcluded(std::string_view relative_path) const -> bool {
  if (relative_path.empty()) {
    return false;
  }
  return utils::MatchesAny(excluded_patterns_, relative_path);
}

}  // namespace codenav::core
