#include "codenav/core/server_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace codenav::core {

namespace {

auto ReadStringList(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> values;
  if (!node) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  for (const auto& item : node) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

auto ReadPolicy(const YAML::Node& node) -> ToolPolicy {
  return ToolPolicy{
      .included = ReadStringList(node["IncludedTools"]),
      .excluded = ReadStringList(node["ExcludedTools"]),
  };
}

auto YamlToJson(const YAML::Node& node) -> nlohmann::json {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      auto object = nlohmann::json::object();
      for (const auto& kv : node) {
        object[kv.first.as<std::string>()] = YamlToJson(kv.second);
      }
      return object;
    }
    case YAML::NodeType::Sequence: {
      auto array = nlohmann::json::array();
      for (const auto& item : node) {
        array.push_back(YamlToJson(item));
      }
      return array;
    }
    case YAML::NodeType::Scalar: {
      // Plain scalars keep their YAML type; quoted ones stay strings
      if (node.Tag() != "!") {
        bool bool_value = false;
        if (YAML::convert<bool>::decode(node, bool_value)) {
          return bool_value;
        }
        long long int_value = 0;
        if (YAML::convert<long long>::decode(node, int_value)) {
          return int_value;
        }
        double double_value = 0;
        if (YAML::convert<double>::decode(node, double_value)) {
          return double_value;
        }
      }
      return node.as<std::string>();
    }
    default:
      return nullptr;
  }
}

// Tools that modify files; planning mode hides them
const std::vector<std::string> kEditingTools = {
    "replace_symbol_body", "insert_after_symbol", "insert_before_symbol",
    "rename_symbol",       "write_file",
};

// File tools an IDE assistant host already provides
const std::vector<std::string> kIdeFileTools = {
    "read_file",
    "write_file",
    "list_directory",
    "search_files",
};

}  // namespace

ServerConfig::ServerConfig(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto ServerConfig::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> ServerConfig {
  ServerConfig config(std::move(logger));
  config.LoadBuiltins();
  return config;
}

auto ServerConfig::LoadBuiltins() -> void {
  contexts_["desktop-app"] = ContextDefinition{
      .name = "desktop-app",
      .prompt =
          "You are connected to codenav, a symbol-level code navigation and "
          "editing server. Activate a project before using project tools.",
  };
  contexts_["agent"] = ContextDefinition{
      .name = "agent",
      .prompt =
          "You are running as an autonomous agent. Prefer symbolic tools over "
          "reading whole files.",
  };
  contexts_["ide-assistant"] = ContextDefinition{
      .name = "ide-assistant",
      .prompt =
          "You run inside an IDE that already provides file access. Use "
          "codenav for symbol-level navigation and edits.",
      .policy = ToolPolicy{.excluded = kIdeFileTools},
  };

  modes_["interactive"] = ModeDefinition{
      .name = "interactive",
      .prompt = "Work step by step and ask the user when in doubt.",
  };
  modes_["editing"] = ModeDefinition{
      .name = "editing",
      .prompt = "Prefer symbol-level edits over rewriting whole files.",
  };
  modes_["planning"] = ModeDefinition{
      .name = "planning",
      .prompt = "Analyze and plan only. Do not modify files.",
      .policy = ToolPolicy{.excluded = kEditingTools},
  };
  modes_["one-shot"] = ModeDefinition{
      .name = "one-shot",
      .prompt = "Complete the task in one go without asking follow-up "
                "questions.",
  };

  languages_ = {
      LanguageDefinition{
          .name = "python",
          .extensions = {".py", ".pyi"},
          .command = "pyright-langserver",
          .args = {"--stdio"},
      },
      LanguageDefinition{
          .name = "typescript",
          .extensions = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"},
          .command = "typescript-language-server",
          .args = {"--stdio"},
      },
      LanguageDefinition{
          .name = "go",
          .extensions = {".go"},
          .command = "gopls",
      },
      LanguageDefinition{
          .name = "rust",
          .extensions = {".rs"},
          .command = "rust-analyzer",
      },
      LanguageDefinition{
          .name = "cpp",
          .extensions = {".c", ".h", ".cc", ".cpp", ".cxx", ".hpp", ".hh"},
          .command = "clangd",
      },
  };
}

auto ServerConfig::LoadFromFile(
    const std::filesystem::path& config_path,
    std::shared_ptr<spdlog::logger> logger) -> Result<ServerConfig> {
  auto config = CreateDefault(std::move(logger));

  std::ifstream file(config_path);
  if (!file) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("cannot read {}", config_path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  if (auto parsed = config.Parse(config_path.string(), buffer.str());
      !parsed) {
    return std::unexpected(parsed.error());
  }
  config.logger_->debug("Loaded configuration from {}", config_path.string());
  return config;
}

auto ServerConfig::LoadFromString(
    std::string_view yaml, std::shared_ptr<spdlog::logger> logger)
    -> Result<ServerConfig> {
  auto config = CreateDefault(std::move(logger));
  if (auto parsed = config.Parse("<string>", std::string(yaml)); !parsed) {
    return std::unexpected(parsed.error());
  }
  return config;
}

auto ServerConfig::FindUserConfig() -> std::optional<std::filesystem::path> {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::nullopt;
  }
  auto path = std::filesystem::path(home) / ".codenav" / "codenav.yml";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  return path;
}

auto ServerConfig::Parse(std::string_view source_name, const std::string& text)
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

    if (yaml["ToolTimeout"]) {
      tool_timeout_ = std::chrono::seconds(yaml["ToolTimeout"].as<int>());
    }
    if (yaml["StartupTimeout"]) {
      startup_timeout_ =
          std::chrono::seconds(yaml["StartupTimeout"].as<int>());
    }
    if (yaml["ShutdownGrace"]) {
      shutdown_grace_ = std::chrono::seconds(yaml["ShutdownGrace"].as<int>());
    }
    if (yaml["RecordToolUsage"]) {
      record_tool_usage_ = yaml["RecordToolUsage"].as<bool>();
    }
    if (yaml["DefaultContext"]) {
      default_context_ = yaml["DefaultContext"].as<std::string>();
    }
    if (yaml["DefaultModes"]) {
      default_modes_ = ReadStringList(yaml["DefaultModes"]);
    }
    global_policy_ = ReadPolicy(yaml);

    for (const auto& node : yaml["Contexts"]) {
      auto name = node["Name"].as<std::string>();
      contexts_[name] = ContextDefinition{
          .name = name,
          .prompt = node["Prompt"].as<std::string>(""),
          .policy = ReadPolicy(node),
      };
      logger_->debug("Loaded context '{}'", name);
    }

    for (const auto& node : yaml["Modes"]) {
      auto name = node["Name"].as<std::string>();
      modes_[name] = ModeDefinition{
          .name = name,
          .prompt = node["Prompt"].as<std::string>(""),
          .policy = ReadPolicy(node),
      };
      logger_->debug("Loaded mode '{}'", name);
    }

    for (const auto& node : yaml["Languages"]) {
      LanguageDefinition language{
          .name = node["Name"].as<std::string>(),
          .extensions = ReadStringList(node["Extensions"]),
          .command = node["Command"].as<std::string>(),
          .args = ReadStringList(node["Args"]),
          .working_directory = node["WorkingDirectory"].as<std::string>(""),
          .max_concurrent_requests =
              node["MaxConcurrentRequests"].as<std::size_t>(1),
      };
      if (language.max_concurrent_requests == 0) {
        return CodenavError::Unexpected(
            ErrorKind::kConfigResolutionError,
            fmt::format(
                "{}: MaxConcurrentRequests of '{}' must be at least 1",
                source_name, language.name));
      }
      if (node["InitializationOptions"]) {
        language.initialization_options =
            YamlToJson(node["InitializationOptions"]);
      }
      logger_->debug(
          "Loaded language '{}' ({})", language.name, language.command);
      SetLanguage(std::move(language));
    }
  } catch (const YAML::Exception& e) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("{}: {}", source_name, e.what()));
  }
  return Ok();
}

auto ServerConfig::FindContext(std::string_view name) const
    -> const ContextDefinition* {
  auto it = contexts_.find(std::string(name));
  return it == contexts_.end() ? nullptr : &it->second;
}

auto ServerConfig::FindMode(std::string_view name) const
    -> const ModeDefinition* {
  auto it = modes_.find(std::string(name));
  return it == modes_.end() ? nullptr : &it->second;
}

auto ServerConfig::SetLanguage(LanguageDefinition language) -> void {
  for (auto& existing : languages_) {
    if (existing.name == language.name) {
      existing = std::move(language);
      return;
    }
  }
  languages_.push_back(std::move(language));
}

}  // namespace codenav::core
