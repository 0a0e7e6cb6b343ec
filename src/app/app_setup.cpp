#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "info";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

struct LoggerConfig {
  std::string_view name;
  // Framing chatter stays quiet unless explicitly raised
  bool follows_user_level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::info);
}

// Splits "--name=value"; a bare "--name" yields an empty value
auto SplitOption(std::string_view arg)
    -> std::optional<std::pair<std::string_view, std::string_view>> {
  if (!arg.starts_with("--")) {
    return std::nullopt;
  }
  arg.remove_prefix(2);
  const auto eq = arg.find('=');
  if (eq == std::string_view::npos) {
    return std::pair{arg, std::string_view{}};
  }
  return std::pair{arg.substr(0, eq), arg.substr(eq + 1)};
}

}  // namespace

auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, std::string> {
  CommandLineOptions options;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    auto option = SplitOption(arg);
    if (!option || option->second.empty()) {
      return std::unexpected(fmt::format("unrecognized argument '{}'", arg));
    }
    const auto [name, value] = *option;
    if (name == "config") {
      options.config_path = std::string(value);
    } else if (name == "project") {
      options.project = std::string(value);
    } else if (name == "context") {
      options.context = std::string(value);
    } else if (name == "mode") {
      options.modes.emplace_back(value);
    } else if (name == "pipe") {
      options.pipe_name = std::string(value);
    } else {
      return std::unexpected(fmt::format("unrecognized argument '{}'", arg));
    }
  }
  return options;
}

auto Usage(std::string_view executable) -> std::string {
  return fmt::format(
      "Usage: {} [--config=<file>] [--project=<path>] [--context=<name>] "
      "[--mode=<name>]... [--pipe=<name>]",
      executable);
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .follows_user_level = false},
      LoggerConfig{.name = "lsp", .follows_user_level = true},
      LoggerConfig{.name = "mcp", .follows_user_level = false},
      LoggerConfig{.name = "codenav", .follows_user_level = true},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    // stdout carries the MCP stream
    auto logger = spdlog::stderr_color_mt(std::string(config.name));
    const auto level = config.follows_user_level
                           ? user_log_level
                           : std::max(user_log_level, spdlog::level::info);
    ConfigureLogger(logger, level);
    loggers[std::string(config.name)] = std::move(logger);
  }
  spdlog::set_default_logger(loggers["codenav"]);

  return loggers;
}

}  // namespace app
