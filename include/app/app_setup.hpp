#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Options given on the command line. Values not given keep the
/// configuration file's settings.
struct CommandLineOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> project;
  std::optional<std::string> context;
  std::vector<std::string> modes;
  /// Serve a named pipe instead of stdio
  std::optional<std::string> pipe_name;
};

/// Parse `--name=value` style arguments (args[0] is the executable)
/// Returns a description of the first offending argument on error
auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, std::string>;

auto Usage(std::string_view executable) -> std::string;

/// Setup structured logging with named loggers on stderr
/// Returns configured loggers for transport, lsp, mcp, and codenav
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
