#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codenav/core/server_config.hpp"
#include "codenav/error/error.hpp"
#include "codenav/tools/tool_registry.hpp"

namespace codenav::server {

// Computes which tools are exposed from the composable policies. Pure: equal
// inputs always give equal output.
class CapabilityResolver {
 public:
  // Every registered tool admitted by the global policy, the context and
  // every mode; mutating tools are dropped when `read_only`
  static auto Resolve(
      const tools::ToolRegistry& registry, const core::ToolPolicy& global,
      const core::ContextDefinition& context,
      const std::vector<core::ModeDefinition>& modes, bool read_only)
      -> std::set<std::string>;

  // Resolves by context and mode names. Call Validate first; unknown names
  // fail with kConfigResolutionError here too.
  static auto Resolve(
      const tools::ToolRegistry& registry, const core::ServerConfig& config,
      std::string_view context, const std::vector<std::string>& modes,
      bool read_only) -> Result<std::set<std::string>>;

  // Rejects unknown context or mode names, literal tool names that are not
  // registered, and literal names both included and excluded by one policy
  static auto Validate(
      const tools::ToolRegistry& registry, const core::ServerConfig& config,
      std::string_view context, const std::vector<std::string>& modes)
      -> Result<void>;

  static auto Admits(const core::ToolPolicy& policy, std::string_view name)
      -> bool;
};

}  // namespace codenav::server
