#include "codenav/server/capability_resolver.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "codenav/utils/glob.hpp"

namespace codenav::server {

namespace {

using utils::GlobPattern;

auto ValidatePolicy(
    const tools::ToolRegistry& registry, const core::ToolPolicy& policy,
    std::string_view level) -> Result<void> {
  for (const auto* list : {&policy.included, &policy.excluded}) {
    for (const auto& pattern : *list) {
      if (GlobPattern(pattern).IsLiteral() && !registry.Contains(pattern)) {
        return CodenavError::Unexpected(
            ErrorKind::kConfigResolutionError,
            fmt::format("{} names unknown tool '{}'", level, pattern));
      }
    }
  }
  for (const auto& name : policy.included) {
    if (GlobPattern(name).IsLiteral() &&
        std::ranges::find(policy.excluded, name) != policy.excluded.end()) {
      return CodenavError::Unexpected(
          ErrorKind::kConfigResolutionError,
          fmt::format("{} both includes and excludes '{}'", level, name));
    }
  }
  return Ok();
}

}  // namespace

auto CapabilityResolver::Admits(
    const core::ToolPolicy& policy, std::string_view name) -> bool {
  const auto included = utils::CompileGlobs(policy.included, GlobPattern::Syntax::kName);
  const auto excluded = utils::CompileGlobs(policy.excluded, GlobPattern::Syntax::kName);
  const bool admitted = included.empty() || utils::MatchesAny(included, name);
  return admitted && !utils::MatchesAny(excluded, name);
}

auto CapabilityResolver::Resolve(
    const tools::ToolRegistry& registry, const core::ToolPolicy& global,
    const core::ContextDefinition& context,
    const std::vector<core::ModeDefinition>& modes, bool read_only)
    -> std::set<std::string> {
  std::set<std::string> exposed;
  for (const auto& name : registry.Names()) {
    if (!Admits(global, name) || !Admits(context.policy, name)) {
      continue;
    }
    const bool modes_admit =
        std::ranges::all_of(modes, [&name](const core::ModeDefinition& mode) {
          return Admits(mode.policy, name);
        });
    if (!modes_admit) {
      continue;
    }
    if (read_only && registry.Find(name)->MutatesState()) {
      continue;
    }
    exposed.insert(name);
  }
  return exposed;
}

auto CapabilityResolver::Resolve(
    const tools::ToolRegistry& registry, const core::ServerConfig& config,
    std::string_view context, const std::vector<std::string>& modes,
    bool read_only) -> Result<std::set<std::string>> {
  const auto* context_definition = config.FindContext(context);
  if (context_definition == nullptr) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("unknown context '{}'", context));
  }
  std::vector<core::ModeDefinition> mode_definitions;
  for (const auto& name : modes) {
    const auto* mode = config.FindMode(name);
    if (mode == nullptr) {
      return CodenavError::Unexpected(
          ErrorKind::kConfigResolutionError,
          fmt::format("unknown mode '{}'", name));
    }
    mode_definitions.push_back(*mode);
  }
  return Resolve(
      registry, config.GetGlobalPolicy(), *context_definition,
      mode_definitions, read_only);
}

auto CapabilityResolver::Validate(
    const tools::ToolRegistry& registry, const core::ServerConfig& config,
    std::string_view context, const std::vector<std::string>& modes)
    -> Result<void> {
  if (auto global = ValidatePolicy(
          registry, config.GetGlobalPolicy(), "global tool policy");
      !global) {
    return global;
  }

  const auto* context_definition = config.FindContext(context);
  if (context_definition == nullptr) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("unknown context '{}'", context));
  }
  if (auto checked = ValidatePolicy(
          registry, context_definition->policy,
          fmt::format("context '{}'", context));
      !checked) {
    return checked;
  }

  for (const auto& name : modes) {
    const auto* mode = config.FindMode(name);
    if (mode == nullptr) {
      return CodenavError::Unexpected(
          ErrorKind::kConfigResolutionError,
          fmt::format("unknown mode '{}'", name));
    }
    if (auto checked = ValidatePolicy(
            registry, mode->policy, fmt::format("mode '{}'", name));
        !checked) {
      return checked;
    }
  }
  return Ok();
}

}  // namespace codenav::server
