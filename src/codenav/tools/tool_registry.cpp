#include "codenav/tools/tool_registry.hpp"

#include <fmt/format.h>

#include "codenav/tools/config_tools.hpp"
#include "codenav/tools/file_tools.hpp"
#include "codenav/tools/symbol_tools.hpp"

namespace codenav::tools {

auto ToolRegistry::CreateDefault() -> Result<ToolRegistry> {
  ToolRegistry registry;
  for (auto group : {MakeConfigTools(), MakeSymbolTools(), MakeFileTools()}) {
    for (auto& tool : group) {
      if (auto registered = registry.Register(std::move(tool)); !registered) {
        return std::unexpected(registered.error());
      }
    }
  }
  return registry;
}

auto ToolRegistry::Register(std::shared_ptr<const Tool> tool) -> Result<void> {
  auto [it, inserted] = tools_.try_emplace(tool->Name(), tool);
  if (!inserted) {
    return CodenavError::Unexpected(
        ErrorKind::kConfigResolutionError,
        fmt::format("tool '{}' registered twice", tool->Name()));
  }
  return Ok();
}

auto ToolRegistry::Find(std::string_view name) const
    -> std::shared_ptr<const Tool> {
  auto it = tools_.find(name);
  return it == tools_.end() ? nullptr : it->second;
}

auto ToolRegistry::Names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(tools_.size());
  for (const auto& [name, _] : tools_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace codenav::tools
