#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "codenav/error/error.hpp"
#include "codenav/tools/tool.hpp"

namespace codenav::tools {

// The fixed universe of tools of a session
class ToolRegistry {
 public:
  // Every built-in tool
  static auto CreateDefault() -> Result<ToolRegistry>;

  // Fails with kConfigResolutionError on a duplicate name
  auto Register(std::shared_ptr<const Tool> tool) -> Result<void>;

  [[nodiscard]] auto Find(std::string_view name) const
      -> std::shared_ptr<const Tool>;

  [[nodiscard]] auto Contains(std::string_view name) const -> bool {
    return Find(name) != nullptr;
  }

  // Sorted
  [[nodiscard]] auto Names() const -> std::vector<std::string>;

  [[nodiscard]] auto Size() const -> std::size_t {
    return tools_.size();
  }

 private:
  std::map<std::string, std::shared_ptr<const Tool>, std::less<>> tools_;
};

}  // namespace codenav::tools
