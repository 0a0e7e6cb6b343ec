#pragma once

#include <memory>
#include <vector>

#include "codenav/tools/tool.hpp"

namespace codenav::tools {

// Symbol-level navigation and editing tools
auto MakeSymbolTools() -> std::vector<std::shared_ptr<const Tool>>;

}  // namespace codenav::tools
