#pragma once

#include <memory>
#include <vector>

#include "codenav/tools/tool.hpp"

namespace codenav::tools {

// Session tools: project activation, configuration, modes and server restarts
auto MakeConfigTools() -> std::vector<std::shared_ptr<const Tool>>;

}  // namespace codenav::tools
