#pragma once

#include <memory>
#include <vector>

#include "codenav/tools/tool.hpp"

namespace codenav::tools {

// File tools: reading, writing, listing and searching project files
auto MakeFileTools() -> std::vector<std::shared_ptr<const Tool>>;

}  // namespace codenav::tools
