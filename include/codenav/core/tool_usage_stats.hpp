#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace codenav::core {

struct ToolUsage {
  std::size_t calls = 0;
  std::size_t failures = 0;
  std::chrono::milliseconds total_duration{0};
};

// Per-tool call statistics of one session
class ToolUsageStats {
 public:
  auto Record(
      std::string_view tool, std::chrono::milliseconds duration, bool success)
      -> void;

  [[nodiscard]] auto Snapshot() const -> std::map<std::string, ToolUsage>;

  [[nodiscard]] auto ToJson() const -> nlohmann::json;

  auto LogSummary(const std::shared_ptr<spdlog::logger>& logger) const -> void;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, ToolUsage, std::less<>> usage_;
};

}  // namespace codenav::core
