#include "codenav/core/tool_usage_stats.hpp"

#include "codenav/utils/scoped_timer.hpp"

namespace codenav::core {

auto ToolUsageStats::Record(
    std::string_view tool, std::chrono::milliseconds duration, bool success)
    -> void {
  std::lock_guard lock(mutex_);
  auto it = usage_.find(tool);
  if (it == usage_.end()) {
    it = usage_.emplace(std::string(tool), ToolUsage{}).first;
  }
  ++it->second.calls;
  if (!success) {
    ++it->second.failures;
  }
  it->second.total_duration += duration;
}

auto ToolUsageStats::Snapshot() const -> std::map<std::string, ToolUsage> {
  std::lock_guard lock(mutex_);
  return {usage_.begin(), usage_.end()};
}

auto ToolUsageStats::ToJson() const -> nlohmann::json {
  auto j = nlohmann::json::object();
  for (const auto& [tool, usage] : Snapshot()) {
    j[tool] = {
        {"calls", usage.calls},
        {"failures", usage.failures},
        {"total_duration_ms", usage.total_duration.count()},
    };
  }
  return j;
}

auto ToolUsageStats::LogSummary(
    const std::shared_ptr<spdlog::logger>& logger) const -> void {
  auto snapshot = Snapshot();
  if (snapshot.empty()) {
    return;
  }
  logger->info("Tool usage:");
  for (const auto& [tool, usage] : snapshot) {
    logger->info(
        "  {}: {} calls, {} failed, {}", tool, usage.calls, usage.failures,
        utils::ScopedTimer::FormatDuration(usage.total_duration));
  }
}

}  // namespace codenav::core
