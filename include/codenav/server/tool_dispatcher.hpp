#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/core/orchestrator.hpp"
#include "codenav/core/tool_usage_stats.hpp"
#include "codenav/error/error.hpp"
#include "codenav/tools/tool.hpp"
#include "codenav/tools/tool_registry.hpp"
#include "mcp/protocol.hpp"

namespace codenav::server {

// Tools exposed at one point in time. Published whole; never mutated.
struct ToolTable {
  std::map<std::string, std::shared_ptr<const tools::Tool>, std::less<>> tools;

  [[nodiscard]] auto Names() const -> std::vector<std::string>;
  [[nodiscard]] auto NameSet() const -> std::set<std::string>;
};

// Routes tool calls to the exposed tools and keeps the exposed table in step
// with the orchestrator's context, modes and project.
class ToolDispatcher : public tools::SessionControl,
                       public std::enable_shared_from_this<ToolDispatcher> {
 public:
  using TablePtr = std::shared_ptr<const ToolTable>;
  using StatisticsSink = std::function<void(
      std::string_view tool, std::chrono::milliseconds duration, bool success)>;
  // Sends notifications/tools/list_changed to the client
  using ListChangedCallback = std::function<asio::awaitable<void>()>;

  ToolDispatcher(
      asio::any_io_executor executor, tools::ToolRegistry registry,
      std::shared_ptr<core::Orchestrator> orchestrator,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  ToolDispatcher(const ToolDispatcher&) = delete;
  ToolDispatcher(ToolDispatcher&&) = delete;
  auto operator=(const ToolDispatcher&) -> ToolDispatcher& = delete;
  auto operator=(ToolDispatcher&&) -> ToolDispatcher& = delete;
  ~ToolDispatcher() override = default;

  // Validates the active context and modes, publishes the first table and
  // subscribes to orchestrator changes
  auto Initialize() -> Result<void>;

  [[nodiscard]] auto Table() const -> TablePtr {
    return table_.load();
  }

  [[nodiscard]] auto ListTools() const -> mcp::ListToolsResult;

  // Never fails: every error becomes an isError result
  auto CallTool(mcp::CallToolParams params)
      -> asio::awaitable<mcp::CallToolResult>;

  // Recomputes the exposed tools; emits list_changed when they differ.
  // Returns true if the table changed.
  auto Republish() -> asio::awaitable<bool>;

  // Context prompt followed by the prompts of the active modes
  [[nodiscard]] auto Instructions() const -> std::string;

  auto SetListChangedCallback(ListChangedCallback callback) -> void {
    list_changed_ = std::move(callback);
  }
  auto SetStatisticsSink(StatisticsSink sink) -> void {
    statistics_sink_ = std::move(sink);
  }

  [[nodiscard]] auto GetOrchestrator() const
      -> const std::shared_ptr<core::Orchestrator>& {
    return orchestrator_;
  }

  // Rejects later calls with kSessionShuttingDown and tears the session down
  auto Shutdown() -> asio::awaitable<void>;

  auto SwitchModes(std::vector<std::string> modes)
      -> asio::awaitable<Result<void>> override;
  [[nodiscard]] auto ExposedToolNames() const
      -> std::vector<std::string> override;
  [[nodiscard]] auto UsageStats() const -> nlohmann::json override;

 private:
  auto ComputeTable() const -> Result<TablePtr>;
  auto Invoke(const tools::Tool& tool, const nlohmann::json& arguments)
      -> asio::awaitable<Result<nlohmann::json>>;

  static auto ErrorResult(const CodenavError& error) -> mcp::CallToolResult;
  static auto SuccessResult(const nlohmann::json& value) -> mcp::CallToolResult;

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  tools::ToolRegistry registry_;
  std::shared_ptr<core::Orchestrator> orchestrator_;
  std::shared_ptr<spdlog::logger> logger_;

  std::atomic<TablePtr> table_;
  std::shared_ptr<core::ToolUsageStats> stats_;
  StatisticsSink statistics_sink_;
  ListChangedCallback list_changed_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace codenav::server
