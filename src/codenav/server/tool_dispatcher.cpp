#include "codenav/server/tool_dispatcher.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "codenav/server/capability_resolver.hpp"
#include "codenav/utils/scoped_timer.hpp"

namespace codenav::server {

namespace {

// Invalid UTF-8 becomes U+FFFD so the response always serializes
auto ToValidUtf8(const nlohmann::json& value, int indent = -1) -> std::string {
  return value.dump(
      indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto SanitizeText(const std::string& text) -> std::string {
  return nlohmann::json::parse(ToValidUtf8(text)).get<std::string>();
}

}  // namespace

auto ToolTable::Names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(tools.size());
  for (const auto& [name, tool] : tools) {
    names.push_back(name);
  }
  return names;
}

auto ToolTable::NameSet() const -> std::set<std::string> {
  std::set<std::string> names;
  for (const auto& [name, tool] : tools) {
    names.insert(name);
  }
  return names;
}

ToolDispatcher::ToolDispatcher(
    asio::any_io_executor executor, tools::ToolRegistry registry,
    std::shared_ptr<core::Orchestrator> orchestrator,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      strand_(asio::make_strand(executor)),
      registry_(std::move(registry)),
      orchestrator_(std::move(orchestrator)),
      logger_(logger ? logger : spdlog::default_logger()),
      table_(std::make_shared<const ToolTable>()) {
  if (orchestrator_->Config().GetRecordToolUsage()) {
    stats_ = std::make_shared<core::ToolUsageStats>();
    statistics_sink_ = [stats = stats_](
                           std::string_view tool,
                           std::chrono::milliseconds duration, bool success) {
      stats->Record(tool, duration, success);
    };
  }
}

auto ToolDispatcher::Initialize() -> Result<void> {
  if (auto valid = CapabilityResolver::Validate(
          registry_, orchestrator_->Config(), orchestrator_->ActiveContext(),
          orchestrator_->ActiveModes());
      !valid) {
    return valid;
  }
  auto table = ComputeTable();
  if (!table) {
    return std::unexpected(table.error());
  }
  table_.store(*table);
  logger_->info(
      "Exposing {} of {} tools (context {}, modes {})", (*table)->tools.size(),
      registry_.Size(), orchestrator_->ActiveContext(),
      fmt::join(orchestrator_->ActiveModes(), ", "));

  std::weak_ptr<ToolDispatcher> weak = weak_from_this();
  orchestrator_->SetChangeListener([weak, executor = executor_]() {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    asio::co_spawn(
        executor,
        [self]() -> asio::awaitable<void> { co_await self->Republish(); },
        asio::detached);
  });
  return Ok();
}

auto ToolDispatcher::ComputeTable() const -> Result<TablePtr> {
  auto names = CapabilityResolver::Resolve(
      registry_, orchestrator_->Config(), orchestrator_->ActiveContext(),
      orchestrator_->ActiveModes(), orchestrator_->IsReadOnly());
  if (!names) {
    return std::unexpected(names.error());
  }
  auto table = std::make_shared<ToolTable>();
  for (const auto& name : *names) {
    table->tools.emplace(name, registry_.Find(name));
  }
  return table;
}

auto ToolDispatcher::Republish() -> asio::awaitable<bool> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto table = ComputeTable();
  if (!table) {
    logger_->error("Tool resolution failed: {}", table.error());
    co_return false;
  }
  auto previous = table_.load();
  if (previous->NameSet() == (*table)->NameSet()) {
    co_return false;
  }
  table_.store(*table);
  logger_->info(
      "Exposed tools changed: {}", fmt::join((*table)->Names(), ", "));

  if (list_changed_ && !shutting_down_) {
    co_await list_changed_();
  }
  co_return true;
}

auto ToolDispatcher::ListTools() const -> mcp::ListToolsResult {
  auto table = Table();
  mcp::ListToolsResult result;
  result.tools.reserve(table->tools.size());
  for (const auto& [name, tool] : table->tools) {
    result.tools.push_back(mcp::ToolDescription{
        .name = name,
        .description = tool->Description(),
        .inputSchema = tool->InputSchema(),
    });
  }
  return result;
}

auto ToolDispatcher::Invoke(
    const tools::Tool& tool, const nlohmann::json& arguments)
    -> asio::awaitable<Result<nlohmann::json>> {
  tools::ToolContext context{
      .orchestrator = orchestrator_,
      .session = this,
      .logger = logger_,
  };

  std::string failure;
  try {
    co_return co_await tool.Apply(context, arguments);
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  logger_->error("Tool {} threw: {}", tool.Name(), failure);
  co_return CodenavError::Unexpected(ErrorKind::kToolExecutionError, failure);
}

auto ToolDispatcher::CallTool(mcp::CallToolParams params)
    -> asio::awaitable<mcp::CallToolResult> {
  if (shutting_down_) {
    co_return ErrorResult(CodenavError::Make(ErrorKind::kSessionShuttingDown));
  }

  auto table = Table();
  auto it = table->tools.find(params.name);
  if (it == table->tools.end()) {
    logger_->debug("Rejected call to unexposed tool {}", params.name);
    co_return ErrorResult(
        CodenavError::Make(ErrorKind::kNoSuchTool, params.name));
  }
  auto tool = it->second;

  if (tool->RequiresActiveProject() && !orchestrator_->ActiveProject()) {
    co_return ErrorResult(CodenavError::Make(
        ErrorKind::kProjectNotActive,
        fmt::format("{} needs an active project", params.name)));
  }

  const auto& arguments = params.arguments.is_null()
                              ? nlohmann::json::object()
                              : params.arguments;

  utils::ScopedTimer timer(fmt::format("tool {}", params.name), logger_);
  auto result = co_await Invoke(*tool, arguments);
  const auto elapsed = timer.GetElapsed();

  std::optional<mcp::CallToolResult> rendered;
  if (result) {
    try {
      rendered = SuccessResult(*result);
    } catch (const nlohmann::json::exception& e) {
      result = CodenavError::Unexpected(
          ErrorKind::kToolExecutionError,
          fmt::format("cannot render result: {}", e.what()));
    }
  }

  if (statistics_sink_) {
    statistics_sink_(params.name, elapsed, result.has_value());
  }

  if (!result) {
    logger_->warn("Tool {} failed: {}", params.name, result.error());
    co_return ErrorResult(result.error());
  }
  co_return std::move(*rendered);
}

auto ToolDispatcher::ErrorResult(const CodenavError& error)
    -> mcp::CallToolResult {
  auto result = mcp::CallToolResult::Text(SanitizeText(
      fmt::format("Error ({}): {}", error.KindName(), error.Message())));
  result.isError = true;
  result.structuredContent = nlohmann::json::parse(
      ToValidUtf8(nlohmann::json{{"error", error.ToJson()}}));
  return result;
}

auto ToolDispatcher::SuccessResult(const nlohmann::json& value)
    -> mcp::CallToolResult {
  if (value.is_string()) {
    return mcp::CallToolResult::Text(SanitizeText(value.get<std::string>()));
  }
  return mcp::CallToolResult::Text(ToValidUtf8(value, 2));
}

auto ToolDispatcher::Instructions() const -> std::string {
  const auto& config = orchestrator_->Config();
  std::string instructions;
  auto append = [&instructions](const std::string& prompt) {
    if (prompt.empty()) {
      return;
    }
    if (!instructions.empty()) {
      instructions += "\n\n";
    }
    instructions += prompt;
  };
  if (const auto* context = config.FindContext(orchestrator_->ActiveContext())) {
    append(context->prompt);
  }
  for (const auto& name : orchestrator_->ActiveModes()) {
    if (const auto* mode = config.FindMode(name)) {
      append(mode->prompt);
    }
  }
  return instructions;
}

auto ToolDispatcher::SwitchModes(std::vector<std::string> modes)
    -> asio::awaitable<Result<void>> {
  if (auto valid = CapabilityResolver::Validate(
          registry_, orchestrator_->Config(), orchestrator_->ActiveContext(),
          modes);
      !valid) {
    co_return valid;
  }
  logger_->info("Switching modes to {}", fmt::join(modes, ", "));
  orchestrator_->SetActiveModes(std::move(modes));
  co_await Republish();
  co_return Ok();
}

auto ToolDispatcher::ExposedToolNames() const -> std::vector<std::string> {
  return Table()->Names();
}

auto ToolDispatcher::UsageStats() const -> nlohmann::json {
  if (!stats_) {
    return nullptr;
  }
  return stats_->ToJson();
}

auto ToolDispatcher::Shutdown() -> asio::awaitable<void> {
  if (shutting_down_.exchange(true)) {
    co_return;
  }
  logger_->info("Tool dispatcher shutting down");
  co_await orchestrator_->Shutdown();
  if (stats_) {
    stats_->LogSummary(logger_);
  }
}

}  // namespace codenav::server
