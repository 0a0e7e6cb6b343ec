#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/core/orchestrator.hpp"
#include "codenav/error/error.hpp"

namespace codenav::tools {

// Session operations tools can reach beyond the orchestrator. Implemented by
// the tool dispatcher, which owns tool resolution.
class SessionControl {
 public:
  SessionControl() = default;
  SessionControl(const SessionControl&) = delete;
  SessionControl(SessionControl&&) = delete;
  auto operator=(const SessionControl&) -> SessionControl& = delete;
  auto operator=(SessionControl&&) -> SessionControl& = delete;
  virtual ~SessionControl() = default;

  // Validates the modes against the configuration and the tool registry,
  // then makes them active and republishes the tool table
  virtual auto SwitchModes(std::vector<std::string> modes)
      -> asio::awaitable<Result<void>> = 0;

  [[nodiscard]] virtual auto ExposedToolNames() const
      -> std::vector<std::string> = 0;

  [[nodiscard]] virtual auto UsageStats() const -> nlohmann::json = 0;
};

// Everything a tool call may touch
struct ToolContext {
  std::shared_ptr<core::Orchestrator> orchestrator;
  SessionControl* session = nullptr;
  std::shared_ptr<spdlog::logger> logger;
};

// Static description of a tool
struct ToolInfo {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  bool requires_active_project = false;
  bool mutates_state = false;
};

// A callable tool. Implementations are stateless; one instance serves every
// call of a session.
class Tool {
 public:
  explicit Tool(ToolInfo info) : info_(std::move(info)) {
  }

  Tool(const Tool&) = delete;
  Tool(Tool&&) = delete;
  auto operator=(const Tool&) -> Tool& = delete;
  auto operator=(Tool&&) -> Tool& = delete;
  virtual ~Tool() = default;

  [[nodiscard]] auto Name() const -> const std::string& {
    return info_.name;
  }
  [[nodiscard]] auto Description() const -> const std::string& {
    return info_.description;
  }
  [[nodiscard]] auto InputSchema() const -> const nlohmann::json& {
    return info_.input_schema;
  }
  [[nodiscard]] auto RequiresActiveProject() const -> bool {
    return info_.requires_active_project;
  }
  [[nodiscard]] auto MutatesState() const -> bool {
    return info_.mutates_state;
  }

  // Returns a JSON result; strings are passed to the client as plain text
  virtual auto Apply(const ToolContext& context, const nlohmann::json& args)
      const -> asio::awaitable<Result<nlohmann::json>> = 0;

 private:
  ToolInfo info_;
};

}  // namespace codenav::tools
