#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "codenav/error/error.hpp"
#include "codenav/server/tool_dispatcher.hpp"
#include "mcp/protocol.hpp"

namespace codenav::server {

using RpcError = jsonrpc::error::RpcError;

// MCP front end: binds the protocol methods of a JSON-RPC endpoint to the
// tool dispatcher
class McpServer {
 public:
  McpServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<ToolDispatcher> dispatcher,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  McpServer(const McpServer&) = delete;
  McpServer(McpServer&&) = delete;
  auto operator=(const McpServer&) -> McpServer& = delete;
  auto operator=(McpServer&&) -> McpServer& = delete;
  ~McpServer() = default;

  // Serves until the client disconnects or Shutdown is called, then tears
  // down the session
  auto Start() -> asio::awaitable<Result<void>>;

  auto Shutdown() -> asio::awaitable<Result<void>>;

 private:
  void RegisterHandlers();

  auto OnInitialize(mcp::InitializeParams params)
      -> asio::awaitable<std::expected<mcp::InitializeResult, RpcError>>;
  auto OnInitialized(mcp::EmptyParams params)
      -> asio::awaitable<std::expected<void, RpcError>>;
  auto OnPing(mcp::EmptyParams params)
      -> asio::awaitable<std::expected<mcp::EmptyParams, RpcError>>;
  auto OnListTools(mcp::ListToolsParams params)
      -> asio::awaitable<std::expected<mcp::ListToolsResult, RpcError>>;
  auto OnCallTool(mcp::CallToolParams params)
      -> asio::awaitable<std::expected<mcp::CallToolResult, RpcError>>;

  auto NotifyToolListChanged() -> asio::awaitable<void>;

  asio::any_io_executor executor_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  std::shared_ptr<ToolDispatcher> dispatcher_;
  std::shared_ptr<spdlog::logger> logger_;

  std::optional<mcp::Implementation> client_info_;
  std::atomic<bool> client_initialized_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace codenav::server
