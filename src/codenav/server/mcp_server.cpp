#include "codenav/server/mcp_server.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#ifndef CODENAV_VERSION
#define CODENAV_VERSION "0.0.0"
#endif

namespace codenav::server {

namespace {

constexpr auto kServerName = "codenav";

}  // namespace

McpServer::McpServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<ToolDispatcher> dispatcher,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      endpoint_(std::move(endpoint)),
      dispatcher_(std::move(dispatcher)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto McpServer::Start() -> asio::awaitable<Result<void>> {
  RegisterHandlers();
  dispatcher_->SetListChangedCallback(
      [this]() -> asio::awaitable<void> { co_await NotifyToolListChanged(); });

  auto started = co_await endpoint_->Start();
  if (!started) {
    logger_->error("MCP endpoint error: {}", started.error().Message());
    co_await dispatcher_->Shutdown();
    co_return CodenavError::Unexpected(
        ErrorKind::kProtocolError, started.error().Message());
  }
  logger_->debug("MCP endpoint started");

  auto finished = co_await endpoint_->WaitForShutdown();
  dispatcher_->SetListChangedCallback(nullptr);
  co_await dispatcher_->Shutdown();
  if (!finished) {
    logger_->error(
        "MCP endpoint wait for shutdown error: {}", finished.error().Message());
    co_return CodenavError::Unexpected(
        ErrorKind::kProtocolError, finished.error().Message());
  }
  logger_->debug("MCP endpoint closed");
  co_return Ok();
}

auto McpServer::Shutdown() -> asio::awaitable<Result<void>> {
  if (stopped_.exchange(true)) {
    co_return Ok();
  }
  logger_->info("MCP server shutting down");
  auto result = co_await endpoint_->Shutdown();
  if (!result) {
    logger_->error("MCP endpoint shutdown error: {}", result.error().Message());
    co_return CodenavError::Unexpected(
        ErrorKind::kProtocolError, result.error().Message());
  }
  co_return Ok();
}

void McpServer::RegisterHandlers() {
  endpoint_->RegisterMethodCall<
      mcp::InitializeParams, mcp::InitializeResult, RpcError>(
      "initialize", [this](const mcp::InitializeParams& params) {
        return OnInitialize(params);
      });

  endpoint_->RegisterNotification<mcp::EmptyParams, RpcError>(
      "notifications/initialized",
      [this](const mcp::EmptyParams& params) { return OnInitialized(params); });

  endpoint_->RegisterMethodCall<mcp::EmptyParams, mcp::EmptyParams, RpcError>(
      "ping", [this](const mcp::EmptyParams& params) { return OnPing(params); });

  endpoint_->RegisterMethodCall<
      mcp::ListToolsParams, mcp::ListToolsResult, RpcError>(
      "tools/list", [this](const mcp::ListToolsParams& params) {
        return OnListTools(params);
      });

  endpoint_->RegisterMethodCall<
      mcp::CallToolParams, mcp::CallToolResult, RpcError>(
      "tools/call", [this](const mcp::CallToolParams& params) {
        return OnCallTool(params);
      });
}

auto McpServer::OnInitialize(mcp::InitializeParams params)
    -> asio::awaitable<std::expected<mcp::InitializeResult, RpcError>> {
  client_info_ = params.clientInfo;
  if (client_info_) {
    logger_->info(
        "Client {} {} connected (protocol {})", client_info_->name,
        client_info_->version, params.protocolVersion);
  } else {
    logger_->info("Client connected (protocol {})", params.protocolVersion);
  }
  if (params.protocolVersion != mcp::kProtocolVersion) {
    logger_->debug(
        "Client requested protocol {}, answering with {}",
        params.protocolVersion, mcp::kProtocolVersion);
  }

  mcp::InitializeResult result{
      .serverInfo = {.name = kServerName, .version = CODENAV_VERSION},
  };
  if (auto instructions = dispatcher_->Instructions(); !instructions.empty()) {
    result.instructions = std::move(instructions);
  }
  co_return result;
}

auto McpServer::OnInitialized(mcp::EmptyParams /*params*/)
    -> asio::awaitable<std::expected<void, RpcError>> {
  client_initialized_ = true;
  logger_->debug("Client initialized");
  co_return std::expected<void, RpcError>{};
}

auto McpServer::OnPing(mcp::EmptyParams /*params*/)
    -> asio::awaitable<std::expected<mcp::EmptyParams, RpcError>> {
  co_return mcp::EmptyParams{};
}

auto McpServer::OnListTools(mcp::ListToolsParams /*params*/)
    -> asio::awaitable<std::expected<mcp::ListToolsResult, RpcError>> {
  co_return dispatcher_->ListTools();
}

auto McpServer::OnCallTool(mcp::CallToolParams params)
    -> asio::awaitable<std::expected<mcp::CallToolResult, RpcError>> {
  logger_->debug("tools/call {}", params.name);
  co_return co_await dispatcher_->CallTool(std::move(params));
}

auto McpServer::NotifyToolListChanged() -> asio::awaitable<void> {
  if (!client_initialized_ || stopped_) {
    co_return;
  }
  logger_->debug("Sending tools/list_changed");
  co_await endpoint_->SendNotification(
      "notifications/tools/list_changed", nlohmann::json::object());
}

}  // namespace codenav::server
