#include <csignal>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <jsonrpc/transport/stdio_transport.hpp>
#include <jsonrpc/transport/transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "codenav/core/orchestrator.hpp"
#include "codenav/core/server_config.hpp"
#include "codenav/server/mcp_server.hpp"
#include "codenav/server/tool_dispatcher.hpp"
#include "codenav/tools/tool_registry.hpp"

using codenav::core::Orchestrator;
using codenav::core::ServerConfig;
using codenav::server::McpServer;
using codenav::server::ToolDispatcher;
using codenav::tools::ToolRegistry;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;
using jsonrpc::transport::StdioTransport;
using jsonrpc::transport::Transport;

namespace {

auto LoadConfig(
    const app::CommandLineOptions& options,
    const std::shared_ptr<spdlog::logger>& logger)
    -> codenav::Result<ServerConfig> {
  if (options.config_path) {
    return ServerConfig::LoadFromFile(*options.config_path, logger);
  }
  if (auto user_config = ServerConfig::FindUserConfig()) {
    return ServerConfig::LoadFromFile(*user_config, logger);
  }
  return ServerConfig::CreateDefault(logger);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();

  auto loggers = app::SetupLoggers();
  auto logger = loggers["codenav"];

  const std::vector<std::string> args(argv, argv + argc);
  auto options = app::ParseCommandLine(args);
  if (!options) {
    logger->error("{}", options.error());
    logger->error("{}", app::Usage(args.empty() ? "codenav" : args[0]));
    return 1;
  }

  auto config = LoadConfig(*options, logger);
  if (!config) {
    logger->error("Failed to load configuration: {}", config.error());
    return 1;
  }
  if (options->context) {
    config->SetDefaultContext(*options->context);
  }
  if (!options->modes.empty()) {
    config->SetDefaultModes(options->modes);
  }

  auto registry = ToolRegistry::CreateDefault();
  if (!registry) {
    logger->error("Failed to build tool registry: {}", registry.error());
    return 1;
  }

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto orchestrator =
      std::make_shared<Orchestrator>(executor, std::move(*config), logger);
  auto dispatcher = std::make_shared<ToolDispatcher>(
      executor, std::move(*registry), orchestrator, logger);
  if (auto initialized = dispatcher->Initialize(); !initialized) {
    logger->error("Invalid tool configuration: {}", initialized.error());
    return 1;
  }

  std::unique_ptr<Transport> transport;
  if (options->pipe_name) {
    transport = std::make_unique<FramedPipeTransport>(
        executor, *options->pipe_name, false, loggers["transport"]);
  } else {
    transport = std::make_unique<StdioTransport>(executor, loggers["transport"]);
  }
  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["mcp"]);
  auto server = std::make_unique<McpServer>(
      executor, std::move(endpoint), dispatcher, loggers["mcp"]);

  int exit_code = 0;
  asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    logger->info("Received signal {}, shutting down", signal_number);
    asio::co_spawn(
        io_context,
        [&]() -> asio::awaitable<void> {
          if (auto stopped = co_await server->Shutdown(); !stopped) {
            logger->error("Shutdown error: {}", stopped.error());
          }
        },
        asio::detached);
  });

  asio::co_spawn(
      io_context,
      [&]() -> asio::awaitable<void> {
        if (options->project) {
          auto activated =
              co_await orchestrator->ActivateProject(*options->project);
          if (!activated) {
            logger->error(
                "Failed to activate {}: {}", *options->project,
                activated.error());
            exit_code = 1;
            co_await orchestrator->Shutdown();
            signals.cancel();
            co_return;
          }
          co_await dispatcher->Republish();
        }
        auto result = co_await server->Start();
        if (!result) {
          logger->error("Server error: {}", result.error());
          exit_code = 1;
        }
        signals.cancel();
      },
      asio::detached);

  io_context.run();
  logger->info("codenav exited");
  return exit_code;
}
