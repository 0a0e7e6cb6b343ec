#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/client/process_transport.hpp"
#include "codenav/utils/async_semaphore.hpp"
#include "lsp/error.hpp"
#include "lsp/message.hpp"

namespace codenav::client {

// JSON-RPC client side of one language server connection.
//
// Correlates requests with responses, bounds every request by a deadline,
// routes server notifications and server-to-client requests to registered
// handlers, and runs the single reader loop of the connection. All mutable
// state lives on one strand.
class RequestDispatcher
    : public std::enable_shared_from_this<RequestDispatcher> {
 public:
  using Result = std::expected<nlohmann::json, lsp::error::LspError>;
  using NotificationHandler = std::function<void(const nlohmann::json&)>;
  using RequestHandler =
      std::function<asio::awaitable<Result>(const nlohmann::json&)>;
  using ClosedHandler = std::function<void(const lsp::error::LspError&)>;

  // `max_in_flight` bounds concurrent outstanding requests; waiting for a
  // slot counts against the request's deadline.
  RequestDispatcher(
      asio::any_io_executor executor,
      std::unique_ptr<ProcessTransport> transport, std::size_t max_in_flight,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  RequestDispatcher(const RequestDispatcher&) = delete;
  RequestDispatcher(RequestDispatcher&&) = delete;
  auto operator=(const RequestDispatcher&) -> RequestDispatcher& = delete;
  auto operator=(RequestDispatcher&&) -> RequestDispatcher& = delete;
  ~RequestDispatcher() = default;

  // Spawns the reader loop
  auto Start() -> void;

  // Sends a request and waits for its response. Resolves exactly once with
  // the result, the server's error (kServerError and friends), kTimeoutError
  // once the deadline passes, or kServerCrashed when the connection closes.
  // A timed out request is forgotten; its late response is dropped.
  auto Call(
      std::string method, nlohmann::json params,
      std::chrono::milliseconds timeout) -> asio::awaitable<Result>;

  // Completes once the notification frame is written
  auto Notify(std::string method, nlohmann::json params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>>;

  // Handler registration, must happen before Start()
  auto OnNotification(std::string method, NotificationHandler handler) -> void;
  auto OnRequest(std::string method, RequestHandler handler) -> void;
  auto OnClosed(ClosedHandler handler) -> void;

  [[nodiscard]] auto PendingCount() const -> std::size_t {
    return pending_.size();
  }
  [[nodiscard]] auto IsClosed() const -> bool {
    return closed_;
  }

 private:
  struct PendingRequest {
    PendingRequest(asio::strand<asio::any_io_executor> strand, std::string m)
        : method(std::move(m)), timer(strand) {
    }
    std::string method;
    asio::steady_timer timer;
    std::optional<Result> result;
  };

  auto RegisterBuiltinHandlers() -> void;

  auto CallOnStrand(
      std::string method, nlohmann::json params,
      std::chrono::milliseconds timeout) -> asio::awaitable<Result>;
  auto NotifyOnStrand(std::string method, nlohmann::json params)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>>;

  auto ReaderLoop() -> asio::awaitable<void>;
  auto Dispatch(nlohmann::json message) -> void;
  auto HandleResponse(const nlohmann::json& message) -> void;
  auto HandleNotification(const nlohmann::json& message) -> void;
  auto HandleServerRequest(nlohmann::json message) -> asio::awaitable<void>;
  auto HandleClosed(const lsp::error::LspError& cause) -> void;

  asio::strand<asio::any_io_executor> strand_;
  std::unique_ptr<ProcessTransport> transport_;
  utils::AsyncSemaphore in_flight_;

  lsp::RequestId next_id_ = 1;
  std::unordered_map<lsp::RequestId, std::shared_ptr<PendingRequest>> pending_;
  bool started_ = false;
  bool closed_ = false;

  std::unordered_map<std::string, NotificationHandler> notification_handlers_;
  std::unordered_map<std::string, RequestHandler> request_handlers_;
  ClosedHandler closed_handler_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace codenav::client
