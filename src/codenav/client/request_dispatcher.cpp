#include "codenav/client/request_dispatcher.hpp"

#include <exception>
#include <string>

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

namespace codenav::client {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

RequestDispatcher::RequestDispatcher(
    asio::any_io_executor executor,
    std::unique_ptr<ProcessTransport> transport, std::size_t max_in_flight,
    std::shared_ptr<spdlog::logger> logger)
    : strand_(asio::make_strand(executor)),
      transport_(std::move(transport)),
      in_flight_(strand_, max_in_flight == 0 ? 1 : max_in_flight),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
  RegisterBuiltinHandlers();
}

auto RequestDispatcher::RegisterBuiltinHandlers() -> void {
  // One null per requested configuration item: codenav has no settings to
  // offer, servers fall back to their defaults
  OnRequest(
      "workspace/configuration",
      [](const nlohmann::json& params) -> asio::awaitable<Result> {
        auto result = nlohmann::json::array();
        if (params.contains("items") && params.at("items").is_array()) {
          for (std::size_t i = 0; i < params.at("items").size(); ++i) {
            result.push_back(nullptr);
          }
        }
        co_return result;
      });

  auto acknowledge = [](const nlohmann::json&) -> asio::awaitable<Result> {
    co_return nullptr;
  };
  OnRequest("client/registerCapability", acknowledge);
  OnRequest("client/unregisterCapability", acknowledge);
  OnRequest("window/workDoneProgress/create", acknowledge);

  auto log_message = [this](const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("message") ||
        !params.at("message").is_string()) {
      logger_->debug("Server message without text: {}", params.dump());
      return;
    }
    logger_->debug(
        "Server message: {}", params.at("message").get<std::string>());
  };
  OnNotification("window/logMessage", log_message);
  OnNotification("window/showMessage", log_message);
  OnNotification("$/progress", [](const nlohmann::json&) {});
  OnNotification("textDocument/publishDiagnostics", [](const nlohmann::json&) {});
}

auto RequestDispatcher::Start() -> void {
  if (started_) {
    return;
  }
  started_ = true;
  asio::co_spawn(
      strand_,
      [self = shared_from_this()]() -> asio::awaitable<void> {
        co_await self->ReaderLoop();
      },
      asio::bind_executor(
          strand_, [self = shared_from_this()](std::exception_ptr error) {
            if (!error) {
              return;
            }
            std::string reason = "unknown error";
            try {
              std::rethrow_exception(error);
            } catch (const std::exception& e) {
              reason = e.what();
            } catch (...) {
              reason = "unknown exception";
            }
            self->logger_->error("RequestDispatcher: reader stopped: {}", reason);
            self->HandleClosed(LspError::FromCode(
                LspErrorCode::kServerCrashed,
                fmt::format("Reader stopped: {}", reason)));
          }));
}

auto RequestDispatcher::Call(
    std::string method, nlohmann::json params,
    std::chrono::milliseconds timeout) -> asio::awaitable<Result> {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(), method = std::move(method),
       params = std::move(params), timeout]() mutable
      -> asio::awaitable<Result> {
        co_return co_await self->CallOnStrand(
            std::move(method), std::move(params), timeout);
      },
      asio::use_awaitable);
}

auto RequestDispatcher::Notify(std::string method, nlohmann::json params)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await asio::co_spawn(
      strand_,
      [self = shared_from_this(), method = std::move(method),
       params = std::move(params)]() mutable
      -> asio::awaitable<std::expected<void, LspError>> {
        co_return co_await self->NotifyOnStrand(
            std::move(method), std::move(params));
      },
      asio::use_awaitable);
}

auto RequestDispatcher::OnNotification(
    std::string method, NotificationHandler handler) -> void {
  notification_handlers_[std::move(method)] = std::move(handler);
}

auto RequestDispatcher::OnRequest(std::string method, RequestHandler handler)
    -> void {
  request_handlers_[std::move(method)] = std::move(handler);
}

auto RequestDispatcher::OnClosed(ClosedHandler handler) -> void {
  closed_handler_ = std::move(handler);
}

auto RequestDispatcher::CallOnStrand(
    std::string method, nlohmann::json params,
    std::chrono::milliseconds timeout) -> asio::awaitable<Result> {
  if (closed_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        fmt::format("Connection closed, cannot send '{}'", method));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto timeout_error = [&method, timeout]() {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kTimeoutError,
        fmt::format(
            "Request '{}' timed out after {}ms", method, timeout.count()));
  };

  auto permit = co_await in_flight_.Acquire(deadline);
  if (!permit) {
    co_return timeout_error();
  }
  if (closed_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        fmt::format("Connection closed, cannot send '{}'", method));
  }

  const auto id = next_id_++;
  auto pending = std::make_shared<PendingRequest>(strand_, method);
  pending->timer.expires_at(deadline);
  pending_[id] = pending;

  logger_->debug("RequestDispatcher --> {} (id {})", method, id);
  auto sent = co_await transport_->SendMessage(
      lsp::MakeRequest(id, method, std::move(params)));
  if (!sent) {
    pending_.erase(id);
    co_return std::unexpected(sent.error());
  }

  if (!pending->result) {
    std::error_code ec;
    co_await pending->timer.async_wait(
        asio::redirect_error(asio::use_awaitable, ec));
  }
  pending_.erase(id);

  if (!pending->result) {
    logger_->warn("RequestDispatcher: {} (id {}) timed out", method, id);
    co_return timeout_error();
  }
  co_return std::move(*pending->result);
}

auto RequestDispatcher::NotifyOnStrand(
    std::string method, nlohmann::json params)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (closed_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        fmt::format("Connection closed, cannot send '{}'", method));
  }
  logger_->debug("RequestDispatcher --> {} (notification)", method);
  co_return co_await transport_->SendMessage(
      lsp::MakeNotification(method, std::move(params)));
}

auto RequestDispatcher::ReaderLoop() -> asio::awaitable<void> {
  while (!closed_) {
    auto message = co_await transport_->ReceiveMessage();
    if (!message) {
      const auto code = message.error().Code();
      if (code == LspErrorCode::kProtocolError ||
          code == LspErrorCode::kParseError) {
        logger_->warn(
            "RequestDispatcher: skipping bad message: {}",
            message.error().Message());
        continue;
      }
      HandleClosed(message.error());
      co_return;
    }

    try {
      Dispatch(std::move(*message));
    } catch (const nlohmann::json::exception& e) {
      logger_->warn("RequestDispatcher: dropping malformed message: {}", e.what());
    }
  }
}

auto RequestDispatcher::Dispatch(nlohmann::json message) -> void {
  switch (lsp::ClassifyMessage(message)) {
    case lsp::MessageKind::kResponse:
      HandleResponse(message);
      break;
    case lsp::MessageKind::kNotification:
      HandleNotification(message);
      break;
    case lsp::MessageKind::kRequest:
      asio::co_spawn(
          strand_,
          [self = shared_from_this(),
           request = std::move(message)]() mutable -> asio::awaitable<void> {
            co_await self->HandleServerRequest(std::move(request));
          },
          asio::detached);
      break;
    case lsp::MessageKind::kInvalid:
      logger_->warn(
          "RequestDispatcher: ignoring invalid message: {}",
          message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
      break;
  }
}

auto RequestDispatcher::HandleResponse(const nlohmann::json& message) -> void {
  const auto& id_json = message.at("id");
  if (!id_json.is_number_integer()) {
    logger_->warn("RequestDispatcher: response with foreign id {}", id_json.dump());
    return;
  }

  const auto id = id_json.get<lsp::RequestId>();
  auto it = pending_.find(id);
  if (it == pending_.end() || it->second->result) {
    logger_->debug("RequestDispatcher: dropping late response for id {}", id);
    return;
  }

  auto& pending = it->second;
  if (message.contains("error")) {
    pending->result =
        std::unexpected(LspError::FromResponseError(message.at("error")));
  } else {
    pending->result = message.at("result");
  }
  logger_->debug(
      "RequestDispatcher <-- {} (id {}){}", pending->method, id,
      message.contains("error") ? " error" : "");
  pending->timer.cancel();
}

auto RequestDispatcher::HandleNotification(const nlohmann::json& message)
    -> void {
  const auto method = message.at("method").get<std::string>();
  auto it = notification_handlers_.find(method);
  if (it == notification_handlers_.end()) {
    logger_->debug("RequestDispatcher: unhandled notification {}", method);
    return;
  }
  it->second(message.contains("params") ? message.at("params")
                                         : nlohmann::json{});
}

auto RequestDispatcher::HandleServerRequest(nlohmann::json message)
    -> asio::awaitable<void> {
  const auto method = message.at("method").get<std::string>();
  const auto id = message.at("id");

  nlohmann::json response;
  auto it = request_handlers_.find(method);
  if (it == request_handlers_.end()) {
    logger_->debug("RequestDispatcher: unsupported server request {}", method);
    response = lsp::MakeErrorResponse(
        id, lsp::error::kJsonRpcMethodNotFound,
        fmt::format("Method not found: {}", method));
  } else {
    auto params = message.contains("params") ? message.at("params")
                                             : nlohmann::json{};
    Result result;
    try {
      result = co_await it->second(std::move(params));
    } catch (const nlohmann::json::exception& e) {
      result = LspError::UnexpectedFromCode(
          LspErrorCode::kInvalidParams,
          fmt::format("Malformed '{}' request: {}", method, e.what()));
    }
    if (result) {
      response = lsp::MakeResponse(id, std::move(*result));
    } else {
      response = lsp::MakeErrorResponse(
          id, lsp::error::kJsonRpcInternalError, result.error().Message());
    }
  }

  if (closed_) {
    co_return;
  }
  auto sent = co_await transport_->SendMessage(response);
  if (!sent) {
    logger_->debug(
        "RequestDispatcher: failed to answer {}: {}", method,
        sent.error().Message());
  }
}

auto RequestDispatcher::HandleClosed(const LspError& cause) -> void {
  if (closed_) {
    return;
  }
  closed_ = true;
  logger_->debug(
      "RequestDispatcher: connection closed ({}), failing {} pending requests",
      cause.Message(), pending_.size());

  for (auto& [id, pending] : pending_) {
    if (!pending->result) {
      pending->result = LspError::UnexpectedFromCode(
          LspErrorCode::kServerCrashed,
          fmt::format(
              "Language server connection closed while waiting for '{}'",
              pending->method));
      pending->timer.cancel();
    }
  }

  if (closed_handler_) {
    closed_handler_(cause);
  }
}

}  // namespace codenav::client
