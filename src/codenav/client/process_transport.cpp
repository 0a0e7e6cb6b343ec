#include "codenav/client/process_transport.hpp"

#include <string>

#include <asio/buffer.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

namespace codenav::client {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

ProcessTransport::ProcessTransport(
    asio::any_io_executor executor, std::shared_ptr<ChildProcess> child,
    std::shared_ptr<spdlog::logger> logger)
    : child_(std::move(child)),
      input_(child_->Stdout()),
      output_(child_->Stdin()),
      write_lock_(executor, 1),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto ProcessTransport::SendMessage(const nlohmann::json& message)
    -> asio::awaitable<std::expected<void, LspError>> {
  auto body = message.dump();
  auto frame = lsp::EncodeFrame(body);

  auto permit = co_await write_lock_.Acquire();
  if (!output_.is_open()) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed, "Language server input is closed");
  }

  std::error_code ec;
  co_await asio::async_write(
      output_, asio::buffer(frame),
      asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    logger_->debug("ProcessTransport write failed: {}", ec.message());
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kServerCrashed,
        "Failed to write to language server: " + ec.message());
  }

  logger_->trace("ProcessTransport --> {}", body);
  co_return lsp::error::Ok();
}

auto ProcessTransport::ReceiveMessage()
    -> asio::awaitable<std::expected<nlohmann::json, LspError>> {
  while (true) {
    auto next = parser_.Next();
    if (!next) {
      logger_->warn("ProcessTransport: {}", next.error().Message());
      co_return std::unexpected(next.error());
    }

    if (next->has_value()) {
      const auto& body = **next;
      logger_->trace("ProcessTransport <-- {}", body);
      auto message = nlohmann::json::parse(body, nullptr, false);
      if (message.is_discarded()) {
        co_return LspError::UnexpectedFromCode(
            LspErrorCode::kParseError, "Undecodable message body");
      }
      co_return message;
    }

    if (!input_.is_open()) {
      co_return LspError::UnexpectedFromCode(
          LspErrorCode::kTransportError, "Language server output is closed");
    }

    std::error_code ec;
    auto bytes = co_await input_.async_read_some(
        asio::buffer(read_buffer_),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      co_return LspError::UnexpectedFromCode(
          LspErrorCode::kTransportError,
          ec == asio::error::eof ? "Language server closed its output"
                                 : "Read failed: " + ec.message());
    }
    parser_.Feed(std::string_view(read_buffer_.data(), bytes));
  }
}

}  // namespace codenav::client
