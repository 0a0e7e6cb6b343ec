#pragma once

#include <array>
#include <expected>
#include <memory>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "codenav/client/child_process.hpp"
#include "codenav/utils/async_semaphore.hpp"
#include "lsp/error.hpp"
#include "lsp/message.hpp"

namespace codenav::client {

// Duplex framed message stream over a child's stdout (input) and stdin
// (output). The transport shares ownership of the child so pending reads
// never outlive the pipes.
class ProcessTransport {
 public:
  ProcessTransport(
      asio::any_io_executor executor, std::shared_ptr<ChildProcess> child,
      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

  // Frames and writes one message. Writers are served one at a time in
  // arrival order, so a message sent earlier is on the wire before any
  // message sent later. A failed write means the peer is gone and reports
  // kServerCrashed.
  auto SendMessage(const nlohmann::json& message)
      -> asio::awaitable<std::expected<void, lsp::error::LspError>>;

  // Reads the next complete message. kProtocolError and kParseError are
  // recoverable (the offending frame is skipped); kTransportError means the
  // stream is closed.
  auto ReceiveMessage()
      -> asio::awaitable<std::expected<nlohmann::json, lsp::error::LspError>>;

 private:
  std::shared_ptr<ChildProcess> child_;
  asio::posix::stream_descriptor& input_;
  asio::posix::stream_descriptor& output_;
  utils::AsyncSemaphore write_lock_;
  lsp::FrameParser parser_;
  std::array<char, 8192> read_buffer_{};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace codenav::client
