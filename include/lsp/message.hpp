#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lsp/error.hpp"

namespace lsp {

using RequestId = std::int64_t;

// Base protocol framing: "Content-Length: <n>\r\n\r\n" followed by n bytes.
auto EncodeFrame(std::string_view body) -> std::string;

// Incremental decoder for the base protocol. Bytes are appended with Feed()
// and complete bodies are pulled with Next(). Headers other than
// Content-Length are ignored.
class FrameParser {
 public:
  void Feed(std::string_view bytes);

  // Returns the next complete body, nullopt when more bytes are needed, or a
  // ProtocolError when a header block is malformed. The malformed block is
  // discarded so parsing can resume with the following header.
  auto Next()
      -> std::expected<std::optional<std::string>, error::LspError>;

  [[nodiscard]] auto BufferedSize() const -> std::size_t {
    return buffer_.size() - offset_;
  }

 private:
  void Compact();

  std::string buffer_;
  std::size_t offset_ = 0;
  std::optional<std::size_t> pending_length_;
};

enum class MessageKind {
  kRequest,
  kNotification,
  kResponse,
  kInvalid,
};

// Classifies a decoded JSON-RPC message: a request has method and id, a
// notification has method only, a response has id and result or error.
auto ClassifyMessage(const nlohmann::json& message) -> MessageKind;

auto MakeRequest(RequestId id, std::string_view method, nlohmann::json params)
    -> nlohmann::json;
auto MakeNotification(std::string_view method, nlohmann::json params)
    -> nlohmann::json;
auto MakeResponse(const nlohmann::json& id, nlohmann::json result)
    -> nlohmann::json;
auto MakeErrorResponse(
    const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

}  // namespace lsp
