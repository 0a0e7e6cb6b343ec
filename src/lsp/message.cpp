#include "lsp/message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace lsp {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kContentLength = "content-length";

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
  return std::ranges::equal(lhs, rhs, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

auto ParseContentLength(std::string_view headers)
    -> std::expected<std::size_t, error::LspError> {
  std::optional<std::size_t> length;
  while (!headers.empty()) {
    auto line_end = headers.find("\r\n");
    auto line = headers.substr(0, line_end);
    headers = line_end == std::string_view::npos
                  ? std::string_view{}
                  : headers.substr(line_end + 2);

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return error::LspError::UnexpectedFromCode(
          error::LspErrorCode::kProtocolError,
          fmt::format("Malformed header line '{}'", line));
    }
    if (!EqualsIgnoreCase(Trim(line.substr(0, colon)), kContentLength)) {
      continue;
    }

    auto value = Trim(line.substr(colon + 1));
    std::size_t parsed = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
      return error::LspError::UnexpectedFromCode(
          error::LspErrorCode::kProtocolError,
          fmt::format("Invalid Content-Length '{}'", value));
    }
    length = parsed;
  }

  if (!length) {
    return error::LspError::UnexpectedFromCode(
        error::LspErrorCode::kProtocolError, "Missing Content-Length header");
  }
  return *length;
}

}  // namespace

auto EncodeFrame(std::string_view body) -> std::string {
  return fmt::format("Content-Length: {}\r\n\r\n{}", body.size(), body);
}

void FrameParser::Feed(std::string_view bytes) {
  buffer_.append(bytes);
}

auto FrameParser::Next()
    -> std::expected<std::optional<std::string>, error::LspError> {
  if (!pending_length_) {
    auto header_end = buffer_.find(kHeaderTerminator, offset_);
    if (header_end == std::string::npos) {
      return std::nullopt;
    }

    auto headers =
        std::string_view(buffer_).substr(offset_, header_end - offset_);
    auto length = ParseContentLength(headers);
    offset_ = header_end + kHeaderTerminator.size();
    if (!length) {
      Compact();
      return std::unexpected(length.error());
    }
    pending_length_ = *length;
  }

  if (BufferedSize() < *pending_length_) {
    return std::nullopt;
  }

  std::string body = buffer_.substr(offset_, *pending_length_);
  offset_ += *pending_length_;
  pending_length_.reset();
  Compact();
  return body;
}

void FrameParser::Compact() {
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  } else if (offset_ > 4096 && offset_ * 2 > buffer_.size()) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
}

auto ClassifyMessage(const nlohmann::json& message) -> MessageKind {
  if (!message.is_object()) {
    return MessageKind::kInvalid;
  }
  const bool has_method =
      message.contains("method") && message.at("method").is_string();
  const bool has_id = message.contains("id") && !message.at("id").is_null();

  if (has_method) {
    return has_id ? MessageKind::kRequest : MessageKind::kNotification;
  }
  if (message.contains("id") &&
      (message.contains("result") || message.contains("error"))) {
    return MessageKind::kResponse;
  }
  return MessageKind::kInvalid;
}

auto MakeRequest(RequestId id, std::string_view method, nlohmann::json params)
    -> nlohmann::json {
  nlohmann::json message{
      {"jsonrpc", "2.0"}, {"id", id}, {"method", std::string(method)}};
  if (!params.is_null()) {
    message["params"] = std::move(params);
  }
  return message;
}

auto MakeNotification(std::string_view method, nlohmann::json params)
    -> nlohmann::json {
  nlohmann::json message{{"jsonrpc", "2.0"}, {"method", std::string(method)}};
  if (!params.is_null()) {
    message["params"] = std::move(params);
  }
  return message;
}

auto MakeResponse(const nlohmann::json& id, nlohmann::json result)
    -> nlohmann::json {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

auto MakeErrorResponse(
    const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"error", {{"code", code}, {"message", std::string(message)}}}};
}

}  // namespace lsp
