#pragma once

#include <expected>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace lsp::error {

enum class LspErrorCode {
  // JSON-RPC errors
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,
  kServerError,
  kTransportError,
  kTimeoutError,

  // Language server client errors
  kProtocolError,
  kServerCrashed,
  kStartupFailed,
  kCapabilityMissing,

  // Unknown error
  kUnknownError,
};

namespace detail {

inline auto DefaultMessageFor(LspErrorCode code) -> std::string {
  switch (code) {
    case LspErrorCode::kParseError:
      return "Parse error";
    case LspErrorCode::kInvalidRequest:
      return "Invalid request";
    case LspErrorCode::kMethodNotFound:
      return "Method not found";
    case LspErrorCode::kInvalidParams:
      return "Invalid params";
    case LspErrorCode::kInternalError:
      return "Internal error";
    case LspErrorCode::kServerError:
      return "Server error";
    case LspErrorCode::kTransportError:
      return "Transport error";
    case LspErrorCode::kTimeoutError:
      return "Timeout error";
    case LspErrorCode::kProtocolError:
      return "Protocol error";
    case LspErrorCode::kServerCrashed:
      return "Language server crashed";
    case LspErrorCode::kStartupFailed:
      return "Language server failed to start";
    case LspErrorCode::kCapabilityMissing:
      return "Capability not supported by language server";
    case LspErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

}  // namespace detail

// JSON-RPC error codes used on the wire
inline constexpr int kJsonRpcParseError = -32700;
inline constexpr int kJsonRpcInvalidRequest = -32600;
inline constexpr int kJsonRpcMethodNotFound = -32601;
inline constexpr int kJsonRpcInvalidParams = -32602;
inline constexpr int kJsonRpcInternalError = -32603;

class LspError {
 public:
  explicit LspError(
      LspErrorCode code, std::string message,
      std::optional<int> wire_code = std::nullopt)
      : code_(code), message_(std::move(message)), wire_code_(wire_code) {
  }

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  // Numeric code of an error response received from the server, if any
  [[nodiscard]] auto WireCode() const -> std::optional<int> {
    return wire_code_;
  }
  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    nlohmann::json j{
        {"code", code_},
        {"message", message_},
    };
    if (wire_code_) {
      j["wireCode"] = *wire_code_;
    }
    return j;
  }

  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError {
    if (message.empty()) {
      return LspError(code, detail::DefaultMessageFor(code));
    }
    return LspError(code, message);
  }

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

  // Converts the `error` member of a JSON-RPC response
  static auto FromResponseError(const nlohmann::json& error) -> LspError {
    const int wire_code = error.value("code", kJsonRpcInternalError);
    std::string message = error.value("message", std::string{});
    LspErrorCode code{};
    switch (wire_code) {
      case kJsonRpcParseError:
        code = LspErrorCode::kParseError;
        break;
      case kJsonRpcInvalidRequest:
        code = LspErrorCode::kInvalidRequest;
        break;
      case kJsonRpcMethodNotFound:
        code = LspErrorCode::kMethodNotFound;
        break;
      case kJsonRpcInvalidParams:
        code = LspErrorCode::kInvalidParams;
        break;
      case kJsonRpcInternalError:
        code = LspErrorCode::kInternalError;
        break;
      default:
        code = LspErrorCode::kServerError;
        break;
    }
    if (message.empty()) {
      message = detail::DefaultMessageFor(code);
    }
    return LspError(code, std::move(message), wire_code);
  }

 private:
  LspErrorCode code_;
  std::string message_;
  std::optional<int> wire_code_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

inline void to_json(nlohmann::json& j, const LspError& e) {
  j = e.ToJson();
}

}  // namespace lsp::error
