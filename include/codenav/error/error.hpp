#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "lsp/error.hpp"

namespace codenav {

/**
 * @brief Error kinds reported to MCP clients
 *
 * Kind names are part of the tool-call error payload and must stay stable.
 */
enum class ErrorKind {
  kStartupError,
  kProtocolError,
  kTimeoutError,
  kCrashError,
  kToolExecutionError,
  kConfigResolutionError,
  kNoSuchTool,
  kProjectNotActive,
  kInvalidArguments,
  kSessionShuttingDown,
};

auto ErrorKindName(ErrorKind kind) -> std::string_view;

/**
 * @brief Error class for the codenav session, tool and supervisor layers
 */
class CodenavError {
 public:
  CodenavError(ErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {
  }

  [[nodiscard]] auto Kind() const -> ErrorKind {
    return kind_;
  }
  [[nodiscard]] auto KindName() const -> std::string_view {
    return ErrorKindName(kind_);
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    return {
        {"kind", std::string(KindName())},
        {"message", message_},
    };
  }

  static auto GetDefaultMessage(ErrorKind kind) -> std::string;

  // Factory method for creating an error, details are appended to the
  // default message of the kind
  static auto Make(ErrorKind kind, const std::string& details = "")
      -> CodenavError {
    if (details.empty()) {
      return {kind, GetDefaultMessage(kind)};
    }
    return {kind, fmt::format("{}: {}", GetDefaultMessage(kind), details)};
  }

  static auto Unexpected(ErrorKind kind, const std::string& details = "")
      -> std::unexpected<CodenavError> {
    return std::unexpected<CodenavError>(Make(kind, details));
  }

  // Maps a language server client error into a session error kind
  static auto FromLspError(const lsp::error::LspError& error) -> CodenavError;

  static auto UnexpectedFromLspError(const lsp::error::LspError& error)
      -> std::unexpected<CodenavError> {
    return std::unexpected<CodenavError>(FromLspError(error));
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

inline void to_json(nlohmann::json& j, const CodenavError& e) {
  j = e.ToJson();
}

template <typename T>
using Result = std::expected<T, CodenavError>;

inline auto Ok() -> Result<void> {
  return {};
}

}  // namespace codenav

template <>
struct fmt::formatter<codenav::CodenavError> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const codenav::CodenavError& e, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}: {}", e.KindName(), e.Message()), ctx);
  }
};
