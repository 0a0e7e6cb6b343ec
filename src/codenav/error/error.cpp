#include "codenav/error/error.hpp"

namespace codenav {

auto ErrorKindName(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::kStartupError:
      return "StartupError";
    case ErrorKind::kProtocolError:
      return "ProtocolError";
    case ErrorKind::kTimeoutError:
      return "TimeoutError";
    case ErrorKind::kCrashError:
      return "CrashError";
    case ErrorKind::kToolExecutionError:
      return "ToolExecutionError";
    case ErrorKind::kConfigResolutionError:
      return "ConfigResolutionError";
    case ErrorKind::kNoSuchTool:
      return "NoSuchTool";
    case ErrorKind::kProjectNotActive:
      return "ProjectNotActive";
    case ErrorKind::kInvalidArguments:
      return "InvalidArguments";
    case ErrorKind::kSessionShuttingDown:
      return "SessionShuttingDown";
  }
  return "ToolExecutionError";
}

auto CodenavError::GetDefaultMessage(ErrorKind kind) -> std::string {
  switch (kind) {
    case ErrorKind::kStartupError:
      return "Language server failed to start";
    case ErrorKind::kProtocolError:
      return "Protocol error";
    case ErrorKind::kTimeoutError:
      return "Request timed out";
    case ErrorKind::kCrashError:
      return "Language server crashed";
    case ErrorKind::kToolExecutionError:
      return "Tool execution failed";
    case ErrorKind::kConfigResolutionError:
      return "Invalid tool configuration";
    case ErrorKind::kNoSuchTool:
      return "No such tool";
    case ErrorKind::kProjectNotActive:
      return "No active project";
    case ErrorKind::kInvalidArguments:
      return "Invalid arguments";
    case ErrorKind::kSessionShuttingDown:
      return "Session is shutting down";
  }
  return "Unknown error";
}

auto CodenavError::FromLspError(const lsp::error::LspError& error)
    -> CodenavError {
  using lsp::error::LspErrorCode;

  ErrorKind kind{};
  switch (error.Code()) {
    case LspErrorCode::kServerCrashed:
      kind = ErrorKind::kCrashError;
      break;
    case LspErrorCode::kStartupFailed:
      kind = ErrorKind::kStartupError;
      break;
    case LspErrorCode::kTimeoutError:
      kind = ErrorKind::kTimeoutError;
      break;
    case LspErrorCode::kParseError:
    case LspErrorCode::kInvalidRequest:
    case LspErrorCode::kProtocolError:
    case LspErrorCode::kTransportError:
      kind = ErrorKind::kProtocolError;
      break;
    case LspErrorCode::kMethodNotFound:
    case LspErrorCode::kInvalidParams:
    case LspErrorCode::kInternalError:
    case LspErrorCode::kServerError:
    case LspErrorCode::kCapabilityMissing:
    case LspErrorCode::kUnknownError:
      kind = ErrorKind::kToolExecutionError;
      break;
  }
  return {kind, error.Message()};
}

}  // namespace codenav
