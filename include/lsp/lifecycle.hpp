#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/document_sync.hpp"

namespace lsp {

// Initialize Request (client side)
struct InitializeParams {
  std::optional<int> processId;
  struct ClientInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ClientInfo> clientInfo;
  std::optional<std::string> locale;
  std::optional<std::string> rootPath;
  std::optional<DocumentUri> rootUri;
  std::optional<nlohmann::json> initializationOptions;
  nlohmann::json capabilities = nlohmann::json::object();
  std::optional<std::vector<WorkspaceFolder>> workspaceFolders;
};

void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p);
void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p);

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

// The subset of server capabilities a client of codenav's shape acts on.
// Provider entries may be `true` or an options object; both count as
// supported.
struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding;
  TextDocumentSyncKind textDocumentSync = TextDocumentSyncKind::kNone;
  bool openClose = false;
  bool documentSymbolProvider = false;
  bool referencesProvider = false;
  bool definitionProvider = false;
  bool renameProvider = false;
  bool workspaceSymbolProvider = false;
};

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

struct InitializeResult {
  ServerCapabilities capabilities;
  struct ServerInfo {
    std::string name;
    std::optional<std::string> version;
  };
  std::optional<ServerInfo> serverInfo;
};

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p);
void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p);

void to_json(nlohmann::json& j, const InitializeResult& p);
void from_json(const nlohmann::json& j, InitializeResult& p);

// Client capabilities advertised by codenav: hierarchical document symbols,
// references, definition with link support, rename, workspace edits with
// document changes, utf-8 and utf-16 position encodings.
auto DefaultClientCapabilities() -> nlohmann::json;

}  // namespace lsp
