#include "lsp/lifecycle.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

namespace {

auto IsProviderEnabled(const nlohmann::json& j, const std::string& key)
    -> bool {
  if (!j.contains(key)) {
    return false;
  }
  const auto& value = j.at(key);
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  return value.is_object();
}

}  // namespace

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  // processId and rootUri are required by the protocol and may be null
  j["processId"] =
      p.processId.has_value() ? nlohmann::json(*p.processId) : nullptr;
  j["rootUri"] = p.rootUri.has_value() ? nlohmann::json(*p.rootUri) : nullptr;
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "locale", p.locale);
  to_json_optional(j, "rootPath", p.rootPath);
  to_json_optional(j, "initializationOptions", p.initializationOptions);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "locale", p.locale);
  from_json_optional(j, "rootPath", p.rootPath);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "initializationOptions", p.initializationOptions);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
  p.capabilities = j.value("capabilities", nlohmann::json::object());
}

// Server Capabilities
void to_json(nlohmann::json& j, const ServerCapabilities& c) {
  j = nlohmann::json{
      {"textDocumentSync",
       nlohmann::json{
           {"openClose", c.openClose}, {"change", c.textDocumentSync}}},
      {"documentSymbolProvider", c.documentSymbolProvider},
      {"referencesProvider", c.referencesProvider},
      {"definitionProvider", c.definitionProvider},
      {"renameProvider", c.renameProvider},
      {"workspaceSymbolProvider", c.workspaceSymbolProvider}};
  to_json_optional(j, "positionEncoding", c.positionEncoding);
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
  if (j.contains("positionEncoding") && j.at("positionEncoding").is_string()) {
    c.positionEncoding = j.at("positionEncoding").get<PositionEncodingKind>();
  }

  // textDocumentSync is either a TextDocumentSyncKind or an options object
  if (j.contains("textDocumentSync")) {
    const auto& sync = j.at("textDocumentSync");
    if (sync.is_number_integer()) {
      c.textDocumentSync = sync.get<TextDocumentSyncKind>();
      c.openClose = c.textDocumentSync != TextDocumentSyncKind::kNone;
    } else if (sync.is_object()) {
      c.openClose = value_or(sync, "openClose", false);
      c.textDocumentSync = static_cast<TextDocumentSyncKind>(
          value_or(sync, "change", static_cast<int>(TextDocumentSyncKind::kNone)));
    }
  }

  c.documentSymbolProvider = IsProviderEnabled(j, "documentSymbolProvider");
  c.referencesProvider = IsProviderEnabled(j, "referencesProvider");
  c.definitionProvider = IsProviderEnabled(j, "definitionProvider");
  c.renameProvider = IsProviderEnabled(j, "renameProvider");
  c.workspaceSymbolProvider = IsProviderEnabled(j, "workspaceSymbolProvider");
}

// Initialize Result
void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  j.at("capabilities").get_to(p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

auto DefaultClientCapabilities() -> nlohmann::json {
  return nlohmann::json{
      {"general", {{"positionEncodings", {"utf-16", "utf-8"}}}},
      {"workspace",
       {{"applyEdit", true},
        {"configuration", true},
        {"workspaceFolders", true},
        {"workspaceEdit", {{"documentChanges", true}}}}},
      {"textDocument",
       {{"synchronization",
         {{"didSave", false}, {"dynamicRegistration", false}}},
        {"documentSymbol",
         {{"hierarchicalDocumentSymbolSupport", true},
          {"symbolKind", {{"valueSet", nlohmann::json::array()}}}}},
        {"definition", {{"linkSupport", true}}},
        {"references", nlohmann::json::object()},
        {"rename", {{"prepareSupport", false}}}}},
      {"window", {{"workDoneProgress", true}}},
  };
}

}  // namespace lsp
