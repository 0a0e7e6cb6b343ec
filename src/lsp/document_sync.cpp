#include "lsp/document_sync.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& k) {
  k = static_cast<TextDocumentSyncKind>(j.get<int>());
}

// DidOpenTextDocument Notification
void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

// DidChangeTextDocument Notification
void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e) {
  j = nlohmann::json{{"text", e.text}};
  to_json_optional(j, "range", e.range);
}

void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e) {
  j.at("text").get_to(e.text);
  from_json_optional(j, "range", e.range);
}

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"contentChanges", p.contentChanges}};
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("contentChanges").get_to(p.contentChanges);
}

// DidCloseTextDocument Notification
void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

}  // namespace lsp
