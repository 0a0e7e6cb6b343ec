#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(nlohmann::json& j, const PositionEncodingKind& p) {
  switch (p) {
    case PositionEncodingKind::kUtf8:
      j = "utf-8";
      break;
    case PositionEncodingKind::kUtf16:
      j = "utf-16";
      break;
    case PositionEncodingKind::kUtf32:
      j = "utf-32";
      break;
  }
}

void from_json(const nlohmann::json& j, PositionEncodingKind& p) {
  auto s = j.get<std::string>();
  if (s == "utf-8") {
    p = PositionEncodingKind::kUtf8;
  } else if (s == "utf-16") {
    p = PositionEncodingKind::kUtf16;
  } else if (s == "utf-32") {
    p = PositionEncodingKind::kUtf32;
  } else {
    throw std::runtime_error("Invalid position encoding kind: " + s);
  }
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Location Link
void to_json(nlohmann::json& j, const LocationLink& l) {
  j = nlohmann::json{
      {"targetUri", l.targetUri},
      {"targetRange", l.targetRange},
      {"targetSelectionRange", l.targetSelectionRange}};
  to_json_optional(j, "originSelectionRange", l.originSelectionRange);
}

void from_json(const nlohmann::json& j, LocationLink& l) {
  j.at("targetUri").get_to(l.targetUri);
  j.at("targetRange").get_to(l.targetRange);
  // Some servers omit the selection range; fall back to the full range
  if (j.contains("targetSelectionRange")) {
    j.at("targetSelectionRange").get_to(l.targetSelectionRange);
  } else {
    l.targetSelectionRange = l.targetRange;
  }
  from_json_optional(j, "originSelectionRange", l.originSelectionRange);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  j.at("uri").get_to(t.uri);
  j.at("languageId").get_to(t.languageId);
  j.at("version").get_to(t.version);
  j.at("text").get_to(t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

// Versioned Text Document Identifier
void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  j.at("uri").get_to(v.uri);
  j.at("version").get_to(v.version);
}

void to_json(
    nlohmann::json& j, const OptionalVersionedTextDocumentIdentifier& o) {
  j = nlohmann::json{{"uri", o.uri}};
  if (o.version.has_value()) {
    j["version"] = *o.version;
  } else {
    j["version"] = nullptr;
  }
}

void from_json(
    const nlohmann::json& j, OptionalVersionedTextDocumentIdentifier& o) {
  j.at("uri").get_to(o.uri);
  from_json_optional(j, "version", o.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{{"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Text Edit
void to_json(nlohmann::json& j, const TextEdit& t) {
  j = nlohmann::json{{"range", t.range}, {"newText", t.newText}};
}

void from_json(const nlohmann::json& j, TextEdit& t) {
  j.at("range").get_to(t.range);
  j.at("newText").get_to(t.newText);
}

// Text Document Edit
void to_json(nlohmann::json& j, const TextDocumentEdit& t) {
  j = nlohmann::json{{"textDocument", t.textDocument}, {"edits", t.edits}};
}

void from_json(const nlohmann::json& j, TextDocumentEdit& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("edits").get_to(t.edits);
}

// Workspace Edit
auto WorkspaceEdit::EditsByUri() const
    -> std::map<DocumentUri, std::vector<TextEdit>> {
  std::map<DocumentUri, std::vector<TextEdit>> result;
  if (documentChanges.has_value()) {
    for (const auto& change : *documentChanges) {
      auto& edits = result[change.textDocument.uri];
      edits.insert(edits.end(), change.edits.begin(), change.edits.end());
    }
  } else if (changes.has_value()) {
    result = *changes;
  }
  return result;
}

void to_json(nlohmann::json& j, const WorkspaceEdit& w) {
  j = nlohmann::json::object();
  to_json_optional(j, "changes", w.changes);
  to_json_optional(j, "documentChanges", w.documentChanges);
}

void from_json(const nlohmann::json& j, WorkspaceEdit& w) {
  from_json_optional(j, "changes", w.changes);

  w.documentChanges.reset();
  if (j.contains("documentChanges") && j.at("documentChanges").is_array()) {
    std::vector<TextDocumentEdit> edits;
    for (const auto& change : j.at("documentChanges")) {
      // Resource operations carry a "kind" discriminator
      if (change.contains("kind")) {
        continue;
      }
      edits.push_back(change.get<TextDocumentEdit>());
    }
    w.documentChanges = std::move(edits);
  }
}

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  j.at("name").get_to(w.name);
}

}  // namespace lsp
