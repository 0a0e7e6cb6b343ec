#pragma once

#include <compare>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Position (zero-based line, character in the negotiated encoding)
struct Position {
  int line = 0;
  int character = 0;

  friend auto operator<=>(const Position&, const Position&) = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

enum class PositionEncodingKind {
  kUtf8,
  kUtf16,
  kUtf32,
};

void to_json(nlohmann::json& j, const PositionEncodingKind& p);
void from_json(const nlohmann::json& j, PositionEncodingKind& p);

// Range (end exclusive)
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;

  [[nodiscard]] auto Contains(const Range& other) const -> bool {
    return start <= other.start && other.end <= end;
  }

  [[nodiscard]] auto Contains(const Position& pos) const -> bool {
    return start <= pos && pos <= end;
  }
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Location
struct Location {
  DocumentUri uri;
  Range range;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Location Link
struct LocationLink {
  std::optional<Range> originSelectionRange;
  DocumentUri targetUri;
  Range targetRange;
  Range targetSelectionRange;
};

void to_json(nlohmann::json& j, const LocationLink& l);
void from_json(const nlohmann::json& j, LocationLink& l);

// Text Document Item
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version = 0;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Text Document Identifier
struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

// Versioned Text Document Identifier
struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version = 0;
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

struct OptionalVersionedTextDocumentIdentifier : TextDocumentIdentifier {
  std::optional<int> version;
};

void to_json(
    nlohmann::json& j, const OptionalVersionedTextDocumentIdentifier& o);
void from_json(
    const nlohmann::json& j, OptionalVersionedTextDocumentIdentifier& o);

// Text Document Position Params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

// Text Edit (annotated edits decode into plain edits)
struct TextEdit {
  Range range;
  std::string newText;
};

void to_json(nlohmann::json& j, const TextEdit& t);
void from_json(const nlohmann::json& j, TextEdit& t);

// Text Document Edit
struct TextDocumentEdit {
  OptionalVersionedTextDocumentIdentifier textDocument;
  std::vector<TextEdit> edits;
};

void to_json(nlohmann::json& j, const TextDocumentEdit& t);
void from_json(const nlohmann::json& j, TextDocumentEdit& t);

// Workspace Edit
// Resource operations (create/rename/delete file) inside documentChanges are
// skipped on decode; codenav only applies text edits.
struct WorkspaceEdit {
  std::optional<std::map<DocumentUri, std::vector<TextEdit>>> changes;
  std::optional<std::vector<TextDocumentEdit>> documentChanges;

  // Flattened view: uri -> edits, merging both representations
  [[nodiscard]] auto EditsByUri() const
      -> std::map<DocumentUri, std::vector<TextEdit>>;
};

void to_json(nlohmann::json& j, const WorkspaceEdit& w);
void from_json(const nlohmann::json& j, WorkspaceEdit& w);

// Workspace Folder
struct WorkspaceFolder {
  Uri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

}  // namespace lsp
