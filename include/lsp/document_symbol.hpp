#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

/**
 * Symbol kinds as defined by the LSP specification
 */
enum class SymbolKind {
  File = 1,
  Module = 2,
  Namespace = 3,
  Package = 4,
  Class = 5,
  Method = 6,
  Property = 7,
  Field = 8,
  Constructor = 9,
  Enum = 10,
  Interface = 11,
  Function = 12,
  Variable = 13,
  Constant = 14,
  String = 15,
  Number = 16,
  Boolean = 17,
  Array = 18,
  Object = 19,
  Key = 20,
  Null = 21,
  EnumMember = 22,
  Struct = 23,
  Event = 24,
  Operator = 25,
  TypeParameter = 26
};

// Human readable kind name ("Function", "Class", ...)
auto SymbolKindName(SymbolKind kind) -> std::string_view;

// Inverse of SymbolKindName, case-insensitive
auto SymbolKindFromName(std::string_view name) -> std::optional<SymbolKind>;

/**
 * Symbol tags as defined by the LSP specification
 */
enum class SymbolTag { Deprecated = 1 };

/**
 * DocumentSymbol as defined by the LSP specification
 * Represents a symbol in a hierarchical structure
 */
struct DocumentSymbol {
  std::string name;                   // Symbol name
  std::optional<std::string> detail;  // Additional details (e.g., signature)
  SymbolKind kind = SymbolKind::Null;
  std::optional<std::vector<SymbolTag>> tags;
  std::optional<bool> deprecated;        // Deprecated flag (legacy)
  Range range;                           // Full symbol range
  Range selectionRange;                  // Name identifier range
  std::vector<DocumentSymbol> children;  // Child symbols
};

/**
 * Flat symbol form returned by older servers
 */
struct SymbolInformation {
  std::string name;
  SymbolKind kind = SymbolKind::Null;
  std::optional<std::vector<SymbolTag>> tags;
  std::optional<bool> deprecated;
  Location location;
  std::optional<std::string> containerName;
};

void to_json(nlohmann::json& j, const SymbolKind& k);
void from_json(const nlohmann::json& j, SymbolKind& k);

void to_json(nlohmann::json& j, const SymbolTag& t);
void from_json(const nlohmann::json& j, SymbolTag& t);

void to_json(nlohmann::json& j, const DocumentSymbol& s);
void from_json(const nlohmann::json& j, DocumentSymbol& s);

void to_json(nlohmann::json& j, const SymbolInformation& s);
void from_json(const nlohmann::json& j, SymbolInformation& s);

// Document Symbols Request
struct DocumentSymbolParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const DocumentSymbolParams& p);
void from_json(const nlohmann::json& j, DocumentSymbolParams& p);

// The response is either hierarchical or flat; null decodes to an empty
// hierarchical list.
using DocumentSymbolResult =
    std::variant<std::vector<DocumentSymbol>, std::vector<SymbolInformation>>;

auto ParseDocumentSymbolResult(const nlohmann::json& j) -> DocumentSymbolResult;

}  // namespace lsp
