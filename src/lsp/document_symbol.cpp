#include "lsp/document_symbol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "lsp/json_utils.hpp"

namespace lsp {

namespace {

constexpr std::array<std::pair<SymbolKind, std::string_view>, 26> kKindNames = {{
    {SymbolKind::File, "File"},
    {SymbolKind::Module, "Module"},
    {SymbolKind::Namespace, "Namespace"},
    {SymbolKind::Package, "Package"},
    {SymbolKind::Class, "Class"},
    {SymbolKind::Method, "Method"},
    {SymbolKind::Property, "Property"},
    {SymbolKind::Field, "Field"},
    {SymbolKind::Constructor, "Constructor"},
    {SymbolKind::Enum, "Enum"},
    {SymbolKind::Interface, "Interface"},
    {SymbolKind::Function, "Function"},
    {SymbolKind::Variable, "Variable"},
    {SymbolKind::Constant, "Constant"},
    {SymbolKind::String, "String"},
    {SymbolKind::Number, "Number"},
    {SymbolKind::Boolean, "Boolean"},
    {SymbolKind::Array, "Array"},
    {SymbolKind::Object, "Object"},
    {SymbolKind::Key, "Key"},
    {SymbolKind::Null, "Null"},
    {SymbolKind::EnumMember, "EnumMember"},
    {SymbolKind::Struct, "Struct"},
    {SymbolKind::Event, "Event"},
    {SymbolKind::Operator, "Operator"},
    {SymbolKind::TypeParameter, "TypeParameter"},
}};

auto EqualsIgnoreCase(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

}  // namespace

auto SymbolKindName(SymbolKind kind) -> std::string_view {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) {
      return name;
    }
  }
  return "Unknown";
}

auto SymbolKindFromName(std::string_view name) -> std::optional<SymbolKind> {
  for (const auto& [k, kind_name] : kKindNames) {
    if (EqualsIgnoreCase(kind_name, name)) {
      return k;
    }
  }
  return std::nullopt;
}

void to_json(nlohmann::json& j, const SymbolKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, SymbolKind& k) {
  k = static_cast<SymbolKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const SymbolTag& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, SymbolTag& t) {
  t = static_cast<SymbolTag>(j.get<int>());
}

void to_json(nlohmann::json& j, const DocumentSymbol& s) {
  j = nlohmann::json{
      {"name", s.name},
      {"kind", s.kind},
      {"range", s.range},
      {"selectionRange", s.selectionRange}};
  to_json_optional(j, "detail", s.detail);
  to_json_optional(j, "tags", s.tags);
  to_json_optional(j, "deprecated", s.deprecated);

  // Children are always serialized, but might be an empty array
  j["children"] = s.children;
}

void from_json(const nlohmann::json& j, DocumentSymbol& s) {
  j.at("name").get_to(s.name);
  j.at("kind").get_to(s.kind);
  j.at("range").get_to(s.range);
  // selectionRange is required by the protocol but not every server sends it
  if (j.contains("selectionRange")) {
    j.at("selectionRange").get_to(s.selectionRange);
  } else {
    s.selectionRange = s.range;
  }
  from_json_optional(j, "detail", s.detail);
  from_json_optional(j, "tags", s.tags);
  from_json_optional(j, "deprecated", s.deprecated);

  s.children.clear();
  if (j.contains("children") && j.at("children").is_array()) {
    j.at("children").get_to(s.children);
  }
}

void to_json(nlohmann::json& j, const SymbolInformation& s) {
  j = nlohmann::json{
      {"name", s.name}, {"kind", s.kind}, {"location", s.location}};
  to_json_optional(j, "tags", s.tags);
  to_json_optional(j, "deprecated", s.deprecated);
  to_json_optional(j, "containerName", s.containerName);
}

void from_json(const nlohmann::json& j, SymbolInformation& s) {
  j.at("name").get_to(s.name);
  j.at("kind").get_to(s.kind);
  j.at("location").get_to(s.location);
  from_json_optional(j, "tags", s.tags);
  from_json_optional(j, "deprecated", s.deprecated);
  from_json_optional(j, "containerName", s.containerName);
}

void to_json(nlohmann::json& j, const DocumentSymbolParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DocumentSymbolParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

auto ParseDocumentSymbolResult(const nlohmann::json& j)
    -> DocumentSymbolResult {
  if (!j.is_array() || j.empty()) {
    return std::vector<DocumentSymbol>{};
  }
  // SymbolInformation is recognized by its "location" member
  if (j.front().contains("location")) {
    return j.get<std::vector<SymbolInformation>>();
  }
  return j.get<std::vector<DocumentSymbol>>();
}

}  // namespace lsp
