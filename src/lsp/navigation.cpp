#include "lsp/navigation.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Goto Definition Request
void to_json(nlohmann::json& j, const DefinitionParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
}

// Find References Request
void to_json(nlohmann::json& j, const ReferenceContext& c) {
  j = nlohmann::json{{"includeDeclaration", c.includeDeclaration}};
}

void from_json(const nlohmann::json& j, ReferenceContext& c) {
  j.at("includeDeclaration").get_to(c.includeDeclaration);
}

void to_json(nlohmann::json& j, const ReferenceParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_required(j, "context", p.context);
}

void from_json(const nlohmann::json& j, ReferenceParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_required(j, "context", p.context);
}

// Rename Request
void to_json(nlohmann::json& j, const RenameParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_required(j, "newName", p.newName);
}

void from_json(const nlohmann::json& j, RenameParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_required(j, "newName", p.newName);
}

auto ParseLocations(const nlohmann::json& j) -> std::vector<Location> {
  std::vector<Location> locations;

  auto append = [&locations](const nlohmann::json& item) {
    if (item.contains("targetUri")) {
      auto link = item.get<LocationLink>();
      locations.push_back(
          Location{.uri = link.targetUri, .range = link.targetSelectionRange});
    } else {
      locations.push_back(item.get<Location>());
    }
  };

  if (j.is_array()) {
    for (const auto& item : j) {
      append(item);
    }
  } else if (j.is_object()) {
    append(j);
  }
  return locations;
}

}  // namespace lsp
