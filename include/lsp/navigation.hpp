#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Goto Definition Request
struct DefinitionParams : TextDocumentPositionParams {};

void to_json(nlohmann::json& j, const DefinitionParams& p);
void from_json(const nlohmann::json& j, DefinitionParams& p);

// Find References Request
struct ReferenceContext {
  bool includeDeclaration = false;
};

void to_json(nlohmann::json& j, const ReferenceContext& c);
void from_json(const nlohmann::json& j, ReferenceContext& c);

struct ReferenceParams : TextDocumentPositionParams {
  ReferenceContext context{};
};

void to_json(nlohmann::json& j, const ReferenceParams& p);
void from_json(const nlohmann::json& j, ReferenceParams& p);

// Rename Request
struct RenameParams : TextDocumentPositionParams {
  std::string newName;
};

void to_json(nlohmann::json& j, const RenameParams& p);
void from_json(const nlohmann::json& j, RenameParams& p);

// Definition and references results come as Location, Location[],
// LocationLink[] or null. All shapes are normalized to plain locations
// (links use their target selection range).
auto ParseLocations(const nlohmann::json& j) -> std::vector<Location>;

}  // namespace lsp
