#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "codenav/error/error.hpp"

namespace codenav::tools {

// Builds the JSON Schema object of a tool's parameters from typed
// declarations
class SchemaBuilder {
 public:
  enum class Presence {
    kRequired,
    kOptional,
  };

  auto String(
      std::string name, std::string description,
      Presence presence = Presence::kRequired) -> SchemaBuilder&;

  auto Integer(
      std::string name, std::string description,
      Presence presence = Presence::kOptional,
      std::optional<int> default_value = std::nullopt) -> SchemaBuilder&;

  auto Boolean(
      std::string name, std::string description,
      std::optional<bool> default_value = std::nullopt) -> SchemaBuilder&;

  auto StringArray(
      std::string name, std::string description,
      Presence presence = Presence::kRequired) -> SchemaBuilder&;

  [[nodiscard]] auto Build() const -> nlohmann::json;

 private:
  auto Add(std::string name, nlohmann::json property, Presence presence)
      -> SchemaBuilder&;

  nlohmann::json properties_ = nlohmann::json::object();
  std::vector<std::string> required_;
};

// Typed read access to tools/call arguments. Type mismatches and missing
// required values fail with kInvalidArguments.
class ToolArguments {
 public:
  explicit ToolArguments(const nlohmann::json& arguments);

  [[nodiscard]] auto GetString(std::string_view name) const
      -> Result<std::string>;
  [[nodiscard]] auto GetOptionalString(std::string_view name) const
      -> Result<std::optional<std::string>>;
  [[nodiscard]] auto GetInt(std::string_view name, int default_value) const
      -> Result<int>;
  [[nodiscard]] auto GetOptionalInt(std::string_view name) const
      -> Result<std::optional<int>>;
  [[nodiscard]] auto GetBool(std::string_view name, bool default_value) const
      -> Result<bool>;
  [[nodiscard]] auto GetStringArray(std::string_view name) const
      -> Result<std::vector<std::string>>;

 private:
  [[nodiscard]] auto Find(std::string_view name) const -> const nlohmann::json*;

  const nlohmann::json& arguments_;
};

}  // namespace codenav::tools
