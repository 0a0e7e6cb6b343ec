#include "codenav/tools/schema.hpp"

#include <fmt/format.h>

namespace codenav::tools {

auto SchemaBuilder::Add(
    std::string name, nlohmann::json property, Presence presence)
    -> SchemaBuilder& {
  if (presence == Presence::kRequired) {
    required_.push_back(name);
  }
  properties_[std::move(name)] = std::move(property);
  return *this;
}

auto SchemaBuilder::String(
    std::string name, std::string description, Presence presence)
    -> SchemaBuilder& {
  return Add(
      std::move(name),
      {{"type", "string"}, {"description", std::move(description)}}, presence);
}

auto SchemaBuilder::Integer(
    std::string name, std::string description, Presence presence,
    std::optional<int> default_value) -> SchemaBuilder& {
  nlohmann::json property{
      {"type", "integer"}, {"description", std::move(description)}};
  if (default_value) {
    property["default"] = *default_value;
  }
  return Add(std::move(name), std::move(property), presence);
}

auto SchemaBuilder::Boolean(
    std::string name, std::string description,
    std::optional<bool> default_value) -> SchemaBuilder& {
  nlohmann::json property{
      {"type", "boolean"}, {"description", std::move(description)}};
  if (default_value) {
    property["default"] = *default_value;
  }
  return Add(std::move(name), std::move(property), Presence::kOptional);
}

auto SchemaBuilder::StringArray(
    std::string name, std::string description, Presence presence)
    -> SchemaBuilder& {
  return Add(
      std::move(name),
      {{"type", "array"},
       {"items", {{"type", "string"}}},
       {"description", std::move(description)}},
      presence);
}

auto SchemaBuilder::Build() const -> nlohmann::json {
  nlohmann::json schema{
      {"type", "object"},
      {"properties", properties_},
  };
  if (!required_.empty()) {
    schema["required"] = required_;
  }
  return schema;
}

ToolArguments::ToolArguments(const nlohmann::json& arguments)
    : arguments_(arguments) {
}

auto ToolArguments::Find(std::string_view name) const
    -> const nlohmann::json* {
  if (!arguments_.is_object()) {
    return nullptr;
  }
  auto it = arguments_.find(std::string(name));
  if (it == arguments_.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

auto ToolArguments::GetString(std::string_view name) const
    -> Result<std::string> {
  auto value = GetOptionalString(name);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (!*value) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("missing required argument '{}'", name));
  }
  return std::move(**value);
}

auto ToolArguments::GetOptionalString(std::string_view name) const
    -> Result<std::optional<std::string>> {
  const auto* value = Find(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("argument '{}' must be a string", name));
  }
  return value->get<std::string>();
}

auto ToolArguments::GetInt(std::string_view name, int default_value) const
    -> Result<int> {
  auto value = GetOptionalInt(name);
  if (!value) {
    return std::unexpected(value.error());
  }
  return value->value_or(default_value);
}

auto ToolArguments::GetOptionalInt(std::string_view name) const
    -> Result<std::optional<int>> {
  const auto* value = Find(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_number_integer()) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("argument '{}' must be an integer", name));
  }
  return value->get<int>();
}

auto ToolArguments::GetBool(std::string_view name, bool default_value) const
    -> Result<bool> {
  const auto* value = Find(name);
  if (value == nullptr) {
    return default_value;
  }
  if (!value->is_boolean()) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("argument '{}' must be a boolean", name));
  }
  return value->get<bool>();
}

auto ToolArguments::GetStringArray(std::string_view name) const
    -> Result<std::vector<std::string>> {
  const auto* value = Find(name);
  if (value == nullptr) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("missing required argument '{}'", name));
  }
  if (!value->is_array()) {
    return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("argument '{}' must be an array of strings", name));
  }
  std::vector<std::string> items;
  for (const auto& item : *value) {
    if (!item.is_string()) {
      return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format("argument '{}' must be an array of strings", name));
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

}  // namespace codenav::tools
