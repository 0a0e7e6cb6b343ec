#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp {

inline constexpr std::string_view kProtocolVersion = "2024-11-05";

struct Implementation {
  std::string name;
  std::string version;
};

void to_json(nlohmann::json& j, const Implementation& i);
void from_json(const nlohmann::json& j, Implementation& i);

// initialize
struct InitializeParams {
  std::string protocolVersion;
  nlohmann::json capabilities = nlohmann::json::object();
  std::optional<Implementation> clientInfo;
};

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

struct InitializeResult {
  std::string protocolVersion{kProtocolVersion};
  Implementation serverInfo;
  bool toolsListChanged = true;
  std::optional<std::string> instructions;
};

void to_json(nlohmann::json& j, const InitializeResult& r);
void from_json(const nlohmann::json& j, InitializeResult& r);

// tools/list
struct ToolDescription {
  std::string name;
  std::string description;
  nlohmann::json inputSchema = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ToolDescription& t);
void from_json(const nlohmann::json& j, ToolDescription& t);

struct ListToolsParams {
  std::optional<std::string> cursor;
};

void to_json(nlohmann::json& j, const ListToolsParams& p);
void from_json(const nlohmann::json& j, ListToolsParams& p);

struct ListToolsResult {
  std::vector<ToolDescription> tools;
};

void to_json(nlohmann::json& j, const ListToolsResult& r);
void from_json(const nlohmann::json& j, ListToolsResult& r);

// tools/call
struct CallToolParams {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const CallToolParams& p);
void from_json(const nlohmann::json& j, CallToolParams& p);

struct TextContent {
  std::string text;
};

void to_json(nlohmann::json& j, const TextContent& c);
void from_json(const nlohmann::json& j, TextContent& c);

struct CallToolResult {
  std::vector<TextContent> content;
  bool isError = false;
  std::optional<nlohmann::json> structuredContent;

  static auto Text(std::string text) -> CallToolResult;
};

void to_json(nlohmann::json& j, const CallToolResult& r);
void from_json(const nlohmann::json& j, CallToolResult& r);

// ping and notifications carry no payload
struct EmptyParams {};

void to_json(nlohmann::json& j, const EmptyParams& p);
void from_json(const nlohmann::json& j, EmptyParams& p);

}  // namespace mcp
