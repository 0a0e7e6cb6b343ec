#include "mcp/protocol.hpp"

namespace mcp {

void to_json(nlohmann::json& j, const Implementation& i) {
  j = nlohmann::json{{"name", i.name}, {"version", i.version}};
}

void from_json(const nlohmann::json& j, Implementation& i) {
  j.at("name").get_to(i.name);
  i.version = j.value("version", std::string{});
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json{
      {"protocolVersion", p.protocolVersion},
      {"capabilities", p.capabilities}};
  if (p.clientInfo) {
    j["clientInfo"] = *p.clientInfo;
  }
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  p.protocolVersion = j.value("protocolVersion", std::string{});
  p.capabilities = j.value("capabilities", nlohmann::json::object());
  if (j.contains("clientInfo") && j.at("clientInfo").is_object()) {
    p.clientInfo = j.at("clientInfo").get<Implementation>();
  }
}

void to_json(nlohmann::json& j, const InitializeResult& r) {
  j = nlohmann::json{
      {"protocolVersion", r.protocolVersion},
      {"serverInfo", r.serverInfo},
      {"capabilities",
       {{"tools", {{"listChanged", r.toolsListChanged}}}}}};
  if (r.instructions) {
    j["instructions"] = *r.instructions;
  }
}

void from_json(const nlohmann::json& j, InitializeResult& r) {
  j.at("protocolVersion").get_to(r.protocolVersion);
  j.at("serverInfo").get_to(r.serverInfo);
  r.toolsListChanged = j.value(
      nlohmann::json::json_pointer("/capabilities/tools/listChanged"), false);
  if (j.contains("instructions")) {
    r.instructions = j.at("instructions").get<std::string>();
  }
}

void to_json(nlohmann::json& j, const ToolDescription& t) {
  j = nlohmann::json{
      {"name", t.name},
      {"description", t.description},
      {"inputSchema", t.inputSchema}};
}

void from_json(const nlohmann::json& j, ToolDescription& t) {
  j.at("name").get_to(t.name);
  t.description = j.value("description", std::string{});
  t.inputSchema = j.value("inputSchema", nlohmann::json::object());
}

void to_json(nlohmann::json& j, const ListToolsParams& p) {
  j = nlohmann::json::object();
  if (p.cursor) {
    j["cursor"] = *p.cursor;
  }
}

void from_json(const nlohmann::json& j, ListToolsParams& p) {
  if (j.is_object() && j.contains("cursor") && j.at("cursor").is_string()) {
    p.cursor = j.at("cursor").get<std::string>();
  }
}

void to_json(nlohmann::json& j, const ListToolsResult& r) {
  j = nlohmann::json{{"tools", r.tools}};
}

void from_json(const nlohmann::json& j, ListToolsResult& r) {
  j.at("tools").get_to(r.tools);
}

void to_json(nlohmann::json& j, const CallToolParams& p) {
  j = nlohmann::json{{"name", p.name}, {"arguments", p.arguments}};
}

void from_json(const nlohmann::json& j, CallToolParams& p) {
  j.at("name").get_to(p.name);
  if (j.contains("arguments") && !j.at("arguments").is_null()) {
    p.arguments = j.at("arguments");
  } else {
    p.arguments = nlohmann::json::object();
  }
}

void to_json(nlohmann::json& j, const TextContent& c) {
  j = nlohmann::json{{"type", "text"}, {"text", c.text}};
}

void from_json(const nlohmann::json& j, TextContent& c) {
  j.at("text").get_to(c.text);
}

auto CallToolResult::Text(std::string text) -> CallToolResult {
  return CallToolResult{
      .content = {TextContent{.text = std::move(text)}}, .isError = false};
}

void to_json(nlohmann::json& j, const CallToolResult& r) {
  j = nlohmann::json{{"content", r.content}, {"isError", r.isError}};
  if (r.structuredContent) {
    j["structuredContent"] = *r.structuredContent;
  }
}

void from_json(const nlohmann::json& j, CallToolResult& r) {
  j.at("content").get_to(r.content);
  r.isError = j.value("isError", false);
  if (j.contains("structuredContent")) {
    r.structuredContent = j.at("structuredContent");
  }
}

void to_json(nlohmann::json& j, const EmptyParams& /*p*/) {
  j = nlohmann::json::object();
}

void from_json(const nlohmann::json& /*j*/, EmptyParams& /*p*/) {
}

}  // namespace mcp
