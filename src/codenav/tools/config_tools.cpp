#include "codenav/tools/config_tools.hpp"

#include "codenav/client/server_state.hpp"
#include "codenav/tools/schema.hpp"

namespace codenav::tools {

namespace {

using Presence = SchemaBuilder::Presence;

auto DescribeProject(const core::Project& project) -> nlohmann::json {
  auto languages = nlohmann::json::array();
  for (const auto& language : project.EnabledLanguages()) {
    auto server = project.FindServer(language);
    languages.push_back({
        {"name", language},
        {"state", server ? std::string(ToString(server->State()))
                         : std::string(ToString(client::ServerState::kNotStarted))},
    });
  }
  return {
      {"name", project.Name()},
      {"root", project.Root().String()},
      {"read_only", project.IsReadOnly()},
      {"languages", std::move(languages)},
  };
}

class ActivateProjectTool : public Tool {
 public:
  ActivateProjectTool()
      : Tool(ToolInfo{
            .name = "activate_project",
            .description =
                "Activates the project at the given directory. Any previously "
                "active project is deactivated and its language servers are "
                "stopped.",
            .input_schema =
                SchemaBuilder()
                    .String("project", "Path of the project root directory")
                    .Build(),
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    auto path = ToolArguments(args).GetString("project");
    if (!path) {
      co_return std::unexpected(path.error());
    }
    auto project = co_await context.orchestrator->ActivateProject(*path);
    if (!project) {
      co_return std::unexpected(project.error());
    }
    auto summary = DescribeProject(**project);
    summary["message"] =
        fmt::format("Activated project {}", (*project)->Name());
    co_return summary;
  }
};

class GetCurrentConfigTool : public Tool {
 public:
  GetCurrentConfigTool()
      : Tool(ToolInfo{
            .name = "get_current_config",
            .description =
                "Shows the active project, context and modes, the exposed "
                "tools, the configured languages and tool usage statistics.",
            .input_schema = SchemaBuilder().Build(),
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& /*args*/) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    const auto& orchestrator = *context.orchestrator;

    auto languages = nlohmann::json::array();
    for (const auto& language : orchestrator.Config().GetLanguages()) {
      languages.push_back({
          {"name", language.name},
          {"extensions", language.extensions},
          {"command", language.command},
      });
    }

    auto project = orchestrator.ActiveProject();
    nlohmann::json result{
        {"active_project",
         project ? DescribeProject(*project) : nlohmann::json(nullptr)},
        {"context", orchestrator.ActiveContext()},
        {"modes", orchestrator.ActiveModes()},
        {"languages", std::move(languages)},
    };
    if (context.session != nullptr) {
      result["exposed_tools"] = context.session->ExposedToolNames();
      result["tool_usage"] = context.session->UsageStats();
    }
    co_return result;
  }
};

class SwitchModesTool : public Tool {
 public:
  SwitchModesTool()
      : Tool(ToolInfo{
            .name = "switch_modes",
            .description =
                "Replaces the active modes, for example [\"planning\", "
                "\"one-shot\"]. The set of exposed tools is updated.",
            .input_schema = SchemaBuilder()
                                .StringArray("modes", "Names of the modes")
                                .Build(),
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    auto modes = ToolArguments(args).GetStringArray("modes");
    if (!modes) {
      co_return std::unexpected(modes.error());
    }
    if (context.session == nullptr) {
      co_return CodenavError::Unexpected(
          ErrorKind::kToolExecutionError, "mode switching is unavailable");
    }
    auto switched = co_await context.session->SwitchModes(*modes);
    if (!switched) {
      co_return std::unexpected(switched.error());
    }

    nlohmann::json result{
        {"modes", context.orchestrator->ActiveModes()},
        {"exposed_tools", context.session->ExposedToolNames()},
    };
    auto prompts = nlohmann::json::array();
    for (const auto& name : context.orchestrator->ActiveModes()) {
      if (const auto* mode = context.orchestrator->Config().FindMode(name);
          mode != nullptr && !mode->prompt.empty()) {
        prompts.push_back(mode->prompt);
      }
    }
    result["instructions"] = std::move(prompts);
    co_return result;
  }
};

class RestartLanguageServerTool : public Tool {
 public:
  RestartLanguageServerTool()
      : Tool(ToolInfo{
            .name = "restart_language_server",
            .description =
                "Restarts the language server of the given language, or all "
                "started servers of the active project. Use this when results "
                "look stale or a server stopped responding.",
            .input_schema = SchemaBuilder()
                                .String(
                                    "language", "Language to restart",
                                    Presence::kOptional)
                                .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    auto language = ToolArguments(args).GetOptionalString("language");
    if (!language) {
      co_return std::unexpected(language.error());
    }
    auto restarted =
        co_await context.orchestrator->RestartLanguageServer(*language);
    if (!restarted) {
      co_return std::unexpected(restarted.error());
    }
    co_return nlohmann::json{{"restarted", *restarted}};
  }
};

}  // namespace

auto MakeConfigTools() -> std::vector<std::shared_ptr<const Tool>> {
  return {
      std::make_shared<ActivateProjectTool>(),
      std::make_shared<GetCurrentConfigTool>(),
      std::make_shared<SwitchModesTool>(),
      std::make_shared<RestartLanguageServerTool>(),
  };
}

}  // namespace codenav::tools
