#include "codenav/tools/file_tools.hpp"

#include <regex>
#include <string>

#include <fmt/format.h>

#include "codenav/tools/schema.hpp"
#include "codenav/utils/glob.hpp"
#include "codenav/utils/text_utils.hpp"

namespace codenav::tools {

namespace {

using Presence = SchemaBuilder::Presence;

constexpr int kDefaultMaxAnswerChars = 200'000;
constexpr std::size_t kBinaryProbeSize = 8192;

auto LooksBinary(std::string_view content) -> bool {
  return content.substr(0, kBinaryProbeSize).find('\0') !=
         std::string_view::npos;
}

auto ResolveInProject(const ToolContext& context, const std::string& path)
    -> Result<std::pair<std::shared_ptr<core::Project>, CanonicalPath>> {
  auto project = context.orchestrator->RequireProject();
  if (!project) {
    return std::unexpected(project.error());
  }
  auto resolved = (*project)->ResolvePath(path);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  return std::make_pair(*project, std::move(*resolved));
}

class ReadFileTool : public Tool {
 public:
  ReadFileTool()
      : Tool(ToolInfo{
            .name = "read_file",
            .description =
                "Reads a project file, optionally only the zero-based line "
                "range [start_line, end_line].",
            .input_schema =
                SchemaBuilder()
                    .String(
                        "relative_path", "File relative to the project root")
                    .Integer("start_line", "First line to read (zero-based)")
                    .Integer(
                        "end_line", "Last line to read, inclusive (zero-based)")
                    .Integer(
                        "max_answer_chars",
                        "Fail instead of returning more characters than this",
                        Presence::kOptional, kDefaultMaxAnswerChars)
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto start_line = arguments.GetOptionalInt("start_line");
    if (!start_line) {
      co_return std::unexpected(start_line.error());
    }
    auto end_line = arguments.GetOptionalInt("end_line");
    if (!end_line) {
      co_return std::unexpected(end_line.error());
    }
    auto max_chars =
        arguments.GetInt("max_answer_chars", kDefaultMaxAnswerChars);
    if (!max_chars) {
      co_return std::unexpected(max_chars.error());
    }

    auto file = ResolveInProject(context, *relative_path);
    if (!file) {
      co_return std::unexpected(file.error());
    }
    auto& [project, path] = *file;
    if (!project->IsWithinSizeLimit(path)) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format(
              "'{}' is larger than the project's MaxFileSize of {} bytes",
              *relative_path, project->Config().GetMaxFileSize()));
    }
    auto content = project->ReadFile(path);
    if (!content) {
      co_return std::unexpected(content.error());
    }

    std::string text;
    if (!*start_line && !*end_line) {
      text = std::move(*content);
    } else {
      const auto lines = utils::SplitLines(*content);
      const int first = start_line->value_or(0);
      const int last =
          end_line->value_or(static_cast<int>(lines.size()) - 1);
      if (first < 0 || last < first) {
        co_return CodenavError::Unexpected(
            ErrorKind::kInvalidArguments,
            fmt::format("invalid line range [{}, {}]", first, last));
      }
      for (int i = first; i <= last && i < static_cast<int>(lines.size());
           ++i) {
        text.append(lines[i]);
        text += '\n';
      }
    }

    if (text.size() > static_cast<std::size_t>(*max_chars)) {
      co_return CodenavError::Unexpected(
          ErrorKind::kToolExecutionError,
          fmt::format(
              "answer of {} characters exceeds max_answer_chars ({}); read a "
              "smaller line range",
              text.size(), *max_chars));
    }
    co_return text;
  }
};

class WriteFileTool : public Tool {
 public:
  WriteFileTool()
      : Tool(ToolInfo{
            .name = "write_file",
            .description =
                "Creates or overwrites a project file with the given content.",
            .input_schema =
                SchemaBuilder()
                    .String(
                        "relative_path", "File relative to the project root")
                    .String("content", "Complete new content of the file")
                    .Build(),
            .requires_active_project = true,
            .mutates_state = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto content = arguments.GetString("content");
    if (!content) {
      co_return std::unexpected(content.error());
    }

    auto file = ResolveInProject(context, *relative_path);
    if (!file) {
      co_return std::unexpected(file.error());
    }
    auto& [project, path] = *file;
    if (auto written = project->WriteFile(path, *content); !written) {
      co_return std::unexpected(written.error());
    }
    co_await context.orchestrator->NotifyFileWritten(path, *content);
    co_return fmt::format(
        "OK: wrote {} bytes to {}", content->size(), *relative_path);
  }
};

class ListDirectoryTool : public Tool {
 public:
  ListDirectoryTool()
      : Tool(ToolInfo{
            .name = "list_directory",
            .description =
                "Lists the directories and files of a project directory. "
                "Excluded paths are omitted.",
            .input_schema =
                SchemaBuilder()
                    .String(
                        "relative_path",
                        "Directory relative to the project root, '.' for the "
                        "root")
                    .Boolean("recursive", "Include all subdirectories", false)
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto recursive = arguments.GetBool("recursive", false);
    if (!recursive) {
      co_return std::unexpected(recursive.error());
    }

    auto dir = ResolveInProject(context, *relative_path);
    if (!dir) {
      co_return std::unexpected(dir.error());
    }
    auto listing = dir->first->ListDirectory(dir->second, *recursive);
    if (!listing) {
      co_return std::unexpected(listing.error());
    }
    co_return nlohmann::json{
        {"directories", listing->directories},
        {"files", listing->files},
    };
  }
};

class SearchFilesTool : public Tool {
 public:
  SearchFilesTool()
      : Tool(ToolInfo{
            .name = "search_files",
            .description =
                "Searches project files for lines matching a regular "
                "expression. Returns zero-based line numbers.",
            .input_schema =
                SchemaBuilder()
                    .String("pattern", "ECMAScript regular expression")
                    .String(
                        "relative_path",
                        "Restrict the search to this file or directory",
                        Presence::kOptional)
                    .String(
                        "file_pattern",
                        "Glob on file names, for example '*.py'",
                        Presence::kOptional)
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto pattern = arguments.GetString("pattern");
    if (!pattern) {
      co_return std::unexpected(pattern.error());
    }
    auto relative_path = arguments.GetOptionalString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto file_pattern = arguments.GetOptionalString("file_pattern");
    if (!file_pattern) {
      co_return std::unexpected(file_pattern.error());
    }

    std::regex regex;
    try {
      regex = std::regex(*pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format("invalid pattern '{}': {}", *pattern, e.what()));
    }
    std::optional<utils::GlobPattern> name_filter;
    if (*file_pattern) {
      name_filter.emplace(**file_pattern, utils::GlobPattern::Syntax::kName);
    }

    auto target = ResolveInProject(context, relative_path->value_or("."));
    if (!target) {
      co_return std::unexpected(target.error());
    }
    auto& [project, path] = *target;

    std::vector<CanonicalPath> files;
    std::error_code ec;
    if (std::filesystem::is_regular_file(path.Path(), ec)) {
      files.push_back(path);
    } else {
      auto listing = project->ListDirectory(path, true);
      if (!listing) {
        co_return std::unexpected(listing.error());
      }
      for (const auto& file : listing->files) {
        files.push_back(project->Root() / file);
      }
    }

    auto matches = nlohmann::json::array();
    for (const auto& file : files) {
      if (name_filter &&
          !name_filter->Matches(file.Path().filename().string())) {
        continue;
      }
      if (!project->IsWithinSizeLimit(file)) {
        continue;
      }
      auto content = project->ReadFile(file);
      if (!content || LooksBinary(*content)) {
        continue;
      }
      const auto lines = utils::SplitLines(*content);
      for (std::size_t i = 0; i < lines.size(); ++i) {
        if (std::regex_search(lines[i].begin(), lines[i].end(), regex)) {
          matches.push_back({
              {"relative_path", project->RelativePath(file)},
              {"line", i},
              {"text", std::string(lines[i])},
          });
        }
      }
    }
    co_return matches;
  }
};

}  // namespace

auto MakeFileTools() -> std::vector<std::shared_ptr<const Tool>> {
  return {
      std::make_shared<ReadFileTool>(),
      std::make_shared<WriteFileTool>(),
      std::make_shared<ListDirectoryTool>(),
      std::make_shared<SearchFilesTool>(),
  };
}

}  // namespace codenav::tools
