#include "codenav/tools/symbol_tools.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "codenav/symbols/name_path.hpp"
#include "codenav/symbols/symbol_model.hpp"
#include "codenav/symbols/text_edit.hpp"
#include "codenav/tools/schema.hpp"
#include "codenav/utils/text_utils.hpp"

namespace codenav::tools {

namespace {

using Presence = SchemaBuilder::Presence;
using client::LanguageServerProcess;
using symbols::NamePathPattern;
using symbols::UnifiedSymbol;

constexpr std::string_view kNamePathHelp =
    "Name path of the symbol, for example 'MyClass/my_method'. A leading '/' "
    "anchors the path at the top level of the file";

// A symbol resolved to exactly one match, with the tree that owns it
struct SymbolHit {
  std::shared_ptr<core::Project> project;
  CanonicalPath path;
  std::string language;
  symbols::SymbolCache::TreePtr tree;
  const UnifiedSymbol* symbol = nullptr;
};

auto TrimmedLine(std::string_view content, int line) -> std::string {
  auto lines = utils::SplitLines(content);
  if (line < 0 || static_cast<std::size_t>(line) >= lines.size()) {
    return {};
  }
  auto text = lines[line];
  auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t\r");
  return std::string(text.substr(first, last - first + 1));
}

// Last line that belongs to the symbol. Some servers end a range at column 0
// of the following line.
auto LastLineOf(const UnifiedSymbol& symbol) -> int {
  const auto& range = symbol.range;
  if (range.end.character == 0 && range.end.line > range.start.line) {
    return range.end.line - 1;
  }
  return range.end.line;
}

auto ResolveFile(const ToolContext& context, const std::string& relative_path)
    -> Result<std::pair<std::shared_ptr<core::Project>, CanonicalPath>> {
  auto project = context.orchestrator->RequireProject();
  if (!project) {
    return std::unexpected(project.error());
  }
  auto path = (*project)->ResolvePath(relative_path);
  if (!path) {
    return std::unexpected(path.error());
  }
  return std::make_pair(*project, std::move(*path));
}

auto FindUniqueSymbol(
    const ToolContext& context, std::string name_path,
    std::string relative_path) -> asio::awaitable<Result<SymbolHit>> {
  auto file = ResolveFile(context, relative_path);
  if (!file) {
    co_return std::unexpected(file.error());
  }
  auto& [project, path] = *file;
  auto language = project->LanguageFor(path);
  if (!language) {
    co_return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("no language server handles '{}'", relative_path));
  }

  auto tree = co_await context.orchestrator->GetSymbols(path);
  if (!tree) {
    co_return std::unexpected(tree.error());
  }

  NamePathPattern pattern(name_path);
  auto matches = symbols::FindMatchingSymbols(**tree, pattern);
  if (matches.empty()) {
    co_return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format("no symbol '{}' in '{}'", name_path, relative_path));
  }
  if (matches.size() > 1) {
    std::vector<std::string> candidates;
    for (const auto* match : matches) {
      candidates.push_back(
          fmt::format("{} (line {})", match->name_path, match->range.start.line));
    }
    co_return CodenavError::Unexpected(
        ErrorKind::kInvalidArguments,
        fmt::format(
            "'{}' is ambiguous in '{}': {}", name_path, relative_path,
            fmt::join(candidates, ", ")));
  }

  co_return SymbolHit{
      .project = project,
      .path = path,
      .language = *language,
      .tree = *tree,
      .symbol = matches.front(),
  };
}

auto EncodingOf(const SymbolHit& hit) -> lsp::PositionEncodingKind {
  auto server = hit.project->FindServer(hit.language);
  return server ? server->PositionEncoding()
                : lsp::PositionEncodingKind::kUtf16;
}

auto WriteAndNotify(
    const ToolContext& context, core::Project& project,
    const CanonicalPath& path, std::string content)
    -> asio::awaitable<Result<void>> {
  if (auto written = project.WriteFile(path, content); !written) {
    co_return std::unexpected(written.error());
  }
  co_await context.orchestrator->NotifyFileWritten(path, std::move(content));
  co_return Ok();
}

// Describes a location for tool output, with the enclosing symbol when the
// file belongs to the project
auto DescribeLocation(
    const ToolContext& context, const core::Project& project,
    const lsp::Location& location) -> asio::awaitable<nlohmann::json> {
  auto path = CanonicalPath::FromUri(location.uri);
  nlohmann::json j{
      {"line", location.range.start.line},
      {"column", location.range.start.character},
  };
  if (project.IsExcluded(path)) {
    j["path"] = path.String();
    co_return j;
  }
  j["relative_path"] = project.RelativePath(path);

  auto content = project.ReadFile(path);
  if (!content) {
    co_return j;
  }
  j["snippet"] = TrimmedLine(*content, location.range.start.line);

  if (project.LanguageFor(path)) {
    auto tree = co_await context.orchestrator->GetSymbols(path);
    if (!tree) {
      context.logger->debug(
          "No symbols for {}: {}", path, tree.error().Message());
    } else if (const auto* enclosing = symbols::FindEnclosingSymbol(
                   **tree, location.range.start)) {
      j["enclosing_symbol"] = {
          {"name_path", enclosing->name_path},
          {"kind", std::string(lsp::SymbolKindName(enclosing->kind))},
      };
    }
  }
  co_return j;
}

class GetSymbolsOverviewTool : public Tool {
 public:
  GetSymbolsOverviewTool()
      : Tool(ToolInfo{
            .name = "get_symbols_overview",
            .description =
                "Lists the top-level symbols of a file (name path, kind and "
                "line range). For a directory, lists them for every source "
                "file below it.",
            .input_schema =
                SchemaBuilder()
                    .String(
                        "relative_path",
                        "File or directory, relative to the project root")
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    auto relative_path = ToolArguments(args).GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto target = ResolveFile(context, *relative_path);
    if (!target) {
      co_return std::unexpected(target.error());
    }
    auto& [project, path] = *target;

    auto files = project->EnumerateSourceFiles(path);
    if (!files) {
      co_return std::unexpected(files.error());
    }

    auto overview = nlohmann::json::object();
    for (const auto& file : *files) {
      auto tree = co_await context.orchestrator->GetSymbols(file);
      if (!tree) {
        co_return std::unexpected(tree.error());
      }
      auto entries = nlohmann::json::array();
      for (const auto& symbol : **tree) {
        entries.push_back(symbols::SymbolToJson(symbol, 0, false));
      }
      overview[project->RelativePath(file)] = std::move(entries);
    }
    co_return overview;
  }
};

class FindSymbolTool : public Tool {
 public:
  FindSymbolTool()
      : Tool(ToolInfo{
            .name = "find_symbol",
            .description =
                "Finds symbols by name path, optionally restricted to a file "
                "or directory. Returns their locations, optionally with "
                "children and source bodies.",
            .input_schema =
                SchemaBuilder()
                    .String("name_path", std::string(kNamePathHelp))
                    .String(
                        "relative_path",
                        "Restrict the search to this file or directory",
                        Presence::kOptional)
                    .Integer(
                        "depth", "Levels of children to include",
                        Presence::kOptional, 0)
                    .Boolean(
                        "include_body", "Include the source text of matches",
                        false)
                    .Boolean(
                        "substring_matching",
                        "Match the last name path segment as a substring",
                        false)
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto name_path = arguments.GetString("name_path");
    auto relative_path = arguments.GetOptionalString("relative_path");
    auto depth = arguments.GetInt("depth", 0);
    auto include_body = arguments.GetBool("include_body", false);
    auto substring = arguments.GetBool("substring_matching", false);
    if (!name_path) {
      co_return std::unexpected(name_path.error());
    }
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    if (!depth) {
      co_return std::unexpected(depth.error());
    }
    if (!include_body) {
      co_return std::unexpected(include_body.error());
    }
    if (!substring) {
      co_return std::unexpected(substring.error());
    }

    auto target = ResolveFile(context, relative_path->value_or(""));
    if (!target) {
      co_return std::unexpected(target.error());
    }
    auto& [project, path] = *target;
    auto files = project->EnumerateSourceFiles(path);
    if (!files) {
      co_return std::unexpected(files.error());
    }

    NamePathPattern pattern(*name_path);
    if (pattern.Empty()) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments, "name_path is empty");
    }

    auto matches = nlohmann::json::array();
    for (const auto& file : *files) {
      auto tree = co_await context.orchestrator->GetSymbols(file);
      if (!tree) {
        co_return std::unexpected(tree.error());
      }
      for (const auto* symbol :
           symbols::FindMatchingSymbols(**tree, pattern, *substring)) {
        auto entry = symbols::SymbolToJson(*symbol, *depth, *include_body);
        entry["relative_path"] = project->RelativePath(file);
        matches.push_back(std::move(entry));
      }
    }
    co_return matches;
  }
};

class FindReferencingSymbolsTool : public Tool {
 public:
  FindReferencingSymbolsTool()
      : Tool(ToolInfo{
            .name = "find_referencing_symbols",
            .description =
                "Finds references to a symbol. Each reference is reported "
                "with its enclosing symbol and the referencing line.",
            .input_schema =
                SchemaBuilder()
                    .String("name_path", std::string(kNamePathHelp))
                    .String(
                        "relative_path",
                        "File containing the symbol, relative to the project "
                        "root")
                    .Build(),
            .requires_active_project = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto name_path = arguments.GetString("name_path");
    if (!name_path) {
      co_return std::unexpected(name_path.error());
    }
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }

    auto hit = co_await FindUniqueSymbol(context, *name_path, *relative_path);
    if (!hit) {
      co_return std::unexpected(hit.error());
    }
    auto content = hit->project->ReadFile(hit->path);
    if (!content) {
      co_return std::unexpected(content.error());
    }

    const auto position = hit->symbol->selection_range.start;
    auto locations =
        co_await context.orchestrator->WithLanguageServer<
            std::vector<lsp::Location>>(
            hit->language,
            [path = hit->path, content = *content,
             position](LanguageServerProcess& server)
                -> asio::awaitable<
                    LanguageServerProcess::Result<std::vector<lsp::Location>>> {
              auto synced = co_await server.SyncDocument(path, content);
              if (!synced) {
                co_return std::unexpected(synced.error());
              }
              co_return co_await server.FindReferences(path, position, false);
            });
    if (!locations) {
      co_return std::unexpected(locations.error());
    }

    auto references = nlohmann::json::array();
    for (const auto& location : *locations) {
      references.push_back(
          co_await DescribeLocation(context, *hit->project, location));
    }
    co_return references;
  }
};

class FindDefinitionTool : public Tool {
 public:
  FindDefinitionTool()
      : Tool(ToolInfo{
            .name = "find_definition",
            .description =
                "Finds the definition of the symbol at a position. Line and "
                "column are zero-based; the column counts characters.",
            .input_schema =
                SchemaBuilder()
                    .String(
                        "relative_path",
                        "File relative to the project root")
                    .Integer("line", "Zero-based line", Presence::kRequired)
                    .Integer(
                        "column", "Zero-based character column",
                        Presence::kRequired)
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
    auto line = arguments.GetOptionalInt("line");
    auto column = arguments.GetOptionalInt("column");
    if (!line || !*line || !column || !*column || **line < 0 || **column < 0) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          "line and column must be non-negative integers");
    }

    auto file = ResolveFile(context, *relative_path);
    if (!file) {
      co_return std::unexpected(file.error());
    }
    auto& [project, path] = *file;
    auto language = project->LanguageFor(path);
    if (!language) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format("no language server handles '{}'", *relative_path));
    }
    auto content = project->ReadFile(path);
    if (!content) {
      co_return std::unexpected(content.error());
    }

    const auto lines = utils::SplitLines(*content);
    if (static_cast<std::size_t>(**line) >= lines.size()) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments,
          fmt::format("'{}' has only {} lines", *relative_path, lines.size()));
    }
    const std::string line_text(lines[**line]);
    const auto byte_offset = utils::ColumnToByteOffset(
        line_text, **column, lsp::PositionEncodingKind::kUtf32);

    auto locations =
        co_await context.orchestrator->WithLanguageServer<
            std::vector<lsp::Location>>(
            *language,
            [path, content = *content, line_text, line_number = **line,
             byte_offset](LanguageServerProcess& server)
                -> asio::awaitable<
                    LanguageServerProcess::Result<std::vector<lsp::Location>>> {
              auto synced = co_await server.SyncDocument(path, content);
              if (!synced) {
                co_return std::unexpected(synced.error());
              }
              lsp::Position position{
                  .line = line_number,
                  .character = utils::ByteOffsetToColumn(
                      line_text, byte_offset, server.PositionEncoding()),
              };
              co_return co_await server.FindDefinition(path, position);
            });
    if (!locations) {
      co_return std::unexpected(locations.error());
    }

    auto definitions = nlohmann::json::array();
    for (const auto& location : *locations) {
      definitions.push_back(
          co_await DescribeLocation(context, *project, location));
    }
    co_return definitions;
  }
};

// Shared argument handling of the three body-editing tools
class SymbolEditTool : public Tool {
 public:
  using Tool::Tool;

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto name_path = arguments.GetString("name_path");
    if (!name_path) {
      co_return std::unexpected(name_path.error());
    }
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto body = arguments.GetString("body");
    if (!body) {
      co_return std::unexpected(body.error());
    }

    auto hit = co_await FindUniqueSymbol(context, *name_path, *relative_path);
    if (!hit) {
      co_return std::unexpected(hit.error());
    }
    auto content = hit->project->ReadFile(hit->path);
    if (!content) {
      co_return std::unexpected(content.error());
    }

    auto updated = Edit(*content, *hit->symbol, *body, EncodingOf(*hit));
    auto written = co_await WriteAndNotify(
        context, *hit->project, hit->path, std::move(updated));
    if (!written) {
      co_return std::unexpected(written.error());
    }
    co_return fmt::format(
        "OK: {} {} in {}", Verb(), hit->symbol->name_path, *relative_path);
  }

 protected:
  virtual auto Edit(
      std::string_view content, const UnifiedSymbol& symbol,
      std::string_view body, lsp::PositionEncodingKind encoding) const
      -> std::string = 0;
  [[nodiscard]] virtual auto Verb() const -> std::string_view = 0;

  static auto Schema(std::string body_description) -> nlohmann::json {
    return SchemaBuilder()
        .String("name_path", std::string(kNamePathHelp))
        .String(
            "relative_path",
            "File containing the symbol, relative to the project root")
        .String("body", std::move(body_description))
        .Build();
  }
};

class ReplaceSymbolBodyTool : public SymbolEditTool {
 public:
  ReplaceSymbolBodyTool()
      : SymbolEditTool(ToolInfo{
            .name = "replace_symbol_body",
            .description =
                "Replaces the full definition of a symbol, signature "
                "included, with new source text.",
            .input_schema = Schema("New source text of the symbol"),
            .requires_active_project = true,
            .mutates_state = true,
        }) {
  }

 protected:
  auto Edit(
      std::string_view content, const UnifiedSymbol& symbol,
      std::string_view body, lsp::PositionEncodingKind encoding) const
      -> std::string override {
    return symbols::ReplaceRange(content, symbol.range, body, encoding);
  }
  [[nodiscard]] auto Verb() const -> std::string_view override {
    return "replaced body of";
  }
};

class InsertAfterSymbolTool : public SymbolEditTool {
 public:
  InsertAfterSymbolTool()
      : SymbolEditTool(ToolInfo{
            .name = "insert_after_symbol",
            .description =
                "Inserts source text on the lines following the end of a "
                "symbol's definition.",
            .input_schema = Schema("Source text to insert"),
            .requires_active_project = true,
            .mutates_state = true,
        }) {
  }

 protected:
  auto Edit(
      std::string_view content, const UnifiedSymbol& symbol,
      std::string_view body, lsp::PositionEncodingKind /*encoding*/) const
      -> std::string override {
    return symbols::InsertAfterLine(content, LastLineOf(symbol), body);
  }
  [[nodiscard]] auto Verb() const -> std::string_view override {
    return "inserted after";
  }
};

class InsertBeforeSymbolTool : public SymbolEditTool {
 public:
  InsertBeforeSymbolTool()
      : SymbolEditTool(ToolInfo{
            .name = "insert_before_symbol",
            .description =
                "Inserts source text on the lines preceding the start of a "
                "symbol's definition.",
            .input_schema = Schema("Source text to insert"),
            .requires_active_project = true,
            .mutates_state = true,
        }) {
  }

 protected:
  auto Edit(
      std::string_view content, const UnifiedSymbol& symbol,
      std::string_view body, lsp::PositionEncodingKind /*encoding*/) const
      -> std::string override {
    return symbols::InsertBeforeLine(content, symbol.range.start.line, body);
  }
  [[nodiscard]] auto Verb() const -> std::string_view override {
    return "inserted before";
  }
};

class RenameSymbolTool : public Tool {
 public:
  RenameSymbolTool()
      : Tool(ToolInfo{
            .name = "rename_symbol",
            .description =
                "Renames a symbol and every reference to it across the "
                "project using the language server.",
            .input_schema =
                SchemaBuilder()
                    .String("name_path", std::string(kNamePathHelp))
                    .String(
                        "relative_path",
                        "File containing the symbol, relative to the project "
                        "root")
                    .String("new_name", "New name of the symbol")
                    .Build(),
            .requires_active_project = true,
            .mutates_state = true,
        }) {
  }

  auto Apply(const ToolContext& context, const nlohmann::json& args) const
      -> asio::awaitable<Result<nlohmann::json>> override {
    ToolArguments arguments(args);
    auto name_path = arguments.GetString("name_path");
    if (!name_path) {
      co_return std::unexpected(name_path.error());
    }
    auto relative_path = arguments.GetString("relative_path");
    if (!relative_path) {
      co_return std::unexpected(relative_path.error());
    }
    auto new_name = arguments.GetString("new_name");
    if (!new_name) {
      co_return std::unexpected(new_name.error());
    }
    if (new_name->empty()) {
      co_return CodenavError::Unexpected(
          ErrorKind::kInvalidArguments, "new_name is empty");
    }

    auto hit = co_await FindUniqueSymbol(context, *name_path, *relative_path);
    if (!hit) {
      co_return std::unexpected(hit.error());
    }
    auto content = hit->project->ReadFile(hit->path);
    if (!content) {
      co_return std::unexpected(content.error());
    }

    struct RenameEdit {
      lsp::WorkspaceEdit edit;
      lsp::PositionEncodingKind encoding;
    };
    const auto position = hit->symbol->selection_range.start;
    auto rename = co_await context.orchestrator->WithLanguageServer<RenameEdit>(
        hit->language,
        [path = hit->path, content = *content, position,
         new_name = *new_name](LanguageServerProcess& server)
            -> asio::awaitable<LanguageServerProcess::Result<RenameEdit>> {
          auto synced = co_await server.SyncDocument(path, content);
          if (!synced) {
            co_return std::unexpected(synced.error());
          }
          auto edit = co_await server.Rename(path, position, new_name);
          if (!edit) {
            co_return std::unexpected(edit.error());
          }
          co_return RenameEdit{
              .edit = std::move(*edit),
              .encoding = server.PositionEncoding(),
          };
        });
    if (!rename) {
      co_return std::unexpected(rename.error());
    }

    auto written = co_await context.orchestrator->ApplyWorkspaceEdit(
        rename->edit, rename->encoding);
    if (!written) {
      co_return std::unexpected(written.error());
    }

    std::vector<std::string> changed;
    for (const auto& file : *written) {
      changed.push_back(hit->project->RelativePath(file.path));
    }
    std::ranges::sort(changed);
    co_return nlohmann::json{
        {"renamed", hit->symbol->name_path},
        {"new_name", *new_name},
        {"changed_files", changed},
    };
  }
};

}  // namespace

auto MakeSymbolTools() -> std::vector<std::shared_ptr<const Tool>> {
  return {
      std::make_shared<GetSymbolsOverviewTool>(),
      std::make_shared<FindSymbolTool>(),
      std::make_shared<FindReferencingSymbolsTool>(),
      std::make_shared<FindDefinitionTool>(),
      std::make_shared<ReplaceSymbolBodyTool>(),
      std::make_shared<InsertAfterSymbolTool>(),
      std::make_shared<InsertBeforeSymbolTool>(),
      std::make_shared<RenameSymbolTool>(),
  };
}

}  // namespace codenav::tools
