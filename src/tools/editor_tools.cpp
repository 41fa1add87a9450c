#include "tool_families.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolserver {
namespace {

static nlohmann::json PositionSchema() {
  return {{"type", "object"},
          {"properties", {{"line", {{"type", "number"}}}, {"character", {{"type", "number"}}}}},
          {"required", {"line", "character"}}};
}

static nlohmann::json RangeSchema() {
  return {{"type", "object"},
          {"properties", {{"start", PositionSchema()}, {"end", PositionSchema()}}},
          {"required", {"start", "end"}}};
}

static nlohmann::json NoParams() {
  return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

static ToolSchema EditorSchema(const char* name, const char* description, nlohmann::json parameters) {
  ToolSchema schema;
  schema.name = name;
  schema.description = description;
  schema.kind = ToolKind::kEditor;
  schema.parameters = std::move(parameters);
  return schema;
}

// Text operations act on `path` when given, else on the editor's active file.
static std::string TargetPath(EditorBridge* ed, const nlohmann::json& p) {
  if (auto path = GetOptionalString(p, "path"); path && !path->empty()) return *path;
  ToolError err;
  auto active = ed->GetActiveFile(&err);
  if (!active) throw ToolException(err);
  if (active->empty()) throw ToolException(ToolErrorKind::kInvalidParameters, "no path given and no active editor");
  return *active;
}

static Position RequirePosition(const nlohmann::json& p, const char* key) {
  auto pos = p.contains(key) ? ParsePosition(p[key]) : std::nullopt;
  if (!pos) throw ToolException(ToolErrorKind::kInvalidParameters, std::string(key) + " must be {line, character}");
  return *pos;
}

static Range RequireRange(const nlohmann::json& p) {
  auto r = p.contains("range") ? ParseRange(p["range"]) : std::nullopt;
  if (!r) throw ToolException(ToolErrorKind::kInvalidParameters, "range must be {start, end}");
  return *r;
}

static ToolResult Done(bool ok, const ToolError& err, nlohmann::json result) {
  if (!ok) return ToolResult::Failure(err);
  return ToolResult::Success(std::move(result));
}

}  // namespace

void RegisterEditorTools(ToolRegistry& registry, EditorBridge& editor) {
  EditorBridge* ed = &editor;
  const nlohmann::json path_only = {
      {"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}, {"required", {"path"}}};
  const nlohmann::json optional_path = {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}};

  registry.RegisterTool(EditorSchema("editor_open_file", "Open a file in the editor.", path_only),
                        [ed](const nlohmann::json& p) {
                          ToolError err;
                          const auto path = GetString(p, "path");
                          return Done(ed->OpenFile(path, &err), err, {{"path", path}, {"opened", true}});
                        });

  registry.RegisterTool(EditorSchema("editor_close_file", "Close a file in the editor.", path_only),
                        [ed](const nlohmann::json& p) {
                          ToolError err;
                          const auto path = GetString(p, "path");
                          return Done(ed->CloseFile(path, &err), err, {{"path", path}, {"closed", true}});
                        });

  {
    auto schema = EditorSchema("editor_insert_text",
                               "Insert text at a position. Without a position the text becomes a new last line.",
                               {{"type", "object"},
                                {"properties",
                                 {{"path", {{"type", "string"}}},
                                  {"text", {{"type", "string"}}},
                                  {"position", PositionSchema()}}},
                                {"required", {"text"}}});
    registry.RegisterTool(schema, [ed](const nlohmann::json& p) {
      ToolError err;
      const auto path = TargetPath(ed, p);
      std::optional<Position> at;
      if (p.contains("position") && !p["position"].is_null()) at = RequirePosition(p, "position");
      return Done(ed->InsertText(path, GetString(p, "text"), at, &err), err, {{"path", path}, {"inserted", true}});
    });
  }

  {
    auto schema = EditorSchema("editor_replace_text", "Replace the text in a range.",
                               {{"type", "object"},
                                {"properties",
                                 {{"path", {{"type", "string"}}}, {"range", RangeSchema()}, {"text", {{"type", "string"}}}}},
                                {"required", {"range", "text"}}});
    registry.RegisterTool(schema, [ed](const nlohmann::json& p) {
      ToolError err;
      const auto path = TargetPath(ed, p);
      const auto range = RequireRange(p);
      return Done(ed->ReplaceText(path, range, GetString(p, "text"), &err), err, {{"path", path}, {"replaced", true}});
    });
  }

  {
    auto schema = EditorSchema("editor_delete_text", "Delete the text in a range.",
                               {{"type", "object"},
                                {"properties", {{"path", {{"type", "string"}}}, {"range", RangeSchema()}}},
                                {"required", {"range"}}});
    registry.RegisterTool(schema, [ed](const nlohmann::json& p) {
      ToolError err;
      const auto path = TargetPath(ed, p);
      const auto range = RequireRange(p);
      return Done(ed->DeleteText(path, range, &err), err, {{"path", path}, {"deleted", true}});
    });
  }

  registry.RegisterTool(EditorSchema("editor_format_document", "Normalize line endings of a document.", optional_path),
                        [ed](const nlohmann::json& p) {
                          ToolError err;
                          const auto path = TargetPath(ed, p);
                          return Done(ed->FormatDocument(path, &err), err, {{"path", path}, {"formatted", true}});
                        });

  registry.RegisterTool(EditorSchema("editor_organize_imports", "Organize imports of a document.", optional_path),
                        [ed](const nlohmann::json& p) {
                          ToolError err;
                          const auto path = TargetPath(ed, p);
                          return Done(ed->OrganizeImports(path, &err), err, {{"path", path}, {"organized", true}});
                        });

  registry.RegisterTool(
      EditorSchema("editor_get_active_file", "Return the file shown in the active editor.", NoParams()),
      [ed](const nlohmann::json&) {
        ToolError err;
        auto file = ed->GetActiveFile(&err);
        if (!file) return ToolResult::Failure(err);
        if (file->empty()) return ToolResult::Success({{"file", nullptr}});
        return ToolResult::Success({{"file", *file}, {"language", EditorBridge::LanguageForPath(*file)}});
      });

  registry.RegisterTool(EditorSchema("editor_get_open_files", "List files open in the editor.", NoParams()),
                        [ed](const nlohmann::json&) {
                          ToolError err;
                          auto files = ed->GetOpenFiles(&err);
                          if (!files) return ToolResult::Failure(err);
                          return ToolResult::Success({{"files", *files}});
                        });

  registry.RegisterTool(EditorSchema("editor_get_selection", "Return the selected text.", NoParams()),
                        [ed](const nlohmann::json&) {
                          ToolError err;
                          auto text = ed->GetSelection(&err);
                          if (!text) return ToolResult::Failure(err);
                          return ToolResult::Success({{"text", *text}});
                        });

  registry.RegisterTool(EditorSchema("editor_get_cursor_position", "Return the cursor position.", NoParams()),
                        [ed](const nlohmann::json&) {
                          ToolError err;
                          auto pos = ed->GetCursorPosition(&err);
                          if (!pos) return ToolResult::Failure(err);
                          return ToolResult::Success({{"position", ToJson(*pos)}});
                        });

  registry.RegisterTool(
      EditorSchema("editor_set_cursor_position", "Move the cursor.",
                   {{"type", "object"}, {"properties", {{"position", PositionSchema()}}}, {"required", {"position"}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        const auto pos = RequirePosition(p, "position");
        return Done(ed->SetCursorPosition(pos, &err), err, {{"position", ToJson(pos)}});
      });

  registry.RegisterTool(
      EditorSchema("editor_select_range", "Select a range in the active editor.",
                   {{"type", "object"}, {"properties", {{"range", RangeSchema()}}}, {"required", {"range"}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        const auto range = RequireRange(p);
        return Done(ed->SelectRange(range, &err), err, {{"start", ToJson(range.start)}, {"end", ToJson(range.end)}});
      });

  registry.RegisterTool(
      EditorSchema("editor_go_to_line", "Reveal a line (1-based) in the active editor.",
                   {{"type", "object"}, {"properties", {{"line", {{"type", "number"}}}}}, {"required", {"line"}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        const int line = GetOptionalInt(p, "line").value_or(1);
        return Done(ed->GoToLine(line, &err), err, {{"line", line}});
      });

  registry.RegisterTool(
      EditorSchema("editor_find_and_replace", "Find and replace text in the active editor.",
                   {{"type", "object"},
                    {"properties",
                     {{"find", {{"type", "string"}}},
                      {"replace", {{"type", "string"}}},
                      {"options",
                       {{"type", "object"},
                        {"properties",
                         {{"matchCase", {{"type", "boolean"}}},
                          {"matchWholeWord", {{"type", "boolean"}}},
                          {"useRegex", {{"type", "boolean"}}},
                          {"replaceAll", {{"type", "boolean"}}}}}}}}},
                    {"required", {"find", "replace"}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        const auto options = p.contains("options") && p["options"].is_object() ? p["options"] : nlohmann::json::object();
        return Done(ed->FindAndReplace(GetString(p, "find"), GetString(p, "replace"), options, &err), err,
                    {{"find", GetString(p, "find")}, {"replace", GetString(p, "replace")}});
      });

  registry.RegisterTool(
      EditorSchema("editor_show_message", "Show a notification in the editor.",
                   {{"type", "object"},
                    {"properties",
                     {{"message", {{"type", "string"}}},
                      {"type", {{"type", "string"}, {"enum", {"info", "warning", "error"}}}},
                      {"items", {{"type", "array"}, {"items", {{"type", "string"}}}}}}},
                    {"required", {"message"}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        std::vector<std::string> items;
        if (p.contains("items") && p["items"].is_array()) {
          for (const auto& item : p["items"]) items.push_back(item.get<std::string>());
        }
        auto selected = ed->ShowMessage(GetString(p, "message"), GetString(p, "type", "info"), items, &err);
        if (!selected) return ToolResult::Failure(err);
        return ToolResult::Success({{"shown", true}, {"selected", *selected}});
      });

  registry.RegisterTool(EditorSchema("editor_list_extensions", "List installed editor extensions.", NoParams()),
                        [ed](const nlohmann::json&) {
                          ToolError err;
                          auto ext = ed->ListExtensions(&err);
                          if (!ext) return ToolResult::Failure(err);
                          return ToolResult::Success({{"extensions", *ext}});
                        });

  registry.RegisterTool(
      EditorSchema("editor_get_configuration", "Read editor settings, optionally for one section.",
                   {{"type", "object"}, {"properties", {{"section", {{"type", "string"}}}}}}),
      [ed](const nlohmann::json& p) {
        ToolError err;
        auto cfg = ed->GetConfiguration(GetString(p, "section"), &err);
        if (!cfg) return ToolResult::Failure(err);
        return ToolResult::Success({{"section", GetString(p, "section")}, {"settings", *cfg}});
      });

  {
    auto schema = EditorSchema("editor_get_context",
                               "Collect editor version, extensions, settings and active editor in one call.",
                               NoParams());
    schema.resource_uris = {"editor://active"};
    registry.RegisterTool(schema, [ed](const nlohmann::json&) {
      ToolError err;
      if (!ed->EnsureConnected(&err)) return ToolResult::Failure(err);
      return ToolResult::Success(ed->GetContext());
    });
  }

  {
    auto schema = EditorSchema("editor_terminal_create", "Open a terminal inside the editor.",
                               {{"type", "object"},
                                {"properties", {{"name", {{"type", "string"}}}, {"cwd", {{"type", "string"}}}}},
                                {"required", {"name"}}});
    registry.RegisterTool(schema, [ed](const nlohmann::json& p) {
      ToolError err;
      auto id = ed->CreateTerminal(GetString(p, "name"), GetString(p, "cwd"), &err);
      if (!id) return ToolResult::Failure(err);
      return ToolResult::Success({{"terminalId", *id}, {"name", GetString(p, "name")}});
    });
  }

  {
    auto schema = EditorSchema("editor_terminal_send_text", "Send text to an editor terminal.",
                               {{"type", "object"},
                                {"properties",
                                 {{"terminalId", {{"type", "string"}}},
                                  {"text", {{"type", "string"}}},
                                  {"addNewline", {{"type", "boolean"}}}}},
                                {"required", {"terminalId", "text"}}});
    schema.parameter_aliases = {{"addNewLine", "addNewline"}};
    registry.RegisterTool(schema, [ed](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "terminalId");
      return Done(ed->SendText(id, GetString(p, "text"), GetBool(p, "addNewline", true), &err), err,
                  {{"terminalId", id}, {"sent", true}});
    });
  }

  registry.RegisterTool(EditorSchema("editor_terminal_get_active", "Return the editor's active terminal.", NoParams()),
                        [ed](const nlohmann::json&) {
                          ToolError err;
                          auto id = ed->GetActiveTerminal(&err);
                          if (!id) return ToolResult::Failure(err);
                          return ToolResult::Success(
                              {{"terminalId", id->empty() ? nlohmann::json(nullptr) : nlohmann::json(*id)}});
                        });

  {
    const nlohmann::json terminal_only = {
        {"type", "object"}, {"properties", {{"terminalId", {{"type", "string"}}}}}, {"required", {"terminalId"}}};
    registry.RegisterTool(EditorSchema("editor_terminal_show", "Focus an editor terminal.", terminal_only),
                          [ed](const nlohmann::json& p) {
                            ToolError err;
                            const auto id = GetString(p, "terminalId");
                            return Done(ed->ShowTerminal(id, &err), err, {{"terminalId", id}, {"shown", true}});
                          });
    registry.RegisterTool(EditorSchema("editor_terminal_dispose", "Close an editor terminal.", terminal_only),
                          [ed](const nlohmann::json& p) {
                            ToolError err;
                            const auto id = GetString(p, "terminalId");
                            return Done(ed->DisposeTerminal(id, &err), err, {{"terminalId", id}, {"disposed", true}});
                          });
  }
}

}  // namespace toolserver
