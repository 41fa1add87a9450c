#include "tool_families.hpp"

#include <map>
#include <string>
#include <utility>

namespace toolserver {
namespace {

static const std::map<std::string, std::string> kSessionAliases = {{"terminalId", "sessionId"}};

static nlohmann::json SessionOnlySchema() {
  return {{"type", "object"}, {"properties", {{"sessionId", {{"type", "string"}}}}}, {"required", {"sessionId"}}};
}

static ToolSchema TerminalSchema(const char* name, const char* description, nlohmann::json parameters) {
  ToolSchema schema;
  schema.name = name;
  schema.description = description;
  schema.kind = ToolKind::kTerminal;
  schema.parameters = std::move(parameters);
  schema.parameter_aliases = kSessionAliases;
  return schema;
}

}  // namespace

void RegisterTerminalTools(ToolRegistry& registry, TerminalSessionManager& terminals) {
  TerminalSessionManager* tm = &terminals;

  {
    ToolSchema schema;
    schema.name = "terminal_execute";
    schema.description =
        "Run a one-shot shell command and return its stdout, stderr and exit code. "
        "timeout is in milliseconds.";
    schema.kind = ToolKind::kTerminal;
    schema.parameters = {{"type", "object"},
                         {"properties",
                          {{"command", {{"type", "string"}}},
                           {"cwd", {{"type", "string"}}},
                           {"timeout", {{"type", "number"}}},
                           {"shell", {{"type", "string"}}}}},
                         {"required", {"command"}}};
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto command = GetString(p, "command");
      auto r = tm->ExecuteCommand(command, GetOptionalString(p, "cwd"), GetOptionalInt(p, "timeout"),
                                  GetOptionalString(p, "shell"), &err);
      if (!r) return ToolResult::Failure(err);
      auto j = r->ToJson();
      j["command"] = command;
      if (r->timed_out) {
        return ToolResult::Failure(
            {ToolErrorKind::kTimeout, "command timed out after " + std::to_string(r->duration_ms) + " ms"}, j);
      }
      return ToolResult::Success(std::move(j));
    });
  }

  {
    auto schema = TerminalSchema("terminal_create",
                                 "Start a persistent shell session on a pseudo-terminal.",
                                 {{"type", "object"},
                                  {"properties",
                                   {{"name", {{"type", "string"}}},
                                    {"cwd", {{"type", "string"}}},
                                    {"shell", {{"type", "string"}}}}},
                                  {"required", {"name"}}});
    schema.parameter_aliases.clear();
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      auto id = tm->Create(GetString(p, "name"), GetOptionalString(p, "cwd"), GetOptionalString(p, "shell"), &err);
      if (!id) return ToolResult::Failure(err);
      nlohmann::json j = {{"sessionId", *id}, {"name", GetString(p, "name")}};
      for (const auto& info : tm->List()) {
        if (info.id == *id) {
          j = info.ToJson();
          j["sessionId"] = *id;
          break;
        }
      }
      return ToolResult::Success(std::move(j));
    });
  }

  {
    auto schema = TerminalSchema("terminal_send_text",
                                 "Write text to a terminal session and return the output it produced.",
                                 {{"type", "object"},
                                  {"properties",
                                   {{"sessionId", {{"type", "string"}}},
                                    {"text", {{"type", "string"}}},
                                    {"addNewline", {{"type", "boolean"}}},
                                    {"waitMs", {{"type", "integer"}}}}},
                                  {"required", {"sessionId", "text"}}});
    schema.parameter_aliases["addNewLine"] = "addNewline";
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      auto out = tm->SendText(id, GetString(p, "text"), GetBool(p, "addNewline", true),
                              GetOptionalInt(p, "waitMs").value_or(-1), &err);
      if (!out) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"output", *out}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_read_output",
                                 "Return and consume output a terminal session produced since the last read.",
                                 SessionOnlySchema());
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      auto out = tm->ReadOutput(id, &err);
      if (!out) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"output", *out}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_list", "List live terminal sessions.",
                                 {{"type", "object"}, {"properties", nlohmann::json::object()}});
    registry.RegisterTool(schema, [tm](const nlohmann::json&) {
      nlohmann::json arr = nlohmann::json::array();
      for (const auto& info : tm->List()) arr.push_back(info.ToJson());
      return ToolResult::Success({{"sessions", std::move(arr)}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_get_active", "Return the active terminal session, if any.",
                                 {{"type", "object"}, {"properties", nlohmann::json::object()}});
    registry.RegisterTool(schema, [tm](const nlohmann::json&) {
      auto info = tm->GetActive();
      return ToolResult::Success({{"active", info ? info->ToJson() : nlohmann::json(nullptr)}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_set_active", "Make a terminal session the active one.",
                                 SessionOnlySchema());
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      if (!tm->SetActive(id, &err)) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"active", true}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_resize", "Resize the pseudo-terminal of a session.",
                                 {{"type", "object"},
                                  {"properties",
                                   {{"sessionId", {{"type", "string"}}},
                                    {"cols", {{"type", "number"}}},
                                    {"rows", {{"type", "number"}}}}},
                                  {"required", {"sessionId", "cols", "rows"}}});
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      const int cols = GetOptionalInt(p, "cols").value_or(0);
      const int rows = GetOptionalInt(p, "rows").value_or(0);
      if (!tm->Resize(id, cols, rows, &err)) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"cols", cols}, {"rows", rows}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_clear", "Drop buffered output and clear the terminal screen.",
                                 SessionOnlySchema());
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      if (!tm->Clear(id, &err)) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"cleared", true}});
    });
  }

  {
    auto schema = TerminalSchema("terminal_dispose", "Terminate a terminal session and release it.",
                                 SessionOnlySchema());
    registry.RegisterTool(schema, [tm](const nlohmann::json& p) {
      ToolError err;
      const auto id = GetString(p, "sessionId");
      if (!tm->Dispose(id, &err)) return ToolResult::Failure(err);
      return ToolResult::Success({{"sessionId", id}, {"disposed", true}});
    });
  }
}

}  // namespace toolserver
