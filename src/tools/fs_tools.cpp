#include "tool_families.hpp"

#include <string>
#include <utility>
#include <vector>

namespace toolserver {
namespace {

static nlohmann::json PathOnlySchema() {
  return {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}, {"required", {"path"}}};
}

static ToolResult Fail(const ToolError& e) {
  return ToolResult::Failure(e);
}

}  // namespace

void RegisterFilesystemTools(ToolRegistry& registry, const Workspace& workspace) {
  const Workspace* ws = &workspace;
  const std::vector<std::string> kResources = {"workspace://files"};

  {
    ToolSchema schema;
    schema.name = "fs_read_file";
    schema.description = "Read the contents of a file in the workspace.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      auto content = ws->ReadFile(GetString(p, "path"), &err);
      if (!content) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"content", *content}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_write_file";
    schema.description = "Write content to a file, creating it and its parent directories if needed.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = {{"type", "object"},
                         {"properties", {{"path", {{"type", "string"}}}, {"content", {{"type", "string"}}}}},
                         {"required", {"path", "content"}}};
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      const auto content = GetString(p, "content");
      if (!ws->WriteFile(GetString(p, "path"), content, &err)) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"bytesWritten", content.size()}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_create_file";
    schema.description = "Create a new file. Fails if the file already exists.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = {{"type", "object"},
                         {"properties", {{"path", {{"type", "string"}}}, {"content", {{"type", "string"}}}}},
                         {"required", {"path"}}};
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->CreateFile(GetString(p, "path"), GetString(p, "content"), &err)) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"created", true}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_delete_file";
    schema.description = "Delete a file.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->DeleteFile(GetString(p, "path"), &err)) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"deleted", true}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_rename_file";
    schema.description = "Rename or move a file within the workspace.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = {{"type", "object"},
                         {"properties", {{"oldPath", {{"type", "string"}}}, {"newPath", {{"type", "string"}}}}},
                         {"required", {"oldPath", "newPath"}}};
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->RenameFile(GetString(p, "oldPath"), GetString(p, "newPath"), &err)) return Fail(err);
      return ToolResult::Success({{"oldPath", GetString(p, "oldPath")}, {"newPath", GetString(p, "newPath")}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_copy_file";
    schema.description = "Copy a file, overwriting the destination.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = {{"type", "object"},
                         {"properties", {{"source", {{"type", "string"}}}, {"destination", {{"type", "string"}}}}},
                         {"required", {"source", "destination"}}};
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->CopyFile(GetString(p, "source"), GetString(p, "destination"), &err)) return Fail(err);
      return ToolResult::Success(
          {{"source", GetString(p, "source")}, {"destination", GetString(p, "destination")}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_create_directory";
    schema.description = "Create a directory and any missing parents.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->CreateDirectory(GetString(p, "path"), &err)) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"created", true}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_delete_directory";
    schema.description = "Delete a directory. Non-empty directories require recursive=true.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = {{"type", "object"},
                         {"properties", {{"path", {{"type", "string"}}}, {"recursive", {{"type", "boolean"}}}}},
                         {"required", {"path"}}};
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      if (!ws->DeleteDirectory(GetString(p, "path"), GetBool(p, "recursive", false), &err)) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"deleted", true}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_list_directory";
    schema.description = "List the entries of a directory.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    schema.resource_uris = kResources;
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      auto entries = ws->ListDirectory(GetString(p, "path"), &err);
      if (!entries) return Fail(err);
      nlohmann::json arr = nlohmann::json::array();
      for (const auto& e : *entries) arr.push_back(ToJson(e));
      return ToolResult::Success({{"path", GetString(p, "path")}, {"entries", std::move(arr)}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_exists";
    schema.description = "Check whether a path exists.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      auto exists = ws->Exists(GetString(p, "path"), &err);
      if (!exists) return Fail(err);
      return ToolResult::Success({{"path", GetString(p, "path")}, {"exists", *exists}});
    });
  }

  {
    ToolSchema schema;
    schema.name = "fs_get_stats";
    schema.description = "Get size, timestamps and permissions of a path.";
    schema.kind = ToolKind::kFilesystem;
    schema.parameters = PathOnlySchema();
    registry.RegisterTool(schema, [ws](const nlohmann::json& p) {
      ToolError err;
      auto stats = ws->GetStats(GetString(p, "path"), &err);
      if (!stats) return Fail(err);
      auto j = ToJson(*stats);
      j["path"] = GetString(p, "path");
      return ToolResult::Success(std::move(j));
    });
  }
}

}  // namespace toolserver
