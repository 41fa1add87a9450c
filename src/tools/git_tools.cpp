#include "tool_families.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toolserver {
namespace {

static ToolSchema GitSchema(const char* name, const char* description, nlohmann::json parameters) {
  ToolSchema schema;
  schema.name = name;
  schema.description = description;
  schema.kind = ToolKind::kGit;
  schema.parameters = std::move(parameters);
  return schema;
}

static nlohmann::json Props(nlohmann::json properties, nlohmann::json required = nlohmann::json::array()) {
  nlohmann::json j = {{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty()) j["required"] = std::move(required);
  return j;
}

static ToolResult Text(const std::optional<std::string>& out, const ToolError& err, const char* key) {
  if (!out) return ToolResult::Failure(err);
  return ToolResult::Success({{key, *out}});
}

}  // namespace

void RegisterGitTools(ToolRegistry& registry, const GitClient& git) {
  const GitClient* g = &git;
  const nlohmann::json str = {{"type", "string"}};

  {
    auto schema = GitSchema("git_status", "Show branch, tracking state and changed files.", Props({{"path", str}}));
    schema.resource_uris = {"git://status"};
    registry.RegisterTool(schema, [g](const nlohmann::json& p) {
      ToolError err;
      auto st = g->Status(GetOptionalString(p, "path"), &err);
      if (!st) return ToolResult::Failure(err);
      return ToolResult::Success(st->ToJson());
    });
  }

  registry.RegisterTool(
      GitSchema("git_add", "Stage files.",
                Props({{"files", {{"type", "array"}, {"items", str}}}, {"path", str}}, {"files"})),
      [g](const nlohmann::json& p) {
        ToolError err;
        std::vector<std::string> files;
        for (const auto& f : p["files"]) files.push_back(f.get<std::string>());
        if (!g->Add(files, GetOptionalString(p, "path"), &err)) return ToolResult::Failure(err);
        return ToolResult::Success({{"added", files}});
      });

  registry.RegisterTool(GitSchema("git_commit", "Commit staged changes.",
                                  Props({{"message", str}, {"path", str}}, {"message"})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          return Text(g->Commit(GetString(p, "message"), GetOptionalString(p, "path"), &err), err,
                                      "output");
                        });

  registry.RegisterTool(GitSchema("git_push", "Push to a remote.", Props({{"remote", str}, {"branch", str}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          return Text(g->Push(GetString(p, "remote"), GetString(p, "branch"), &err), err, "output");
                        });

  registry.RegisterTool(GitSchema("git_pull", "Pull from a remote.", Props({{"remote", str}, {"branch", str}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          return Text(g->Pull(GetString(p, "remote"), GetString(p, "branch"), &err), err, "output");
                        });

  registry.RegisterTool(GitSchema("git_checkout", "Check out a branch or commit.", Props({{"branch", str}}, {"branch"})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          const auto branch = GetString(p, "branch");
                          if (!g->Checkout(branch, &err)) return ToolResult::Failure(err);
                          return ToolResult::Success({{"branch", branch}});
                        });

  registry.RegisterTool(
      GitSchema("git_create_branch", "Create a branch, optionally checking it out.",
                Props({{"name", str}, {"checkout", {{"type", "boolean"}}}}, {"name"})),
      [g](const nlohmann::json& p) {
        ToolError err;
        const auto name = GetString(p, "name");
        const bool checkout = GetBool(p, "checkout", false);
        if (!g->CreateBranch(name, checkout, &err)) return ToolResult::Failure(err);
        return ToolResult::Success({{"branch", name}, {"checkedOut", checkout}});
      });

  registry.RegisterTool(GitSchema("git_list_branches", "List local branches, or all branches with remote=true.",
                                  Props({{"remote", {{"type", "boolean"}}}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          auto branches = g->ListBranches(GetBool(p, "remote", false), &err);
                          if (!branches) return ToolResult::Failure(err);
                          return ToolResult::Success({{"branches", *branches}});
                        });

  registry.RegisterTool(GitSchema("git_current_branch", "Return the checked out branch.", Props({{"path", str}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          return Text(g->CurrentBranch(GetOptionalString(p, "path"), &err), err, "branch");
                        });

  registry.RegisterTool(GitSchema("git_diff", "Show unstaged changes, or staged ones with staged=true.",
                                  Props({{"file", str}, {"staged", {{"type", "boolean"}}}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          return Text(g->Diff(GetString(p, "file"), GetBool(p, "staged", false), &err), err, "diff");
                        });

  registry.RegisterTool(
      GitSchema("git_log", "Show recent commits.",
                Props({{"limit", {{"type", "number"}}}, {"oneline", {{"type", "boolean"}}}})),
      [g](const nlohmann::json& p) {
        ToolError err;
        auto commits = g->Log(GetOptionalInt(p, "limit").value_or(10), &err);
        if (!commits) return ToolResult::Failure(err);
        const bool oneline = GetBool(p, "oneline", false);
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& c : *commits) {
          if (oneline) {
            arr.push_back(c.hash.substr(0, 7) + " " + c.message);
          } else {
            arr.push_back({{"hash", c.hash}, {"author", c.author}, {"date", c.date}, {"message", c.message}});
          }
        }
        return ToolResult::Success({{"commits", std::move(arr)}});
      });

  registry.RegisterTool(
      GitSchema("git_reset", "Reset HEAD to a commit.",
                Props({{"mode", {{"type", "string"}, {"enum", {"soft", "mixed", "hard"}}}}, {"commit", str}})),
      [g](const nlohmann::json& p) {
        ToolError err;
        const auto mode = GetString(p, "mode", "mixed");
        const auto commit = GetString(p, "commit", "HEAD");
        if (!g->Reset(mode, commit, &err)) return ToolResult::Failure(err);
        return ToolResult::Success({{"mode", mode}, {"commit", commit}});
      });

  registry.RegisterTool(
      GitSchema("git_stash", "Stash changes or manage the stash.",
                Props({{"action", {{"type", "string"}, {"enum", {"push", "pop", "list", "apply", "drop"}}}},
                       {"message", str},
                       {"index", {{"type", "number"}}}})),
      [g](const nlohmann::json& p) {
        ToolError err;
        const auto action = GetString(p, "action", "push");
        auto out = g->Stash(action, GetString(p, "message"), GetOptionalInt(p, "index"), &err);
        if (!out) return ToolResult::Failure(err);
        return ToolResult::Success({{"action", action}, {"output", *out}});
      });

  registry.RegisterTool(GitSchema("git_init", "Initialize a repository.", Props({{"path", str}})),
                        [g](const nlohmann::json& p) {
                          ToolError err;
                          const auto path = GetOptionalString(p, "path");
                          if (!g->Init(path, &err)) return ToolResult::Failure(err);
                          return ToolResult::Success({{"path", path.value_or(".")}, {"initialized", true}});
                        });

  registry.RegisterTool(
      GitSchema("git_clone", "Clone a repository into the workspace.",
                Props({{"url", str}, {"path", str}, {"branch", str}}, {"url"})),
      [g](const nlohmann::json& p) {
        ToolError err;
        const auto url = GetString(p, "url");
        if (!g->Clone(url, GetOptionalString(p, "path"), GetString(p, "branch"), &err)) return ToolResult::Failure(err);
        return ToolResult::Success({{"url", url}, {"cloned", true}});
      });
}

}  // namespace toolserver
