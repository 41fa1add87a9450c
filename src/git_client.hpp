#pragma once

#include "env_sanitizer.hpp"
#include "tool_error.hpp"
#include "workspace.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolserver {

struct GitStatus {
  std::string branch;
  std::string upstream;
  int ahead = 0;
  int behind = 0;
  std::vector<std::string> modified;
  std::vector<std::string> added;
  std::vector<std::string> deleted;
  std::vector<std::string> renamed;
  std::vector<std::string> untracked;

  nlohmann::json ToJson() const;
};

struct GitCommitInfo {
  std::string hash;
  std::string author;
  std::string date;
  std::string message;
};

// Parses `git status --porcelain=v1 -b` output.
GitStatus ParsePorcelainStatus(const std::string& text);

struct GitOptions {
  std::string workspace_root = "/workspace";
  Environment env;
  std::string git = "git";
  int timeout_ms = 30000;
  int kill_grace_ms = 2000;
};

// Stateless git runner. Each call execs git (no shell) in the workspace root
// or in a directory resolved under it.
class GitClient {
 public:
  explicit GitClient(GitOptions opts);

  // Returns stdout. A non-zero exit fails with git's stderr.
  std::optional<std::string> Run(const std::vector<std::string>& args,
                                 const std::optional<std::string>& path,
                                 ToolError* err) const;

  std::optional<GitStatus> Status(const std::optional<std::string>& path, ToolError* err) const;
  bool Add(const std::vector<std::string>& files, const std::optional<std::string>& path, ToolError* err) const;
  std::optional<std::string> Commit(const std::string& message, const std::optional<std::string>& path, ToolError* err) const;
  std::optional<std::string> Push(const std::string& remote, const std::string& branch, ToolError* err) const;
  std::optional<std::string> Pull(const std::string& remote, const std::string& branch, ToolError* err) const;
  bool Checkout(const std::string& ref, ToolError* err) const;
  bool CreateBranch(const std::string& name, bool checkout, ToolError* err) const;
  std::optional<std::vector<std::string>> ListBranches(bool include_remote, ToolError* err) const;
  std::optional<std::string> CurrentBranch(const std::optional<std::string>& path, ToolError* err) const;
  std::optional<std::string> Diff(const std::string& file, bool staged, ToolError* err) const;
  std::optional<std::vector<GitCommitInfo>> Log(int limit, ToolError* err) const;
  bool Reset(const std::string& mode, const std::string& commit, ToolError* err) const;
  std::optional<std::string> Stash(const std::string& action,
                                   const std::string& message,
                                   const std::optional<int>& index,
                                   ToolError* err) const;
  bool Init(const std::optional<std::string>& path, ToolError* err) const;
  bool Clone(const std::string& url, const std::optional<std::string>& path, const std::string& branch, ToolError* err) const;

 private:
  GitOptions opts_;
  Workspace workspace_;
};

}  // namespace toolserver
