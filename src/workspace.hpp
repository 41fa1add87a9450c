#pragma once

#include "tool_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolserver {

struct DirectoryEntry {
  std::string name;
  std::string type;  // "file" | "directory"
  std::string path;  // relative to the workspace root
  std::optional<uint64_t> size;
  int64_t modified = 0;
};

struct FileStats {
  uint64_t size = 0;
  int64_t modified = 0;
  int64_t changed = 0;
  bool is_directory = false;
  bool is_file = false;
  std::string permissions;
};

nlohmann::json ToJson(const DirectoryEntry& e);
nlohmann::json ToJson(const FileStats& s);

// File primitives confined to one root directory. Every path argument is
// resolved through Resolve(); anything that lands outside the root fails with
// kPathTraversalRejected before the filesystem is touched.
class Workspace {
 public:
  explicit Workspace(std::string root);

  const std::string& root() const { return root_; }

  // Creates the root if it does not exist.
  bool EnsureRoot(ToolError* err) const;

  // Accepts relative paths, absolute paths inside the root and file:// URIs.
  std::optional<std::string> Resolve(const std::string& path, ToolError* err) const;
  std::string Relative(const std::string& absolute) const;

  std::optional<std::string> ReadFile(const std::string& path, ToolError* err) const;
  // Parent directories are created as needed.
  bool WriteFile(const std::string& path, const std::string& content, ToolError* err) const;
  // Fails if the path already exists.
  bool CreateFile(const std::string& path, const std::string& content, ToolError* err) const;
  bool DeleteFile(const std::string& path, ToolError* err) const;
  bool RenameFile(const std::string& from, const std::string& to, ToolError* err) const;
  bool CopyFile(const std::string& source, const std::string& destination, ToolError* err) const;
  bool CreateDirectory(const std::string& path, ToolError* err) const;
  bool DeleteDirectory(const std::string& path, bool recursive, ToolError* err) const;

  std::optional<std::vector<DirectoryEntry>> ListDirectory(const std::string& path, ToolError* err) const;
  std::optional<std::vector<std::string>> ListFiles(const std::string& path, ToolError* err) const;
  std::optional<std::vector<std::string>> ListDirectories(const std::string& path, ToolError* err) const;

  std::optional<bool> Exists(const std::string& path, ToolError* err) const;
  std::optional<FileStats> GetStats(const std::string& path, ToolError* err) const;

 private:
  std::string root_;
};

}  // namespace toolserver
