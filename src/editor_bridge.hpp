#pragma once

#include "config.hpp"
#include "tool_error.hpp"
#include "workspace.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolserver {

struct Position {
  int line = 0;
  int character = 0;
};

struct Range {
  Position start;
  Position end;
};

std::optional<Position> ParsePosition(const nlohmann::json& j);
std::optional<Range> ParseRange(const nlohmann::json& j);
nlohmann::json ToJson(const Position& p);

// Remote control of one editor host over HTTP. File primitives go straight to
// the shared workspace; everything else is forwarded to the editor's command
// endpoint after a lazy liveness probe.
class EditorBridge {
 public:
  EditorBridge(EditorConfig cfg, std::string workspace_root);

  // Forces a probe of GET / on the editor. Any status below 500 counts as
  // reachable. Also creates the workspace root when missing.
  bool Connect(ToolError* err);
  // Reuses the last probe while it is fresh; concurrent callers share it.
  bool EnsureConnected(ToolError* err);
  bool IsConnected() const;
  const EditorConfig& config() const { return cfg_; }
  const Workspace& workspace() const { return workspace_; }

  std::optional<nlohmann::json> ExecuteCommand(const std::string& command,
                                               const nlohmann::json& args,
                                               ToolError* err);

  bool CreateFile(const std::string& path, const std::string& content, ToolError* err);
  std::optional<std::string> ReadFile(const std::string& path, ToolError* err);
  bool WriteFile(const std::string& path, const std::string& content, ToolError* err);
  bool DeleteFile(const std::string& path, ToolError* err);
  std::optional<bool> FileExists(const std::string& path, ToolError* err);
  std::optional<std::vector<std::string>> ListFiles(const std::string& path, ToolError* err);
  std::optional<std::vector<std::string>> ListDirectories(const std::string& path, ToolError* err);
  bool CreateDirectory(const std::string& path, ToolError* err);
  bool DeleteDirectory(const std::string& path, bool recursive, ToolError* err);

  // The editor's own terminal widget. Unrelated to TerminalSessionManager.
  std::optional<std::string> CreateTerminal(const std::string& name, const std::string& cwd, ToolError* err);
  bool SendText(const std::string& terminal_id, const std::string& text, bool add_newline, ToolError* err);
  std::optional<std::string> GetActiveTerminal(ToolError* err);
  bool ShowTerminal(const std::string& terminal_id, ToolError* err);
  bool DisposeTerminal(const std::string& terminal_id, ToolError* err);

  bool OpenFile(const std::string& path, ToolError* err);
  bool CloseFile(const std::string& path, ToolError* err);
  // Without a position the text is appended as a new last line.
  bool InsertText(const std::string& path, const std::string& text, const std::optional<Position>& at, ToolError* err);
  bool ReplaceText(const std::string& path, const Range& range, const std::string& text, ToolError* err);
  bool DeleteText(const std::string& path, const Range& range, ToolError* err);
  bool FormatDocument(const std::string& path, ToolError* err);
  bool OrganizeImports(const std::string& path, ToolError* err);

  std::optional<std::string> GetActiveFile(ToolError* err);
  std::optional<nlohmann::json> GetOpenFiles(ToolError* err);
  std::optional<std::string> GetSelection(ToolError* err);
  std::optional<Position> GetCursorPosition(ToolError* err);
  bool SetCursorPosition(const Position& p, ToolError* err);
  bool SelectRange(const Range& r, ToolError* err);
  bool GoToLine(int line, ToolError* err);
  bool FindAndReplace(const std::string& find, const std::string& replace, const nlohmann::json& options, ToolError* err);
  std::optional<nlohmann::json> ShowMessage(const std::string& message,
                                            const std::string& type,
                                            const std::vector<std::string>& items,
                                            ToolError* err);
  std::optional<nlohmann::json> ListExtensions(ToolError* err);
  std::optional<nlohmann::json> GetConfiguration(const std::string& section, ToolError* err);

  // {version, extensions, settings, activeEditor}; pieces whose call failed
  // are left out.
  nlohmann::json GetContext();

  static std::string LanguageForPath(const std::string& path);

 private:
  bool ProbeLocked(ToolError* err);
  void MarkDown();

  EditorConfig cfg_;
  Workspace workspace_;

  mutable std::mutex probe_mu_;
  bool probed_ = false;
  bool connected_ = false;
  std::chrono::steady_clock::time_point last_probe_;
};

}  // namespace toolserver
