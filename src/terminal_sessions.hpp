#pragma once

#include "config.hpp"
#include "env_sanitizer.hpp"
#include "process.hpp"
#include "tool_error.hpp"
#include "workspace.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace toolserver {

enum class SessionStatus { kCreated, kRunning, kIdle, kDisposed };

const char* SessionStatusName(SessionStatus status);

struct SessionInfo {
  std::string id;
  std::string name;
  std::string cwd;
  std::string shell;
  SessionStatus status = SessionStatus::kCreated;
  bool active = false;
  int64_t created_at = 0;
  int pid = -1;

  nlohmann::json ToJson() const;
};

struct TerminalOptions {
  std::string workspace_root = "/workspace";
  SanitizationPolicy policy;
  Environment ambient;
  std::string shell = "/bin/sh";
  int command_timeout_ms = 30000;
  int kill_grace_ms = 2000;
  size_t buffer_limit = 256 * 1024;
  int settle_ms = 150;
  int default_wait_ms = 1500;
  // Empty disables the transcript.
  std::string transcript_path;
};

TerminalOptions TerminalOptionsFromConfig(const ServerConfig& cfg);

// Empty cwd means the policy default. Absolute paths are taken as given;
// relative ones resolve under the workspace root.
std::optional<std::string> ResolveCommandCwd(const TerminalOptions& opts,
                                             const std::optional<std::string>& cwd,
                                             ToolError* err);

// Owns every server-side shell session. Sessions live in an id-keyed arena;
// each one is spawned once and destroyed once, and ids are never handed out
// twice. Writes to one session are serialized in submission order.
class TerminalSessionManager {
 public:
  explicit TerminalSessionManager(TerminalOptions opts);
  ~TerminalSessionManager();
  TerminalSessionManager(const TerminalSessionManager&) = delete;
  TerminalSessionManager& operator=(const TerminalSessionManager&) = delete;

  std::optional<std::string> Create(const std::string& name,
                                    const std::optional<std::string>& cwd,
                                    const std::optional<std::string>& shell,
                                    ToolError* err);

  // Writes `text` and returns whatever the session printed until it went
  // quiet or wait_ms elapsed. wait_ms < 0 uses the default.
  std::optional<std::string> SendText(const std::string& id,
                                      const std::string& text,
                                      bool add_newline,
                                      int wait_ms,
                                      ToolError* err);
  std::optional<std::string> ReadOutput(const std::string& id, ToolError* err);

  std::vector<SessionInfo> List();
  std::optional<SessionInfo> GetActive();
  bool SetActive(const std::string& id, ToolError* err);

  bool Resize(const std::string& id, int cols, int rows, ToolError* err);
  bool Clear(const std::string& id, ToolError* err);

  // Idempotent for ids that were disposed before. Unknown ids fail.
  bool Dispose(const std::string& id, ToolError* err);
  void Shutdown();

  std::optional<CommandResult> ExecuteCommand(const std::string& command,
                                              const std::optional<std::string>& cwd,
                                              const std::optional<int>& timeout_ms,
                                              const std::optional<std::string>& shell,
                                              ToolError* err);

  size_t LiveCount();
  Environment SessionEnvironment() const;
  std::optional<std::string> ResolveCwd(const std::optional<std::string>& cwd, ToolError* err) const;
  const TerminalOptions& options() const { return opts_; }

 private:
  struct Session;

  std::shared_ptr<Session> Find(const std::string& id, ToolError* err);
  std::string AllocateIdLocked(const std::string& name);
  void ReapExited();
  void Destroy(const std::shared_ptr<Session>& s);
  static void ReaderLoop(Session* s, size_t buffer_limit);
  SessionInfo Describe(Session& s, const std::string& active) const;

  void TranscriptWrite(const std::string& text);

  TerminalOptions opts_;

  std::mutex mu_;
  std::map<std::string, std::shared_ptr<Session>> live_;
  std::set<std::string> used_ids_;
  std::string active_;

  std::mutex transcript_mu_;
  bool transcript_initialized_ = false;
};

}  // namespace toolserver
