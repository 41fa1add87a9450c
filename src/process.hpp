#pragma once

#include "env_sanitizer.hpp"
#include "tool_error.hpp"

#include <nlohmann/json.hpp>

#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolserver {

struct SpawnOptions {
  std::vector<std::string> argv;
  std::string cwd;
  Environment env;
  bool use_pty = false;
  int cols = 80;
  int rows = 24;
};

// Owns one forked child and its descriptors. The child leads its own process
// group so signals reach everything it started.
class ChildProcess {
 public:
  static std::unique_ptr<ChildProcess> Spawn(const SpawnOptions& opts, ToolError* err);

  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }
  bool is_pty() const { return pty_; }

  // With a pty, output_fd() carries both streams and error_fd() is -1.
  int output_fd() const { return out_fd_; }
  int error_fd() const { return err_fd_; }

  bool WriteAll(const std::string& data, ToolError* err);
  bool Resize(int cols, int rows);

  // Non-blocking reap. True once the child has exited.
  bool TryReap(int* exit_code);

  // SIGTERM to the group, SIGKILL after grace_ms, then reap. Idempotent.
  int Terminate(int grace_ms);

  // Sends EOF to a pipe-backed child. No-op for a pty.
  void CloseInput();

 private:
  ChildProcess() = default;
  bool ReapLocked(bool block, int* exit_code);

  pid_t pid_ = -1;
  bool pty_ = false;
  int in_fd_ = -1;
  int out_fd_ = -1;
  int err_fd_ = -1;

  std::mutex reap_mu_;
  bool reaped_ = false;
  int exit_code_ = -1;
};

struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  bool timed_out = false;
  int64_t duration_ms = 0;
  bool fallback = false;

  nlohmann::json ToJson() const;
};

struct CommandOptions {
  std::string shell = "/bin/sh";
  std::string cwd;
  Environment env;
  int timeout_ms = 30000;
  int kill_grace_ms = 2000;
  std::function<void(const std::string& chunk, bool is_stderr)> on_output;
};

// Runs `shell -c command`. A timeout still yields a result (timed_out=true,
// partial output); only spawn problems return nullopt.
std::optional<CommandResult> RunCommand(const std::string& command, const CommandOptions& opts, ToolError* err);
std::optional<CommandResult> RunArgv(const std::vector<std::string>& argv, const CommandOptions& opts, ToolError* err);

// Reads whatever is available without blocking. False on EOF or hard error.
bool ReadAvailable(int fd, std::string* out);

std::optional<std::string> ResolveExecutable(const std::string& name, const Environment& env);

}  // namespace toolserver
