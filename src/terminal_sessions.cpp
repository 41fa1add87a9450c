#include "terminal_sessions.hpp"

#include <poll.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace toolserver {
namespace {

static int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static std::string IsoTimestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm tm {};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  s.resize(max_chars);
  s += "...(truncated)";
  return s;
}

}  // namespace

struct TerminalSessionManager::Session {
  std::string id;
  std::string name;
  std::string cwd;
  std::string shell;
  int64_t created_at = 0;
  std::unique_ptr<ChildProcess> process;

  std::thread reader;
  std::atomic<bool> stop{false};
  std::atomic<bool> exited{false};

  // Held for the whole write-and-collect cycle of SendText.
  std::mutex write_mu;

  std::mutex buf_mu;
  std::condition_variable buf_cv;
  std::string buffer;
  size_t read_pos = 0;
  uint64_t total_bytes = 0;
  SessionStatus status = SessionStatus::kCreated;
};

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kCreated:
      return "created";
    case SessionStatus::kRunning:
      return "running";
    case SessionStatus::kIdle:
      return "idle";
    case SessionStatus::kDisposed:
      return "disposed";
  }
  return "unknown";
}

nlohmann::json SessionInfo::ToJson() const {
  return {{"id", id},
          {"name", name},
          {"cwd", cwd},
          {"shell", shell},
          {"status", SessionStatusName(status)},
          {"active", active},
          {"createdAt", created_at},
          {"pid", pid}};
}

TerminalOptions TerminalOptionsFromConfig(const ServerConfig& cfg) {
  TerminalOptions opts;
  opts.workspace_root = cfg.workspace_root;
  opts.policy = cfg.sanitization;
  opts.ambient = CurrentEnvironment();
  opts.shell = cfg.shell;
  opts.command_timeout_ms = cfg.command_timeout_ms;
  opts.kill_grace_ms = cfg.kill_grace_ms;
  opts.transcript_path = cfg.terminal_log_path;
  return opts;
}

TerminalSessionManager::TerminalSessionManager(TerminalOptions opts) : opts_(std::move(opts)) {}

TerminalSessionManager::~TerminalSessionManager() {
  Shutdown();
}

Environment TerminalSessionManager::SessionEnvironment() const {
  return Sanitize(opts_.ambient, opts_.policy);
}

std::optional<std::string> ResolveCommandCwd(const TerminalOptions& opts,
                                             const std::optional<std::string>& cwd,
                                             ToolError* err) {
  std::string dir = opts.policy.working_directory_default;
  if (dir.empty()) dir = opts.workspace_root;
  if (!cwd || cwd->empty()) return dir;
  if ((*cwd)[0] == '/') return *cwd;
  return Workspace(opts.workspace_root).Resolve(*cwd, err);
}

std::optional<std::string> TerminalSessionManager::ResolveCwd(const std::optional<std::string>& cwd,
                                                              ToolError* err) const {
  return ResolveCommandCwd(opts_, cwd, err);
}

std::string TerminalSessionManager::AllocateIdLocked(const std::string& name) {
  const std::string base = name.empty() ? "terminal" : name;
  if (!used_ids_.count(base)) return base;
  for (int n = 2;; n++) {
    std::string candidate = base + "-" + std::to_string(n);
    if (!used_ids_.count(candidate)) return candidate;
  }
}

void TerminalSessionManager::ReaderLoop(Session* s, size_t buffer_limit) {
  const int fd = s->process->output_fd();
  auto append = [&](const std::string& chunk) {
    if (chunk.empty()) return;
    std::lock_guard<std::mutex> lock(s->buf_mu);
    s->buffer += chunk;
    if (s->buffer.size() > buffer_limit) {
      const size_t drop = s->buffer.size() - buffer_limit;
      s->buffer.erase(0, drop);
      s->read_pos = s->read_pos > drop ? s->read_pos - drop : 0;
    }
    s->total_bytes += chunk.size();
    s->status = SessionStatus::kRunning;
    s->buf_cv.notify_all();
  };

  while (!s->stop.load()) {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int r = ::poll(&pfd, 1, 100);
    if (r < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (r == 0) {
      // A background job can keep the pty open after the shell is gone.
      if (s->process->TryReap(nullptr)) {
        std::string rest;
        ReadAvailable(fd, &rest);
        append(rest);
        break;
      }
      continue;
    }
    std::string chunk;
    const bool open = ReadAvailable(fd, &chunk);
    append(chunk);
    if (!open) break;
  }

  if (!s->stop.load()) {
    int code = -1;
    s->process->TryReap(&code);
    std::cout << "[terminal] exited id=" << s->id << " pid=" << s->process->pid() << " code=" << code << "\n";
  }
  {
    std::lock_guard<std::mutex> lock(s->buf_mu);
    s->exited = true;
  }
  s->buf_cv.notify_all();
}

void TerminalSessionManager::ReapExited() {
  std::vector<std::shared_ptr<Session>> dead;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = live_.begin(); it != live_.end();) {
      if (it->second->exited.load()) {
        if (active_ == it->first) active_.clear();
        dead.push_back(it->second);
        it = live_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& s : dead) Destroy(s);
}

void TerminalSessionManager::Destroy(const std::shared_ptr<Session>& s) {
  s->stop = true;
  const int code = s->process->Terminate(opts_.kill_grace_ms);
  if (s->reader.joinable()) s->reader.join();
  {
    std::lock_guard<std::mutex> lock(s->buf_mu);
    s->buffer.clear();
    s->buffer.shrink_to_fit();
    s->read_pos = 0;
    s->status = SessionStatus::kDisposed;
  }
  s->buf_cv.notify_all();
  std::cout << "[terminal] dispose id=" << s->id << " pid=" << s->process->pid() << " code=" << code << "\n";
}

std::shared_ptr<TerminalSessionManager::Session> TerminalSessionManager::Find(const std::string& id, ToolError* err) {
  ReapExited();
  std::lock_guard<std::mutex> lock(mu_);
  auto it = live_.find(id);
  if (it == live_.end()) {
    SetError(err, ToolErrorKind::kSessionNotFound, "terminal session not found: " + id);
    return nullptr;
  }
  return it->second;
}

SessionInfo TerminalSessionManager::Describe(Session& s, const std::string& active) const {
  SessionInfo info;
  info.id = s.id;
  info.name = s.name;
  info.cwd = s.cwd;
  info.shell = s.shell;
  info.created_at = s.created_at;
  info.active = (s.id == active);
  info.pid = static_cast<int>(s.process->pid());
  std::lock_guard<std::mutex> lock(s.buf_mu);
  info.status = s.status;
  return info;
}

std::optional<std::string> TerminalSessionManager::Create(const std::string& name,
                                                          const std::optional<std::string>& cwd,
                                                          const std::optional<std::string>& shell,
                                                          ToolError* err) {
  ReapExited();
  auto dir = ResolveCwd(cwd, err);
  if (!dir) return std::nullopt;

  SpawnOptions so;
  so.argv = {shell && !shell->empty() ? *shell : opts_.shell};
  so.cwd = *dir;
  so.env = SessionEnvironment();
  if (!so.env.count("TERM")) so.env["TERM"] = "xterm-256color";
  so.use_pty = true;

  auto child = ChildProcess::Spawn(so, err);
  if (!child) {
    std::cout << "[terminal] create failed name=" << name << " shell=" << so.argv[0] << " cwd=" << so.cwd << "\n";
    return std::nullopt;
  }

  auto s = std::make_shared<Session>();
  s->name = name;
  s->cwd = so.cwd;
  s->shell = so.argv[0];
  s->created_at = NowMillis();
  s->process = std::move(child);

  std::string id;
  {
    std::lock_guard<std::mutex> lock(mu_);
    id = AllocateIdLocked(name);
    used_ids_.insert(id);
  }
  s->id = id;
  // The reader must be running before the session becomes reachable.
  s->reader = std::thread(&TerminalSessionManager::ReaderLoop, s.get(), opts_.buffer_limit);
  {
    std::lock_guard<std::mutex> lock(mu_);
    live_[id] = s;
    if (active_.empty()) active_ = id;
  }
  std::cout << "[terminal] create id=" << id << " pid=" << s->process->pid() << " shell=" << s->shell
            << " cwd=" << s->cwd << "\n";
  return id;
}

std::optional<std::string> TerminalSessionManager::SendText(const std::string& id,
                                                            const std::string& text,
                                                            bool add_newline,
                                                            int wait_ms,
                                                            ToolError* err) {
  auto s = Find(id, err);
  if (!s) return std::nullopt;

  std::lock_guard<std::mutex> write_lock(s->write_mu);
  uint64_t before = 0;
  {
    std::lock_guard<std::mutex> lock(s->buf_mu);
    before = s->total_bytes;
  }
  if (!s->process->WriteAll(add_newline ? text + "\n" : text, err)) return std::nullopt;
  std::cout << "[terminal] send id=" << id << " text=" << TruncateForLog(text, 200) << "\n";

  const int wait = wait_ms < 0 ? opts_.default_wait_ms : wait_ms;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait);
  std::unique_lock<std::mutex> lock(s->buf_mu);
  while (!s->exited.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    const uint64_t seen = s->total_bytes;
    const auto until = std::min(deadline, now + std::chrono::milliseconds(opts_.settle_ms));
    s->buf_cv.wait_until(lock, until, [&] { return s->total_bytes != seen || s->exited.load(); });
    if (s->total_bytes == seen && seen != before) break;
  }
  std::string out = s->buffer.substr(std::min(s->read_pos, s->buffer.size()));
  s->read_pos = s->buffer.size();
  if (s->status != SessionStatus::kDisposed) s->status = SessionStatus::kIdle;
  return out;
}

std::optional<std::string> TerminalSessionManager::ReadOutput(const std::string& id, ToolError* err) {
  auto s = Find(id, err);
  if (!s) return std::nullopt;
  std::lock_guard<std::mutex> lock(s->buf_mu);
  std::string out = s->buffer.substr(std::min(s->read_pos, s->buffer.size()));
  s->read_pos = s->buffer.size();
  if (s->status != SessionStatus::kDisposed) s->status = SessionStatus::kIdle;
  return out;
}

std::vector<SessionInfo> TerminalSessionManager::List() {
  ReapExited();
  std::vector<std::shared_ptr<Session>> sessions;
  std::string active;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& kv : live_) sessions.push_back(kv.second);
    active = active_;
  }
  std::vector<SessionInfo> out;
  out.reserve(sessions.size());
  for (const auto& s : sessions) out.push_back(Describe(*s, active));
  return out;
}

std::optional<SessionInfo> TerminalSessionManager::GetActive() {
  ReapExited();
  std::shared_ptr<Session> s;
  std::string active;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (active_.empty()) return std::nullopt;
    auto it = live_.find(active_);
    if (it == live_.end()) return std::nullopt;
    s = it->second;
    active = active_;
  }
  return Describe(*s, active);
}

bool TerminalSessionManager::SetActive(const std::string& id, ToolError* err) {
  ReapExited();
  std::lock_guard<std::mutex> lock(mu_);
  if (!live_.count(id)) {
    SetError(err, ToolErrorKind::kSessionNotFound, "terminal session not found: " + id);
    return false;
  }
  active_ = id;
  std::cout << "[terminal] active id=" << id << "\n";
  return true;
}

bool TerminalSessionManager::Resize(const std::string& id, int cols, int rows, ToolError* err) {
  auto s = Find(id, err);
  if (!s) return false;
  if (cols <= 0 || rows <= 0 || cols > 0xffff || rows > 0xffff) {
    SetError(err, ToolErrorKind::kInvalidParameters, "cols and rows must be positive");
    return false;
  }
  if (!s->process->Resize(cols, rows)) {
    SetError(err, ToolErrorKind::kExecutionFailed, "failed to resize terminal " + id);
    return false;
  }
  std::cout << "[terminal] resize id=" << id << " cols=" << cols << " rows=" << rows << "\n";
  return true;
}

bool TerminalSessionManager::Clear(const std::string& id, ToolError* err) {
  auto s = Find(id, err);
  if (!s) return false;
  std::lock_guard<std::mutex> write_lock(s->write_mu);
  {
    std::lock_guard<std::mutex> lock(s->buf_mu);
    s->buffer.clear();
    s->read_pos = 0;
  }
  return s->process->WriteAll("clear\n", err);
}

bool TerminalSessionManager::Dispose(const std::string& id, ToolError* err) {
  std::shared_ptr<Session> s;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = live_.find(id);
    if (it == live_.end()) {
      if (used_ids_.count(id)) return true;
      SetError(err, ToolErrorKind::kSessionNotFound, "terminal session not found: " + id);
      return false;
    }
    s = it->second;
    live_.erase(it);
    if (active_ == id) active_.clear();
  }
  Destroy(s);
  return true;
}

void TerminalSessionManager::Shutdown() {
  std::vector<std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& kv : live_) all.push_back(std::move(kv.second));
    live_.clear();
    active_.clear();
  }
  for (const auto& s : all) Destroy(s);
  if (!all.empty()) std::cout << "[terminal] shutdown disposed=" << all.size() << "\n";
}

size_t TerminalSessionManager::LiveCount() {
  ReapExited();
  std::lock_guard<std::mutex> lock(mu_);
  return live_.size();
}

void TerminalSessionManager::TranscriptWrite(const std::string& text) {
  if (opts_.transcript_path.empty()) return;
  std::lock_guard<std::mutex> lock(transcript_mu_);
  if (!transcript_initialized_) {
    std::error_code ec;
    if (!std::filesystem::exists(opts_.transcript_path, ec)) {
      std::ofstream header(opts_.transcript_path, std::ios::app);
      if (header) {
        header << std::string(80, '=') << "\n"
               << "AGENT TERMINAL LOG\n"
               << "Every command executed by the agent is recorded here.\n"
               << "Log started: " << IsoTimestamp() << "\n"
               << std::string(80, '=') << "\n\n";
      }
    }
    transcript_initialized_ = true;
  }
  std::ofstream out(opts_.transcript_path, std::ios::app);
  if (!out) return;
  out << text;
}

std::optional<CommandResult> TerminalSessionManager::ExecuteCommand(const std::string& command,
                                                                    const std::optional<std::string>& cwd,
                                                                    const std::optional<int>& timeout_ms,
                                                                    const std::optional<std::string>& shell,
                                                                    ToolError* err) {
  auto dir = ResolveCwd(cwd, err);
  if (!dir) return std::nullopt;

  CommandOptions co;
  co.shell = shell && !shell->empty() ? *shell : opts_.shell;
  co.cwd = *dir;
  co.env = SessionEnvironment();
  co.timeout_ms = timeout_ms && *timeout_ms > 0 ? *timeout_ms : opts_.command_timeout_ms;
  co.kill_grace_ms = opts_.kill_grace_ms;
  co.on_output = [this](const std::string& chunk, bool) { TranscriptWrite(chunk); };

  std::cout << "[terminal] exec cwd=" << co.cwd << " timeout_ms=" << co.timeout_ms
            << " command=" << TruncateForLog(command, 500) << "\n";
  TranscriptWrite("\n" + std::string(80, '=') + "\n[" + IsoTimestamp() + "] Agent Terminal\nCommand: " + command +
                  "\nDirectory: " + co.cwd + "\n" + std::string(80, '=') + "\n\n");

  auto r = RunCommand(command, co, err);
  if (!r) {
    TranscriptWrite("\nFAILED TO START: " + (err ? err->message : std::string("spawn failed")) + "\n\n");
    std::cout << "[terminal] exec spawn_failed error=" << (err ? err->message : "-") << "\n";
    return std::nullopt;
  }

  std::string status;
  if (r->timed_out) {
    status = "TIMED OUT";
  } else if (r->exit_code == 0) {
    status = "SUCCESS";
  } else {
    status = "FAILED (exit code: " + std::to_string(r->exit_code) + ")";
  }
  TranscriptWrite("\n" + std::string(80, '-') + "\n" + status + " (" + std::to_string(r->duration_ms) + "ms)\n" +
                  std::string(80, '-') + "\n\n");
  std::cout << "[terminal] exec done exit_code=" << r->exit_code << " timed_out=" << (r->timed_out ? 1 : 0)
            << " duration_ms=" << r->duration_ms << " stdout_bytes=" << r->stdout_text.size()
            << " stderr_bytes=" << r->stderr_text.size() << "\n";
  return r;
}

}  // namespace toolserver
