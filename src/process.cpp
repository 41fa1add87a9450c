#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

namespace toolserver {
namespace {

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

static void SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void SetCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  if (flags >= 0) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

static std::string ErrnoText(int e) {
  return std::strerror(e);
}

static int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

bool ReadAvailable(int fd, std::string* out) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      if (out) out->append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    // EIO: the pty slave side is gone.
    return false;
  }
}

std::optional<std::string> ResolveExecutable(const std::string& name, const Environment& env) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0) return name;
    return std::nullopt;
  }
  std::string path = "/usr/local/bin:/usr/bin:/bin";
  if (auto it = env.find("PATH"); it != env.end() && !it->second.empty()) path = it->second;
  size_t start = 0;
  while (start <= path.size()) {
    size_t colon = path.find(':', start);
    if (colon == std::string::npos) colon = path.size();
    std::string dir = path.substr(start, colon - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    start = colon + 1;
  }
  return std::nullopt;
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const SpawnOptions& opts, ToolError* err) {
  if (opts.argv.empty() || opts.argv[0].empty()) {
    SetError(err, ToolErrorKind::kSpawnFailed, "empty command");
    return nullptr;
  }
  std::error_code ec;
  if (opts.cwd.empty() || !std::filesystem::is_directory(opts.cwd, ec)) {
    SetError(err, ToolErrorKind::kSpawnFailed, "working directory does not exist: " + opts.cwd);
    return nullptr;
  }
  auto exe = ResolveExecutable(opts.argv[0], opts.env);
  if (!exe) {
    SetError(err, ToolErrorKind::kSpawnFailed, "executable not found: " + opts.argv[0]);
    return nullptr;
  }

  // Everything the child needs is built before fork.
  const std::string exe_path = *exe;
  const std::string cwd = opts.cwd;
  std::vector<char*> argv;
  argv.reserve(opts.argv.size() + 1);
  for (const auto& a : opts.argv) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  const auto env_strings = ToEnvp(opts.env);
  std::vector<char*> envp;
  envp.reserve(env_strings.size() + 1);
  for (const auto& e : env_strings) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);

  int status_pipe[2] = {-1, -1};
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    SetError(err, ToolErrorKind::kSpawnFailed, "pipe failed: " + ErrnoText(errno));
    return nullptr;
  }

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pty_ = opts.use_pty;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int master = -1;
  pid_t pid = -1;

  if (opts.use_pty) {
    struct winsize ws {};
    ws.ws_col = static_cast<unsigned short>(opts.cols > 0 ? opts.cols : 80);
    ws.ws_row = static_cast<unsigned short>(opts.rows > 0 ? opts.rows : 24);
    pid = ::forkpty(&master, nullptr, nullptr, &ws);
  } else {
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
      const int e = errno;
      for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                      &status_pipe[0], &status_pipe[1]}) {
        CloseFd(fd);
      }
      SetError(err, ToolErrorKind::kSpawnFailed, "pipe failed: " + ErrnoText(e));
      return nullptr;
    }
    pid = ::fork();
  }

  if (pid < 0) {
    const int e = errno;
    for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0],
                    &status_pipe[1]}) {
      CloseFd(fd);
    }
    SetError(err, ToolErrorKind::kSpawnFailed, "fork failed: " + ErrnoText(e));
    return nullptr;
  }

  if (pid == 0) {
    if (!opts.use_pty) {
      ::setpgid(0, 0);
      ::dup2(in_pipe[0], STDIN_FILENO);
      ::dup2(out_pipe[1], STDOUT_FILENO);
      ::dup2(err_pipe[1], STDERR_FILENO);
    }
    ::signal(SIGPIPE, SIG_DFL);
    if (::chdir(cwd.c_str()) != 0) {
      int e = errno;
      (void)!::write(status_pipe[1], &e, sizeof(e));
      ::_exit(127);
    }
    ::execve(exe_path.c_str(), argv.data(), envp.data());
    int e = errno;
    (void)!::write(status_pipe[1], &e, sizeof(e));
    ::_exit(127);
  }

  child->pid_ = pid;
  CloseFd(&status_pipe[1]);
  if (opts.use_pty) {
    SetCloseOnExec(master);
    SetNonBlocking(master);
    child->out_fd_ = master;
  } else {
    ::setpgid(pid, pid);
    CloseFd(&in_pipe[0]);
    CloseFd(&out_pipe[1]);
    CloseFd(&err_pipe[1]);
    child->in_fd_ = in_pipe[1];
    child->out_fd_ = out_pipe[0];
    child->err_fd_ = err_pipe[0];
    SetNonBlocking(child->out_fd_);
    SetNonBlocking(child->err_fd_);
  }

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);
  if (n > 0) {
    {
      std::lock_guard<std::mutex> lock(child->reap_mu_);
      child->ReapLocked(true, nullptr);
    }
    SetError(err, ToolErrorKind::kSpawnFailed, "failed to start " + opts.argv[0] + ": " + ErrnoText(child_errno));
    return nullptr;
  }
  return child;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0) Terminate(0);
  CloseFd(&in_fd_);
  CloseFd(&out_fd_);
  CloseFd(&err_fd_);
}

bool ChildProcess::WriteAll(const std::string& data, ToolError* err) {
  const int fd = pty_ ? out_fd_ : in_fd_;
  if (fd < 0) {
    SetError(err, ToolErrorKind::kExecutionFailed, "process input is closed");
    return false;
  }
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd {};
      pfd.fd = fd;
      pfd.events = POLLOUT;
      ::poll(&pfd, 1, 100);
      continue;
    }
    SetError(err, ToolErrorKind::kExecutionFailed, "write failed: " + ErrnoText(errno));
    return false;
  }
  return true;
}

bool ChildProcess::Resize(int cols, int rows) {
  if (!pty_ || out_fd_ < 0) return false;
  struct winsize ws {};
  ws.ws_col = static_cast<unsigned short>(cols);
  ws.ws_row = static_cast<unsigned short>(rows);
  return ::ioctl(out_fd_, TIOCSWINSZ, &ws) == 0;
}

void ChildProcess::CloseInput() {
  if (!pty_) CloseFd(&in_fd_);
}

bool ChildProcess::ReapLocked(bool block, int* exit_code) {
  if (!reaped_) {
    int status = 0;
    pid_t r = 0;
    do {
      r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
      reaped_ = true;
      exit_code_ = DecodeWaitStatus(status);
    } else if (r < 0) {
      reaped_ = true;
    }
  }
  if (reaped_ && exit_code) *exit_code = exit_code_;
  return reaped_;
}

bool ChildProcess::TryReap(int* exit_code) {
  std::lock_guard<std::mutex> lock(reap_mu_);
  return ReapLocked(false, exit_code);
}

int ChildProcess::Terminate(int grace_ms) {
  int code = -1;
  if (TryReap(&code)) return code;

  // Interactive shells ignore SIGTERM; SIGHUP is what a closing terminal sends.
  if (pty_) ::kill(-pid_, SIGHUP);
  ::kill(-pid_, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (TryReap(&code)) return code;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (TryReap(&code)) return code;

  ::kill(-pid_, SIGKILL);
  ::kill(pid_, SIGKILL);
  std::lock_guard<std::mutex> lock(reap_mu_);
  ReapLocked(true, &code);
  return code;
}

nlohmann::json CommandResult::ToJson() const {
  nlohmann::json j;
  j["stdout"] = stdout_text;
  j["stderr"] = stderr_text;
  j["exitCode"] = exit_code;
  j["timedOut"] = timed_out;
  j["durationMs"] = duration_ms;
  if (fallback) j["fallback"] = true;
  return j;
}

std::optional<CommandResult> RunArgv(const std::vector<std::string>& argv, const CommandOptions& opts, ToolError* err) {
  const auto start = std::chrono::steady_clock::now();
  SpawnOptions so;
  so.argv = argv;
  so.cwd = opts.cwd;
  so.env = opts.env;
  auto child = ChildProcess::Spawn(so, err);
  if (!child) return std::nullopt;
  child->CloseInput();

  CommandResult r;
  bool out_open = true;
  bool err_open = true;
  bool reaped = false;
  const auto deadline = start + std::chrono::milliseconds(opts.timeout_ms);

  auto consume = [&](int fd, bool is_stderr, bool* open) {
    std::string chunk;
    *open = ReadAvailable(fd, &chunk);
    if (chunk.empty()) return;
    (is_stderr ? r.stderr_text : r.stdout_text) += chunk;
    if (opts.on_output) opts.on_output(chunk, is_stderr);
  };

  while (out_open || err_open) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      r.timed_out = true;
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {child->output_fd(), POLLIN, 0};
    if (err_open) fds[nfds++] = {child->error_fd(), POLLIN, 0};
    int ready = ::poll(fds, nfds, static_cast<int>(std::min<int64_t>(remaining, 100)));
    if (ready < 0 && errno != EINTR) break;
    if (ready > 0) {
      for (nfds_t i = 0; i < nfds; i++) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        if (fds[i].fd == child->output_fd()) consume(child->output_fd(), false, &out_open);
        if (fds[i].fd == child->error_fd()) consume(child->error_fd(), true, &err_open);
      }
    }
    // A background grandchild may hold the pipes open after the child exits.
    if (child->TryReap(&r.exit_code)) {
      reaped = true;
      if (out_open) consume(child->output_fd(), false, &out_open);
      if (err_open) consume(child->error_fd(), true, &err_open);
      break;
    }
  }

  while (!reaped && !r.timed_out) {
    if (child->TryReap(&r.exit_code)) {
      reaped = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      r.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  if (r.timed_out) {
    r.exit_code = child->Terminate(opts.kill_grace_ms);
    if (out_open) consume(child->output_fd(), false, &out_open);
    if (err_open) consume(child->error_fd(), true, &err_open);
  }
  r.duration_ms = ElapsedMs(start);
  return r;
}

std::optional<CommandResult> RunCommand(const std::string& command, const CommandOptions& opts, ToolError* err) {
  return RunArgv({opts.shell, "-c", command}, opts, err);
}

}  // namespace toolserver
