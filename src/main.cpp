#include "audit_log.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "editor_bridge.hpp"
#include "env_sanitizer.hpp"
#include "git_client.hpp"
#include "resources.hpp"
#include "terminal_sessions.hpp"
#include "tool_router.hpp"
#include "tooling.hpp"
#include "tools/tool_families.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

static void LogConfig(const toolserver::ServerConfig& cfg) {
  std::cout << "[config] workspace=" << cfg.workspace_root << " shell=" << cfg.shell
            << " command_timeout_ms=" << cfg.command_timeout_ms << " kill_grace_ms=" << cfg.kill_grace_ms << "\n";
  std::cout << "[config] editor host=" << cfg.editor.host << " port=" << cfg.editor.port
            << " timeout_s=" << cfg.editor.timeout_seconds << " recheck_s=" << cfg.editor.recheck_seconds << "\n";
  std::cout << "[config] llm_service=" << toolserver::EndpointToString(cfg.llm_service)
            << " backend=" << toolserver::EndpointToString(cfg.backend) << "\n";
  std::cout << "[config] env strip=" << cfg.sanitization.strip_keys.size()
            << " force=" << cfg.sanitization.forced_keys.size()
            << " audit_log=" << (cfg.audit_log_path.empty() ? "<disabled>" : cfg.audit_log_path)
            << " terminal_log=" << (cfg.terminal_log_path.empty() ? "<disabled>" : cfg.terminal_log_path) << "\n";
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  signal(SIGPIPE, SIG_IGN);

  // Blocked here so every thread inherits the mask and only the watcher
  // receives them.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  auto cfg = toolserver::LoadConfigFromEnv();
  LogConfig(cfg);

  toolserver::Workspace workspace(cfg.workspace_root);
  {
    toolserver::ToolError err;
    if (!workspace.EnsureRoot(&err)) std::cout << "[config] workspace root unavailable error=" << err.message << "\n";
  }

  toolserver::TerminalSessionManager terminals(toolserver::TerminalOptionsFromConfig(cfg));
  toolserver::EditorBridge editor(cfg.editor, cfg.workspace_root);

  toolserver::GitOptions git_opts;
  git_opts.workspace_root = cfg.workspace_root;
  git_opts.env = toolserver::Sanitize(toolserver::CurrentEnvironment(), cfg.sanitization);
  git_opts.timeout_ms = cfg.command_timeout_ms;
  git_opts.kill_grace_ms = cfg.kill_grace_ms;
  toolserver::GitClient git(git_opts);

  toolserver::ToolRegistry registry;
  try {
    toolserver::RegisterFilesystemTools(registry, workspace);
    toolserver::RegisterTerminalTools(registry, terminals);
    toolserver::RegisterEditorTools(registry, editor);
    toolserver::RegisterGitTools(registry, git);
  } catch (const toolserver::DuplicateToolError& e) {
    std::cout << "[tool] registration failed name=" << e.name() << " error=" << e.what() << "\n";
    return 1;
  }
  std::cout << "[tool] registered count=" << registry.size() << "\n";

  toolserver::ResourceRegistry resources;
  toolserver::RegisterBuiltinResources(resources, workspace, git, editor);

  std::unique_ptr<toolserver::AuditLog> audit;
  if (!cfg.audit_log_path.empty()) audit = std::make_unique<toolserver::AuditLog>(cfg.audit_log_path);
  toolserver::Dispatcher dispatcher(&registry, audit.get());

  {
    toolserver::ToolError err;
    const bool ok = editor.Connect(&err);
    std::cout << "[editor] startup probe ok=" << (ok ? 1 : 0);
    if (!ok) std::cout << " error=" << err.message;
    std::cout << "\n";
  }

  httplib::Server server;
  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    nlohmann::json j;
    j["success"] = false;
    j["error"] = {{"kind", "ExecutionFailed"}, {"message", message}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "server error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["success"] = false;
    j["error"] = {{"kind", "InvalidRequest"}, {"message", message}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  toolserver::ToolRouter router(&dispatcher, &resources, &terminals, &editor);
  router.Register(&server);

  std::atomic<bool> listen_done{false};
  std::thread watcher([&]() {
    int sig = 0;
    sigwait(&stop_signals, &sig);
    if (!listen_done.load()) std::cout << "[http] signal=" << sig << " stopping\n";
    server.stop();
  });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  bool ok = server.bind_to_port(cfg.listen.host, cfg.listen.port);
  if (ok) ok = server.listen_after_bind();
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";

  // Wake the watcher if the listener ended without a signal.
  listen_done.store(true);
  pthread_kill(watcher.native_handle(), SIGTERM);
  watcher.join();

  terminals.Shutdown();
  return ok ? 0 : 1;
}
