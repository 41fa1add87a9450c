#include "fallback_executor.hpp"

#include "env_sanitizer.hpp"
#include "process.hpp"

#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace toolserver {
namespace {

constexpr const char* kExecuteTool = "terminal_execute";

static int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static nlohmann::json LocalEnvelope(bool success,
                                    nlohmann::json result,
                                    const std::optional<ToolError>& error,
                                    int64_t duration_ms) {
  nlohmann::json j;
  j["success"] = success;
  if (!result.is_null()) j["result"] = std::move(result);
  if (error) j["error"] = error->ToJson();
  j["duration"] = duration_ms;
  j["metadata"] = {{"tool", kExecuteTool}, {"timestamp", NowMillis()}};
  j["fallback"] = true;
  return j;
}

static nlohmann::json ServerFailure(const std::string& message) {
  ToolError err{ToolErrorKind::kExecutionFailed, message};
  return {{"success", false}, {"error", err.ToJson()}};
}

}  // namespace

FallbackOptions FallbackOptionsFromEnv() {
  FallbackOptions opts;
  const char* url = std::getenv("TOOL_SERVER_URL");
  opts.server = ParseHttpEndpoint(url && *url ? url : "http://127.0.0.1:9001", 9001);
  opts.local = TerminalOptionsFromConfig(LoadConfigFromEnv());
  // The transcript belongs to the server.
  opts.local.transcript_path.clear();
  return opts;
}

FallbackExecutor::FallbackExecutor(FallbackOptions opts) : opts_(std::move(opts)) {}

nlohmann::json FallbackExecutor::Execute(const std::string& command,
                                         const std::optional<std::string>& cwd,
                                         const std::optional<int>& timeout_ms) {
  nlohmann::json params = {{"command", command}};
  if (cwd) params["cwd"] = *cwd;
  if (timeout_ms) params["timeout"] = *timeout_ms;
  const nlohmann::json body = {{"tool", kExecuteTool}, {"parameters", params}};

  const int effective_timeout_ms = timeout_ms && *timeout_ms > 0 ? *timeout_ms : opts_.local.command_timeout_ms;
  const int read_timeout_s = effective_timeout_ms / 1000 + opts_.local.kill_grace_ms / 1000 + 10;

  httplib::Client cli(opts_.server.host, opts_.server.port);
  cli.set_connection_timeout(opts_.connect_timeout_seconds);
  cli.set_read_timeout(read_timeout_s);
  cli.set_write_timeout(opts_.connect_timeout_seconds);

  auto res = cli.Post(opts_.server.base_path + "/api/tools/execute", body.dump(), "application/json");
  if (!res) {
    // A read failure means the request went out; the server may be running it.
    if (res.error() == httplib::Error::Read) {
      std::cerr << "[fallback] server=" << EndpointToString(opts_.server) << " no reply, not running locally\n";
      return ServerFailure("no reply from tool server; the command may have run");
    }
    std::cerr << "[fallback] server=" << EndpointToString(opts_.server)
              << " unreachable error=" << httplib::to_string(res.error()) << " running locally\n";
    return RunLocally(command, cwd, timeout_ms);
  }
  if (res->status == 502 || res->status == 503) {
    std::cerr << "[fallback] server=" << EndpointToString(opts_.server) << " status=" << res->status
              << " running locally\n";
    return RunLocally(command, cwd, timeout_ms);
  }
  if (res->status >= 500) {
    std::cerr << "[fallback] server=" << EndpointToString(opts_.server) << " status=" << res->status
              << " not running locally\n";
    return ServerFailure("tool server answered status " + std::to_string(res->status) +
                         "; the command may have run");
  }

  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return ServerFailure("invalid response from tool server (status " + std::to_string(res->status) + ")");
  }
  return j;
}

nlohmann::json FallbackExecutor::RunLocally(const std::string& command,
                                            const std::optional<std::string>& cwd,
                                            const std::optional<int>& timeout_ms) {
  const auto start = std::chrono::steady_clock::now();
  auto elapsed = [&]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  };

  ToolError err;
  auto dir = ResolveCommandCwd(opts_.local, cwd, &err);
  if (!dir) return LocalEnvelope(false, nullptr, err, elapsed());

  CommandOptions co;
  co.shell = opts_.local.shell;
  co.cwd = *dir;
  co.env = Sanitize(opts_.local.ambient, opts_.local.policy);
  co.timeout_ms = timeout_ms && *timeout_ms > 0 ? *timeout_ms : opts_.local.command_timeout_ms;
  co.kill_grace_ms = opts_.local.kill_grace_ms;

  auto r = RunCommand(command, co, &err);
  if (!r) return LocalEnvelope(false, nullptr, err, elapsed());
  r->fallback = true;

  auto result = r->ToJson();
  result["command"] = command;
  std::cerr << "[fallback] local exit_code=" << r->exit_code << " timed_out=" << (r->timed_out ? 1 : 0)
            << " duration_ms=" << r->duration_ms << "\n";
  if (r->timed_out) {
    return LocalEnvelope(false, std::move(result),
                         ToolError{ToolErrorKind::kTimeout,
                                   "command timed out after " + std::to_string(r->duration_ms) + " ms"},
                         elapsed());
  }
  return LocalEnvelope(true, std::move(result), std::nullopt, elapsed());
}

}  // namespace toolserver
