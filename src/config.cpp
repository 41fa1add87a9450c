#include "config.hpp"

#include "env_sanitizer.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace toolserver {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

}  // namespace

bool TryParseInt(const std::string& s, int* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(n);
  return true;
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.base_path == "/") ep.base_path.clear();
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointToString(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

ServerConfig LoadConfigFromEnv() {
  ServerConfig cfg;

  if (auto host = GetEnvStr("TOOL_SERVER_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("MCP_PORT"); !port.empty()) TryParseInt(port, &cfg.listen.port);

  if (auto host = GetEnvStr("VSCODE_HOST"); !host.empty()) cfg.editor.host = host;
  if (auto port = GetEnvStr("VSCODE_PORT"); !port.empty()) TryParseInt(port, &cfg.editor.port);
  if (auto t = GetEnvStr("TOOL_SERVER_EDITOR_TIMEOUT_S"); !t.empty()) TryParseInt(t, &cfg.editor.timeout_seconds);
  if (auto t = GetEnvStr("TOOL_SERVER_EDITOR_RECHECK_S"); !t.empty()) TryParseInt(t, &cfg.editor.recheck_seconds);

  if (auto root = GetEnvStr("WORKSPACE_PATH"); !root.empty()) cfg.workspace_root = root;

  auto llm = GetEnvStr("LLM_SERVICE_URL");
  cfg.llm_service = ParseHttpEndpoint(llm.empty() ? "http://llm-service:9000" : llm, 9000);
  auto backend = GetEnvStr("BACKEND_URL");
  cfg.backend = ParseHttpEndpoint(backend.empty() ? "http://backend:8000" : backend, 8000);

  if (auto strip = GetEnvStr("TOOL_SERVER_ENV_STRIP"); !strip.empty()) {
    cfg.sanitization.strip_keys.clear();
    for (auto& key : SplitCsv(strip)) cfg.sanitization.strip_keys.insert(std::move(key));
  }
  if (auto force = GetEnvStr("TOOL_SERVER_ENV_FORCE"); !force.empty()) {
    cfg.sanitization.forced_keys = ParseForcedKeys(force);
  }
  cfg.sanitization.working_directory_default = cfg.workspace_root;

  if (auto shell = GetEnvStr("TOOL_SERVER_SHELL"); !shell.empty()) cfg.shell = shell;
  if (auto t = GetEnvStr("TOOL_SERVER_COMMAND_TIMEOUT_MS"); !t.empty()) TryParseInt(t, &cfg.command_timeout_ms);
  if (auto t = GetEnvStr("TOOL_SERVER_KILL_GRACE_MS"); !t.empty()) TryParseInt(t, &cfg.kill_grace_ms);
  if (cfg.command_timeout_ms <= 0) cfg.command_timeout_ms = 30000;
  if (cfg.kill_grace_ms < 0) cfg.kill_grace_ms = 0;

  cfg.audit_log_path = GetEnvStr("TOOL_SERVER_AUDIT_LOG");
  cfg.terminal_log_path = GetEnvStr("TOOL_SERVER_TERMINAL_LOG");
  if (cfg.terminal_log_path.empty()) cfg.terminal_log_path = cfg.workspace_root + "/.agent-terminal.log";

  return cfg;
}

}  // namespace toolserver
