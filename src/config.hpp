#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace toolserver {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 9001;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

struct SanitizationPolicy {
  std::set<std::string> strip_keys = {"PORT"};
  std::map<std::string, std::string> forced_keys = {{"NODE_ENV", "development"}};
  std::string working_directory_default = "/workspace";
};

struct EditorConfig {
  std::string host = "vscode";
  int port = 8080;
  int timeout_seconds = 30;
  int recheck_seconds = 30;
};

struct ServerConfig {
  HttpListenConfig listen;
  EditorConfig editor;
  std::string workspace_root = "/workspace";
  HttpEndpoint llm_service;
  HttpEndpoint backend;
  SanitizationPolicy sanitization;
  std::string shell = "/bin/sh";
  int command_timeout_ms = 30000;
  int kill_grace_ms = 2000;
  std::string audit_log_path;
  std::string terminal_log_path;
};

ServerConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::string EndpointToString(const HttpEndpoint& ep);
std::vector<std::string> SplitCsv(const std::string& s);

// Whole-string base-10 parse. False on trailing junk or when the value does
// not fit an int; *out is left untouched then.
bool TryParseInt(const std::string& s, int* out);

}  // namespace toolserver
