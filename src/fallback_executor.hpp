#pragma once

#include "config.hpp"
#include "terminal_sessions.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolserver {

struct FallbackOptions {
  HttpEndpoint server;
  int connect_timeout_seconds = 3;
  // Local execution uses the same cwd default, sanitizer, shell and timeout
  // as the server's terminal_execute.
  TerminalOptions local;
};

// TOOL_SERVER_URL (default http://127.0.0.1:9001) plus the server's own
// environment configuration.
FallbackOptions FallbackOptionsFromEnv();

// Caller-side terminal_execute. Talks to the tool server and runs the command
// in-process only when the request never reached it: connect or send failed,
// or a proxy answered 502/503. A sent request with no reply, 500 or 504 is
// reported as ExecutionFailed so a command never runs twice.
class FallbackExecutor {
 public:
  explicit FallbackExecutor(FallbackOptions opts);

  // Returns the execution envelope. Locally produced envelopes carry
  // fallback=true at the top level and inside result.
  nlohmann::json Execute(const std::string& command,
                         const std::optional<std::string>& cwd,
                         const std::optional<int>& timeout_ms = std::nullopt);

  nlohmann::json RunLocally(const std::string& command,
                            const std::optional<std::string>& cwd,
                            const std::optional<int>& timeout_ms);

  const FallbackOptions& options() const { return opts_; }

 private:
  FallbackOptions opts_;
};

}  // namespace toolserver
