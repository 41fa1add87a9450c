#pragma once

#include "audit_log.hpp"
#include "tool_error.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolserver {

struct ExecutionRequest {
  std::string tool;
  nlohmann::json parameters = nlohmann::json::object();
};

struct ExecutionResult {
  bool success = false;
  nlohmann::json result;
  std::optional<ToolError> error;
  int64_t duration_ms = 0;
  std::string tool;
  int64_t timestamp = 0;

  // {success, result?, error?: {kind, message}, duration, metadata: {tool, timestamp}}
  nlohmann::json ToJson() const;
};

// Protocol entry point. Holds no per-call state and may be shared by every
// server thread.
class Dispatcher {
 public:
  explicit Dispatcher(const ToolRegistry* registry, AuditLog* audit = nullptr);

  ExecutionResult Invoke(const ExecutionRequest& request) const;

  const ToolRegistry& registry() const { return *registry_; }

 private:
  const ToolRegistry* registry_;
  AuditLog* audit_;
};

}  // namespace toolserver
