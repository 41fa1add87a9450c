#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace toolserver {

enum class ToolErrorKind {
  kToolNotFound,
  kInvalidParameters,
  kExecutionFailed,
  kSpawnFailed,
  kSessionNotFound,
  kTimeout,
  kBridgeUnreachable,
  kPathTraversalRejected,
};

const char* ToolErrorKindName(ToolErrorKind kind);

struct ToolError {
  ToolErrorKind kind = ToolErrorKind::kExecutionFailed;
  std::string message;

  nlohmann::json ToJson() const;
};

// Thrown by handlers that want a specific kind; anything else thrown becomes
// kExecutionFailed at the dispatcher.
class ToolException : public std::runtime_error {
 public:
  ToolException(ToolErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
  explicit ToolException(const ToolError& error) : ToolException(error.kind, error.message) {}

  ToolErrorKind kind() const { return kind_; }

 private:
  ToolErrorKind kind_;
};

inline void SetError(ToolError* err, ToolErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

}  // namespace toolserver
