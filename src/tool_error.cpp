#include "tool_error.hpp"

namespace toolserver {

const char* ToolErrorKindName(ToolErrorKind kind) {
  switch (kind) {
    case ToolErrorKind::kToolNotFound:
      return "ToolNotFound";
    case ToolErrorKind::kInvalidParameters:
      return "InvalidParameters";
    case ToolErrorKind::kExecutionFailed:
      return "ExecutionFailed";
    case ToolErrorKind::kSpawnFailed:
      return "SpawnFailed";
    case ToolErrorKind::kSessionNotFound:
      return "SessionNotFound";
    case ToolErrorKind::kTimeout:
      return "Timeout";
    case ToolErrorKind::kBridgeUnreachable:
      return "BridgeUnreachable";
    case ToolErrorKind::kPathTraversalRejected:
      return "PathTraversalRejected";
  }
  return "ExecutionFailed";
}

nlohmann::json ToolError::ToJson() const {
  return {{"kind", ToolErrorKindName(kind)}, {"message", message}};
}

}  // namespace toolserver
