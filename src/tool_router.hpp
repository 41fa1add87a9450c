#pragma once

#include "dispatcher.hpp"
#include "editor_bridge.hpp"
#include "resources.hpp"
#include "terminal_sessions.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

namespace toolserver {

inline constexpr const char* kServiceName = "agent-tool-server";
inline constexpr const char* kServiceVersion = "1.0.0";

class ToolRouter {
 public:
  ToolRouter(const Dispatcher* dispatcher,
             const ResourceRegistry* resources,
             TerminalSessionManager* terminals,
             EditorBridge* editor);

  void Register(httplib::Server* server);

  // Body of POST /api/tools/execute. Sets *status to 400 for a malformed
  // envelope, 200 otherwise.
  nlohmann::json HandleExecute(const std::string& body, int* status) const;
  // One JSON-RPC 2.0 request object in, one response object out.
  nlohmann::json HandleRpc(const nlohmann::json& request) const;
  nlohmann::json Health() const;

 private:
  const Dispatcher* dispatcher_;
  const ResourceRegistry* resources_;
  TerminalSessionManager* terminals_;
  EditorBridge* editor_;
};

}  // namespace toolserver
