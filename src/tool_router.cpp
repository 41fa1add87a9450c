#include "tool_router.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace toolserver {
namespace {

constexpr int kRpcParseError = -32700;
constexpr int kRpcInvalidRequest = -32600;
constexpr int kRpcMethodNotFound = -32601;
constexpr int kRpcInternalError = -32603;

static int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static nlohmann::json MakeRequestError(const std::string& message) {
  return {{"success", false}, {"error", {{"kind", "InvalidRequest"}, {"message", message}}}};
}

static nlohmann::json RpcResult(const nlohmann::json& id, nlohmann::json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

static nlohmann::json RpcError(const nlohmann::json& id, int code, const std::string& message,
                               nlohmann::json data = nullptr) {
  nlohmann::json err = {{"code", code}, {"message", message}};
  if (!data.is_null()) err["data"] = std::move(data);
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(err)}};
}

static nlohmann::json ToolsJson(const ToolRegistry& registry) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& s : registry.ListSchemas()) arr.push_back(s.ToJson());
  return arr;
}

static nlohmann::json ResourcesJson(const ResourceRegistry& resources) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& r : resources.ListResources()) arr.push_back(r.ToJson());
  return arr;
}

static void LogRequest(const httplib::Request& req) {
  std::cout << "[http] " << req.method << " " << req.path << " bytes=" << req.body.size() << "\n";
}

}  // namespace

ToolRouter::ToolRouter(const Dispatcher* dispatcher,
                       const ResourceRegistry* resources,
                       TerminalSessionManager* terminals,
                       EditorBridge* editor)
    : dispatcher_(dispatcher), resources_(resources), terminals_(terminals), editor_(editor) {}

nlohmann::json ToolRouter::HandleExecute(const std::string& body, int* status) const {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    *status = 400;
    return MakeRequestError("invalid json body");
  }
  if (!j.contains("tool") || !j["tool"].is_string()) {
    *status = 400;
    return MakeRequestError("missing field: tool");
  }
  ExecutionRequest request;
  request.tool = j["tool"].get<std::string>();
  if (j.contains("parameters") && !j["parameters"].is_null()) request.parameters = j["parameters"];
  *status = 200;
  return dispatcher_->Invoke(request).ToJson();
}

nlohmann::json ToolRouter::HandleRpc(const nlohmann::json& request) const {
  if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
    return RpcError(request.is_object() && request.contains("id") ? request["id"] : nlohmann::json(nullptr),
                    kRpcInvalidRequest, "invalid request");
  }
  const nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
  const auto method = request["method"].get<std::string>();
  const nlohmann::json params =
      request.contains("params") && request["params"].is_object() ? request["params"] : nlohmann::json::object();

  if (method == "tools/list") {
    return RpcResult(id, {{"tools", ToolsJson(dispatcher_->registry())}});
  }
  if (method == "tools/call") {
    ExecutionRequest call;
    call.tool = GetString(params, "name");
    if (params.contains("arguments") && params["arguments"].is_object()) call.parameters = params["arguments"];
    auto result = dispatcher_->Invoke(call);
    if (!result.success) {
      const std::string message = result.error ? result.error->message : std::string("tool failed");
      return RpcError(id, kRpcInternalError, message, result.ToJson());
    }
    return RpcResult(id, result.ToJson());
  }
  if (method == "resources/list") {
    return RpcResult(id, {{"resources", ResourcesJson(*resources_)}});
  }
  if (method == "resources/read") {
    ToolError err;
    auto contents = resources_->ReadResource(GetString(params, "uri"), &err);
    if (!contents) return RpcError(id, kRpcInternalError, err.message, {{"error", err.ToJson()}});
    return RpcResult(id, {{"contents", nlohmann::json::array({*contents})}});
  }
  return RpcError(id, kRpcMethodNotFound, "method not found: " + method);
}

nlohmann::json ToolRouter::Health() const {
  return {{"status", "healthy"},
          {"service", kServiceName},
          {"version", kServiceVersion},
          {"tools", dispatcher_->registry().size()},
          {"resources", resources_->size()},
          {"sessions", terminals_->LiveCount()},
          {"editorConnected", editor_->IsConnected()},
          {"timestamp", NowMillis()}};
}

void ToolRouter::Register(httplib::Server* server) {
  server->Get("/health", [this](const httplib::Request&, httplib::Response& res) { SendJson(&res, 200, Health()); });

  server->Get("/api/tools", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, {{"success", true}, {"tools", ToolsJson(dispatcher_->registry())}});
  });

  server->Post("/api/tools/execute", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    int status = 200;
    auto out = HandleExecute(req.body, &status);
    SendJson(&res, status, out);
  });

  server->Get("/api/resources", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, {{"success", true}, {"resources", ResourcesJson(*resources_)}});
  });

  server->Post("/api/resources/read", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = nlohmann::json::parse(req.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeRequestError("invalid json body"));
    if (!j.contains("uri") || !j["uri"].is_string()) return SendJson(&res, 400, MakeRequestError("missing field: uri"));
    ToolError err;
    auto contents = resources_->ReadResource(j["uri"].get<std::string>(), &err);
    if (!contents) return SendJson(&res, 200, {{"success", false}, {"error", err.ToJson()}});
    SendJson(&res, 200, {{"success", true}, {"result", *contents}});
  });

  server->Post("/rpc", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = nlohmann::json::parse(req.body, nullptr, false);
    if (j.is_discarded()) return SendJson(&res, 200, RpcError(nullptr, kRpcParseError, "parse error"));
    SendJson(&res, 200, HandleRpc(j));
  });
}

}  // namespace toolserver
