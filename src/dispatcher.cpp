#include "dispatcher.hpp"

#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <utility>

namespace toolserver {
namespace {

static int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static std::string DumpForLog(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

nlohmann::json ExecutionResult::ToJson() const {
  nlohmann::json j;
  j["success"] = success;
  if (!result.is_null()) j["result"] = result;
  if (error) j["error"] = error->ToJson();
  j["duration"] = duration_ms;
  j["metadata"] = {{"tool", tool}, {"timestamp", timestamp}};
  return j;
}

Dispatcher::Dispatcher(const ToolRegistry* registry, AuditLog* audit) : registry_(registry), audit_(audit) {}

ExecutionResult Dispatcher::Invoke(const ExecutionRequest& request) const {
  const auto start = std::chrono::steady_clock::now();
  ExecutionResult out;
  out.tool = request.tool;
  out.timestamp = NowMillis();

  auto fail = [&](ToolErrorKind kind, const std::string& message) {
    out.success = false;
    out.error = ToolError{kind, message};
  };

  nlohmann::json params = request.parameters.is_null() ? nlohmann::json::object() : request.parameters;
  auto schema = registry_->GetSchema(request.tool);
  auto handler = registry_->GetHandler(request.tool);
  if (!schema || !handler) {
    fail(ToolErrorKind::kToolNotFound, "tool not found: " + request.tool);
  } else {
    params = ApplyParameterAliases(*schema, params);
    if (auto problem = ValidateParameters(*schema, params)) {
      fail(ToolErrorKind::kInvalidParameters, *problem);
    } else {
      try {
        ToolResult tr = (*handler)(params);
        out.success = tr.ok;
        out.result = std::move(tr.result);
        if (!tr.ok) out.error = std::move(tr.error);
      } catch (const ToolException& e) {
        fail(e.kind(), e.what());
      } catch (const std::exception& e) {
        fail(ToolErrorKind::kExecutionFailed, e.what());
      } catch (...) {
        fail(ToolErrorKind::kExecutionFailed, "unknown error");
      }
    }
  }

  out.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  std::cout << "[tool] name=" << request.tool << " ok=" << (out.success ? 1 : 0)
            << " duration_ms=" << out.duration_ms;
  if (out.error) std::cout << " kind=" << ToolErrorKindName(out.error->kind) << " error=" << out.error->message;
  std::cout << " params=" << TruncateForLog(DumpForLog(params), 500) << "\n";

  if (audit_) {
    nlohmann::json record;
    record["timestamp"] = out.timestamp;
    record["tool"] = request.tool;
    record["parameters"] = params;
    record["success"] = out.success;
    record["durationMs"] = out.duration_ms;
    if (out.error) record["error"] = out.error->ToJson();
    if (!audit_->Append(record)) std::cout << "[audit] append failed tool=" << request.tool << "\n";
  }
  return out;
}

}  // namespace toolserver
