#include "tooling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <utility>

namespace toolserver {
namespace {

static bool MatchesType(const nlohmann::json& value, const std::string& type) {
  if (type == "string") return value.is_string();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  if (type == "number") return value.is_number();
  if (type == "integer") {
    if (value.is_number_integer()) return true;
    if (value.is_number_float()) {
      const double d = value.get<double>();
      return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
  }
  if (type == "null") return value.is_null();
  // Unknown or composite types are not checked.
  return true;
}

}  // namespace

const char* ToolKindName(ToolKind kind) {
  switch (kind) {
    case ToolKind::kFilesystem:
      return "filesystem";
    case ToolKind::kTerminal:
      return "terminal";
    case ToolKind::kEditor:
      return "editor";
    case ToolKind::kGit:
      return "git";
  }
  return "unknown";
}

nlohmann::json ToolSchema::ToJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["description"] = description;
  j["kind"] = ToolKindName(kind);
  j["inputSchema"] = parameters.is_null() ? nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}}
                                          : parameters;
  j["resources"] = resource_uris;
  return j;
}

ToolResult ToolResult::Success(nlohmann::json result) {
  ToolResult r;
  r.ok = true;
  r.result = std::move(result);
  return r;
}

ToolResult ToolResult::Failure(ToolError error, nlohmann::json partial) {
  ToolResult r;
  r.ok = false;
  r.error = std::move(error);
  r.result = std::move(partial);
  return r;
}

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (schemas_.count(schema.name)) throw DuplicateToolError(schema.name);
  const std::string name = schema.name;
  schemas_.emplace(name, std::move(schema));
  handlers_.emplace(name, std::move(handler));
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.find(name) != schemas_.end();
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::vector<ToolSchema> out;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    out.reserve(schemas_.size());
    for (const auto& kv : schemas_) out.push_back(kv.second);
  }
  std::sort(out.begin(), out.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
  return out;
}

std::vector<ToolSchema> ToolRegistry::ListSchemasByKind(ToolKind kind) const {
  std::vector<ToolSchema> out;
  for (auto& s : ListSchemas()) {
    if (s.kind == kind) out.push_back(std::move(s));
  }
  return out;
}

size_t ToolRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return schemas_.size();
}

std::optional<std::string> ValidateParameters(const ToolSchema& schema, const nlohmann::json& params) {
  if (!params.is_object()) return std::string("parameters must be an object");
  const auto& p = schema.parameters;
  if (!p.is_object()) return std::nullopt;

  if (p.contains("required") && p["required"].is_array()) {
    for (const auto& key : p["required"]) {
      if (!key.is_string()) continue;
      const auto k = key.get<std::string>();
      if (!params.contains(k) || params[k].is_null()) return "missing required parameter: " + k;
    }
  }

  if (p.contains("properties") && p["properties"].is_object()) {
    for (const auto& [key, prop] : p["properties"].items()) {
      if (!params.contains(key) || params[key].is_null()) continue;
      if (!prop.is_object() || !prop.contains("type") || !prop["type"].is_string()) continue;
      const auto type = prop["type"].get<std::string>();
      if (!MatchesType(params[key], type)) return "parameter " + key + " must be of type " + type;
      if (type == "array" && prop.contains("items") && prop["items"].is_object() && prop["items"].contains("type") &&
          prop["items"]["type"].is_string()) {
        const auto item_type = prop["items"]["type"].get<std::string>();
        for (const auto& item : params[key]) {
          if (!MatchesType(item, item_type)) return "parameter " + key + " must contain only " + item_type + " items";
        }
      }
      if (prop.contains("enum") && prop["enum"].is_array()) {
        const auto& allowed = prop["enum"];
        if (std::find(allowed.begin(), allowed.end(), params[key]) == allowed.end()) {
          return "parameter " + key + " must be one of " + allowed.dump();
        }
      }
    }
  }
  return std::nullopt;
}

nlohmann::json ApplyParameterAliases(const ToolSchema& schema, const nlohmann::json& params) {
  if (!params.is_object() || schema.parameter_aliases.empty()) return params;
  nlohmann::json out = params;
  for (const auto& [alias, canonical] : schema.parameter_aliases) {
    if (!out.contains(alias)) continue;
    if (!out.contains(canonical)) out[canonical] = out[alias];
    out.erase(alias);
  }
  return out;
}

std::string GetString(const nlohmann::json& params, const char* key, const std::string& fallback) {
  if (params.is_object() && params.contains(key) && params[key].is_string()) return params[key].get<std::string>();
  return fallback;
}

std::optional<std::string> GetOptionalString(const nlohmann::json& params, const char* key) {
  if (params.is_object() && params.contains(key) && params[key].is_string()) return params[key].get<std::string>();
  return std::nullopt;
}

bool GetBool(const nlohmann::json& params, const char* key, bool fallback) {
  if (params.is_object() && params.contains(key) && params[key].is_boolean()) return params[key].get<bool>();
  return fallback;
}

std::optional<int> GetOptionalInt(const nlohmann::json& params, const char* key) {
  if (!params.is_object() || !params.contains(key) || !params[key].is_number()) return std::nullopt;
  const double v = params[key].get<double>();
  if (!(v >= static_cast<double>(std::numeric_limits<int>::min()) &&
        v <= static_cast<double>(std::numeric_limits<int>::max()))) {
    throw ToolException(ToolErrorKind::kInvalidParameters, std::string(key) + " is out of range");
  }
  return static_cast<int>(v);
}

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools) {
  std::vector<std::string> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(t.name);
  return out;
}

}  // namespace toolserver
