#pragma once

#include "tool_error.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolserver {

enum class ToolKind { kFilesystem, kTerminal, kEditor, kGit };

const char* ToolKindName(ToolKind kind);

struct ToolSchema {
  std::string name;
  std::string description;
  ToolKind kind = ToolKind::kFilesystem;
  nlohmann::json parameters;
  std::vector<std::string> resource_uris;
  // alias -> canonical parameter name, applied before validation.
  std::map<std::string, std::string> parameter_aliases;

  nlohmann::json ToJson() const;
};

struct ToolResult {
  bool ok = true;
  nlohmann::json result;
  ToolError error;

  static ToolResult Success(nlohmann::json result);
  // `partial` is carried alongside the error, e.g. output captured before a
  // timeout.
  static ToolResult Failure(ToolError error, nlohmann::json partial = nullptr);
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

class DuplicateToolError : public std::runtime_error {
 public:
  explicit DuplicateToolError(const std::string& name)
      : std::runtime_error("tool already registered: " + name), name_(name) {}
  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  // Throws DuplicateToolError when the name is taken.
  void RegisterTool(ToolSchema schema, ToolHandler handler);
  bool HasTool(const std::string& name) const;
  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;

  // Sorted by name.
  std::vector<ToolSchema> ListSchemas() const;
  std::vector<ToolSchema> ListSchemasByKind(ToolKind kind) const;
  size_t size() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

// Shape check only: params is an object, required keys are present and
// non-null, declared primitive types match. Returns the first problem.
std::optional<std::string> ValidateParameters(const ToolSchema& schema, const nlohmann::json& params);

// Renames alias keys to their canonical names. The canonical key wins when
// both are present.
nlohmann::json ApplyParameterAliases(const ToolSchema& schema, const nlohmann::json& params);

std::string GetString(const nlohmann::json& params, const char* key, const std::string& fallback = {});
std::optional<std::string> GetOptionalString(const nlohmann::json& params, const char* key);
bool GetBool(const nlohmann::json& params, const char* key, bool fallback);
// Throws ToolException(kInvalidParameters) when the number does not fit an int.
std::optional<int> GetOptionalInt(const nlohmann::json& params, const char* key);

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools);

}  // namespace toolserver
