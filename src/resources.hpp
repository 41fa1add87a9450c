#pragma once

#include "editor_bridge.hpp"
#include "git_client.hpp"
#include "tool_error.hpp"
#include "workspace.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolserver {

struct ResourceDescriptor {
  std::string uri;
  std::string name;
  std::string description;
  std::string mime_type = "application/json";

  nlohmann::json ToJson() const;
};

using ResourceReader = std::function<std::optional<nlohmann::json>(ToolError* err)>;

class ResourceRegistry {
 public:
  void Register(ResourceDescriptor descriptor, ResourceReader reader);

  // Sorted by uri.
  std::vector<ResourceDescriptor> ListResources() const;
  // {uri, mimeType, contents}. Unknown uris fail with kToolNotFound.
  std::optional<nlohmann::json> ReadResource(const std::string& uri, ToolError* err) const;
  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    ResourceDescriptor descriptor;
    ResourceReader reader;
  };
  std::map<std::string, Entry> entries_;
};

// workspace://files, git://status and editor://active.
void RegisterBuiltinResources(ResourceRegistry& registry,
                              const Workspace& workspace,
                              const GitClient& git,
                              EditorBridge& editor);

}  // namespace toolserver
