#include "resources.hpp"

#include <utility>

namespace toolserver {

nlohmann::json ResourceDescriptor::ToJson() const {
  return {{"uri", uri}, {"name", name}, {"description", description}, {"mimeType", mime_type}};
}

void ResourceRegistry::Register(ResourceDescriptor descriptor, ResourceReader reader) {
  const std::string uri = descriptor.uri;
  entries_[uri] = Entry{std::move(descriptor), std::move(reader)};
}

std::vector<ResourceDescriptor> ResourceRegistry::ListResources() const {
  std::vector<ResourceDescriptor> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.push_back(kv.second.descriptor);
  return out;
}

std::optional<nlohmann::json> ResourceRegistry::ReadResource(const std::string& uri, ToolError* err) const {
  auto it = entries_.find(uri);
  if (it == entries_.end()) {
    SetError(err, ToolErrorKind::kToolNotFound, "resource not found: " + uri);
    return std::nullopt;
  }
  auto contents = it->second.reader(err);
  if (!contents) return std::nullopt;
  return nlohmann::json{{"uri", uri}, {"mimeType", it->second.descriptor.mime_type}, {"contents", *contents}};
}

void RegisterBuiltinResources(ResourceRegistry& registry,
                              const Workspace& workspace,
                              const GitClient& git,
                              EditorBridge& editor) {
  const Workspace* ws = &workspace;
  const GitClient* g = &git;
  EditorBridge* ed = &editor;

  registry.Register({"workspace://files", "Workspace files", "Top-level listing of the workspace root"},
                    [ws](ToolError* err) -> std::optional<nlohmann::json> {
                      auto entries = ws->ListDirectory(".", err);
                      if (!entries) return std::nullopt;
                      nlohmann::json arr = nlohmann::json::array();
                      for (const auto& e : *entries) arr.push_back(ToJson(e));
                      return nlohmann::json{{"root", ws->root()}, {"entries", std::move(arr)}};
                    });

  registry.Register({"git://status", "Git status", "Branch and changed files of the workspace repository"},
                    [g](ToolError* err) -> std::optional<nlohmann::json> {
                      auto st = g->Status(std::nullopt, err);
                      if (!st) return std::nullopt;
                      return st->ToJson();
                    });

  registry.Register({"editor://active", "Active editor", "File and language of the editor's active document"},
                    [ed](ToolError* err) -> std::optional<nlohmann::json> {
                      auto file = ed->GetActiveFile(err);
                      if (!file) return std::nullopt;
                      if (file->empty()) return nlohmann::json{{"file", nullptr}};
                      nlohmann::json j = {{"file", *file}, {"language", EditorBridge::LanguageForPath(*file)}};
                      ToolError sel_err;
                      if (auto sel = ed->GetSelection(&sel_err)) j["selection"] = *sel;
                      return j;
                    });
}

}  // namespace toolserver
