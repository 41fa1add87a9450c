#pragma once

#include "../editor_bridge.hpp"
#include "../git_client.hpp"
#include "../terminal_sessions.hpp"
#include "../tooling.hpp"
#include "../workspace.hpp"

namespace toolserver {

// Each family registers its fixed catalog. The referenced component must
// outlive the registry. Duplicate names throw DuplicateToolError.
void RegisterFilesystemTools(ToolRegistry& registry, const Workspace& workspace);
void RegisterTerminalTools(ToolRegistry& registry, TerminalSessionManager& terminals);
void RegisterEditorTools(ToolRegistry& registry, EditorBridge& editor);
void RegisterGitTools(ToolRegistry& registry, const GitClient& git);

}  // namespace toolserver
