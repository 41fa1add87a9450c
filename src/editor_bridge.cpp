#include "editor_bridge.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <limits>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <utility>

namespace toolserver {
namespace {

// A failed probe is reused only long enough for concurrent callers to share it.
constexpr int kFailedProbeTtlMs = 1000;

static std::unique_ptr<httplib::Client> MakeClient(const EditorConfig& cfg) {
  auto cli = std::make_unique<httplib::Client>(cfg.host, cfg.port);
  cli->set_connection_timeout(cfg.timeout_seconds);
  cli->set_read_timeout(cfg.timeout_seconds);
  cli->set_write_timeout(cfg.timeout_seconds);
  return cli;
}

static std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

static std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

static int ClampLine(int line, const std::vector<std::string>& lines) {
  return std::max(0, std::min(line, static_cast<int>(lines.size()) - 1));
}

static size_t ClampChar(int ch, const std::string& line) {
  if (ch <= 0) return 0;
  return std::min(static_cast<size_t>(ch), line.size());
}

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static std::optional<int> IntField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
  const double v = j[key].get<double>();
  if (!(v >= static_cast<double>(std::numeric_limits<int>::min()) &&
        v <= static_cast<double>(std::numeric_limits<int>::max()))) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}

}  // namespace

std::optional<Position> ParsePosition(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  auto line = IntField(j, "line");
  auto character = IntField(j, "character");
  if (!line || !character) return std::nullopt;
  Position p;
  p.line = *line;
  p.character = *character;
  return p;
}

std::optional<Range> ParseRange(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("start") || !j.contains("end")) return std::nullopt;
  auto start = ParsePosition(j["start"]);
  auto end = ParsePosition(j["end"]);
  if (!start || !end) return std::nullopt;
  return Range{*start, *end};
}

nlohmann::json ToJson(const Position& p) {
  return {{"line", p.line}, {"character", p.character}};
}

EditorBridge::EditorBridge(EditorConfig cfg, std::string workspace_root)
    : cfg_(std::move(cfg)), workspace_(std::move(workspace_root)) {}

bool EditorBridge::ProbeLocked(ToolError* err) {
  ToolError root_err;
  if (!workspace_.EnsureRoot(&root_err)) {
    std::cout << "[editor] workspace root unavailable error=" << root_err.message << "\n";
  }
  auto cli = MakeClient(cfg_);
  auto res = cli->Get("/");
  probed_ = true;
  last_probe_ = std::chrono::steady_clock::now();
  connected_ = res && res->status < 500;
  std::cout << "[editor] connect ok=" << (connected_ ? 1 : 0) << " host=" << cfg_.host << " port=" << cfg_.port
            << " status=" << (res ? std::to_string(res->status) : httplib::to_string(res.error())) << "\n";
  if (!connected_) {
    SetError(err, ToolErrorKind::kBridgeUnreachable,
             "editor not reachable at " + cfg_.host + ":" + std::to_string(cfg_.port));
  }
  return connected_;
}

bool EditorBridge::Connect(ToolError* err) {
  std::lock_guard<std::mutex> lock(probe_mu_);
  return ProbeLocked(err);
}

bool EditorBridge::EnsureConnected(ToolError* err) {
  std::lock_guard<std::mutex> lock(probe_mu_);
  if (probed_) {
    const auto age =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - last_probe_).count();
    const int64_t ttl = connected_ ? static_cast<int64_t>(cfg_.recheck_seconds) * 1000 : kFailedProbeTtlMs;
    if (age < ttl) {
      if (!connected_) {
        SetError(err, ToolErrorKind::kBridgeUnreachable,
                 "editor not reachable at " + cfg_.host + ":" + std::to_string(cfg_.port));
      }
      return connected_;
    }
  }
  return ProbeLocked(err);
}

bool EditorBridge::IsConnected() const {
  std::lock_guard<std::mutex> lock(probe_mu_);
  return connected_;
}

void EditorBridge::MarkDown() {
  std::lock_guard<std::mutex> lock(probe_mu_);
  connected_ = false;
  last_probe_ = std::chrono::steady_clock::now();
}

std::optional<nlohmann::json> EditorBridge::ExecuteCommand(const std::string& command,
                                                           const nlohmann::json& args,
                                                           ToolError* err) {
  if (!EnsureConnected(err)) return std::nullopt;

  nlohmann::json body;
  body["command"] = command;
  if (args.is_null()) {
    body["arguments"] = nlohmann::json::array();
  } else if (args.is_array()) {
    body["arguments"] = args;
  } else {
    body["arguments"] = nlohmann::json::array({args});
  }

  auto cli = MakeClient(cfg_);
  auto res = cli->Post("/api/commands/execute", body.dump(), "application/json");
  if (!res) {
    MarkDown();
    std::cout << "[editor] command=" << command << " ok=0 error=" << httplib::to_string(res.error()) << "\n";
    SetError(err, ToolErrorKind::kBridgeUnreachable, "editor request failed: " + httplib::to_string(res.error()));
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    std::cout << "[editor] command=" << command << " ok=0 status=" << res->status << "\n";
    SetError(err, ToolErrorKind::kExecutionFailed,
             "editor command " + command + " failed: http " + std::to_string(res->status));
    return std::nullopt;
  }
  std::cout << "[editor] command=" << command << " ok=1 status=" << res->status << "\n";
  if (res->body.empty()) return nlohmann::json();
  auto parsed = nlohmann::json::parse(res->body, nullptr, false);
  if (parsed.is_discarded()) return nlohmann::json(res->body);
  return parsed;
}

bool EditorBridge::CreateFile(const std::string& path, const std::string& content, ToolError* err) {
  return workspace_.CreateFile(path, content, err);
}

std::optional<std::string> EditorBridge::ReadFile(const std::string& path, ToolError* err) {
  return workspace_.ReadFile(path, err);
}

bool EditorBridge::WriteFile(const std::string& path, const std::string& content, ToolError* err) {
  return workspace_.WriteFile(path, content, err);
}

bool EditorBridge::DeleteFile(const std::string& path, ToolError* err) {
  return workspace_.DeleteFile(path, err);
}

std::optional<bool> EditorBridge::FileExists(const std::string& path, ToolError* err) {
  return workspace_.Exists(path, err);
}

std::optional<std::vector<std::string>> EditorBridge::ListFiles(const std::string& path, ToolError* err) {
  return workspace_.ListFiles(path, err);
}

std::optional<std::vector<std::string>> EditorBridge::ListDirectories(const std::string& path, ToolError* err) {
  return workspace_.ListDirectories(path, err);
}

bool EditorBridge::CreateDirectory(const std::string& path, ToolError* err) {
  return workspace_.CreateDirectory(path, err);
}

bool EditorBridge::DeleteDirectory(const std::string& path, bool recursive, ToolError* err) {
  return workspace_.DeleteDirectory(path, recursive, err);
}

std::optional<std::string> EditorBridge::CreateTerminal(const std::string& name, const std::string& cwd, ToolError* err) {
  nlohmann::json opts = {{"name", name}};
  if (!cwd.empty()) opts["cwd"] = cwd;
  auto r = ExecuteCommand("workbench.action.terminal.new", nlohmann::json::array({opts}), err);
  if (!r) return std::nullopt;
  auto id = StringField(*r, "id");
  return id.empty() ? std::string("default") : id;
}

bool EditorBridge::SendText(const std::string& terminal_id, const std::string& text, bool add_newline, ToolError* err) {
  nlohmann::json arg = {{"terminalId", terminal_id}, {"text", add_newline ? text + "\n" : text}};
  return ExecuteCommand("workbench.action.terminal.sendSequence", nlohmann::json::array({arg}), err).has_value();
}

std::optional<std::string> EditorBridge::GetActiveTerminal(ToolError* err) {
  auto r = ExecuteCommand("workbench.action.terminal.getActive", nullptr, err);
  if (!r) return std::nullopt;
  return StringField(*r, "id");
}

bool EditorBridge::ShowTerminal(const std::string& terminal_id, ToolError* err) {
  return ExecuteCommand("workbench.action.terminal.show", nlohmann::json::array({terminal_id}), err).has_value();
}

bool EditorBridge::DisposeTerminal(const std::string& terminal_id, ToolError* err) {
  return ExecuteCommand("workbench.action.terminal.dispose", nlohmann::json::array({terminal_id}), err).has_value();
}

bool EditorBridge::OpenFile(const std::string& path, ToolError* err) {
  auto exists = workspace_.Exists(path, err);
  if (!exists) return false;
  if (!*exists) {
    SetError(err, ToolErrorKind::kExecutionFailed, "file does not exist: " + path);
    return false;
  }
  return true;
}

bool EditorBridge::CloseFile(const std::string& path, ToolError* err) {
  return workspace_.Resolve(path, err).has_value();
}

bool EditorBridge::InsertText(const std::string& path,
                              const std::string& text,
                              const std::optional<Position>& at,
                              ToolError* err) {
  auto content = workspace_.ReadFile(path, err);
  if (!content) return false;
  auto lines = SplitLines(*content);
  if (at) {
    const int line = ClampLine(at->line, lines);
    auto& cur = lines[line];
    const size_t ch = ClampChar(at->character, cur);
    cur = cur.substr(0, ch) + text + cur.substr(ch);
  } else {
    lines.push_back(text);
  }
  return workspace_.WriteFile(path, JoinLines(lines), err);
}

bool EditorBridge::ReplaceText(const std::string& path, const Range& range, const std::string& text, ToolError* err) {
  auto content = workspace_.ReadFile(path, err);
  if (!content) return false;
  auto lines = SplitLines(*content);
  const int start_line = ClampLine(range.start.line, lines);
  const int end_line = ClampLine(range.end.line, lines);
  if (end_line < start_line) {
    SetError(err, ToolErrorKind::kInvalidParameters, "range end precedes range start");
    return false;
  }
  const auto& first = lines[start_line];
  const auto& last = lines[end_line];
  const std::string merged =
      first.substr(0, ClampChar(range.start.character, first)) + text + last.substr(ClampChar(range.end.character, last));
  lines.erase(lines.begin() + start_line, lines.begin() + end_line + 1);
  lines.insert(lines.begin() + start_line, merged);
  return workspace_.WriteFile(path, JoinLines(lines), err);
}

bool EditorBridge::DeleteText(const std::string& path, const Range& range, ToolError* err) {
  return ReplaceText(path, range, "", err);
}

bool EditorBridge::FormatDocument(const std::string& path, ToolError* err) {
  auto content = workspace_.ReadFile(path, err);
  if (!content) return false;
  std::string out;
  out.reserve(content->size());
  for (size_t i = 0; i < content->size(); i++) {
    const char c = (*content)[i];
    if (c == '\r') {
      out += '\n';
      if (i + 1 < content->size() && (*content)[i + 1] == '\n') i++;
      continue;
    }
    out += c;
  }
  if (out == *content) return true;
  return workspace_.WriteFile(path, out, err);
}

bool EditorBridge::OrganizeImports(const std::string& path, ToolError* err) {
  auto abs = workspace_.Resolve(path, err);
  if (!abs) return false;
  if (!ExecuteCommand("vscode.open", nlohmann::json::array({nlohmann::json{{"path", *abs}}}), err)) return false;
  return ExecuteCommand("editor.action.organizeImports", nullptr, err).has_value();
}

std::optional<std::string> EditorBridge::GetActiveFile(ToolError* err) {
  auto r = ExecuteCommand("workbench.action.files.getActiveFile", nullptr, err);
  if (!r) return std::nullopt;
  if (r->is_string()) return r->get<std::string>();
  return StringField(*r, "path");
}

std::optional<nlohmann::json> EditorBridge::GetOpenFiles(ToolError* err) {
  auto r = ExecuteCommand("workbench.action.files.getOpenFiles", nullptr, err);
  if (!r) return std::nullopt;
  if (!r->is_array()) return nlohmann::json::array();
  return r;
}

std::optional<std::string> EditorBridge::GetSelection(ToolError* err) {
  auto r = ExecuteCommand("editor.action.getSelection", nullptr, err);
  if (!r) return std::nullopt;
  if (r->is_string()) return r->get<std::string>();
  return StringField(*r, "text");
}

std::optional<Position> EditorBridge::GetCursorPosition(ToolError* err) {
  auto r = ExecuteCommand("editor.action.getCursorPosition", nullptr, err);
  if (!r) return std::nullopt;
  auto p = ParsePosition(*r);
  return p ? *p : Position{};
}

bool EditorBridge::SetCursorPosition(const Position& p, ToolError* err) {
  return ExecuteCommand("editor.action.setCursorPosition", nlohmann::json::array({ToJson(p)}), err).has_value();
}

bool EditorBridge::SelectRange(const Range& r, ToolError* err) {
  nlohmann::json range = {{"start", ToJson(r.start)}, {"end", ToJson(r.end)}};
  return ExecuteCommand("editor.action.selectRange", nlohmann::json::array({range}), err).has_value();
}

bool EditorBridge::GoToLine(int line, ToolError* err) {
  return ExecuteCommand("workbench.action.gotoLine", nlohmann::json::array({line}), err).has_value();
}

bool EditorBridge::FindAndReplace(const std::string& find,
                                  const std::string& replace,
                                  const nlohmann::json& options,
                                  ToolError* err) {
  nlohmann::json arg = {{"searchString", find}, {"replaceString", replace}};
  if (options.is_object()) {
    for (const auto& [k, v] : options.items()) arg[k] = v;
  }
  return ExecuteCommand("editor.action.startFindReplaceAction", nlohmann::json::array({arg}), err).has_value();
}

std::optional<nlohmann::json> EditorBridge::ShowMessage(const std::string& message,
                                                        const std::string& type,
                                                        const std::vector<std::string>& items,
                                                        ToolError* err) {
  std::string command = "window.showInformationMessage";
  if (type == "warning") {
    command = "window.showWarningMessage";
  } else if (type == "error") {
    command = "window.showErrorMessage";
  } else if (!type.empty() && type != "info") {
    SetError(err, ToolErrorKind::kInvalidParameters, "unknown message type: " + type);
    return std::nullopt;
  }
  nlohmann::json args = nlohmann::json::array({message});
  for (const auto& item : items) args.push_back(item);
  auto r = ExecuteCommand(command, args, err);
  if (!r) return std::nullopt;
  auto selected = StringField(*r, "selected");
  return selected.empty() ? nlohmann::json() : nlohmann::json(selected);
}

std::optional<nlohmann::json> EditorBridge::ListExtensions(ToolError* err) {
  auto r = ExecuteCommand("workbench.extensions.getInstalled", nullptr, err);
  if (!r) return std::nullopt;
  if (!r->is_array()) return nlohmann::json::array();
  return r;
}

std::optional<nlohmann::json> EditorBridge::GetConfiguration(const std::string& section, ToolError* err) {
  nlohmann::json args = nlohmann::json::array();
  if (!section.empty()) args.push_back(section);
  auto r = ExecuteCommand("workspace.getConfiguration", args, err);
  if (!r) return std::nullopt;
  if (r->is_null()) return nlohmann::json::object();
  return r;
}

nlohmann::json EditorBridge::GetContext() {
  auto version = std::async(std::launch::async, [this]() -> std::optional<nlohmann::json> {
    ToolError e;
    return ExecuteCommand("workbench.action.getVersion", nullptr, &e);
  });
  auto extensions = std::async(std::launch::async, [this]() {
    ToolError e;
    return ListExtensions(&e);
  });
  auto settings = std::async(std::launch::async, [this]() {
    ToolError e;
    return GetConfiguration("", &e);
  });
  auto active = std::async(std::launch::async, [this]() -> std::optional<nlohmann::json> {
    ToolError e;
    auto file = GetActiveFile(&e);
    if (!file || file->empty()) return std::nullopt;
    nlohmann::json info = {{"file", *file}, {"language", LanguageForPath(*file)}};
    auto selection = ExecuteCommand("editor.action.getSelectionRange", nullptr, &e);
    if (selection && !selection->is_null()) info["selection"] = *selection;
    return info;
  });

  nlohmann::json ctx = nlohmann::json::object();
  if (auto v = version.get(); v && !v->is_null()) ctx["version"] = *v;
  if (auto exts = extensions.get()) {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& ext : *exts) {
      if (ext.is_string()) {
        ids.push_back(ext);
      } else if (auto id = StringField(ext, "id"); !id.empty()) {
        ids.push_back(id);
      }
    }
    ctx["extensions"] = ids;
  }
  if (auto s = settings.get()) ctx["settings"] = *s;
  if (auto a = active.get()) ctx["activeEditor"] = *a;
  std::cout << "[editor] context keys=" << ctx.size() << "\n";
  return ctx;
}

std::string EditorBridge::LanguageForPath(const std::string& path) {
  static const std::unordered_map<std::string, std::string> kLanguages = {
      {"ts", "typescript"}, {"js", "javascript"}, {"tsx", "typescriptreact"}, {"jsx", "javascriptreact"},
      {"py", "python"},     {"java", "java"},     {"cpp", "cpp"},             {"cc", "cpp"},
      {"hpp", "cpp"},       {"h", "c"},           {"c", "c"},                 {"cs", "csharp"},
      {"go", "go"},         {"rs", "rust"},       {"php", "php"},             {"rb", "ruby"},
      {"swift", "swift"},   {"kt", "kotlin"},     {"scala", "scala"},         {"html", "html"},
      {"css", "css"},       {"scss", "scss"},     {"sass", "sass"},           {"less", "less"},
      {"json", "json"},     {"xml", "xml"},       {"yaml", "yaml"},           {"yml", "yaml"},
      {"md", "markdown"},   {"sql", "sql"},       {"sh", "shellscript"},      {"bash", "shellscript"},
      {"zsh", "shellscript"}, {"fish", "shellscript"}};
  const auto slash = path.find_last_of('/');
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "plaintext";
  std::string ext = path.substr(dot + 1);
  for (auto& ch : ext) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  auto it = kLanguages.find(ext);
  return it == kLanguages.end() ? "plaintext" : it->second;
}

}  // namespace toolserver
