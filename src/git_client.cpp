#include "git_client.hpp"

#include "process.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

namespace toolserver {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string Join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

static int ParseCount(const std::string& header, const std::string& key) {
  auto pos = header.find(key);
  if (pos == std::string::npos) return 0;
  pos += key.size();
  int v = 0;
  while (pos < header.size() && std::isdigit(static_cast<unsigned char>(header[pos]))) {
    v = v * 10 + (header[pos] - '0');
    pos++;
  }
  return v;
}

static bool Contains(const std::vector<std::string>& allowed, const std::string& v) {
  for (const auto& a : allowed) {
    if (a == v) return true;
  }
  return false;
}

}  // namespace

nlohmann::json GitStatus::ToJson() const {
  nlohmann::json j;
  j["branch"] = branch;
  if (!upstream.empty()) j["upstream"] = upstream;
  j["ahead"] = ahead;
  j["behind"] = behind;
  j["modified"] = modified;
  j["added"] = added;
  j["deleted"] = deleted;
  j["renamed"] = renamed;
  j["untracked"] = untracked;
  return j;
}

GitStatus ParsePorcelainStatus(const std::string& text) {
  GitStatus st;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.rfind("## ", 0) == 0) {
      std::string head = line.substr(3);
      const std::string kNoCommits = "No commits yet on ";
      if (head.rfind(kNoCommits, 0) == 0) {
        st.branch = head.substr(kNoCommits.size());
        continue;
      }
      auto bracket = head.find(" [");
      std::string tracking = bracket == std::string::npos ? std::string() : head.substr(bracket);
      std::string names = bracket == std::string::npos ? head : head.substr(0, bracket);
      auto dots = names.find("...");
      if (dots != std::string::npos) {
        st.branch = names.substr(0, dots);
        st.upstream = names.substr(dots + 3);
      } else {
        st.branch = names;
      }
      st.ahead = ParseCount(tracking, "ahead ");
      st.behind = ParseCount(tracking, "behind ");
      continue;
    }
    if (line.size() < 4) continue;
    const char x = line[0];
    const char y = line[1];
    std::string path = line.substr(3);
    if (x == '?' && y == '?') {
      st.untracked.push_back(path);
      continue;
    }
    if (x == 'R' || y == 'R') {
      auto arrow = path.find(" -> ");
      st.renamed.push_back(arrow == std::string::npos ? path : path.substr(arrow + 4));
      continue;
    }
    if (x == 'A') st.added.push_back(path);
    if (x == 'D' || y == 'D') st.deleted.push_back(path);
    if (x == 'M' || y == 'M') st.modified.push_back(path);
  }
  return st;
}

GitClient::GitClient(GitOptions opts) : opts_(std::move(opts)), workspace_(opts_.workspace_root) {
  opts_.env["GIT_TERMINAL_PROMPT"] = "0";
}

std::optional<std::string> GitClient::Run(const std::vector<std::string>& args,
                                          const std::optional<std::string>& path,
                                          ToolError* err) const {
  std::string cwd = opts_.workspace_root;
  if (path && !path->empty()) {
    auto resolved = workspace_.Resolve(*path, err);
    if (!resolved) return std::nullopt;
    cwd = *resolved;
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(opts_.git);
  argv.insert(argv.end(), args.begin(), args.end());

  CommandOptions co;
  co.cwd = cwd;
  co.env = opts_.env;
  co.timeout_ms = opts_.timeout_ms;
  co.kill_grace_ms = opts_.kill_grace_ms;
  auto r = RunArgv(argv, co, err);
  if (!r) return std::nullopt;

  std::cout << "[git] args=" << Join(args, " ") << " cwd=" << cwd << " exit_code=" << r->exit_code
            << " timed_out=" << (r->timed_out ? 1 : 0) << "\n";
  if (r->timed_out) {
    SetError(err, ToolErrorKind::kTimeout, "git " + (args.empty() ? std::string() : args[0]) + " timed out");
    return std::nullopt;
  }
  if (r->exit_code != 0) {
    auto msg = Trim(r->stderr_text);
    if (msg.empty()) msg = Trim(r->stdout_text);
    if (msg.empty()) msg = "exit code " + std::to_string(r->exit_code);
    SetError(err, ToolErrorKind::kExecutionFailed, "git " + (args.empty() ? std::string() : args[0]) + ": " + msg);
    return std::nullopt;
  }
  return r->stdout_text;
}

std::optional<GitStatus> GitClient::Status(const std::optional<std::string>& path, ToolError* err) const {
  auto out = Run({"status", "--porcelain=v1", "-b"}, path, err);
  if (!out) return std::nullopt;
  return ParsePorcelainStatus(*out);
}

bool GitClient::Add(const std::vector<std::string>& files, const std::optional<std::string>& path, ToolError* err) const {
  if (files.empty()) {
    SetError(err, ToolErrorKind::kInvalidParameters, "files must not be empty");
    return false;
  }
  std::vector<std::string> args = {"add", "--"};
  args.insert(args.end(), files.begin(), files.end());
  return Run(args, path, err).has_value();
}

std::optional<std::string> GitClient::Commit(const std::string& message,
                                             const std::optional<std::string>& path,
                                             ToolError* err) const {
  return Run({"commit", "-m", message}, path, err);
}

std::optional<std::string> GitClient::Push(const std::string& remote, const std::string& branch, ToolError* err) const {
  std::vector<std::string> args = {"push"};
  if (!remote.empty()) args.push_back(remote);
  if (!remote.empty() && !branch.empty()) args.push_back(branch);
  return Run(args, std::nullopt, err);
}

std::optional<std::string> GitClient::Pull(const std::string& remote, const std::string& branch, ToolError* err) const {
  std::vector<std::string> args = {"pull"};
  if (!remote.empty()) args.push_back(remote);
  if (!remote.empty() && !branch.empty()) args.push_back(branch);
  return Run(args, std::nullopt, err);
}

bool GitClient::Checkout(const std::string& ref, ToolError* err) const {
  return Run({"checkout", ref}, std::nullopt, err).has_value();
}

bool GitClient::CreateBranch(const std::string& name, bool checkout, ToolError* err) const {
  if (checkout) return Run({"checkout", "-b", name}, std::nullopt, err).has_value();
  return Run({"branch", name}, std::nullopt, err).has_value();
}

std::optional<std::vector<std::string>> GitClient::ListBranches(bool include_remote, ToolError* err) const {
  std::vector<std::string> args = {"branch", "--format=%(refname:short)"};
  if (include_remote) args.push_back("-a");
  auto out = Run(args, std::nullopt, err);
  if (!out) return std::nullopt;
  std::vector<std::string> branches;
  std::istringstream iss(*out);
  std::string line;
  while (std::getline(iss, line)) {
    line = Trim(line);
    if (line.empty() || line == "HEAD" || line.find("/HEAD") != std::string::npos) continue;
    branches.push_back(line);
  }
  return branches;
}

std::optional<std::string> GitClient::CurrentBranch(const std::optional<std::string>& path, ToolError* err) const {
  auto out = Run({"rev-parse", "--abbrev-ref", "HEAD"}, path, err);
  if (!out) return std::nullopt;
  return Trim(*out);
}

std::optional<std::string> GitClient::Diff(const std::string& file, bool staged, ToolError* err) const {
  std::vector<std::string> args = {"diff"};
  if (staged) args.push_back("--cached");
  if (!file.empty()) {
    auto resolved = workspace_.Resolve(file, err);
    if (!resolved) return std::nullopt;
    args.push_back("--");
    args.push_back(*resolved);
  }
  return Run(args, std::nullopt, err);
}

std::optional<std::vector<GitCommitInfo>> GitClient::Log(int limit, ToolError* err) const {
  if (limit <= 0) limit = 10;
  // Unit and record separators keep multi-word subjects intact.
  auto out = Run({"log", "-n", std::to_string(limit), "--format=%H%x1f%an%x1f%aI%x1f%s%x1e"}, std::nullopt, err);
  if (!out) return std::nullopt;
  std::vector<GitCommitInfo> commits;
  size_t start = 0;
  while (start < out->size()) {
    size_t end = out->find('\x1e', start);
    if (end == std::string::npos) end = out->size();
    std::string record = Trim(out->substr(start, end - start));
    start = end + 1;
    if (record.empty()) continue;
    std::vector<std::string> fields;
    size_t fs = 0;
    while (true) {
      size_t sep = record.find('\x1f', fs);
      if (sep == std::string::npos) {
        fields.push_back(record.substr(fs));
        break;
      }
      fields.push_back(record.substr(fs, sep - fs));
      fs = sep + 1;
    }
    if (fields.size() < 4) continue;
    commits.push_back({fields[0], fields[1], fields[2], fields[3]});
  }
  return commits;
}

bool GitClient::Reset(const std::string& mode, const std::string& commit, ToolError* err) const {
  const std::string m = mode.empty() ? "mixed" : mode;
  if (!Contains({"soft", "mixed", "hard"}, m)) {
    SetError(err, ToolErrorKind::kInvalidParameters, "unknown reset mode: " + m);
    return false;
  }
  return Run({"reset", "--" + m, commit.empty() ? "HEAD" : commit}, std::nullopt, err).has_value();
}

std::optional<std::string> GitClient::Stash(const std::string& action,
                                            const std::string& message,
                                            const std::optional<int>& index,
                                            ToolError* err) const {
  const std::string a = action.empty() ? "push" : action;
  if (!Contains({"push", "pop", "list", "apply", "drop"}, a)) {
    SetError(err, ToolErrorKind::kInvalidParameters, "unknown stash action: " + a);
    return std::nullopt;
  }
  std::vector<std::string> args = {"stash", a};
  if (a == "push" && !message.empty()) {
    args.push_back("-m");
    args.push_back(message);
  }
  if (index && (a == "pop" || a == "apply" || a == "drop")) args.push_back("stash@{" + std::to_string(*index) + "}");
  return Run(args, std::nullopt, err);
}

bool GitClient::Init(const std::optional<std::string>& path, ToolError* err) const {
  if (path && !path->empty()) {
    if (!workspace_.CreateDirectory(*path, err)) return false;
  }
  return Run({"init"}, path, err).has_value();
}

bool GitClient::Clone(const std::string& url,
                      const std::optional<std::string>& path,
                      const std::string& branch,
                      ToolError* err) const {
  std::vector<std::string> args = {"clone"};
  if (!branch.empty()) {
    args.push_back("--branch");
    args.push_back(branch);
  }
  args.push_back("--");
  args.push_back(url);
  if (path && !path->empty()) {
    auto resolved = workspace_.Resolve(*path, err);
    if (!resolved) return false;
    args.push_back(*resolved);
  }
  return Run(args, std::nullopt, err).has_value();
}

}  // namespace toolserver
