#include "workspace.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace toolserver {
namespace fs = std::filesystem;
namespace {

constexpr int kMaxSymlinkHops = 40;

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::string PercentDecode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  auto hex = [](char x) -> int {
    if (x >= '0' && x <= '9') return x - '0';
    if (x >= 'a' && x <= 'f') return 10 + (x - 'a');
    if (x >= 'A' && x <= 'F') return 10 + (x - 'A');
    return -1;
  };
  for (size_t i = 0; i < in.size(); i++) {
    const char ch = in[i];
    if (ch == '%' && i + 2 < in.size()) {
      const int ha = hex(in[i + 1]);
      const int hb = hex(in[i + 2]);
      if (ha >= 0 && hb >= 0) {
        out.push_back(static_cast<char>((ha << 4) | hb));
        i += 2;
        continue;
      }
    }
    out.push_back(ch);
  }
  return out;
}

static bool IsUnder(const std::string& path, const std::string& root) {
  if (path == root) return true;
  if (root == "/") return true;
  return path.size() > root.size() && path.compare(0, root.size(), root) == 0 && path[root.size()] == '/';
}

static int64_t ToUnixSeconds(const struct timespec& ts) {
  return static_cast<int64_t>(ts.tv_sec);
}

static std::string OctalMode(mode_t mode) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%o", static_cast<unsigned>(mode));
  return buf;
}

static bool Fail(ToolError* err, const std::string& what, const std::string& path, const std::string& reason) {
  SetError(err, ToolErrorKind::kExecutionFailed, "failed to " + what + " " + path + ": " + reason);
  return false;
}

static bool EnsureParent(const fs::path& p, std::error_code* ec) {
  const auto parent = p.parent_path();
  if (parent.empty()) return true;
  fs::create_directories(parent, *ec);
  return !*ec;
}

}  // namespace

nlohmann::json ToJson(const DirectoryEntry& e) {
  nlohmann::json j;
  j["name"] = e.name;
  j["type"] = e.type;
  j["path"] = e.path;
  if (e.size) j["size"] = *e.size;
  j["lastModified"] = e.modified;
  return j;
}

nlohmann::json ToJson(const FileStats& s) {
  return {{"size", s.size},
          {"modified", s.modified},
          {"changed", s.changed},
          {"isDirectory", s.is_directory},
          {"isFile", s.is_file},
          {"permissions", s.permissions}};
}

Workspace::Workspace(std::string root) : root_(std::move(root)) {}

bool Workspace::EnsureRoot(ToolError* err) const {
  std::error_code ec;
  if (fs::is_directory(root_, ec)) return true;
  fs::create_directories(root_, ec);
  if (ec) return Fail(err, "create workspace root", root_, ec.message());
  std::cout << "[workspace] created root=" << root_ << "\n";
  return true;
}

std::optional<std::string> Workspace::Resolve(const std::string& path, ToolError* err) const {
  if (root_.empty()) {
    SetError(err, ToolErrorKind::kExecutionFailed, "workspace root is not configured");
    return std::nullopt;
  }
  std::string raw = path;
  constexpr const char* kFileScheme = "file://";
  if (ToLower(raw).rfind(kFileScheme, 0) == 0) {
    raw = raw.substr(std::strlen(kFileScheme));
    if (raw.rfind("localhost/", 0) == 0) raw = raw.substr(std::strlen("localhost"));
    raw = PercentDecode(raw);
  }
  if (raw.find('\0') != std::string::npos) {
    SetError(err, ToolErrorKind::kInvalidParameters, "path contains a NUL byte");
    return std::nullopt;
  }

  std::error_code ec;
  auto root = fs::weakly_canonical(fs::path(root_), ec);
  if (ec || root.empty()) {
    SetError(err, ToolErrorKind::kExecutionFailed, "invalid workspace root: " + root_);
    return std::nullopt;
  }

  fs::path p = raw;
  if (p.is_relative()) p = root / p;
  p = p.lexically_normal();
  if (!p.has_filename() && p != p.root_path()) p = p.parent_path();

  // The operand is the last component itself, so a symlink is removed or
  // renamed rather than its target.
  fs::path operand = p;
  if (p.has_filename() && p != p.root_path()) {
    operand = fs::weakly_canonical(p.parent_path(), ec) / p.filename();
    if (ec) {
      SetError(err, ToolErrorKind::kExecutionFailed, "invalid path: " + path);
      return std::nullopt;
    }
  }
  const auto root_s = root.generic_string();
  auto operand_s = operand.generic_string();
  while (operand_s.size() > 1 && operand_s.back() == '/') operand_s.pop_back();
  if (!IsUnder(operand_s, root_s)) {
    SetError(err, ToolErrorKind::kPathTraversalRejected, "path escapes the workspace root: " + path);
    return std::nullopt;
  }

  // Reads and writes follow links. weakly_canonical resolves existing ones;
  // a dangling link is walked hop by hop and each hop must stay inside.
  auto target = fs::weakly_canonical(operand, ec);
  for (int hops = 0; !ec && fs::is_symlink(target, ec); hops++) {
    if (hops >= kMaxSymlinkHops) {
      SetError(err, ToolErrorKind::kExecutionFailed, "too many levels of symbolic links: " + path);
      return std::nullopt;
    }
    auto next = fs::read_symlink(target, ec);
    if (ec) break;
    if (next.is_relative()) next = target.parent_path() / next;
    target = fs::weakly_canonical(next.lexically_normal(), ec);
    if (!ec && !IsUnder(target.generic_string(), root_s)) break;
  }
  ec.clear();
  auto target_s = target.generic_string();
  while (target_s.size() > 1 && target_s.back() == '/') target_s.pop_back();
  if (!IsUnder(target_s, root_s)) {
    SetError(err, ToolErrorKind::kPathTraversalRejected, "path escapes the workspace root: " + path);
    return std::nullopt;
  }
  return operand_s;
}

std::string Workspace::Relative(const std::string& absolute) const {
  std::error_code ec;
  auto root = fs::weakly_canonical(fs::path(root_), ec);
  if (ec) return absolute;
  auto rel = fs::path(absolute).lexically_relative(root);
  if (rel.empty()) return absolute;
  return rel.generic_string();
}

std::optional<std::string> Workspace::ReadFile(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return std::nullopt;
  std::error_code ec;
  if (fs::is_directory(*abs, ec)) {
    Fail(err, "read file", path, "is a directory");
    return std::nullopt;
  }
  std::ifstream in(*abs, std::ios::binary);
  if (!in) {
    Fail(err, "read file", path, std::strerror(errno));
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

bool Workspace::WriteFile(const std::string& path, const std::string& content, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return false;
  std::error_code ec;
  if (!EnsureParent(*abs, &ec)) return Fail(err, "write file", path, ec.message());
  std::ofstream out(*abs, std::ios::binary | std::ios::trunc);
  if (!out) return Fail(err, "write file", path, std::strerror(errno));
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) return Fail(err, "write file", path, "write error");
  return true;
}

bool Workspace::CreateFile(const std::string& path, const std::string& content, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return false;
  std::error_code ec;
  if (fs::exists(*abs, ec)) return Fail(err, "create file", path, "file already exists");
  return WriteFile(*abs, content, err);
}

bool Workspace::DeleteFile(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return false;
  std::error_code ec;
  if (fs::is_directory(*abs, ec)) return Fail(err, "delete file", path, "is a directory");
  if (!fs::remove(*abs, ec)) return Fail(err, "delete file", path, ec ? ec.message() : "no such file");
  return true;
}

bool Workspace::RenameFile(const std::string& from, const std::string& to, ToolError* err) const {
  auto src = Resolve(from, err);
  if (!src) return false;
  auto dst = Resolve(to, err);
  if (!dst) return false;
  std::error_code ec;
  if (!EnsureParent(*dst, &ec)) return Fail(err, "rename file", from, ec.message());
  fs::rename(*src, *dst, ec);
  if (ec) return Fail(err, "rename file", from, ec.message());
  return true;
}

bool Workspace::CopyFile(const std::string& source, const std::string& destination, ToolError* err) const {
  auto src = Resolve(source, err);
  if (!src) return false;
  auto dst = Resolve(destination, err);
  if (!dst) return false;
  std::error_code ec;
  if (!EnsureParent(*dst, &ec)) return Fail(err, "copy file", source, ec.message());
  fs::copy_file(*src, *dst, fs::copy_options::overwrite_existing, ec);
  if (ec) return Fail(err, "copy file", source, ec.message());
  return true;
}

bool Workspace::CreateDirectory(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return false;
  std::error_code ec;
  fs::create_directories(*abs, ec);
  if (ec) return Fail(err, "create directory", path, ec.message());
  return true;
}

bool Workspace::DeleteDirectory(const std::string& path, bool recursive, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return false;
  std::error_code ec;
  auto root = fs::weakly_canonical(fs::path(root_), ec);
  if (!ec && *abs == root.generic_string()) return Fail(err, "delete directory", path, "refusing to delete the workspace root");
  if (!fs::is_directory(*abs, ec)) return Fail(err, "delete directory", path, "not a directory");
  if (recursive) {
    fs::remove_all(*abs, ec);
  } else {
    fs::remove(*abs, ec);
  }
  if (ec) return Fail(err, "delete directory", path, ec.message());
  return true;
}

std::optional<std::vector<DirectoryEntry>> Workspace::ListDirectory(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return std::nullopt;
  std::error_code ec;
  fs::directory_iterator it(*abs, ec);
  if (ec) {
    Fail(err, "list directory", path, ec.message());
    return std::nullopt;
  }
  std::vector<DirectoryEntry> out;
  for (const auto& entry : it) {
    DirectoryEntry e;
    e.name = entry.path().filename().string();
    const bool is_dir = entry.is_directory(ec);
    e.type = is_dir ? "directory" : "file";
    e.path = Relative(entry.path().generic_string());
    struct stat st {};
    if (::stat(entry.path().c_str(), &st) == 0) {
      if (!is_dir) e.size = static_cast<uint64_t>(st.st_size);
      e.modified = ToUnixSeconds(st.st_mtim);
    }
    out.push_back(std::move(e));
  }
  std::sort(out.begin(), out.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
  return out;
}

std::optional<std::vector<std::string>> Workspace::ListFiles(const std::string& path, ToolError* err) const {
  auto entries = ListDirectory(path, err);
  if (!entries) return std::nullopt;
  std::vector<std::string> out;
  for (const auto& e : *entries) {
    if (e.type == "file") out.push_back(e.name);
  }
  return out;
}

std::optional<std::vector<std::string>> Workspace::ListDirectories(const std::string& path, ToolError* err) const {
  auto entries = ListDirectory(path, err);
  if (!entries) return std::nullopt;
  std::vector<std::string> out;
  for (const auto& e : *entries) {
    if (e.type == "directory") out.push_back(e.name);
  }
  return out;
}

std::optional<bool> Workspace::Exists(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return std::nullopt;
  std::error_code ec;
  return fs::exists(*abs, ec);
}

std::optional<FileStats> Workspace::GetStats(const std::string& path, ToolError* err) const {
  auto abs = Resolve(path, err);
  if (!abs) return std::nullopt;
  struct stat st {};
  if (::stat(abs->c_str(), &st) != 0) {
    Fail(err, "stat", path, std::strerror(errno));
    return std::nullopt;
  }
  FileStats s;
  s.size = static_cast<uint64_t>(st.st_size);
  s.modified = ToUnixSeconds(st.st_mtim);
  s.changed = ToUnixSeconds(st.st_ctim);
  s.is_directory = S_ISDIR(st.st_mode);
  s.is_file = S_ISREG(st.st_mode);
  s.permissions = OctalMode(st.st_mode & 07777);
  return s;
}

}  // namespace toolserver
