#include "workspace.hpp"

#include "dispatcher.hpp"
#include "tools/tool_families.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <functional>

namespace toolserver {
namespace {

using test_support::ReadAll;
using test_support::ScopedTempDir;
using test_support::WriteAll;

class WorkspaceTest : public ::testing::Test {
 protected:
  ScopedTempDir dir_;
  Workspace ws_{dir_.path()};
};

TEST_F(WorkspaceTest, WriteThenReadRoundTrip) {
  ToolError err;
  ASSERT_TRUE(ws_.WriteFile("nested/dir/a.txt", "hello\nworld", &err)) << err.message;
  auto content = ws_.ReadFile("nested/dir/a.txt", &err);
  ASSERT_TRUE(content.has_value()) << err.message;
  EXPECT_EQ(*content, "hello\nworld");
  EXPECT_EQ(ReadAll(dir_.Join("nested/dir/a.txt")), "hello\nworld");
}

TEST_F(WorkspaceTest, TraversalRejectedForEveryPrimitive) {
  const std::string bad = "../../etc/passwd";
  std::vector<std::pair<std::string, std::function<bool(ToolError*)>>> calls = {
      {"ReadFile", [&](ToolError* e) { return ws_.ReadFile(bad, e).has_value(); }},
      {"WriteFile", [&](ToolError* e) { return ws_.WriteFile(bad, "x", e); }},
      {"CreateFile", [&](ToolError* e) { return ws_.CreateFile(bad, "x", e); }},
      {"DeleteFile", [&](ToolError* e) { return ws_.DeleteFile(bad, e); }},
      {"RenameFile.from", [&](ToolError* e) { return ws_.RenameFile(bad, "ok.txt", e); }},
      {"RenameFile.to", [&](ToolError* e) { return ws_.RenameFile("ok.txt", bad, e); }},
      {"CopyFile.source", [&](ToolError* e) { return ws_.CopyFile(bad, "ok.txt", e); }},
      {"CopyFile.destination", [&](ToolError* e) { return ws_.CopyFile("ok.txt", bad, e); }},
      {"CreateDirectory", [&](ToolError* e) { return ws_.CreateDirectory(bad, e); }},
      {"DeleteDirectory", [&](ToolError* e) { return ws_.DeleteDirectory(bad, true, e); }},
      {"ListDirectory", [&](ToolError* e) { return ws_.ListDirectory(bad, e).has_value(); }},
      {"ListFiles", [&](ToolError* e) { return ws_.ListFiles(bad, e).has_value(); }},
      {"ListDirectories", [&](ToolError* e) { return ws_.ListDirectories(bad, e).has_value(); }},
      {"Exists", [&](ToolError* e) { return ws_.Exists(bad, e).has_value(); }},
      {"GetStats", [&](ToolError* e) { return ws_.GetStats(bad, e).has_value(); }},
  };
  WriteAll(dir_.Join("ok.txt"), "ok");
  for (const auto& [name, call] : calls) {
    ToolError err;
    EXPECT_FALSE(call(&err)) << name;
    EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected) << name << ": " << err.message;
  }
  EXPECT_EQ(ReadAll(dir_.Join("ok.txt")), "ok");
}

TEST_F(WorkspaceTest, AbsolutePathsInsideRootAndFileUris) {
  WriteAll(dir_.Join("a b.txt"), "spaced");
  ToolError err;
  auto abs = ws_.ReadFile(dir_.Join("a b.txt"), &err);
  ASSERT_TRUE(abs.has_value()) << err.message;
  EXPECT_EQ(*abs, "spaced");

  auto uri = ws_.ReadFile("file://" + dir_.path() + "/a%20b.txt", &err);
  ASSERT_TRUE(uri.has_value()) << err.message;
  EXPECT_EQ(*uri, "spaced");

  EXPECT_FALSE(ws_.ReadFile("/etc/hostname", &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
}

TEST_F(WorkspaceTest, SiblingWithSharedPrefixIsOutside) {
  ToolError err;
  const std::string sibling = "../" + std::filesystem::path(dir_.path()).filename().string() + "-evil/x";
  EXPECT_FALSE(ws_.WriteFile(sibling, "x", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
}

TEST_F(WorkspaceTest, SymlinkOutOfRootRejected) {
  ASSERT_EQ(::symlink("/etc", dir_.Join("etc-link").c_str()), 0);
  ToolError err;
  EXPECT_FALSE(ws_.ReadFile("etc-link/hostname", &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
}

TEST_F(WorkspaceTest, DeleteAndRenameActOnTheLinkItself) {
  WriteAll(dir_.Join("real.txt"), "payload");
  ASSERT_EQ(::symlink("real.txt", dir_.Join("link").c_str()), 0);
  ASSERT_EQ(::symlink("real.txt", dir_.Join("link2").c_str()), 0);
  ToolError err;

  auto through = ws_.ReadFile("link", &err);
  ASSERT_TRUE(through.has_value()) << err.message;
  EXPECT_EQ(*through, "payload");

  ASSERT_TRUE(ws_.DeleteFile("link", &err)) << err.message;
  EXPECT_FALSE(std::filesystem::is_symlink(dir_.Join("link")));
  EXPECT_EQ(ReadAll(dir_.Join("real.txt")), "payload");

  ASSERT_TRUE(ws_.RenameFile("link2", "moved-link", &err)) << err.message;
  EXPECT_TRUE(std::filesystem::is_symlink(dir_.Join("moved-link")));
  EXPECT_FALSE(std::filesystem::exists(dir_.Join("link2")));
  EXPECT_TRUE(std::filesystem::is_regular_file(std::filesystem::symlink_status(dir_.Join("real.txt"))));
}

TEST_F(WorkspaceTest, DanglingLinkOutOfRootRejected) {
  ScopedTempDir outside;
  const std::string victim = outside.Join("created-through-link.txt");
  ASSERT_EQ(::symlink(victim.c_str(), dir_.Join("out").c_str()), 0);
  ToolError err;
  EXPECT_FALSE(ws_.WriteFile("out", "x", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected) << err.message;
  EXPECT_FALSE(std::filesystem::exists(victim));
  EXPECT_FALSE(ws_.CreateFile("out", "x", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
  EXPECT_TRUE(std::filesystem::is_symlink(dir_.Join("out")));
}

TEST_F(WorkspaceTest, CreateFileFailsWhenPresent) {
  ToolError err;
  ASSERT_TRUE(ws_.CreateFile("new.txt", "one", &err)) << err.message;
  EXPECT_FALSE(ws_.CreateFile("new.txt", "two", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kExecutionFailed);
  EXPECT_EQ(ReadAll(dir_.Join("new.txt")), "one");
}

TEST_F(WorkspaceTest, RenameCopyDelete) {
  ToolError err;
  ASSERT_TRUE(ws_.WriteFile("a.txt", "A", &err));
  ASSERT_TRUE(ws_.CopyFile("a.txt", "copies/b.txt", &err)) << err.message;
  ASSERT_TRUE(ws_.RenameFile("a.txt", "c.txt", &err)) << err.message;

  EXPECT_FALSE(*ws_.Exists("a.txt", &err));
  EXPECT_TRUE(*ws_.Exists("c.txt", &err));
  EXPECT_EQ(ReadAll(dir_.Join("copies/b.txt")), "A");

  ASSERT_TRUE(ws_.DeleteFile("c.txt", &err));
  EXPECT_FALSE(ws_.DeleteFile("c.txt", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kExecutionFailed);
}

TEST_F(WorkspaceTest, Directories) {
  ToolError err;
  ASSERT_TRUE(ws_.CreateDirectory("d/e", &err));
  ASSERT_TRUE(ws_.WriteFile("d/file.txt", "12345", &err));

  auto entries = ws_.ListDirectory("d", &err);
  ASSERT_TRUE(entries.has_value()) << err.message;
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[0].name, "e");
  EXPECT_EQ((*entries)[0].type, "directory");
  EXPECT_EQ((*entries)[0].path, "d/e");
  EXPECT_FALSE((*entries)[0].size.has_value());
  EXPECT_EQ((*entries)[1].name, "file.txt");
  EXPECT_EQ((*entries)[1].size.value_or(0), 5u);

  EXPECT_EQ(*ws_.ListFiles("d", &err), std::vector<std::string>{"file.txt"});
  EXPECT_EQ(*ws_.ListDirectories("d", &err), std::vector<std::string>{"e"});

  EXPECT_FALSE(ws_.DeleteDirectory("d", false, &err));
  ASSERT_TRUE(ws_.DeleteDirectory("d", true, &err)) << err.message;
  EXPECT_FALSE(*ws_.Exists("d", &err));
}

TEST_F(WorkspaceTest, RootCannotBeDeleted) {
  ToolError err;
  EXPECT_FALSE(ws_.DeleteDirectory(".", true, &err));
  EXPECT_TRUE(std::filesystem::is_directory(dir_.path()));
}

TEST_F(WorkspaceTest, Stats) {
  ToolError err;
  ASSERT_TRUE(ws_.WriteFile("s.txt", "abc", &err));
  auto st = ws_.GetStats("s.txt", &err);
  ASSERT_TRUE(st.has_value()) << err.message;
  EXPECT_EQ(st->size, 3u);
  EXPECT_TRUE(st->is_file);
  EXPECT_FALSE(st->is_directory);
  EXPECT_FALSE(st->permissions.empty());

  auto j = ToJson(*st);
  EXPECT_EQ(j["size"], 3);
  EXPECT_EQ(j["isFile"], true);

  EXPECT_FALSE(ws_.GetStats("missing", &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kExecutionFailed);
}

class FilesystemToolsTest : public ::testing::Test {
 protected:
  void SetUp() override { RegisterFilesystemTools(registry_, ws_); }

  ScopedTempDir dir_;
  Workspace ws_{dir_.path()};
  ToolRegistry registry_;
  Dispatcher dispatcher_{&registry_};
};

TEST_F(FilesystemToolsTest, WriteThenReadThroughDispatcher) {
  auto wrote = dispatcher_.Invoke({"fs_write_file", {{"path", "a.txt"}, {"content", "x"}}});
  ASSERT_TRUE(wrote.success) << wrote.ToJson().dump();
  EXPECT_EQ(wrote.result["path"], "a.txt");
  EXPECT_EQ(wrote.result["bytesWritten"], 1);

  auto read = dispatcher_.Invoke({"fs_read_file", {{"path", "a.txt"}}});
  ASSERT_TRUE(read.success) << read.ToJson().dump();
  EXPECT_EQ(read.result["content"], "x");
}

TEST_F(FilesystemToolsTest, ResultShapes) {
  auto created = dispatcher_.Invoke({"fs_create_file", {{"path", "src/main.cpp"}, {"content", "int main() {}\n"}}});
  ASSERT_TRUE(created.success) << created.ToJson().dump();
  EXPECT_EQ(created.result["created"], true);

  auto again = dispatcher_.Invoke({"fs_create_file", {{"path", "src/main.cpp"}}});
  EXPECT_FALSE(again.success);
  EXPECT_EQ(again.error->kind, ToolErrorKind::kExecutionFailed);

  ASSERT_TRUE(dispatcher_.Invoke({"fs_create_directory", {{"path", "src/util"}}}).success);
  auto copied = dispatcher_.Invoke({"fs_copy_file", {{"source", "src/main.cpp"}, {"destination", "src/util/copy.cpp"}}});
  ASSERT_TRUE(copied.success) << copied.ToJson().dump();
  EXPECT_EQ(copied.result["destination"], "src/util/copy.cpp");

  auto listed = dispatcher_.Invoke({"fs_list_directory", {{"path", "src"}}});
  ASSERT_TRUE(listed.success) << listed.ToJson().dump();
  ASSERT_EQ(listed.result["entries"].size(), 2u);
  EXPECT_EQ(listed.result["entries"][0]["name"], "main.cpp");
  EXPECT_EQ(listed.result["entries"][0]["type"], "file");
  EXPECT_EQ(listed.result["entries"][0]["path"], "src/main.cpp");
  EXPECT_EQ(listed.result["entries"][0]["size"], 14);
  EXPECT_EQ(listed.result["entries"][1]["name"], "util");
  EXPECT_EQ(listed.result["entries"][1]["type"], "directory");

  auto stats = dispatcher_.Invoke({"fs_get_stats", {{"path", "src/main.cpp"}}});
  ASSERT_TRUE(stats.success) << stats.ToJson().dump();
  EXPECT_EQ(stats.result["path"], "src/main.cpp");
  EXPECT_EQ(stats.result["size"], 14);
  EXPECT_EQ(stats.result["isFile"], true);
  EXPECT_EQ(stats.result["isDirectory"], false);
  EXPECT_TRUE(stats.result["permissions"].is_string());

  auto renamed = dispatcher_.Invoke({"fs_rename_file", {{"oldPath", "src/main.cpp"}, {"newPath", "app.cpp"}}});
  ASSERT_TRUE(renamed.success) << renamed.ToJson().dump();
  EXPECT_EQ(dispatcher_.Invoke({"fs_exists", {{"path", "src/main.cpp"}}}).result["exists"], false);
  EXPECT_EQ(dispatcher_.Invoke({"fs_exists", {{"path", "app.cpp"}}}).result["exists"], true);

  ASSERT_TRUE(dispatcher_.Invoke({"fs_delete_file", {{"path", "app.cpp"}}}).success);
  auto not_empty = dispatcher_.Invoke({"fs_delete_directory", {{"path", "src"}}});
  EXPECT_FALSE(not_empty.success);
  auto removed = dispatcher_.Invoke({"fs_delete_directory", {{"path", "src"}, {"recursive", true}}});
  ASSERT_TRUE(removed.success) << removed.ToJson().dump();
  EXPECT_EQ(removed.result["deleted"], true);
  EXPECT_FALSE(std::filesystem::exists(dir_.Join("src")));
}

TEST_F(FilesystemToolsTest, TraversalIsRejectedAsToolFailure) {
  auto r = dispatcher_.Invoke({"fs_write_file", {{"path", "../../escaped.txt"}, {"content", "x"}}});
  EXPECT_FALSE(r.success);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ToolErrorKind::kPathTraversalRejected);
  EXPECT_EQ(r.ToJson()["error"]["kind"], "PathTraversalRejected");
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(dir_.path()).parent_path().parent_path() /
                                       "escaped.txt"));
}

TEST(WorkspaceRootTest, EnsureRootCreatesMissingRoot) {
  ScopedTempDir dir;
  Workspace ws(dir.Join("fresh/root"));
  ToolError err;
  ASSERT_TRUE(ws.EnsureRoot(&err)) << err.message;
  EXPECT_TRUE(std::filesystem::is_directory(dir.Join("fresh/root")));
}

}  // namespace
}  // namespace toolserver
