#include "dispatcher.hpp"
#include "editor_bridge.hpp"
#include "tools/tool_families.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace toolserver {
namespace {

using test_support::ReadAll;
using test_support::ScopedTempDir;
using test_support::WaitFor;
using test_support::WriteAll;

// In-process stand-in for the editor host. GET / answers 401 like an editor
// behind auth; commands listed in `failing` answer 500.
class FakeEditor {
 public:
  FakeEditor() {
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
      res.status = 401;
      res.set_content("unauthorized", "text/plain");
    });
    server_.Post("/api/commands/execute", [this](const httplib::Request& req, httplib::Response& res) {
      auto body = nlohmann::json::parse(req.body, nullptr, false);
      const std::string command = body.is_object() ? body.value("command", std::string()) : std::string();
      bool fail = false;
      {
        std::lock_guard<std::mutex> lock(mu_);
        commands_.push_back(command);
        last_args_ = body.is_object() ? body.value("arguments", nlohmann::json::array()) : nlohmann::json::array();
        fail = failing_.count(command) > 0;
      }
      if (fail) {
        res.status = 500;
        return;
      }
      nlohmann::json out;
      if (command == "workbench.action.getVersion") {
        out = "1.85.0";
      } else if (command == "workbench.extensions.getInstalled") {
        out = nlohmann::json::array({{{"id", "ms-python.python"}}, "rust-lang.rust-analyzer"});
      } else if (command == "workspace.getConfiguration") {
        out = {{"editor.tabSize", 2}};
      } else if (command == "workbench.action.files.getActiveFile") {
        out = {{"path", "/workspace/src/app.ts"}};
      } else if (command == "editor.action.getSelectionRange") {
        out = {{"start", {{"line", 1}, {"character", 0}}}, {"end", {{"line", 1}, {"character", 4}}}};
      } else if (command == "workbench.action.terminal.new") {
        out = {{"id", "term-7"}};
      } else if (command == "window.showWarningMessage") {
        out = {{"selected", "Retry"}};
      } else if (command == "unknown.command") {
        res.status = 404;
        return;
      }
      res.set_content(out.is_null() ? std::string() : out.dump(), "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    WaitFor([this]() { return server_.is_running(); }, 3000);
  }

  ~FakeEditor() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  int port() const { return port_; }
  void Fail(const std::string& command) {
    std::lock_guard<std::mutex> lock(mu_);
    failing_.insert(command);
  }
  std::vector<std::string> commands() {
    std::lock_guard<std::mutex> lock(mu_);
    return commands_;
  }
  nlohmann::json last_args() {
    std::lock_guard<std::mutex> lock(mu_);
    return last_args_;
  }

 private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = -1;
  std::set<std::string> failing_;
  std::mutex mu_;
  std::vector<std::string> commands_;
  nlohmann::json last_args_;
};

static EditorConfig ConfigFor(int port) {
  EditorConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.timeout_seconds = 2;
  cfg.recheck_seconds = 30;
  return cfg;
}

TEST(EditorBridgeTest, UnauthorizedRootCountsAsReachable) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.Join("ws"));
  ToolError err;
  EXPECT_TRUE(bridge.Connect(&err)) << err.message;
  EXPECT_TRUE(bridge.IsConnected());
  EXPECT_TRUE(std::filesystem::is_directory(dir.Join("ws")));
}

TEST(EditorBridgeTest, ClosedPortIsBridgeUnreachable) {
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(1), dir.path());
  ToolError err;
  EXPECT_FALSE(bridge.Connect(&err));
  EXPECT_EQ(err.kind, ToolErrorKind::kBridgeUnreachable);
  EXPECT_FALSE(bridge.IsConnected());

  err = ToolError{};
  EXPECT_FALSE(bridge.ExecuteCommand("workbench.action.getVersion", nullptr, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kBridgeUnreachable);
}

TEST(EditorBridgeTest, ExecuteCommandPostsEnvelope) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());
  ToolError err;

  auto r = bridge.ExecuteCommand("workbench.action.terminal.new", nlohmann::json::object({{"name", "dev"}}), &err);
  ASSERT_TRUE(r.has_value()) << err.message;
  EXPECT_EQ((*r)["id"], "term-7");
  EXPECT_EQ(fake.last_args(), nlohmann::json::array({{{"name", "dev"}}}));

  EXPECT_FALSE(bridge.ExecuteCommand("unknown.command", nullptr, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kExecutionFailed);
  EXPECT_TRUE(bridge.IsConnected());
}

TEST(EditorBridgeTest, ConcurrentCallersShareOneProbe) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());

  std::vector<std::thread> threads;
  std::atomic<int> ok{0};
  for (int i = 0; i < 6; i++) {
    threads.emplace_back([&]() {
      ToolError err;
      if (bridge.EnsureConnected(&err)) ok++;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(ok.load(), 6);
}

TEST(EditorBridgeTest, PartialContextOmitsFailedPieces) {
  FakeEditor fake;
  fake.Fail("workbench.extensions.getInstalled");
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());

  auto ctx = bridge.GetContext();
  EXPECT_EQ(ctx["version"], "1.85.0");
  EXPECT_FALSE(ctx.contains("extensions"));
  EXPECT_EQ(ctx["settings"]["editor.tabSize"], 2);
  ASSERT_TRUE(ctx.contains("activeEditor"));
  EXPECT_EQ(ctx["activeEditor"]["file"], "/workspace/src/app.ts");
  EXPECT_EQ(ctx["activeEditor"]["language"], "typescript");
  EXPECT_EQ(ctx["activeEditor"]["selection"]["end"]["character"], 4);
}

TEST(EditorBridgeTest, FullContextListsExtensionIds) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());
  auto ctx = bridge.GetContext();
  EXPECT_EQ(ctx["extensions"], nlohmann::json::array({"ms-python.python", "rust-lang.rust-analyzer"}));
}

TEST(EditorBridgeTest, ContextWithoutEditorIsEmpty) {
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(1), dir.path());
  EXPECT_TRUE(bridge.GetContext().empty());
}

TEST(EditorBridgeTest, FilePrimitivesStayInWorkspace) {
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(1), dir.path());
  ToolError err;
  EXPECT_TRUE(bridge.CreateFile("a/b.txt", "x", &err)) << err.message;
  EXPECT_EQ(bridge.ReadFile("a/b.txt", &err).value_or(""), "x");
  EXPECT_EQ(bridge.ListFiles("a", &err).value_or(std::vector<std::string>{}), std::vector<std::string>{"b.txt"});
  EXPECT_EQ(bridge.ListDirectories(".", &err).value_or(std::vector<std::string>{}), std::vector<std::string>{"a"});

  EXPECT_FALSE(bridge.WriteFile("../../etc/passwd", "x", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
  EXPECT_FALSE(bridge.FileExists("../../etc/passwd", &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
  EXPECT_FALSE(bridge.DeleteDirectory("../..", true, &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
}

TEST(EditorBridgeTest, TextEditsApplyToFile) {
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(1), dir.path());
  WriteAll(dir.Join("f.txt"), "hello world\nsecond line\r\nthird");
  ToolError err;

  ASSERT_TRUE(bridge.FormatDocument("f.txt", &err)) << err.message;
  EXPECT_EQ(ReadAll(dir.Join("f.txt")), "hello world\nsecond line\nthird");

  ASSERT_TRUE(bridge.InsertText("f.txt", "big ", Position{0, 6}, &err));
  EXPECT_EQ(ReadAll(dir.Join("f.txt")), "hello big world\nsecond line\nthird");

  ASSERT_TRUE(bridge.ReplaceText("f.txt", Range{{1, 0}, {2, 5}}, "merged", &err));
  EXPECT_EQ(ReadAll(dir.Join("f.txt")), "hello big world\nmerged");

  ASSERT_TRUE(bridge.DeleteText("f.txt", Range{{0, 5}, {0, 9}}, &err));
  EXPECT_EQ(ReadAll(dir.Join("f.txt")), "hello world\nmerged");

  ASSERT_TRUE(bridge.InsertText("f.txt", "tail", std::nullopt, &err));
  EXPECT_EQ(ReadAll(dir.Join("f.txt")), "hello world\nmerged\ntail");

  EXPECT_FALSE(bridge.ReplaceText("f.txt", Range{{2, 0}, {0, 0}}, "x", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kInvalidParameters);
}

TEST(EditorBridgeTest, ShowMessageTypes) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());
  ToolError err;
  auto selected = bridge.ShowMessage("disk almost full", "warning", {"Retry", "Ignore"}, &err);
  ASSERT_TRUE(selected.has_value()) << err.message;
  EXPECT_EQ(*selected, "Retry");
  EXPECT_EQ(fake.last_args(), nlohmann::json::array({"disk almost full", "Retry", "Ignore"}));

  EXPECT_FALSE(bridge.ShowMessage("x", "shout", {}, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kInvalidParameters);
}

TEST(EditorBridgeTest, ParsePositionRejectsOutOfRangeNumbers) {
  auto ok = ParsePosition({{"line", 3}, {"character", 7.0}});
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->line, 3);
  EXPECT_EQ(ok->character, 7);

  EXPECT_FALSE(ParsePosition({{"line", 1e12}, {"character", 0}}).has_value());
  EXPECT_FALSE(ParsePosition({{"line", 0}, {"character", -3e10}}).has_value());
  EXPECT_FALSE(ParseRange({{"start", {{"line", 0}, {"character", 0}}}, {"end", {{"line", 5e9}, {"character", 0}}}})
                   .has_value());
}

TEST(EditorBridgeTest, LanguageForPath) {
  EXPECT_EQ(EditorBridge::LanguageForPath("a/b/main.CPP"), "cpp");
  EXPECT_EQ(EditorBridge::LanguageForPath("script.py"), "python");
  EXPECT_EQ(EditorBridge::LanguageForPath("dir.d/Makefile"), "plaintext");
  EXPECT_EQ(EditorBridge::LanguageForPath("notes.unknown"), "plaintext");
}

TEST(EditorToolsTest, ToolsGoThroughTheBridge) {
  FakeEditor fake;
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(fake.port()), dir.path());
  ToolRegistry registry;
  RegisterEditorTools(registry, bridge);
  Dispatcher dispatcher(&registry);

  auto active = dispatcher.Invoke({"editor_get_active_file", nlohmann::json::object()});
  ASSERT_TRUE(active.success) << active.ToJson().dump();
  EXPECT_EQ(active.result["file"], "/workspace/src/app.ts");
  EXPECT_EQ(active.result["language"], "typescript");

  auto term = dispatcher.Invoke({"editor_terminal_create", {{"name", "dev"}}});
  ASSERT_TRUE(term.success) << term.ToJson().dump();
  EXPECT_EQ(term.result["terminalId"], "term-7");

  auto sent = dispatcher.Invoke({"editor_terminal_send_text", {{"terminalId", "term-7"}, {"text", "ls"}}});
  ASSERT_TRUE(sent.success);
  EXPECT_EQ(fake.last_args()[0]["text"], "ls\n");

  WriteAll(dir.Join("code.txt"), "abc");
  auto insert = dispatcher.Invoke(
      {"editor_insert_text", {{"path", "code.txt"}, {"text", "X"}, {"position", {{"line", 0}, {"character", 1}}}}});
  ASSERT_TRUE(insert.success) << insert.ToJson().dump();
  EXPECT_EQ(ReadAll(dir.Join("code.txt")), "aXbc");

  auto bad_pos = dispatcher.Invoke({"editor_set_cursor_position", {{"position", {{"line", 1}}}}});
  EXPECT_FALSE(bad_pos.success);
  EXPECT_EQ(bad_pos.error->kind, ToolErrorKind::kInvalidParameters);
}

TEST(EditorToolsTest, UnreachableEditorSurfacesAsBridgeUnreachable) {
  ScopedTempDir dir;
  EditorBridge bridge(ConfigFor(1), dir.path());
  ToolRegistry registry;
  RegisterEditorTools(registry, bridge);
  Dispatcher dispatcher(&registry);

  auto r = dispatcher.Invoke({"editor_go_to_line", {{"line", 3}}});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error->kind, ToolErrorKind::kBridgeUnreachable);
}

}  // namespace
}  // namespace toolserver
