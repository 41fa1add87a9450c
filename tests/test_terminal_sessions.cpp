#include "dispatcher.hpp"
#include "terminal_sessions.hpp"
#include "tools/tool_families.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <filesystem>
#include <thread>

namespace toolserver {
namespace {

using test_support::ReadAll;
using test_support::ScopedTempDir;
using test_support::WaitFor;

static TerminalOptions TestOptions(const std::string& root) {
  TerminalOptions opts;
  opts.workspace_root = root;
  opts.policy.working_directory_default = root;
  opts.ambient = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}, {"HOME", root}, {"PORT", "3000"}};
  opts.shell = "/bin/sh";
  opts.kill_grace_ms = 500;
  opts.command_timeout_ms = 10000;
  return opts;
}

// Collects session output until `needle` shows up.
static bool WaitForOutput(TerminalSessionManager& tm, const std::string& id, const std::string& needle,
                          std::string* seen, int timeout_ms = 5000) {
  return WaitFor(
      [&]() {
        ToolError err;
        if (auto out = tm.ReadOutput(id, &err)) *seen += *out;
        return seen->find(needle) != std::string::npos;
      },
      timeout_ms);
}

class TerminalSessionsTest : public ::testing::Test {
 protected:
  ScopedTempDir dir_;
  TerminalSessionManager tm_{TestOptions(dir_.path())};
};

TEST_F(TerminalSessionsTest, CreateSendAndRead) {
  ToolError err;
  auto id = tm_.Create("t1", std::nullopt, std::nullopt, &err);
  ASSERT_TRUE(id.has_value()) << err.message;
  EXPECT_EQ(*id, "t1");

  auto out = tm_.SendText("t1", "echo $((40+2))", true, -1, &err);
  ASSERT_TRUE(out.has_value()) << err.message;
  std::string seen = *out;
  EXPECT_TRUE(seen.find("42") != std::string::npos || WaitForOutput(tm_, "t1", "42", &seen)) << seen;
}

TEST_F(TerminalSessionsTest, SessionEnvironmentIsSanitized) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("env", std::nullopt, std::nullopt, &err)) << err.message;
  ASSERT_TRUE(tm_.SendText("env", "echo port=${PORT:-none} node=$NODE_ENV; pwd", true, 0, &err)) << err.message;
  std::string seen;
  EXPECT_TRUE(WaitForOutput(tm_, "env", "port=none node=development", &seen)) << seen;
  EXPECT_TRUE(WaitForOutput(tm_, "env", dir_.path(), &seen)) << seen;
}

TEST_F(TerminalSessionsTest, IdsAreNeverReused) {
  ToolError err;
  EXPECT_EQ(tm_.Create("t1", std::nullopt, std::nullopt, &err).value_or(""), "t1");
  EXPECT_EQ(tm_.Create("t1", std::nullopt, std::nullopt, &err).value_or(""), "t1-2");
  ASSERT_TRUE(tm_.Dispose("t1", &err));
  EXPECT_EQ(tm_.Create("t1", std::nullopt, std::nullopt, &err).value_or(""), "t1-3");
  EXPECT_EQ(tm_.LiveCount(), 2u);
}

TEST_F(TerminalSessionsTest, WritesToOneSessionAreFifo) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("fifo", std::nullopt, std::nullopt, &err)) << err.message;

  std::thread first([&]() {
    ToolError e;
    tm_.SendText("fifo", "sleep 0.3; echo one >> order.txt", true, 200, &e);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  std::thread second([&]() {
    ToolError e;
    tm_.SendText("fifo", "echo two >> order.txt", true, 200, &e);
  });
  first.join();
  second.join();

  const auto path = dir_.Join("order.txt");
  ASSERT_TRUE(WaitFor([&]() { return ReadAll(path) == "one\ntwo\n"; }, 5000)) << ReadAll(path);
}

TEST_F(TerminalSessionsTest, DisposeTwiceSucceedsThenNotFound) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("d", std::nullopt, std::nullopt, &err)) << err.message;
  const int pid = tm_.List().at(0).pid;

  EXPECT_TRUE(tm_.Dispose("d", &err));
  EXPECT_TRUE(tm_.Dispose("d", &err));
  EXPECT_EQ(::kill(pid, 0), -1);

  err = ToolError{};
  EXPECT_FALSE(tm_.SendText("d", "echo hi", true, 0, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kSessionNotFound);
  EXPECT_FALSE(tm_.Resize("d", 80, 24, &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kSessionNotFound);
  EXPECT_FALSE(tm_.SetActive("d", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kSessionNotFound);

  err = ToolError{};
  EXPECT_FALSE(tm_.Dispose("never-existed", &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kSessionNotFound);
}

TEST_F(TerminalSessionsTest, ActivePointer) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("a", std::nullopt, std::nullopt, &err));
  ASSERT_TRUE(tm_.Create("b", std::nullopt, std::nullopt, &err));
  ASSERT_TRUE(tm_.GetActive().has_value());
  EXPECT_EQ(tm_.GetActive()->id, "a");

  ASSERT_TRUE(tm_.SetActive("b", &err));
  EXPECT_EQ(tm_.GetActive()->id, "b");
  for (const auto& info : tm_.List()) EXPECT_EQ(info.active, info.id == "b");

  ASSERT_TRUE(tm_.Dispose("b", &err));
  EXPECT_FALSE(tm_.GetActive().has_value());
}

TEST_F(TerminalSessionsTest, SessionThatExitsIsReaped) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("gone", std::nullopt, std::nullopt, &err));
  ASSERT_TRUE(tm_.SendText("gone", "exit", true, 0, &err)) << err.message;
  EXPECT_TRUE(WaitFor([&]() { return tm_.LiveCount() == 0; }, 5000));
  EXPECT_FALSE(tm_.ReadOutput("gone", &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kSessionNotFound);
  EXPECT_TRUE(tm_.Dispose("gone", &err));
}

TEST_F(TerminalSessionsTest, CreateFailures) {
  ToolError err;
  EXPECT_FALSE(tm_.Create("x", dir_.Join("missing"), std::nullopt, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kSpawnFailed);

  err = ToolError{};
  EXPECT_FALSE(tm_.Create("x", std::nullopt, std::string("/no/such/shell"), &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kSpawnFailed);

  err = ToolError{};
  EXPECT_FALSE(tm_.Create("x", std::string("../../.."), std::nullopt, &err).has_value());
  EXPECT_EQ(err.kind, ToolErrorKind::kPathTraversalRejected);
  EXPECT_EQ(tm_.LiveCount(), 0u);
}

TEST_F(TerminalSessionsTest, ResizeAndClear) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("r", std::nullopt, std::nullopt, &err));
  EXPECT_TRUE(tm_.Resize("r", 100, 30, &err)) << err.message;
  EXPECT_FALSE(tm_.Resize("r", 0, 30, &err));
  EXPECT_EQ(err.kind, ToolErrorKind::kInvalidParameters);

  ASSERT_TRUE(tm_.SendText("r", "stty size", true, -1, &err));
  std::string seen;
  EXPECT_TRUE(WaitForOutput(tm_, "r", "30 100", &seen)) << seen;
  EXPECT_TRUE(tm_.Clear("r", &err)) << err.message;
}

TEST_F(TerminalSessionsTest, ShutdownDisposesEverything) {
  ToolError err;
  ASSERT_TRUE(tm_.Create("a", std::nullopt, std::nullopt, &err));
  ASSERT_TRUE(tm_.Create("b", std::nullopt, std::nullopt, &err));
  tm_.Shutdown();
  EXPECT_EQ(tm_.LiveCount(), 0u);
  EXPECT_TRUE(tm_.List().empty());
}

TEST(TerminalExecuteTest, TranscriptRecordsCommands) {
  ScopedTempDir dir;
  auto opts = TestOptions(dir.path());
  opts.transcript_path = dir.Join(".agent-terminal.log");
  TerminalSessionManager tm(opts);

  ToolError err;
  auto ok = tm.ExecuteCommand("echo hi", std::nullopt, std::nullopt, std::nullopt, &err);
  ASSERT_TRUE(ok.has_value()) << err.message;
  auto bad = tm.ExecuteCommand("exit 4", std::nullopt, std::nullopt, std::nullopt, &err);
  ASSERT_TRUE(bad.has_value()) << err.message;
  EXPECT_EQ(bad->exit_code, 4);

  const auto log = ReadAll(opts.transcript_path);
  EXPECT_NE(log.find("Command: echo hi"), std::string::npos) << log;
  EXPECT_NE(log.find("hi\n"), std::string::npos);
  EXPECT_NE(log.find("SUCCESS"), std::string::npos);
  EXPECT_NE(log.find("FAILED (exit code: 4)"), std::string::npos);
}

class TerminalToolsTest : public ::testing::Test {
 protected:
  void SetUp() override { RegisterTerminalTools(registry_, tm_); }

  ScopedTempDir dir_;
  TerminalSessionManager tm_{TestOptions(dir_.path())};
  ToolRegistry registry_;
  Dispatcher dispatcher_{&registry_};
};

TEST_F(TerminalToolsTest, CreateThenSendText) {
  auto created = dispatcher_.Invoke({"terminal_create", {{"name", "t1"}}});
  ASSERT_TRUE(created.success) << created.ToJson().dump();
  EXPECT_EQ(created.result["sessionId"], "t1");

  auto sent = dispatcher_.Invoke({"terminal_send_text", {{"sessionId", "t1"}, {"text", "echo hi"}}});
  ASSERT_TRUE(sent.success) << sent.ToJson().dump();
  EXPECT_EQ(sent.result["sessionId"], "t1");
  EXPECT_NE(sent.result["output"].get<std::string>().find("hi"), std::string::npos);

  auto via_alias = dispatcher_.Invoke({"terminal_read_output", {{"terminalId", "t1"}}});
  EXPECT_TRUE(via_alias.success) << via_alias.ToJson().dump();
}

TEST_F(TerminalToolsTest, ExecuteNonZeroExitIsSuccess) {
  auto r = dispatcher_.Invoke({"terminal_execute", {{"command", "echo out; exit 7"}}});
  ASSERT_TRUE(r.success) << r.ToJson().dump();
  EXPECT_EQ(r.result["exitCode"], 7);
  EXPECT_EQ(r.result["stdout"], "out\n");
  EXPECT_EQ(r.result["timedOut"], false);
}

TEST_F(TerminalToolsTest, ExecuteRejectsOutOfRangeTimeout) {
  auto r = dispatcher_.Invoke({"terminal_execute", {{"command", "touch ran"}, {"timeout", 1e12}}});
  EXPECT_FALSE(r.success);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ToolErrorKind::kInvalidParameters);
  EXPECT_FALSE(std::filesystem::exists(dir_.Join("ran")));
}

TEST_F(TerminalToolsTest, ExecuteTimeoutKillsProcess) {
  auto r = dispatcher_.Invoke({"terminal_execute", {{"command", "echo $$ > pid; echo waiting; sleep 60"}, {"timeout", 1000}}});
  EXPECT_FALSE(r.success);
  ASSERT_TRUE(r.error.has_value());
  EXPECT_EQ(r.error->kind, ToolErrorKind::kTimeout);
  EXPECT_EQ(r.result["stdout"], "waiting\n");
  EXPECT_EQ(r.result["timedOut"], true);

  const int pid = std::stoi(ReadAll(dir_.Join("pid")));
  EXPECT_TRUE(WaitFor([&]() { return ::kill(-pid, 0) != 0; }, 2000));
}

TEST_F(TerminalToolsTest, ListAndDispose) {
  ASSERT_TRUE(dispatcher_.Invoke({"terminal_create", {{"name", "x"}}}).success);
  auto list = dispatcher_.Invoke({"terminal_list", nlohmann::json::object()});
  ASSERT_TRUE(list.success);
  ASSERT_EQ(list.result["sessions"].size(), 1u);
  EXPECT_EQ(list.result["sessions"][0]["id"], "x");
  EXPECT_EQ(list.result["sessions"][0]["active"], true);

  EXPECT_TRUE(dispatcher_.Invoke({"terminal_dispose", {{"sessionId", "x"}}}).success);
  EXPECT_TRUE(dispatcher_.Invoke({"terminal_dispose", {{"sessionId", "x"}}}).success);
  auto after = dispatcher_.Invoke({"terminal_send_text", {{"sessionId", "x"}, {"text", "echo"}}});
  EXPECT_FALSE(after.success);
  EXPECT_EQ(after.error->kind, ToolErrorKind::kSessionNotFound);
}

}  // namespace
}  // namespace toolserver
