#include "config.hpp"
#include "fallback_executor.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace {

static void PrintUsage() {
  std::cerr << "usage: tool_exec [--cwd DIR] [--timeout MS] [--json] [--] COMMAND...\n"
               "Runs COMMAND through the tool server's terminal_execute, or locally when the\n"
               "server at $TOOL_SERVER_URL is unreachable.\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::optional<std::string> cwd;
  std::optional<int> timeout_ms;
  bool json_output = false;
  std::string command;

  int i = 1;
  for (; i < argc; i++) {
    const std::string arg = argv[i];
    if (arg == "--") {
      i++;
      break;
    }
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    }
    if (arg == "--json") {
      json_output = true;
    } else if (arg == "--cwd" && i + 1 < argc) {
      cwd = argv[++i];
    } else if (arg == "--timeout" && i + 1 < argc) {
      int v = 0;
      if (!toolserver::TryParseInt(argv[++i], &v) || v <= 0) {
        std::cerr << "tool_exec: invalid --timeout value\n";
        return 2;
      }
      timeout_ms = v;
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      std::cerr << "tool_exec: unknown option " << arg << "\n";
      PrintUsage();
      return 2;
    } else {
      break;
    }
  }
  for (; i < argc; i++) {
    if (!command.empty()) command += " ";
    command += argv[i];
  }
  if (command.empty()) {
    PrintUsage();
    return 2;
  }

  toolserver::FallbackExecutor executor(toolserver::FallbackOptionsFromEnv());
  const auto envelope = executor.Execute(command, cwd, timeout_ms);

  if (json_output) {
    std::cout << envelope.dump(2) << "\n";
    return envelope.value("success", false) ? 0 : 1;
  }

  const auto result = envelope.contains("result") && envelope["result"].is_object() ? envelope["result"]
                                                                                       : nlohmann::json::object();
  std::cout << result.value("stdout", std::string());
  std::cerr << result.value("stderr", std::string());
  if (!envelope.value("success", false)) {
    const auto error = envelope.contains("error") ? envelope["error"] : nlohmann::json::object();
    std::cerr << "tool_exec: " << error.value("kind", std::string("ExecutionFailed")) << ": "
              << error.value("message", std::string()) << "\n";
    return 1;
  }
  return result.value("exitCode", 0);
}
