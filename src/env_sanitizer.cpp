#include "env_sanitizer.hpp"

#include <unistd.h>

#include <string>
#include <vector>

extern char** environ;

namespace toolserver {

Environment Sanitize(const Environment& ambient, const SanitizationPolicy& policy) {
  Environment out = ambient;
  for (const auto& key : policy.strip_keys) out.erase(key);
  for (const auto& [key, value] : policy.forced_keys) out[key] = value;
  return out;
}

Environment CurrentEnvironment() {
  Environment env;
  if (!environ) return env;
  for (char** p = environ; *p; ++p) {
    std::string entry(*p);
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
  }
  return env;
}

std::vector<std::string> ToEnvp(const Environment& env) {
  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [key, value] : env) out.push_back(key + "=" + value);
  return out;
}

std::map<std::string, std::string> ParseForcedKeys(const std::string& csv) {
  std::map<std::string, std::string> out;
  for (const auto& item : SplitCsv(csv)) {
    auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    out[item.substr(0, eq)] = item.substr(eq + 1);
  }
  return out;
}

}  // namespace toolserver
