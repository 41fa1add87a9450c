#pragma once

#include "config.hpp"

#include <map>
#include <string>
#include <vector>

namespace toolserver {

using Environment = std::map<std::string, std::string>;

// Copy of `ambient` with policy.strip_keys removed and policy.forced_keys
// overlaid. Pure; Sanitize(Sanitize(e, p), p) == Sanitize(e, p).
Environment Sanitize(const Environment& ambient, const SanitizationPolicy& policy);

Environment CurrentEnvironment();

// KEY=VALUE strings suitable for execve.
std::vector<std::string> ToEnvp(const Environment& env);

// "A=1,B=2" -> {A:1, B:2}. Entries without '=' are ignored.
std::map<std::string, std::string> ParseForcedKeys(const std::string& csv);

}  // namespace toolserver
