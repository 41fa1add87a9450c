#pragma once

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace toolserver {

// Append-only JSON-lines file, one object per tool invocation.
class AuditLog {
 public:
  explicit AuditLog(std::string path);

  bool Append(const nlohmann::json& record);
  const std::string& path() const { return path_; }

 private:
  std::mutex mu_;
  std::string path_;
  std::ofstream out_;
};

}  // namespace toolserver
