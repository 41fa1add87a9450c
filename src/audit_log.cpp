#include "audit_log.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace toolserver {

AuditLog::AuditLog(std::string path) : path_(std::move(path)) {}

bool AuditLog::Append(const nlohmann::json& record) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!out_.is_open()) {
    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    out_.open(path_, std::ios::app);
    if (!out_) {
      std::cout << "[audit] open failed path=" << path_ << "\n";
      return false;
    }
  }
  out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  out_.flush();
  return static_cast<bool>(out_);
}

}  // namespace toolserver
