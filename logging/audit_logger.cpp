#include "logging/audit_logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace promptguard {

namespace {
long long NowSeconds() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}
}  // namespace

AuditLogger::AuditLogger(const std::string& path, bool debug_mode)
    : debug_mode_(debug_mode) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::LogValidation(const ValidationResult& result) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["request_id"] = result.request_id;
  j["security_level"] = result.security_level;
  j["is_blocked"] = result.is_blocked;
  json blocked = json::array();
  for (auto category : result.blocked_categories) {
    blocked.push_back(CategoryName(category));
  }
  j["blocked_categories"] = blocked;
  j["confidence"] = result.confidence_score;
  j["finding_count"] = result.findings.size();
  j["modified"] = result.ModificationsMade();
  json phases = json::object();
  for (const auto& phase : result.phases) {
    phases[phase.name] = PhaseStatusName(phase.status);
  }
  j["phases"] = phases;
  if (debug_mode_) {
    j["prompt"] = result.original_prompt;
    j["sanitized"] = result.sanitized_text;
  } else {
    // Hashed by default; raw text only in debug mode.
    j["prompt_sha256"] = HashContent(result.original_prompt);
    j["sanitized_sha256"] = HashContent(result.sanitized_text);
  }
  Write(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void AuditLogger::LogRejection(const std::string& level_name, const std::string& error) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = NowSeconds();
  j["security_level"] = level_name;
  j["status"] = "rejected";
  j["error"] = error;
  Write(j.dump(-1, ' ', false, json::error_handler_t::replace));
}

void AuditLogger::Write(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace promptguard
