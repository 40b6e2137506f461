#pragma once

#include "core/finding.h"

#include <fstream>
#include <mutex>
#include <string>

namespace promptguard {

// Append-only JSON-lines record of validation decisions.
class AuditLogger {
 public:
  AuditLogger() = default;

  // path: log file path; debug_mode: when true, log raw prompt/sanitized text
  // instead of SHA-256 hashes.
  explicit AuditLogger(const std::string& path, bool debug_mode = false);

  bool Enabled() const { return stream_.is_open(); }

  // One line per decision: ids, level, verdict, categories, confidence,
  // finding count and phase outcomes.
  void LogValidation(const ValidationResult& result);

  // A call refused before detection (unknown level, invalid config).
  void LogRejection(const std::string& level_name, const std::string& error);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  void Write(const std::string& line);

  std::ofstream stream_;
  std::mutex mutex_;
  bool debug_mode_{false};
};

}  // namespace promptguard
