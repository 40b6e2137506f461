#pragma once

#include "classifier/classifier_factory.h"
#include "core/security_level.h"
#include "detect/pattern_rules.h"
#include "pipeline/validation_pipeline.h"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace promptguard {

// Unreadable or inconsistent configuration. Raised at startup only.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct LoggingSettings {
  std::string format{"text"};  // text | json
  std::string level{"info"};
};

struct AuditSettings {
  std::string path;  // empty disables the audit log
  bool debug{false};
};

struct DetectorSettings {
  bool entropy_scan{true};
  std::size_t min_token_length{8};
  std::size_t keyword_window{40};
  std::vector<std::string> excluded_values;      // added to the defaults
  std::vector<std::string> credential_keywords;  // added to the defaults
  std::vector<PatternRule> custom_rules;         // appended after the built-ins
};

struct ServiceConfig {
  LoggingSettings logging;
  AuditSettings audit;
  std::chrono::milliseconds phase_timeout{3000};
  std::size_t workers{4};
  std::size_t max_workers{64};
  std::string default_level{"balanced"};
  std::vector<SecurityLevelRegistry::Entry> levels{SecurityLevelRegistry::BuiltinEntries()};
  DetectorSettings detector;
  std::vector<ClassifierSpec> classifiers;
  bool classifiers_enabled{true};
};

// Parses YAML text on top of the defaults. Sections: logging, pipeline,
// security_levels, detector, classifiers, audit. A level whose name matches a
// built-in replaces it; others are appended. Throws ConfigError.
ServiceConfig ParseServiceConfig(const std::string& yaml_text);
ServiceConfig LoadServiceConfig(const std::string& path);

using EnvLookup = std::function<const char*(const char*)>;

// PROMPTGUARD_LOG_FORMAT, PROMPTGUARD_LOG_LEVEL, PROMPTGUARD_DEFAULT_LEVEL,
// PROMPTGUARD_PHASE_TIMEOUT_MS, PROMPTGUARD_WORKERS, PROMPTGUARD_AUDIT_LOG,
// PROMPTGUARD_AUDIT_DEBUG, PROMPTGUARD_CLASSIFIERS_DISABLED.
void ApplyEnvironment(ServiceConfig* config, const EnvLookup& lookup);
void ApplyEnvironment(ServiceConfig* config);

void ConfigureLogging(const LoggingSettings& settings);

struct ServiceComponents {
  std::shared_ptr<const SecurityLevelRegistry> levels;
  std::shared_ptr<const PatternDetector> detector;
  AdapterList adapters;
  PipelineOptions options;
};

// Compiles rules, validates levels and builds classifier adapters. Throws
// ConfigError, InvalidConfig or MalformedDetectorRule.
ServiceComponents BuildComponents(const ServiceConfig& config);

}  // namespace promptguard
