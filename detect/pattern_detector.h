#pragma once

#include "common/cancellation.h"
#include "core/finding.h"
#include "core/security_level.h"
#include "detect/pattern_rules.h"

#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace promptguard {

struct PatternDetectorOptions {
  std::size_t min_token_length{8};
  // Bytes searched on either side of a high-entropy token for a credential
  // keyword.
  std::size_t keyword_window{40};
  bool entropy_scan{true};
  std::vector<std::string> excluded_values{DefaultExcludedValues()};
  std::vector<std::string> credential_keywords{DefaultCredentialKeywords()};
};

// Deterministic structural detector: regex rules per category, a keyword
// gated entropy scan for unlabelled secrets, and composite escalation when
// several jailbreak families co-occur. All rules compile in the constructor;
// a bad pattern throws MalformedDetectorRule there and never at Detect time.
class PatternDetector {
 public:
  explicit PatternDetector(std::vector<PatternRule> rules = DefaultPatternRules(),
                           PatternDetectorOptions options = {});
  ~PatternDetector();

  PatternDetector(const PatternDetector&) = delete;
  PatternDetector& operator=(const PatternDetector&) = delete;

  // Findings in rule order, then entropy findings, then the composite
  // jailbreak finding if any. Stops early (returning what it has) once
  // `cancel` fires.
  std::vector<Finding> Detect(const std::string& prompt, const SecurityLevelConfig& level,
                              const CancellationToken& cancel = {}) const;

  std::size_t RuleCount() const { return rules_.size(); }

 private:
  struct CompiledRule {
    PatternRule rule;
    std::unique_ptr<re2::RE2> regex;
  };

  void ScanRule(const CompiledRule& compiled, const std::string& prompt,
                std::vector<Finding>* findings) const;
  void ScanEntropy(const std::string& prompt, const SecurityLevelConfig& level,
                   std::vector<Finding>* findings) const;
  void EscalateJailbreak(std::vector<Finding>* findings) const;
  bool IsExcludedValue(const std::string& value) const;
  bool KeywordNear(const std::string& prompt, std::size_t start, std::size_t end) const;

  std::vector<CompiledRule> rules_;
  std::unique_ptr<re2::RE2> token_regex_;
  PatternDetectorOptions options_;
};

}  // namespace promptguard
