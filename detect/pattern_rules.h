#pragma once

#include "core/finding.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace promptguard {

// A structural or context rule failed to compile. Raised at startup only.
class MalformedDetectorRule : public std::runtime_error {
 public:
  MalformedDetectorRule(const std::string& rule_id, const std::string& detail)
      : std::runtime_error("malformed detector rule '" + rule_id + "': " + detail),
        rule_id_(rule_id) {}

  const std::string& rule_id() const { return rule_id_; }

 private:
  std::string rule_id_;
};

struct PatternRule {
  std::string id;      // e.g. "credential.openai_key"
  std::string family;  // jailbreak families drive composite escalation
  Category category{Category::kNormal};
  std::string pattern;  // RE2 syntax
  double confidence{0.0};
  // Empty replacement marks a report-only rule: the finding carries a span
  // for audit but is never rewritten.
  std::string replacement;
  // Capture group whose range becomes the span (0 = whole match).
  int value_group{0};
  std::size_t min_value_length{0};
};

// Compiles `pattern` with RE2 (errors not logged by RE2 itself). Throws
// MalformedDetectorRule naming `rule_id` when the pattern does not compile.
std::unique_ptr<re2::RE2> CompileRule(const std::string& rule_id,
                                      const std::string& pattern);

// Built-in structural rules for every threat category.
std::vector<PatternRule> DefaultPatternRules();

// Credential-looking values that are placeholders rather than secrets.
std::vector<std::string> DefaultExcludedValues();

// Keywords that must appear near a high-entropy token before it is treated
// as a credential.
std::vector<std::string> DefaultCredentialKeywords();

}  // namespace promptguard
