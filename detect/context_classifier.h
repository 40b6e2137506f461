#pragma once

#include "core/finding.h"

#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace promptguard {

// Derives ContextSignals from the literal prompt text. Rule sets are compiled
// once in the constructor (MalformedDetectorRule on failure); Classify() is
// pure, never blocks on I/O and is safe to call concurrently.
//
// is_config_context is reported separately from is_question so callers can
// tell a tooling discussion apart from a plain question.
class ContextClassifier {
 public:
  ContextClassifier();
  ~ContextClassifier();

  ContextClassifier(const ContextClassifier&) = delete;
  ContextClassifier& operator=(const ContextClassifier&) = delete;

  ContextSignals Classify(const std::string& prompt) const;

  bool IsQuestion(const std::string& prompt) const;
  bool IsConfigContext(const std::string& prompt) const;
  bool IsDisclosure(const std::string& prompt) const;

 private:
  using RuleSet = std::vector<std::unique_ptr<re2::RE2>>;
  static bool AnyMatch(const RuleSet& rules, const std::string& text);

  RuleSet question_rules_;
  RuleSet config_tool_rules_;
  RuleSet config_vocab_rules_;
  RuleSet config_phrase_rules_;
  RuleSet disclosure_rules_;
};

}  // namespace promptguard
