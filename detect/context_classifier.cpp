#include "detect/context_classifier.h"

#include "detect/pattern_rules.h"

#include <re2/re2.h>

namespace promptguard {

namespace {
constexpr char kSecretNoun[] =
    R"((?:password|passwd|passphrase|passcode|pin|account\s+number|api[\s_-]?key|key|token|secret|credentials?|ssn|social\s+security\s+number|credit\s+card(?:\s+number)?|card\s+number|email(?:\s+address)?|phone(?:\s+number)?|address|login))";

void CompileInto(std::vector<std::unique_ptr<re2::RE2>>* rules, const std::string& prefix,
                 const std::vector<std::string>& patterns) {
  for (std::size_t i = 0; i < patterns.size(); ++i) {
    rules->push_back(CompileRule(prefix + "." + std::to_string(i), patterns[i]));
  }
}
}  // namespace

ContextClassifier::ContextClassifier() {
  CompileInto(&question_rules_, "context.question",
              {
                  R"((?i)^\s*(?:how|what|why|when|where|which|who|whom|whose|can|could|should|would|will|is|are|was|were|does|do|did|may|might|shall)\b)",
                  R"(\?)",
                  R"((?i)\bhow\s+(?:do|can|should|would|to)\b)",
                  R"((?i)\bwhat(?:'s|\s+is)\s+the\s+(?:best|right|proper|recommended|correct)\s+(?:way|practice|approach|method))",
                  R"((?i)\b(?:should|can|could|may)\s+i\b)",
                  R"((?i)\bis\s+it\s+(?:safe|okay|ok|possible|secure|wise|a\s+good\s+idea)\b)",
                  R"((?i)\bbest\s+practices?\b|\brecommended\s+way\b|\bproper\s+(?:way|method)\b)",
                  R"((?i)^\s*(?:please\s+)?(?:explain|describe|help\s+me\s+understand)\b)",
              });

  CompileInto(&config_tool_rules_, "context.config_tool",
              {
                  R"((?i)\b(?:eslint|tslint|prettier|stylelint|webpack|vite|babel|tsconfig|package\.json|editorconfig|typescript|cmake|gradle|maven|make(?:file)?|compiler|gcc|g\+\+|clang|msvc|pylint|flake8|mypy|black|ruff|rubocop|jest|pytest|mocha|docker-compose|dockerfile|nginx|apache|terraform|ansible|helm|kubernetes|openapi|swagger|npm|yarn|pnpm|pip|poetry|cargo|git|vscode|intellij|linter|formatter|bundler)\b)",
                  R"((?i)\bapi\s+version\b)",
              });

  CompileInto(&config_vocab_rules_, "context.config_vocab",
              {
                  R"((?i)\b(?:configure|configuration|config|settings?|options?|rules?|flags?|enable|disable|allow|suppress|turn\s+(?:off|on)|version(?:ing|s)?|warnings?|plugins?|presets?|lint(?:ing)?|extends|ignore\s+(?:file|pattern)s?)\b)",
              });

  CompileInto(&config_phrase_rules_, "context.config_phrase",
              {
                  R"((?i)\bcompiler\s+(?:flags?|options?|warnings?)\b)",
                  R"((?i)\blint(?:ing|er)?\s+rules?\b)",
                  R"((?i)\bapi\s+versioning\b)",
                  R"((?i)\bbuild\s+(?:config(?:uration)?|settings|flags|options)\b)",
                  R"((?i)\b(?:config|configuration|settings)\s+file\b)",
              });

  const std::string noun = kSecretNoun;
  CompileInto(&disclosure_rules_, "context.disclosure",
              {
                  R"((?i)\bmy\s+(?:\w+\s+){0,2})" + noun + R"(\s*(?:is\b|was\b|=|:))",
                  R"((?i)\bhere(?:'s|\s+is|\s+are)\s+(?:my|the|our|it)\b)",
                  R"((?i)\bhere\s+it\s+is\b)",
                  R"((?i)\b)" + noun + R"(\s*[:=]\s*\S)",
                  R"((?i)\buse\s+(?:this|these|my)\s+(?:\w+\s+)?)" + noun + R"(\b)",
                  R"((?i)\b(?:username|user\s+name|login)\s*(?:is\s+|[:=]\s*)\S)",
              });
}

ContextClassifier::~ContextClassifier() = default;

bool ContextClassifier::AnyMatch(const RuleSet& rules, const std::string& text) {
  for (const auto& rule : rules) {
    if (RE2::PartialMatch(text, *rule)) {
      return true;
    }
  }
  return false;
}

bool ContextClassifier::IsQuestion(const std::string& prompt) const {
  return AnyMatch(question_rules_, prompt);
}

bool ContextClassifier::IsConfigContext(const std::string& prompt) const {
  if (AnyMatch(config_phrase_rules_, prompt)) {
    return true;
  }
  return AnyMatch(config_tool_rules_, prompt) && AnyMatch(config_vocab_rules_, prompt);
}

bool ContextClassifier::IsDisclosure(const std::string& prompt) const {
  return AnyMatch(disclosure_rules_, prompt);
}

ContextSignals ContextClassifier::Classify(const std::string& prompt) const {
  ContextSignals signals;
  if (prompt.empty()) {
    return signals;
  }
  signals.is_question = IsQuestion(prompt);
  signals.is_config_context = IsConfigContext(prompt);
  signals.is_disclosure = IsDisclosure(prompt);
  return signals;
}

}  // namespace promptguard
