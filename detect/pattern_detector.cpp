#include "detect/pattern_detector.h"

#include "detect/entropy.h"

#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace promptguard {

namespace {
constexpr char kCompositeRule[] = "jailbreak.composite";
constexpr char kEntropyRule[] = "credential.high_entropy";
constexpr int kMaxGroups = 10;

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string StripQuotes(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && (value[begin] == '"' || value[begin] == '\'')) {
    ++begin;
  }
  while (end > begin && (value[end - 1] == '"' || value[end - 1] == '\'')) {
    --end;
  }
  return value.substr(begin, end - begin);
}
}  // namespace

PatternDetector::PatternDetector(std::vector<PatternRule> rules,
                                 PatternDetectorOptions options)
    : options_(std::move(options)) {
  rules_.reserve(rules.size());
  for (auto& rule : rules) {
    if (rule.value_group < 0 || rule.value_group >= kMaxGroups) {
      throw MalformedDetectorRule(rule.id, "value_group out of range");
    }
    if (rule.confidence < 0.0 || rule.confidence > 1.0) {
      throw MalformedDetectorRule(rule.id, "confidence must be within [0, 1]");
    }
    if (rule.category == Category::kNormal) {
      throw MalformedDetectorRule(rule.id, "rules must target a threat category");
    }
    auto regex = CompileRule(rule.id, rule.pattern);
    if (regex->NumberOfCapturingGroups() < rule.value_group) {
      throw MalformedDetectorRule(rule.id, "value_group exceeds capture groups");
    }
    rules_.push_back({std::move(rule), std::move(regex)});
  }
  std::string token_pattern = "[A-Za-z0-9_\\-.+/=]{" +
                              std::to_string(std::max<std::size_t>(1, options_.min_token_length)) +
                              ",}";
  token_regex_ = CompileRule("credential.entropy_token", token_pattern);
  for (auto& value : options_.excluded_values) {
    value = Lower(value);
  }
  for (auto& keyword : options_.credential_keywords) {
    keyword = Lower(keyword);
  }
}

PatternDetector::~PatternDetector() = default;

std::vector<Finding> PatternDetector::Detect(const std::string& prompt,
                                             const SecurityLevelConfig& level,
                                             const CancellationToken& cancel) const {
  std::vector<Finding> findings;
  if (prompt.empty()) {
    return findings;
  }
  for (const auto& compiled : rules_) {
    if (cancel.IsCancelled()) {
      return findings;
    }
    ScanRule(compiled, prompt, &findings);
  }
  if (options_.entropy_scan && !cancel.IsCancelled()) {
    ScanEntropy(prompt, level, &findings);
  }
  EscalateJailbreak(&findings);
  return findings;
}

void PatternDetector::ScanRule(const CompiledRule& compiled, const std::string& prompt,
                               std::vector<Finding>* findings) const {
  const auto& rule = compiled.rule;
  const int groups = rule.value_group + 1;
  re2::StringPiece text(prompt);
  re2::StringPiece match[kMaxGroups];
  std::size_t pos = 0;
  while (pos <= prompt.size() &&
         compiled.regex->Match(text, pos, prompt.size(), RE2::UNANCHORED, match, groups)) {
    const std::size_t whole_start = static_cast<std::size_t>(match[0].data() - prompt.data());
    const std::size_t whole_end = whole_start + match[0].size();
    pos = whole_end > whole_start ? whole_end : whole_start + 1;

    const auto& value = match[rule.value_group];
    if (value.data() == nullptr || value.empty()) {
      continue;
    }
    const std::size_t start = static_cast<std::size_t>(value.data() - prompt.data());
    const std::size_t end = start + value.size();
    if (rule.category == Category::kCredential) {
      std::string raw(value.data(), value.size());
      if (raw.size() < rule.min_value_length || IsExcludedValue(raw)) {
        continue;
      }
    }

    Finding finding;
    finding.category = rule.category;
    finding.confidence = rule.confidence;
    finding.source = FindingSource::kPattern;
    finding.span = TextSpan{start, end};
    if (!rule.replacement.empty()) {
      finding.replacement_hint = rule.replacement;
    }
    finding.rule = rule.id;
    findings->push_back(std::move(finding));
  }
}

void PatternDetector::ScanEntropy(const std::string& prompt, const SecurityLevelConfig& level,
                                  std::vector<Finding>* findings) const {
  re2::StringPiece text(prompt);
  re2::StringPiece match;
  std::size_t pos = 0;
  while (pos < prompt.size() &&
         token_regex_->Match(text, pos, prompt.size(), RE2::UNANCHORED, &match, 1)) {
    std::size_t start = static_cast<std::size_t>(match.data() - prompt.data());
    std::size_t end = start + match.size();
    pos = end;
    // Sentence punctuation is not part of the token.
    while (end > start && prompt[end - 1] == '.') {
      --end;
    }
    if (end - start < options_.min_token_length) {
      continue;
    }
    std::string token = prompt.substr(start, end - start);
    if (!HasLetterAndDigit(token) || IsExcludedValue(token)) {
      continue;
    }
    const double entropy = ShannonEntropy(token);
    if (entropy <= level.entropy_threshold || !KeywordNear(prompt, start, end)) {
      continue;
    }
    const TextSpan span{start, end};
    bool covered = std::any_of(findings->begin(), findings->end(), [&](const Finding& f) {
      return f.category == Category::kCredential && f.span &&
             f.span->start <= span.start && f.span->end >= span.end;
    });
    if (covered) {
      continue;
    }
    Finding finding;
    finding.category = Category::kCredential;
    finding.confidence =
        std::min(0.95, 0.70 + 0.10 * (entropy - level.entropy_threshold) +
                           (HasMixedCase(token) ? 0.05 : 0.0));
    finding.source = FindingSource::kEntropy;
    finding.span = span;
    finding.replacement_hint = "[CREDENTIAL_MASKED]";
    finding.rule = kEntropyRule;
    findings->push_back(std::move(finding));
  }
}

void PatternDetector::EscalateJailbreak(std::vector<Finding>* findings) const {
  std::map<std::string, std::string> family_of;
  for (const auto& compiled : rules_) {
    if (compiled.rule.category == Category::kJailbreak) {
      family_of[compiled.rule.id] = compiled.rule.family;
    }
  }
  std::set<std::string> families;
  double strongest = 0.0;
  for (const auto& finding : *findings) {
    if (finding.category != Category::kJailbreak) {
      continue;
    }
    auto it = family_of.find(finding.rule);
    families.insert(it != family_of.end() ? it->second : finding.rule);
    strongest = std::max(strongest, finding.confidence);
  }
  if (families.size() < 2) {
    return;
  }
  Finding composite;
  composite.category = Category::kJailbreak;
  composite.confidence = families.size() >= 3 ? 0.99 : std::min(0.98, strongest + 0.10);
  composite.source = FindingSource::kPattern;
  composite.rule = kCompositeRule;
  findings->push_back(std::move(composite));
}

bool PatternDetector::IsExcludedValue(const std::string& value) const {
  const std::string lowered = Lower(StripQuotes(value));
  if (lowered.empty()) {
    return true;
  }
  // Template placeholders such as ${API_KEY}, {{token}} or <your-key>.
  if (lowered.rfind("${", 0) == 0 || lowered.rfind("{{", 0) == 0 || lowered[0] == '<') {
    return true;
  }
  return std::find(options_.excluded_values.begin(), options_.excluded_values.end(),
                   lowered) != options_.excluded_values.end();
}

bool PatternDetector::KeywordNear(const std::string& prompt, std::size_t start,
                                  std::size_t end) const {
  const std::size_t before_start =
      start > options_.keyword_window ? start - options_.keyword_window : 0;
  const std::size_t after_end = std::min(prompt.size(), end + options_.keyword_window);
  const std::string before = Lower(prompt.substr(before_start, start - before_start));
  const std::string after = Lower(prompt.substr(end, after_end - end));
  for (const auto& keyword : options_.credential_keywords) {
    if (keyword.empty()) {
      continue;
    }
    if (before.find(keyword) != std::string::npos || after.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace promptguard
