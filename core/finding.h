#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace promptguard {

// Closed set of detection categories. Order matters: warnings and
// serialized category lists follow enum order.
enum class Category {
  kCredential,
  kPersonalInfo,
  kInjection,
  kMaliciousCode,
  kJailbreak,
  kNormal,
};

const char* CategoryName(Category category);
std::optional<Category> ParseCategory(const std::string& name);
std::vector<Category> AllCategories();

enum class FindingSource { kPattern, kEntropy, kClassifier };

// Half-open byte range into the prompt.
struct TextSpan {
  std::size_t start{0};
  std::size_t end{0};

  std::size_t length() const { return end > start ? end - start : 0; }
  bool Overlaps(const TextSpan& other) const {
    return start < other.end && other.start < end;
  }
};

// One unit of detection evidence. A Finding without a span is a whole-prompt
// judgment (typically from a classifier); with a span it is a precise match.
struct Finding {
  Category category{Category::kNormal};
  double confidence{0.0};
  FindingSource source{FindingSource::kPattern};
  std::string classifier;  // adapter name when source == kClassifier
  std::optional<TextSpan> span;
  std::optional<std::string> replacement_hint;
  std::string rule;  // audit label: rule id, entity type or classifier label
};

// "pattern", "entropy" or "classifier:<name>".
std::string SourceLabel(const Finding& finding);

double ClampConfidence(double value);

struct ContextSignals {
  bool is_question{false};
  bool is_disclosure{false};
  bool is_config_context{false};
};

struct SanitizationSpan {
  std::size_t start{0};
  std::size_t end{0};
  std::string replacement_text;
  // Index into ValidationResult::findings. The first id is the finding whose
  // span was applied; the rest were subsumed by it.
  std::vector<std::size_t> origin_finding_ids;
};

enum class PhaseStatus { kOk, kFailed, kTimedOut, kCancelled };

const char* PhaseStatusName(PhaseStatus status);

struct PhaseReport {
  std::string name;
  PhaseStatus status{PhaseStatus::kOk};
  std::size_t finding_count{0};
  double elapsed_ms{0.0};
  std::string error;
};

struct ValidationResult {
  std::string request_id;
  std::string security_level;
  std::string original_prompt;
  std::string sanitized_text;
  std::vector<Finding> findings;  // full and unfiltered, for audit
  std::vector<SanitizationSpan> sanitization_spans;
  std::set<Category> blocked_categories;
  std::set<Category> warned_categories;     // detected below blocking threshold
  std::set<Category> suppressed_categories;  // held back by question/config context
  std::vector<std::string> warnings;
  double confidence_score{1.0};
  bool is_blocked{false};
  ContextSignals context;
  std::vector<PhaseReport> phases;
  double elapsed_ms{0.0};

  bool ModificationsMade() const { return sanitized_text != original_prompt; }
};

}  // namespace promptguard
