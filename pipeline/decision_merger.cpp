#include "pipeline/decision_merger.h"

#include "pipeline/overlap_resolver.h"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace promptguard {

namespace {
std::string FormatConfidence(double confidence) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << confidence;
  return out.str();
}

void RaiseMax(std::map<Category, double>* by_category, Category category, double confidence) {
  auto it = by_category->find(category);
  if (it == by_category->end()) {
    by_category->emplace(category, confidence);
  } else {
    it->second = std::max(it->second, confidence);
  }
}
}  // namespace

bool DecisionMerger::Suppressed(const Finding& finding, const ContextSignals& context) {
  if (finding.category == Category::kJailbreak) {
    return false;
  }
  return (context.is_question || context.is_config_context) && !context.is_disclosure;
}

ValidationResult DecisionMerger::Decide(const std::string& prompt,
                                        const ContextSignals& context,
                                        std::vector<Finding> findings,
                                        const SecurityLevelConfig& config,
                                        std::vector<PhaseReport> phases) {
  config.Validate();

  ValidationResult result;
  result.security_level = config.name;
  result.original_prompt = prompt;
  result.context = context;
  result.findings = std::move(findings);
  result.phases = std::move(phases);

  std::map<Category, double> active;
  std::map<Category, double> suppressed;
  std::vector<std::size_t> sanitize_ids;
  double confidence = -1.0;

  for (std::size_t id = 0; id < result.findings.size(); ++id) {
    const auto& finding = result.findings[id];
    if (finding.category == Category::kNormal) {
      continue;
    }
    if (Suppressed(finding, context)) {
      RaiseMax(&suppressed, finding.category, finding.confidence);
      continue;
    }
    RaiseMax(&active, finding.category, finding.confidence);
    confidence = std::max(confidence, finding.confidence);
    if (finding.span && finding.replacement_hint &&
        finding.confidence >= config.detection_threshold) {
      sanitize_ids.push_back(id);
    }
  }
  result.confidence_score = confidence < 0.0 ? 1.0 : confidence;

  std::vector<std::string> warned;
  for (auto category : AllCategories()) {
    auto it = active.find(category);
    if (it == active.end()) {
      continue;
    }
    if (it->second >= config.blocking_threshold) {
      result.blocked_categories.insert(category);
      result.warnings.push_back(std::string(CategoryName(category)) + " blocked (confidence " +
                                FormatConfidence(it->second) + ")");
    } else if (it->second >= config.detection_threshold) {
      result.warned_categories.insert(category);
      warned.push_back(std::string(CategoryName(category)) +
                       " detected below blocking threshold (confidence " +
                       FormatConfidence(it->second) + ")");
    }
  }
  result.warnings.insert(result.warnings.end(), warned.begin(), warned.end());

  const char* reason = context.is_question ? "question context" : "configuration context";
  for (auto category : AllCategories()) {
    auto it = suppressed.find(category);
    if (it == suppressed.end() || it->second < config.detection_threshold) {
      continue;
    }
    result.suppressed_categories.insert(category);
    result.warnings.push_back(std::string(CategoryName(category)) +
                              " finding suppressed by " + reason + " (confidence " +
                              FormatConfidence(it->second) + ")");
  }

  for (const auto& phase : result.phases) {
    if (phase.status == PhaseStatus::kOk) {
      continue;
    }
    std::string warning = "reduced detection coverage: " + phase.name + " " +
                          PhaseStatusName(phase.status);
    if (!phase.error.empty()) {
      warning += " (" + phase.error + ")";
    }
    result.warnings.push_back(std::move(warning));
  }

  auto outcome = OverlapResolver::Resolve(
      prompt, OverlapResolver::CandidatesFrom(result.findings, sanitize_ids));
  result.sanitized_text = std::move(outcome.sanitized_text);
  result.sanitization_spans = std::move(outcome.spans);

  result.is_blocked = config.block_mode && !result.blocked_categories.empty();
  return result;
}

}  // namespace promptguard
