#include "pipeline/result_json.h"

using json = nlohmann::json;

namespace promptguard {

json ToJson(const Finding& finding) {
  json j;
  j["category"] = CategoryName(finding.category);
  j["confidence"] = finding.confidence;
  j["source"] = SourceLabel(finding);
  if (finding.span) {
    j["span"] = {{"start", finding.span->start}, {"end", finding.span->end}};
  }
  j["rule"] = finding.rule;
  if (finding.replacement_hint) {
    j["replacementHint"] = *finding.replacement_hint;
  }
  return j;
}

json ToJson(const ContextSignals& context) {
  return {{"isQuestion", context.is_question},
          {"isDisclosure", context.is_disclosure},
          {"isConfigContext", context.is_config_context}};
}

json ToJson(const PhaseReport& phase) {
  json j = {{"name", phase.name},
            {"status", PhaseStatusName(phase.status)},
            {"findingCount", phase.finding_count},
            {"elapsedMs", phase.elapsed_ms}};
  if (!phase.error.empty()) {
    j["error"] = phase.error;
  }
  return j;
}

json ToJson(const ValidationResult& result) {
  json j;
  j["requestId"] = result.request_id;
  j["securityLevel"] = result.security_level;
  j["sanitizedText"] = result.sanitized_text;
  j["isBlocked"] = result.is_blocked;
  json blocked = json::array();
  for (auto category : result.blocked_categories) {
    blocked.push_back(CategoryName(category));
  }
  j["blockedCategories"] = blocked;
  j["warnings"] = result.warnings;
  j["confidenceScore"] = result.confidence_score;
  json findings = json::array();
  for (const auto& finding : result.findings) {
    findings.push_back(ToJson(finding));
  }
  j["findings"] = findings;
  json spans = json::array();
  for (const auto& span : result.sanitization_spans) {
    spans.push_back({{"start", span.start},
                     {"end", span.end},
                     {"replacementText", span.replacement_text},
                     {"originFindingIds", span.origin_finding_ids}});
  }
  j["sanitizationSpans"] = spans;
  j["context"] = ToJson(result.context);
  json phases = json::array();
  for (const auto& phase : result.phases) {
    phases.push_back(ToJson(phase));
  }
  j["phases"] = phases;
  j["modificationsMade"] = result.ModificationsMade();
  j["elapsedMs"] = result.elapsed_ms;
  return j;
}

std::string DumpJson(const json& j, bool pretty) {
  return j.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

}  // namespace promptguard
