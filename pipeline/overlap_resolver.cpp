#include "pipeline/overlap_resolver.h"

#include <algorithm>

namespace promptguard {

SanitizationOutcome OverlapResolver::Resolve(const std::string& prompt,
                                             std::vector<SpanCandidate> candidates) {
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&](const SpanCandidate& c) {
                                    return c.start >= c.end || c.end > prompt.size();
                                  }),
                   candidates.end());
  std::sort(candidates.begin(), candidates.end(),
            [](const SpanCandidate& a, const SpanCandidate& b) {
              if (a.start != b.start) {
                return a.start < b.start;
              }
              const auto a_len = a.end - a.start;
              const auto b_len = b.end - b.start;
              if (a_len != b_len) {
                return a_len > b_len;
              }
              return a.finding_id < b.finding_id;
            });

  SanitizationOutcome outcome;
  for (auto& candidate : candidates) {
    if (!outcome.spans.empty() && candidate.start < outcome.spans.back().end) {
      outcome.spans.back().origin_finding_ids.push_back(candidate.finding_id);
      continue;
    }
    SanitizationSpan span;
    span.start = candidate.start;
    span.end = candidate.end;
    span.replacement_text = std::move(candidate.replacement);
    span.origin_finding_ids.push_back(candidate.finding_id);
    outcome.spans.push_back(std::move(span));
  }

  outcome.sanitized_text = prompt;
  for (auto it = outcome.spans.rbegin(); it != outcome.spans.rend(); ++it) {
    outcome.sanitized_text.replace(it->start, it->end - it->start, it->replacement_text);
  }
  return outcome;
}

std::vector<SpanCandidate> OverlapResolver::CandidatesFrom(
    const std::vector<Finding>& findings, const std::vector<std::size_t>& ids) {
  std::vector<SpanCandidate> candidates;
  candidates.reserve(ids.size());
  for (auto id : ids) {
    if (id >= findings.size()) {
      continue;
    }
    const auto& finding = findings[id];
    if (!finding.span || !finding.replacement_hint) {
      continue;
    }
    candidates.push_back({finding.span->start, finding.span->end, *finding.replacement_hint, id});
  }
  return candidates;
}

}  // namespace promptguard
