#pragma once

#include "core/finding.h"

#include <string>
#include <vector>

namespace promptguard {

struct SpanCandidate {
  std::size_t start{0};
  std::size_t end{0};
  std::string replacement;
  std::size_t finding_id{0};
};

struct SanitizationOutcome {
  std::string sanitized_text;
  std::vector<SanitizationSpan> spans;  // accepted, ascending by start
};

// Picks one non-overlapping set of redactions and applies it in a single
// right-to-left pass over the prompt. Candidates are ordered by
// (start asc, length desc, finding id asc); a candidate overlapping the last
// accepted span is dropped and its finding id recorded on that span.
// Candidates outside the prompt or with start >= end are ignored.
class OverlapResolver {
 public:
  static SanitizationOutcome Resolve(const std::string& prompt,
                                     std::vector<SpanCandidate> candidates);

  // Candidates built from the findings' spans and replacement hints. Findings
  // without either are skipped.
  static std::vector<SpanCandidate> CandidatesFrom(const std::vector<Finding>& findings,
                                                   const std::vector<std::size_t>& ids);
};

}  // namespace promptguard
