#pragma once

#include "core/finding.h"
#include "core/security_level.h"

#include <string>
#include <vector>

namespace promptguard {

// Turns accumulated findings into a verdict for one security level.
//
// Context override: a finding is suppressed from blocking when the prompt is a
// question or a configuration discussion and is not a disclosure. Jailbreak
// findings are never suppressed. Suppressed findings stay in the audit list
// and surface as warnings only.
class DecisionMerger {
 public:
  static bool Suppressed(const Finding& finding, const ContextSignals& context);

  // `findings` is taken as-is; ids in the result index into it. Failed phases
  // become degraded-coverage warnings.
  static ValidationResult Decide(const std::string& prompt, const ContextSignals& context,
                                 std::vector<Finding> findings,
                                 const SecurityLevelConfig& config,
                                 std::vector<PhaseReport> phases = {});
};

}  // namespace promptguard
