#pragma once

#include "logging/audit_logger.h"
#include "pipeline/validation_pipeline.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace promptguard {

// One prompt per line. Trailing carriage returns are stripped and blank lines
// skipped.
std::vector<std::string> ReadPromptLines(std::istream& in);

struct BatchOutcome {
  std::size_t prompts{0};
  std::size_t blocked{0};
};

// Validates each prompt in order under `level_name`, writing one JSON
// document per prompt to `out` (nothing when null) and one audit line per
// decision when `audit` is enabled. An unknown level is audited as a
// rejection and rethrown as InvalidConfig.
BatchOutcome ValidatePrompts(const ValidationPipeline& pipeline,
                             const std::vector<std::string>& prompts,
                             const std::string& level_name, AuditLogger* audit,
                             std::ostream* out, bool pretty = false);

// 2 when any prompt was blocked, else 0.
int ExitCodeFor(const BatchOutcome& outcome);

}  // namespace promptguard
