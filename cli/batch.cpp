#include "cli/batch.h"

#include "logging/logger.h"
#include "pipeline/result_json.h"

#include <algorithm>
#include <cctype>

namespace promptguard {

std::vector<std::string> ReadPromptLines(std::istream& in) {
  std::vector<std::string> prompts;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const bool blank = std::all_of(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (!blank) {
      prompts.push_back(line);
    }
  }
  return prompts;
}

BatchOutcome ValidatePrompts(const ValidationPipeline& pipeline,
                             const std::vector<std::string>& prompts,
                             const std::string& level_name, AuditLogger* audit,
                             std::ostream* out, bool pretty) {
  BatchOutcome outcome;
  for (const auto& prompt : prompts) {
    ValidationResult result;
    try {
      result = pipeline.Validate(prompt, level_name);
    } catch (const InvalidConfig& e) {
      if (audit && audit->Enabled()) {
        audit->LogRejection(level_name, e.what());
      }
      throw;
    }
    if (audit && audit->Enabled()) {
      audit->LogValidation(result);
    }
    if (out) {
      *out << DumpJson(ToJson(result), pretty) << "\n";
    }
    ++outcome.prompts;
    if (result.is_blocked) {
      ++outcome.blocked;
    }
  }
  if (prompts.size() > 1) {
    log::Info("cli", "batch validated",
              "prompts=" + std::to_string(outcome.prompts) +
                  " blocked=" + std::to_string(outcome.blocked));
  }
  return outcome;
}

int ExitCodeFor(const BatchOutcome& outcome) { return outcome.blocked > 0 ? 2 : 0; }

}  // namespace promptguard
