#pragma once

#include "common/cancellation.h"
#include "core/finding.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

enum class UnavailableReason { kTimeout, kUnreachable, kHttpStatus, kMalformedResponse, kCancelled };

const char* UnavailableReasonName(UnavailableReason reason);

// A classifier could not be reached or understood. Recovered locally: the
// adapter contributes no findings and the pipeline reports reduced coverage.
struct ClassifierUnavailable {
  UnavailableReason reason{UnavailableReason::kUnreachable};
  std::string message;
};

struct ClassifierOutcome {
  std::vector<Finding> findings;
  std::optional<ClassifierUnavailable> error;

  bool ok() const { return !error.has_value(); }

  static ClassifierOutcome Unavailable(UnavailableReason reason, std::string message) {
    ClassifierOutcome outcome;
    outcome.error = ClassifierUnavailable{reason, std::move(message)};
    return outcome;
  }
};

// One external ML classifier, normalized to Findings. Invoke() never throws;
// every failure comes back as ClassifierOutcome::error.
class ClassifierAdapter {
 public:
  virtual ~ClassifierAdapter() = default;

  virtual std::string Name() const = 0;
  virtual std::chrono::milliseconds Timeout() const = 0;
  virtual ClassifierOutcome Invoke(const std::string& prompt, const CallContext& call) const = 0;
};

}  // namespace promptguard
