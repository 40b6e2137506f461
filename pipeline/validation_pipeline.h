#pragma once

#include "classifier/classifier_factory.h"
#include "common/cancellation.h"
#include "core/finding.h"
#include "core/security_level.h"
#include "detect/context_classifier.h"
#include "detect/pattern_detector.h"
#include "pipeline/phase_executor.h"
#include "tracing/span.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace promptguard {

class MetricsRegistry;

enum class PipelineState { kReceived, kContextResolved, kDetected, kMerged, kSanitized, kDecided, kFailed };

const char* PipelineStateName(PipelineState state);

struct PipelineOptions {
  // Upper bound for every detection phase; an adapter's own timeout may be
  // shorter.
  std::chrono::milliseconds phase_timeout{3000};
  // Classifier worker threads kept alive, and the ceiling the pool may grow
  // to while classifiers are slow.
  std::size_t workers{4};
  std::size_t max_workers{64};
};

// What one detection phase produced. Findings are appended, never replaced.
struct PhaseOutput {
  PhaseReport report;
  std::vector<Finding> findings;
  std::optional<ClassifierUnavailable> unavailable;
};

// Detector findings first, then each adapter's in registration order.
std::vector<Finding> AccumulateFindings(const std::vector<PhaseOutput>& outputs);

// Runs one validation: context resolution, the pattern detector on the calling
// thread while every classifier adapter runs on the worker pool, a
// bounded-wait join, then merge, sanitize and decide. Validate() is const and safe to call concurrently; the
// only shared state is the immutable level registry.
class ValidationPipeline {
 public:
  ValidationPipeline(std::shared_ptr<const SecurityLevelRegistry> levels,
                     std::shared_ptr<const PatternDetector> detector, AdapterList adapters = {},
                     PipelineOptions options = {}, MetricsRegistry* metrics = nullptr);
  ~ValidationPipeline();

  ValidationPipeline(const ValidationPipeline&) = delete;
  ValidationPipeline& operator=(const ValidationPipeline&) = delete;

  // Throws InvalidConfig for an unknown or empty level name before any
  // detection work starts.
  ValidationResult Validate(const std::string& prompt, const std::string& level_name,
                            const CancellationToken& cancellation = {}) const;
  // Throws InvalidConfig when `level` fails validation.
  ValidationResult Validate(const std::string& prompt, const SecurityLevelConfig& level,
                            const CancellationToken& cancellation = {}) const;

  // Context signals and raw detector findings with no decision.
  ContextSignals Analyze(const std::string& prompt, const SecurityLevelConfig& level,
                         std::vector<Finding>* findings) const;

  const SecurityLevelRegistry& Levels() const { return *levels_; }
  const AdapterList& Adapters() const { return adapters_; }

 private:
  struct PendingPhase;

  std::vector<PhaseOutput> RunPhases(const std::string& prompt, const SecurityLevelConfig& level,
                                     const CancellationToken& cancellation,
                                     const SpanContext& trace) const;
  void Join(std::vector<PendingPhase>* pending, const CancellationToken& cancellation) const;

  std::shared_ptr<const SecurityLevelRegistry> levels_;
  std::shared_ptr<const PatternDetector> detector_;
  AdapterList adapters_;
  PipelineOptions options_;
  MetricsRegistry* metrics_;
  ContextClassifier context_;
  std::unique_ptr<PhaseExecutor> executor_;
};

}  // namespace promptguard
