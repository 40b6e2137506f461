#include "pipeline/validation_pipeline.h"

#include "logging/logger.h"
#include "metrics/metrics.h"
#include "pipeline/decision_merger.h"

#include <algorithm>
#include <sstream>

namespace promptguard {

namespace {
constexpr char kDetectorPhase[] = "pattern_detector";
constexpr std::chrono::milliseconds kJoinSlice{5};

PhaseStatus StatusFor(UnavailableReason reason) {
  switch (reason) {
    case UnavailableReason::kTimeout:
      return PhaseStatus::kTimedOut;
    case UnavailableReason::kCancelled:
      return PhaseStatus::kCancelled;
    default:
      return PhaseStatus::kFailed;
  }
}

std::string CategoryList(const std::set<Category>& categories) {
  std::string joined;
  for (auto category : categories) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += CategoryName(category);
  }
  return joined.empty() ? "-" : joined;
}

double MillisSince(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}
}  // namespace

const char* PipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::kReceived:
      return "RECEIVED";
    case PipelineState::kContextResolved:
      return "CONTEXT_RESOLVED";
    case PipelineState::kDetected:
      return "DETECTED";
    case PipelineState::kMerged:
      return "MERGED";
    case PipelineState::kSanitized:
      return "SANITIZED";
    case PipelineState::kDecided:
      return "DECIDED";
    case PipelineState::kFailed:
      return "FAILED";
  }
  return "FAILED";
}

std::vector<Finding> AccumulateFindings(const std::vector<PhaseOutput>& outputs) {
  std::vector<Finding> findings;
  for (const auto& output : outputs) {
    findings.insert(findings.end(), output.findings.begin(), output.findings.end());
  }
  return findings;
}

struct ValidationPipeline::PendingPhase {
  std::string name;
  std::future<PhaseOutput> future;
  CancellationToken token;
  Clock::time_point started;
  Clock::time_point deadline;
  std::chrono::milliseconds budget{0};
  std::optional<PhaseOutput> output;

  void Resolve(PhaseStatus status, std::string error) {
    PhaseOutput resolved;
    resolved.report.name = name;
    resolved.report.status = status;
    resolved.report.elapsed_ms = MillisSince(started);
    resolved.report.error = std::move(error);
    output = std::move(resolved);
  }
};

ValidationPipeline::ValidationPipeline(std::shared_ptr<const SecurityLevelRegistry> levels,
                                       std::shared_ptr<const PatternDetector> detector,
                                       AdapterList adapters, PipelineOptions options,
                                       MetricsRegistry* metrics)
    : levels_(std::move(levels)),
      detector_(std::move(detector)),
      adapters_(std::move(adapters)),
      options_(options),
      metrics_(metrics) {
  if (!levels_) {
    throw InvalidConfig("validation pipeline requires a security level registry");
  }
  if (!detector_) {
    throw InvalidConfig("validation pipeline requires a pattern detector");
  }
  if (options_.phase_timeout.count() <= 0) {
    throw InvalidConfig("phase timeout must be positive");
  }
  for (const auto& adapter : adapters_) {
    if (!adapter) {
      throw InvalidConfig("null classifier adapter");
    }
  }
  executor_ = std::make_unique<PhaseExecutor>(options_.workers, options_.max_workers);
  executor_->Start();
  log::Info("pipeline", "validation pipeline ready",
            "rules=" + std::to_string(detector_->RuleCount()) +
                " classifiers=" + std::to_string(adapters_.size()) +
                " workers=" + std::to_string(executor_->Workers()));
}

ValidationPipeline::~ValidationPipeline() = default;

ValidationResult ValidationPipeline::Validate(const std::string& prompt,
                                              const std::string& level_name,
                                              const CancellationToken& cancellation) const {
  const SecurityLevelConfig* level = nullptr;
  try {
    level = &levels_->Lookup(level_name);
  } catch (const InvalidConfig& e) {
    log::Warn("pipeline", "rejected validation", std::string("error=") + e.what());
    if (metrics_) {
      metrics_->RecordInvalidConfig();
    }
    throw;
  }
  return Validate(prompt, *level, cancellation);
}

ValidationResult ValidationPipeline::Validate(const std::string& prompt,
                                              const SecurityLevelConfig& level,
                                              const CancellationToken& cancellation) const {
  const auto trace = tracing::NewContext();
  const std::string& request_id = trace.trace_id;
  Span total("validate", trace);
  auto transition = [&](PipelineState state, const std::string& detail) {
    log::Debug("pipeline", PipelineStateName(state),
               "request_id=" + request_id + (detail.empty() ? "" : " " + detail));
  };

  transition(PipelineState::kReceived, "level=" + level.name + " bytes=" +
                                           std::to_string(prompt.size()));
  try {
    level.Validate();
  } catch (const InvalidConfig& e) {
    transition(PipelineState::kFailed, std::string("error=") + e.what());
    if (metrics_) {
      metrics_->RecordInvalidConfig();
    }
    throw;
  }

  const auto context = context_.Classify(prompt);
  transition(PipelineState::kContextResolved,
             std::string("question=") + (context.is_question ? "1" : "0") +
                 " disclosure=" + (context.is_disclosure ? "1" : "0") +
                 " config=" + (context.is_config_context ? "1" : "0"));

  auto outputs = RunPhases(prompt, level, cancellation, trace);
  std::vector<PhaseReport> reports;
  reports.reserve(outputs.size());
  for (const auto& output : outputs) {
    const auto& report = output.report;
    if (report.status != PhaseStatus::kOk) {
      log::Warn("pipeline", "reduced detection coverage",
                "request_id=" + request_id + " phase=" + report.name +
                    " status=" + PhaseStatusName(report.status) + " error=" + report.error);
    }
    if (metrics_) {
      metrics_->RecordPhase(report.name, report.status, report.elapsed_ms);
      if (output.unavailable) {
        metrics_->RecordClassifierFailure(report.name,
                                          UnavailableReasonName(output.unavailable->reason));
      }
    }
    reports.push_back(report);
  }
  auto findings = AccumulateFindings(outputs);
  transition(PipelineState::kDetected, "findings=" + std::to_string(findings.size()));

  auto result = DecisionMerger::Decide(prompt, context, std::move(findings), level,
                                       std::move(reports));
  transition(PipelineState::kMerged, "blocked=" + CategoryList(result.blocked_categories) +
                                         " warned=" + CategoryList(result.warned_categories));
  transition(PipelineState::kSanitized,
             "spans=" + std::to_string(result.sanitization_spans.size()));

  result.request_id = request_id;
  result.elapsed_ms = total.Finish();
  transition(PipelineState::kDecided, std::string("is_blocked=") +
                                          (result.is_blocked ? "true" : "false"));
  if (metrics_) {
    metrics_->RecordValidation(result);
  }
  return result;
}

ContextSignals ValidationPipeline::Analyze(const std::string& prompt,
                                           const SecurityLevelConfig& level,
                                           std::vector<Finding>* findings) const {
  level.Validate();
  if (findings) {
    *findings = detector_->Detect(prompt, level);
  }
  return context_.Classify(prompt);
}

std::vector<PhaseOutput> ValidationPipeline::RunPhases(const std::string& prompt,
                                                       const SecurityLevelConfig& level,
                                                       const CancellationToken& cancellation,
                                                       const SpanContext& trace) const {
  // Tasks may outlive this call when their phase times out, so they own
  // copies of everything they read.
  auto shared_prompt = std::make_shared<const std::string>(prompt);
  const auto started = Clock::now();

  std::vector<PendingPhase> pending;
  pending.reserve(adapters_.size());
  for (const auto& adapter : adapters_) {
    PendingPhase phase;
    phase.name = adapter->Name();
    phase.token = cancellation.Child();
    phase.started = started;
    phase.budget = std::min(adapter->Timeout(), options_.phase_timeout);
    phase.deadline = started + phase.budget;
    CallContext call{phase.deadline, phase.token};
    auto context = tracing::ChildContext(trace);
    try {
      phase.future = executor_->Submit([adapter, shared_prompt, call, context]() {
        PhaseOutput output;
        output.report.name = adapter->Name();
        Span span(adapter->Name(), context);
        auto outcome = adapter->Invoke(*shared_prompt, call);
        output.report.elapsed_ms = span.Finish();
        if (outcome.ok()) {
          output.findings = std::move(outcome.findings);
        } else {
          output.report.status = StatusFor(outcome.error->reason);
          output.report.error = std::string(UnavailableReasonName(outcome.error->reason)) +
                                ": " + outcome.error->message;
          output.unavailable = outcome.error;
        }
        output.report.finding_count = output.findings.size();
        return output;
      });
    } catch (const std::runtime_error& e) {
      phase.Resolve(PhaseStatus::kFailed, e.what());
    }
    pending.push_back(std::move(phase));
  }

  // Detection runs on the calling thread, never queued behind a classifier.
  std::vector<PhaseOutput> outputs;
  outputs.reserve(adapters_.size() + 1);
  {
    PhaseOutput detected;
    detected.report.name = kDetectorPhase;
    Span span(kDetectorPhase, tracing::ChildContext(trace));
    detected.findings = detector_->Detect(prompt, level, cancellation);
    detected.report.elapsed_ms = span.Finish();
    if (cancellation.IsCancelled()) {
      detected.findings.clear();
      detected.report.status = PhaseStatus::kCancelled;
      detected.report.error = "validation cancelled by caller";
    }
    detected.report.finding_count = detected.findings.size();
    outputs.push_back(std::move(detected));
  }

  Join(&pending, cancellation);
  for (auto& phase : pending) {
    outputs.push_back(std::move(*phase.output));
  }
  return outputs;
}

// Bounded-wait join: each phase is waited on until its own deadline while the
// caller's cancellation is polled. Phases left behind get their token fired
// and contribute no findings.
void ValidationPipeline::Join(std::vector<PendingPhase>* pending,
                              const CancellationToken& cancellation) const {
  while (true) {
    const bool cancelled = cancellation.IsCancelled();
    const auto now = Clock::now();
    PendingPhase* waiting = nullptr;
    for (auto& phase : *pending) {
      if (phase.output) {
        continue;
      }
      if (phase.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        try {
          phase.output = phase.future.get();
        } catch (const std::exception& e) {
          phase.Resolve(PhaseStatus::kFailed, e.what());
        } catch (...) {
          phase.Resolve(PhaseStatus::kFailed, "classifier raised a non-standard exception");
        }
        continue;
      }
      if (cancelled) {
        phase.token.Cancel();
        phase.Resolve(PhaseStatus::kCancelled, "validation cancelled by caller");
        continue;
      }
      if (now >= phase.deadline) {
        phase.token.Cancel();
        phase.Resolve(PhaseStatus::kTimedOut,
                      "no result within " + std::to_string(phase.budget.count()) + "ms");
        continue;
      }
      if (!waiting || phase.deadline < waiting->deadline) {
        waiting = &phase;
      }
    }
    if (!waiting) {
      return;
    }
    waiting->future.wait_until(std::min(waiting->deadline, now + kJoinSlice));
  }
}

}  // namespace promptguard
