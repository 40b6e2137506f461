#include "metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace promptguard {

namespace {
MetricsRegistry g_metrics;

void AppendHistogram(std::ostringstream& out, const std::string& metric,
                     const std::string& labels, const LatencyHistogram& histogram) {
  const std::string prefix = labels.empty() ? "{" : "{" + labels + ",";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << metric << "_bucket" << prefix << "le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << histogram.counts[i].load() << "\n";
  }
  out << metric << "_bucket" << prefix << "le=\"+Inf\"} "
      << histogram.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  const std::string suffix = labels.empty() ? "" : "{" + labels + "}";
  out << metric << "_sum" << suffix << " " << histogram.sum_ms.load() << "\n";
  out << metric << "_count" << suffix << " " << histogram.total.load() << "\n";
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordValidation(const ValidationResult& result) {
  validations_.fetch_add(1, std::memory_order_relaxed);
  if (result.is_blocked) {
    blocked_.fetch_add(1, std::memory_order_relaxed);
  } else {
    allowed_.fetch_add(1, std::memory_order_relaxed);
  }
  if (result.ModificationsMade()) {
    sanitized_.fetch_add(1, std::memory_order_relaxed);
  }
  for (auto category : result.blocked_categories) {
    blocked_by_category_[static_cast<std::size_t>(category)].fetch_add(1, std::memory_order_relaxed);
  }
  for (auto category : result.warned_categories) {
    warned_by_category_[static_cast<std::size_t>(category)].fetch_add(1, std::memory_order_relaxed);
  }
  for (auto category : result.suppressed_categories) {
    suppressed_by_category_[static_cast<std::size_t>(category)].fetch_add(
        1, std::memory_order_relaxed);
  }
  validation_latency_.Record(result.elapsed_ms);
}

void MetricsRegistry::RecordPhase(const std::string& phase, PhaseStatus status, double ms) {
  std::lock_guard<std::mutex> lock(phase_mutex_);
  auto& histogram = phase_latency_[phase];
  if (!histogram) {
    histogram = std::make_unique<LatencyHistogram>();
  }
  histogram->Record(ms);
  ++phase_status_[{phase, PhaseStatusName(status)}];
}

void MetricsRegistry::RecordClassifierFailure(const std::string& classifier,
                                              const std::string& reason) {
  std::lock_guard<std::mutex> lock(classifier_mutex_);
  ++classifier_failures_[{classifier, reason}];
}

void MetricsRegistry::RecordInvalidConfig() {
  invalid_config_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t MetricsRegistry::BlockedFor(Category category) const {
  return blocked_by_category_[static_cast<std::size_t>(category)].load();
}

uint64_t MetricsRegistry::WarnedFor(Category category) const {
  return warned_by_category_[static_cast<std::size_t>(category)].load();
}

uint64_t MetricsRegistry::SuppressedFor(Category category) const {
  return suppressed_by_category_[static_cast<std::size_t>(category)].load();
}

uint64_t MetricsRegistry::ClassifierFailures(const std::string& classifier,
                                             const std::string& reason) const {
  std::lock_guard<std::mutex> lock(classifier_mutex_);
  auto it = classifier_failures_.find({classifier, reason});
  return it == classifier_failures_.end() ? 0 : it->second;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  // --- Counters ---
  out << "# HELP promptguard_validations_total Total validation calls that reached a decision\n";
  out << "# TYPE promptguard_validations_total counter\n";
  out << "promptguard_validations_total " << validations_.load() << "\n";

  out << "# HELP promptguard_blocked_total Validations that refused the prompt\n";
  out << "# TYPE promptguard_blocked_total counter\n";
  out << "promptguard_blocked_total " << blocked_.load() << "\n";

  out << "# HELP promptguard_allowed_total Validations that let the prompt through\n";
  out << "# TYPE promptguard_allowed_total counter\n";
  out << "promptguard_allowed_total " << allowed_.load() << "\n";

  out << "# HELP promptguard_sanitized_total Validations whose text was rewritten\n";
  out << "# TYPE promptguard_sanitized_total counter\n";
  out << "promptguard_sanitized_total " << sanitized_.load() << "\n";

  out << "# HELP promptguard_invalid_config_total Validation calls rejected for invalid configuration\n";
  out << "# TYPE promptguard_invalid_config_total counter\n";
  out << "promptguard_invalid_config_total " << invalid_config_.load() << "\n";

  out << "# HELP promptguard_category_decisions_total Per-category verdicts\n";
  out << "# TYPE promptguard_category_decisions_total counter\n";
  for (auto category : AllCategories()) {
    if (category == Category::kNormal) {
      continue;
    }
    const auto index = static_cast<std::size_t>(category);
    const std::string name = CategoryName(category);
    out << "promptguard_category_decisions_total{category=\"" << name
        << "\",decision=\"blocked\"} " << blocked_by_category_[index].load() << "\n";
    out << "promptguard_category_decisions_total{category=\"" << name
        << "\",decision=\"warned\"} " << warned_by_category_[index].load() << "\n";
    out << "promptguard_category_decisions_total{category=\"" << name
        << "\",decision=\"suppressed\"} " << suppressed_by_category_[index].load() << "\n";
  }

  out << "# HELP promptguard_classifier_failures_total Classifier calls that returned no verdict\n";
  out << "# TYPE promptguard_classifier_failures_total counter\n";
  {
    std::lock_guard<std::mutex> lock(classifier_mutex_);
    for (const auto& [key, count] : classifier_failures_) {
      out << "promptguard_classifier_failures_total{classifier=\"" << key.first
          << "\",reason=\"" << key.second << "\"} " << count << "\n";
    }
  }

  out << "# HELP promptguard_phase_outcomes_total Detection phase outcomes\n";
  out << "# TYPE promptguard_phase_outcomes_total counter\n";
  {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    for (const auto& [key, count] : phase_status_) {
      out << "promptguard_phase_outcomes_total{phase=\"" << key.first << "\",status=\""
          << key.second << "\"} " << count << "\n";
    }
  }

  // --- Latency histograms ---
  out << "# HELP promptguard_validation_duration_ms Validation end-to-end latency in milliseconds\n";
  out << "# TYPE promptguard_validation_duration_ms histogram\n";
  AppendHistogram(out, "promptguard_validation_duration_ms", "", validation_latency_);

  out << "# HELP promptguard_phase_duration_ms Per-phase latency in milliseconds\n";
  out << "# TYPE promptguard_phase_duration_ms histogram\n";
  {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    for (const auto& [phase, histogram] : phase_latency_) {
      AppendHistogram(out, "promptguard_phase_duration_ms", "phase=\"" + phase + "\"", *histogram);
    }
  }

  return out.str();
}

MetricsRegistry& GlobalMetrics() { return g_metrics; }

}  // namespace promptguard
