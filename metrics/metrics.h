#pragma once

#include "core/finding.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace promptguard {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, +Inf
  static constexpr std::array<double, 10> kBuckets{1.0,   5.0,   10.0,  25.0,   50.0,
                                                   100.0, 250.0, 500.0, 1000.0, 2500.0};
  std::array<std::atomic<uint64_t>, 11> counts{};  // 10 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
 public:
  // One finished validation: outcome, per-category verdicts, end-to-end latency.
  void RecordValidation(const ValidationResult& result);
  void RecordPhase(const std::string& phase, PhaseStatus status, double ms);
  void RecordClassifierFailure(const std::string& classifier, const std::string& reason);
  void RecordInvalidConfig();

  uint64_t Validations() const { return validations_.load(); }
  uint64_t Blocked() const { return blocked_.load(); }
  uint64_t Allowed() const { return allowed_.load(); }
  uint64_t BlockedFor(Category category) const;
  uint64_t WarnedFor(Category category) const;
  uint64_t SuppressedFor(Category category) const;
  uint64_t ClassifierFailures(const std::string& classifier, const std::string& reason) const;

  std::string RenderPrometheus() const;

 private:
  using CategoryCounters = std::array<std::atomic<uint64_t>, 6>;

  std::atomic<uint64_t> validations_{0};
  std::atomic<uint64_t> blocked_{0};
  std::atomic<uint64_t> allowed_{0};
  std::atomic<uint64_t> sanitized_{0};
  std::atomic<uint64_t> invalid_config_{0};
  CategoryCounters blocked_by_category_{};
  CategoryCounters warned_by_category_{};
  CategoryCounters suppressed_by_category_{};

  LatencyHistogram validation_latency_;

  mutable std::mutex phase_mutex_;
  std::map<std::string, std::unique_ptr<LatencyHistogram>> phase_latency_;
  std::map<std::pair<std::string, std::string>, uint64_t> phase_status_;  // (phase, status)

  mutable std::mutex classifier_mutex_;
  std::map<std::pair<std::string, std::string>, uint64_t> classifier_failures_;  // (name, reason)
};

MetricsRegistry& GlobalMetrics();

}  // namespace promptguard
