#pragma once

// Request ids and an RAII phase timer.
//
// Every validation gets a root SpanContext whose trace_id doubles as the
// request id; each phase runs under a child context. Span::OnEnd is where
// timings flow into MetricsRegistry.

#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <thread>

namespace promptguard {

struct SpanContext {
  std::string trace_id;  // 32-char lowercase hex (16 bytes)
  std::string span_id;   // 16-char lowercase hex (8 bytes)

  bool valid() const { return trace_id.size() == 32 && span_id.size() == 16; }
};

namespace tracing {

namespace detail {
inline uint64_t RandomU64() {
  // Per-thread RNG seeded from the clock; phases run on pool threads.
  static thread_local std::mt19937_64 rng{
      static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()) ^
      static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()))};
  return rng();
}
}  // namespace detail

// Lowercase hex string encoding `bytes` random bytes. `bytes` must be a
// multiple of 8.
inline std::string RandomHex(std::size_t bytes) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < bytes / 8; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(16) << detail::RandomU64();
  }
  return oss.str();
}

inline SpanContext NewContext() { return SpanContext{RandomHex(16), RandomHex(8)}; }

// Inherits trace_id, generates a new span_id. An invalid parent starts a new
// trace.
inline SpanContext ChildContext(const SpanContext& parent) {
  std::string tid = parent.trace_id.size() == 32 ? parent.trace_id : RandomHex(16);
  return SpanContext{tid, RandomHex(8)};
}

}  // namespace tracing

// RAII timer for one named phase. OnEnd receives (name, context, duration_ms)
// exactly once, from Finish() or the destructor.
class Span {
 public:
  using OnEnd = std::function<void(const std::string&, const SpanContext&, double)>;

  Span(std::string name, SpanContext context, OnEnd on_end = nullptr)
      : name_(std::move(name)),
        context_(std::move(context)),
        on_end_(std::move(on_end)),
        start_(std::chrono::steady_clock::now()) {}

  ~Span() { Finish(); }

  Span(const Span&) = delete;
  Span& operator=(const Span&) = delete;

  // Idempotent.
  double Finish() {
    if (finished_) return elapsed_ms_;
    finished_ = true;
    elapsed_ms_ = ElapsedMs();
    if (on_end_) on_end_(name_, context_, elapsed_ms_);
    return elapsed_ms_;
  }

  double ElapsedMs() const {
    if (finished_) return elapsed_ms_;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start_).count();
  }

  const SpanContext& context() const { return context_; }
  const std::string& name() const { return name_; }

 private:
  std::string name_;
  SpanContext context_;
  OnEnd on_end_;
  std::chrono::steady_clock::time_point start_;
  bool finished_{false};
  double elapsed_ms_{0.0};
};

}  // namespace promptguard
