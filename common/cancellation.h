#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace promptguard {

// Shared cancellation flag. Copies observe the same state; a child token is
// cancelled when either it or any ancestor is cancelled. A default-constructed
// token can never be cancelled.
class CancellationToken {
 public:
  CancellationToken() = default;

  static CancellationToken Create() {
    CancellationToken token;
    token.state_ = std::make_shared<State>();
    return token;
  }

  CancellationToken Child() const {
    CancellationToken child = Create();
    child.state_->parent = state_;
    return child;
  }

  void Cancel() const {
    if (state_) {
      state_->cancelled.store(true, std::memory_order_release);
    }
  }

  bool IsCancelled() const {
    for (auto* state = state_.get(); state != nullptr; state = state->parent.get()) {
      if (state->cancelled.load(std::memory_order_acquire)) {
        return true;
      }
    }
    return false;
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<State> parent;
  };

  std::shared_ptr<State> state_;
};

using Clock = std::chrono::steady_clock;

// Deadline and cancellation for one outbound call.
struct CallContext {
  Clock::time_point deadline{Clock::time_point::max()};
  CancellationToken cancellation;

  bool Expired() const { return Clock::now() >= deadline; }
  std::chrono::milliseconds Remaining() const {
    if (deadline == Clock::time_point::max()) {
      return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }
};

}  // namespace promptguard
