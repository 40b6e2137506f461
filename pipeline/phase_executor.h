#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace promptguard {

// Worker pool that runs classifier phases. Each submitted task hands its
// result back through a future, so a caller can wait on it with its own
// deadline. Tasks must own everything they touch: a caller that stops waiting
// does not stop the task.
//
// Starts `workers` threads and adds one whenever a task is queued with no idle
// worker to take it, up to `max_workers`. A hung classifier therefore holds
// its own thread instead of delaying phases queued behind it.
class PhaseExecutor {
 public:
  explicit PhaseExecutor(std::size_t workers = 4, std::size_t max_workers = 64,
                         std::size_t max_queue_depth = 256);
  ~PhaseExecutor();

  PhaseExecutor(const PhaseExecutor&) = delete;
  PhaseExecutor& operator=(const PhaseExecutor&) = delete;

  void Start();
  // Drains queued tasks, then joins the workers.
  void Stop();

  std::size_t Workers() const { return worker_count_; }
  std::size_t MaxWorkers() const { return max_workers_; }
  // Threads currently alive, including those added under load.
  std::size_t LiveWorkers() const;

  // Blocks while the queue is full. Throws std::runtime_error once stopped.
  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> Submit(Fn fn) {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
  }

 private:
  void Enqueue(std::function<void()> task);
  void Worker();
  void SpawnLocked();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable producer_cv_;
  bool running_{false};
  bool stop_{false};
  std::size_t idle_{0};
  std::size_t worker_count_{4};
  std::size_t max_workers_{64};
  std::size_t max_queue_depth_{256};
};

}  // namespace promptguard
