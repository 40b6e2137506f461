#include "pipeline/phase_executor.h"

#include <algorithm>

namespace promptguard {

PhaseExecutor::PhaseExecutor(std::size_t workers, std::size_t max_workers,
                             std::size_t max_queue_depth)
    : worker_count_(workers == 0 ? 1 : workers),
      max_workers_(std::max(max_workers, worker_count_)),
      max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {}

PhaseExecutor::~PhaseExecutor() { Stop(); }

void PhaseExecutor::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  stop_ = false;
  running_ = true;
  for (std::size_t i = 0; i < worker_count_; ++i) {
    SpawnLocked();
  }
}

void PhaseExecutor::Stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
    workers.swap(workers_);
  }
  cv_.notify_all();
  producer_cv_.notify_all();
  for (auto &worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

std::size_t PhaseExecutor::LiveWorkers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

void PhaseExecutor::SpawnLocked() {
  workers_.emplace_back(&PhaseExecutor::Worker, this);
}

void PhaseExecutor::Enqueue(std::function<void()> task) {
  bool need_start = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    producer_cv_.wait(lock, [&] { return stop_ || tasks_.size() < max_queue_depth_; });
    if (stop_) {
      throw std::runtime_error("phase executor stopped");
    }
    tasks_.push(std::move(task));
    need_start = !running_;
    // Every queued task needs an idle worker of its own; a worker that was
    // notified but has not woken yet still counts as idle.
    if (running_ && tasks_.size() > idle_ && workers_.size() < max_workers_) {
      SpawnLocked();
    }
  }
  if (need_start) {
    Start();
  }
  cv_.notify_one();
}

void PhaseExecutor::Worker() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ++idle_;
      cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });
      --idle_;
      if (stop_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
      producer_cv_.notify_one();
    }
    // packaged_task stores exceptions in its future.
    task();
  }
}

}  // namespace promptguard
