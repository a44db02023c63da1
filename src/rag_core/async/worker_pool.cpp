#include "rag_core/async/worker_pool.hpp"

#include <iostream>

namespace rag_core::async {

WorkerPool::WorkerPool(size_t num_threads, std::string name) : name_(std::move(name)) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&WorkerPool::run_loop, this);
  }
  std::cout << name_ << " created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  stop();
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void WorkerPool::run_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        // stopping and nothing left to run
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
    }

    // packaged_task captures job exceptions into its future
    job();
  }
}

}  // namespace rag_core::async
