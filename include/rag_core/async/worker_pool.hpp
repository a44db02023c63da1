#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace rag_core::async {

/**
 * @class WorkerPool
 * @brief A fixed set of worker threads draining a shared job queue.
 *
 * The pool owns its threads for their whole lifetime: they are started by
 * the constructor and joined by stop() or the destructor, after every queued
 * job has run. The number of threads is the concurrency limit for whatever
 * is submitted to the pool.
 */
class WorkerPool {
 public:
  /**
   * @brief Creates and starts the worker threads.
   *
   * @param num_threads Number of worker threads; must be at least one.
   * @param name Label used in log lines.
   */
  explicit WorkerPool(size_t num_threads, std::string name = "WorkerPool");

  /**
   * @brief Destructor. Drains the queue and joins all worker threads.
   */
  ~WorkerPool();

  /**
   * @brief Queues a job and returns a future for its result.
   *
   * Exceptions thrown by the job are delivered through the future.
   * Throws std::runtime_error once the pool has been stopped.
   */
  template <typename Job>
  std::future<std::invoke_result_t<Job>> submit(Job job) {
    using Result = std::invoke_result_t<Job>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(job));
    std::future<Result> future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stopping_) {
        throw std::runtime_error(name_ + " is stopped; cannot accept new jobs.");
      }
      jobs_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
  }

  /**
   * @brief Stops accepting jobs, runs what is queued, and joins the threads.
   *
   * Safe to call more than once.
   */
  void stop();

  size_t size() const {
    return workers_.size();
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  void run_loop();

  std::string name_;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> jobs_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stopping_ = false;
};

}  // namespace rag_core::async
