#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "common/logging/logger.h"

namespace nodelink::utils {

/**
 * A fixed set of worker threads driving one Boost.Asio I/O context.
 *
 * Every asynchronous task of the node (accept loops, connection readers,
 * stream handlers, retry timers) is scheduled on this context. Work that must
 * not run concurrently is placed on a strand by its owner; the pool itself
 * gives no ordering guarantees.
 *
 * Thread Safety: All public methods are thread-safe.
 */
class IoThreadPool {
 public:
  /**
   * Create the pool and start its workers.
   *
   * @param num_threads Number of worker threads. If 0, uses hardware_concurrency().
   */
  explicit IoThreadPool(std::size_t num_threads = 0)
      : work_guard_(boost::asio::make_work_guard(io_context_)), running_(true) {
    if (num_threads == 0) {
      num_threads = std::thread::hardware_concurrency();
      if (num_threads == 0) {
        num_threads = 4;  // Fallback
      }
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this, i] { worker_loop(i); });
    }
    LOG_DEBUG("IoThreadPool created with {} worker threads", num_threads);
  }

  /**
   * Destructor. Stops the context and joins all workers.
   */
  ~IoThreadPool() {
    stop();
    join();
    LOG_DEBUG("IoThreadPool destroyed");
  }

  // Non-copyable, non-movable
  IoThreadPool(const IoThreadPool&) = delete;
  IoThreadPool& operator=(const IoThreadPool&) = delete;
  IoThreadPool(IoThreadPool&&) = delete;
  IoThreadPool& operator=(IoThreadPool&&) = delete;

  [[nodiscard]] boost::asio::io_context& context() noexcept { return io_context_; }

  [[nodiscard]] boost::asio::io_context::executor_type executor() noexcept {
    return io_context_.get_executor();
  }

  /**
   * Let the workers exit once all outstanding work has completed.
   */
  void release() { work_guard_.reset(); }

  /**
   * Abandon outstanding work and stop the workers as soon as possible.
   */
  void stop() {
    running_.store(false);
    work_guard_.reset();
    io_context_.stop();
  }

  /**
   * Wait for every worker to return.
   */
  void join() {
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

  [[nodiscard]] std::size_t num_threads() const noexcept { return workers_.size(); }

 private:
  void worker_loop(std::size_t thread_id) {
    LOG_DEBUG("IoThreadPool worker {} started", thread_id);

    // run() returns early when a handler throws; keep the worker alive so one
    // failing task cannot take the pool down.
    while (running_.load()) {
      try {
        io_context_.run();
        break;
      } catch (const std::exception& e) {
        LOG_ERROR("IoThreadPool worker {} caught exception: {}", thread_id, e.what());
      }
    }

    LOG_DEBUG("IoThreadPool worker {} stopping", thread_id);
  }

  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_;
};

}  // namespace nodelink::utils
