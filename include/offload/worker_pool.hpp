/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file worker_pool.hpp
 * @brief WorkerPool - fixed-size thread pool returning Futures.
 *
 * Architecture:
 *   Submit() -> [count_mtx_] ++pending
 *            -> [queue_mtx_] queue_.push_back(Task) -> notify_one
 *                    |
 *              Worker[0..N-1]: wait(stop || !queue.empty())
 *                    | pop one Task
 *              Execute -> log failure -> [count_mtx_] --pending -> Complete
 *
 * Features:
 * - Submit never blocks the caller
 * - Exceptions raised by tasks are captured into their Future; a failing
 *   task never takes its worker thread down
 * - Cooperative "wait for all" through CompletionPoll
 * - Thread priority and CPU affinity support (Linux)
 *
 * Shutdown is best effort: workers that see the stop request exit without
 * draining the queue, and tasks still queued at that point are discarded.
 * Their futures never complete.
 *
 * Usage:
 *   offload::WorkerPoolConfig cfg;
 *   cfg.name = "io";
 *
 *   offload::WorkerPool pool(cfg);
 *   auto f = pool.SubmitTyped([] { return 42; });
 *   if (f.has_value()) {
 *     int v = f.value().Value();
 *   }
 */

#ifndef OFFLOAD_WORKER_POOL_HPP_
#define OFFLOAD_WORKER_POOL_HPP_

#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/task.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace offload {

// ============================================================================
// Error codes
// ============================================================================

enum class WorkerPoolError : uint8_t {
  kDisposed = 0,     ///< Pool already shut down
  kInvalidCallback,  ///< Empty callback
  kIndexOutOfRange,  ///< SubmitToSlot index outside the target vector
};

inline const char* ErrorName(WorkerPoolError e) noexcept {
  switch (e) {
    case WorkerPoolError::kDisposed:
      return "disposed";
    case WorkerPoolError::kInvalidCallback:
      return "invalid callback";
    case WorkerPoolError::kIndexOutOfRange:
      return "index out of range";
  }
  return "unknown";
}

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief WorkerPool configuration.
 */
struct WorkerPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t worker_num{0U};  ///< 0 = max(cores - 1, 1)
  int32_t priority{0};      ///< >0 SCHED_FIFO, <0 SCHED_IDLE, 0 untouched
#ifdef __linux__
  uint32_t cpu_set_size{0U};
  const cpu_set_t* cpu_set{nullptr};
#endif
};

struct WorkerPoolStats {
  uint64_t submitted{0U};
  uint64_t processed{0U};
  uint64_t failed{0U};
  uint64_t discarded{0U};
};

namespace detail {

inline void ApplyThreadTuning(int32_t prio, uint32_t cpu_set_size, const void* cpu_set) noexcept {
#ifdef __linux__
  if (prio > 0) {
    struct sched_param param{};
    param.sched_priority = (prio > 99) ? 99 : prio;
    (void)pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
  } else if (prio < 0) {
    struct sched_param param{};
    param.sched_priority = 0;
    (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
  }
  if (cpu_set != nullptr && cpu_set_size > 0U) {
    (void)pthread_setaffinity_np(pthread_self(), cpu_set_size, static_cast<const cpu_set_t*>(cpu_set));
  }
#else
  (void)prio;
  (void)cpu_set_size;
  (void)cpu_set;
#endif
}

}  // namespace detail

// ============================================================================
// WorkerPool
// ============================================================================

class WorkerPool final {
 public:
  /**
   * @brief Spawn the worker threads immediately.
   */
  explicit WorkerPool(const WorkerPoolConfig& cfg = WorkerPoolConfig{})
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : DefaultWorkerCount()),
        priority_(cfg.priority)
#ifdef __linux__
        ,
        cpu_set_size_(cfg.cpu_set_size),
        cpu_set_(cfg.cpu_set)
#endif
  {
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
    OFFLOAD_LOG_DEBUG("WorkerPool", "[%s] started %u workers", name_.c_str(), worker_num_);
  }

  ~WorkerPool() { Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Submit API ========================

  /**
   * @brief Run @p callback on a worker thread. Never blocks.
   *
   * Any return value of the callback is discarded; use SubmitTyped() to
   * keep it.
   *
   * @return Future observing the callback, or kDisposed after Shutdown().
   */
  template <typename F>
  expected<Future<>, WorkerPoolError> Submit(F&& callback) {
    std::function<void()> fn(std::forward<F>(callback));
    if (!fn) {
      return expected<Future<>, WorkerPoolError>::error(WorkerPoolError::kInvalidCallback);
    }
    Future<> result = Future<>::Pending();
    if (!Enqueue(Task::Create(std::move(fn), result))) {
      return expected<Future<>, WorkerPoolError>::error(WorkerPoolError::kDisposed);
    }
    return expected<Future<>, WorkerPoolError>::success(std::move(result));
  }

  /**
   * @brief Run a value-returning @p callback on a worker thread.
   *
   * @return Future<R> carrying the callback's return value.
   */
  template <typename F, typename R = CallbackResult<F>>
  expected<Future<R>, WorkerPoolError> SubmitTyped(F&& callback) {
    if constexpr (std::is_void<R>::value) {
      return Submit(std::forward<F>(callback));
    } else {
      Future<R> result = Future<R>::Pending();
      if (!Enqueue(Task::CreateTyped(std::forward<F>(callback), result))) {
        return expected<Future<R>, WorkerPoolError>::error(WorkerPoolError::kDisposed);
      }
      return expected<Future<R>, WorkerPoolError>::success(std::move(result));
    }
  }

  /**
   * @brief Run @p callback asynchronously and store its result in
   *        out[index].
   *
   * @p out must outlive the task and must not be resized until the
   * returned future completes.
   */
  template <typename T, typename F>
  expected<Future<>, WorkerPoolError> SubmitToSlot(std::vector<T>& out, size_t index, F&& callback) {
    if (index >= out.size()) {
      return expected<Future<>, WorkerPoolError>::error(WorkerPoolError::kIndexOutOfRange);
    }
    T* slot = &out[index];
    return Submit([slot, fn = std::forward<F>(callback)]() mutable { *slot = fn(); });
  }

  // ======================== Completion tracking ========================

  /**
   * @brief Tasks enqueued or executing, not yet completed.
   */
  int64_t PendingCount() const noexcept {
    std::lock_guard<std::mutex> lk(count_mtx_);
    return pending_;
  }

  /**
   * @brief Cooperative barrier over PendingCount().
   */
  expected<CompletionPoll<WorkerPool>, WorkerPoolError> WaitForTasksCompletion() const {
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<CompletionPoll<WorkerPool>, WorkerPoolError>::error(WorkerPoolError::kDisposed);
    }
    return expected<CompletionPoll<WorkerPool>, WorkerPoolError>::success(CompletionPoll<WorkerPool>(*this));
  }

  // ======================== Lifecycle ========================

  /**
   * @brief Stop the workers, join them, and reject further submissions.
   *
   * Tasks already executing run to completion. Tasks still queued are
   * discarded. Safe to call more than once.
   */
  void Shutdown() noexcept {
    {
      std::lock_guard<std::mutex> lk(queue_mtx_);
      if (stop_) {
        return;
      }
      stop_ = true;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();

    size_t dropped = 0U;
    {
      std::lock_guard<std::mutex> lk(queue_mtx_);
      dropped = queue_.size();
      queue_.clear();
    }
    if (dropped > 0U) {
      {
        std::lock_guard<std::mutex> lk(count_mtx_);
        pending_ -= static_cast<int64_t>(dropped);
      }
      discarded_.fetch_add(dropped, std::memory_order_relaxed);
      OFFLOAD_LOG_WARN("WorkerPool", "[%s] shutdown discarded %zu queued tasks", name_.c_str(), dropped);
    }

    disposed_.store(true, std::memory_order_release);
    OFFLOAD_LOG_DEBUG("WorkerPool", "[%s] stopped", name_.c_str());
  }

  // ======================== Query ========================

  WorkerPoolStats GetStats() const noexcept {
    WorkerPoolStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.failed = failed_.load(std::memory_order_relaxed);
    s.discarded = discarded_.load(std::memory_order_relaxed);
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  bool IsDisposed() const noexcept { return disposed_.load(std::memory_order_acquire); }

  const char* Name() const noexcept { return name_.c_str(); }

 private:
  bool Enqueue(Task&& task) {
    {
      std::lock_guard<std::mutex> lk(count_mtx_);
      ++pending_;
    }
    {
      std::lock_guard<std::mutex> lk(queue_mtx_);
      if (!stop_) {
        queue_.push_back(std::move(task));
        submitted_.fetch_add(1U, std::memory_order_relaxed);
        task = Task();
      }
    }
    if (task.Valid()) {
      // Rejected: stop_ was set before we got the queue lock.
      std::lock_guard<std::mutex> lk(count_mtx_);
      --pending_;
      return false;
    }
    queue_cv_.notify_one();
    return true;
  }

  void WorkerLoop(uint32_t worker_id) noexcept {
#ifdef __linux__
    detail::ApplyThreadTuning(priority_, cpu_set_size_, cpu_set_);
#else
    detail::ApplyThreadTuning(priority_, 0U, nullptr);
#endif

    for (;;) {
      Task task;
      {
        std::unique_lock<std::mutex> lk(queue_mtx_);
        queue_cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
        // Stop wins over queued work.
        if (stop_) {
          break;
        }
        task = std::move(queue_.front());
        queue_.pop_front();
      }
      RunTask(task, worker_id);
    }
  }

  void RunTask(Task& task, uint32_t worker_id) noexcept {
    std::exception_ptr ep = task.Execute();
    if (ep) {
      char desc[256];
      OFFLOAD_LOG_ERROR("WorkerPool", "[%s] worker %u: task raised: %s", name_.c_str(), worker_id,
                        DescribeException(ep, desc, sizeof(desc)));
      failed_.fetch_add(1U, std::memory_order_relaxed);
    }
    {
      std::lock_guard<std::mutex> lk(count_mtx_);
      --pending_;
    }
    processed_.fetch_add(1U, std::memory_order_relaxed);
    task.Complete(std::move(ep));
  }

  // ======================== Data members ========================

  FixedString<32> name_;
  const uint32_t worker_num_;
  const int32_t priority_;
#ifdef __linux__
  const uint32_t cpu_set_size_{0U};
  const cpu_set_t* cpu_set_{nullptr};
#endif

  std::vector<std::thread> threads_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<Task> queue_;
  bool stop_{false};

  mutable std::mutex count_mtx_;
  int64_t pending_{0};

  std::atomic<bool> disposed_{false};

  alignas(kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> failed_{0U};
  std::atomic<uint64_t> discarded_{0U};
};

}  // namespace offload

#endif  // OFFLOAD_WORKER_POOL_HPP_
