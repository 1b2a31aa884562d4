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
 * @file parallel_processing.hpp
 * @brief ParallelProcessing - one algorithm applied to a stream of items.
 *
 * Where WorkerPool runs arbitrary callbacks, ParallelProcessing runs a
 * single algorithm over queued data items. Each worker owns a private
 * context built by a factory before the workers start (scratch buffers,
 * decoder state, ...), so the algorithm never shares mutable state between
 * threads.
 *
 *   AddData(d) -> queue_ -> Worker[i]: algorithm(context[i], d)
 *
 * Completion is tracked with a pending counter plus a ManualResetEvent,
 * giving both a blocking barrier (WaitUntilTasksCompletion) and a
 * cooperative one (WaitForTasksCompletion).
 *
 * An item whose algorithm throws is logged and counted in FailureCount();
 * the worker moves on to the next item.
 */

#ifndef OFFLOAD_PARALLEL_PROCESSING_HPP_
#define OFFLOAD_PARALLEL_PROCESSING_HPP_

#include "offload/event.hpp"
#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/task.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace offload {

enum class ParallelError : uint8_t {
  kDisposed = 0,
};

inline const char* ErrorName(ParallelError e) noexcept {
  switch (e) {
    case ParallelError::kDisposed:
      return "disposed";
  }
  return "unknown";
}

struct ParallelConfig {
  FixedString<32> name{"parallel"};
  uint32_t worker_num{0U};  ///< 0 = max(cores - 1, 1)
};

template <typename Data, typename Context>
class ParallelProcessing final {
 public:
  using Algorithm = std::function<void(Context&, Data&)>;
  using ContextFactory = std::function<Context(uint32_t worker_index)>;

  /**
   * @brief Build one context per worker, then start the workers.
   *
   * The factory runs on the constructing thread; an exception it raises
   * propagates to the caller and no thread is started. Without a factory,
   * contexts are default constructed; a Context that cannot be default
   * constructed requires one (aborts otherwise).
   */
  ParallelProcessing(Algorithm algorithm, ContextFactory factory, const ParallelConfig& cfg = ParallelConfig{})
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : DefaultWorkerCount()),
        algorithm_(std::move(algorithm)) {
    OFFLOAD_ASSERT(algorithm_);
    contexts_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      if constexpr (std::is_default_constructible<Context>::value) {
        if (!factory) {
          contexts_.emplace_back();
          continue;
        }
      } else {
        OFFLOAD_CHECK(static_cast<bool>(factory));
      }
      contexts_.push_back(factory(i));
    }
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&ParallelProcessing::WorkerLoop, this, i);
    }
  }

  ~ParallelProcessing() { Shutdown(); }

  ParallelProcessing(const ParallelProcessing&) = delete;
  ParallelProcessing& operator=(const ParallelProcessing&) = delete;
  ParallelProcessing(ParallelProcessing&&) = delete;
  ParallelProcessing& operator=(ParallelProcessing&&) = delete;

  /**
   * @brief Queue one item. Never blocks.
   */
  expected<void, ParallelError> AddData(Data data) {
    {
      std::lock_guard<std::mutex> lk(count_mtx_);
      ++pending_;
      completed_.Reset();
    }
    bool accepted = false;
    {
      std::lock_guard<std::mutex> lk(queue_mtx_);
      if (!stop_) {
        queue_.push_back(std::move(data));
        accepted = true;
      }
    }
    if (!accepted) {
      FinishOne();
      return expected<void, ParallelError>::error(ParallelError::kDisposed);
    }
    queue_cv_.notify_one();
    return expected<void, ParallelError>::success();
  }

  /**
   * @brief Items queued or being processed.
   */
  int64_t PendingCount() const noexcept {
    std::lock_guard<std::mutex> lk(count_mtx_);
    return pending_;
  }

  /**
   * @brief Block until every queued item has been processed.
   */
  expected<void, ParallelError> WaitUntilTasksCompletion() const {
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<void, ParallelError>::error(ParallelError::kDisposed);
    }
    completed_.Wait();
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<void, ParallelError>::error(ParallelError::kDisposed);
    }
    return expected<void, ParallelError>::success();
  }

  /**
   * @brief Cooperative barrier over PendingCount().
   */
  expected<CompletionPoll<ParallelProcessing>, ParallelError> WaitForTasksCompletion() const {
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<CompletionPoll<ParallelProcessing>, ParallelError>::error(ParallelError::kDisposed);
    }
    return expected<CompletionPoll<ParallelProcessing>, ParallelError>::success(
        CompletionPoll<ParallelProcessing>(*this));
  }

  /**
   * @brief Stop and join the workers. Items not yet started are dropped.
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
    disposed_.store(true, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lk(count_mtx_);
      pending_ -= static_cast<int64_t>(dropped);
    }
    // Release anyone parked in WaitUntilTasksCompletion().
    completed_.Set();
    if (dropped > 0U) {
      OFFLOAD_LOG_WARN("Parallel", "[%s] shutdown dropped %zu items", name_.c_str(), dropped);
    }
  }

  uint64_t FailureCount() const noexcept { return failures_.load(std::memory_order_relaxed); }

  uint64_t ProcessedCount() const noexcept { return processed_.load(std::memory_order_relaxed); }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

 private:
  void WorkerLoop(uint32_t worker_index) noexcept {
    Context& ctx = contexts_[worker_index];
    for (;;) {
      std::optional<Data> item;
      {
        std::unique_lock<std::mutex> lk(queue_mtx_);
        queue_cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
        if (stop_) {
          break;
        }
        item.emplace(std::move(queue_.front()));
        queue_.pop_front();
      }

      try {
        algorithm_(ctx, *item);
      } catch (const std::exception& e) {
        failures_.fetch_add(1U, std::memory_order_relaxed);
        OFFLOAD_LOG_ERROR("Parallel", "[%s] worker %u: algorithm raised: %s", name_.c_str(), worker_index, e.what());
      } catch (...) {
        failures_.fetch_add(1U, std::memory_order_relaxed);
        OFFLOAD_LOG_ERROR("Parallel", "[%s] worker %u: algorithm raised an unknown exception", name_.c_str(),
                          worker_index);
      }
      processed_.fetch_add(1U, std::memory_order_relaxed);
      FinishOne();
    }
  }

  void FinishOne() noexcept {
    std::lock_guard<std::mutex> lk(count_mtx_);
    --pending_;
    if (pending_ <= 0) {
      completed_.Set();
    }
  }

  FixedString<32> name_;
  const uint32_t worker_num_;
  Algorithm algorithm_;
  std::vector<Context> contexts_;
  std::vector<std::thread> threads_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<Data> queue_;
  bool stop_{false};

  mutable std::mutex count_mtx_;
  int64_t pending_{0};
  ManualResetEvent completed_{true};

  std::atomic<bool> disposed_{false};
  std::atomic<uint64_t> failures_{0U};
  std::atomic<uint64_t> processed_{0U};
};

}  // namespace offload

#endif  // OFFLOAD_PARALLEL_PROCESSING_HPP_
