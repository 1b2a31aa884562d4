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
 * @file reactor.hpp
 * @brief Reactor - marshals work onto one owning thread.
 *
 * Callers on any thread Submit() callbacks; they run only when the owning
 * thread calls Pump(), typically once per host tick. Submitting from the
 * owning thread itself runs the callback inline.
 *
 *   worker thread                owning thread
 *   -------------                -------------
 *   Submit(f) --> pending_ --+
 *                            |   Pump():
 *                            +-->  swap(pending_, in_progress_)
 *                                  run in_progress_ in FIFO order
 *
 * Tasks submitted while a pump is running land in pending_ and run on the
 * next Pump(), so a steady stream of submissions cannot stretch a single
 * pump indefinitely.
 *
 * Shutdown() drops everything still queued. Futures of dropped tasks never
 * complete, so nobody may be blocked on them when the reactor goes away.
 */

#ifndef OFFLOAD_REACTOR_HPP_
#define OFFLOAD_REACTOR_HPP_

#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/task.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace offload {

enum class ReactorError : uint8_t {
  kDisposed = 0,     ///< Reactor already shut down
  kInvalidCallback,  ///< Empty callback
  kNotOwnerThread,   ///< Pump() called from a thread that does not own the reactor
  kReentrantPump,    ///< Pump() called from inside a pumped task
};

inline const char* ErrorName(ReactorError e) noexcept {
  switch (e) {
    case ReactorError::kDisposed:
      return "disposed";
    case ReactorError::kInvalidCallback:
      return "invalid callback";
    case ReactorError::kNotOwnerThread:
      return "not owner thread";
    case ReactorError::kReentrantPump:
      return "reentrant pump";
  }
  return "unknown";
}

class Reactor final {
 public:
  /**
   * @brief Create a reactor owned by the calling thread.
   */
  Reactor() noexcept : owner_(std::this_thread::get_id()) {}

  ~Reactor() { Shutdown(); }

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;
  Reactor(Reactor&&) = delete;
  Reactor& operator=(Reactor&&) = delete;

  /**
   * @brief Move ownership to the calling thread.
   *
   * Meant for setup, before the host loop starts pumping.
   */
  void BindToCurrentThread() noexcept { owner_.store(std::this_thread::get_id(), std::memory_order_release); }

  bool IsOwnerThread() const noexcept {
    return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
  }

  // ======================== Submit API ========================

  /**
   * @brief Run @p callback on the owning thread.
   *
   * Inline when called from the owning thread (the returned future is
   * already complete), queued for the next Pump() otherwise.
   */
  template <typename F>
  expected<Future<>, ReactorError> Submit(F&& callback) {
    std::function<void()> fn(std::forward<F>(callback));
    if (!fn) {
      return expected<Future<>, ReactorError>::error(ReactorError::kInvalidCallback);
    }
    Future<> result = Future<>::Pending();
    auto r = Dispatch(Task::Create(std::move(fn), result));
    if (!r.has_value()) {
      return expected<Future<>, ReactorError>::error(r.get_error());
    }
    return expected<Future<>, ReactorError>::success(std::move(result));
  }

  template <typename F, typename R = CallbackResult<F>>
  expected<Future<R>, ReactorError> SubmitTyped(F&& callback) {
    if constexpr (std::is_void<R>::value) {
      return Submit(std::forward<F>(callback));
    } else {
      Future<R> result = Future<R>::Pending();
      auto r = Dispatch(Task::CreateTyped(std::forward<F>(callback), result));
      if (!r.has_value()) {
        return expected<Future<R>, ReactorError>::error(r.get_error());
      }
      return expected<Future<R>, ReactorError>::success(std::move(result));
    }
  }

  // ======================== Pump ========================

  /**
   * @brief Run every task queued before this call, in submission order.
   *
   * Owning thread only.
   *
   * @return Number of tasks executed.
   */
  expected<uint32_t, ReactorError> Pump() {
    if (!IsOwnerThread()) {
      return expected<uint32_t, ReactorError>::error(ReactorError::kNotOwnerThread);
    }
    if (pumping_) {
      return expected<uint32_t, ReactorError>::error(ReactorError::kReentrantPump);
    }
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<uint32_t, ReactorError>::error(ReactorError::kDisposed);
    }

    pumping_ = true;
    {
      std::lock_guard<std::mutex> lk(pending_mtx_);
      std::swap(pending_, in_progress_);
    }

    uint32_t executed = 0U;
    while (!in_progress_.empty()) {
      if (disposed_.load(std::memory_order_acquire)) {
        // Shut down from another thread mid-pump.
        in_progress_.clear();
        break;
      }
      Task task = std::move(in_progress_.front());
      in_progress_.pop_front();
      Run(task);
      ++executed;
    }
    pumping_ = false;
    return expected<uint32_t, ReactorError>::success(executed);
  }

  // ======================== Lifecycle ========================

  /**
   * @brief Drop all queued tasks and reject further submissions.
   */
  void Shutdown() noexcept {
    size_t dropped = 0U;
    {
      std::lock_guard<std::mutex> lk(pending_mtx_);
      if (disposed_.load(std::memory_order_acquire)) {
        return;
      }
      disposed_.store(true, std::memory_order_release);
      dropped = pending_.size();
      pending_.clear();
    }
    // in_progress_ belongs to the owning thread; a foreign caller leaves it
    // to the running Pump().
    if (IsOwnerThread()) {
      dropped += in_progress_.size();
      in_progress_.clear();
    }
    if (dropped > 0U) {
      OFFLOAD_LOG_WARN("Reactor", "shutdown dropped %zu queued tasks", dropped);
    }
  }

  // ======================== Query ========================

  /**
   * @brief Tasks waiting for the next Pump().
   */
  size_t PendingCount() const noexcept {
    std::lock_guard<std::mutex> lk(pending_mtx_);
    return pending_.size();
  }

  bool IsDisposed() const noexcept { return disposed_.load(std::memory_order_acquire); }

 private:
  expected<void, ReactorError> Dispatch(Task&& task) {
    if (IsOwnerThread()) {
      if (disposed_.load(std::memory_order_acquire)) {
        return expected<void, ReactorError>::error(ReactorError::kDisposed);
      }
      Run(task);
      return expected<void, ReactorError>::success();
    }
    std::lock_guard<std::mutex> lk(pending_mtx_);
    if (disposed_.load(std::memory_order_acquire)) {
      return expected<void, ReactorError>::error(ReactorError::kDisposed);
    }
    pending_.push_back(std::move(task));
    return expected<void, ReactorError>::success();
  }

  static void Run(Task& task) noexcept {
    std::exception_ptr ep = task.Execute();
    if (ep) {
      char desc[256];
      OFFLOAD_LOG_ERROR("Reactor", "task raised: %s", DescribeException(ep, desc, sizeof(desc)));
    }
    task.Complete(std::move(ep));
  }

  std::atomic<std::thread::id> owner_;
  std::atomic<bool> disposed_{false};
  bool pumping_{false};  ///< Owning thread only.

  mutable std::mutex pending_mtx_;
  std::deque<Task> pending_;
  std::deque<Task> in_progress_;  ///< Owning thread only.
};

}  // namespace offload

#endif  // OFFLOAD_REACTOR_HPP_
