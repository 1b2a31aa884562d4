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
 * @file task.hpp
 * @brief Task - a unit of work paired with the Future that observes it.
 *
 * Execution and completion are two separate steps so that an executor can
 * do its own bookkeeping (pending counters, logging) after the callback ran
 * but before observers are released:
 *
 *   std::exception_ptr ep = task.Execute();   // runs the callback
 *   ...bookkeeping...
 *   task.Complete(ep);                        // releases Wait()ers
 */

#ifndef OFFLOAD_TASK_HPP_
#define OFFLOAD_TASK_HPP_

#include "offload/future.hpp"

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace offload {

class Task final {
 public:
  Task() noexcept = default;

  /**
   * @brief Wrap a callback whose return value (if any) is discarded.
   */
  static Task Create(std::function<void()> callback, Future<> result) {
    return Task(std::move(callback), std::move(result));
  }

  /**
   * @brief Wrap a value-returning callback; the value lands in @p result.
   */
  template <typename F, typename R>
  static Task CreateTyped(F&& callback, Future<R> result) {
    std::function<void()> body =
        [fn = std::forward<F>(callback), result]() mutable { result.SetValue(fn()); };
    return Task(std::move(body), std::move(result));
  }

  Task(Task&&) noexcept = default;
  Task& operator=(Task&&) noexcept = default;
  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  bool Valid() const noexcept { return static_cast<bool>(callback_) && result_.Valid(); }

  /**
   * @brief Run the callback once.
   * @return The exception it raised, or nullptr.
   */
  std::exception_ptr Execute() noexcept {
    OFFLOAD_ASSERT(Valid());
    std::function<void()> fn = std::move(callback_);
    callback_ = nullptr;
    try {
      fn();
    } catch (...) {
      return std::current_exception();
    }
    return nullptr;
  }

  void Complete(std::exception_ptr ep) const { result_.Complete(std::move(ep)); }

  const Future<>& result() const noexcept { return result_; }

 private:
  Task(std::function<void()> callback, Future<> result) noexcept
      : callback_(std::move(callback)), result_(std::move(result)) {}

  std::function<void()> callback_;
  Future<> result_;
};

/// Return type of a zero-argument callable.
template <typename F>
using CallbackResult = std::invoke_result_t<std::decay_t<F>&>;

// ============================================================================
// CompletionPoll - cooperative "wait for all" sequence
// ============================================================================

/**
 * @brief Lazy, restartable barrier over an executor's pending count.
 *
 * Never blocks: each Next() call checks the count once and hands control
 * back, so the caller's own scheduler (a frame loop, a Reactor pump) keeps
 * running while work drains.
 *
 * @code
 *   auto poll = pool.WaitForTasksCompletion().value();
 *   while (poll.Next()) {
 *     reactor.Pump();
 *   }
 * @endcode
 *
 * @tparam Source Any type with `int64_t PendingCount() const`.
 */
template <typename Source>
class CompletionPoll final {
 public:
  explicit CompletionPoll(const Source& source) noexcept : source_(&source) {}

  /**
   * @brief Advance one round.
   * @return true while work is still pending, false once it drained.
   */
  bool Next() noexcept {
    if (!finished_) {
      finished_ = source_->PendingCount() <= 0;
    }
    return !finished_;
  }

  bool Finished() const noexcept { return finished_; }

  /// Start over, e.g. after more work was submitted.
  void Restart() noexcept { finished_ = false; }

 private:
  const Source* source_;
  bool finished_{false};
};

}  // namespace offload

#endif  // OFFLOAD_TASK_HPP_
