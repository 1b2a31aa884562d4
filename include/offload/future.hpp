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
 * @file future.hpp
 * @brief Future<T> - one-shot completion handle for asynchronous work.
 *
 * A Future observes a single unit of work. The thread that ran the work
 * calls Complete() exactly once; any number of observer threads may poll
 * IsDone() or block in Wait(), Success(), Exception() or Value().
 *
 *   Future<>   : completion signal + optional captured exception
 *   Future<T>  : the above plus a value of type T
 *
 * Handles are cheap to copy and share one state. A Future<T> converts to
 * Future<> by slicing without losing the shared state.
 *
 * If the last handle goes away while a captured exception was never looked
 * at (Success(), Exception() or Value()), the exception is reported on the
 * "Future" log category so failures of fire-and-forget work stay visible.
 */

#ifndef OFFLOAD_FUTURE_HPP_
#define OFFLOAD_FUTURE_HPP_

#include "offload/event.hpp"
#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/vocabulary.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace offload {

namespace detail {

// ============================================================================
// FutureState - shared state behind every Future handle
// ============================================================================

class FutureState {
 public:
  FutureState() noexcept = default;

  virtual ~FutureState() {
    if (exception_ && !observed_) {
      char desc[256];
      OFFLOAD_LOG_ERROR("Future", "unobserved task exception: %s",
                        DescribeException(exception_, desc, sizeof(desc)));
    }
  }

  FutureState(const FutureState&) = delete;
  FutureState& operator=(const FutureState&) = delete;

  void Complete(std::exception_ptr ep) {
    std::function<void()> cb;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      // A second Complete() means two producers share one state.
      OFFLOAD_CHECK(!completed_);
      completed_ = true;
      exception_ = std::move(ep);
      cb = std::move(on_complete_);
      on_complete_ = nullptr;
    }
    done_.Set();
    if (cb) {
      RunCallback(cb);
    }
  }

  void OnComplete(std::function<void()> cb) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!completed_) {
        on_complete_ = std::move(cb);
        return;
      }
    }
    if (cb) {
      RunCallback(cb);
    }
  }

  bool IsDone() const noexcept { return done_.IsSet(); }

  void Wait() const noexcept { done_.Wait(); }

  template <typename Rep, typename Period>
  bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const noexcept {
    return done_.WaitFor(timeout);
  }

  /// Blocks until completion and marks the exception as observed.
  std::exception_ptr TakeException() {
    Wait();
    std::lock_guard<std::mutex> lk(mtx_);
    observed_ = true;
    return exception_;
  }

 private:
  // Continuations run on executor threads; a throwing one is reported, not
  // allowed to unwind into the worker loop.
  static void RunCallback(const std::function<void()>& cb) noexcept {
    try {
      cb();
    } catch (const std::exception& e) {
      OFFLOAD_LOG_ERROR("Future", "completion callback raised: %s", e.what());
    } catch (...) {
      OFFLOAD_LOG_ERROR("Future", "completion callback raised an unknown exception");
    }
  }

  ManualResetEvent done_;
  mutable std::mutex mtx_;
  bool completed_{false};
  bool observed_{false};
  std::exception_ptr exception_;
  std::function<void()> on_complete_;
};

template <typename T>
class ValueState final : public FutureState {
 public:
  /// Written by the producer before Complete(); read only after it.
  std::optional<T> value;
};

}  // namespace detail

template <typename T = void>
class Future;

// ============================================================================
// Future<void>
// ============================================================================

template <>
class Future<void> {
 public:
  /// An empty handle. Valid() is false until assigned from a real future.
  Future() noexcept = default;

  /// A new, pending future with its own shared state.
  static Future Pending() { return Future(std::make_shared<detail::FutureState>()); }

  bool Valid() const noexcept { return state_ != nullptr; }

  /**
   * @brief Block until the work completes. No timeout.
   */
  void Wait() const noexcept {
    OFFLOAD_ASSERT(Valid());
    state_->Wait();
  }

  /**
   * @brief Block for at most @p timeout.
   * @return true if the work completed in time.
   */
  template <typename Rep, typename Period>
  bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const noexcept {
    OFFLOAD_ASSERT(Valid());
    return state_->WaitFor(timeout);
  }

  /**
   * @brief Non-blocking completion poll.
   */
  bool IsDone() const noexcept {
    OFFLOAD_ASSERT(Valid());
    return state_->IsDone();
  }

  /**
   * @brief Blocks until completion.
   * @return true if the work raised no exception. Counts as observing it.
   */
  bool Success() const { return Exception() == nullptr; }

  /**
   * @brief Blocks until completion and returns the captured exception.
   * @return The exception raised by the work, or nullptr.
   */
  std::exception_ptr Exception() const {
    OFFLOAD_ASSERT(Valid());
    return state_->TakeException();
  }

  /**
   * @brief Mark the work as finished. Producer side only.
   *
   * Must be called exactly once, by the thread that ran the work; a second
   * call aborts the process. The OnComplete() callback, if any, runs
   * synchronously on the calling thread.
   *
   * @param ep Exception raised by the work, or nullptr on success.
   */
  void Complete(std::exception_ptr ep = nullptr) const {
    OFFLOAD_ASSERT(Valid());
    state_->Complete(std::move(ep));
  }

  /**
   * @brief Register a callback run on the completing thread.
   *
   * Replaces any previously registered callback. If the future is already
   * complete, @p cb runs immediately on the calling thread.
   */
  void OnComplete(std::function<void()> cb) const {
    OFFLOAD_ASSERT(Valid());
    state_->OnComplete(std::move(cb));
  }

 protected:
  explicit Future(std::shared_ptr<detail::FutureState> state) noexcept
      : state_(std::move(state)) {}

  std::shared_ptr<detail::FutureState> state_;
};

// ============================================================================
// Future<T>
// ============================================================================

template <typename T>
class Future : public Future<void> {
 public:
  Future() noexcept = default;

  static Future Pending() { return Future(std::make_shared<detail::ValueState<T>>()); }

  /**
   * @brief Blocks until completion and returns a copy of the value.
   *
   * The copy stays usable after every handle is gone. If the work raised,
   * the exception is rethrown here (and counts as observed).
   */
  T Value() const {
    std::exception_ptr ep = Exception();
    if (ep) {
      std::rethrow_exception(ep);
    }
    const auto& slot = Typed().value;
    OFFLOAD_ASSERT(slot.has_value());
    return *slot;
  }

  /**
   * @brief Store the value. Producer side only, before Complete().
   */
  template <typename U>
  void SetValue(U&& v) const {
    OFFLOAD_ASSERT(Valid());
    OFFLOAD_ASSERT(!IsDone());
    Typed().value.emplace(std::forward<U>(v));
  }

 private:
  explicit Future(std::shared_ptr<detail::ValueState<T>> state) noexcept
      : Future<void>(std::move(state)) {}

  detail::ValueState<T>& Typed() const noexcept {
    return static_cast<detail::ValueState<T>&>(*state_);
  }
};

}  // namespace offload

#endif  // OFFLOAD_FUTURE_HPP_
