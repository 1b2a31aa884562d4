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
 * @file event.hpp
 * @brief ManualResetEvent - a latch that stays signaled until Reset().
 *
 * Unlike a semaphore, Wait() does not consume the signal: every waiter is
 * released once Set() is called, and later waiters return immediately
 * until Reset().
 */

#ifndef OFFLOAD_EVENT_HPP_
#define OFFLOAD_EVENT_HPP_

#include "offload/platform.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace offload {

class ManualResetEvent final {
 public:
  explicit ManualResetEvent(bool initially_set = false) noexcept : set_(initially_set) {}

  ~ManualResetEvent() = default;

  ManualResetEvent(const ManualResetEvent&) = delete;
  ManualResetEvent& operator=(const ManualResetEvent&) = delete;
  ManualResetEvent(ManualResetEvent&&) = delete;
  ManualResetEvent& operator=(ManualResetEvent&&) = delete;

  /**
   * @brief Signal the event and wake all waiters.
   */
  void Set() noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      set_ = true;
    }
    cv_.notify_all();
  }

  void Reset() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    set_ = false;
  }

  bool IsSet() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return set_;
  }

  /**
   * @brief Block until the event is signaled.
   */
  void Wait() const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return set_; });
  }

  /**
   * @brief Block for at most @p timeout.
   * @return true if the event was signaled before the timeout.
   */
  template <typename Rep, typename Period>
  bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const noexcept {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return set_; });
  }

 private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  bool set_;
};

}  // namespace offload

#endif  // OFFLOAD_EVENT_HPP_
