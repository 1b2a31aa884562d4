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
 * @file buffer_pool.hpp
 * @brief BufferPool - reusable, resizable byte buffers with typed contexts.
 *
 * The pool keeps released byte arrays in a free list sorted by ascending
 * capacity and hands them out again through move-only Buffer<T> handles.
 * Each handle carries a context of type T (connection, message header, ...)
 * that travels with the bytes.
 *
 * Allocation policy:
 *   - first fit: the first free array whose capacity suffices is reused
 *   - nothing fits: the smallest free array is evicted and a fresh array of
 *     exactly the requested size is allocated outside the lock
 *
 * Ownership:
 *   - exactly one handle owns an array at a time
 *   - Mutate()/Resize() consume the handle (call on an rvalue) and return
 *     the new owner; the old handle is left invalid
 *   - destroying a valid handle returns its array to the pool, unless the
 *     array was supplied by the caller (GetBufferFromExistingData)
 *
 * Usage:
 * @code
 *   offload::BufferPool pool;
 *   auto buf = pool.GetBuffer<Header>(1024, Header{7});
 *   std::memcpy(buf.Data(), src, 512);
 *   buf.SetSize(512);
 *   (void)pool.ResizeBuffer(buf, 4096);
 *   auto framed = std::move(buf).Mutate(Frame{...});
 * @endcode
 *
 * Thread safety: the pool is safe to use from any thread. A Buffer<T>
 * handle is not; hand it over with std::move.
 */

#ifndef OFFLOAD_BUFFER_POOL_HPP_
#define OFFLOAD_BUFFER_POOL_HPP_

#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace offload {

enum class BufferPoolError : uint8_t {
  kBufferInvalidated = 0,  ///< Handle was moved from, mutated, resized or released
  kForeignBuffer,          ///< Buffer belongs to another pool
};

inline const char* ErrorName(BufferPoolError e) noexcept {
  switch (e) {
    case BufferPoolError::kBufferInvalidated:
      return "buffer invalidated";
    case BufferPoolError::kForeignBuffer:
      return "foreign buffer";
  }
  return "unknown";
}

/// Default context for buffers that need none.
struct NoContext {};

struct BufferPoolStats {
  uint64_t allocations{0U};  ///< Fresh arrays created
  uint64_t reuses{0U};       ///< Requests served from the free list
  uint64_t evictions{0U};    ///< Free arrays dropped to make room
  uint64_t releases{0U};     ///< Arrays returned to the free list
  uint32_t free_count{0U};
  uint64_t free_bytes{0U};
};

class BufferPool;

namespace detail {

struct PoolBlock {
  std::unique_ptr<uint8_t[]> data;
  size_t capacity{0U};
};

}  // namespace detail

// ============================================================================
// Buffer<T>
// ============================================================================

template <typename T = NoContext>
class Buffer final {
 public:
  /// Lower bound of the growth factor applied on repeated resizes.
  static constexpr double kMinResizeOffset = 0.1;

  Buffer() noexcept = default;

  Buffer(Buffer&& other) noexcept { TakeFrom(other); }

  Buffer& operator=(Buffer&& other) noexcept {
    if (this != &other) {
      ReleaseInternal();
      TakeFrom(other);
    }
    return *this;
  }

  Buffer(const Buffer&) = delete;
  Buffer& operator=(const Buffer&) = delete;

  ~Buffer() { ReleaseInternal(); }

  // ======================== Accessors ========================

  bool Valid() const noexcept { return valid_; }

  uint8_t* Data() noexcept {
    OFFLOAD_CHECK(valid_);
    return data_;
  }
  const uint8_t* Data() const noexcept {
    OFFLOAD_CHECK(valid_);
    return data_;
  }

  size_t Capacity() const noexcept { return capacity_; }

  /// Bytes in use; always <= Capacity().
  size_t Size() const noexcept { return size_; }

  void SetSize(size_t size) noexcept {
    OFFLOAD_CHECK(valid_);
    OFFLOAD_ASSERT(size <= capacity_);
    size_ = (size <= capacity_) ? size : capacity_;
  }

  T& Context() noexcept {
    OFFLOAD_CHECK(valid_);
    return *context_;
  }
  const T& Context() const noexcept {
    OFFLOAD_CHECK(valid_);
    return *context_;
  }

  uint32_t ResizeCount() const noexcept { return resize_count_; }

  /// True when the bytes were supplied by the caller, not the pool.
  bool IsExternal() const noexcept { return valid_ && owned_ == nullptr; }

  BufferPool* Owner() const noexcept { return pool_; }

  // ======================== Ownership transfer ========================

  /**
   * @brief Hand the bytes to a new handle with a different context.
   *
   * No copy, no pool access. This handle is invalid afterwards and its old
   * context is destroyed. Calling it on an invalid handle aborts.
   */
  template <typename U>
  Buffer<U> Mutate(U context) && {
    OFFLOAD_CHECK(valid_);
    Buffer<U> out;
    out.pool_ = pool_;
    out.owned_ = std::move(owned_);
    out.data_ = data_;
    out.capacity_ = capacity_;
    out.size_ = size_;
    out.resize_count_ = resize_count_;
    out.context_.emplace(std::move(context));
    out.valid_ = true;
    Invalidate();
    return out;
  }

  /**
   * @brief Mutate() with the new context computed from the old one.
   */
  template <typename F, typename U = std::decay_t<std::invoke_result_t<F&, T&>>>
  Buffer<U> MutateWith(F&& converter) && {
    OFFLOAD_CHECK(valid_);
    U next = converter(*context_);
    return std::move(*this).template Mutate<U>(std::move(next));
  }

  /**
   * @brief Grow to at least @p min_size bytes.
   *
   * Returns this buffer unchanged when it is already large enough.
   * Otherwise the content and size move to a new pool buffer and the old
   * array is freed without going back to the pool, so transient oversized
   * arrays do not accumulate in the free list. Aborts on an invalid handle.
   */
  Buffer Resize(size_t min_size) &&;

  /**
   * @brief Return the array to the pool now instead of at destruction.
   */
  expected<void, BufferPoolError> Release() noexcept {
    if (!valid_) {
      return expected<void, BufferPoolError>::error(BufferPoolError::kBufferInvalidated);
    }
    ReleaseInternal();
    return expected<void, BufferPoolError>::success();
  }

 private:
  template <typename>
  friend class Buffer;
  friend class BufferPool;

  /**
   * @brief Capacity to request when growing to @p min_size.
   *
   * Buffers resized often get a margin proportional to their resize count,
   * buffers whose size barely moves get little extra.
   */
  size_t GrowthTarget(size_t min_size) const noexcept {
    double growth = kMinResizeOffset;
    if (capacity_ > 0U) {
      growth = std::max(1.0 - static_cast<double>(min_size) / static_cast<double>(capacity_), kMinResizeOffset);
    }
    return min_size + static_cast<size_t>(static_cast<double>(resize_count_) * growth * static_cast<double>(min_size));
  }

  void TakeFrom(Buffer& other) noexcept {
    pool_ = other.pool_;
    owned_ = std::move(other.owned_);
    data_ = other.data_;
    capacity_ = other.capacity_;
    size_ = other.size_;
    resize_count_ = other.resize_count_;
    context_.reset();
    if (other.context_.has_value()) {
      context_.emplace(std::move(*other.context_));
    }
    valid_ = other.valid_;
    other.Invalidate();
  }

  /// Forget the bytes without returning them anywhere.
  void Invalidate() noexcept {
    pool_ = nullptr;
    owned_.reset();
    data_ = nullptr;
    capacity_ = 0U;
    size_ = 0U;
    resize_count_ = 0U;
    context_.reset();
    valid_ = false;
  }

  void ReleaseInternal() noexcept;

  BufferPool* pool_{nullptr};
  std::unique_ptr<uint8_t[]> owned_;  ///< Null for caller-supplied arrays
  uint8_t* data_{nullptr};
  size_t capacity_{0U};
  size_t size_{0U};
  uint32_t resize_count_{0U};
  std::optional<T> context_;
  bool valid_{false};
};

// ============================================================================
// BufferPool
// ============================================================================

class BufferPool final {
 public:
  BufferPool() = default;

  ~BufferPool() {
    const int64_t live = outstanding_.load(std::memory_order_acquire);
    if (live != 0) {
      OFFLOAD_LOG_ERROR("BufferPool", "destroyed with %lld buffers still alive", static_cast<long long>(live));
    }
    OFFLOAD_ASSERT(live == 0);
  }

  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool(BufferPool&&) = delete;
  BufferPool& operator=(BufferPool&&) = delete;

  /**
   * @brief Get a buffer of at least @p min_size bytes, size 0.
   *
   * The capacity may exceed @p min_size when a larger free array is reused.
   */
  template <typename T = NoContext>
  Buffer<T> GetBuffer(size_t min_size, T context = T{}) {
    detail::PoolBlock block = Grab(min_size);
    Buffer<T> out;
    out.pool_ = this;
    out.data_ = block.data.get();
    out.owned_ = std::move(block.data);
    out.capacity_ = block.capacity;
    out.size_ = 0U;
    out.context_.emplace(std::move(context));
    out.valid_ = true;
    outstanding_.fetch_add(1, std::memory_order_relaxed);
    return out;
  }

  /**
   * @brief Wrap caller-owned bytes. Size and capacity are @p length.
   *
   * The array is never inserted into the free list; the caller keeps
   * ownership and must keep it alive while the buffer is.
   */
  template <typename T = NoContext>
  Buffer<T> GetBufferFromExistingData(uint8_t* data, size_t length, T context = T{}) {
    OFFLOAD_ASSERT(data != nullptr || length == 0U);
    Buffer<T> out;
    out.pool_ = this;
    out.data_ = data;
    out.capacity_ = length;
    out.size_ = length;
    out.context_.emplace(std::move(context));
    out.valid_ = true;
    outstanding_.fetch_add(1, std::memory_order_relaxed);
    return out;
  }

  /**
   * @brief Grow @p buffer in place to at least @p min_size bytes.
   */
  template <typename T>
  expected<void, BufferPoolError> ResizeBuffer(Buffer<T>& buffer, size_t min_size) {
    if (!buffer.Valid()) {
      return expected<void, BufferPoolError>::error(BufferPoolError::kBufferInvalidated);
    }
    if (buffer.Owner() != this) {
      return expected<void, BufferPoolError>::error(BufferPoolError::kForeignBuffer);
    }
    buffer = std::move(buffer).Resize(min_size);
    return expected<void, BufferPoolError>::success();
  }

  /**
   * @brief Drop every free array.
   */
  void Clear() noexcept {
    std::list<detail::PoolBlock> dropped;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      dropped.swap(available_);
    }
  }

  BufferPoolStats GetStats() const noexcept {
    BufferPoolStats s;
    s.allocations = allocations_.load(std::memory_order_relaxed);
    s.reuses = reuses_.load(std::memory_order_relaxed);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.releases = releases_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(mtx_);
    s.free_count = static_cast<uint32_t>(available_.size());
    for (const auto& b : available_) {
      s.free_bytes += b.capacity;
    }
    return s;
  }

  uint32_t FreeCount() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(available_.size());
  }

  /// Handles created by this pool and not yet released or invalidated.
  int64_t OutstandingCount() const noexcept { return outstanding_.load(std::memory_order_acquire); }

 private:
  template <typename>
  friend class Buffer;

  detail::PoolBlock Grab(size_t min_size) {
    detail::PoolBlock block;
    detail::PoolBlock evicted;
    bool found = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      for (auto it = available_.begin(); it != available_.end(); ++it) {
        if (it->capacity >= min_size) {
          block = std::move(*it);
          available_.erase(it);
          found = true;
          break;
        }
      }
      if (!found && !available_.empty()) {
        // Bound the pool: the smallest array makes room for the new one.
        evicted = std::move(available_.front());
        available_.pop_front();
        evictions_.fetch_add(1U, std::memory_order_relaxed);
      }
    }

    if (found) {
      reuses_.fetch_add(1U, std::memory_order_relaxed);
      return block;
    }

    // Allocate outside the lock.
    block.data = std::make_unique<uint8_t[]>(min_size);
    block.capacity = min_size;
    allocations_.fetch_add(1U, std::memory_order_relaxed);
    return block;
  }

  void Release(detail::PoolBlock&& block) noexcept {
    const size_t cap = block.capacity;
    std::lock_guard<std::mutex> lk(mtx_);
    if (available_.empty() || available_.back().capacity <= cap) {
      available_.push_back(std::move(block));
    } else {
      for (auto it = available_.begin(); it != available_.end(); ++it) {
        if (it->capacity >= cap) {
          available_.insert(it, std::move(block));
          break;
        }
      }
    }
    releases_.fetch_add(1U, std::memory_order_relaxed);
  }

  void Forget() noexcept { outstanding_.fetch_sub(1, std::memory_order_relaxed); }

  mutable std::mutex mtx_;
  std::list<detail::PoolBlock> available_;  ///< Ascending by capacity

  std::atomic<int64_t> outstanding_{0};
  std::atomic<uint64_t> allocations_{0U};
  std::atomic<uint64_t> reuses_{0U};
  std::atomic<uint64_t> evictions_{0U};
  std::atomic<uint64_t> releases_{0U};
};

// ============================================================================
// Buffer<T> out-of-class members (need the complete BufferPool)
// ============================================================================

template <typename T>
Buffer<T> Buffer<T>::Resize(size_t min_size) && {
  OFFLOAD_CHECK(valid_);
  if (capacity_ >= min_size) {
    return std::move(*this);
  }

  Buffer grown = pool_->GetBuffer<T>(GrowthTarget(min_size), std::move(*context_));
  if (capacity_ > 0U) {
    std::memcpy(grown.data_, data_, capacity_);
  }
  grown.size_ = size_;
  grown.resize_count_ = resize_count_ + 1U;

  // The old array is freed here, not pooled.
  pool_->Forget();
  Invalidate();
  return grown;
}

template <typename T>
void Buffer<T>::ReleaseInternal() noexcept {
  if (!valid_) {
    return;
  }
  if (pool_ != nullptr) {
    if (owned_ != nullptr) {
      detail::PoolBlock block;
      block.data = std::move(owned_);
      block.capacity = capacity_;
      pool_->Release(std::move(block));
    }
    pool_->Forget();
  }
  // Destroys the context, releasing whatever it holds.
  Invalidate();
}

}  // namespace offload

#endif  // OFFLOAD_BUFFER_POOL_HPP_
