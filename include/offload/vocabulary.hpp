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
 * @file vocabulary.hpp
 * @brief Shared vocabulary types: expected<V, E> and exception description.
 *
 * expected<V, E> carries either a value or an error enum. All library
 * operations that can fail on a caller mistake (submitting to a disposed
 * pool, resizing an invalidated buffer) report through it instead of
 * throwing.
 *
 * Usage:
 * @code
 *   offload::expected<uint32_t, MyError> r = DoWork();
 *   if (!r.has_value()) {
 *     HandleError(r.get_error());
 *   }
 * @endcode
 */

#ifndef OFFLOAD_VOCABULARY_HPP_
#define OFFLOAD_VOCABULARY_HPP_

#include "offload/platform.hpp"

#include <cstdio>
#include <cstring>

#include <exception>
#include <new>
#include <type_traits>
#include <utility>

namespace offload {

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected final {
  static_assert(std::is_enum<E>::value, "expected<V, E> requires an enum error type");

 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    OFFLOAD_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    OFFLOAD_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    OFFLOAD_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const { return has_value_ ? storage_.value : fallback; }

 private:
  explicit expected(const V& v) : has_value_(true) { ::new (&storage_.value) V(v); }
  explicit expected(V&& v) : has_value_(true) { ::new (&storage_.value) V(std::move(v)); }
  explicit expected(E e) noexcept : has_value_(false) { storage_.err = e; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/**
 * @brief Partial specialization for operations that return no value.
 */
template <typename E>
class expected<void, E> final {
  static_assert(std::is_enum<E>::value, "expected<void, E> requires an enum error type");

 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/**
 * @brief Inline, truncating string used for names in config structs.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  FixedString(const char* str) noexcept { Assign(str); }  // NOLINT(google-explicit-constructor)

  void Assign(const char* str) noexcept {
    size_ = 0U;
    if (str != nullptr) {
      while (size_ < Capacity && str[size_] != '\0') {
        buf_[size_] = str[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  bool operator==(const char* other) const noexcept {
    return other != nullptr && std::strcmp(buf_, other) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_{0U};
};

// ============================================================================
// Exception description
// ============================================================================

/**
 * @brief Write a one-line description of a captured exception into @p buf.
 *
 * std::exception subclasses report what(); anything else is reported as
 * "unknown exception". A null pointer yields "none".
 *
 * @return @p buf, always null-terminated.
 */
inline const char* DescribeException(const std::exception_ptr& ep, char* buf,
                                     size_t buf_size) noexcept {
  if (buf == nullptr || buf_size == 0U) {
    return "";
  }
  if (!ep) {
    (void)std::snprintf(buf, buf_size, "none");
    return buf;
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    (void)std::snprintf(buf, buf_size, "%s", e.what());
  } catch (...) {
    (void)std::snprintf(buf, buf_size, "unknown exception");
  }
  return buf;
}

}  // namespace offload

#endif  // OFFLOAD_VOCABULARY_HPP_
