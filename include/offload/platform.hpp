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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and contract-check macros.
 */

#ifndef OFFLOAD_PLATFORM_HPP_
#define OFFLOAD_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <thread>

namespace offload {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define OFFLOAD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define OFFLOAD_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define OFFLOAD_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define OFFLOAD_LIKELY(x) __builtin_expect(!!(x), 1)
#define OFFLOAD_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define OFFLOAD_LIKELY(x) (x)
#define OFFLOAD_UNLIKELY(x) (x)
#endif

// ============================================================================
// Contract Checks
// ============================================================================

namespace detail {

/**
 * @brief Report a violated contract to stderr and abort.
 *
 * @param kind  "OFFLOAD_ASSERT" or "OFFLOAD_CHECK".
 */
[[noreturn]] inline void ContractFail(const char* kind, const char* cond,
                                      const char* file, int line) noexcept {
  (void)std::fprintf(stderr, "%s failed: %s at %s:%d\n", kind, cond, file,
                     line);
  (void)std::fflush(stderr);
  std::abort();
}

}  // namespace detail

/// Debug-only check (compiled out with NDEBUG).
#ifdef NDEBUG
#define OFFLOAD_ASSERT(cond) ((void)0)
#else
#define OFFLOAD_ASSERT(cond) \
  ((cond) ? ((void)0)        \
          : ::offload::detail::ContractFail("OFFLOAD_ASSERT", #cond, __FILE__, __LINE__))
#endif

/// Always-on check for producer bugs that must never be survived.
#define OFFLOAD_CHECK(cond) \
  ((cond) ? ((void)0)       \
          : ::offload::detail::ContractFail("OFFLOAD_CHECK", #cond, __FILE__, __LINE__))

// ============================================================================
// CPU topology
// ============================================================================

/**
 * @brief Number of logical cores, never less than 1.
 */
inline uint32_t HardwareConcurrency() noexcept {
  const unsigned n = std::thread::hardware_concurrency();
  return (n == 0U) ? 1U : static_cast<uint32_t>(n);
}

/**
 * @brief Default worker count: one core is left to the submitting thread.
 */
inline uint32_t DefaultWorkerCount() noexcept {
  const uint32_t cores = HardwareConcurrency();
  return (cores > 1U) ? cores - 1U : 1U;
}

}  // namespace offload

#endif  // OFFLOAD_PLATFORM_HPP_
