/**
 * @file test_buffer_pool.cpp
 * @brief Catch2 tests for offload::BufferPool and offload::Buffer<T>.
 */

#include "offload/buffer_pool.hpp"

#ifdef __linux__
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <catch2/catch_test_macros.hpp>

#include <csignal>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Header {
  uint32_t id{0U};
};

struct Frame {
  uint32_t id{0U};
  std::string tag;
};

#ifdef __linux__
/// Runs @p fn in a forked child; true if the child died from SIGABRT.
template <typename F>
bool AbortsInChild(F&& fn) {
  pid_t pid = fork();
  if (pid == 0) {
    fn();
    _exit(0);
  }
  int status = 0;
  waitpid(pid, &status, 0);
  return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}
#endif

/// Context that counts its live instances.
struct Tracked {
  explicit Tracked(std::shared_ptr<int> c = nullptr) : counter(std::move(c)) {}
  std::shared_ptr<int> counter;
};

}  // namespace

// ============================================================================
// GetBuffer
// ============================================================================

TEST_CASE("buffer_pool - fresh buffer has the requested capacity", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer(100U);
  REQUIRE(buf.Valid());
  REQUIRE(buf.Capacity() >= 100U);
  REQUIRE(buf.Size() == 0U);
  REQUIRE(buf.ResizeCount() == 0U);
  REQUIRE_FALSE(buf.IsExternal());
  REQUIRE(buf.Owner() == &pool);
  REQUIRE(pool.OutstandingCount() == 1);
  REQUIRE(pool.GetStats().allocations == 1U);
}

TEST_CASE("buffer_pool - context travels with the buffer", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer<Header>(16U, Header{7U});
  REQUIRE(buf.Context().id == 7U);
  buf.Context().id = 8U;
  REQUIRE(buf.Context().id == 8U);
}

TEST_CASE("buffer_pool - released array is reused", "[buffer_pool]") {
  offload::BufferPool pool;
  {
    auto buf = pool.GetBuffer(256U);
  }
  REQUIRE(pool.FreeCount() == 1U);
  REQUIRE(pool.OutstandingCount() == 0);

  auto again = pool.GetBuffer(128U);
  REQUIRE(again.Capacity() == 256U);
  REQUIRE(again.Size() == 0U);

  auto stats = pool.GetStats();
  REQUIRE(stats.allocations == 1U);
  REQUIRE(stats.reuses == 1U);
  REQUIRE(stats.releases == 1U);
  REQUIRE(pool.FreeCount() == 0U);
}

TEST_CASE("buffer_pool - Release returns early and invalidates", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer(32U);
  REQUIRE(buf.Release().has_value());
  REQUIRE_FALSE(buf.Valid());
  REQUIRE(pool.FreeCount() == 1U);

  auto again = buf.Release();
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == offload::BufferPoolError::kBufferInvalidated);
}

TEST_CASE("buffer_pool - free list is sorted and first fit", "[buffer_pool]") {
  offload::BufferPool pool;
  {
    auto a = pool.GetBuffer(300U);
    auto b = pool.GetBuffer(100U);
    auto c = pool.GetBuffer(200U);
  }
  auto stats = pool.GetStats();
  REQUIRE(stats.free_count == 3U);
  REQUIRE(stats.free_bytes == 600U);

  // Smallest sufficient array wins, regardless of release order.
  auto x = pool.GetBuffer(150U);
  REQUIRE(x.Capacity() == 200U);
  auto y = pool.GetBuffer(50U);
  REQUIRE(y.Capacity() == 100U);
  auto z = pool.GetBuffer(10U);
  REQUIRE(z.Capacity() == 300U);
}

TEST_CASE("buffer_pool - no fit evicts the smallest free array", "[buffer_pool]") {
  offload::BufferPool pool;
  {
    auto a = pool.GetBuffer(64U);
    auto b = pool.GetBuffer(128U);
  }
  REQUIRE(pool.FreeCount() == 2U);

  auto big = pool.GetBuffer(1024U);
  REQUIRE(big.Capacity() == 1024U);
  REQUIRE(pool.FreeCount() == 1U);

  auto stats = pool.GetStats();
  REQUIRE(stats.evictions == 1U);
  REQUIRE(stats.free_bytes == 128U);
}

TEST_CASE("buffer_pool - Clear drops free arrays", "[buffer_pool]") {
  offload::BufferPool pool;
  {
    auto a = pool.GetBuffer(64U);
  }
  pool.Clear();
  REQUIRE(pool.FreeCount() == 0U);
}

// ============================================================================
// Move semantics
// ============================================================================

TEST_CASE("buffer_pool - move leaves the source invalid", "[buffer_pool]") {
  offload::BufferPool pool;
  auto a = pool.GetBuffer<Header>(16U, Header{1U});
  auto b = std::move(a);
  REQUIRE_FALSE(a.Valid());  // NOLINT(bugprone-use-after-move)
  REQUIRE(b.Valid());
  REQUIRE(b.Context().id == 1U);
  REQUIRE(pool.OutstandingCount() == 1);
}

// ============================================================================
// Resize
// ============================================================================

TEST_CASE("buffer_pool - Resize within capacity keeps the buffer", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer(200U);
  uint8_t* before = buf.Data();
  auto same = std::move(buf).Resize(150U);
  REQUIRE(same.Data() == before);
  REQUIRE(same.Capacity() == 200U);
  REQUIRE(same.ResizeCount() == 0U);
}

TEST_CASE("buffer_pool - Resize copies content and grows", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer<Header>(100U, Header{3U});
  std::memset(buf.Data(), 0xAB, 100U);
  buf.SetSize(80U);

  auto grown = std::move(buf).Resize(150U);
  REQUIRE_FALSE(buf.Valid());  // NOLINT(bugprone-use-after-move)
  REQUIRE(grown.Capacity() >= 150U);
  REQUIRE(grown.Size() == 80U);
  REQUIRE(grown.ResizeCount() == 1U);
  REQUIRE(grown.Context().id == 3U);
  for (size_t i = 0; i < 100U; ++i) {
    REQUIRE(grown.Data()[i] == 0xAB);
  }

  // The old array is freed, not pooled.
  REQUIRE(pool.FreeCount() == 0U);
  REQUIRE(pool.OutstandingCount() == 1);
}

TEST_CASE("buffer_pool - repeated resizes grow with margin", "[buffer_pool]") {
  offload::BufferPool pool;
  offload::Buffer<> buf = pool.GetBuffer(100U);

  REQUIRE(pool.ResizeBuffer(buf, 150U).has_value());
  REQUIRE(buf.Capacity() >= 150U);
  REQUIRE(buf.ResizeCount() == 1U);

  REQUIRE(pool.ResizeBuffer(buf, 400U).has_value());
  REQUIRE(buf.Capacity() >= 400U);
  REQUIRE(buf.ResizeCount() == 2U);

  // Second growth gets resize_count * max(1 - 400/150, 0.1) * 400 extra.
  REQUIRE(buf.Capacity() == 440U);

  const size_t cap = buf.Capacity();
  REQUIRE(pool.ResizeBuffer(buf, 300U).has_value());
  REQUIRE(buf.Capacity() == cap);
  REQUIRE(buf.ResizeCount() == 2U);
}

TEST_CASE("buffer_pool - ResizeBuffer errors", "[buffer_pool]") {
  offload::BufferPool pool;
  offload::BufferPool other;

  SECTION("invalidated handle") {
    auto buf = pool.GetBuffer(8U);
    (void)buf.Release();
    auto r = pool.ResizeBuffer(buf, 64U);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == offload::BufferPoolError::kBufferInvalidated);
  }

  SECTION("buffer from another pool") {
    auto buf = other.GetBuffer(8U);
    auto r = pool.ResizeBuffer(buf, 64U);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == offload::BufferPoolError::kForeignBuffer);
  }
}

// ============================================================================
// Mutate
// ============================================================================

TEST_CASE("buffer_pool - Mutate swaps the context without copying", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer<Header>(64U, Header{5U});
  buf.SetSize(10U);
  uint8_t* bytes = buf.Data();

  auto framed = std::move(buf).Mutate(Frame{9U, "frame"});
  REQUIRE_FALSE(buf.Valid());  // NOLINT(bugprone-use-after-move)
  REQUIRE(framed.Data() == bytes);
  REQUIRE(framed.Size() == 10U);
  REQUIRE(framed.Context().id == 9U);
  REQUIRE(framed.Context().tag == "frame");
  REQUIRE(pool.OutstandingCount() == 1);
}

TEST_CASE("buffer_pool - MutateWith derives the new context", "[buffer_pool]") {
  offload::BufferPool pool;
  auto buf = pool.GetBuffer<Header>(64U, Header{5U});
  auto framed = std::move(buf).MutateWith([](Header& h) { return Frame{h.id + 1U, "next"}; });
  REQUIRE(framed.Context().id == 6U);
}

TEST_CASE("buffer_pool - old context is destroyed on mutate and release", "[buffer_pool]") {
  offload::BufferPool pool;
  auto counter = std::make_shared<int>(0);

  auto buf = pool.GetBuffer<Tracked>(16U, Tracked(counter));
  REQUIRE(counter.use_count() == 2);

  auto plain = std::move(buf).Mutate(Header{1U});
  REQUIRE(counter.use_count() == 1);

  auto tracked = std::move(plain).Mutate(Tracked(counter));
  REQUIRE(counter.use_count() == 2);
  REQUIRE(tracked.Release().has_value());
  REQUIRE(counter.use_count() == 1);
}

// ============================================================================
// External data
// ============================================================================

TEST_CASE("buffer_pool - external data is wrapped, never pooled", "[buffer_pool]") {
  offload::BufferPool pool;
  std::vector<uint8_t> storage(48U, 0x11);

  {
    auto ext = pool.GetBufferFromExistingData<Header>(storage.data(), storage.size(), Header{2U});
    REQUIRE(ext.IsExternal());
    REQUIRE(ext.Data() == storage.data());
    REQUIRE(ext.Size() == 48U);
    REQUIRE(ext.Capacity() == 48U);
  }
  REQUIRE(pool.FreeCount() == 0U);
  REQUIRE(pool.OutstandingCount() == 0);
}

TEST_CASE("buffer_pool - resizing external data moves it into the pool", "[buffer_pool]") {
  offload::BufferPool pool;
  std::vector<uint8_t> storage(16U, 0x22);

  auto ext = pool.GetBufferFromExistingData(storage.data(), storage.size());
  REQUIRE(pool.ResizeBuffer(ext, 64U).has_value());
  REQUIRE_FALSE(ext.IsExternal());
  REQUIRE(ext.Size() == 16U);
  REQUIRE(ext.Data()[15] == 0x22);
  REQUIRE(pool.OutstandingCount() == 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("buffer_pool - concurrent get and release", "[buffer_pool]") {
  offload::BufferPool pool;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&pool, t] {
      for (int i = 0; i < 200; ++i) {
        auto buf = pool.GetBuffer(static_cast<size_t>(32 + (i % 8) * 16 + t));
        buf.Data()[0] = static_cast<uint8_t>(i);
        buf.SetSize(1U);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  REQUIRE(pool.OutstandingCount() == 0);
  auto stats = pool.GetStats();
  REQUIRE(stats.allocations + stats.reuses == 800U);
  REQUIRE(stats.releases == 800U);
}

// ============================================================================
// Invalidated handles
// ============================================================================

TEST_CASE("buffer_pool - invalidated handle forgets its pool", "[buffer_pool]") {
  offload::BufferPool pool;
  auto a = pool.GetBuffer(16U);
  auto b = std::move(a);
  REQUIRE(a.Owner() == nullptr);  // NOLINT(bugprone-use-after-move)
  REQUIRE(b.Owner() == &pool);

  REQUIRE(b.Release().has_value());
  REQUIRE(b.Owner() == nullptr);
  REQUIRE(pool.OutstandingCount() == 0);
}

TEST_CASE("buffer_pool - outstanding count survives moves, mutate and resize", "[buffer_pool]") {
  offload::BufferPool pool;
  {
    auto a = pool.GetBuffer<Header>(16U, Header{1U});
    auto b = std::move(a);
    auto c = std::move(b).Mutate(Frame{2U, "f"});
    auto d = std::move(c).Resize(256U);
    REQUIRE(pool.OutstandingCount() == 1);

    auto r = pool.ResizeBuffer(c, 512U);  // NOLINT(bugprone-use-after-move)
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == offload::BufferPoolError::kBufferInvalidated);
    REQUIRE(pool.OutstandingCount() == 1);
  }
  REQUIRE(pool.OutstandingCount() == 0);
}

#ifdef __linux__
TEST_CASE("buffer_pool - using an invalidated handle aborts", "[buffer_pool]") {
  offload::BufferPool pool;

  SECTION("Mutate") {
    REQUIRE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer<Header>(16U, Header{1U});
      auto b = std::move(a);
      auto m = std::move(a).Mutate(42);  // NOLINT(bugprone-use-after-move)
      (void)m;
    }));
  }

  SECTION("MutateWith") {
    REQUIRE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer<Header>(16U, Header{1U});
      (void)a.Release();
      auto m = std::move(a).MutateWith([](Header& h) { return Frame{h.id, "x"}; });
      (void)m;
    }));
  }

  SECTION("Resize") {
    REQUIRE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer(16U);
      auto b = std::move(a);
      auto r = std::move(a).Resize(64U);  // NOLINT(bugprone-use-after-move)
      (void)r;
    }));
  }

  SECTION("Data and Context") {
    REQUIRE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer<Header>(16U, Header{1U});
      auto b = std::move(a);
      (void)a.Context();  // NOLINT(bugprone-use-after-move)
    }));
    REQUIRE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer(16U);
      (void)a.Release();
      (void)a.Data();
    }));
  }

  SECTION("valid handle does not abort") {
    REQUIRE_FALSE(AbortsInChild([&pool] {
      auto a = pool.GetBuffer(16U);
      auto m = std::move(a).Mutate(Header{3U});
      (void)m.Data();
    }));
  }

  REQUIRE(pool.OutstandingCount() == 0);
}
#endif  // __linux__
