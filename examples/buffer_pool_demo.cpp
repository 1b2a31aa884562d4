// Copyright (c) 2024 liudegui. MIT License.
//
// buffer_pool_demo.cpp -- BufferPool demo.
//
// Demonstrates:
//   1. Reuse of released arrays (allocation vs reuse counters)
//   2. Growing a message buffer with ResizeBuffer
//   3. Retyping a buffer's context with Mutate (no copy)
//   4. Wrapping caller-owned bytes

#include "offload/buffer_pool.hpp"
#include "offload/log.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>

struct RawPacket {
  uint32_t seq{0U};
};

struct DecodedPacket {
  uint32_t seq{0U};
  uint32_t checksum{0U};
};

static void PrintStats(const offload::BufferPool& pool) {
  const offload::BufferPoolStats s = pool.GetStats();
  printf("  alloc=%llu reuse=%llu evict=%llu release=%llu free=%u (%llu bytes)\n",
         static_cast<unsigned long long>(s.allocations), static_cast<unsigned long long>(s.reuses),
         static_cast<unsigned long long>(s.evictions), static_cast<unsigned long long>(s.releases), s.free_count,
         static_cast<unsigned long long>(s.free_bytes));
}

int main() {
  offload::log::Init();
  offload::BufferPool pool;

  printf("\n=== Demo 1: reuse ===\n");
  for (uint32_t i = 0U; i < 8U; ++i) {
    auto buf = pool.GetBuffer<RawPacket>(512U, RawPacket{i});
    std::memset(buf.Data(), static_cast<int>(i), 64U);
    buf.SetSize(64U);
  }
  PrintStats(pool);

  printf("\n=== Demo 2: growth ===\n");
  auto msg = pool.GetBuffer<RawPacket>(100U, RawPacket{42U});
  const size_t targets[] = {150U, 400U, 900U, 600U};
  for (size_t target : targets) {
    auto r = pool.ResizeBuffer(msg, target);
    if (!r.has_value()) {
      printf("  resize failed: %s\n", offload::ErrorName(r.get_error()));
      break;
    }
    printf("  need %4zu -> capacity %4zu (resizes=%u)\n", target, msg.Capacity(), msg.ResizeCount());
  }

  printf("\n=== Demo 3: mutate ===\n");
  msg.SetSize(16U);
  uint32_t sum = 0U;
  for (size_t i = 0U; i < msg.Size(); ++i) {
    msg.Data()[i] = static_cast<uint8_t>(i);
    sum += msg.Data()[i];
  }
  auto decoded = std::move(msg).MutateWith([sum](RawPacket& raw) { return DecodedPacket{raw.seq, sum}; });
  printf("  seq=%u checksum=%u size=%zu\n", decoded.Context().seq, decoded.Context().checksum, decoded.Size());
  (void)decoded.Release();

  printf("\n=== Demo 4: external bytes ===\n");
  uint8_t frame[32] = {};
  {
    auto ext = pool.GetBufferFromExistingData(frame, sizeof(frame));
    printf("  external=%d size=%zu\n", ext.IsExternal() ? 1 : 0, ext.Size());
  }
  PrintStats(pool);

  offload::log::Shutdown();
  return 0;
}
