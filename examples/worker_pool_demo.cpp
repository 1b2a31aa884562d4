// Copyright (c) 2024 liudegui. MIT License.
//
// worker_pool_demo.cpp -- WorkerPool and ParallelProcessing demo.
//
// Demonstrates:
//   1. Submit / SubmitTyped with futures
//   2. Failure containment (a throwing task leaves the pool healthy)
//   3. SubmitToSlot filling a result vector
//   4. Cooperative wait with CompletionPoll
//   5. ParallelProcessing with per-worker contexts
//   6. Optional INI configuration (when built with OFFLOAD_CONFIG_INI)

#include "offload/config.hpp"
#include "offload/log.hpp"
#include "offload/parallel_processing.hpp"
#include "offload/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <vector>

using Clock = std::chrono::steady_clock;

static inline uint64_t ElapsedUs(Clock::time_point t0, Clock::time_point t1) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
}

static uint64_t Collatz(uint64_t n) {
  uint64_t steps = 0U;
  while (n != 1U) {
    n = (n % 2U == 0U) ? n / 2U : 3U * n + 1U;
    ++steps;
  }
  return steps;
}

// ============================================================================
// Demo 1: Futures
// ============================================================================

static void DemoFutures(offload::WorkerPool& pool) {
  printf("\n=== Demo 1: Futures ===\n");
  auto r = pool.SubmitTyped([] { return Collatz(837799U); });
  if (!r.has_value()) {
    printf("  submit failed: %s\n", offload::ErrorName(r.get_error()));
    return;
  }
  printf("  Collatz(837799) = %llu steps\n", static_cast<unsigned long long>(r.value().Value()));
}

// ============================================================================
// Demo 2: Failure containment
// ============================================================================

static void DemoFailure(offload::WorkerPool& pool) {
  printf("\n=== Demo 2: Failure containment ===\n");
  auto bad = pool.Submit([] { throw std::runtime_error("corrupt input"); });
  auto good = pool.SubmitTyped([] { return 7; });
  if (!bad.has_value() || !good.has_value()) {
    return;
  }
  char desc[128];
  printf("  failing task success=%d (%s)\n", bad.value().Success() ? 1 : 0,
         offload::DescribeException(bad.value().Exception(), desc, sizeof(desc)));
  printf("  next task value=%d\n", good.value().Value());
}

// ============================================================================
// Demo 3 + 4: SubmitToSlot and CompletionPoll
// ============================================================================

static void DemoSlots(offload::WorkerPool& pool) {
  printf("\n=== Demo 3: SubmitToSlot + CompletionPoll ===\n");
  std::vector<uint64_t> steps(32U, 0U);
  auto t0 = Clock::now();
  for (size_t i = 0; i < steps.size(); ++i) {
    auto r = pool.SubmitToSlot(steps, i, [i] { return Collatz(1000000U + i); });
    if (!r.has_value()) {
      printf("  slot %zu rejected: %s\n", i, offload::ErrorName(r.get_error()));
    }
  }

  auto poll = pool.WaitForTasksCompletion();
  if (!poll.has_value()) {
    return;
  }
  uint32_t rounds = 0U;
  while (poll.value().Next()) {
    ++rounds;  // a real host would run its frame here
    std::this_thread::yield();
  }
  auto t1 = Clock::now();
  printf("  32 slots filled in %llu us over %u poll rounds, steps[0]=%llu\n",
         static_cast<unsigned long long>(ElapsedUs(t0, t1)), rounds,
         static_cast<unsigned long long>(steps[0]));
}

// ============================================================================
// Demo 5: ParallelProcessing
// ============================================================================

struct Histogram {
  uint64_t buckets[8] = {};
};

static void DemoParallel(const offload::ParallelConfig& cfg) {
  printf("\n=== Demo 5: ParallelProcessing ===\n");
  std::atomic<uint64_t> total{0U};
  {
    offload::ParallelProcessing<uint64_t, Histogram> proc(
        [&total](Histogram& h, uint64_t& n) {
          const uint64_t s = Collatz(n);
          ++h.buckets[s % 8U];
          total.fetch_add(s, std::memory_order_relaxed);
        },
        nullptr, cfg);

    for (uint64_t n = 1U; n <= 5000U; ++n) {
      (void)proc.AddData(n);
    }
    auto w = proc.WaitUntilTasksCompletion();
    printf("  %u workers processed %llu items (wait ok=%d)\n", proc.WorkerCount(),
           static_cast<unsigned long long>(proc.ProcessedCount()), w.has_value() ? 1 : 0);
  }
  printf("  total steps = %llu\n", static_cast<unsigned long long>(total.load()));
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  offload::log::Init();

  offload::RuntimeConfig rc;
  rc.pool.name = "demo";
#ifdef OFFLOAD_CONFIG_INI_ENABLED
  if (argc > 1) {
    offload::Config<offload::IniBackend> cfg;
    auto loaded = cfg.LoadFile(argv[1]);
    if (loaded.has_value()) {
      rc = offload::ApplyConfig(cfg);
    } else {
      OFFLOAD_LOG_WARN("Demo", "config %s not loaded: %s", argv[1], offload::ErrorName(loaded.get_error()));
    }
  }
#else
  (void)argc;
  (void)argv;
#endif
  offload::log::SetLevel(rc.log_level);

  printf("offload worker pool demo\n");
  {
    offload::WorkerPool pool(rc.pool);
    printf("pool '%s' with %u workers\n", pool.Name(), pool.WorkerCount());

    DemoFutures(pool);
    DemoFailure(pool);
    DemoSlots(pool);

    auto stats = pool.GetStats();
    printf("\nstats: submitted=%llu processed=%llu failed=%llu\n",
           static_cast<unsigned long long>(stats.submitted), static_cast<unsigned long long>(stats.processed),
           static_cast<unsigned long long>(stats.failed));
  }
  DemoParallel(rc.parallel);

  offload::log::Shutdown();
  return 0;
}
