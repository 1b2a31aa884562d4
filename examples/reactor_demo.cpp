// Copyright (c) 2024 liudegui. MIT License.
//
// reactor_demo.cpp -- Reactor host loop demo.
//
// A host "frame loop" owns a Reactor. Background workers compute results
// and post them back to the reactor, so all state owned by the host thread
// is only ever touched on that thread. The loop pumps once per frame until
// the pool drained.

#include "offload/log.hpp"
#include "offload/reactor.hpp"
#include "offload/worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <thread>
#include <vector>

struct Scene {
  std::vector<uint32_t> tiles;
  uint32_t updates{0U};
};

int main() {
  offload::log::Init();

  Scene scene;
  scene.tiles.assign(16U, 0U);

  offload::Reactor reactor;
  offload::WorkerPoolConfig cfg;
  cfg.name = "tiles";
  cfg.worker_num = 3U;
  offload::WorkerPool pool(cfg);

  for (uint32_t tile = 0U; tile < scene.tiles.size(); ++tile) {
    auto r = pool.Submit([tile, &reactor, &scene] {
      // Heavy work off the host thread.
      uint32_t acc = tile;
      for (uint32_t i = 0U; i < 200000U; ++i) {
        acc = acc * 1664525U + 1013904223U;
      }
      // Apply the result on the host thread.
      auto posted = reactor.Submit([tile, acc, &scene] {
        scene.tiles[tile] = acc;
        ++scene.updates;
      });
      if (!posted.has_value()) {
        OFFLOAD_LOG_WARN("Demo", "tile %u dropped: %s", tile, offload::ErrorName(posted.get_error()));
      }
    });
    if (!r.has_value()) {
      OFFLOAD_LOG_ERROR("Demo", "submit failed: %s", offload::ErrorName(r.get_error()));
    }
  }

  auto poll = pool.WaitForTasksCompletion();
  if (!poll.has_value()) {
    return 1;
  }

  uint32_t frame = 0U;
  bool draining = true;
  while (draining) {
    draining = poll.value().Next();
    auto pumped = reactor.Pump();
    if (!pumped.has_value()) {
      OFFLOAD_LOG_ERROR("Demo", "pump failed: %s", offload::ErrorName(pumped.get_error()));
      break;
    }
    if (pumped.value() > 0U) {
      printf("frame %3u: applied %u results (%u/%zu)\n", frame, pumped.value(), scene.updates,
             scene.tiles.size());
    }
    ++frame;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  printf("done after %u frames, %u tile updates\n", frame, scene.updates);
  pool.Shutdown();
  reactor.Shutdown();
  offload::log::Shutdown();
  return 0;
}
