/**
 * @file test_reactor.cpp
 * @brief Catch2 tests for offload::Reactor.
 */

#include "offload/reactor.hpp"
#include "offload/worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

// ============================================================================
// Thread affinity
// ============================================================================

TEST_CASE("reactor - owner is the constructing thread", "[reactor]") {
  offload::Reactor reactor;
  REQUIRE(reactor.IsOwnerThread());

  bool other_is_owner = true;
  std::thread t([&] { other_is_owner = reactor.IsOwnerThread(); });
  t.join();
  REQUIRE_FALSE(other_is_owner);
}

TEST_CASE("reactor - submit from the owner runs inline", "[reactor]") {
  offload::Reactor reactor;
  bool ran = false;
  auto r = reactor.Submit([&ran] { ran = true; });
  REQUIRE(r.has_value());
  REQUIRE(ran);
  REQUIRE(r.value().IsDone());
  REQUIRE(reactor.PendingCount() == 0U);
}

TEST_CASE("reactor - foreign submissions run on the owner during Pump", "[reactor]") {
  offload::Reactor reactor;
  const std::thread::id owner = std::this_thread::get_id();
  std::thread::id ran_on{};

  offload::Future<int> f;
  std::thread producer([&] {
    f = reactor.SubmitTyped([&ran_on] {
                 ran_on = std::this_thread::get_id();
                 return 9;
               })
            .value();
  });
  producer.join();

  REQUIRE(reactor.PendingCount() == 1U);
  REQUIRE_FALSE(f.IsDone());

  auto pumped = reactor.Pump();
  REQUIRE(pumped.has_value());
  REQUIRE(pumped.value() == 1U);
  REQUIRE(ran_on == owner);
  REQUIRE(f.Value() == 9);
}

TEST_CASE("reactor - Pump preserves submission order", "[reactor]") {
  offload::Reactor reactor;
  std::vector<int> order;

  std::atomic<int> accepted{0};
  std::thread producer([&] {
    for (int i = 0; i < 32; ++i) {
      if (reactor.Submit([i, &order] { order.push_back(i); }).has_value()) {
        accepted.fetch_add(1);
      }
    }
  });
  producer.join();
  REQUIRE(accepted.load() == 32);

  REQUIRE(reactor.Pump().value() == 32U);
  REQUIRE(order.size() == 32U);
  for (int i = 0; i < 32; ++i) {
    REQUIRE(order[static_cast<size_t>(i)] == i);
  }
}

TEST_CASE("reactor - tasks queued during a pump wait for the next pump", "[reactor]") {
  offload::Reactor reactor;
  std::atomic<int> second_ran{0};

  std::thread producer([&] {
    (void)reactor.Submit([&] {
      // Queue from a foreign thread while this pump is running.
      std::thread inner([&] { (void)reactor.Submit([&second_ran] { second_ran.fetch_add(1); }); });
      inner.join();
    });
  });
  producer.join();
  REQUIRE(reactor.PendingCount() == 1U);

  REQUIRE(reactor.Pump().value() == 1U);
  REQUIRE(second_ran.load() == 0);
  REQUIRE(reactor.PendingCount() == 1U);

  REQUIRE(reactor.Pump().value() == 1U);
  REQUIRE(second_ran.load() == 1);
}

TEST_CASE("reactor - Pump from a foreign thread is refused", "[reactor]") {
  offload::Reactor reactor;
  bool refused = false;
  std::thread t([&] {
    auto r = reactor.Pump();
    refused = !r.has_value() && r.get_error() == offload::ReactorError::kNotOwnerThread;
  });
  t.join();
  REQUIRE(refused);
}

TEST_CASE("reactor - Pump from inside a pumped task is refused", "[reactor]") {
  offload::Reactor reactor;
  offload::ReactorError inner_error = offload::ReactorError::kDisposed;
  bool inner_ok = true;

  std::thread producer([&] {
    (void)reactor.Submit([&] {
      auto r = reactor.Pump();
      inner_ok = r.has_value();
      if (!r.has_value()) {
        inner_error = r.get_error();
      }
    });
  });
  producer.join();
  REQUIRE(reactor.PendingCount() == 1U);

  REQUIRE(reactor.Pump().has_value());
  REQUIRE_FALSE(inner_ok);
  REQUIRE(inner_error == offload::ReactorError::kReentrantPump);
}

TEST_CASE("reactor - BindToCurrentThread moves ownership", "[reactor]") {
  offload::Reactor reactor;
  bool bound = false;
  std::thread t([&] {
    reactor.BindToCurrentThread();
    bound = reactor.IsOwnerThread();
  });
  t.join();
  REQUIRE(bound);
  REQUIRE_FALSE(reactor.IsOwnerThread());
  reactor.BindToCurrentThread();
}

TEST_CASE("reactor - failing task is contained and reported", "[reactor]") {
  offload::Reactor reactor;
  offload::Future<> bad;
  std::thread producer([&] { bad = reactor.Submit([] { throw std::runtime_error("pumped failure"); }).value(); });
  producer.join();

  auto r = reactor.Pump();
  REQUIRE(r.has_value());
  REQUIRE(bad.IsDone());
  REQUIRE_FALSE(bad.Success());
}

TEST_CASE("reactor - worker results marshalled back to the owner", "[reactor]") {
  offload::Reactor reactor;
  offload::WorkerPoolConfig cfg;
  cfg.worker_num = 2U;
  offload::WorkerPool pool(cfg);

  std::atomic<int> delivered{0};
  const std::thread::id owner = std::this_thread::get_id();
  bool all_on_owner = true;

  for (int i = 0; i < 8; ++i) {
    REQUIRE(pool.Submit([&] {
                  (void)reactor.Submit([&] {
                    all_on_owner = all_on_owner && std::this_thread::get_id() == owner;
                    delivered.fetch_add(1);
                  });
                })
                .has_value());
  }

  auto poll = pool.WaitForTasksCompletion().value();
  while (poll.Next()) {
    REQUIRE(reactor.Pump().has_value());
  }
  REQUIRE(reactor.Pump().has_value());

  REQUIRE(delivered.load() == 8);
  REQUIRE(all_on_owner);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("reactor - shutdown rejects and drops", "[reactor]") {
  offload::Reactor reactor;
  std::atomic<bool> ran{false};

  std::thread producer([&] { (void)reactor.Submit([&ran] { ran = true; }); });
  producer.join();
  REQUIRE(reactor.PendingCount() == 1U);

  reactor.Shutdown();
  REQUIRE(reactor.IsDisposed());
  REQUIRE(reactor.PendingCount() == 0U);

  auto s = reactor.Submit([] {});
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.get_error() == offload::ReactorError::kDisposed);

  auto p = reactor.Pump();
  REQUIRE_FALSE(p.has_value());
  REQUIRE(p.get_error() == offload::ReactorError::kDisposed);
  REQUIRE_FALSE(ran.load());
}
