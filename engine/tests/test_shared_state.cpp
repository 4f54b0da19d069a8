#include <catch2/catch_test_macros.hpp>
#include <latch>
#include <thread>
#include <vector>

#include "shared_state.h"

using namespace drinkd;

TEST_CASE("slot_key_for maps names to one well-known key", "[shared_state]") {
  REQUIRE(slot_key_for("httpx") == "httpx_driver");
  REQUIRE(slot_key_for("storage") == "storage_driver");
  REQUIRE(slot_key_for("mongo") == "mongo_driver");
  REQUIRE(slot_key_for("redis") == "redis_pool");
  REQUIRE(slot_key_for("search") == "search_driver");
}

TEST_CASE("publish is write-once", "[shared_state]") {
  SharedState state;
  auto first = std::make_shared<int>(1);
  auto second = std::make_shared<int>(2);

  REQUIRE(state.load("mongo_driver") == nullptr);
  REQUIRE(state.set<int>("mongo_driver", first) == first);
  // The later publisher gets the earlier instance back
  REQUIRE(state.set<int>("mongo_driver", second) == first);
  REQUIRE(*state.get<int>("mongo_driver") == 1);
  REQUIRE(state.keys() == std::vector<std::string>{"mongo_driver"});
}

TEST_CASE("typed access checks the published type", "[shared_state]") {
  SharedState state;
  state.set<int>("httpx_driver", std::make_shared<int>(7));

  REQUIRE_THROWS_AS(state.get<double>("httpx_driver"), std::logic_error);
  REQUIRE_THROWS_AS(state.set<double>("httpx_driver",
                                      std::make_shared<double>(1.0)),
                    std::logic_error);
  REQUIRE(state.get<double>("absent") == nullptr);
}

TEST_CASE("withdraw only clears the matching instance", "[shared_state]") {
  SharedState state;
  auto published = std::make_shared<int>(1);
  auto stranger = std::make_shared<int>(1);
  state.set<int>("redis_pool", published);

  REQUIRE_FALSE(state.withdraw("redis_pool", stranger));
  REQUIRE(state.get<int>("redis_pool") == published);

  REQUIRE(state.withdraw("redis_pool", published));
  REQUIRE(state.load("redis_pool") == nullptr);
  REQUIRE(state.keys().empty());

  // A withdrawn slot can be published again
  auto next = std::make_shared<int>(3);
  REQUIRE(state.set<int>("redis_pool", next) == next);
}

TEST_CASE("concurrent publishers agree on one winner", "[shared_state]") {
  SharedState state;
  constexpr int kThreads = 8;
  std::latch start(kThreads);
  std::vector<std::shared_ptr<int>> winners(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      start.arrive_and_wait();
      winners[i] = state.set<int>("storage_driver", std::make_shared<int>(i));
    });
  }
  for (auto& t : threads) t.join();

  for (const auto& w : winners) {
    REQUIRE(w == winners[0]);
  }
}
