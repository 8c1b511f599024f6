#include "EventQueue.hpp"
#include "TestHeaders.hpp"
#include "TimerQueue.hpp"

using namespace btlink;

TEST_CASE("Timers fire in deadline order", "[TimerQueue]") {
  TimerQueue timers;
  std::mutex orderMutex;
  vector<int> order;
  auto record = [&](int n) {
    lock_guard<std::mutex> guard(orderMutex);
    order.push_back(n);
  };
  timers.schedule(std::chrono::milliseconds(150), [&] { record(3); });
  timers.schedule(std::chrono::milliseconds(50), [&] { record(1); });
  timers.schedule(std::chrono::milliseconds(100), [&] { record(2); });
  REQUIRE(waitUntil([&] {
    lock_guard<std::mutex> guard(orderMutex);
    return order.size() == 3;
  }));
  REQUIRE(order == vector<int>({1, 2, 3}));
  REQUIRE(timers.size() == 0);
}

TEST_CASE("Cancelled and periodic timers", "[TimerQueue]") {
  TimerQueue timers;
  atomic<int> fired(0);
  atomic<int> ticks(0);
  auto id = timers.schedule(std::chrono::milliseconds(100), [&] { fired++; });
  REQUIRE(timers.cancel(id));
  REQUIRE_FALSE(timers.cancel(id));

  auto periodic =
      timers.schedulePeriodic(std::chrono::milliseconds(20), [&] { ticks++; });
  REQUIRE(waitUntil([&] { return ticks >= 3; }));
  timers.cancel(periodic);
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  REQUIRE(fired == 0);

  timers.shutdown();
  timers.shutdown();
}

TEST_CASE("Events are delivered in order on one thread", "[EventQueue]") {
  EventQueue queue;
  vector<int> delivered;
  set<std::thread::id> threads;
  for (int i = 0; i < 100; i++) {
    queue.post([&, i] {
      delivered.push_back(i);
      threads.insert(std::this_thread::get_id());
    });
  }
  REQUIRE(queue.flush());
  REQUIRE(delivered.size() == 100);
  REQUIRE(std::is_sorted(delivered.begin(), delivered.end()));
  REQUIRE(threads.size() == 1);
  REQUIRE(threads.count(std::this_thread::get_id()) == 0);
  REQUIRE_FALSE(queue.isDeliveryThread());

  queue.shutdown();
  queue.post([&] { delivered.push_back(-1); });
  REQUIRE(delivered.size() == 100);
}
