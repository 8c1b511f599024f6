#include "ReconnectSupervisor.hpp"
#include "TestHeaders.hpp"

using namespace btlink;

namespace {
class RecordingReconnectListener : public ReconnectListener {
 public:
  virtual void onReconnectAttempt(const string& address, int attempt,
                                  int maxAttempts) {
    lock_guard<std::mutex> guard(recordMutex);
    events.push_back("attempt:" + address + ":" + to_string(attempt) + "/" +
                     to_string(maxAttempts));
  }
  virtual void onReconnectSuccess(const string& address, int attempts) {
    lock_guard<std::mutex> guard(recordMutex);
    events.push_back("success:" + address + ":" + to_string(attempts));
  }
  virtual void onReconnectFailed(const string& address, int attempts) {
    lock_guard<std::mutex> guard(recordMutex);
    events.push_back("failed:" + address + ":" + to_string(attempts));
  }
  virtual void onReconnectAborted(const string& address,
                                  const string& reason) {
    lock_guard<std::mutex> guard(recordMutex);
    events.push_back("aborted:" + address + ":" + reason);
  }

  vector<string> snapshot() {
    lock_guard<std::mutex> guard(recordMutex);
    return events;
  }
  string last() {
    lock_guard<std::mutex> guard(recordMutex);
    return events.empty() ? "" : events.back();
  }

  std::mutex recordMutex;
  vector<string> events;
};

ReconnectConfig fastConfig() {
  ReconnectConfig config;
  config.initialDelayMs = 500;
  config.maxDelayMs = 1000;
  config.maxAttempts = 2;
  return config;
}
}  // namespace

TEST_CASE("Backoff grows by half and stops at the cap", "[Reconnect]") {
  vector<double> expected = {3000, 4500, 6750, 10125, 15187.5, 22781.25, 30000,
                             30000};
  double delay = 2000;
  for (double step : expected) {
    delay = ReconnectSupervisor::nextDelay(delay, 30000);
    REQUIRE(delay == Approx(step));
  }
}

TEST_CASE("Configuration is clamped", "[Reconnect]") {
  auto timers = make_shared<TimerQueue>();
  ReconnectConfig config;
  config.initialDelayMs = 10;
  config.maxDelayMs = 20;
  config.maxAttempts = 0;
  auto supervisor = make_shared<ReconnectSupervisor>(
      timers, [](const string&, std::function<void(bool)>) {},
      make_shared<RecordingReconnectListener>(), config);
  ReconnectConfig applied = supervisor->configuration();
  REQUIRE(applied.initialDelayMs == ReconnectConfig::MIN_INITIAL_DELAY_MS);
  REQUIRE(applied.maxDelayMs == ReconnectConfig::MIN_MAX_DELAY_MS);
  REQUIRE(applied.maxAttempts == 1);

  supervisor->setMaxAttempts(7);
  supervisor->setInitialDelay(4000);
  supervisor->setMaxDelay(60000);
  applied = supervisor->configuration();
  REQUIRE(applied.maxAttempts == 7);
  REQUIRE(applied.initialDelayMs == 4000);
  REQUIRE(applied.maxDelayMs == 60000);
  REQUIRE(supervisor->status()["maxAttempts"] == 7);
  timers->shutdown();
}

TEST_CASE("Supervised reconnects", "[Reconnect]") {
  auto timers = make_shared<TimerQueue>();
  auto listener = make_shared<RecordingReconnectListener>();
  atomic<int> dials(0);
  atomic<bool> succeed(false);
  auto supervisor = make_shared<ReconnectSupervisor>(
      timers,
      [&dials, &succeed](const string&, std::function<void(bool)> done) {
        dials++;
        done(succeed.load());
      },
      listener, fastConfig());

  SECTION("Gives up after the attempt limit") {
    REQUIRE(supervisor->startReconnect("AA", "Connection lost"));
    REQUIRE_FALSE(supervisor->startReconnect("AA", "Connection lost"));
    REQUIRE(supervisor->isReconnecting("AA"));
    REQUIRE(supervisor->status()["devices"]["AA"]["reason"] ==
            "Connection lost");
    REQUIRE(waitUntil([&] { return listener->last() == "failed:AA:2"; }));
    REQUIRE(listener->snapshot() ==
            vector<string>({"attempt:AA:1/2", "attempt:AA:2/2", "failed:AA:2"}));
    REQUIRE(dials == 2);
    REQUIRE_FALSE(supervisor->isReconnecting("AA"));
  }

  SECTION("Stops on the first successful dial") {
    succeed = true;
    REQUIRE(supervisor->startReconnect("BB", "Connection lost"));
    REQUIRE(waitUntil([&] { return listener->last() == "success:BB:1"; }));
    REQUIRE(dials == 1);
    REQUIRE(supervisor->reconnectingDevices().empty());
  }

  SECTION("Stopping aborts before the dial") {
    REQUIRE(supervisor->startReconnect("CC", "Connection lost"));
    REQUIRE(supervisor->stopReconnect("CC", "Disconnected by user"));
    REQUIRE(listener->last() == "aborted:CC:Disconnected by user");
    REQUIRE_FALSE(supervisor->stopReconnect("CC", "again"));
    std::this_thread::sleep_for(std::chrono::milliseconds(700));
    REQUIRE(dials == 0);
  }

  SECTION("Disabling aborts every task") {
    REQUIRE(supervisor->startReconnect("DD", "Connection lost"));
    REQUIRE(supervisor->startReconnect("EE", "Connection lost"));
    supervisor->setEnabled(false);
    REQUIRE_FALSE(supervisor->isEnabled());
    REQUIRE(supervisor->reconnectingDevices().empty());
    REQUIRE(listener->snapshot().size() == 2);
    REQUIRE_FALSE(supervisor->startReconnect("DD", "Connection lost"));
  }

  supervisor->stopAll("done");
  timers->shutdown();
}

TEST_CASE("A late dial result is ignored after a stop", "[Reconnect]") {
  auto timers = make_shared<TimerQueue>();
  auto listener = make_shared<RecordingReconnectListener>();
  std::mutex doneMutex;
  std::function<void(bool)> pendingDone;
  auto supervisor = make_shared<ReconnectSupervisor>(
      timers,
      [&](const string&, std::function<void(bool)> done) {
        lock_guard<std::mutex> guard(doneMutex);
        pendingDone = done;
      },
      listener, fastConfig());

  REQUIRE(supervisor->startReconnect("FF", "Connection lost"));
  REQUIRE(waitUntil([&] {
    lock_guard<std::mutex> guard(doneMutex);
    return bool(pendingDone);
  }));
  REQUIRE(supervisor->stopReconnect("FF", "Disconnected by user"));
  {
    lock_guard<std::mutex> guard(doneMutex);
    pendingDone(true);
  }
  REQUIRE(listener->last() == "aborted:FF:Disconnected by user");
  timers->shutdown();
}
