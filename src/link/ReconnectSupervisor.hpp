#ifndef __BTLINK_RECONNECT_SUPERVISOR__
#define __BTLINK_RECONNECT_SUPERVISOR__

#include "Headers.hpp"
#include "TimerQueue.hpp"

namespace btlink {
class ReconnectListener {
 public:
  virtual ~ReconnectListener() {}
  virtual void onReconnectAttempt(const string& address, int attempt,
                                  int maxAttempts) = 0;
  virtual void onReconnectSuccess(const string& address, int attempts) = 0;
  virtual void onReconnectFailed(const string& address, int attempts) = 0;
  virtual void onReconnectAborted(const string& address,
                                  const string& reason) = 0;
};

struct ReconnectConfig {
  static constexpr int64_t MIN_INITIAL_DELAY_MS = 500;
  static constexpr int64_t MIN_MAX_DELAY_MS = 1000;

  bool enabled = true;
  int maxAttempts = 5;
  int64_t initialDelayMs = 2000;
  int64_t maxDelayMs = 30000;

  json toJson() const;
};

/**
 * @brief Dials @p address and reports the outcome through the callback,
 * exactly once. It is called on the timer thread, so it must hand the
 * actual connect to another thread instead of blocking.
 */
typedef std::function<void(const string& address,
                           std::function<void(bool)> done)>
    Dialer;

/**
 * @brief Redials lost devices with exponential backoff.
 *
 * Per address: Idle -> Scheduled -> Attempting -> Success | Scheduled with
 * a longer delay | Exhausted, or Aborted from any of those by
 * stopReconnect(). There is at most one task per address.
 */
class ReconnectSupervisor
    : public std::enable_shared_from_this<ReconnectSupervisor> {
 public:
  ReconnectSupervisor(shared_ptr<TimerQueue> _timerQueue, Dialer _dialer,
                      shared_ptr<ReconnectListener> _listener,
                      const ReconnectConfig& _config);
  ~ReconnectSupervisor();

  /**
   * @brief Schedules the first attempt after the initial delay.
   * @return false if supervision is disabled or @p address already has a
   * task.
   */
  bool startReconnect(const string& address, const string& reason);
  /**
   * @brief Cancels the task for @p address. A dial that is in flight is
   * allowed to finish but its result is ignored.
   * @return false if there was no task.
   */
  bool stopReconnect(const string& address, const string& reason);
  void stopAll(const string& reason);

  /** @brief Disabling aborts every task. */
  void setEnabled(bool enabled);
  void setMaxAttempts(int maxAttempts);
  void setInitialDelay(int64_t delayMs);
  void setMaxDelay(int64_t delayMs);

  bool isEnabled();
  bool isReconnecting(const string& address);
  vector<string> reconnectingDevices();
  /** @brief Per address attempt counts and next delays. */
  json status();
  ReconnectConfig configuration();

  /** @brief The delay that follows @p delayMs. */
  static double nextDelay(double delayMs, int64_t maxDelayMs);

 protected:
  struct Task {
    string reason;
    int attempts = 0;
    double delayMs = 0;
    TimerQueue::TimerId timer = -1;
    bool dialing = false;
    int64_t serial = 0;
    int64_t startedAt = 0;
  };

  void scheduleAttempt(const string& address, Task* task);
  void attempt(const string& address, int64_t serial);
  void onDialResult(const string& address, int64_t serial, bool success);

  shared_ptr<TimerQueue> timerQueue;
  Dialer dialer;
  shared_ptr<ReconnectListener> listener;

  std::mutex supervisorMutex;
  ReconnectConfig config;
  map<string, Task> tasks;
  int64_t nextSerial;
};
}  // namespace btlink

#endif  // __BTLINK_RECONNECT_SUPERVISOR__
