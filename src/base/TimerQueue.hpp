#ifndef __BTLINK_TIMER_QUEUE__
#define __BTLINK_TIMER_QUEUE__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief Runs one-shot and periodic callbacks on a dedicated thread.
 *
 * Drives connection heartbeats and reconnect backoff delays. Callbacks run
 * on the timer thread, one at a time, so they must be short; anything that
 * blocks should be handed to a worker pool.
 */
class TimerQueue {
 public:
  typedef int64_t TimerId;

  TimerQueue();
  ~TimerQueue();

  /**
   * @brief Runs @p fn once after @p delay.
   * @return Id that can be passed to cancel().
   */
  TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn);

  /**
   * @brief Runs @p fn every @p period, the first time one period from now.
   */
  TimerId schedulePeriodic(std::chrono::milliseconds period,
                           std::function<void()> fn);

  /**
   * @brief Removes a pending timer.
   * @return false if the id is unknown, already fired (one-shot) or
   * currently executing.
   */
  bool cancel(TimerId id);

  /** @brief Number of timers waiting to fire. */
  size_t size();

  /** @brief Drops all timers and joins the timer thread. Idempotent. */
  void shutdown();

 protected:
  struct Entry {
    std::chrono::steady_clock::time_point deadline;
    std::chrono::milliseconds period;
    std::function<void()> fn;
  };

  void run();
  TimerId add(std::chrono::milliseconds delay, std::chrono::milliseconds period,
              std::function<void()> fn);

  std::mutex timerMutex;
  std::condition_variable timerCv;
  map<TimerId, Entry> timers;
  /** @brief Deadline ordered index into timers. */
  multimap<std::chrono::steady_clock::time_point, TimerId> deadlines;
  TimerId nextId;
  bool running;
  std::thread timerThread;
};
}  // namespace btlink

#endif  // __BTLINK_TIMER_QUEUE__
