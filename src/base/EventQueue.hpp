#ifndef __BTLINK_EVENT_QUEUE__
#define __BTLINK_EVENT_QUEUE__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief Delivers posted callbacks on a single thread, in posting order.
 *
 * All application-facing notifications from every worker thread go through
 * one EventQueue, so a listener never sees two callbacks at once and sees
 * them in the order the workers produced them.
 */
class EventQueue {
 public:
  EventQueue();
  ~EventQueue();

  /** @brief Queues @p event for delivery. Dropped after shutdown(). */
  void post(std::function<void()> event);

  /**
   * @brief Blocks until everything posted before this call was delivered.
   * @return false if the timeout elapsed first.
   */
  bool flush(std::chrono::milliseconds timeout = std::chrono::seconds(5));

  /** @brief True when called from the delivery thread. */
  bool isDeliveryThread() const;

  /**
   * @brief Delivers what is still queued, then stops the delivery thread.
   */
  void shutdown();

 protected:
  void run();

  std::mutex queueMutex;
  std::condition_variable queueCv;
  deque<std::function<void()>> events;
  int64_t postedCount;
  int64_t deliveredCount;
  bool running;
  std::thread deliveryThread;
};
}  // namespace btlink

#endif  // __BTLINK_EVENT_QUEUE__
