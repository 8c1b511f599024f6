#include "EventQueue.hpp"

namespace btlink {
EventQueue::EventQueue() : postedCount(0), deliveredCount(0), running(true) {
  deliveryThread = std::thread(&EventQueue::run, this);
}

EventQueue::~EventQueue() { shutdown(); }

void EventQueue::post(std::function<void()> event) {
  lock_guard<std::mutex> guard(queueMutex);
  if (!running) {
    VLOG(1) << "Dropping event posted after shutdown";
    return;
  }
  events.push_back(std::move(event));
  postedCount++;
  queueCv.notify_all();
}

bool EventQueue::flush(std::chrono::milliseconds timeout) {
  if (isDeliveryThread()) {
    // Waiting on ourselves would never finish.
    return false;
  }
  std::unique_lock<std::mutex> lock(queueMutex);
  int64_t target = postedCount;
  return queueCv.wait_for(lock, timeout, [this, target] {
    return deliveredCount >= target || !running;
  });
}

bool EventQueue::isDeliveryThread() const {
  return deliveryThread.get_id() == std::this_thread::get_id();
}

void EventQueue::shutdown() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (!running) {
      return;
    }
    running = false;
    queueCv.notify_all();
  }
  if (deliveryThread.joinable()) {
    if (isDeliveryThread()) {
      deliveryThread.detach();
    } else {
      deliveryThread.join();
    }
  }
}

void EventQueue::run() {
  el::Helpers::setThreadName("events");
  std::unique_lock<std::mutex> lock(queueMutex);
  while (true) {
    queueCv.wait(lock, [this] { return !events.empty() || !running; });
    if (events.empty()) {
      // Not running and fully drained
      break;
    }
    std::function<void()> event = std::move(events.front());
    events.pop_front();
    lock.unlock();
    try {
      event();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Event listener threw: " << e.what();
    }
    lock.lock();
    deliveredCount++;
    queueCv.notify_all();
  }
}
}  // namespace btlink
