#include "TimerQueue.hpp"

namespace btlink {
TimerQueue::TimerQueue() : nextId(1), running(true) {
  timerThread = std::thread(&TimerQueue::run, this);
}

TimerQueue::~TimerQueue() { shutdown(); }

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay,
                                         std::function<void()> fn) {
  return add(delay, std::chrono::milliseconds(0), fn);
}

TimerQueue::TimerId TimerQueue::schedulePeriodic(
    std::chrono::milliseconds period, std::function<void()> fn) {
  if (period.count() <= 0) {
    throw std::invalid_argument("Timer period must be positive");
  }
  return add(period, period, fn);
}

TimerQueue::TimerId TimerQueue::add(std::chrono::milliseconds delay,
                                    std::chrono::milliseconds period,
                                    std::function<void()> fn) {
  lock_guard<std::mutex> guard(timerMutex);
  if (!running) {
    LOG(WARNING) << "Tried to schedule a timer after shutdown";
    return -1;
  }
  TimerId id = nextId++;
  Entry entry;
  entry.deadline = std::chrono::steady_clock::now() + delay;
  entry.period = period;
  entry.fn = fn;
  deadlines.insert(make_pair(entry.deadline, id));
  timers[id] = entry;
  timerCv.notify_one();
  return id;
}

bool TimerQueue::cancel(TimerId id) {
  lock_guard<std::mutex> guard(timerMutex);
  auto it = timers.find(id);
  if (it == timers.end()) {
    return false;
  }
  auto range = deadlines.equal_range(it->second.deadline);
  for (auto dit = range.first; dit != range.second; ++dit) {
    if (dit->second == id) {
      deadlines.erase(dit);
      break;
    }
  }
  timers.erase(it);
  return true;
}

size_t TimerQueue::size() {
  lock_guard<std::mutex> guard(timerMutex);
  return timers.size();
}

void TimerQueue::shutdown() {
  {
    lock_guard<std::mutex> guard(timerMutex);
    if (!running) {
      return;
    }
    running = false;
    timers.clear();
    deadlines.clear();
    timerCv.notify_all();
  }
  if (timerThread.joinable()) {
    if (timerThread.get_id() == std::this_thread::get_id()) {
      // Shut down from inside a callback, the loop exits on its own.
      timerThread.detach();
    } else {
      timerThread.join();
    }
  }
}

void TimerQueue::run() {
  el::Helpers::setThreadName("timer");
  std::unique_lock<std::mutex> lock(timerMutex);
  while (running) {
    if (deadlines.empty()) {
      timerCv.wait(lock);
      continue;
    }
    auto first = deadlines.begin();
    auto now = std::chrono::steady_clock::now();
    if (first->first > now) {
      timerCv.wait_until(lock, first->first);
      continue;
    }
    TimerId id = first->second;
    deadlines.erase(first);
    auto it = timers.find(id);
    if (it == timers.end()) {
      continue;
    }
    std::function<void()> fn = it->second.fn;
    if (it->second.period.count() > 0) {
      // Reschedule before running so cancel() from inside fn works.
      it->second.deadline = now + it->second.period;
      deadlines.insert(make_pair(it->second.deadline, id));
    } else {
      timers.erase(it);
    }

    lock.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Timer " << id << " threw: " << e.what();
    }
    lock.lock();
  }
}
}  // namespace btlink
