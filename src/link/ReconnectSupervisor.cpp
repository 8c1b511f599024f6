#include "ReconnectSupervisor.hpp"

namespace btlink {
namespace {
const double BACKOFF_MULTIPLIER = 1.5;
}

json ReconnectConfig::toJson() const {
  json j;
  j["enabled"] = enabled;
  j["maxAttempts"] = maxAttempts;
  j["initialDelay"] = initialDelayMs;
  j["maxDelay"] = maxDelayMs;
  return j;
}

ReconnectSupervisor::ReconnectSupervisor(
    shared_ptr<TimerQueue> _timerQueue, Dialer _dialer,
    shared_ptr<ReconnectListener> _listener, const ReconnectConfig& _config)
    : timerQueue(_timerQueue),
      dialer(_dialer),
      listener(_listener),
      nextSerial(1) {
  config.enabled = _config.enabled;
  setMaxAttempts(_config.maxAttempts);
  setInitialDelay(_config.initialDelayMs);
  setMaxDelay(_config.maxDelayMs);
}

ReconnectSupervisor::~ReconnectSupervisor() {
  lock_guard<std::mutex> guard(supervisorMutex);
  for (auto& it : tasks) {
    timerQueue->cancel(it.second.timer);
  }
  tasks.clear();
}

double ReconnectSupervisor::nextDelay(double delayMs, int64_t maxDelayMs) {
  return std::min(delayMs * BACKOFF_MULTIPLIER, double(maxDelayMs));
}

bool ReconnectSupervisor::startReconnect(const string& address,
                                         const string& reason) {
  lock_guard<std::mutex> guard(supervisorMutex);
  if (!config.enabled) {
    VLOG(1) << "Auto-reconnect disabled, not reconnecting " << address;
    return false;
  }
  if (tasks.count(address)) {
    VLOG(1) << "Already reconnecting " << address;
    return false;
  }
  LOG(INFO) << "Reconnecting " << address << " (" << reason << ")";
  Task& task = tasks[address];
  task.reason = reason;
  task.delayMs = double(config.initialDelayMs);
  task.serial = nextSerial++;
  task.startedAt = nowEpochMs();
  scheduleAttempt(address, &task);
  return true;
}

void ReconnectSupervisor::scheduleAttempt(const string& address, Task* task) {
  weak_ptr<ReconnectSupervisor> weakSelf = shared_from_this();
  int64_t serial = task->serial;
  auto delay = std::chrono::milliseconds(int64_t(task->delayMs));
  VLOG(1) << "Next attempt for " << address << " in " << delay.count()
          << " ms";
  task->dialing = false;
  task->timer = timerQueue->schedule(delay, [weakSelf, address, serial] {
    auto self = weakSelf.lock();
    if (self) {
      self->attempt(address, serial);
    }
  });
}

void ReconnectSupervisor::attempt(const string& address, int64_t serial) {
  int attemptNumber;
  int maxAttempts;
  {
    lock_guard<std::mutex> guard(supervisorMutex);
    auto it = tasks.find(address);
    if (it == tasks.end() || it->second.serial != serial) {
      return;
    }
    it->second.attempts++;
    it->second.dialing = true;
    it->second.timer = -1;
    attemptNumber = it->second.attempts;
    maxAttempts = config.maxAttempts;
  }
  LOG(INFO) << "Reconnect attempt " << attemptNumber << "/" << maxAttempts
            << " for " << address;
  listener->onReconnectAttempt(address, attemptNumber, maxAttempts);

  weak_ptr<ReconnectSupervisor> weakSelf = shared_from_this();
  dialer(address, [weakSelf, address, serial](bool success) {
    auto self = weakSelf.lock();
    if (self) {
      self->onDialResult(address, serial, success);
    }
  });
}

void ReconnectSupervisor::onDialResult(const string& address, int64_t serial,
                                       bool success) {
  int attempts;
  bool exhausted = false;
  {
    lock_guard<std::mutex> guard(supervisorMutex);
    auto it = tasks.find(address);
    if (it == tasks.end() || it->second.serial != serial) {
      VLOG(1) << "Discarding dial result for " << address;
      return;
    }
    Task& task = it->second;
    attempts = task.attempts;
    if (!success) {
      if (attempts >= config.maxAttempts) {
        exhausted = true;
      } else {
        task.delayMs = nextDelay(task.delayMs, config.maxDelayMs);
        scheduleAttempt(address, &task);
        return;
      }
    }
    tasks.erase(it);
  }
  if (success) {
    LOG(INFO) << "Reconnected " << address << " after " << attempts
              << " attempts";
    listener->onReconnectSuccess(address, attempts);
  } else if (exhausted) {
    LOG(WARNING) << "Giving up on " << address << " after " << attempts
                 << " attempts";
    listener->onReconnectFailed(address, attempts);
  }
}

bool ReconnectSupervisor::stopReconnect(const string& address,
                                        const string& reason) {
  {
    lock_guard<std::mutex> guard(supervisorMutex);
    auto it = tasks.find(address);
    if (it == tasks.end()) {
      return false;
    }
    if (it->second.timer >= 0) {
      timerQueue->cancel(it->second.timer);
    }
    tasks.erase(it);
  }
  LOG(INFO) << "Stopped reconnecting " << address << ": " << reason;
  listener->onReconnectAborted(address, reason);
  return true;
}

void ReconnectSupervisor::stopAll(const string& reason) {
  for (const auto& address : reconnectingDevices()) {
    stopReconnect(address, reason);
  }
}

void ReconnectSupervisor::setEnabled(bool enabled) {
  {
    lock_guard<std::mutex> guard(supervisorMutex);
    config.enabled = enabled;
  }
  if (!enabled) {
    stopAll("Auto-reconnect disabled");
  }
}

void ReconnectSupervisor::setMaxAttempts(int maxAttempts) {
  lock_guard<std::mutex> guard(supervisorMutex);
  config.maxAttempts = std::max(1, maxAttempts);
}

void ReconnectSupervisor::setInitialDelay(int64_t delayMs) {
  lock_guard<std::mutex> guard(supervisorMutex);
  config.initialDelayMs =
      std::max(ReconnectConfig::MIN_INITIAL_DELAY_MS, delayMs);
}

void ReconnectSupervisor::setMaxDelay(int64_t delayMs) {
  lock_guard<std::mutex> guard(supervisorMutex);
  config.maxDelayMs = std::max(ReconnectConfig::MIN_MAX_DELAY_MS, delayMs);
}

bool ReconnectSupervisor::isEnabled() {
  lock_guard<std::mutex> guard(supervisorMutex);
  return config.enabled;
}

bool ReconnectSupervisor::isReconnecting(const string& address) {
  lock_guard<std::mutex> guard(supervisorMutex);
  return tasks.count(address) > 0;
}

vector<string> ReconnectSupervisor::reconnectingDevices() {
  lock_guard<std::mutex> guard(supervisorMutex);
  vector<string> addresses;
  for (const auto& it : tasks) {
    addresses.push_back(it.first);
  }
  return addresses;
}

json ReconnectSupervisor::status() {
  lock_guard<std::mutex> guard(supervisorMutex);
  json j = config.toJson();
  j["devices"] = json::object();
  for (const auto& it : tasks) {
    json device;
    device["attempts"] = it.second.attempts;
    device["delay"] = int64_t(it.second.delayMs);
    device["dialing"] = it.second.dialing;
    device["reason"] = it.second.reason;
    device["startedAt"] = it.second.startedAt;
    j["devices"][it.first] = device;
  }
  return j;
}

ReconnectConfig ReconnectSupervisor::configuration() {
  lock_guard<std::mutex> guard(supervisorMutex);
  return config;
}
}  // namespace btlink
