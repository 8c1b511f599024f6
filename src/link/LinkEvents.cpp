#include "LinkEvents.hpp"

namespace btlink {
Subscription::Subscription(Subscription&& other)
    : registry(std::move(other.registry)), id(other.id) {
  other.id = -1;
}

Subscription& Subscription::operator=(Subscription&& other) {
  if (this != &other) {
    cancel();
    registry = std::move(other.registry);
    id = other.id;
    other.id = -1;
  }
  return *this;
}

void Subscription::cancel() {
  if (id < 0) {
    return;
  }
  auto r = registry.lock();
  if (r) {
    lock_guard<std::mutex> guard(r->registryMutex);
    r->listeners.erase(id);
  }
  id = -1;
}

bool Subscription::isActive() const {
  if (id < 0) {
    return false;
  }
  auto r = registry.lock();
  if (!r) {
    return false;
  }
  lock_guard<std::mutex> guard(r->registryMutex);
  return r->listeners.count(id) > 0;
}

LinkEventHub::LinkEventHub(shared_ptr<EventQueue> _eventQueue)
    : eventQueue(_eventQueue), registry(make_shared<Subscription::Registry>()) {}

Subscription LinkEventHub::subscribe(shared_ptr<LinkEventListener> listener) {
  lock_guard<std::mutex> guard(registry->registryMutex);
  int64_t id = registry->nextId++;
  registry->listeners[id] = listener;
  return Subscription(registry, id);
}

size_t LinkEventHub::listenerCount() {
  lock_guard<std::mutex> guard(registry->registryMutex);
  return registry->listeners.size();
}

void LinkEventHub::emit(std::function<void(LinkEventListener*)> call) {
  auto r = registry;
  eventQueue->post([r, call] {
    vector<shared_ptr<LinkEventListener>> snapshot;
    {
      lock_guard<std::mutex> guard(r->registryMutex);
      for (const auto& it : r->listeners) {
        snapshot.push_back(it.second);
      }
    }
    for (const auto& listener : snapshot) {
      call(listener.get());
    }
  });
}
}  // namespace btlink
