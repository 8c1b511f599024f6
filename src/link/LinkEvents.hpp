#ifndef __BTLINK_LINK_EVENTS__
#define __BTLINK_LINK_EVENTS__

#include "DiscoverySource.hpp"
#include "EventQueue.hpp"
#include "Headers.hpp"
#include "Message.hpp"
#include "TransferEngine.hpp"

namespace btlink {
/**
 * @brief Application facing notifications. Override what you need; every
 * call arrives on the event delivery thread, in the order it was produced.
 */
class LinkEventListener {
 public:
  virtual ~LinkEventListener() {}

  virtual void onConnectionEstablished(const string& address) {}
  virtual void onConnectionLost(const string& address) {}
  virtual void onConnectionFailed(const string& address, const string& error) {
  }
  /** @brief The sender address is in metadata["senderAddress"]. */
  virtual void onMessageReceived(const Message& message) {}
  virtual void onDataReceived(const string& address, const string& data) {}
  virtual void onCommandReceived(const string& address,
                                 const string& command) {}
  virtual void onDeviceInfo(const string& address, const DeviceInfo& info) {}

  virtual void onDeviceDiscovered(const DiscoveredDevice& device) {}
  virtual void onScanFinished(int devicesFound) {}
  virtual void onServerStateChanged(bool running) {}

  virtual void onTransferProgress(const TransferProgress& progress) {}
  virtual void onTransferCompleted(const string& transferId,
                                   const string& path) {}
  virtual void onTransferFailed(const string& transferId,
                                const string& reason) {}
  virtual void onTransferCancelled(const string& transferId) {}

  virtual void onReconnectAttempt(const string& address, int attempt,
                                  int maxAttempts) {}
  virtual void onReconnectSuccess(const string& address, int attempts) {}
  virtual void onReconnectFailed(const string& address, int attempts) {}
  virtual void onReconnectAborted(const string& address,
                                  const string& reason) {}

  virtual void onError(const string& message) {}
};

class LinkEventHub;

/**
 * @brief Keeps a listener subscribed for as long as it lives. Move only;
 * safe to outlive the hub.
 */
class Subscription {
 public:
  Subscription() : id(-1) {}
  Subscription(Subscription&& other);
  Subscription& operator=(Subscription&& other);
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  ~Subscription() { cancel(); }

  void cancel();
  bool isActive() const;

 protected:
  friend class LinkEventHub;
  struct Registry {
    std::mutex registryMutex;
    map<int64_t, shared_ptr<LinkEventListener>> listeners;
    int64_t nextId = 1;
  };
  Subscription(weak_ptr<Registry> _registry, int64_t _id)
      : registry(_registry), id(_id) {}

  weak_ptr<Registry> registry;
  int64_t id;
};

/**
 * @brief Fans events out to subscribed listeners through an EventQueue.
 */
class LinkEventHub {
 public:
  explicit LinkEventHub(shared_ptr<EventQueue> _eventQueue);

  Subscription subscribe(shared_ptr<LinkEventListener> listener);
  size_t listenerCount();

  /** @brief Queues @p call for every listener subscribed at delivery. */
  void emit(std::function<void(LinkEventListener*)> call);

  shared_ptr<EventQueue> getEventQueue() { return eventQueue; }

 protected:
  shared_ptr<EventQueue> eventQueue;
  shared_ptr<Subscription::Registry> registry;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_EVENTS__
