#ifndef __BTLINK_LINK_CLIENT__
#define __BTLINK_LINK_CLIENT__

#include "DiscoverySource.hpp"
#include "Headers.hpp"
#include "LinkSession.hpp"
#include "ReconnectSupervisor.hpp"

namespace btlink {
/**
 * @brief Scans for devices, dials them and redials the ones that drop.
 */
class LinkClient : public LinkSession {
 public:
  LinkClient(shared_ptr<LinkContext> _context,
             shared_ptr<DiscoverySource> _discovery);
  virtual ~LinkClient();

  /**
   * @brief Starts a scan that ends after @p timeoutMs (the configured scan
   * timeout when negative).
   * @return false if a scan is already running or the adapter is missing.
   */
  bool startScan(int64_t timeoutMs = -1);
  void stopScan();
  bool isScanning();
  /** @brief Devices seen by the current or last scan, one per address. */
  vector<DiscoveredDevice> discoveredDevices();

  /** @brief Dials @p address and blocks until connected or failed. */
  bool connect(const string& address);
  /** @brief Dials on the worker pool; the outcome arrives as an event. */
  void connectAsync(const string& address);
  /**
   * @brief Closes the link to @p address. Explicit disconnects are never
   * redialed.
   */
  bool disconnect(const string& address);

  shared_ptr<ReconnectSupervisor> reconnect() { return supervisor; }

 protected:
  class ReconnectEvents : public ReconnectListener {
   public:
    explicit ReconnectEvents(LinkClient* _client) : client(_client) {}
    virtual void onReconnectAttempt(const string& address, int attempt,
                                    int maxAttempts);
    virtual void onReconnectSuccess(const string& address, int attempts);
    virtual void onReconnectFailed(const string& address, int attempts);
    virtual void onReconnectAborted(const string& address,
                                    const string& reason);

   protected:
    LinkClient* client;
  };

  virtual void handleDisconnected(const string& address);
  void finishScan(int64_t generation);
  /** @brief Runs @p task on the pool, tracked so the destructor waits. */
  void runDial(std::function<void()> task);

  shared_ptr<DiscoverySource> discovery;
  shared_ptr<ReconnectEvents> reconnectEvents;
  shared_ptr<ReconnectSupervisor> supervisor;

  atomic<bool> closing;
  std::mutex clientMutex;
  std::condition_variable dialCv;
  int pendingDials;
  bool scanning;
  int64_t scanGeneration;
  TimerQueue::TimerId scanTimer;
  map<string, DiscoveredDevice> scanResults;
  set<string> explicitDisconnects;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_CLIENT__
