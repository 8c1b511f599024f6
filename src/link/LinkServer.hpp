#ifndef __BTLINK_LINK_SERVER__
#define __BTLINK_LINK_SERVER__

#include "Headers.hpp"
#include "LinkSession.hpp"
#include "SocketEndpoint.hpp"

namespace btlink {
/**
 * @brief Advertises the service, accepts clients and hands each one to the
 * connection registry.
 */
class LinkServer : public LinkSession {
 public:
  explicit LinkServer(shared_ptr<LinkContext> _context);
  virtual ~LinkServer();

  /** @brief Starts with the configured service name and uuid. */
  bool start();
  /**
   * @brief Opens the listening socket and starts accepting.
   * @return false if the adapter is unavailable or listening failed; both
   * are also reported through onError. Starting a running server is a
   * no-op that returns true.
   */
  bool start(const string& serviceName, const string& serviceUuid);
  /**
   * @brief Stops accepting new clients. Connected clients stay connected
   * until they leave or the server is destroyed.
   */
  void stop();
  bool isRunning() const { return running; }
  bool disconnectClient(const string& address);
  const SocketEndpoint& getEndpoint() const { return endpoint; }

 protected:
  void acceptLoop();

  std::mutex serverMutex;
  atomic<bool> running;
  SocketEndpoint endpoint;
  unique_ptr<std::thread> acceptThread;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_SERVER__
