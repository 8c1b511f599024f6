#ifndef __BTLINK_CONNECTION_REGISTRY__
#define __BTLINK_CONNECTION_REGISTRY__

#include "Headers.hpp"
#include "LinkConnection.hpp"
#include "SocketHandler.hpp"
#include "TimerQueue.hpp"

namespace btlink {
/**
 * @brief Owns every live connection, keyed by device address.
 *
 * Each connection's read loop runs on a thread of its own and its heartbeat
 * on the shared timer queue. At most one connection exists per address:
 * adding an address that is already present tears the old connection down,
 * including its disconnected notification, before the new one is visible.
 */
class ConnectionRegistry {
 public:
  ConnectionRegistry(shared_ptr<SocketHandler> _socketHandler,
                     shared_ptr<TimerQueue> _timerQueue,
                     const ConnectionOptions& _options);
  ~ConnectionRegistry();

  /**
   * @brief Takes ownership of @p socketFd and starts its read loop.
   */
  void add(const string& address, int socketFd,
           shared_ptr<ConnectionListener> listener);
  /** @return whether a connection existed for @p address. */
  bool remove(const string& address);

  /**
   * @brief Sends one frame.
   * @return false if there is no connected entry, or the write failed (the
   * connection's listener gets onError in that case).
   */
  bool send(const string& address, const Packet& packet);
  bool sendData(const string& address, const string& bytes);
  bool sendCommand(const string& address, const string& command);

  bool isConnected(const string& address);
  bool pauseReading(const string& address);
  bool resumeReading(const string& address);
  optional<ConnectionStats> stats(const string& address);
  vector<string> connectedDevices();
  size_t size();

  /**
   * @brief Leases the raw stream of a connection, see StreamLease.
   * @return null if there is no connection or the stream stayed busy for
   * @p timeout.
   */
  unique_ptr<StreamLease> acquireStream(const string& address,
                                        std::chrono::milliseconds timeout);

  /**
   * @brief Closes every connection and waits for their read loops to
   * finish.
   */
  void shutdown();

  const ConnectionOptions& getOptions() const { return options; }

 protected:
  shared_ptr<LinkConnection> find(const string& address);
  void onTeardown(LinkConnection* connection);
  /**
   * @brief Whether a read loop for @p address is still tearing down.
   * Caller holds the lock.
   */
  bool isClosing(const string& address);
  /** @brief Takes the threads of finished read loops. Caller holds the lock. */
  vector<unique_ptr<std::thread>> takeFinishedLoops();
  static void joinLoops(vector<unique_ptr<std::thread>>* loops);

  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<TimerQueue> timerQueue;
  ConnectionOptions options;

  std::mutex registryMutex;
  std::condition_variable registryCv;
  map<string, shared_ptr<LinkConnection>> connections;
  /** @brief Read loop threads that have not been joined yet. */
  map<shared_ptr<LinkConnection>, unique_ptr<std::thread>> readLoops;
};
}  // namespace btlink

#endif  // __BTLINK_CONNECTION_REGISTRY__
