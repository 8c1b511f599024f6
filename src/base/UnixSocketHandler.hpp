#ifndef __BTLINK_UNIX_SOCKET_HANDLER__
#define __BTLINK_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace btlink {
/**
 * @brief SocketHandler base for every POSIX socket family (AF_UNIX and
 * AF_BLUETOOTH), with a mutex guarding each descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /** @brief select() on a single descriptor. */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  /**
   * @brief Writes everything under the descriptor's mutex without raising
   * SIGPIPE. Gives up with -1 after about 5 seconds of a full send buffer.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Forgets the descriptor and closes it. Closing twice is fatal. */
  virtual void close(int fd);
  virtual void shutdown(int fd);
  virtual bool isConnected(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /** @brief Starts tracking @p fd. */
  void addToActiveSockets(int fd);
  /**
   * @brief Returns the mutex for a tracked fd, or null if it was closed.
   */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /** @brief Switches @p fd to non-blocking mode. */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);
  /**
   * @brief Waits for a non-blocking connect() to finish.
   * @return true if the socket connected before the timeout.
   */
  bool waitForConnect(int sockFd, int64_t timeoutMs);

  /** @brief Open descriptors and the mutex serializing each one's I/O. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Sockets that were shut down locally but not closed yet. */
  set<int> shutdownSockets;
  recursive_mutex globalMutex;
};
}  // namespace btlink

#endif  // __BTLINK_UNIX_SOCKET_HANDLER__
