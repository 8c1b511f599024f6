#ifndef __BTLINK_SOCKET_HANDLER__
#define __BTLINK_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketEndpoint.hpp"

namespace btlink {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 *
 * A link never touches a raw socket API directly: RFCOMM, AF_UNIX pipes and
 * the test doubles all sit behind this interface and hand out plain file
 * descriptors.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks until the fd becomes readable or the timeout elapses.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   * @throws std::runtime_error on timeout, error or end of stream.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Serializes and writes a packet with a leading length prefix.
   */
  inline void writePacket(int fd, const Packet& packet) {
    string frame = packet.toFrame();
    if (int64_t(packet.length()) > MAX_FRAME_SIZE) {
      STFATAL << "Invalid message length: " << packet.length();
    }
    writeAllOrThrow(fd, frame.data(), frame.length(), true);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure, with
   * errno set).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   * @throws std::runtime_error if the endpoint cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Returns any fds associated with the endpoint (listening or
   * otherwise).
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The new fd, or -1 with errno set (EAGAIN when nothing is
   * pending).
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /**
   * @brief Shuts both directions of the stream down without releasing the
   * descriptor, so a thread blocked on it wakes up.
   */
  virtual void shutdown(int fd) = 0;
  /** @brief True while the descriptor is open and has no pending error. */
  virtual bool isConnected(int fd) = 0;
  /** @brief Address of the remote end, used as the connection key. */
  virtual string getPeerAddress(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace btlink

#endif  // __BTLINK_SOCKET_HANDLER__
