#ifndef __BTLINK_PIPE_SOCKET_HANDLER__
#define __BTLINK_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace btlink {
/**
 * @brief Carries links over AF_UNIX stream sockets instead of RFCOMM.
 *
 * Endpoint names are socket paths. Useful for running a server and a client
 * on the same machine and for the integration tests.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  explicit PipeSocketHandler(int64_t _connectTimeoutMs = 3000);
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a pipe identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket and stores it internally.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified pipe, closes its fd and removes
   * the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);
  /**
   * @brief Unix peers have no address of their own, so accepted sockets are
   * named after the listening path and the descriptor.
   */
  virtual string getPeerAddress(int fd);
  virtual int accept(int fd);
  virtual void close(int fd);

 protected:
  int64_t connectTimeoutMs;
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
  /** @brief Listening path each accepted or dialed fd belongs to. */
  map<int, string> socketPaths;
};
}  // namespace btlink

#endif  // __BTLINK_PIPE_SOCKET_HANDLER__
