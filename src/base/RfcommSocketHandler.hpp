#ifndef __BTLINK_RFCOMM_SOCKET_HANDLER__
#define __BTLINK_RFCOMM_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace btlink {
/**
 * @brief Bluetooth classic RFCOMM transport on top of BlueZ sockets.
 *
 * Endpoint names are device addresses in "XX:XX:XX:XX:XX:XX" form and the
 * endpoint channel is the RFCOMM channel. An empty name binds every local
 * adapter when listening.
 */
class RfcommSocketHandler : public UnixSocketHandler {
 public:
  explicit RfcommSocketHandler(int64_t _connectTimeoutMs = 10000);
  virtual ~RfcommSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);
  /** @brief Bluetooth address of the remote device. */
  virtual string getPeerAddress(int fd);

  /**
   * @brief Checks that a local adapter exists and that this process may open
   * RFCOMM sockets.
   * @param reason Filled with a human readable cause when false is returned.
   */
  static bool adapterAvailable(string* reason);

  /** @brief True if the string parses as a Bluetooth device address. */
  static bool isValidAddress(const string& address);

 protected:
  int64_t connectTimeoutMs;
  /** @brief Listening sockets keyed by RFCOMM channel. */
  map<int, set<int>> channelServerSockets;
};
}  // namespace btlink

#endif  // __BTLINK_RFCOMM_SOCKET_HANDLER__
