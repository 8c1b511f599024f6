#ifndef __BTLINK_SOCKET_ENDPOINT__
#define __BTLINK_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief Where a link listens or dials.
 *
 * For RFCOMM the name is a device address ("00:11:22:33:44:55", or empty to
 * bind any local adapter) and the channel selects the service. For the
 * local pipe transport the name is a filesystem path and the channel is
 * unused.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), channel(-1) {}

  explicit SocketEndpoint(const string &_name) : name(_name), channel(-1) {}

  explicit SocketEndpoint(int _channel) : name(""), channel(_channel) {}

  SocketEndpoint(const string &_name, int _channel)
      : name(_name), channel(_channel) {}

  const string &getName() const { return name; }

  int getChannel() const { return channel; }

  const string &getServiceName() const { return serviceName; }
  void setServiceName(const string &_serviceName) {
    serviceName = _serviceName;
  }

  const string &getServiceUuid() const { return serviceUuid; }
  void setServiceUuid(const string &_serviceUuid) {
    serviceUuid = _serviceUuid;
  }

 protected:
  string name;
  int channel;
  string serviceName;
  string serviceUuid;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getChannel() >= 0) {
    return os << self.getName() << "#" << self.getChannel(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace btlink

#endif  // __BTLINK_SOCKET_ENDPOINT__
