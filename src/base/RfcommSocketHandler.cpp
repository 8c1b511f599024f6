#include "RfcommSocketHandler.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <bluetooth/rfcomm.h>

namespace btlink {
RfcommSocketHandler::RfcommSocketHandler(int64_t _connectTimeoutMs)
    : connectTimeoutMs(_connectTimeoutMs) {}

bool RfcommSocketHandler::isValidAddress(const string& address) {
  return bachk(address.c_str()) == 0;
}

int RfcommSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  if (!isValidAddress(endpoint.getName())) {
    LOG(WARNING) << "Invalid bluetooth address: " << endpoint.getName();
    SetErrno(EINVAL);
    return -1;
  }
  int channel =
      endpoint.getChannel() > 0 ? endpoint.getChannel() : DEFAULT_RFCOMM_CHANNEL;

  int sockFd = ::socket(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
  if (sockFd == -1) {
    auto localErrno = GetErrno();
    LOG(WARNING) << "Could not create RFCOMM socket: " << strerror(localErrno);
    SetErrno(localErrno);
    return -1;
  }
  initSocket(sockFd);

  sockaddr_rc remote;
  memset(&remote, 0, sizeof(remote));
  remote.rc_family = AF_BLUETOOTH;
  remote.rc_channel = uint8_t(channel);
  str2ba(endpoint.getName().c_str(), &remote.rc_bdaddr);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result = ::connect(sockFd, (struct sockaddr*)&remote, sizeof(remote));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }
  if (result < 0 && !waitForConnect(sockFd, connectTimeoutMs)) {
    localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno << " "
              << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> RfcommSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int channel =
      endpoint.getChannel() > 0 ? endpoint.getChannel() : DEFAULT_RFCOMM_CHANNEL;
  if (channelServerSockets.find(channel) != channelServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same channel");
  }

  int fd = ::socket(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
  if (fd == -1) {
    throw runtime_error(string("Could not create RFCOMM socket: ") +
                        strerror(GetErrno()));
  }
  initServerSocket(fd);

  sockaddr_rc local;
  memset(&local, 0, sizeof(local));
  local.rc_family = AF_BLUETOOTH;
  local.rc_channel = uint8_t(channel);
  if (!endpoint.getName().empty()) {
    str2ba(endpoint.getName().c_str(), &local.rc_bdaddr);
  }
  // An all-zero rc_bdaddr binds every local adapter

  if (::bind(fd, (struct sockaddr*)&local, sizeof(local)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to bind RFCOMM channel " + to_string(channel) +
                        ": " + strerror(localErrno));
  }
  if (::listen(fd, 5) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to listen on RFCOMM channel " +
                        to_string(channel) + ": " + strerror(localErrno));
  }
  // TODO: publish the service name and uuid with sdp_record_register so
  // clients can resolve the channel through SDP instead of configuration.
  LOG(INFO) << "Listening for " << endpoint.getServiceName() << " ("
            << endpoint.getServiceUuid() << ") on RFCOMM channel " << channel;

  channelServerSockets[channel] = set<int>({fd});
  return channelServerSockets[channel];
}

set<int> RfcommSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int channel =
      endpoint.getChannel() > 0 ? endpoint.getChannel() : DEFAULT_RFCOMM_CHANNEL;
  auto it = channelServerSockets.find(channel);
  if (it == channelServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a channel without calling listen() "
               "first: "
            << channel;
  }
  return it->second;
}

void RfcommSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int channel =
      endpoint.getChannel() > 0 ? endpoint.getChannel() : DEFAULT_RFCOMM_CHANNEL;
  auto it = channelServerSockets.find(channel);
  if (it == channelServerSockets.end()) {
    LOG(WARNING) << "Tried to stop listening on a channel that we weren't "
                    "listening on: "
                 << channel;
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  channelServerSockets.erase(it);
}

string RfcommSocketHandler::getPeerAddress(int fd) {
  sockaddr_rc remote;
  memset(&remote, 0, sizeof(remote));
  socklen_t len = sizeof(remote);
  if (::getpeername(fd, (struct sockaddr*)&remote, &len) == -1) {
    LOG(WARNING) << "getpeername failed on " << fd << ": "
                 << strerror(GetErrno());
    return "unknown#" + to_string(fd);
  }
  char address[18];
  ba2str(&remote.rc_bdaddr, address);
  return string(address);
}

bool RfcommSocketHandler::adapterAvailable(string* reason) {
  int deviceId = hci_get_route(NULL);
  if (deviceId < 0) {
    if (reason) {
      *reason = "Bluetooth adapter not available";
    }
    return false;
  }
  int probe = ::socket(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
  if (probe == -1) {
    auto localErrno = GetErrno();
    if (reason) {
      if (localErrno == EPERM || localErrno == EACCES) {
        *reason = "Bluetooth permission denied";
      } else {
        *reason = string("Bluetooth unavailable: ") + strerror(localErrno);
      }
    }
    return false;
  }
  FATAL_FAIL(::close(probe));
  return true;
}
}  // namespace btlink
