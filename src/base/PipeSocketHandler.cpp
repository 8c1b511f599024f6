#include "PipeSocketHandler.hpp"

namespace btlink {
PipeSocketHandler::PipeSocketHandler(int64_t _connectTimeoutMs)
    : connectTimeoutMs(_connectTimeoutMs) {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.getName();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(remote));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    ::shutdown(sockFd, SHUT_RDWR);
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
  socketPaths[sockFd] = pipePath;
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }
  if (pipePath.empty() || pipePath.length() >= sizeof(sockaddr_un::sun_path)) {
    throw runtime_error("Invalid pipe path: " + pipePath);
  }

  sockaddr_un local;
  memset(&local, 0, sizeof(local));

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  local.sun_family = AF_UNIX;
  strncpy(local.sun_path, pipePath.c_str(), sizeof(local.sun_path) - 1);
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to bind " + pipePath + ": " +
                        strerror(localErrno));
  }
  if (::listen(fd, 5) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to listen on " + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getPipeFd on a pipe without calling listen() first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    LOG(WARNING) << "Tried to stop listening to a pipe that we weren't "
                    "listening on: "
                 << pipePath;
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  ::unlink(pipePath.c_str());
}

int PipeSocketHandler::accept(int fd) {
  int clientFd = UnixSocketHandler::accept(fd);
  if (clientFd >= 0) {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    for (const auto& it : pipeServerSockets) {
      if (it.second.count(fd)) {
        socketPaths[clientFd] = it.first;
      }
    }
  }
  return clientFd;
}

void PipeSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  socketPaths.erase(fd);
  UnixSocketHandler::close(fd);
}

string PipeSocketHandler::getPeerAddress(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = socketPaths.find(fd);
  string path = (it == socketPaths.end()) ? string("pipe") : it->second;
  return path + "#" + to_string(fd);
}
}  // namespace btlink
