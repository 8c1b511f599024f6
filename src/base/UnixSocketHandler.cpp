#include "UnixSocketHandler.hpp"

namespace btlink {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    // Select failed, most likely because the fd was closed under us.
    VLOG(4) << "socket select failed: " << strerror(errno);
    return false;
  } else if (n == 0) {
    return false;
  }
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  // Try to write for around 5 seconds before giving up
  time_t startTime = time(NULL);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    lock_guard<recursive_mutex> guard(*socketMutex);
    ssize_t w = ::send(fd, ((const char *)buf) + bytesWritten,
                       count - bytesWritten, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (time(NULL) > startTime + 5) {
          // Give up
          return -1;
        }
      } else {
        return -1;
      }
    } else {
      bytesWritten += w;
    }
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
  shutdownSockets.erase(fd);
}

int UnixSocketHandler::accept(int sockFd) {
  VLOG(3) << "Sockethandler accept " << sockFd;
  sockaddr_storage client;
  socklen_t c = sizeof(client);
  int client_sock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;
  if (client_sock < 0) {
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
      VLOG(1) << "accept failed on " << sockFd << ": "
              << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }

  lock_guard<std::recursive_mutex> guard(globalMutex);
  VLOG(3) << "Socket " << sockFd
          << " accepted, returned client_sock: " << client_sock;
  addToActiveSockets(client_sock);
  initSocket(client_sock);
  return client_sock;
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
  shutdownSockets.erase(fd);
}

void UnixSocketHandler::shutdown(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (activeSocketMutexes.find(fd) == activeSocketMutexes.end()) {
    return;
  }
  VLOG(1) << "Shutting down connection: " << fd;
  // ENOTCONN just means the peer already went away.
  if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
    LOG(WARNING) << "shutdown failed on " << fd << ": " << strerror(errno);
  }
  shutdownSockets.insert(fd);
}

bool UnixSocketHandler::isConnected(int fd) {
  {
    lock_guard<std::recursive_mutex> globalGuard(globalMutex);
    if (activeSocketMutexes.find(fd) == activeSocketMutexes.end() ||
        shutdownSockets.count(fd)) {
      return false;
    }
  }
  int so_error = 0;
  socklen_t len = sizeof so_error;
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, (char *)&so_error, &len) == -1 ||
      so_error != 0) {
    return false;
  }
  char c;
  ssize_t peeked = ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
  if (peeked == 0) {
    // Orderly shutdown from the remote side
    return false;
  }
  if (peeked < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
    return false;
  }
  return true;
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  vector<int> fds;
  for (auto it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
  int opts;
  opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  // Also set the accept socket as reusable
  {
    int flag = 1;
    FATAL_FAIL(
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
  }
}

bool UnixSocketHandler::waitForConnect(int sockFd, int64_t timeoutMs) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting sockFd";
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (!FD_ISSET(sockFd, &fdset)) {
    SetErrno(ETIMEDOUT);
    return false;
  }
  int so_error;
  socklen_t len = sizeof so_error;
  FATAL_FAIL(
      ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char *)&so_error, &len));
  if (so_error != 0) {
    SetErrno(so_error);
    return false;
  }
  return true;
}
}  // namespace btlink
