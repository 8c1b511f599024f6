#ifndef __BTLINK_FLAKY_SOCKET_HANDLER__
#define __BTLINK_FLAKY_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace btlink {
/**
 * @brief Wraps another handler and injects failures into it.
 *
 * Failures are either random (one in `readFailureOdds` reads, etc., zero
 * disables) or forced for the next N calls with a chosen errno.
 */
class FlakySocketHandler : public SocketHandler {
 public:
  FlakySocketHandler(shared_ptr<SocketHandler> _actualSocketHandler)
      : actualSocketHandler(_actualSocketHandler),
        connectFailureOdds(0),
        readFailureOdds(0),
        writeFailureOdds(0),
        forcedReadFailures(0),
        forcedReadErrno(EIO),
        forcedWriteFailures(0),
        forcedWriteErrno(EPIPE) {}
  virtual ~FlakySocketHandler() {}

  void setFailureOdds(int connectOdds, int readOdds, int writeOdds) {
    connectFailureOdds = connectOdds;
    readFailureOdds = readOdds;
    writeFailureOdds = writeOdds;
  }
  void failNextReads(int count, int err) {
    forcedReadErrno = err;
    forcedReadFailures = count;
  }
  void failNextWrites(int count, int err) {
    forcedWriteErrno = err;
    forcedWriteFailures = count;
  }

  virtual int connect(const SocketEndpoint& endpoint) {
    if (roll(connectFailureOdds)) {
      errno = ECONNREFUSED;
      return -1;
    }
    return actualSocketHandler->connect(endpoint);
  }
  virtual set<int> listen(const SocketEndpoint& endpoint) {
    return actualSocketHandler->listen(endpoint);
  }
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) {
    return actualSocketHandler->getEndpointFds(endpoint);
  }
  virtual void stopListening(const SocketEndpoint& endpoint) {
    return actualSocketHandler->stopListening(endpoint);
  }
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) {
    if (forcedReadFailures > 0) {
      return true;
    }
    return actualSocketHandler->waitForData(fd, sec, usec);
  }
  virtual bool hasData(int fd) { return actualSocketHandler->hasData(fd); }
  virtual ssize_t read(int fd, void* buf, size_t count) {
    if (forcedReadFailures > 0) {
      forcedReadFailures--;
      errno = forcedReadErrno;
      return -1;
    }
    if (roll(readFailureOdds)) {
      errno = EPIPE;
      return -1;
    }
    return actualSocketHandler->read(fd, buf, count);
  }
  virtual ssize_t write(int fd, const void* buf, size_t count) {
    if (forcedWriteFailures > 0) {
      forcedWriteFailures--;
      errno = forcedWriteErrno;
      return -1;
    }
    if (roll(writeFailureOdds)) {
      errno = EPIPE;
      return -1;
    }
    return actualSocketHandler->write(fd, buf, count);
  }
  virtual int accept(int fd) { return actualSocketHandler->accept(fd); }
  virtual void close(int fd) { actualSocketHandler->close(fd); }
  virtual void shutdown(int fd) { actualSocketHandler->shutdown(fd); }
  virtual bool isConnected(int fd) {
    return actualSocketHandler->isConnected(fd);
  }
  virtual string getPeerAddress(int fd) {
    return actualSocketHandler->getPeerAddress(fd);
  }
  virtual vector<int> getActiveSockets() {
    return actualSocketHandler->getActiveSockets();
  }

 protected:
  bool roll(int odds) { return odds > 0 && rand() % odds == 0; }

  shared_ptr<SocketHandler> actualSocketHandler;
  atomic<int> connectFailureOdds;
  atomic<int> readFailureOdds;
  atomic<int> writeFailureOdds;
  atomic<int> forcedReadFailures;
  atomic<int> forcedReadErrno;
  atomic<int> forcedWriteFailures;
  atomic<int> forcedWriteErrno;
};
}  // namespace btlink

#endif  // __BTLINK_FLAKY_SOCKET_HANDLER__
