#include "SocketHandler.hpp"

namespace btlink {
namespace {
// A blocking transfer fails after this long without any progress
const int64_t STALL_TIMEOUT_MS = 10 * 1000;
const int64_t POLL_INTERVAL_US = 100 * 1000;

void checkStall(bool timeout, int64_t lastProgressMs, int fd) {
  if (timeout && nowSteadyMs() - lastProgressMs > STALL_TIMEOUT_MS) {
    throw std::runtime_error("No progress on fd " + to_string(fd) +
                             " for " + to_string(STALL_TIMEOUT_MS) + " ms");
  }
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = static_cast<char*>(buf);
  int64_t lastProgressMs = nowSteadyMs();
  size_t done = 0;
  while (done < count) {
    if (!waitForData(fd, 0, POLL_INTERVAL_US)) {
      checkStall(timeout, lastProgressMs, fd);
      if (!isConnected(fd)) {
        throw std::runtime_error("Stream closed while reading");
      }
      continue;
    }
    ssize_t n = read(fd, out + done, count - done);
    if (n == 0) {
      throw std::runtime_error("Unexpected end of stream");
    }
    if (n < 0) {
      int localErrno = errno;
      if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
        VLOG(1) << "read on " << fd << " failed: " << strerror(localErrno);
        throw std::runtime_error(string("Read failed: ") +
                                 strerror(localErrno));
      }
      VLOG(3) << "EAGAIN on " << fd;
      continue;
    }
    done += size_t(n);
    lastProgressMs = nowSteadyMs();
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* in = static_cast<const char*>(buf);
  int64_t lastProgressMs = nowSteadyMs();
  size_t done = 0;
  while (done < count) {
    checkStall(timeout, lastProgressMs, fd);
    ssize_t n = write(fd, in + done, count - done);
    if (n > 0) {
      done += size_t(n);
      lastProgressMs = nowSteadyMs();
      continue;
    }
    if (n == 0) {
      throw std::runtime_error("Stream closed while writing");
    }
    int localErrno = errno;
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      LOG(WARNING) << "write on " << fd << " failed: " << strerror(localErrno);
      throw std::runtime_error(string("Write failed: ") + strerror(localErrno));
    }
    // Send buffer is full, the peer is slower than us
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace btlink
