#ifndef __BTLINK_TEST_HEADERS__
#define __BTLINK_TEST_HEADERS__

#include "Headers.hpp"
#include "UnixSocketHandler.hpp"
#include "catch2/catch.hpp"

namespace btlink {
/**
 * @brief Hands out connected AF_UNIX socketpairs so a link can be driven
 * from the other end without a listener.
 */
class SocketPairHandler : public UnixSocketHandler {
 public:
  SocketPairHandler() {}
  virtual ~SocketPairHandler() {}

  /** @return {link side, peer side} */
  pair<int, int> makePair() {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    initSocket(fds[0]);
    initSocket(fds[1]);
    addToActiveSockets(fds[0]);
    addToActiveSockets(fds[1]);
    return make_pair(fds[0], fds[1]);
  }

  virtual int connect(const SocketEndpoint&) {
    errno = ECONNREFUSED;
    return -1;
  }
  virtual set<int> listen(const SocketEndpoint&) {
    throw std::runtime_error("SocketPairHandler cannot listen");
  }
  virtual set<int> getEndpointFds(const SocketEndpoint&) { return set<int>(); }
  virtual void stopListening(const SocketEndpoint&) {}
  virtual string getPeerAddress(int fd) { return "pair-" + to_string(fd); }
};

/** @brief Polls @p condition every 10 ms for up to @p timeoutMs. */
inline bool waitUntil(std::function<bool()> condition,
                      int64_t timeoutMs = 5000) {
  int64_t deadline = nowSteadyMs() + timeoutMs;
  while (!condition()) {
    if (nowSteadyMs() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

/** @brief A fresh directory under the temp dir, removed on destruction. */
class TempDir {
 public:
  TempDir() {
    string pattern = GetTempDirectory() + string("btlink_test_XXXXXXXX");
    path = string(mkdtemp(&pattern[0]));
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  string file(const string& name) const { return (fs::path(path) / name).string(); }

  string path;
};

inline void writeFile(const string& path, const string& contents) {
  ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

inline string readFile(const string& path) {
  ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/** @brief Reads one length-prefixed frame from a raw peer socket. */
inline Packet readFrame(SocketHandler* handler, int fd) {
  uint32_t networkLength;
  handler->readAll(fd, &networkLength, sizeof(networkLength), true);
  string body(ntohl(networkLength), '\0');
  handler->readAll(fd, &body[0], body.length(), true);
  return Packet(body);
}
}  // namespace btlink

#endif  // __BTLINK_TEST_HEADERS__
