#ifndef __BTLINK_LINK_CONNECTION__
#define __BTLINK_LINK_CONNECTION__

#include "FrameDecoder.hpp"
#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketHandler.hpp"
#include "TimerQueue.hpp"

namespace btlink {
class StreamLease;

/** @brief Read loop and heartbeat tunables. */
struct ConnectionOptions {
  int64_t heartbeatIntervalMs = 30000;
  int readRetryLimit = 3;
  int64_t readRetryBackoffMs = 2000;
  size_t readBufferSize = 32768;
};

/** @brief Point in time copy of a connection's counters. */
struct ConnectionStats {
  string deviceAddress;
  bool connected = false;
  int64_t connectTime = 0;
  int64_t uptimeMs = 0;
  int64_t bytesSent = 0;
  int64_t bytesReceived = 0;
  int64_t lastHeartbeat = 0;
  int reconnectAttempts = 0;
  bool readingPaused = false;
  bool leased = false;

  json toJson() const;
};

/**
 * @brief Receives a connection's lifecycle and traffic.
 *
 * Called from the connection's read loop thread (traffic, lifecycle) or
 * from the timer thread (heartbeat send errors). Implementations must not
 * block.
 */
class ConnectionListener {
 public:
  virtual ~ConnectionListener() {}
  virtual void onConnected(const string& address) = 0;
  virtual void onDisconnected(const string& address) = 0;
  virtual void onConnectionFailed(const string& address,
                                  const string& error) = 0;
  /** @brief A complete non-heartbeat packet, in stream order. */
  virtual void onPacket(const string& address, const Packet& packet) = 0;
  virtual void onError(const string& address, const string& error) = 0;
};

/**
 * @brief One live link: owns the descriptor, runs the read loop, sends
 * heartbeats and hands out stream leases.
 *
 * State: Starting -> Connected -> Disconnected. Disconnected is terminal;
 * the descriptor and the heartbeat timer are released exactly once, after
 * which the disconnected notification fires.
 */
class LinkConnection : public std::enable_shared_from_this<LinkConnection> {
 public:
  LinkConnection(const string& _address, int _socketFd,
                 shared_ptr<SocketHandler> _socketHandler,
                 shared_ptr<TimerQueue> _timerQueue,
                 shared_ptr<ConnectionListener> _listener,
                 const ConnectionOptions& _options);
  ~LinkConnection();

  /**
   * @brief Runs the read loop until the stream ends or close() is called,
   * then tears down. Blocks; meant for a worker thread.
   */
  void run();

  /**
   * @brief Asks the read loop to stop and shuts the stream down. Teardown
   * itself happens on the read loop thread.
   */
  void close();

  /**
   * @brief Writes one frame.
   * @return false if not connected (silently), if the stream is leased or
   * if the write failed (both reported through onError).
   */
  bool send(const Packet& packet);

  bool isConnected();
  void pauseReading() { readingPaused = true; }
  void resumeReading() { readingPaused = false; }
  bool isReadingPaused() const { return readingPaused; }
  bool isLeased() const { return leased; }
  /** @brief Whether teardown, including onDisconnected, has completed. */
  bool isFinished() const { return finished; }
  bool onReadLoopThread();

  ConnectionStats stats() const;

  /**
   * @brief Takes exclusive ownership of the raw stream away from the read
   * loop.
   * @return null if another lease is held past @p timeout or the connection
   * is down.
   */
  unique_ptr<StreamLease> acquire(std::chrono::milliseconds timeout);

  const string& getAddress() const { return address; }
  int getSocketFd() const { return socketFd; }

  /**
   * @brief Tears down a connection whose read loop will never run.
   */
  void abandon();

  /** @brief Invoked once at the end of teardown, after onDisconnected. */
  void setTeardownHook(std::function<void(LinkConnection*)> hook) {
    teardownHook = hook;
  }

 protected:
  friend class StreamLease;

  void startHeartbeat();
  void heartbeatTick();
  void dispatch(const Packet& packet);
  /**
   * @brief Dispatches every complete frame in the decoder.
   * @return false if the stream is corrupt.
   */
  bool dispatchBuffered();
  /**
   * @brief Sleeps and re-checks the existing stream after a read error.
   * @return true if the stream reports connected again within the retry
   * budget.
   */
  bool recoverFromReadError(int readErrno);
  /**
   * @brief Waits (briefly) for the stream to be free and claims it for one
   * read.
   * @return false if a lease holds or wants the stream.
   */
  bool beginRead();
  void endRead();
  void teardown();
  /** @param unread Bytes the lease took from the decoder but did not use. */
  void releaseLease(const string& unread);

  string address;
  int socketFd;
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<TimerQueue> timerQueue;
  shared_ptr<ConnectionListener> listener;
  ConnectionOptions options;
  std::function<void(LinkConnection*)> teardownHook;

  /**
   * @brief Guards stream ownership. The read loop marks itself busy for one
   * read; a lease waits for it to finish and then holds the stream until it
   * is destroyed, on whatever thread that happens.
   */
  std::mutex leaseMutex;
  std::condition_variable leaseCv;
  bool readerBusy;
  int leaseWaiters;
  std::thread::id readLoopThread;
  /**
   * @brief Bytes read but not yet parsed. A lease taken from inside the
   * read loop (while a packet is dispatched) inherits them, since they
   * belong to whatever the peer sent after that packet.
   */
  FrameDecoder decoder;
  std::mutex decoderMutex;
  /** @brief Serializes frame writes. */
  std::mutex writeMutex;
  /** @brief Wakes retry sleeps when close() is called. */
  std::mutex closeMutex;
  std::condition_variable closeCv;

  atomic<bool> running;
  atomic<bool> connected;
  atomic<bool> readingPaused;
  atomic<bool> leased;
  atomic<bool> tornDown;
  atomic<bool> finished;
  atomic<int64_t> bytesSent;
  atomic<int64_t> bytesReceived;
  atomic<int64_t> connectTime;
  atomic<int64_t> lastHeartbeat;
  atomic<int64_t> lastActivitySteadyMs;
  atomic<int> reconnectAttempts;
  TimerQueue::TimerId heartbeatTimer;
};

/**
 * @brief Exclusive use of a connection's raw stream.
 *
 * While a lease exists the read loop does not read and ordinary sends are
 * refused, so the holder (a file transfer) sees exactly the bytes the peer
 * wrote. Destroying the lease hands the stream back.
 */
class StreamLease {
 public:
  ~StreamLease();

  const string& getAddress() const { return connection->getAddress(); }
  bool isOpen();

  /**
   * @brief Reads exactly @p count bytes.
   * @throws std::runtime_error on end of stream, error or a 10 second stall.
   */
  void readAll(void* buf, size_t count);
  /** @throws std::runtime_error if the write fails. */
  void writeAll(const void* buf, size_t count);
  /** @brief Writes one length-prefixed frame on the leased stream. */
  void writePacket(const Packet& packet);
  /**
   * @brief Reads one length-prefixed frame.
   * @throws std::runtime_error on a bad length or a read failure.
   */
  Packet readPacket();

  /**
   * @brief Shuts the stream down. Blocked reads and writes fail right away
   * and the connection goes to Disconnected once the lease is released.
   */
  void abort();

 protected:
  friend class LinkConnection;
  StreamLease(shared_ptr<LinkConnection> _connection, const string& _prefetched);

  shared_ptr<LinkConnection> connection;
  /** @brief Already received bytes, served before reading the stream. */
  string prefetched;
  size_t prefetchOffset;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_CONNECTION__
