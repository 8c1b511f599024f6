#include "LinkConnection.hpp"

namespace btlink {
namespace {
const std::chrono::milliseconds READ_POLL_INTERVAL(100);
const std::chrono::milliseconds YIELD_INTERVAL(10);
}  // namespace

json ConnectionStats::toJson() const {
  json j;
  j["deviceAddress"] = deviceAddress;
  j["connected"] = connected;
  j["connectTime"] = connectTime;
  j["uptime"] = uptimeMs;
  j["bytesSent"] = bytesSent;
  j["bytesReceived"] = bytesReceived;
  j["lastHeartbeat"] = lastHeartbeat;
  j["reconnectAttempts"] = reconnectAttempts;
  j["readingPaused"] = readingPaused;
  j["leased"] = leased;
  return j;
}

LinkConnection::LinkConnection(const string& _address, int _socketFd,
                               shared_ptr<SocketHandler> _socketHandler,
                               shared_ptr<TimerQueue> _timerQueue,
                               shared_ptr<ConnectionListener> _listener,
                               const ConnectionOptions& _options)
    : address(_address),
      socketFd(_socketFd),
      socketHandler(_socketHandler),
      timerQueue(_timerQueue),
      listener(_listener),
      options(_options),
      readerBusy(false),
      leaseWaiters(0),
      running(true),
      connected(false),
      readingPaused(false),
      leased(false),
      tornDown(false),
      finished(false),
      bytesSent(0),
      bytesReceived(0),
      connectTime(nowEpochMs()),
      lastHeartbeat(nowEpochMs()),
      lastActivitySteadyMs(nowSteadyMs()),
      reconnectAttempts(0),
      heartbeatTimer(-1) {
  connected = socketHandler->isConnected(socketFd);
}

LinkConnection::~LinkConnection() {
  if (!tornDown) {
    STERROR << "Connection " << address << " destroyed without teardown";
  }
}

void LinkConnection::run() {
  el::Helpers::setThreadName("link-" + address);
  {
    lock_guard<std::mutex> guard(leaseMutex);
    readLoopThread = std::this_thread::get_id();
  }
  if (!connected) {
    LOG(WARNING) << "Stream for " << address << " is not connected";
    listener->onConnectionFailed(address, "Stream is not connected");
    teardown();
    return;
  }

  LOG(INFO) << "Connection established with " << address;
  listener->onConnected(address);
  startHeartbeat();

  vector<char> buffer(options.readBufferSize);
  while (running) {
    if (readingPaused) {
      std::this_thread::sleep_for(YIELD_INTERVAL);
      continue;
    }
    if (!dispatchBuffered() || !running) {
      break;
    }
    if (!beginRead()) {
      continue;
    }
    if (!socketHandler->waitForData(socketFd, 0,
                                    READ_POLL_INTERVAL.count() * 1000)) {
      endRead();
      continue;
    }
    ssize_t bytesRead = socketHandler->read(socketFd, &buffer[0], buffer.size());
    int readErrno = errno;
    endRead();

    if (bytesRead > 0) {
      bytesReceived += bytesRead;
      lastHeartbeat = nowEpochMs();
      lastActivitySteadyMs = nowSteadyMs();
      lock_guard<std::mutex> guard(decoderMutex);
      decoder.append(&buffer[0], bytesRead);
    } else if (bytesRead == 0) {
      LOG(INFO) << "Connection closed by " << address;
      break;
    } else {
      if (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
          readErrno == EINTR) {
        continue;
      }
      if (!running) {
        // Closed locally
        break;
      }
      if (!recoverFromReadError(readErrno)) {
        listener->onError(address,
                          string("Connection lost: ") + strerror(readErrno));
        break;
      }
    }
  }
  teardown();
}

bool LinkConnection::dispatchBuffered() {
  while (running) {
    Packet packet;
    try {
      lock_guard<std::mutex> guard(decoderMutex);
      if (!decoder.next(&packet)) {
        return true;
      }
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Corrupt stream from " << address << ": " << re.what();
      listener->onError(address, string("Corrupt stream: ") + re.what());
      return false;
    }
    // Not under the decoder lock: a handler may lease the stream.
    dispatch(packet);
  }
  return true;
}

bool LinkConnection::beginRead() {
  std::unique_lock<std::mutex> lock(leaseMutex);
  if (leased || leaseWaiters > 0) {
    leaseCv.wait_for(lock, YIELD_INTERVAL);
    return false;
  }
  readerBusy = true;
  return true;
}

void LinkConnection::endRead() {
  lock_guard<std::mutex> guard(leaseMutex);
  readerBusy = false;
  leaseCv.notify_all();
}

bool LinkConnection::recoverFromReadError(int readErrno) {
  while (running && reconnectAttempts < options.readRetryLimit) {
    reconnectAttempts++;
    LOG(WARNING) << "Read error on " << address << " (" << strerror(readErrno)
                 << "), probe " << reconnectAttempts << "/"
                 << options.readRetryLimit;
    {
      std::unique_lock<std::mutex> lock(closeMutex);
      closeCv.wait_for(lock,
                       std::chrono::milliseconds(options.readRetryBackoffMs),
                       [this] { return !running; });
    }
    if (!running) {
      return false;
    }
    if (socketHandler->isConnected(socketFd)) {
      LOG(INFO) << "Stream to " << address << " still up, resuming reads";
      return true;
    }
  }
  return false;
}

void LinkConnection::dispatch(const Packet& packet) {
  if (!isKnownPacketType(packet.getHeader())) {
    LOG(WARNING) << "Dropping packet with unknown header "
                 << int(packet.getHeader()) << " from " << address;
    return;
  }
  if (packet.getType() == PacketType::HEARTBEAT) {
    VLOG(2) << "Heartbeat from " << address;
    return;
  }
  listener->onPacket(address, packet);
}

void LinkConnection::startHeartbeat() {
  if (options.heartbeatIntervalMs <= 0) {
    return;
  }
  weak_ptr<LinkConnection> weakSelf = shared_from_this();
  heartbeatTimer = timerQueue->schedulePeriodic(
      std::chrono::milliseconds(options.heartbeatIntervalMs), [weakSelf] {
        auto self = weakSelf.lock();
        if (self) {
          self->heartbeatTick();
        }
      });
}

void LinkConnection::heartbeatTick() {
  if (!running || !connected) {
    return;
  }
  if (leased) {
    VLOG(2) << "Skipping heartbeat to " << address << ", stream is leased";
    return;
  }
  int64_t silence = nowSteadyMs() - lastActivitySteadyMs;
  if (silence < options.heartbeatIntervalMs) {
    return;
  }
  VLOG(1) << "Sending heartbeat to " << address << " after " << silence
          << " ms of silence";
  if (send(Packet(PacketType::HEARTBEAT, "HEARTBEAT"))) {
    lastHeartbeat = nowEpochMs();
  }
}

bool LinkConnection::send(const Packet& packet) {
  if (!running || !connected) {
    VLOG(1) << "Not sending to " << address << ", not connected";
    return false;
  }
  string error;
  {
    lock_guard<std::mutex> guard(writeMutex);
    if (leased) {
      error = "Stream is leased by an active transfer";
    } else {
      try {
        socketHandler->writePacket(socketFd, packet);
        bytesSent += packet.length() + sizeof(uint32_t);
        lastActivitySteadyMs = nowSteadyMs();
        return true;
      } catch (const std::runtime_error& re) {
        error = string("Send failed: ") + re.what();
      }
    }
  }
  LOG(WARNING) << "Could not send to " << address << ": " << error;
  listener->onError(address, error);
  return false;
}

bool LinkConnection::isConnected() {
  return running && connected && socketHandler->isConnected(socketFd);
}

ConnectionStats LinkConnection::stats() const {
  ConnectionStats s;
  s.deviceAddress = address;
  s.connected = running && connected;
  s.connectTime = connectTime;
  s.uptimeMs = nowEpochMs() - s.connectTime;
  s.bytesSent = bytesSent;
  s.bytesReceived = bytesReceived;
  s.lastHeartbeat = lastHeartbeat;
  s.reconnectAttempts = reconnectAttempts;
  s.readingPaused = readingPaused;
  s.leased = leased;
  return s;
}

unique_ptr<StreamLease> LinkConnection::acquire(
    std::chrono::milliseconds timeout) {
  if (!running || !connected) {
    return unique_ptr<StreamLease>();
  }
  bool fromReadLoop;
  {
    std::unique_lock<std::mutex> lock(leaseMutex);
    leaseWaiters++;
    bool available = leaseCv.wait_for(lock, timeout, [this] {
      return (!leased && !readerBusy) || !running;
    });
    leaseWaiters--;
    if (!available || !running) {
      leaseCv.notify_all();
      return unique_ptr<StreamLease>();
    }
    leased = true;
    fromReadLoop = readLoopThread == std::this_thread::get_id();
  }
  {
    // Let a frame that is already being written finish first.
    lock_guard<std::mutex> guard(writeMutex);
  }
  string prefetched;
  if (fromReadLoop) {
    lock_guard<std::mutex> guard(decoderMutex);
    prefetched = decoder.takePending();
  }
  VLOG(1) << "Stream for " << address << " leased with " << prefetched.length()
          << " bytes already buffered";
  return unique_ptr<StreamLease>(
      new StreamLease(shared_from_this(), prefetched));
}

void LinkConnection::releaseLease(const string& unread) {
  if (!unread.empty()) {
    lock_guard<std::mutex> guard(decoderMutex);
    decoder.restore(unread);
  }
  lock_guard<std::mutex> guard(leaseMutex);
  leased = false;
  leaseCv.notify_all();
  VLOG(1) << "Stream for " << address << " released";
}

void LinkConnection::close() {
  {
    lock_guard<std::mutex> guard(closeMutex);
    running = false;
    closeCv.notify_all();
  }
  {
    lock_guard<std::mutex> guard(leaseMutex);
    leaseCv.notify_all();
  }
  socketHandler->shutdown(socketFd);
}

bool LinkConnection::onReadLoopThread() {
  lock_guard<std::mutex> guard(leaseMutex);
  return readLoopThread == std::this_thread::get_id();
}

void LinkConnection::abandon() {
  close();
  teardown();
}

void LinkConnection::teardown() {
  if (tornDown.exchange(true)) {
    return;
  }
  running = false;
  connected = false;
  if (heartbeatTimer >= 0) {
    timerQueue->cancel(heartbeatTimer);
  }
  {
    // The descriptor can only be released once nobody else is using it.
    std::unique_lock<std::mutex> lock(leaseMutex);
    leaseCv.wait(lock, [this] { return !leased && !readerBusy; });
  }
  socketHandler->close(socketFd);
  LOG(INFO) << "Connection with " << address << " torn down";
  listener->onDisconnected(address);
  finished = true;
  if (teardownHook) {
    teardownHook(this);
  }
}

StreamLease::StreamLease(shared_ptr<LinkConnection> _connection,
                         const string& _prefetched)
    : connection(_connection), prefetched(_prefetched), prefetchOffset(0) {}

StreamLease::~StreamLease() {
  connection->releaseLease(prefetched.substr(prefetchOffset));
}

bool StreamLease::isOpen() { return connection->isConnected(); }

void StreamLease::readAll(void* buf, size_t count) {
  size_t fromBuffer = std::min(count, prefetched.length() - prefetchOffset);
  if (fromBuffer > 0) {
    memcpy(buf, prefetched.data() + prefetchOffset, fromBuffer);
    prefetchOffset += fromBuffer;
  }
  if (fromBuffer < count) {
    size_t remaining = count - fromBuffer;
    connection->socketHandler->readAll(connection->socketFd,
                                       ((char*)buf) + fromBuffer, remaining,
                                       true);
    connection->bytesReceived += remaining;
  }
  connection->lastActivitySteadyMs = nowSteadyMs();
}

Packet StreamLease::readPacket() {
  uint32_t networkLength;
  readAll(&networkLength, sizeof(networkLength));
  int64_t length = int64_t(ntohl(networkLength));
  if (length <= 0 || length > MAX_FRAME_SIZE) {
    throw std::runtime_error("Invalid frame size: " + to_string(length));
  }
  string body(size_t(length), '\0');
  readAll(&body[0], body.length());
  return Packet(body);
}

void StreamLease::writeAll(const void* buf, size_t count) {
  lock_guard<std::mutex> guard(connection->writeMutex);
  connection->socketHandler->writeAllOrThrow(connection->socketFd, buf, count,
                                             true);
  connection->bytesSent += count;
  connection->lastActivitySteadyMs = nowSteadyMs();
}

void StreamLease::writePacket(const Packet& packet) {
  string frame = packet.toFrame();
  writeAll(frame.data(), frame.length());
}

void StreamLease::abort() {
  LOG(INFO) << "Aborting leased stream to " << getAddress();
  connection->close();
}
}  // namespace btlink
