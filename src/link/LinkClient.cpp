#include "LinkClient.hpp"

#include "SocketEndpoint.hpp"

namespace btlink {
LinkClient::LinkClient(shared_ptr<LinkContext> _context,
                       shared_ptr<DiscoverySource> _discovery)
    : LinkSession(_context, "client"),
      discovery(_discovery),
      closing(false),
      pendingDials(0),
      scanning(false),
      scanGeneration(0),
      scanTimer(-1) {
  reconnectEvents = make_shared<ReconnectEvents>(this);
  supervisor = make_shared<ReconnectSupervisor>(
      context->timerQueue,
      [this](const string& address, std::function<void(bool)> done) {
        runDial([this, address, done] { done(connect(address)); });
      },
      reconnectEvents, context->config.reconnect);
}

LinkClient::~LinkClient() {
  closing = true;
  supervisor->stopAll("Client shutting down");
  stopScan();
  {
    unique_lock<std::mutex> guard(clientMutex);
    dialCv.wait(guard, [this] { return pendingDials == 0; });
  }
  shutdownSession();
}

bool LinkClient::startScan(int64_t timeoutMs) {
  if (timeoutMs < 0) {
    timeoutMs = context->config.scanTimeoutMs;
  }
  if (!discovery) {
    reportError("Discovery is not available");
    return false;
  }
  if (!checkCapability()) {
    return false;
  }
  int64_t generation;
  {
    lock_guard<std::mutex> guard(clientMutex);
    if (scanning) {
      reportError("Scan already in progress");
      return false;
    }
    scanning = true;
    generation = ++scanGeneration;
    scanResults.clear();
  }
  stats.recordScanAttempt();
  bool started = discovery->start(
      timeoutMs,
      [this, generation](const DiscoveredDevice& found) {
        DiscoveredDevice device = found;
        device.isConnected = registry->isConnected(device.address);
        {
          lock_guard<std::mutex> guard(clientMutex);
          if (generation != scanGeneration || !scanning ||
              scanResults.count(device.address)) {
            return;
          }
          scanResults[device.address] = device;
        }
        VLOG(1) << "Discovered " << device.address << " (" << device.name
                << ")";
        stats.recordDeviceDiscovered();
        hub.emit(
            [device](LinkEventListener* l) { l->onDeviceDiscovered(device); });
      },
      [this, generation] { finishScan(generation); });
  if (!started) {
    lock_guard<std::mutex> guard(clientMutex);
    scanning = false;
    reportError("Failed to start discovery");
    return false;
  }
  LOG(INFO) << "Scanning for " << timeoutMs << " ms";
  auto timer = context->timerQueue->schedule(
      std::chrono::milliseconds(timeoutMs), [this, generation] {
        discovery->cancel();
        finishScan(generation);
      });
  lock_guard<std::mutex> guard(clientMutex);
  scanTimer = timer;
  return true;
}

void LinkClient::stopScan() {
  int64_t generation;
  {
    lock_guard<std::mutex> guard(clientMutex);
    if (!scanning) {
      return;
    }
    generation = scanGeneration;
    context->timerQueue->cancel(scanTimer);
  }
  if (discovery) {
    discovery->cancel();
  }
  finishScan(generation);
}

void LinkClient::finishScan(int64_t generation) {
  int found;
  {
    lock_guard<std::mutex> guard(clientMutex);
    if (!scanning || generation != scanGeneration) {
      return;
    }
    scanning = false;
    found = int(scanResults.size());
  }
  LOG(INFO) << "Scan finished with " << found << " devices";
  hub.emit([found](LinkEventListener* l) { l->onScanFinished(found); });
}

bool LinkClient::isScanning() {
  lock_guard<std::mutex> guard(clientMutex);
  return scanning;
}

vector<DiscoveredDevice> LinkClient::discoveredDevices() {
  lock_guard<std::mutex> guard(clientMutex);
  vector<DiscoveredDevice> devices;
  for (const auto& it : scanResults) {
    devices.push_back(it.second);
  }
  return devices;
}

bool LinkClient::connect(const string& address) {
  if (address.empty()) {
    reportError("Cannot connect to an empty address");
    return false;
  }
  if (closing) {
    return false;
  }
  if (registry->isConnected(address)) {
    VLOG(1) << "Already connected to " << address;
    return true;
  }
  if (!checkCapability()) {
    return false;
  }
  {
    lock_guard<std::mutex> guard(clientMutex);
    explicitDisconnects.erase(address);
  }
  stats.recordConnectionAttempt();
  LOG(INFO) << "Connecting to " << address;
  int fd = context->socketHandler->connect(
      SocketEndpoint(address, context->config.channel));
  if (fd < 0) {
    LOG(WARNING) << "Could not connect to " << address;
    handleConnectionFailed(address, "Connection failed");
    return false;
  }
  stats.recordSuccessfulConnection();
  adopt(address, fd);
  return true;
}

void LinkClient::connectAsync(const string& address) {
  runDial([this, address] { connect(address); });
}

void LinkClient::runDial(std::function<void()> task) {
  {
    lock_guard<std::mutex> guard(clientMutex);
    pendingDials++;
  }
  auto finished = [this] {
    lock_guard<std::mutex> guard(clientMutex);
    pendingDials--;
    dialCv.notify_all();
  };
  try {
    context->threadPool->enqueue([task, finished] {
      task();
      finished();
    });
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Cannot schedule dial: " << re.what();
    finished();
  }
}

bool LinkClient::disconnect(const string& address) {
  {
    lock_guard<std::mutex> guard(clientMutex);
    explicitDisconnects.insert(address);
  }
  supervisor->stopReconnect(address, "Disconnected by user");
  return registry->remove(address);
}

void LinkClient::handleDisconnected(const string& address) {
  LinkSession::handleDisconnected(address);
  bool explicitDisconnect;
  {
    lock_guard<std::mutex> guard(clientMutex);
    explicitDisconnect = explicitDisconnects.erase(address) > 0;
  }
  if (explicitDisconnect || closing || shuttingDown) {
    return;
  }
  supervisor->startReconnect(address, "Connection lost");
}

void LinkClient::ReconnectEvents::onReconnectAttempt(const string& address,
                                                     int attempt,
                                                     int maxAttempts) {
  client->stats.recordReconnectAttempt();
  client->hub.emit([address, attempt, maxAttempts](LinkEventListener* l) {
    l->onReconnectAttempt(address, attempt, maxAttempts);
  });
}

void LinkClient::ReconnectEvents::onReconnectSuccess(const string& address,
                                                     int attempts) {
  client->stats.recordReconnectSuccess();
  client->hub.emit([address, attempts](LinkEventListener* l) {
    l->onReconnectSuccess(address, attempts);
  });
}

void LinkClient::ReconnectEvents::onReconnectFailed(const string& address,
                                                    int attempts) {
  client->hub.emit([address, attempts](LinkEventListener* l) {
    l->onReconnectFailed(address, attempts);
  });
}

void LinkClient::ReconnectEvents::onReconnectAborted(const string& address,
                                                     const string& reason) {
  client->hub.emit([address, reason](LinkEventListener* l) {
    l->onReconnectAborted(address, reason);
  });
}
}  // namespace btlink
