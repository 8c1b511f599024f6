#include "ConnectionRegistry.hpp"

namespace btlink {
namespace {
const std::chrono::seconds SHUTDOWN_TIMEOUT(10);
}

ConnectionRegistry::ConnectionRegistry(shared_ptr<SocketHandler> _socketHandler,
                                       shared_ptr<TimerQueue> _timerQueue,
                                       const ConnectionOptions& _options)
    : socketHandler(_socketHandler), timerQueue(_timerQueue), options(_options) {}

ConnectionRegistry::~ConnectionRegistry() { shutdown(); }

void ConnectionRegistry::add(const string& address, int socketFd,
                             shared_ptr<ConnectionListener> listener) {
  auto connection =
      make_shared<LinkConnection>(address, socketFd, socketHandler, timerQueue,
                                  listener, options);
  connection->setTeardownHook(
      [this](LinkConnection* finished) { onTeardown(finished); });

  shared_ptr<LinkConnection> previous;
  {
    lock_guard<std::mutex> guard(registryMutex);
    auto it = connections.find(address);
    if (it != connections.end()) {
      previous = it->second;
      connections.erase(it);
    }
  }
  if (previous) {
    LOG(INFO) << "Replacing existing connection for " << address;
    if (previous->onReadLoopThread()) {
      // Replaced from one of its own handlers: its loop cannot finish first.
      previous->abandon();
    } else {
      previous->close();
    }
  }
  {
    // Also covers a connection that remove() closed but is still tearing
    // down.
    std::unique_lock<std::mutex> lock(registryMutex);
    auto closed = [this, &address] { return !isClosing(address); };
    if (!registryCv.wait_for(lock, SHUTDOWN_TIMEOUT, closed)) {
      LOG(ERROR) << "Previous connection for " << address
                 << " did not finish tearing down";
    }
  }

  vector<unique_ptr<std::thread>> finishedLoops;
  bool started = true;
  {
    lock_guard<std::mutex> guard(registryMutex);
    finishedLoops = takeFinishedLoops();
    connections[address] = connection;
    try {
      readLoops[connection].reset(
          new std::thread([connection] { connection->run(); }));
    } catch (const std::system_error& se) {
      LOG(ERROR) << "Could not start read loop for " << address << ": "
                 << se.what();
      readLoops.erase(connection);
      started = false;
    }
  }
  joinLoops(&finishedLoops);
  if (!started) {
    connection->abandon();
  }
}

bool ConnectionRegistry::remove(const string& address) {
  shared_ptr<LinkConnection> connection;
  {
    lock_guard<std::mutex> guard(registryMutex);
    auto it = connections.find(address);
    if (it == connections.end()) {
      return false;
    }
    connection = it->second;
    connections.erase(it);
  }
  LOG(INFO) << "Removing connection " << address;
  connection->close();
  return true;
}

shared_ptr<LinkConnection> ConnectionRegistry::find(const string& address) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = connections.find(address);
  if (it == connections.end()) {
    return shared_ptr<LinkConnection>();
  }
  return it->second;
}

bool ConnectionRegistry::send(const string& address, const Packet& packet) {
  auto connection = find(address);
  if (!connection) {
    VLOG(1) << "No connection for " << address;
    return false;
  }
  return connection->send(packet);
}

bool ConnectionRegistry::sendData(const string& address, const string& bytes) {
  return send(address, Packet(PacketType::RAW_DATA, bytes));
}

bool ConnectionRegistry::sendCommand(const string& address,
                                     const string& command) {
  return send(address, Packet(PacketType::COMMAND, command));
}

bool ConnectionRegistry::isConnected(const string& address) {
  if (address.empty()) {
    return false;
  }
  auto connection = find(address);
  return connection && connection->isConnected();
}

bool ConnectionRegistry::pauseReading(const string& address) {
  auto connection = find(address);
  if (!connection) {
    return false;
  }
  connection->pauseReading();
  return true;
}

bool ConnectionRegistry::resumeReading(const string& address) {
  auto connection = find(address);
  if (!connection) {
    return false;
  }
  connection->resumeReading();
  return true;
}

optional<ConnectionStats> ConnectionRegistry::stats(const string& address) {
  auto connection = find(address);
  if (!connection) {
    return nullopt;
  }
  return connection->stats();
}

vector<string> ConnectionRegistry::connectedDevices() {
  vector<shared_ptr<LinkConnection>> snapshot;
  {
    lock_guard<std::mutex> guard(registryMutex);
    for (const auto& it : connections) {
      snapshot.push_back(it.second);
    }
  }
  vector<string> addresses;
  for (const auto& connection : snapshot) {
    if (connection->isConnected()) {
      addresses.push_back(connection->getAddress());
    }
  }
  return addresses;
}

size_t ConnectionRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return connections.size();
}

unique_ptr<StreamLease> ConnectionRegistry::acquireStream(
    const string& address, std::chrono::milliseconds timeout) {
  auto connection = find(address);
  if (!connection) {
    return unique_ptr<StreamLease>();
  }
  return connection->acquire(timeout);
}

void ConnectionRegistry::onTeardown(LinkConnection* finished) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = connections.find(finished->getAddress());
  if (it != connections.end() && it->second.get() == finished) {
    connections.erase(it);
  }
  registryCv.notify_all();
}

bool ConnectionRegistry::isClosing(const string& address) {
  for (const auto& it : readLoops) {
    const auto& connection = it.first;
    if (connection->getAddress() == address && !connection->isFinished() &&
        !connection->onReadLoopThread()) {
      return true;
    }
  }
  return false;
}

vector<unique_ptr<std::thread>> ConnectionRegistry::takeFinishedLoops() {
  vector<unique_ptr<std::thread>> finishedLoops;
  for (auto it = readLoops.begin(); it != readLoops.end();) {
    if (it->first->isFinished()) {
      finishedLoops.push_back(std::move(it->second));
      it = readLoops.erase(it);
    } else {
      ++it;
    }
  }
  return finishedLoops;
}

void ConnectionRegistry::joinLoops(vector<unique_ptr<std::thread>>* loops) {
  for (auto& loop : *loops) {
    if (loop->get_id() == std::this_thread::get_id()) {
      loop->detach();
    } else {
      loop->join();
    }
  }
  loops->clear();
}

void ConnectionRegistry::shutdown() {
  vector<shared_ptr<LinkConnection>> toClose;
  {
    lock_guard<std::mutex> guard(registryMutex);
    for (const auto& it : readLoops) {
      toClose.push_back(it.first);
    }
    connections.clear();
  }
  for (const auto& connection : toClose) {
    connection->close();
  }
  vector<unique_ptr<std::thread>> finishedLoops;
  {
    std::unique_lock<std::mutex> lock(registryMutex);
    auto allFinished = [this] {
      for (const auto& it : readLoops) {
        if (!it.first->isFinished()) {
          return false;
        }
      }
      return true;
    };
    if (!registryCv.wait_for(lock, SHUTDOWN_TIMEOUT, allFinished)) {
      LOG(ERROR) << "Some read loops did not finish during shutdown";
    }
    finishedLoops = takeFinishedLoops();
    for (auto& it : readLoops) {
      it.second->detach();
    }
    readLoops.clear();
  }
  joinLoops(&finishedLoops);
}
}  // namespace btlink
