#include "LinkServer.hpp"

namespace btlink {
LinkServer::LinkServer(shared_ptr<LinkContext> _context)
    : LinkSession(_context, "server"), running(false) {}

LinkServer::~LinkServer() {
  stop();
  shutdownSession();
}

bool LinkServer::start() {
  return start(context->config.serviceName, context->config.serviceUuid);
}

bool LinkServer::start(const string& serviceName, const string& serviceUuid) {
  lock_guard<std::mutex> guard(serverMutex);
  if (running) {
    LOG(INFO) << "Server already running on " << endpoint;
    return true;
  }
  if (!checkCapability()) {
    return false;
  }
  SocketEndpoint newEndpoint(context->config.bindAddress,
                             context->config.channel);
  newEndpoint.setServiceName(serviceName);
  newEndpoint.setServiceUuid(serviceUuid);
  try {
    context->socketHandler->listen(newEndpoint);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Could not listen on " << newEndpoint << ": " << re.what();
    reportError(string("Failed to start server: ") + re.what());
    return false;
  }
  endpoint = newEndpoint;
  localAddress = endpoint.getName();
  running = true;
  stats.recordServerStart();
  LOG(INFO) << "Server '" << serviceName << "' listening on " << endpoint;
  acceptThread.reset(new std::thread(&LinkServer::acceptLoop, this));
  hub.emit([](LinkEventListener* l) { l->onServerStateChanged(true); });
  return true;
}

void LinkServer::stop() {
  unique_ptr<std::thread> finished;
  {
    lock_guard<std::mutex> guard(serverMutex);
    if (!running) {
      return;
    }
    running = false;
    finished = std::move(acceptThread);
  }
  if (finished) {
    finished->join();
  }
  context->socketHandler->stopListening(endpoint);
  LOG(INFO) << "Server stopped listening on " << endpoint;
  hub.emit([](LinkEventListener* l) { l->onServerStateChanged(false); });
}

bool LinkServer::disconnectClient(const string& address) {
  return registry->remove(address);
}

void LinkServer::acceptLoop() {
  el::Helpers::setThreadName("server-accept");
  auto socketHandler = context->socketHandler;
  while (running) {
    set<int> serverFds = socketHandler->getEndpointFds(endpoint);
    if (serverFds.empty()) {
      break;
    }
    for (int fd : serverFds) {
      if (!socketHandler->waitForData(fd, 0, 100 * 1000)) {
        continue;
      }
      int clientFd;
      try {
        clientFd = socketHandler->accept(fd);
      } catch (const std::runtime_error& re) {
        if (!running) {
          VLOG(1) << "Listener closed";
          return;
        }
        LOG(ERROR) << "Error accepting client: " << re.what();
        reportError(string("Accept failed: ") + re.what());
        continue;
      }
      if (clientFd < 0) {
        continue;
      }
      string address = socketHandler->getPeerAddress(clientFd);
      LOG(INFO) << "Accepted client " << address;
      stats.recordClientAccepted();
      stats.recordSuccessfulConnection();
      adopt(address, clientFd);
    }
  }
}
}  // namespace btlink
