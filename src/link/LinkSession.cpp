#include "LinkSession.hpp"

namespace btlink {
namespace {
const std::chrono::seconds LEASE_TIMEOUT(5);
}

shared_ptr<LinkContext> LinkContext::create(
    const LinkConfig& config, shared_ptr<SocketHandler> socketHandler,
    CapabilityCheck capabilityCheck) {
  auto context = make_shared<LinkContext>();
  context->config = config;
  context->socketHandler = socketHandler;
  context->threadPool = make_shared<ThreadPool>(size_t(config.workerThreads));
  context->timerQueue = make_shared<TimerQueue>();
  context->eventQueue = make_shared<EventQueue>();
  context->capabilityCheck = capabilityCheck;
  return context;
}

LinkSession::LinkSession(shared_ptr<LinkContext> _context, const string& _role)
    : context(_context),
      role(_role),
      hub(_context->eventQueue),
      shuttingDown(false) {
  connectionEvents = make_shared<ConnectionEvents>(this);
  transferEvents = make_shared<TransferEvents>(this);
  transfers =
      make_shared<TransferEngine>(context->threadPool, context->config.transfer);
  registry = make_shared<ConnectionRegistry>(
      context->socketHandler, context->timerQueue, context->config.connection);

  for (const auto& it : context->config.filters) {
    try {
      pipeline.addFilter(MessageFilter::fromConfig(it.first, it.second));
    } catch (const std::invalid_argument& ia) {
      LOG(ERROR) << "Skipping filter " << it.first << ": " << ia.what();
    }
  }
}

LinkSession::~LinkSession() { shutdownSession(); }

void LinkSession::shutdownSession() {
  if (shuttingDown.exchange(true)) {
    return;
  }
  VLOG(1) << "Shutting down " << role << " session";
  transfers->shutdown();
  registry->shutdown();
}

Subscription LinkSession::subscribe(shared_ptr<LinkEventListener> listener) {
  return hub.subscribe(listener);
}

bool LinkSession::checkCapability() {
  if (!context->capabilityCheck) {
    return true;
  }
  string reason;
  if (context->capabilityCheck(&reason)) {
    return true;
  }
  LOG(WARNING) << "Capability check failed: " << reason;
  reportError(reason);
  return false;
}

void LinkSession::reportError(const string& error) {
  stats.recordError();
  hub.emit([error](LinkEventListener* l) { l->onError(error); });
}

void LinkSession::adopt(const string& address, int socketFd) {
  registry->add(address, socketFd, connectionEvents);
}

Packet LinkSession::encodeMessage(const Message& message) {
  Message filtered = pipeline.applyOutgoing(message);
  return Packet(PacketType::MESSAGE, filtered.encode());
}

bool LinkSession::sendMessage(const string& address, const Message& message) {
  Packet packet;
  try {
    packet = encodeMessage(message);
  } catch (const ValidationError& ve) {
    LOG(WARNING) << "Not sending " << message.type << " to " << address
                 << ": " << ve.what();
    stats.recordMessageFiltered();
    reportError(string("Message rejected: ") + ve.what());
    return false;
  }
  if (!registry->send(address, packet)) {
    return false;
  }
  stats.recordMessageSent(packet.length());
  return true;
}

bool LinkSession::sendText(const string& address, const string& text) {
  return sendMessage(address, makeTextMessage(text));
}

bool LinkSession::sendData(const string& address, const string& bytes) {
  if (!registry->sendData(address, bytes)) {
    return false;
  }
  stats.recordMessageSent(bytes.length());
  return true;
}

bool LinkSession::sendCommand(const string& address, const string& command) {
  if (!registry->sendCommand(address, command)) {
    return false;
  }
  stats.recordMessageSent(command.length());
  return true;
}

bool LinkSession::requestDeviceInfo(const string& address) {
  return sendMessage(address, makeDeviceInfoRequest());
}

bool LinkSession::sendDeviceInfo(const string& address) {
  return sendMessage(address,
                     makeDeviceInfoMessage(localDeviceInfo(
                         context->config.deviceName, localAddress)));
}

string LinkSession::sendFile(const string& address, const string& filePath) {
  std::error_code ec;
  unique_ptr<StreamLease> lease;
  Packet announcement;
  if (fs::is_regular_file(filePath, ec)) {
    try {
      announcement = encodeMessage(
          makeFileTransfer(fs::path(filePath).filename().string(),
                           int64_t(fs::file_size(filePath, ec))));
    } catch (const ValidationError& ve) {
      transferEvents->onFailed("", string("Message rejected: ") + ve.what());
      return "";
    }
    lease = registry->acquireStream(address, LEASE_TIMEOUT);
  }
  string transferId = transfers->startUpload(
      std::move(lease), filePath, transferEvents,
      [announcement](StreamLease* l) { l->writePacket(announcement); });
  if (!transferId.empty()) {
    stats.recordTransferStart();
  }
  return transferId;
}

string LinkSession::requestFile(const string& address, const string& fileName,
                                const string& savePath) {
  Packet request;
  try {
    request = encodeMessage(makeFileRequest(fileName));
  } catch (const ValidationError& ve) {
    transferEvents->onFailed("", string("Message rejected: ") + ve.what());
    return "";
  }
  auto lease = registry->acquireStream(address, LEASE_TIMEOUT);
  string transferId = transfers->startDownload(
      std::move(lease), fileName, savePath, transferEvents,
      [this, request, address](StreamLease* l) {
        l->writePacket(request);
        while (true) {
          Packet packet = l->readPacket();
          if (packet.getType() == PacketType::HEARTBEAT) {
            continue;
          }
          if (packet.getType() != PacketType::MESSAGE) {
            handlePacket(address, packet);
            continue;
          }
          auto reply = receiveMessage(address, packet.getPayload());
          if (!reply) {
            continue;
          }
          if (reply->type == MessageTypes::FILE_REQUEST_ERROR) {
            throw TransferRefused(
                reply->metadataString("error", reply->content.value_or("")));
          }
          if (reply->type == MessageTypes::FILE_TRANSFER) {
            return;
          }
          if (needsStream(*reply)) {
            // Answering writes on the stream this preamble holds.
            deferMessage(address, *reply);
          } else {
            handleMessage(address, *reply);
          }
        }
      });
  if (!transferId.empty()) {
    stats.recordTransferStart();
  }
  return transferId;
}

bool LinkSession::cancelTransfer(const string& transferId) {
  return transfers->cancel(transferId);
}

vector<string> LinkSession::activeTransfers() {
  return transfers->activeTransferIds();
}

optional<TransferInfo> LinkSession::transferInfo(const string& transferId) {
  return transfers->transferInfo(transferId);
}

vector<string> LinkSession::connectedDevices() {
  return registry->connectedDevices();
}

bool LinkSession::isConnected(const string& address) {
  return registry->isConnected(address);
}

optional<ConnectionStats> LinkSession::connectionStats(const string& address) {
  return registry->stats(address);
}

void LinkSession::handleConnected(const string& address) {
  hub.emit([address](LinkEventListener* l) {
    l->onConnectionEstablished(address);
  });
}

void LinkSession::handleDisconnected(const string& address) {
  stats.recordDisconnection();
  hub.emit([address](LinkEventListener* l) { l->onConnectionLost(address); });
}

void LinkSession::handleConnectionFailed(const string& address,
                                         const string& error) {
  stats.recordFailedConnection();
  hub.emit([address, error](LinkEventListener* l) {
    l->onConnectionFailed(address, error);
  });
}

void LinkSession::handlePacket(const string& address, const Packet& packet) {
  const string& payload = packet.getPayload();
  switch (packet.getType()) {
    case PacketType::MESSAGE: {
      auto message = receiveMessage(address, payload);
      if (message) {
        handleMessage(address, *message);
      }
      break;
    }
    case PacketType::RAW_DATA:
      stats.recordMessageReceived(payload.length());
      hub.emit([address, payload](LinkEventListener* l) {
        l->onDataReceived(address, payload);
      });
      break;
    case PacketType::COMMAND:
      stats.recordMessageReceived(payload.length());
      hub.emit([address, payload](LinkEventListener* l) {
        l->onCommandReceived(address, payload);
      });
      break;
    case PacketType::HEARTBEAT:
      break;
  }
}

optional<Message> LinkSession::receiveMessage(const string& address,
                                              const string& payload) {
  stats.recordMessageReceived(payload.length());
  try {
    Message message = pipeline.applyIncoming(Message::decode(payload));
    message.metadata["senderAddress"] = address;
    return message;
  } catch (const ValidationError& ve) {
    LOG(WARNING) << "Dropping message from " << address << ": " << ve.what();
    stats.recordMessageFiltered();
    reportError(string("Invalid message from ") + address + ": " + ve.what());
    return nullopt;
  }
}

void LinkSession::handleMessage(const string& address,
                                const Message& message) {
  VLOG(1) << role << " got " << message.type << " from " << address;
  if (message.type == MessageTypes::DEVICE_INFO_REQUEST) {
    sendDeviceInfo(address);
  } else if (message.type == MessageTypes::DEVICE_INFO) {
    try {
      DeviceInfo info = parseDeviceInfo(message);
      hub.emit([address, info](LinkEventListener* l) {
        l->onDeviceInfo(address, info);
      });
    } catch (const std::invalid_argument& ia) {
      reportError(string("Bad device info from ") + address + ": " +
                  ia.what());
    }
  } else if (message.type == MessageTypes::FILE_REQUEST) {
    serveFileRequest(address, message);
  } else if (message.type == MessageTypes::FILE_TRANSFER) {
    receiveAnnouncedFile(address, message);
  } else {
    hub.emit([message](LinkEventListener* l) { l->onMessageReceived(message); });
  }
}

bool LinkSession::needsStream(const Message& message) {
  return message.type == MessageTypes::FILE_REQUEST ||
         message.type == MessageTypes::DEVICE_INFO_REQUEST;
}

void LinkSession::deferMessage(const string& address, const Message& message) {
  VLOG(1) << "Deferring " << message.type << " from " << address
          << " until the stream is released";
  lock_guard<std::mutex> guard(deferredMutex);
  deferredMessages.push_back(make_pair(address, message));
}

void LinkSession::handleDeferredMessages() {
  vector<pair<string, Message>> pending;
  {
    lock_guard<std::mutex> guard(deferredMutex);
    pending.swap(deferredMessages);
  }
  if (shuttingDown) {
    return;
  }
  for (const auto& it : pending) {
    handleMessage(it.first, it.second);
  }
}

bool LinkSession::resolveSharedFile(const string& fileName, fs::path* path,
                                    string* error) {
  const string& shareDir = context->config.shareDir;
  if (shareDir.empty()) {
    *error = "File sharing is disabled";
    return false;
  }
  fs::path requested(fileName);
  if (fileName.empty() || requested.is_absolute()) {
    *error = "Invalid file name: " + fileName;
    return false;
  }
  for (const auto& part : requested) {
    if (part == "..") {
      *error = "Invalid file name: " + fileName;
      return false;
    }
  }
  std::error_code ec;
  fs::path base = fs::weakly_canonical(fs::path(shareDir), ec);
  fs::path full = fs::weakly_canonical(base / requested, ec);
  if (ec) {
    *error = "File not found: " + fileName;
    return false;
  }
  // Symlinks may still point outside the share directory.
  auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(),
                                full.end());
  if (mismatch.first != base.end()) {
    *error = "Invalid file name: " + fileName;
    return false;
  }
  if (!fs::is_regular_file(full, ec)) {
    *error = "File not found: " + fileName;
    return false;
  }
  *path = full;
  return true;
}

void LinkSession::serveFileRequest(const string& address,
                                   const Message& message) {
  string fileName = message.metadataString("fileName");
  fs::path path;
  string error;
  if (!resolveSharedFile(fileName, &path, &error)) {
    LOG(INFO) << "Refusing file request for '" << fileName << "' from "
              << address << ": " << error;
    sendMessage(address, makeFileRequestError(fileName, error));
    return;
  }
  Packet announcement;
  try {
    std::error_code ec;
    announcement = encodeMessage(
        makeFileTransfer(fileName, int64_t(fs::file_size(path, ec))));
  } catch (const ValidationError& ve) {
    reportError(string("Cannot answer file request: ") + ve.what());
    return;
  }
  auto lease = registry->acquireStream(address, LEASE_TIMEOUT);
  if (!lease) {
    reportError("Stream to " + address + " is busy, dropping file request");
    return;
  }
  LOG(INFO) << "Serving " << path << " to " << address;
  string transferId = transfers->startUpload(
      std::move(lease), path.string(), transferEvents,
      [announcement](StreamLease* l) { l->writePacket(announcement); });
  if (!transferId.empty()) {
    stats.recordTransferStart();
  }
}

void LinkSession::receiveAnnouncedFile(const string& address,
                                       const Message& message) {
  string fileName =
      fs::path(message.metadataString("fileName")).filename().string();
  if (fileName.empty() || fileName == "." || fileName == "..") {
    fileName = "received_" + to_string(nowEpochMs());
  }
  // The file bytes follow the announcement right away.
  auto lease = registry->acquireStream(address, LEASE_TIMEOUT);
  if (!lease) {
    reportError("Cannot receive " + fileName + " from " + address +
                ", dropping the connection");
    registry->remove(address);
    return;
  }
  fs::path savePath = fs::path(context->config.downloadDir) / fileName;
  LOG(INFO) << "Receiving " << fileName << " from " << address << " into "
            << savePath;
  string transferId = transfers->startDownload(
      std::move(lease), fileName, savePath.string(), transferEvents);
  if (!transferId.empty()) {
    stats.recordTransferStart();
  }
}

void LinkSession::ConnectionEvents::onConnected(const string& address) {
  session->handleConnected(address);
}

void LinkSession::ConnectionEvents::onDisconnected(const string& address) {
  session->handleDisconnected(address);
}

void LinkSession::ConnectionEvents::onConnectionFailed(const string& address,
                                                       const string& error) {
  session->handleConnectionFailed(address, error);
}

void LinkSession::ConnectionEvents::onPacket(const string& address,
                                             const Packet& packet) {
  session->handlePacket(address, packet);
}

void LinkSession::ConnectionEvents::onError(const string& address,
                                            const string& error) {
  session->reportError(address + ": " + error);
}

void LinkSession::TransferEvents::onProgress(const TransferProgress& progress) {
  session->hub.emit([progress](LinkEventListener* l) {
    l->onTransferProgress(progress);
  });
}

void LinkSession::TransferEvents::onCompleted(const string& transferId,
                                              const string& path) {
  auto info = session->transfers->transferInfo(transferId);
  if (info) {
    session->stats.recordTransferCompleted(
        info->totalBytes, info->direction == TransferDirection::UPLOAD);
  }
  session->hub.emit([transferId, path](LinkEventListener* l) {
    l->onTransferCompleted(transferId, path);
  });
  session->handleDeferredMessages();
}

void LinkSession::TransferEvents::onFailed(const string& transferId,
                                           const string& reason) {
  session->stats.recordTransferFailed();
  session->hub.emit([transferId, reason](LinkEventListener* l) {
    l->onTransferFailed(transferId, reason);
  });
  session->handleDeferredMessages();
}

void LinkSession::TransferEvents::onCancelled(const string& transferId) {
  session->stats.recordTransferCancelled();
  session->hub.emit([transferId](LinkEventListener* l) {
    l->onTransferCancelled(transferId);
  });
  session->handleDeferredMessages();
}
}  // namespace btlink
