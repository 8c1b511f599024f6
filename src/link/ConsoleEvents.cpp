#include "ConsoleEvents.hpp"

namespace btlink {
void ConsoleEvents::onConnectionEstablished(const string& address) {
  CLOG(INFO, "stdout") << "Connected: " << address << endl;
}

void ConsoleEvents::onConnectionLost(const string& address) {
  CLOG(INFO, "stdout") << "Disconnected: " << address << endl;
}

void ConsoleEvents::onConnectionFailed(const string& address,
                                       const string& error) {
  CLOG(INFO, "stdout") << "Connection to " << address << " failed: " << error
                       << endl;
}

void ConsoleEvents::onMessageReceived(const Message& message) {
  CLOG(INFO, "stdout") << "[" << message.metadataString("senderAddress")
                       << "] " << message.type << ": "
                       << message.content.value_or("") << endl;
}

void ConsoleEvents::onDataReceived(const string& address, const string& data) {
  CLOG(INFO, "stdout") << "[" << address << "] " << data.length()
                       << " bytes of data" << endl;
}

void ConsoleEvents::onCommandReceived(const string& address,
                                      const string& command) {
  CLOG(INFO, "stdout") << "[" << address << "] command: " << command << endl;
}

void ConsoleEvents::onDeviceInfo(const string& address,
                                 const DeviceInfo& info) {
  CLOG(INFO, "stdout") << "Device " << address << ": " << info.device_name()
                       << " (" << info.os_version() << ", btlink "
                       << info.app_version() << ")" << endl;
  done("deviceinfo");
}

void ConsoleEvents::onDeviceDiscovered(const DiscoveredDevice& device) {
  CLOG(INFO, "stdout") << device.address << "  " << device.name << endl;
}

void ConsoleEvents::onScanFinished(int devicesFound) {
  CLOG(INFO, "stdout") << "Scan finished, " << devicesFound
                       << " devices found" << endl;
  done("scan");
}

void ConsoleEvents::onServerStateChanged(bool running) {
  CLOG(INFO, "stdout") << "Server " << (running ? "started" : "stopped")
                       << endl;
}

void ConsoleEvents::onTransferProgress(const TransferProgress& progress) {
  CLOG(INFO, "stdout") << progress.transferId << ": "
                       << int(progress.percentage) << "% ("
                       << progress.transferredBytes << "/"
                       << progress.totalBytes << ")" << endl;
}

void ConsoleEvents::onTransferCompleted(const string& transferId,
                                        const string& path) {
  CLOG(INFO, "stdout") << transferId << " completed: " << path << endl;
  done(transferId);
}

void ConsoleEvents::onTransferFailed(const string& transferId,
                                     const string& reason) {
  CLOG(INFO, "stdout") << "Transfer " << transferId << " failed: " << reason
                       << endl;
  done(transferId, false);
}

void ConsoleEvents::onTransferCancelled(const string& transferId) {
  CLOG(INFO, "stdout") << transferId << " cancelled" << endl;
  done(transferId, false);
}

void ConsoleEvents::onReconnectAttempt(const string& address, int attempt,
                                       int maxAttempts) {
  CLOG(INFO, "stdout") << "Reconnecting to " << address << " (" << attempt
                       << "/" << maxAttempts << ")" << endl;
}

void ConsoleEvents::onReconnectFailed(const string& address, int attempts) {
  CLOG(INFO, "stdout") << "Gave up on " << address << " after " << attempts
                       << " attempts" << endl;
}

void ConsoleEvents::onError(const string& message) {
  CLOG(INFO, "stdout") << "Error: " << message << endl;
}

bool ConsoleEvents::waitFor(const string& key,
                            std::chrono::milliseconds timeout) {
  unique_lock<std::mutex> guard(eventMutex);
  return eventCv.wait_for(guard, timeout,
                          [&] { return finished.count(key) > 0; });
}

bool ConsoleEvents::waitForTransfer(const string& transferId,
                                    std::chrono::milliseconds timeout) {
  if (transferId.empty()) {
    return false;
  }
  if (!waitFor(transferId, timeout)) {
    LOG(WARNING) << "Timed out waiting for " << transferId;
    return false;
  }
  lock_guard<std::mutex> guard(eventMutex);
  return finished[transferId];
}

void ConsoleEvents::done(const string& key, bool succeeded) {
  lock_guard<std::mutex> guard(eventMutex);
  finished[key] = succeeded;
  eventCv.notify_all();
}
}  // namespace btlink
