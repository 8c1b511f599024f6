#include "LinkStatistics.hpp"

namespace btlink {
LinkStatistics::LinkStatistics() : startTime(nowEpochMs()) { reset(); }

void LinkStatistics::recordTransferCompleted(int64_t bytes, bool upload) {
  transfersCompleted++;
  bytesTransferred += bytes;
  if (upload) {
    filesSent++;
  } else {
    filesReceived++;
  }
}

double LinkStatistics::connectionSuccessRate() const {
  int64_t attempts = connectionAttempts;
  if (attempts == 0) {
    return 0;
  }
  return successfulConnections * 100.0 / attempts;
}

double LinkStatistics::transferSuccessRate() const {
  int64_t started = transfersStarted;
  if (started == 0) {
    return 0;
  }
  return transfersCompleted * 100.0 / started;
}

int64_t LinkStatistics::averageTransferSize() const {
  int64_t completed = transfersCompleted;
  if (completed == 0) {
    return 0;
  }
  return bytesTransferred / completed;
}

double LinkStatistics::averageTransferRate() const {
  int64_t elapsedMs = nowEpochMs() - lastResetTime;
  if (elapsedMs <= 0) {
    return 0;
  }
  return bytesTransferred * 1000.0 / elapsedMs;
}

double LinkStatistics::averageDevicesPerScan() const {
  int64_t scans = scanAttempts;
  if (scans == 0) {
    return 0;
  }
  return double(devicesDiscovered) / scans;
}

json LinkStatistics::snapshot() const {
  json j;
  j["connections"] = {{"attempts", int64_t(connectionAttempts)},
                      {"successful", int64_t(successfulConnections)},
                      {"failed", int64_t(failedConnections)},
                      {"lost", int64_t(disconnections)},
                      {"accepted", int64_t(clientsAccepted)},
                      {"successRate", connectionSuccessRate()}};
  j["messages"] = {{"sent", int64_t(messagesSent)},
                   {"received", int64_t(messagesReceived)},
                   {"filtered", int64_t(messagesFiltered)},
                   {"bytesSent", int64_t(bytesSent)},
                   {"bytesReceived", int64_t(bytesReceived)}};
  j["transfers"] = {{"started", int64_t(transfersStarted)},
                    {"completed", int64_t(transfersCompleted)},
                    {"failed", int64_t(transfersFailed)},
                    {"cancelled", int64_t(transfersCancelled)},
                    {"filesSent", int64_t(filesSent)},
                    {"filesReceived", int64_t(filesReceived)},
                    {"bytes", int64_t(bytesTransferred)},
                    {"successRate", transferSuccessRate()},
                    {"averageSize", averageTransferSize()},
                    {"averageRate", averageTransferRate()}};
  j["discovery"] = {{"scans", int64_t(scanAttempts)},
                    {"devices", int64_t(devicesDiscovered)},
                    {"averagePerScan", averageDevicesPerScan()}};
  j["reconnect"] = {{"attempts", int64_t(reconnectAttempts)},
                    {"successes", int64_t(reconnectSuccesses)}};
  j["serverStarts"] = int64_t(serverStarts);
  j["errors"] = int64_t(errors);
  j["uptime"] = uptimeMs();
  j["lastReset"] = int64_t(lastResetTime);
  return j;
}

string LinkStatistics::summary() const {
  std::ostringstream ss;
  ss.precision(1);
  ss << std::fixed << "connections " << successfulConnections.load() << "/"
     << connectionAttempts.load() << " (" << connectionSuccessRate() << "%), "
     << "messages " << messagesSent.load() << " out "
     << messagesReceived.load() << " in, transfers "
     << transfersCompleted.load() << "/" << transfersStarted.load() << " ("
     << bytesTransferred.load() << " bytes), errors " << errors.load()
     << ", uptime " << uptimeMs() / 1000 << "s";
  return ss.str();
}

void LinkStatistics::logStatistics() const {
  LOG(INFO) << "Statistics: " << summary();
}

void LinkStatistics::reset() {
  connectionAttempts = 0;
  successfulConnections = 0;
  failedConnections = 0;
  disconnections = 0;
  clientsAccepted = 0;
  serverStarts = 0;
  messagesSent = 0;
  messagesReceived = 0;
  messagesFiltered = 0;
  bytesSent = 0;
  bytesReceived = 0;
  transfersStarted = 0;
  transfersCompleted = 0;
  transfersFailed = 0;
  transfersCancelled = 0;
  filesSent = 0;
  filesReceived = 0;
  bytesTransferred = 0;
  scanAttempts = 0;
  devicesDiscovered = 0;
  reconnectAttempts = 0;
  reconnectSuccesses = 0;
  errors = 0;
  lastResetTime = nowEpochMs();
}
}  // namespace btlink
