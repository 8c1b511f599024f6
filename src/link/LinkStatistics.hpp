#ifndef __BTLINK_LINK_STATISTICS__
#define __BTLINK_LINK_STATISTICS__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief Process-wide counters for one session manager. Every record call
 * is a single atomic increment and may come from any thread.
 */
class LinkStatistics {
 public:
  LinkStatistics();

  void recordConnectionAttempt() { connectionAttempts++; }
  void recordSuccessfulConnection() { successfulConnections++; }
  void recordFailedConnection() { failedConnections++; }
  void recordDisconnection() { disconnections++; }
  void recordClientAccepted() { clientsAccepted++; }
  void recordServerStart() { serverStarts++; }

  void recordMessageSent(int64_t bytes) {
    messagesSent++;
    bytesSent += bytes;
  }
  void recordMessageReceived(int64_t bytes) {
    messagesReceived++;
    bytesReceived += bytes;
  }
  /** @brief A message dropped by validation. */
  void recordMessageFiltered() { messagesFiltered++; }

  void recordTransferStart() { transfersStarted++; }
  void recordTransferCompleted(int64_t bytes, bool upload);
  void recordTransferFailed() { transfersFailed++; }
  void recordTransferCancelled() { transfersCancelled++; }

  void recordScanAttempt() { scanAttempts++; }
  void recordDeviceDiscovered() { devicesDiscovered++; }

  void recordReconnectAttempt() { reconnectAttempts++; }
  void recordReconnectSuccess() { reconnectSuccesses++; }

  void recordError() { errors++; }

  int64_t uptimeMs() const { return nowEpochMs() - startTime; }
  /** @return Percentage in [0, 100], 0 when nothing was attempted. */
  double connectionSuccessRate() const;
  double transferSuccessRate() const;
  int64_t averageTransferSize() const;
  /** @return Bytes per second of completed transfers since the last reset. */
  double averageTransferRate() const;
  double averageDevicesPerScan() const;

  json snapshot() const;
  /** @brief One line human readable summary. */
  string summary() const;
  void logStatistics() const;
  void reset();

 protected:
  atomic<int64_t> connectionAttempts;
  atomic<int64_t> successfulConnections;
  atomic<int64_t> failedConnections;
  atomic<int64_t> disconnections;
  atomic<int64_t> clientsAccepted;
  atomic<int64_t> serverStarts;
  atomic<int64_t> messagesSent;
  atomic<int64_t> messagesReceived;
  atomic<int64_t> messagesFiltered;
  atomic<int64_t> bytesSent;
  atomic<int64_t> bytesReceived;
  atomic<int64_t> transfersStarted;
  atomic<int64_t> transfersCompleted;
  atomic<int64_t> transfersFailed;
  atomic<int64_t> transfersCancelled;
  atomic<int64_t> filesSent;
  atomic<int64_t> filesReceived;
  atomic<int64_t> bytesTransferred;
  atomic<int64_t> scanAttempts;
  atomic<int64_t> devicesDiscovered;
  atomic<int64_t> reconnectAttempts;
  atomic<int64_t> reconnectSuccesses;
  atomic<int64_t> errors;
  atomic<int64_t> startTime;
  atomic<int64_t> lastResetTime;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_STATISTICS__
