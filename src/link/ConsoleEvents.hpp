#ifndef __BTLINK_CONSOLE_EVENTS__
#define __BTLINK_CONSOLE_EVENTS__

#include "Headers.hpp"
#include "LinkEvents.hpp"

namespace btlink {
/**
 * @brief Prints every event to stdout and lets the command line tool wait
 * for the ones it cares about.
 */
class ConsoleEvents : public LinkEventListener {
 public:
  virtual void onConnectionEstablished(const string& address);
  virtual void onConnectionLost(const string& address);
  virtual void onConnectionFailed(const string& address, const string& error);
  virtual void onMessageReceived(const Message& message);
  virtual void onDataReceived(const string& address, const string& data);
  virtual void onCommandReceived(const string& address, const string& command);
  virtual void onDeviceInfo(const string& address, const DeviceInfo& info);
  virtual void onDeviceDiscovered(const DiscoveredDevice& device);
  virtual void onScanFinished(int devicesFound);
  virtual void onServerStateChanged(bool running);
  virtual void onTransferProgress(const TransferProgress& progress);
  virtual void onTransferCompleted(const string& transferId,
                                   const string& path);
  virtual void onTransferFailed(const string& transferId,
                                const string& reason);
  virtual void onTransferCancelled(const string& transferId);
  virtual void onReconnectAttempt(const string& address, int attempt,
                                  int maxAttempts);
  virtual void onReconnectFailed(const string& address, int attempts);
  virtual void onError(const string& message);

  /** @brief Waits until done(@p key) was called, up to @p timeout. */
  bool waitFor(const string& key, std::chrono::milliseconds timeout);

  /**
   * @brief Waits for a transfer to end.
   * @return true only if it completed. Failed, cancelled, unknown or still
   * running transfers give false.
   */
  bool waitForTransfer(const string& transferId,
                       std::chrono::milliseconds timeout);

 protected:
  void done(const string& key, bool succeeded = true);

  std::mutex eventMutex;
  std::condition_variable eventCv;
  /** @brief Finished keys and whether each one succeeded. */
  map<string, bool> finished;
};
}  // namespace btlink

#endif  // __BTLINK_CONSOLE_EVENTS__
