#ifndef __BTLINK_DISCOVERY_SOURCE__
#define __BTLINK_DISCOVERY_SOURCE__

#include "Headers.hpp"

namespace btlink {
struct DiscoveredDevice {
  string address;
  string name;
  /** @brief Class of device, 0 when unknown. */
  uint32_t deviceClass = 0;
  bool bonded = false;
  bool isConnected = false;

  json toJson() const;
};

typedef std::function<void(const DiscoveredDevice&)> DeviceFoundCallback;

/**
 * @brief Where scan results come from. Implementations may report the same
 * device more than once; callers deduplicate.
 */
class DiscoverySource {
 public:
  virtual ~DiscoverySource() {}
  virtual bool adapterAvailable(string* reason) = 0;
  /**
   * @brief Starts an inquiry lasting at most @p timeoutMs.
   * @return false if an inquiry is already running or cannot be started.
   * @p onFinished is called once when the inquiry ends on its own; it is
   * not called after cancel().
   */
  virtual bool start(int64_t timeoutMs, DeviceFoundCallback onFound,
                     std::function<void()> onFinished) = 0;
  virtual void cancel() = 0;
  virtual bool isDiscovering() = 0;
};

/** @brief Classic inquiry through the BlueZ HCI library. */
class HciDiscoverySource : public DiscoverySource {
 public:
  explicit HciDiscoverySource(shared_ptr<ThreadPool> _threadPool);
  virtual ~HciDiscoverySource();

  virtual bool adapterAvailable(string* reason);
  virtual bool start(int64_t timeoutMs, DeviceFoundCallback onFound,
                     std::function<void()> onFinished);
  virtual void cancel();
  virtual bool isDiscovering() { return state->discovering; }

  /** @brief Shared with the inquiry task, which may outlive this object. */
  struct InquiryState {
    atomic<bool> discovering;
    /** @brief Bumped by cancel() so a finishing inquiry stays silent. */
    atomic<int64_t> generation;

    InquiryState() : discovering(false), generation(0), deviceBusy(false) {}

    /**
     * @brief Waits for the previous inquiry task to let go of the HCI
     * device, then takes it.
     * @return false if it was still held after @p timeout.
     */
    bool claimDevice(std::chrono::milliseconds timeout) {
      std::unique_lock<std::mutex> lock(deviceMutex);
      if (!deviceCv.wait_for(lock, timeout, [this] { return !deviceBusy; })) {
        return false;
      }
      deviceBusy = true;
      return true;
    }

    void releaseDevice() {
      lock_guard<std::mutex> guard(deviceMutex);
      deviceBusy = false;
      deviceCv.notify_all();
    }

   protected:
    std::mutex deviceMutex;
    std::condition_variable deviceCv;
    bool deviceBusy;
  };

 protected:

  static void runInquiry(shared_ptr<InquiryState> state, int64_t timeoutMs,
                         int64_t generation, DeviceFoundCallback onFound,
                         std::function<void()> onFinished);

  shared_ptr<ThreadPool> threadPool;
  shared_ptr<InquiryState> state;
};
}  // namespace btlink

#endif  // __BTLINK_DISCOVERY_SOURCE__
