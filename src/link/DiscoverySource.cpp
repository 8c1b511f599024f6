#include "DiscoverySource.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>

#include "RfcommSocketHandler.hpp"

namespace btlink {
namespace {
// One inquiry unit is 1.28 seconds
const int64_t INQUIRY_UNIT_MS = 1280;
const int MAX_INQUIRY_UNITS = 8;
const int MAX_RESPONSES = 255;
const int NAME_TIMEOUT_MS = 2000;
// Longest a cancelled inquiry keeps the device: one inquiry call and one
// name lookup
const std::chrono::milliseconds INQUIRY_DRAIN_TIMEOUT(
    MAX_INQUIRY_UNITS * INQUIRY_UNIT_MS + NAME_TIMEOUT_MS + 1000);
}  // namespace

json DiscoveredDevice::toJson() const {
  json j;
  j["address"] = address;
  j["name"] = name;
  j["type"] = deviceClass;
  j["bondState"] = bonded ? "bonded" : "none";
  j["isConnected"] = isConnected;
  return j;
}

HciDiscoverySource::HciDiscoverySource(shared_ptr<ThreadPool> _threadPool)
    : threadPool(_threadPool), state(make_shared<InquiryState>()) {}

HciDiscoverySource::~HciDiscoverySource() { cancel(); }

bool HciDiscoverySource::adapterAvailable(string* reason) {
  return RfcommSocketHandler::adapterAvailable(reason);
}

bool HciDiscoverySource::start(int64_t timeoutMs, DeviceFoundCallback onFound,
                               std::function<void()> onFinished) {
  bool expected = false;
  if (!state->discovering.compare_exchange_strong(expected, true)) {
    return false;
  }
  if (!state->claimDevice(INQUIRY_DRAIN_TIMEOUT)) {
    LOG(WARNING) << "Previous inquiry is still using the adapter";
    state->discovering = false;
    return false;
  }
  int64_t current = ++state->generation;
  auto inquiryState = state;
  try {
    threadPool->enqueue(
        [inquiryState, timeoutMs, current, onFound, onFinished] {
          runInquiry(inquiryState, timeoutMs, current, onFound, onFinished);
        });
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Could not start inquiry: " << re.what();
    state->releaseDevice();
    state->discovering = false;
    return false;
  }
  return true;
}

void HciDiscoverySource::cancel() {
  state->generation++;
  state->discovering = false;
}

void HciDiscoverySource::runInquiry(shared_ptr<InquiryState> state,
                                    int64_t timeoutMs, int64_t myGeneration,
                                    DeviceFoundCallback onFound,
                                    std::function<void()> onFinished) {
  el::Helpers::setThreadName("inquiry");
  int deviceId = hci_get_route(NULL);
  int hciSocket = deviceId < 0 ? -1 : hci_open_dev(deviceId);
  if (hciSocket < 0) {
    LOG(WARNING) << "Cannot open HCI device: " << strerror(GetErrno());
  } else {
    int64_t deadline = nowSteadyMs() + timeoutMs;
    vector<inquiry_info> responses(MAX_RESPONSES);
    while (state->generation == myGeneration && nowSteadyMs() < deadline) {
      int64_t remaining = deadline - nowSteadyMs();
      int units = int(std::max<int64_t>(
          1, std::min<int64_t>(MAX_INQUIRY_UNITS, remaining / INQUIRY_UNIT_MS)));
      inquiry_info* results = &responses[0];
      int found = hci_inquiry(deviceId, units, MAX_RESPONSES, NULL, &results,
                              IREQ_CACHE_FLUSH);
      if (found < 0) {
        LOG(WARNING) << "Inquiry failed: " << strerror(GetErrno());
        break;
      }
      for (int i = 0; i < found && state->generation == myGeneration; i++) {
        DiscoveredDevice device;
        char address[19];
        ba2str(&responses[i].bdaddr, address);
        device.address = address;
        device.deviceClass = uint32_t(responses[i].dev_class[0]) |
                             (uint32_t(responses[i].dev_class[1]) << 8) |
                             (uint32_t(responses[i].dev_class[2]) << 16);
        char name[248];
        memset(name, 0, sizeof(name));
        if (hci_read_remote_name(hciSocket, &responses[i].bdaddr, sizeof(name),
                                 name, NAME_TIMEOUT_MS) == 0) {
          device.name = name;
        }
        VLOG(1) << "Inquiry found " << device.address << " (" << device.name
                << ")";
        onFound(device);
      }
    }
    ::close(hciSocket);
  }
  state->releaseDevice();
  if (state->generation == myGeneration) {
    state->discovering = false;
    onFinished();
  }
}
}  // namespace btlink
