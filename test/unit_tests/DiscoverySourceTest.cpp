#include "DiscoverySource.hpp"

#include "TestHeaders.hpp"

using namespace btlink;

TEST_CASE("Inquiries take turns on the adapter", "[DiscoverySource]") {
  HciDiscoverySource::InquiryState state;
  REQUIRE(state.claimDevice(std::chrono::milliseconds(10)));
  // A cancelled inquiry still holds the device until its task exits
  state.generation++;
  REQUIRE_FALSE(state.claimDevice(std::chrono::milliseconds(50)));

  std::thread finishing([&state] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    state.releaseDevice();
  });
  int64_t before = nowSteadyMs();
  REQUIRE(state.claimDevice(std::chrono::seconds(5)));
  REQUIRE(nowSteadyMs() - before >= 50);
  finishing.join();

  state.releaseDevice();
  REQUIRE(state.claimDevice(std::chrono::milliseconds(10)));
}
