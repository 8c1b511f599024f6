#include "LinkConfig.hpp"
#include "TestHeaders.hpp"

using namespace btlink;

TEST_CASE("Defaults", "[LinkConfig]") {
  LinkConfig config;
  REQUIRE(config.serviceName == DEFAULT_SERVICE_NAME);
  REQUIRE(config.serviceUuid == DEFAULT_SERVICE_UUID);
  REQUIRE(config.scanTimeoutMs == 15000);
  REQUIRE(config.transfer.chunkSize == 65536);
  REQUIRE(config.transfer.progressIntervalMs == 500);
  REQUIRE(config.reconnect.maxAttempts == 5);
  REQUIRE(config.reconnect.initialDelayMs == 2000);
  REQUIRE(config.reconnect.maxDelayMs == 30000);
  REQUIRE(config.shareDir.empty());
  REQUIRE(config.filters.empty());
}

TEST_CASE("Load from ini", "[LinkConfig]") {
  TempDir dir;
  string path = dir.file("btlink.cfg");
  writeFile(path,
            "[Server]\n"
            "service_name = Chat\n"
            "channel = 4\n"
            "share_dir = /srv/share\n"
            "bind_address = /tmp/btlink.sock\n"
            "[Transfer]\n"
            "chunk_size = 4096\n"
            "[Reconnect]\n"
            "enabled = false\n"
            "max_attempts = 0\n"
            "initial_delay_ms = 10\n"
            "[Connection]\n"
            "heartbeat_interval_ms = nonsense\n"
            "[Filter:zip]\n"
            "type = compression\n"
            "priority = 2\n"
            "threshold = 100\n"
            "[Filter:route]\n"
            "type = routing\n"
            "routingRules = text=chat, file_request=files\n");

  LinkConfig config = LinkConfig::loadFromFile(path);
  REQUIRE(config.serviceName == "Chat");
  REQUIRE(config.channel == 4);
  REQUIRE(config.shareDir == "/srv/share");
  REQUIRE(config.bindAddress == "/tmp/btlink.sock");
  REQUIRE(config.transfer.chunkSize == 4096);
  REQUIRE_FALSE(config.reconnect.enabled);
  // Out of range values are clamped
  REQUIRE(config.reconnect.maxAttempts == 1);
  REQUIRE(config.reconnect.initialDelayMs ==
          ReconnectConfig::MIN_INITIAL_DELAY_MS);
  REQUIRE(config.connection.heartbeatIntervalMs == 30000);

  REQUIRE(config.filters.size() == 2);
  REQUIRE(config.filters["zip"]["threshold"] == 100);
  REQUIRE(config.filters["route"]["routingRules"]["file_request"] == "files");
  vector<MessageFilter> filters = config.buildFilters();
  REQUIRE(filters.size() == 2);

  REQUIRE(config.toJson()["server"]["serviceName"] == "Chat");
}

TEST_CASE("Missing config file", "[LinkConfig]") {
  REQUIRE_THROWS_AS(LinkConfig::loadFromFile("/nonexistent/btlink.cfg"),
                    std::runtime_error);
}
