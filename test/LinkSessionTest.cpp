#include "LinkClient.hpp"
#include "LinkServer.hpp"
#include "PipeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace btlink;

namespace {
class WaitingListener : public LinkEventListener {
 public:
  virtual void onConnectionEstablished(const string& address) {
    record("connected", address);
  }
  virtual void onConnectionLost(const string& address) {
    record("lost", address);
  }
  virtual void onMessageReceived(const Message& message) {
    lock_guard<std::mutex> guard(eventMutex);
    messages.push_back(message);
    eventCv.notify_all();
  }
  virtual void onDeviceInfo(const string& address, const DeviceInfo& info) {
    record("deviceinfo", info.device_name());
  }
  virtual void onTransferCompleted(const string& transferId,
                                   const string& path) {
    record("completed", path);
  }
  virtual void onTransferFailed(const string& transferId,
                                const string& reason) {
    record("failed", reason);
  }
  virtual void onConnectionFailed(const string& address,
                                  const string& error) {
    record("connectfailed", address);
  }
  virtual void onServerStateChanged(bool running) {
    record("serverstate", running ? "running" : "stopped");
  }
  virtual void onReconnectSuccess(const string& address, int attempts) {
    record("reconnected", address);
  }
  virtual void onDeviceDiscovered(const DiscoveredDevice& device) {
    record("discovered", device.address);
  }
  virtual void onScanFinished(int devicesFound) {
    record("scanfinished", to_string(devicesFound));
  }
  virtual void onError(const string& message) { record("error", message); }

  /** @return The value of the first @p kind event, empty on timeout. */
  string waitFor(const string& kind, int64_t timeoutMs = 10000) {
    std::unique_lock<std::mutex> guard(eventMutex);
    bool seen = eventCv.wait_for(
        guard, std::chrono::milliseconds(timeoutMs),
        [this, &kind] { return events.find(kind) != events.end(); });
    if (!seen) {
      return "";
    }
    auto it = events.find(kind);
    string value = it->second;
    events.erase(it);
    return value;
  }

  bool waitForMessage(Message* message, int64_t timeoutMs = 10000) {
    std::unique_lock<std::mutex> guard(eventMutex);
    if (!eventCv.wait_for(guard, std::chrono::milliseconds(timeoutMs),
                          [this] { return !messages.empty(); })) {
      return false;
    }
    *message = messages.front();
    messages.pop_front();
    return true;
  }

 protected:
  void record(const string& kind, const string& value) {
    lock_guard<std::mutex> guard(eventMutex);
    events.insert(make_pair(kind, value));
    eventCv.notify_all();
  }

  std::mutex eventMutex;
  std::condition_variable eventCv;
  multimap<string, string> events;
  deque<Message> messages;
};

/** @brief Reports whatever the test feeds it. */
class FakeDiscoverySource : public DiscoverySource {
 public:
  FakeDiscoverySource() : discovering(false) {}

  virtual bool adapterAvailable(string*) { return true; }
  virtual bool start(int64_t, DeviceFoundCallback _onFound,
                     std::function<void()> _onFinished) {
    lock_guard<std::mutex> guard(fakeMutex);
    if (discovering) {
      return false;
    }
    discovering = true;
    onFound = _onFound;
    onFinished = _onFinished;
    return true;
  }
  virtual void cancel() {
    lock_guard<std::mutex> guard(fakeMutex);
    discovering = false;
  }
  virtual bool isDiscovering() {
    lock_guard<std::mutex> guard(fakeMutex);
    return discovering;
  }

  void report(const string& address, const string& name) {
    DiscoveredDevice device;
    device.address = address;
    device.name = name;
    DeviceFoundCallback callback;
    {
      lock_guard<std::mutex> guard(fakeMutex);
      callback = onFound;
    }
    callback(device);
  }
  void complete() {
    std::function<void()> callback;
    {
      lock_guard<std::mutex> guard(fakeMutex);
      discovering = false;
      callback = onFinished;
    }
    callback();
  }

 protected:
  std::mutex fakeMutex;
  bool discovering;
  DeviceFoundCallback onFound;
  std::function<void()> onFinished;
};

bool alwaysCapable(string*) { return true; }

struct SessionFixture {
  SessionFixture()
      : serverEvents(make_shared<WaitingListener>()),
        clientEvents(make_shared<WaitingListener>()) {
    pipePath = dir.file("link.sock");
    fs::create_directories(dir.file("share"));

    LinkConfig serverConfig;
    serverConfig.bindAddress = pipePath;
    serverConfig.shareDir = dir.file("share");
    serverConfig.downloadDir = dir.file("server_downloads");
    serverConfig.deviceName = "server-box";
    serverConfig.workerThreads = 8;
    server.reset(new LinkServer(LinkContext::create(
        serverConfig, make_shared<PipeSocketHandler>(), alwaysCapable)));
    serverSubscription = server->subscribe(serverEvents);

    LinkConfig clientConfig;
    clientConfig.downloadDir = dir.file("client_downloads");
    clientConfig.deviceName = "client-box";
    clientConfig.workerThreads = 8;
    clientConfig.reconnect.initialDelayMs = 500;
    clientConfig.reconnect.maxDelayMs = 1000;
    client.reset(new LinkClient(
        LinkContext::create(clientConfig, make_shared<PipeSocketHandler>(),
                            alwaysCapable),
        shared_ptr<DiscoverySource>()));
    clientSubscription = client->subscribe(clientEvents);

    REQUIRE(server->start());
    REQUIRE(client->connect(pipePath));
    REQUIRE(clientEvents->waitFor("connected") == pipePath);
    serverSideAddress = serverEvents->waitFor("connected");
    REQUIRE(!serverSideAddress.empty());
  }

  ~SessionFixture() {
    client.reset();
    server.reset();
  }

  TempDir dir;
  string pipePath;
  string serverSideAddress;
  shared_ptr<WaitingListener> serverEvents;
  shared_ptr<WaitingListener> clientEvents;
  unique_ptr<LinkServer> server;
  unique_ptr<LinkClient> client;
  Subscription serverSubscription;
  Subscription clientSubscription;
};
}  // namespace

TEST_CASE("Text and device info over a live link", "[LinkSession]") {
  SessionFixture f;

  REQUIRE(f.client->sendText(f.pipePath, "hello server"));
  Message received;
  REQUIRE(f.serverEvents->waitForMessage(&received));
  REQUIRE(received.type == MessageTypes::TEXT);
  REQUIRE(received.content.value_or("") == "hello server");
  REQUIRE(received.metadataString("senderAddress") == f.serverSideAddress);

  REQUIRE(f.server->sendText(f.serverSideAddress, "hello client"));
  REQUIRE(f.clientEvents->waitForMessage(&received));
  REQUIRE(received.metadataString("senderAddress") == f.pipePath);

  REQUIRE(f.client->requestDeviceInfo(f.pipePath));
  REQUIRE(f.clientEvents->waitFor("deviceinfo") == "server-box");

  REQUIRE(waitUntil([&] {
    return f.server->statistics().snapshot()["messages"]["received"] >= 2;
  }));
}

TEST_CASE("Files move in both directions", "[LinkSession]") {
  SessionFixture f;

  SECTION("Pushed files land in the download directory") {
    string localPath = f.dir.file("notes.txt");
    writeFile(localPath, string(200000, 'n'));
    REQUIRE(!f.client->sendFile(f.pipePath, localPath).empty());
    REQUIRE(f.clientEvents->waitFor("completed") == localPath);
    string savedPath = f.serverEvents->waitFor("completed");
    REQUIRE(fs::path(savedPath).filename() == "notes.txt");
    REQUIRE(readFile(savedPath) == string(200000, 'n'));
  }

  SECTION("Requested files come from the share directory") {
    writeFile(f.dir.file("share/shared.txt"), "shared contents");
    string savePath = f.dir.file("fetched/shared.txt");
    REQUIRE(!f.client->requestFile(f.pipePath, "shared.txt", savePath).empty());
    REQUIRE(f.clientEvents->waitFor("completed") == savePath);
    REQUIRE(readFile(savePath) == "shared contents");
  }

  SECTION("Bad requests are refused and the link survives") {
    writeFile(f.dir.file("secret.txt"), "secret");
    f.client->requestFile(f.pipePath, "../secret.txt", f.dir.file("x"));
    REQUIRE(f.clientEvents->waitFor("failed") ==
            "Invalid file name: ../secret.txt");

    f.client->requestFile(f.pipePath, "nope.txt", f.dir.file("y"));
    REQUIRE(f.clientEvents->waitFor("failed") == "File not found: nope.txt");
    REQUIRE_FALSE(fs::exists(f.dir.file("y")));

    REQUIRE_NOTHROW(
        f.client->requestFile(f.pipePath, "caf\xe9.txt", f.dir.file("z")));
    REQUIRE(f.clientEvents->waitFor("failed") ==
            "File not found: caf\xef\xbf\xbd.txt");

    REQUIRE(f.client->isConnected(f.pipePath));
    REQUIRE(f.client->sendText(f.pipePath, "still here"));
    Message received;
    REQUIRE(f.serverEvents->waitForMessage(&received));
    REQUIRE(received.content.value_or("") == "still here");
  }
}

TEST_CASE("Validation filters reject outgoing messages", "[LinkSession]") {
  SessionFixture f;
  REQUIRE(f.client->filters().addFilter(
      MessageFilter::validation("needs-priority", 0, {"priority"})));
  REQUIRE_FALSE(f.client->sendText(f.pipePath, "no priority"));
  REQUIRE(f.clientEvents->waitFor("error").find("Message rejected") == 0);

  Message withPriority = makeTextMessage("urgent");
  withPriority.metadata["priority"] = "high";
  REQUIRE(f.client->sendMessage(f.pipePath, withPriority));
  Message received;
  REQUIRE(f.serverEvents->waitForMessage(&received));
  REQUIRE(received.metadataString("priority") == "high");
}

TEST_CASE("Clients redial a server that drops them", "[LinkSession]") {
  SessionFixture f;
  REQUIRE(f.server->disconnectClient(f.serverSideAddress));
  REQUIRE(f.clientEvents->waitFor("lost") == f.pipePath);
  REQUIRE(f.clientEvents->waitFor("reconnected") == f.pipePath);
  REQUIRE(f.client->isConnected(f.pipePath));

  // An explicit disconnect is not redialed
  REQUIRE(f.client->disconnect(f.pipePath));
  REQUIRE(f.clientEvents->waitFor("lost") == f.pipePath);
  REQUIRE(f.clientEvents->waitFor("reconnected", 1500).empty());
  REQUIRE_FALSE(f.client->isConnected(f.pipePath));
}

TEST_CASE("Scans deduplicate devices and end once", "[LinkSession]") {
  auto discovery = make_shared<FakeDiscoverySource>();
  auto events = make_shared<WaitingListener>();
  LinkConfig config;
  config.workerThreads = 4;
  LinkClient client(
      LinkContext::create(config, make_shared<PipeSocketHandler>(),
                          alwaysCapable),
      discovery);
  Subscription subscription = client.subscribe(events);

  SECTION("The source finishing ends the scan") {
    REQUIRE(client.startScan(60000));
    REQUIRE(client.isScanning());
    REQUIRE_FALSE(client.startScan(60000));
    REQUIRE(events->waitFor("error") == "Scan already in progress");

    discovery->report("00:11:22:33:44:55", "phone");
    discovery->report("00:11:22:33:44:55", "phone");
    discovery->report("66:77:88:99:AA:BB", "laptop");
    discovery->complete();

    REQUIRE(events->waitFor("scanfinished") == "2");
    REQUIRE_FALSE(client.isScanning());
    REQUIRE(client.discoveredDevices().size() == 2);
    REQUIRE(client.statistics().snapshot()["discovery"]["devices"] == 2);
  }

  SECTION("The timeout ends the scan") {
    REQUIRE(client.startScan(100));
    discovery->report("00:11:22:33:44:55", "phone");
    REQUIRE(events->waitFor("discovered") == "00:11:22:33:44:55");
    REQUIRE(events->waitFor("scanfinished") == "1");
    REQUIRE_FALSE(discovery->isDiscovering());
  }

  SECTION("Stopping ends the scan") {
    REQUIRE(client.startScan(60000));
    client.stopScan();
    REQUIRE(events->waitFor("scanfinished") == "0");
    REQUIRE(client.startScan(60000));
    client.stopScan();
  }
}

TEST_CASE("Sessions refuse to run without the transport", "[LinkSession]") {
  TempDir dir;
  LinkConfig config;
  config.bindAddress = dir.file("never.sock");
  config.workerThreads = 2;
  auto events = make_shared<WaitingListener>();
  LinkServer server(LinkContext::create(
      config, make_shared<PipeSocketHandler>(), [](string* reason) {
        *reason = "Bluetooth adapter not available";
        return false;
      }));
  Subscription subscription = server.subscribe(events);
  REQUIRE_FALSE(server.start());
  REQUIRE(events->waitFor("error") == "Bluetooth adapter not available");
  REQUIRE_FALSE(fs::exists(config.bindAddress));
}

TEST_CASE("Server lifecycle and background dials", "[LinkSession]") {
  SessionFixture f;
  REQUIRE(f.serverEvents->waitFor("serverstate") == "running");
  REQUIRE(f.server->isRunning());
  REQUIRE(f.server->start());

  REQUIRE(f.client->disconnect(f.pipePath));
  REQUIRE(f.clientEvents->waitFor("lost") == f.pipePath);
  f.client->connectAsync(f.pipePath);
  REQUIRE(f.clientEvents->waitFor("connected") == f.pipePath);

  f.server->stop();
  REQUIRE_FALSE(f.server->isRunning());
  REQUIRE(f.serverEvents->waitFor("serverstate") == "stopped");

  REQUIRE(f.client->disconnect(f.pipePath));
  REQUIRE_FALSE(f.client->connect(f.pipePath));
  REQUIRE(f.clientEvents->waitFor("connectfailed") == f.pipePath);
}

TEST_CASE("Requests from the peer wait for a running download",
          "[LinkSession]") {
  TempDir dir;
  string pipePath = dir.file("raw.sock");
  fs::create_directories(dir.file("share"));
  writeFile(dir.file("share/local.txt"), "from the client");

  auto peer = make_shared<PipeSocketHandler>();
  SocketEndpoint endpoint(pipePath);
  int listenFd = *peer->listen(endpoint).begin();

  LinkConfig config;
  config.shareDir = dir.file("share");
  config.downloadDir = dir.file("downloads");
  config.workerThreads = 4;
  auto events = make_shared<WaitingListener>();
  LinkClient client(LinkContext::create(config, make_shared<PipeSocketHandler>(),
                                        alwaysCapable),
                    shared_ptr<DiscoverySource>());
  Subscription subscription = client.subscribe(events);
  REQUIRE(client.connect(pipePath));
  REQUIRE(peer->waitForData(listenFd, 5, 0));
  int peerFd = peer->accept(listenFd);
  REQUIRE(peerFd >= 0);

  string savePath = dir.file("wanted.txt");
  REQUIRE(!client.requestFile(pipePath, "wanted.txt", savePath).empty());
  Message request = Message::decode(readFrame(peer.get(), peerFd).getPayload());
  REQUIRE(request.type == MessageTypes::FILE_REQUEST);

  // The peer asks for a file of its own before answering
  peer->writePacket(peerFd, Packet(PacketType::MESSAGE,
                                   makeFileRequest("local.txt").encode()));
  peer->writePacket(peerFd, Packet(PacketType::MESSAGE,
                                   makeFileTransfer("wanted.txt", 5).encode()));
  uint64_t prefix = htobe64(5);
  peer->writeAllOrThrow(peerFd, &prefix, sizeof(prefix), true);
  peer->writeAllOrThrow(peerFd, "hello", 5, true);
  REQUIRE(waitUntil([&] { return readFile(savePath) == "hello"; }));

  // Served once the download gave the stream back
  Message announcement =
      Message::decode(readFrame(peer.get(), peerFd).getPayload());
  REQUIRE(announcement.type == MessageTypes::FILE_TRANSFER);
  REQUIRE(announcement.metadataString("fileName") == "local.txt");
  string body(sizeof(uint64_t) + 15, '\0');
  peer->readAll(peerFd, &body[0], body.length(), true);
  REQUIRE(body.substr(sizeof(uint64_t)) == "from the client");
  REQUIRE(client.isConnected(pipePath));

  peer->close(peerFd);
  peer->stopListening(endpoint);
}
