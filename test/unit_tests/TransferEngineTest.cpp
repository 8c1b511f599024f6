#include "ConnectionRegistry.hpp"
#include "TestHeaders.hpp"
#include "TransferEngine.hpp"

using namespace btlink;

namespace {
class NullConnectionListener : public ConnectionListener {
 public:
  virtual void onConnected(const string&) {}
  virtual void onDisconnected(const string&) {}
  virtual void onConnectionFailed(const string&, const string&) {}
  virtual void onPacket(const string&, const Packet&) {}
  virtual void onError(const string&, const string&) {}
};

class RecordingTransferListener : public TransferListener {
 public:
  virtual void onProgress(const TransferProgress& progress) {
    lock_guard<std::mutex> guard(recordMutex);
    progressUpdates.push_back(progress);
  }
  virtual void onCompleted(const string& transferId, const string& path) {
    lock_guard<std::mutex> guard(recordMutex);
    outcomes.push_back("completed:" + path);
  }
  virtual void onFailed(const string& transferId, const string& reason) {
    lock_guard<std::mutex> guard(recordMutex);
    outcomes.push_back("failed:" + reason);
  }
  virtual void onCancelled(const string& transferId) {
    lock_guard<std::mutex> guard(recordMutex);
    outcomes.push_back("cancelled");
  }

  bool finished() {
    lock_guard<std::mutex> guard(recordMutex);
    return !outcomes.empty();
  }
  string outcome() {
    lock_guard<std::mutex> guard(recordMutex);
    return outcomes.empty() ? "" : outcomes.front();
  }

  std::mutex recordMutex;
  vector<TransferProgress> progressUpdates;
  vector<string> outcomes;
};

struct TransferFixture {
  explicit TransferFixture(size_t chunkSize = 4, size_t workerThreads = 4)
      : handler(make_shared<SocketPairHandler>()),
        pool(make_shared<ThreadPool>(workerThreads)),
        timers(make_shared<TimerQueue>()),
        listener(make_shared<RecordingTransferListener>()) {
    ConnectionOptions options;
    options.heartbeatIntervalMs = 0;
    registry.reset(new ConnectionRegistry(handler, timers, options));
    TransferOptions transferOptions;
    transferOptions.chunkSize = chunkSize;
    engine.reset(new TransferEngine(pool, transferOptions));
    fds = handler->makePair();
    registry->add("dev", fds.first, make_shared<NullConnectionListener>());
    waitUntil([this] { return registry->isConnected("dev"); });
  }

  ~TransferFixture() {
    engine->shutdown();
    registry->shutdown();
    handler->close(fds.second);
  }

  unique_ptr<StreamLease> lease() {
    return registry->acquireStream("dev", std::chrono::seconds(1));
  }

  void writePeer(const string& bytes) {
    handler->writeAllOrThrow(fds.second, bytes.data(), bytes.length(), true);
  }

  string readPeer(size_t count) {
    string bytes(count, '\0');
    handler->readAll(fds.second, &bytes[0], count, true);
    return bytes;
  }

  static string sizePrefix(uint64_t size) {
    uint64_t prefix = htobe64(size);
    return string((const char*)&prefix, sizeof(prefix));
  }

  shared_ptr<SocketPairHandler> handler;
  shared_ptr<ThreadPool> pool;
  shared_ptr<TimerQueue> timers;
  shared_ptr<RecordingTransferListener> listener;
  unique_ptr<ConnectionRegistry> registry;
  unique_ptr<TransferEngine> engine;
  pair<int, int> fds;
  TempDir dir;
};
}  // namespace

TEST_CASE("Upload writes a size prefix and the file", "[TransferEngine]") {
  TransferFixture f;
  string path = f.dir.file("ten.bin");
  writeFile(path, "0123456789");

  string id = f.engine->startUpload(f.lease(), path, f.listener);
  REQUIRE(id.find("transfer_") == 0);
  REQUIRE(f.readPeer(8) == TransferFixture::sizePrefix(10));
  REQUIRE(f.readPeer(10) == "0123456789");
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  REQUIRE(f.listener->outcome() == "completed:" + path);

  lock_guard<std::mutex> guard(f.listener->recordMutex);
  // The first chunk and the final byte count, nothing in between
  REQUIRE(f.listener->progressUpdates.size() == 2);
  REQUIRE(f.listener->progressUpdates[0].transferredBytes == 4);
  REQUIRE(f.listener->progressUpdates[1].transferredBytes == 10);
  REQUIRE(f.listener->progressUpdates[1].percentage == Approx(100.0));
  REQUIRE(f.listener->outcomes.size() == 1);
}

TEST_CASE("Small files report progress once", "[TransferEngine]") {
  TransferFixture f(65536);
  string path = f.dir.file("small.bin");
  writeFile(path, "0123456789");
  f.engine->startUpload(f.lease(), path, f.listener);
  REQUIRE(f.readPeer(18) == TransferFixture::sizePrefix(10) + "0123456789");
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  lock_guard<std::mutex> guard(f.listener->recordMutex);
  REQUIRE(f.listener->progressUpdates.size() == 1);
  REQUIRE(f.listener->progressUpdates[0].percentage == Approx(100.0));
  REQUIRE(f.listener->outcomes == vector<string>({"completed:" + path}));
}

TEST_CASE("Empty files report full progress", "[TransferEngine]") {
  TransferFixture f;
  string path = f.dir.file("empty.bin");
  writeFile(path, "");
  f.engine->startUpload(f.lease(), path, f.listener);
  REQUIRE(f.readPeer(8) == TransferFixture::sizePrefix(0));
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  lock_guard<std::mutex> guard(f.listener->recordMutex);
  REQUIRE(f.listener->progressUpdates.size() == 1);
  REQUIRE(f.listener->progressUpdates[0].percentage == Approx(100.0));
}

TEST_CASE("Download saves the announced bytes", "[TransferEngine]") {
  TransferFixture f;
  string savePath = f.dir.file("nested/dir/out.bin");
  string id = f.engine->startDownload(f.lease(), "out.bin", savePath,
                                      f.listener);
  REQUIRE(!id.empty());
  f.writePeer(TransferFixture::sizePrefix(6) + "abcdef");
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  REQUIRE(f.listener->outcome() == "completed:" + savePath);
  REQUIRE(readFile(savePath) == "abcdef");
  REQUIRE(waitUntil([&] { return !f.engine->transferInfo(id); }));
  REQUIRE(f.engine->activeTransferIds().empty());
}

TEST_CASE("Premature end of stream fails the download", "[TransferEngine]") {
  TransferFixture f;
  string savePath = f.dir.file("partial.bin");
  f.engine->startDownload(f.lease(), "partial.bin", savePath, f.listener);
  f.writePeer(TransferFixture::sizePrefix(100) + "only ten!!");
  ::shutdown(f.fds.second, SHUT_WR);
  REQUIRE(waitUntil([&] { return f.listener->finished(); }, 15000));
  REQUIRE(f.listener->outcome().find("failed:") == 0);
  REQUIRE_FALSE(fs::exists(savePath));
  // A broken transfer takes the link down with it
  REQUIRE(waitUntil([&] { return !f.registry->isConnected("dev"); }));
}

TEST_CASE("Cancelling a download removes the partial file",
          "[TransferEngine]") {
  TransferFixture f;
  string savePath = f.dir.file("big.bin");
  string id =
      f.engine->startDownload(f.lease(), "big.bin", savePath, f.listener);
  f.writePeer(TransferFixture::sizePrefix(1024 * 1024) + "firstbytes");
  REQUIRE(waitUntil([&] {
    auto info = f.engine->transferInfo(id);
    return info && info->transferredBytes > 0;
  }));
  REQUIRE(f.engine->activeTransferIds() == vector<string>({id}));
  REQUIRE(f.engine->cancel(id));
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  REQUIRE(f.listener->outcome() == "cancelled");
  REQUIRE_FALSE(fs::exists(savePath));
  REQUIRE(waitUntil([&] { return !f.engine->cancel(id); }));
}

TEST_CASE("Cancelling an upload leaves the source alone", "[TransferEngine]") {
  TransferFixture f(4096);
  string path = f.dir.file("source.bin");
  string contents;
  for (int a = 0; a < 4 * 1024 * 1024; a++) {
    contents.push_back(char('a' + a % 26));
  }
  writeFile(path, contents);

  string id = f.engine->startUpload(f.lease(), path, f.listener);
  REQUIRE(f.readPeer(8) == TransferFixture::sizePrefix(contents.size()));
  REQUIRE(f.readPeer(4096) == contents.substr(0, 4096));
  // The peer stops reading, so the upload stalls on a full socket
  REQUIRE(waitUntil([&] {
    auto info = f.engine->transferInfo(id);
    return info && info->transferredBytes >= 4096;
  }));
  REQUIRE(f.engine->cancel(id));
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  {
    lock_guard<std::mutex> guard(f.listener->recordMutex);
    REQUIRE(f.listener->outcomes == vector<string>({"cancelled"}));
  }
  REQUIRE(readFile(path) == contents);
  REQUIRE(waitUntil([&] { return !f.engine->transferInfo(id); }));
}

TEST_CASE("Transfers run while more links than workers are open",
          "[TransferEngine]") {
  TransferFixture f(4, 2);
  vector<pair<int, int>> extra;
  for (int a = 0; a < 3; a++) {
    extra.push_back(f.handler->makePair());
    f.registry->add("extra" + to_string(a), extra.back().first,
                    make_shared<NullConnectionListener>());
  }
  REQUIRE(waitUntil(
      [&] { return f.registry->connectedDevices().size() == 4; }));

  string path = f.dir.file("busy.bin");
  writeFile(path, "0123456789");
  f.engine->startUpload(f.lease(), path, f.listener);
  REQUIRE(f.readPeer(18) == TransferFixture::sizePrefix(10) + "0123456789");
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  REQUIRE(f.listener->outcome() == "completed:" + path);
  for (const auto& it : extra) {
    f.handler->close(it.second);
  }
}

TEST_CASE("Transfers that cannot start", "[TransferEngine]") {
  TransferFixture f;

  SECTION("Missing source file") {
    string missing = f.dir.file("missing.bin");
    REQUIRE(f.engine->startUpload(f.lease(), missing, f.listener).empty());
    REQUIRE(f.listener->outcome() == "failed:File not found: " + missing);
  }

  SECTION("No stream") {
    string path = f.dir.file("a.bin");
    writeFile(path, "a");
    REQUIRE(f.engine->startUpload(unique_ptr<StreamLease>(), path, f.listener)
                .empty());
    REQUIRE(f.listener->outcome() == "failed:Stream is not available");
  }

  SECTION("Unknown id") { REQUIRE_FALSE(f.engine->cancel("transfer_0_none")); }
}

TEST_CASE("A refused preamble keeps the link", "[TransferEngine]") {
  TransferFixture f;
  string savePath = f.dir.file("refused.bin");
  f.engine->startDownload(f.lease(), "refused.bin", savePath, f.listener,
                          [](StreamLease* lease) {
                            lease->writePacket(
                                Packet(PacketType::MESSAGE, "request"));
                            Packet reply = lease->readPacket();
                            throw TransferRefused(reply.getPayload());
                          });
  REQUIRE(readFrame(f.handler.get(), f.fds.second).getPayload() == "request");
  f.handler->writePacket(f.fds.second, Packet(PacketType::MESSAGE, "No such file"));
  REQUIRE(waitUntil([&] { return f.listener->finished(); }));
  REQUIRE(f.listener->outcome() == "failed:No such file");
  REQUIRE_FALSE(fs::exists(savePath));
  REQUIRE(f.registry->isConnected("dev"));
  REQUIRE(f.registry->send("dev", Packet(PacketType::MESSAGE, "still usable")));
}

TEST_CASE("Transfer ids are unique", "[TransferEngine]") {
  set<string> ids;
  for (int i = 0; i < 100; i++) {
    ids.insert(TransferEngine::generateTransferId());
  }
  REQUIRE(ids.size() == 100);
}
