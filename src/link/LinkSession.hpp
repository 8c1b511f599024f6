#ifndef __BTLINK_LINK_SESSION__
#define __BTLINK_LINK_SESSION__

#include "ConnectionRegistry.hpp"
#include "EventQueue.hpp"
#include "FilterPipeline.hpp"
#include "Headers.hpp"
#include "LinkConfig.hpp"
#include "LinkEvents.hpp"
#include "LinkStatistics.hpp"
#include "Message.hpp"
#include "SocketHandler.hpp"
#include "TimerQueue.hpp"
#include "TransferEngine.hpp"

namespace btlink {
/**
 * @brief Reports whether the platform lets us use the transport at all.
 * @param reason Filled with a human readable cause when false is returned.
 */
typedef std::function<bool(string* reason)> CapabilityCheck;

/**
 * @brief Resources shared by the server and client roles of one process:
 * one worker pool, one timer thread and one event delivery thread.
 */
struct LinkContext {
  LinkConfig config;
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<ThreadPool> threadPool;
  shared_ptr<TimerQueue> timerQueue;
  shared_ptr<EventQueue> eventQueue;
  CapabilityCheck capabilityCheck;

  static shared_ptr<LinkContext> create(const LinkConfig& config,
                                        shared_ptr<SocketHandler> socketHandler,
                                        CapabilityCheck capabilityCheck);
};

/**
 * @brief What the server and the client have in common: a connection
 * registry whose traffic runs through a filter pipeline, file transfers,
 * device info exchange, statistics and the event hub.
 */
class LinkSession {
 public:
  LinkSession(shared_ptr<LinkContext> _context, const string& _role);
  virtual ~LinkSession();

  Subscription subscribe(shared_ptr<LinkEventListener> listener);
  FilterPipeline& filters() { return pipeline; }

  /**
   * @brief Runs @p message through the outgoing filters and sends it.
   * @return false if there is no connection, a filter rejected the message
   * or the write failed. The last two also raise onError.
   */
  bool sendMessage(const string& address, const Message& message);
  bool sendText(const string& address, const string& text);
  bool sendData(const string& address, const string& bytes);
  bool sendCommand(const string& address, const string& command);

  bool requestDeviceInfo(const string& address);
  bool sendDeviceInfo(const string& address);

  /**
   * @brief Announces and uploads a local file. The peer saves it in its
   * download directory.
   * @return The transfer id, empty on failure (reported as a failed
   * transfer).
   */
  string sendFile(const string& address, const string& filePath);
  /**
   * @brief Asks the peer for a file from its share directory and saves it
   * as @p savePath.
   */
  string requestFile(const string& address, const string& fileName,
                     const string& savePath);
  bool cancelTransfer(const string& transferId);
  vector<string> activeTransfers();
  optional<TransferInfo> transferInfo(const string& transferId);

  vector<string> connectedDevices();
  bool isConnected(const string& address);
  optional<ConnectionStats> connectionStats(const string& address);

  LinkStatistics& statistics() { return stats; }
  const string& getRole() const { return role; }

 protected:
  class ConnectionEvents : public ConnectionListener {
   public:
    explicit ConnectionEvents(LinkSession* _session) : session(_session) {}
    virtual void onConnected(const string& address);
    virtual void onDisconnected(const string& address);
    virtual void onConnectionFailed(const string& address,
                                    const string& error);
    virtual void onPacket(const string& address, const Packet& packet);
    virtual void onError(const string& address, const string& error);

   protected:
    LinkSession* session;
  };

  class TransferEvents : public TransferListener {
   public:
    explicit TransferEvents(LinkSession* _session) : session(_session) {}
    virtual void onProgress(const TransferProgress& progress);
    virtual void onCompleted(const string& transferId, const string& path);
    virtual void onFailed(const string& transferId, const string& reason);
    virtual void onCancelled(const string& transferId);

   protected:
    LinkSession* session;
  };

  /** @brief Capability check; a failure is also reported as onError. */
  bool checkCapability();
  /** @brief Hands a freshly connected descriptor to the registry. */
  void adopt(const string& address, int socketFd);

  virtual void handleConnected(const string& address);
  virtual void handleDisconnected(const string& address);
  virtual void handleConnectionFailed(const string& address,
                                      const string& error);

  void handlePacket(const string& address, const Packet& packet);
  /**
   * @brief Decodes and filters an incoming MESSAGE payload.
   * @return nullopt if validation rejected it (already reported).
   */
  optional<Message> receiveMessage(const string& address,
                                   const string& payload);
  void handleMessage(const string& address, const Message& message);
  /** @brief Whether answering @p message writes on the connection. */
  static bool needsStream(const Message& message);
  /**
   * @brief Holds a message read by a transfer preamble until the transfer
   * gives the stream back.
   */
  void deferMessage(const string& address, const Message& message);
  /** @brief Handles deferred messages. Runs when a transfer ends. */
  void handleDeferredMessages();
  void serveFileRequest(const string& address, const Message& message);
  void receiveAnnouncedFile(const string& address, const Message& message);
  /**
   * @brief Maps a requested name onto a file inside the share directory.
   * @return false with @p error set if sharing is off, the name escapes
   * the directory or the file does not exist.
   */
  bool resolveSharedFile(const string& fileName, fs::path* path,
                         string* error);
  /**
   * @brief Filters and encodes @p message into a MESSAGE packet.
   * @throws ValidationError if a validation filter rejects it.
   */
  Packet encodeMessage(const Message& message);
  void reportError(const string& error);
  /** @brief Cancels transfers and closes every connection. Idempotent. */
  void shutdownSession();

  shared_ptr<LinkContext> context;
  string role;
  string localAddress;
  LinkEventHub hub;
  FilterPipeline pipeline;
  LinkStatistics stats;
  shared_ptr<ConnectionEvents> connectionEvents;
  shared_ptr<TransferEvents> transferEvents;
  shared_ptr<TransferEngine> transfers;
  shared_ptr<ConnectionRegistry> registry;
  atomic<bool> shuttingDown;
  std::mutex deferredMutex;
  vector<pair<string, Message>> deferredMessages;
};
}  // namespace btlink

#endif  // __BTLINK_LINK_SESSION__
