#ifndef __BTLINK_TRANSFER_ENGINE__
#define __BTLINK_TRANSFER_ENGINE__

#include "Headers.hpp"
#include "LinkConnection.hpp"

namespace btlink {
enum class TransferDirection { UPLOAD, DOWNLOAD };

enum class TransferState { ACTIVE = 0, COMPLETED, FAILED, CANCELLED };

struct TransferProgress {
  string transferId;
  int64_t totalBytes = 0;
  int64_t transferredBytes = 0;
  double percentage = 0;
};

/** @brief Snapshot of one transfer. */
struct TransferInfo {
  string transferId;
  TransferDirection direction = TransferDirection::UPLOAD;
  string deviceAddress;
  /** @brief Source file for uploads, destination for downloads. */
  string localPath;
  string remoteName;
  int64_t totalBytes = 0;
  int64_t transferredBytes = 0;
  int64_t startTime = 0;
  TransferState state = TransferState::ACTIVE;

  json toJson() const;
};

/**
 * @brief Receives the outcome of transfers. Exactly one of onCompleted,
 * onFailed or onCancelled is called per transfer id, after any number of
 * onProgress calls. Calls come from the transfer's worker thread.
 */
class TransferListener {
 public:
  virtual ~TransferListener() {}
  virtual void onProgress(const TransferProgress& progress) = 0;
  virtual void onCompleted(const string& transferId, const string& path) = 0;
  virtual void onFailed(const string& transferId, const string& reason) = 0;
  virtual void onCancelled(const string& transferId) = 0;
};

/**
 * @brief A transfer that was turned down before any file bytes moved. The
 * stream stays usable.
 */
class TransferRefused : public std::runtime_error {
 public:
  explicit TransferRefused(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Runs on the transfer's worker, on its lease, before the size
 * prefix. Throwing fails the transfer with the exception's message;
 * TransferRefused keeps the stream open.
 */
typedef std::function<void(StreamLease* lease)> TransferPreamble;

struct TransferOptions {
  size_t chunkSize = 65536;
  int64_t progressIntervalMs = 500;
};

/**
 * @brief Moves whole files over leased connection streams.
 *
 * The wire format is an 8-byte big-endian byte count followed by exactly
 * that many bytes. Each transfer owns its stream lease for its whole run
 * and gives it back when it reaches a terminal state.
 */
class TransferEngine {
 public:
  TransferEngine(shared_ptr<ThreadPool> _threadPool,
                 const TransferOptions& _options);
  ~TransferEngine();

  /**
   * @brief Sends @p filePath on @p lease.
   * @return The transfer id, or an empty string if the file does not exist
   * or the stream is unavailable (onFailed has been called in that case).
   */
  string startUpload(unique_ptr<StreamLease> lease, const string& filePath,
                     shared_ptr<TransferListener> listener,
                     TransferPreamble preamble = TransferPreamble());

  /**
   * @brief Receives one file from @p lease into @p savePath, creating its
   * parent directories.
   * @return The transfer id, or an empty string if it could not start.
   */
  string startDownload(unique_ptr<StreamLease> lease, const string& remoteName,
                       const string& savePath,
                       shared_ptr<TransferListener> listener,
                       TransferPreamble preamble = TransferPreamble());

  /**
   * @brief Stops a transfer and closes its stream. A cancelled download
   * removes its partial file.
   * @return false if the id is not active.
   */
  bool cancel(const string& transferId);
  void cancelAll();

  vector<string> activeTransferIds();
  optional<TransferInfo> transferInfo(const string& transferId);

  /** @brief Cancels everything and waits for the workers to finish. */
  void shutdown();

  static string generateTransferId();

 protected:
  struct Task {
    TransferInfo info;
    std::mutex infoMutex;
    unique_ptr<StreamLease> lease;
    std::mutex leaseMutex;
    shared_ptr<TransferListener> listener;
    TransferPreamble preamble;
    atomic<bool> cancelled;
    atomic<int> state;
    int64_t lastProgressMs;
    int64_t lastNotifiedBytes;

    Task()
        : cancelled(false),
          state(int(TransferState::ACTIVE)),
          lastProgressMs(-1),
          lastNotifiedBytes(-1) {}
  };

  string launch(shared_ptr<Task> task);
  void runUpload(shared_ptr<Task> task);
  void runDownload(shared_ptr<Task> task);
  void setProgress(const shared_ptr<Task>& task, int64_t transferred,
                   int64_t total, bool finalUpdate);
  /**
   * @brief Moves the task to a terminal state, gives its lease back and
   * notifies. Only the first call for a task has an effect.
   * @param streamBroken Closes the stream, since a failure halfway leaves
   * the peer out of step.
   */
  void finish(const shared_ptr<Task>& task, TransferState state,
              const string& reason, bool streamBroken = true);
  void removePartialFile(ofstream* output, const string& path);
  shared_ptr<Task> findTask(const string& transferId);

  shared_ptr<ThreadPool> threadPool;
  TransferOptions options;

  std::mutex taskMutex;
  std::condition_variable taskCv;
  map<string, shared_ptr<Task>> tasks;
};
}  // namespace btlink

#endif  // __BTLINK_TRANSFER_ENGINE__
