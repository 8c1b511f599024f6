#include "TransferEngine.hpp"

namespace btlink {
namespace {
const std::chrono::seconds SHUTDOWN_TIMEOUT(15);

const char* directionName(TransferDirection direction) {
  return direction == TransferDirection::UPLOAD ? "upload" : "download";
}

const char* stateName(TransferState state) {
  switch (state) {
    case TransferState::ACTIVE:
      return "active";
    case TransferState::COMPLETED:
      return "completed";
    case TransferState::FAILED:
      return "failed";
    case TransferState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}
}  // namespace

json TransferInfo::toJson() const {
  json j;
  j["transferId"] = transferId;
  j["direction"] = directionName(direction);
  j["deviceAddress"] = deviceAddress;
  j["localPath"] = localPath;
  j["remoteName"] = remoteName;
  j["totalBytes"] = totalBytes;
  j["transferredBytes"] = transferredBytes;
  j["startTime"] = startTime;
  j["state"] = stateName(state);
  return j;
}

TransferEngine::TransferEngine(shared_ptr<ThreadPool> _threadPool,
                               const TransferOptions& _options)
    : threadPool(_threadPool), options(_options) {
  if (options.chunkSize == 0) {
    options.chunkSize = TransferOptions().chunkSize;
  }
}

TransferEngine::~TransferEngine() { shutdown(); }

string TransferEngine::generateTransferId() {
  return "transfer_" + to_string(nowEpochMs()) + "_" +
         sole::uuid4().str().substr(0, 8);
}

string TransferEngine::startUpload(unique_ptr<StreamLease> lease,
                                   const string& filePath,
                                   shared_ptr<TransferListener> listener,
                                   TransferPreamble preamble) {
  std::error_code ec;
  if (!fs::is_regular_file(filePath, ec)) {
    LOG(WARNING) << "Upload source missing: " << filePath;
    listener->onFailed("", "File not found: " + filePath);
    return "";
  }
  if (!lease) {
    listener->onFailed("", "Stream is not available");
    return "";
  }
  auto task = make_shared<Task>();
  task->info.transferId = generateTransferId();
  task->info.direction = TransferDirection::UPLOAD;
  task->info.deviceAddress = lease->getAddress();
  task->info.localPath = filePath;
  task->info.remoteName = fs::path(filePath).filename().string();
  task->info.totalBytes = int64_t(fs::file_size(filePath, ec));
  task->info.startTime = nowEpochMs();
  task->lease = std::move(lease);
  task->listener = listener;
  task->preamble = preamble;
  return launch(task);
}

string TransferEngine::startDownload(unique_ptr<StreamLease> lease,
                                     const string& remoteName,
                                     const string& savePath,
                                     shared_ptr<TransferListener> listener,
                                     TransferPreamble preamble) {
  if (!lease) {
    listener->onFailed("", "Stream is not available");
    return "";
  }
  auto parent = fs::path(savePath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      LOG(WARNING) << "Cannot create " << parent << ": " << ec.message();
      listener->onFailed("", "Cannot create directory " + parent.string() +
                                 ": " + ec.message());
      return "";
    }
  }
  auto task = make_shared<Task>();
  task->info.transferId = generateTransferId();
  task->info.direction = TransferDirection::DOWNLOAD;
  task->info.deviceAddress = lease->getAddress();
  task->info.localPath = savePath;
  task->info.remoteName = remoteName;
  task->info.startTime = nowEpochMs();
  task->lease = std::move(lease);
  task->listener = listener;
  task->preamble = preamble;
  return launch(task);
}

string TransferEngine::launch(shared_ptr<Task> task) {
  string transferId = task->info.transferId;
  {
    lock_guard<std::mutex> guard(taskMutex);
    tasks[transferId] = task;
  }
  LOG(INFO) << "Starting " << directionName(task->info.direction) << " "
            << transferId << " (" << task->info.localPath << ") with "
            << task->info.deviceAddress;
  try {
    threadPool->enqueue([this, task] {
      el::Helpers::setThreadName("transfer-" + task->info.transferId);
      if (task->info.direction == TransferDirection::UPLOAD) {
        runUpload(task);
      } else {
        runDownload(task);
      }
    });
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Could not start transfer " << transferId << ": "
               << re.what();
    finish(task, TransferState::FAILED, re.what());
    return "";
  }
  return transferId;
}

void TransferEngine::runUpload(shared_ptr<Task> task) {
  const string& path = task->info.localPath;
  try {
    ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
      throw TransferRefused("Cannot open " + path);
    }
    if (task->preamble) {
      task->preamble(task->lease.get());
    }
    int64_t total = task->info.totalBytes;
    uint64_t prefix = htobe64(uint64_t(total));
    task->lease->writeAll(&prefix, sizeof(prefix));

    vector<char> chunk(options.chunkSize);
    int64_t sent = 0;
    while (sent < total) {
      if (task->cancelled) {
        finish(task, TransferState::CANCELLED, "");
        return;
      }
      input.read(&chunk[0], chunk.size());
      std::streamsize count = input.gcount();
      if (count <= 0) {
        throw std::runtime_error("File ended early: " + path);
      }
      task->lease->writeAll(&chunk[0], size_t(count));
      sent += count;
      setProgress(task, sent, total, false);
    }
    setProgress(task, sent, total, true);
    finish(task, TransferState::COMPLETED, "");
  } catch (const TransferRefused& tr) {
    LOG(WARNING) << "Upload " << task->info.transferId
                 << " refused: " << tr.what();
    finish(task, TransferState::FAILED, tr.what(), false);
  } catch (const std::exception& e) {
    if (task->cancelled) {
      finish(task, TransferState::CANCELLED, "");
    } else {
      LOG(WARNING) << "Upload " << task->info.transferId
                   << " failed: " << e.what();
      finish(task, TransferState::FAILED, e.what());
    }
  }
}

void TransferEngine::runDownload(shared_ptr<Task> task) {
  const string& path = task->info.localPath;
  ofstream output;
  try {
    if (task->preamble) {
      task->preamble(task->lease.get());
    }
    uint64_t prefix = 0;
    task->lease->readAll(&prefix, sizeof(prefix));
    int64_t total = int64_t(be64toh(prefix));
    if (total < 0) {
      throw std::runtime_error("Invalid transfer size");
    }
    {
      lock_guard<std::mutex> guard(task->infoMutex);
      task->info.totalBytes = total;
    }
    VLOG(1) << "Download " << task->info.transferId << " expects " << total
            << " bytes";
    output.open(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
      throw std::runtime_error("Cannot open " + path + " for writing");
    }

    vector<char> chunk(options.chunkSize);
    int64_t received = 0;
    while (received < total && !task->cancelled) {
      size_t count = size_t(std::min<int64_t>(chunk.size(), total - received));
      task->lease->readAll(&chunk[0], count);
      output.write(&chunk[0], count);
      if (!output) {
        throw std::runtime_error("Write to " + path + " failed");
      }
      received += count;
      setProgress(task, received, total, false);
    }
    if (!task->cancelled) {
      output.close();
      if (output.fail()) {
        throw std::runtime_error("Could not finish writing " + path);
      }
      setProgress(task, received, total, true);
      finish(task, TransferState::COMPLETED, "");
      return;
    }
  } catch (const TransferRefused& tr) {
    LOG(WARNING) << "Download " << task->info.transferId
                 << " refused: " << tr.what();
    finish(task, TransferState::FAILED, tr.what(), false);
    return;
  } catch (const std::exception& e) {
    if (!task->cancelled) {
      LOG(WARNING) << "Download " << task->info.transferId
                   << " failed: " << e.what();
      removePartialFile(&output, path);
      finish(task, TransferState::FAILED, e.what());
      return;
    }
  }
  removePartialFile(&output, path);
  finish(task, TransferState::CANCELLED, "");
}

void TransferEngine::removePartialFile(ofstream* output, const string& path) {
  if (!output->is_open()) {
    // Nothing was created yet
    return;
  }
  output->close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove partial download " << path << ": "
                 << ec.message();
  }
}

void TransferEngine::setProgress(const shared_ptr<Task>& task,
                                 int64_t transferred, int64_t total,
                                 bool finalUpdate) {
  {
    lock_guard<std::mutex> guard(task->infoMutex);
    task->info.transferredBytes = transferred;
  }
  int64_t now = nowSteadyMs();
  if (finalUpdate) {
    if (task->lastNotifiedBytes == total) {
      return;
    }
  } else if (task->lastProgressMs >= 0 &&
             now - task->lastProgressMs < options.progressIntervalMs) {
    return;
  }
  task->lastProgressMs = now;
  task->lastNotifiedBytes = transferred;

  TransferProgress progress;
  progress.transferId = task->info.transferId;
  progress.totalBytes = total;
  progress.transferredBytes = transferred;
  progress.percentage = total > 0 ? (transferred * 100.0) / total : 100.0;
  task->listener->onProgress(progress);
}

void TransferEngine::finish(const shared_ptr<Task>& task, TransferState state,
                            const string& reason, bool streamBroken) {
  int expected = int(TransferState::ACTIVE);
  if (!task->state.compare_exchange_strong(expected, int(state))) {
    return;
  }
  {
    lock_guard<std::mutex> guard(task->infoMutex);
    task->info.state = state;
  }
  {
    lock_guard<std::mutex> guard(task->leaseMutex);
    if (task->lease && state == TransferState::FAILED && streamBroken) {
      // Framing on this stream is lost once a transfer stops halfway.
      task->lease->abort();
    }
    task->lease.reset();
  }

  const string& transferId = task->info.transferId;
  switch (state) {
    case TransferState::COMPLETED:
      LOG(INFO) << "Transfer " << transferId << " completed";
      task->listener->onCompleted(transferId, task->info.localPath);
      break;
    case TransferState::FAILED:
      task->listener->onFailed(transferId, reason);
      break;
    case TransferState::CANCELLED:
      LOG(INFO) << "Transfer " << transferId << " cancelled";
      task->listener->onCancelled(transferId);
      break;
    case TransferState::ACTIVE:
      STFATAL << "Transfer finished in the active state";
      break;
  }

  lock_guard<std::mutex> guard(taskMutex);
  tasks.erase(transferId);
  taskCv.notify_all();
}

shared_ptr<TransferEngine::Task> TransferEngine::findTask(
    const string& transferId) {
  lock_guard<std::mutex> guard(taskMutex);
  auto it = tasks.find(transferId);
  if (it == tasks.end()) {
    return shared_ptr<Task>();
  }
  return it->second;
}

bool TransferEngine::cancel(const string& transferId) {
  auto task = findTask(transferId);
  if (!task || task->state != int(TransferState::ACTIVE)) {
    return false;
  }
  LOG(INFO) << "Cancelling transfer " << transferId;
  task->cancelled = true;
  lock_guard<std::mutex> guard(task->leaseMutex);
  if (task->lease) {
    task->lease->abort();
  }
  return true;
}

void TransferEngine::cancelAll() {
  for (const auto& transferId : activeTransferIds()) {
    cancel(transferId);
  }
}

vector<string> TransferEngine::activeTransferIds() {
  lock_guard<std::mutex> guard(taskMutex);
  vector<string> ids;
  for (const auto& it : tasks) {
    ids.push_back(it.first);
  }
  return ids;
}

optional<TransferInfo> TransferEngine::transferInfo(const string& transferId) {
  auto task = findTask(transferId);
  if (!task) {
    return nullopt;
  }
  lock_guard<std::mutex> guard(task->infoMutex);
  return task->info;
}

void TransferEngine::shutdown() {
  cancelAll();
  std::unique_lock<std::mutex> lock(taskMutex);
  if (!taskCv.wait_for(lock, SHUTDOWN_TIMEOUT,
                       [this] { return tasks.empty(); })) {
    LOG(ERROR) << tasks.size() << " transfers still running at shutdown";
  }
}
}  // namespace btlink
