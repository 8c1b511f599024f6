#include "LinkConfig.hpp"

namespace btlink {
namespace {
const string FILTER_SECTION_PREFIX = "Filter:";

int64_t readInt(const CSimpleIniA& ini, const char* section, const char* key,
                int64_t fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return fallback;
  }
  try {
    return std::stoll(value);
  } catch (const std::logic_error& le) {
    LOG(WARNING) << "Invalid value for [" << section << "] " << key << ": "
                 << value << ", using " << fallback;
    return fallback;
  }
}

string readString(const CSimpleIniA& ini, const char* section,
                  const char* key, const string& fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  return value ? string(value) : fallback;
}

bool parseBool(const string& value, bool fallback) {
  string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  LOG(WARNING) << "Invalid boolean: " << value;
  return fallback;
}
}  // namespace

LinkConfig::LinkConfig()
    : serviceName(DEFAULT_SERVICE_NAME),
      serviceUuid(DEFAULT_SERVICE_UUID),
      channel(DEFAULT_RFCOMM_CHANNEL),
      scanTimeoutMs(15000),
      connectTimeoutMs(10000),
      workerThreads(16),
      downloadDir("./downloads"),
      deviceName(GetHostName()),
      verbose(0),
      logDirectory(GetTempDirectory()),
      maxLogSize("20971520") {}

LinkConfig LinkConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  LinkConfig config;
  config.loadFromIni(ini);
  LOG(INFO) << "Loaded config from " << path;
  return config;
}

void LinkConfig::loadFromIni(const CSimpleIniA& ini) {
  serviceName = readString(ini, "Server", "service_name", serviceName);
  serviceUuid = readString(ini, "Server", "service_uuid", serviceUuid);
  channel = int(readInt(ini, "Server", "channel", channel));
  bindAddress = readString(ini, "Server", "bind_address", bindAddress);
  shareDir = readString(ini, "Server", "share_dir", shareDir);

  scanTimeoutMs = readInt(ini, "Client", "scan_timeout_ms", scanTimeoutMs);
  connectTimeoutMs =
      readInt(ini, "Client", "connect_timeout_ms", connectTimeoutMs);

  connection.heartbeatIntervalMs = readInt(
      ini, "Connection", "heartbeat_interval_ms", connection.heartbeatIntervalMs);
  connection.readRetryLimit = int(readInt(ini, "Connection", "read_retry_limit",
                                          connection.readRetryLimit));
  connection.readRetryBackoffMs = readInt(
      ini, "Connection", "read_retry_backoff_ms", connection.readRetryBackoffMs);
  connection.readBufferSize = size_t(std::max<int64_t>(
      1024, readInt(ini, "Connection", "read_buffer_size",
                    int64_t(connection.readBufferSize))));
  workerThreads = int(std::max<int64_t>(
      2, readInt(ini, "Connection", "worker_threads", workerThreads)));

  transfer.chunkSize = size_t(std::max<int64_t>(
      1, readInt(ini, "Transfer", "chunk_size", int64_t(transfer.chunkSize))));
  transfer.progressIntervalMs = readInt(ini, "Transfer", "progress_interval_ms",
                                        transfer.progressIntervalMs);
  downloadDir = readString(ini, "Transfer", "download_dir", downloadDir);

  reconnect.enabled = parseBool(
      readString(ini, "Reconnect", "enabled", reconnect.enabled ? "1" : "0"),
      reconnect.enabled);
  reconnect.maxAttempts = std::max(
      1, int(readInt(ini, "Reconnect", "max_attempts", reconnect.maxAttempts)));
  reconnect.initialDelayMs =
      std::max(ReconnectConfig::MIN_INITIAL_DELAY_MS,
               readInt(ini, "Reconnect", "initial_delay_ms",
                       reconnect.initialDelayMs));
  reconnect.maxDelayMs = std::max(
      ReconnectConfig::MIN_MAX_DELAY_MS,
      readInt(ini, "Reconnect", "max_delay_ms", reconnect.maxDelayMs));

  deviceName = readString(ini, "Device", "name", deviceName);

  verbose = int(readInt(ini, "Debug", "verbose", verbose));
  logDirectory = readString(ini, "Debug", "logdirectory", logDirectory);
  int64_t logsize = readInt(ini, "Debug", "logsize", 0);
  if (logsize > 0) {
    maxLogSize = to_string(logsize);
  }

  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  for (const auto& section : sections) {
    string sectionName = section.pItem;
    if (sectionName.find(FILTER_SECTION_PREFIX) != 0) {
      continue;
    }
    string id = sectionName.substr(FILTER_SECTION_PREFIX.length());
    if (id.empty()) {
      LOG(WARNING) << "Ignoring filter section without an id";
      continue;
    }
    CSimpleIniA::TNamesDepend keys;
    ini.GetAllKeys(section.pItem, keys);
    map<string, string> values;
    for (const auto& key : keys) {
      const char* value = ini.GetValue(section.pItem, key.pItem, "");
      values[key.pItem] = value;
    }
    filters[id] = filterSectionToJson(values);
  }
}

json LinkConfig::filterSectionToJson(const map<string, string>& values) {
  json config = json::object();
  for (const auto& it : values) {
    const string& key = it.first;
    const string value = trim(it.second);
    if (key == "priority" || key == "threshold" ||
        key == "maxDecompressedSize") {
      try {
        config[key] = std::stoll(value);
      } catch (const std::logic_error& le) {
        LOG(WARNING) << "Invalid filter " << key << ": " << value;
      }
    } else if (key == "logIncoming" || key == "logOutgoing") {
      config[key] = parseBool(value, true);
    } else if (key == "requiredFields") {
      json fields = json::array();
      for (const auto& field : split(value, ',')) {
        if (!trim(field).empty()) {
          fields.push_back(trim(field));
        }
      }
      config[key] = fields;
    } else if (key == "routingRules") {
      json rules = json::object();
      for (const auto& rule : split(value, ',')) {
        auto pos = rule.find('=');
        if (pos == string::npos) {
          LOG(WARNING) << "Invalid routing rule: " << rule;
          continue;
        }
        rules[trim(rule.substr(0, pos))] = trim(rule.substr(pos + 1));
      }
      config[key] = rules;
    } else {
      config[key] = value;
    }
  }
  return config;
}

vector<MessageFilter> LinkConfig::buildFilters() const {
  vector<MessageFilter> built;
  for (const auto& it : filters) {
    built.push_back(MessageFilter::fromConfig(it.first, it.second));
  }
  return built;
}

json LinkConfig::toJson() const {
  json j;
  j["server"] = {{"serviceName", serviceName},
                 {"serviceUuid", serviceUuid},
                 {"channel", channel},
                 {"bindAddress", bindAddress},
                 {"shareDir", shareDir}};
  j["client"] = {{"scanTimeout", scanTimeoutMs},
                 {"connectTimeout", connectTimeoutMs}};
  j["connection"] = {{"heartbeatInterval", connection.heartbeatIntervalMs},
                     {"readRetryLimit", connection.readRetryLimit},
                     {"readRetryBackoff", connection.readRetryBackoffMs},
                     {"readBufferSize", connection.readBufferSize},
                     {"workerThreads", workerThreads}};
  j["transfer"] = {{"chunkSize", transfer.chunkSize},
                   {"progressInterval", transfer.progressIntervalMs},
                   {"downloadDir", downloadDir}};
  j["reconnect"] = reconnect.toJson();
  j["deviceName"] = deviceName;
  j["filters"] = filters;
  return j;
}
}  // namespace btlink
