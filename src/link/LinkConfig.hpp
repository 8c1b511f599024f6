#ifndef __BTLINK_LINK_CONFIG__
#define __BTLINK_LINK_CONFIG__

#include "Headers.hpp"
#include "LinkConnection.hpp"
#include "MessageFilter.hpp"
#include "ReconnectSupervisor.hpp"
#include "SimpleIni.h"
#include "TransferEngine.hpp"

namespace btlink {
/**
 * @brief Every tunable of a btlink process, with compiled in defaults.
 *
 * Read from an ini file (see loadFromFile) and then overridden by command
 * line flags.
 */
struct LinkConfig {
  LinkConfig();

  // [Server]
  string serviceName;
  string serviceUuid;
  int channel;
  /**
   * @brief Local adapter address to listen on (empty for any), or the socket
   * path when running over the pipe transport.
   */
  string bindAddress;
  /** @brief Directory served to file requests, empty to refuse them. */
  string shareDir;

  // [Client]
  int64_t scanTimeoutMs;
  int64_t connectTimeoutMs;

  // [Connection]
  ConnectionOptions connection;
  int workerThreads;

  // [Transfer]
  TransferOptions transfer;
  string downloadDir;

  // [Reconnect]
  ReconnectConfig reconnect;

  // [Device]
  string deviceName;

  // [Debug]
  int verbose;
  string logDirectory;
  string maxLogSize;

  /** @brief Filter id -> filter config object, from [Filter:<id>]. */
  map<string, json> filters;

  /**
   * @brief Loads an ini file on top of the defaults.
   * @throws std::runtime_error if the file cannot be read.
   */
  static LinkConfig loadFromFile(const string& path);
  void loadFromIni(const CSimpleIniA& ini);

  /**
   * @brief Builds the configured filters.
   * @throws std::invalid_argument for an unknown filter type.
   */
  vector<MessageFilter> buildFilters() const;

  json toJson() const;

  /**
   * @brief Turns the string values of a [Filter:<id>] section into a
   * filter config object.
   */
  static json filterSectionToJson(const map<string, string>& values);
};
}  // namespace btlink

#endif  // __BTLINK_LINK_CONFIG__
