#ifndef __BTLINK_MESSAGE__
#define __BTLINK_MESSAGE__

#include "Headers.hpp"

namespace btlink {
namespace MessageTypes {
const string TEXT = "text";
const string FILE_REQUEST = "file_request";
const string FILE_REQUEST_ERROR = "file_request_error";
/** @brief Announces that a raw file transfer follows on the stream. */
const string FILE_TRANSFER = "file_transfer";
const string DEVICE_INFO_REQUEST = "device_info_request";
const string DEVICE_INFO = "device_info";
}  // namespace MessageTypes

/**
 * @brief A structured unit of application data.
 *
 * Filters annotate `metadata` with what they did (`compressed`,
 * `encrypted`, ...) and the session layer adds `senderAddress` on receipt.
 */
struct Message {
  Message() : metadata(json::object()), timestamp(nowEpochMs()) {}
  explicit Message(const string& _type)
      : type(_type), metadata(json::object()), timestamp(nowEpochMs()) {}
  Message(const string& _type, const string& _content)
      : type(_type),
        content(_content),
        metadata(json::object()),
        timestamp(nowEpochMs()) {}

  string type;
  optional<string> content;
  /** @brief Opaque binary payload. */
  optional<string> data;
  json metadata;
  /** @brief Creation time, milliseconds since the epoch. */
  int64_t timestamp;

  /** @brief True if metadata[key] exists and is the boolean true. */
  bool hasFlag(const string& key) const;
  /** @brief metadata[key] as a string, or @p fallback. */
  string metadataString(const string& key, const string& fallback = "") const;

  /** @brief Serializes the message into a WireMessage payload. */
  string encode() const;
  /**
   * @brief Parses a MESSAGE payload.
   *
   * Bytes that are not a WireMessage (for example a peer that only speaks
   * plain text) come back as a "text" message carrying the raw payload.
   */
  static Message decode(const string& payload);

  json toJson() const;
  string toString() const {
    return toJson().dump(-1, ' ', false, json::error_handler_t::replace);
  }

  bool operator==(const Message& other) const {
    return type == other.type && content == other.content &&
           data == other.data && metadata == other.metadata &&
           timestamp == other.timestamp;
  }
  bool operator!=(const Message& other) const { return !(*this == other); }
};

inline ostream& operator<<(ostream& os, const Message& message) {
  return os << message.toString();
}

Message makeTextMessage(const string& text);
Message makeFileRequest(const string& fileName);
Message makeFileRequestError(const string& fileName, const string& error);
Message makeFileTransfer(const string& fileName, int64_t fileSize);
Message makeDeviceInfoRequest();
/** @brief device_info message: fields in metadata, the proto in data. */
Message makeDeviceInfoMessage(const DeviceInfo& info);
/**
 * @brief Extracts the DeviceInfo carried by a device_info message.
 * @throws std::invalid_argument if the message has no device info.
 */
DeviceInfo parseDeviceInfo(const Message& message);
/** @brief Fills a DeviceInfo for this host. */
DeviceInfo localDeviceInfo(const string& deviceName,
                           const string& deviceAddress);
}  // namespace btlink

#endif  // __BTLINK_MESSAGE__
