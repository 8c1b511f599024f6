#include "Message.hpp"

namespace btlink {
bool Message::hasFlag(const string& key) const {
  auto it = metadata.find(key);
  return it != metadata.end() && it->is_boolean() && it->get<bool>();
}

string Message::metadataString(const string& key,
                               const string& fallback) const {
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<string>();
}

string Message::encode() const {
  WireMessage wire;
  wire.set_version(PROTOCOL_VERSION);
  wire.set_type(type);
  if (content) {
    wire.set_content(*content);
  }
  if (data) {
    wire.set_data(*data);
  }
  if (!metadata.empty()) {
    // Bytes that are not UTF-8 become U+FFFD instead of failing the send
    wire.set_metadata_json(
        metadata.dump(-1, ' ', false, json::error_handler_t::replace));
  }
  wire.set_timestamp(timestamp);
  string s;
  if (!wire.SerializeToString(&s)) {
    STFATAL << "Serialization of " << wire.GetTypeName() << " failed!";
  }
  return s;
}

Message Message::decode(const string& payload) {
  WireMessage wire;
  if (!wire.ParseFromString(payload) || !wire.has_type() ||
      wire.type().empty()) {
    VLOG(1) << "Payload is not a WireMessage, treating it as text";
    return makeTextMessage(payload);
  }
  if (wire.version() > PROTOCOL_VERSION) {
    LOG(WARNING) << "Peer speaks a newer message version (" << wire.version()
                 << "), decoding what we understand";
  }
  Message message(wire.type());
  if (wire.has_content()) {
    message.content = wire.content();
  }
  if (wire.has_data()) {
    message.data = wire.data();
  }
  if (wire.has_metadata_json()) {
    json parsed = json::parse(wire.metadata_json(), nullptr, false);
    if (parsed.is_object()) {
      message.metadata = parsed;
    } else {
      LOG(WARNING) << "Dropping malformed metadata on " << wire.type();
    }
  }
  if (wire.has_timestamp()) {
    message.timestamp = wire.timestamp();
  }
  return message;
}

json Message::toJson() const {
  json j;
  j["type"] = type;
  if (content) {
    j["content"] = *content;
  }
  if (data) {
    string encoded;
    Base64::Encode(*data, &encoded);
    j["data"] = encoded;
  }
  j["metadata"] = metadata;
  j["timestamp"] = timestamp;
  return j;
}

Message makeTextMessage(const string& text) {
  return Message(MessageTypes::TEXT, text);
}

Message makeFileRequest(const string& fileName) {
  Message message(MessageTypes::FILE_REQUEST);
  message.metadata["fileName"] = fileName;
  return message;
}

Message makeFileRequestError(const string& fileName, const string& error) {
  Message message(MessageTypes::FILE_REQUEST_ERROR, error);
  message.metadata["fileName"] = fileName;
  message.metadata["error"] = error;
  return message;
}

Message makeFileTransfer(const string& fileName, int64_t fileSize) {
  Message message(MessageTypes::FILE_TRANSFER);
  message.metadata["fileName"] = fileName;
  message.metadata["fileSize"] = fileSize;
  return message;
}

Message makeDeviceInfoRequest() {
  return Message(MessageTypes::DEVICE_INFO_REQUEST);
}

Message makeDeviceInfoMessage(const DeviceInfo& info) {
  Message message(MessageTypes::DEVICE_INFO);
  message.metadata["deviceName"] = info.device_name();
  message.metadata["deviceAddress"] = info.device_address();
  message.metadata["osVersion"] = info.os_version();
  message.metadata["appVersion"] = info.app_version();
  message.metadata["timestamp"] = info.timestamp();
  string s;
  if (!info.SerializeToString(&s)) {
    STFATAL << "Serialization of " << info.GetTypeName() << " failed!";
  }
  message.data = s;
  return message;
}

DeviceInfo parseDeviceInfo(const Message& message) {
  if (message.type != MessageTypes::DEVICE_INFO) {
    throw std::invalid_argument("Not a device_info message: " + message.type);
  }
  DeviceInfo info;
  if (message.data && info.ParseFromString(*message.data)) {
    return info;
  }
  if (!message.metadata.contains("deviceName")) {
    throw std::invalid_argument("device_info message carries no device info");
  }
  info.set_device_name(message.metadataString("deviceName"));
  info.set_device_address(message.metadataString("deviceAddress"));
  info.set_os_version(message.metadataString("osVersion"));
  info.set_app_version(message.metadataString("appVersion"));
  auto it = message.metadata.find("timestamp");
  if (it != message.metadata.end() && it->is_number_integer()) {
    info.set_timestamp(it->get<int64_t>());
  }
  return info;
}

DeviceInfo localDeviceInfo(const string& deviceName,
                           const string& deviceAddress) {
  DeviceInfo info;
  info.set_device_name(deviceName.empty() ? GetHostName() : deviceName);
  info.set_device_address(deviceAddress);
  info.set_os_version(GetOsVersion());
  info.set_app_version(BTLINK_VERSION);
  info.set_timestamp(nowEpochMs());
  return info;
}
}  // namespace btlink
