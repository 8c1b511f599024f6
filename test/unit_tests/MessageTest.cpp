#include "Message.hpp"

#include "TestHeaders.hpp"

using namespace btlink;

TEST_CASE("Message wire encoding", "[Message]") {
  Message message(MessageTypes::TEXT, "hi there");
  message.data = string("\x00\x01\x02", 3);
  message.metadata["priority"] = 3;

  Message decoded = Message::decode(message.encode());
  REQUIRE(decoded == message);
  REQUIRE(decoded.metadata["priority"] == 3);
}

TEST_CASE("Plain payloads decode as text", "[Message]") {
  Message decoded = Message::decode("just some words");
  REQUIRE(decoded.type == MessageTypes::TEXT);
  REQUIRE(decoded.content == string("just some words"));
  REQUIRE(decoded.metadata.is_object());
}

TEST_CASE("Message helpers", "[Message]") {
  Message request = makeFileRequest("notes.txt");
  REQUIRE(request.type == "file_request");
  REQUIRE(request.metadataString("fileName") == "notes.txt");
  REQUIRE(request.metadataString("missing", "fallback") == "fallback");

  Message error = makeFileRequestError("notes.txt", "File not found: notes.txt");
  REQUIRE(error.type == "file_request_error");
  REQUIRE(error.metadataString("error") == "File not found: notes.txt");

  Message announce = makeFileTransfer("photo.jpg", 1234);
  REQUIRE(announce.metadata["fileSize"] == 1234);

  request.metadata["compressed"] = true;
  REQUIRE(request.hasFlag("compressed"));
  request.metadata["compressed"] = "yes";
  REQUIRE_FALSE(request.hasFlag("compressed"));
}

TEST_CASE("Metadata that is not UTF-8 still encodes", "[Message]") {
  Message request = makeFileRequest("caf\xe9.txt");
  string payload;
  REQUIRE_NOTHROW(payload = request.encode());
  REQUIRE_NOTHROW(request.toString());
  Message decoded = Message::decode(payload);
  REQUIRE(decoded.type == "file_request");
  REQUIRE(decoded.metadataString("fileName") == "caf\xef\xbf\xbd.txt");
}

TEST_CASE("Device info round trip", "[Message]") {
  DeviceInfo info = localDeviceInfo("laptop", "00:11:22:33:44:55");
  REQUIRE(info.device_name() == "laptop");
  REQUIRE(info.app_version() == BTLINK_VERSION);

  Message message = makeDeviceInfoMessage(info);
  REQUIRE(message.metadataString("deviceName") == "laptop");

  DeviceInfo parsed = parseDeviceInfo(Message::decode(message.encode()));
  REQUIRE(parsed.device_address() == "00:11:22:33:44:55");
  REQUIRE(parsed.os_version() == info.os_version());

  REQUIRE_THROWS_AS(parseDeviceInfo(makeTextMessage("nope")),
                    std::invalid_argument);
}
