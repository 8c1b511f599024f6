#include "FrameDecoder.hpp"

#include "TestHeaders.hpp"

using namespace btlink;

TEST_CASE("Packet framing", "[FrameDecoder]") {
  Packet packet(PacketType::MESSAGE, "hello");
  REQUIRE(packet.length() == 6);
  string frame = packet.toFrame();
  REQUIRE(frame.length() == 10);
  // 4-byte big-endian length covers the header byte and the payload
  REQUIRE(frame[0] == 0);
  REQUIRE(frame[3] == 6);
  REQUIRE(uint8_t(frame[4]) == uint8_t(PacketType::MESSAGE));

  Packet parsed(packet.serialize());
  REQUIRE(parsed.getType() == PacketType::MESSAGE);
  REQUIRE(parsed.getPayload() == "hello");

  REQUIRE_THROWS_AS(Packet(string()), std::runtime_error);
  REQUIRE(isKnownPacketType(4));
  REQUIRE_FALSE(isKnownPacketType(0));
  REQUIRE_FALSE(isKnownPacketType(5));
}

TEST_CASE("Frames split across reads", "[FrameDecoder]") {
  FrameDecoder decoder;
  string stream = Packet(PacketType::MESSAGE, "first").toFrame() +
                  Packet(PacketType::COMMAND, "second").toFrame();
  Packet packet;

  SECTION("One byte at a time") {
    vector<Packet> packets;
    for (char c : stream) {
      decoder.append(&c, 1);
      while (decoder.next(&packet)) {
        packets.push_back(packet);
      }
    }
    REQUIRE(packets.size() == 2);
    REQUIRE(packets[0].getPayload() == "first");
    REQUIRE(packets[1].getType() == PacketType::COMMAND);
    REQUIRE(packets[1].getPayload() == "second");
    REQUIRE(decoder.pending() == 0);
  }

  SECTION("Two frames in one read") {
    decoder.append(stream.data(), stream.length());
    REQUIRE(decoder.next(&packet));
    REQUIRE(packet.getPayload() == "first");
    REQUIRE(decoder.next(&packet));
    REQUIRE(packet.getPayload() == "second");
    REQUIRE_FALSE(decoder.next(&packet));
  }

  SECTION("Trailing bytes stay pending") {
    string partial = stream.substr(0, stream.length() - 3);
    decoder.append(partial.data(), partial.length());
    REQUIRE(decoder.next(&packet));
    REQUIRE_FALSE(decoder.next(&packet));
    REQUIRE(decoder.pending() > 0);
    string taken = decoder.takePending();
    REQUIRE(decoder.pending() == 0);
    decoder.restore(taken);
    decoder.append(stream.data() + partial.length(), 3);
    REQUIRE(decoder.next(&packet));
    REQUIRE(packet.getPayload() == "second");
  }
}

TEST_CASE("Corrupt length prefix", "[FrameDecoder]") {
  FrameDecoder decoder;
  Packet packet;

  SECTION("Zero length") {
    string zero(4, '\0');
    decoder.append(zero.data(), zero.length());
    REQUIRE_THROWS_AS(decoder.next(&packet), std::runtime_error);
  }

  SECTION("Larger than the frame limit") {
    uint32_t huge = htonl(uint32_t(MAX_FRAME_SIZE + 1));
    decoder.append((const char*)&huge, sizeof(huge));
    REQUIRE_THROWS_AS(decoder.next(&packet), std::runtime_error);
  }
}
