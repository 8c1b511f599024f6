#ifndef __BTLINK_PACKET_H__
#define __BTLINK_PACKET_H__

#include "Headers.hpp"

namespace btlink {
/** @brief Header byte identifying what a frame carries. */
enum class PacketType : uint8_t {
  MESSAGE = 1,
  RAW_DATA = 2,
  COMMAND = 3,
  HEARTBEAT = 4,
};

/**
 * @brief One unit of link traffic: a header byte followed by the payload.
 *
 * On the wire each packet is preceded by a 4-byte big-endian length (see
 * FrameDecoder), so a single send() always arrives as a single packet no
 * matter how the transport splits the bytes.
 */
class Packet {
 public:
  Packet() : header(0) {}
  Packet(PacketType _type, const string& _payload)
      : header(uint8_t(_type)), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error if the buffer is empty.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Empty packet");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  PacketType getType() const { return PacketType(header); }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  size_t length() const { return HEADER_SIZE + payload.length(); }

  /** @brief Header byte followed by the payload. */
  string serialize() const {
    string s(1, char(header));
    s.append(payload);
    return s;
  }

  /** @brief Length-prefixed form written to the stream. */
  string toFrame() const {
    string body = serialize();
    uint32_t length = htonl(uint32_t(body.length()));
    string frame((const char*)&length, sizeof(uint32_t));
    frame.append(body);
    return frame;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};

inline bool isKnownPacketType(uint8_t header) {
  return header >= uint8_t(PacketType::MESSAGE) &&
         header <= uint8_t(PacketType::HEARTBEAT);
}
}  // namespace btlink

#endif  // __BTLINK_PACKET_H__
