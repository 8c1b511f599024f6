#ifndef __BTLINK_FRAME_DECODER__
#define __BTLINK_FRAME_DECODER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace btlink {
/**
 * @brief Reassembles length-prefixed packets from arbitrary stream reads.
 *
 * The read loop appends whatever a read() returned and then drains every
 * packet that is complete. Bytes belonging to an unfinished packet stay
 * buffered until the next append.
 */
class FrameDecoder {
 public:
  FrameDecoder() {}

  /** @brief Buffers freshly read bytes. */
  void append(const char* buf, size_t count) {
    partialMessage.append(buf, count);
  }

  /**
   * @brief Pops the next complete packet.
   * @return true when @p packet was filled, false if more bytes are needed.
   * @throws std::runtime_error if the length prefix is out of range.
   */
  bool next(Packet* packet);

  /** @brief Number of bytes waiting for the rest of their packet. */
  size_t pending() const { return partialMessage.length(); }
  /** @brief Removes and returns every byte that was not parsed yet. */
  string takePending() {
    string taken;
    taken.swap(partialMessage);
    return taken;
  }
  /** @brief Puts unconsumed bytes back in front of the buffer. */
  void restore(const string& bytes) { partialMessage.insert(0, bytes); }

  void clear() { partialMessage.clear(); }

 protected:
  /** @brief Decodes the 4-byte big-endian length at the head of the buffer. */
  int64_t getPartialMessageLength() const;

  string partialMessage;
};
}  // namespace btlink

#endif  // __BTLINK_FRAME_DECODER__
