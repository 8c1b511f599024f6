#include "FrameDecoder.hpp"

namespace btlink {
bool FrameDecoder::next(Packet* packet) {
  if (partialMessage.length() < sizeof(uint32_t)) {
    // We didn't get the full header yet.
    return false;
  }
  int64_t messageLength = getPartialMessageLength();
  if (messageLength <= 0 || messageLength > MAX_FRAME_SIZE) {
    throw std::runtime_error(string("Invalid frame size: ") +
                             to_string(messageLength));
  }
  if (int64_t(partialMessage.length() - sizeof(uint32_t)) < messageLength) {
    VLOG(2) << "Frame of " << messageLength << " bytes still waiting for "
            << (messageLength -
                int64_t(partialMessage.length() - sizeof(uint32_t)))
            << " bytes";
    return false;
  }
  *packet = Packet(partialMessage.substr(sizeof(uint32_t), messageLength));
  partialMessage.erase(0, sizeof(uint32_t) + messageLength);
  return true;
}

int64_t FrameDecoder::getPartialMessageLength() const {
  uint32_t networkLength;
  memcpy(&networkLength, partialMessage.data(), sizeof(uint32_t));
  return int64_t(ntohl(networkLength));
}
}  // namespace btlink
