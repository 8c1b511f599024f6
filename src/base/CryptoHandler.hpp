#ifndef __BTLINK_CRYPTO_HANDLER__
#define __BTLINK_CRYPTO_HANDLER__

#include <sodium.h>

#include "Headers.hpp"

namespace btlink {

/**
 * @brief libsodium secretbox cipher used by the Encryption filter when it is
 * configured with `cipher = secretbox`.
 *
 * Messages travel through one filter pipeline per session but may go to any
 * number of peers, so there is no shared nonce counter: every sealed buffer
 * starts with its own random nonce.
 */
class CryptoHandler {
 public:
  /**
   * @brief Initializes libsodium and derives the secretbox key.
   * @param passphrase Arbitrary key material, hashed down to
   * crypto_secretbox_KEYBYTES with crypto_generichash.
   */
  explicit CryptoHandler(const string& passphrase);
  ~CryptoHandler();

  /**
   * @brief Seals a plaintext buffer.
   * @return nonce || ciphertext || MAC.
   */
  string encrypt(const string& buffer);

  /**
   * @brief Opens a buffer produced by encrypt().
   * @throws std::runtime_error if the buffer is truncated or the MAC does not
   * verify (wrong key or tampering).
   */
  string decrypt(const string& buffer);

 protected:
  /** @brief Shared secret key used for encrypt/decrypt operations. */
  unsigned char key[crypto_secretbox_KEYBYTES];
};
}  // namespace btlink

#endif  // __BTLINK_CRYPTO_HANDLER__
