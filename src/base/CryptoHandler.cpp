#include "CryptoHandler.hpp"

#define SODIUM_FAIL(X)                                         \
  {                                                            \
    int rc = (X);                                              \
    if ((rc) == -1) STFATAL << "Crypto Error: (" << rc << ")"; \
  }
namespace btlink {

CryptoHandler::CryptoHandler(const string& passphrase) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  SODIUM_FAIL(crypto_generichash(key, sizeof(key),
                                 (const unsigned char*)passphrase.data(),
                                 passphrase.length(), NULL, 0));
}

CryptoHandler::~CryptoHandler() { sodium_memzero(key, sizeof(key)); }

string CryptoHandler::encrypt(const string& buffer) {
  string retval(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES +
                    buffer.length(),
                '\0');
  unsigned char* nonce = (unsigned char*)&retval[0];
  randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);
  SODIUM_FAIL(crypto_secretbox_easy(
      (unsigned char*)&retval[crypto_secretbox_NONCEBYTES],
      (const unsigned char*)buffer.data(), buffer.length(), nonce, key));
  return retval;
}

string CryptoHandler::decrypt(const string& buffer) {
  if (buffer.length() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
    throw std::runtime_error("Ciphertext too short");
  }
  const unsigned char* nonce = (const unsigned char*)buffer.data();
  size_t cipherLength = buffer.length() - crypto_secretbox_NONCEBYTES;
  string retval(cipherLength - crypto_secretbox_MACBYTES, '\0');
  if (crypto_secretbox_open_easy(
          (unsigned char*)&retval[0],
          (const unsigned char*)buffer.data() + crypto_secretbox_NONCEBYTES,
          cipherLength, nonce, key) == -1) {
    throw std::runtime_error("Decrypt failed.  Possible key mismatch?");
  }
  return retval;
}
}  // namespace btlink
