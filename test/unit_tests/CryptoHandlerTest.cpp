#include "CryptoHandler.hpp"
#include "TestHeaders.hpp"

using namespace btlink;

TEST_CASE("DoesEncryptDecrypt", "[CryptoHandler]") {
  string key = "12345678901234567890123456789012";
  shared_ptr<CryptoHandler> encryptHandler(new CryptoHandler(key));
  shared_ptr<CryptoHandler> decryptHandler(new CryptoHandler(key));
  string message = "BT Phone Home";
  string encryptedMessage = encryptHandler->encrypt(message);
  REQUIRE(message != encryptedMessage);
  // Every buffer carries a fresh nonce
  REQUIRE(encryptedMessage != encryptHandler->encrypt(message));
  string decryptedMessage = decryptHandler->decrypt(encryptedMessage);
  REQUIRE(message == decryptedMessage);
}

TEST_CASE("RejectsTamperedBuffers", "[CryptoHandler]") {
  CryptoHandler handler("passphrase");
  string sealed = handler.encrypt("payload");
  sealed[sealed.length() - 1] ^= 0x01;
  REQUIRE_THROWS_AS(handler.decrypt(sealed), std::runtime_error);
  REQUIRE_THROWS_AS(handler.decrypt("short"), std::runtime_error);
}
