#ifndef __BTLINK_MESSAGE_FILTER__
#define __BTLINK_MESSAGE_FILTER__

#include "CryptoHandler.hpp"
#include "Headers.hpp"
#include "Message.hpp"

namespace btlink {
/**
 * @brief Raised by a Validation filter. Unlike other filter failures it is
 * not swallowed by the pipeline.
 */
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const string& what) : std::invalid_argument(what) {}
};

typedef std::function<Message(const Message&)> MessageTransform;

/** @brief Logs every message it sees and passes it through unchanged. */
struct LoggingFilter {
  bool logIncoming = true;
  bool logOutgoing = true;
};

/** @brief gzip + base64 of `content` once it reaches `threshold` bytes. */
struct CompressionFilter {
  int64_t threshold = 1024;
  /** @brief Incoming content that inflates past this is rejected. */
  int64_t maxDecompressedSize = MAX_FRAME_SIZE;
};

enum class CipherKind { XOR, SECRETBOX };

/**
 * @brief Enciphers `content`.
 *
 * XOR is the default and is not real protection. SECRETBOX uses libsodium
 * through CryptoHandler, keyed by a hash of `key`.
 */
struct EncryptionFilter {
  string key = "default_key";
  CipherKind cipher = CipherKind::XOR;
  shared_ptr<CryptoHandler> cryptoHandler;
};

/** @brief Rejects messages without a type or missing metadata fields. */
struct ValidationFilter {
  vector<string> requiredFields;
};

/** @brief Tags messages with `routedTo` according to their type. */
struct RoutingFilter {
  map<string, string> routingRules;
};

/** @brief Caller supplied transform pair; either side may be empty. */
struct CustomFilter {
  MessageTransform incoming;
  MessageTransform outgoing;
};

typedef std::variant<LoggingFilter, CompressionFilter, EncryptionFilter,
                     ValidationFilter, RoutingFilter, CustomFilter>
    FilterKind;

/**
 * @brief One stage of the filter pipeline: an id, a priority and a kind.
 */
class MessageFilter {
 public:
  MessageFilter(const string& _id, int _priority, FilterKind _kind);

  const string& getId() const { return id; }
  int getPriority() const { return priority; }
  const FilterKind& getKind() const { return kind; }
  /** @brief "logging", "compression", ... as used in configs. */
  string getTypeName() const;

  /**
   * @brief Reverses what the paired outgoing stage did, if it did anything.
   * @throws ValidationError from a Validation filter, std::exception from
   * any other stage that fails.
   */
  Message processIncoming(const Message& message) const;
  Message processOutgoing(const Message& message) const;

  json toConfig() const;

  /**
   * @brief Builds a built-in filter from its config object.
   * @throws std::invalid_argument for unknown or custom types and bad keys.
   */
  static MessageFilter fromConfig(const string& id, const json& config);

  static MessageFilter logging(const string& id, int priority,
                               bool logIncoming = true,
                               bool logOutgoing = true);
  static MessageFilter compression(
      const string& id, int priority, int64_t threshold = 1024,
      int64_t maxDecompressedSize = MAX_FRAME_SIZE);
  static MessageFilter encryption(const string& id, int priority,
                                  const string& key,
                                  CipherKind cipher = CipherKind::XOR);
  static MessageFilter validation(const string& id, int priority,
                                  const vector<string>& requiredFields);
  static MessageFilter routing(const string& id, int priority,
                               const map<string, string>& routingRules);
  static MessageFilter custom(const string& id, int priority,
                              MessageTransform incoming,
                              MessageTransform outgoing);

 protected:
  string id;
  int priority;
  FilterKind kind;
};
}  // namespace btlink

#endif  // __BTLINK_MESSAGE_FILTER__
