#include "MessageFilter.hpp"

#include "Compression.hpp"

namespace btlink {
namespace {
string describe(const Message& message) {
  string s = message.type;
  if (message.content) {
    s += " (" + to_string(message.content->length()) + " chars)";
  }
  if (message.data) {
    s += " [" + to_string(message.data->length()) + " bytes]";
  }
  return s;
}

string encipher(const EncryptionFilter& filter, const string& plaintext) {
  if (filter.cipher == CipherKind::SECRETBOX) {
    return base64Encode(filter.cryptoHandler->encrypt(plaintext));
  }
  return base64Encode(xorKeystream(plaintext, filter.key));
}

string decipher(const EncryptionFilter& filter, const string& ciphertext) {
  if (filter.cipher == CipherKind::SECRETBOX) {
    return filter.cryptoHandler->decrypt(base64Decode(ciphertext));
  }
  return xorKeystream(base64Decode(ciphertext), filter.key);
}

void validate(const ValidationFilter& filter, const Message& message) {
  if (message.type.empty()) {
    throw ValidationError("Message type is required");
  }
  for (const auto& field : filter.requiredFields) {
    if (!message.metadata.contains(field)) {
      throw ValidationError("Required field missing: " + field);
    }
  }
}

Message route(const RoutingFilter& filter, const Message& message) {
  auto it = filter.routingRules.find(message.type);
  if (it == filter.routingRules.end()) {
    return message;
  }
  Message routed(message);
  routed.metadata["routedTo"] = it->second;
  return routed;
}

struct IncomingVisitor {
  const string& id;
  const Message& message;

  Message operator()(const LoggingFilter& filter) const {
    if (filter.logIncoming) {
      LOG(INFO) << "[" << id << "] incoming: " << describe(message);
    }
    return message;
  }
  Message operator()(const CompressionFilter& filter) const {
    if (!message.hasFlag("compressed") || !message.content) {
      return message;
    }
    Message out(message);
    try {
      out.content = gzipDecompress(base64Decode(*message.content),
                                   size_t(filter.maxDecompressedSize));
    } catch (const std::length_error& le) {
      throw ValidationError(string("Compressed content rejected: ") +
                            le.what());
    }
    out.metadata.erase("compressed");
    out.metadata["decompressed"] = true;
    return out;
  }
  Message operator()(const EncryptionFilter& filter) const {
    if (!message.hasFlag("encrypted") || !message.content) {
      return message;
    }
    Message out(message);
    out.content = decipher(filter, *message.content);
    out.metadata.erase("encrypted");
    out.metadata["decrypted"] = true;
    return out;
  }
  Message operator()(const ValidationFilter& filter) const {
    validate(filter, message);
    return message;
  }
  Message operator()(const RoutingFilter& filter) const {
    return route(filter, message);
  }
  Message operator()(const CustomFilter& filter) const {
    return filter.incoming ? filter.incoming(message) : message;
  }
};

struct OutgoingVisitor {
  const string& id;
  const Message& message;

  Message operator()(const LoggingFilter& filter) const {
    if (filter.logOutgoing) {
      LOG(INFO) << "[" << id << "] outgoing: " << describe(message);
    }
    return message;
  }
  Message operator()(const CompressionFilter& filter) const {
    if (!message.content ||
        int64_t(message.content->length()) < filter.threshold ||
        message.hasFlag("compressed")) {
      return message;
    }
    Message out(message);
    out.content = base64Encode(gzipCompress(*message.content));
    out.metadata["compressed"] = true;
    out.metadata["originalSize"] = int64_t(message.content->length());
    out.metadata["compressionFilter"] = id;
    return out;
  }
  Message operator()(const EncryptionFilter& filter) const {
    if (!message.content || message.hasFlag("encrypted")) {
      return message;
    }
    Message out(message);
    out.content = encipher(filter, *message.content);
    out.metadata["encrypted"] = true;
    out.metadata["encryptionFilter"] = id;
    return out;
  }
  Message operator()(const ValidationFilter& filter) const {
    validate(filter, message);
    return message;
  }
  Message operator()(const RoutingFilter& filter) const {
    return route(filter, message);
  }
  Message operator()(const CustomFilter& filter) const {
    return filter.outgoing ? filter.outgoing(message) : message;
  }
};

struct TypeNameVisitor {
  string operator()(const LoggingFilter&) const { return "logging"; }
  string operator()(const CompressionFilter&) const { return "compression"; }
  string operator()(const EncryptionFilter&) const { return "encryption"; }
  string operator()(const ValidationFilter&) const { return "validation"; }
  string operator()(const RoutingFilter&) const { return "routing"; }
  string operator()(const CustomFilter&) const { return "custom"; }
};

struct ConfigVisitor {
  json& config;

  void operator()(const LoggingFilter& filter) const {
    config["logIncoming"] = filter.logIncoming;
    config["logOutgoing"] = filter.logOutgoing;
  }
  void operator()(const CompressionFilter& filter) const {
    config["threshold"] = filter.threshold;
    config["maxDecompressedSize"] = filter.maxDecompressedSize;
  }
  void operator()(const EncryptionFilter& filter) const {
    // The key is a secret and stays out of dumps.
    config["cipher"] =
        filter.cipher == CipherKind::SECRETBOX ? "secretbox" : "xor";
  }
  void operator()(const ValidationFilter& filter) const {
    config["requiredFields"] = filter.requiredFields;
  }
  void operator()(const RoutingFilter& filter) const {
    config["routingRules"] = filter.routingRules;
  }
  void operator()(const CustomFilter&) const {}
};

template <typename T>
T configValue(const json& config, const string& key, const T& fallback) {
  auto it = config.find(key);
  if (it == config.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument("Bad value for filter key " + key + ": " +
                                e.what());
  }
}
}  // namespace

MessageFilter::MessageFilter(const string& _id, int _priority, FilterKind _kind)
    : id(_id), priority(_priority), kind(std::move(_kind)) {
  if (id.empty()) {
    throw std::invalid_argument("Filter id must not be empty");
  }
  if (auto encryption = std::get_if<EncryptionFilter>(&kind)) {
    if (encryption->key.empty()) {
      throw std::invalid_argument("Encryption key must not be empty");
    }
    if (encryption->cipher == CipherKind::SECRETBOX &&
        !encryption->cryptoHandler) {
      encryption->cryptoHandler.reset(new CryptoHandler(encryption->key));
    }
  }
}

string MessageFilter::getTypeName() const {
  return std::visit(TypeNameVisitor(), kind);
}

Message MessageFilter::processIncoming(const Message& message) const {
  return std::visit(IncomingVisitor{id, message}, kind);
}

Message MessageFilter::processOutgoing(const Message& message) const {
  return std::visit(OutgoingVisitor{id, message}, kind);
}

json MessageFilter::toConfig() const {
  json config;
  config["id"] = id;
  config["type"] = getTypeName();
  config["priority"] = priority;
  std::visit(ConfigVisitor{config}, kind);
  return config;
}

MessageFilter MessageFilter::fromConfig(const string& id, const json& config) {
  if (!config.is_object()) {
    throw std::invalid_argument("Filter config for " + id +
                                " must be an object");
  }
  string type = configValue<string>(config, "type", "");
  int priority = configValue<int>(config, "priority", 0);
  if (type == "logging") {
    return logging(id, priority, configValue<bool>(config, "logIncoming", true),
                   configValue<bool>(config, "logOutgoing", true));
  }
  if (type == "compression") {
    return compression(
        id, priority, configValue<int64_t>(config, "threshold", 1024),
        configValue<int64_t>(config, "maxDecompressedSize", MAX_FRAME_SIZE));
  }
  if (type == "encryption") {
    string cipher = configValue<string>(config, "cipher", "xor");
    if (cipher != "xor" && cipher != "secretbox") {
      throw std::invalid_argument("Unknown cipher: " + cipher);
    }
    return encryption(
        id, priority, configValue<string>(config, "key", "default_key"),
        cipher == "secretbox" ? CipherKind::SECRETBOX : CipherKind::XOR);
  }
  if (type == "validation") {
    return validation(id, priority,
                      configValue<vector<string>>(config, "requiredFields",
                                                  vector<string>()));
  }
  if (type == "routing") {
    return routing(id, priority,
                   configValue<map<string, string>>(
                       config, "routingRules", map<string, string>()));
  }
  throw std::invalid_argument("Unknown filter type: " + type);
}

MessageFilter MessageFilter::logging(const string& id, int priority,
                                     bool logIncoming, bool logOutgoing) {
  LoggingFilter filter;
  filter.logIncoming = logIncoming;
  filter.logOutgoing = logOutgoing;
  return MessageFilter(id, priority, filter);
}

MessageFilter MessageFilter::compression(const string& id, int priority,
                                         int64_t threshold,
                                         int64_t maxDecompressedSize) {
  if (threshold < 0) {
    throw std::invalid_argument("Compression threshold must not be negative");
  }
  if (maxDecompressedSize <= 0) {
    throw std::invalid_argument(
        "Compression size limit must be positive");
  }
  CompressionFilter filter;
  filter.threshold = threshold;
  filter.maxDecompressedSize = maxDecompressedSize;
  return MessageFilter(id, priority, filter);
}

MessageFilter MessageFilter::encryption(const string& id, int priority,
                                        const string& key, CipherKind cipher) {
  EncryptionFilter filter;
  filter.key = key;
  filter.cipher = cipher;
  return MessageFilter(id, priority, filter);
}

MessageFilter MessageFilter::validation(const string& id, int priority,
                                        const vector<string>& requiredFields) {
  ValidationFilter filter;
  filter.requiredFields = requiredFields;
  return MessageFilter(id, priority, filter);
}

MessageFilter MessageFilter::routing(const string& id, int priority,
                                     const map<string, string>& routingRules) {
  RoutingFilter filter;
  filter.routingRules = routingRules;
  return MessageFilter(id, priority, filter);
}

MessageFilter MessageFilter::custom(const string& id, int priority,
                                    MessageTransform incoming,
                                    MessageTransform outgoing) {
  CustomFilter filter;
  filter.incoming = incoming;
  filter.outgoing = outgoing;
  return MessageFilter(id, priority, filter);
}
}  // namespace btlink
