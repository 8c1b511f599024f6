#include "Compression.hpp"
#include "FilterPipeline.hpp"
#include "TestHeaders.hpp"

using namespace btlink;

namespace {
MessageFilter tagger(const string& id, int priority, vector<string>* order) {
  return MessageFilter::custom(
      id, priority,
      [id, order](const Message& m) {
        order->push_back("in:" + id);
        return m;
      },
      [id, order](const Message& m) {
        order->push_back("out:" + id);
        return m;
      });
}
}  // namespace

TEST_CASE("Filters run in priority order", "[FilterPipeline]") {
  FilterPipeline pipeline;
  vector<string> order;
  pipeline.addFilter(tagger("b", 10, &order));
  pipeline.addFilter(tagger("a", 0, &order));
  pipeline.addFilter(tagger("c", 5, &order));

  pipeline.applyIncoming(makeTextMessage("x"));
  REQUIRE(order == vector<string>({"in:a", "in:c", "in:b"}));

  order.clear();
  pipeline.applyOutgoing(makeTextMessage("x"));
  REQUIRE(order == vector<string>({"out:b", "out:c", "out:a"}));

  REQUIRE_FALSE(pipeline.addFilter(tagger("a", 20, &order)));
  REQUIRE(pipeline.size() == 3);
  REQUIRE(pipeline.activeFilters().back().getId() == "a");
  REQUIRE(pipeline.removeFilter("a"));
  REQUIRE_FALSE(pipeline.removeFilter("a"));
  REQUIRE_FALSE(pipeline.hasFilter("a"));
}

TEST_CASE("Compression and encryption undo each other", "[FilterPipeline]") {
  FilterPipeline pipeline;
  pipeline.addFilter(MessageFilter::compression("zip", 0, 16));
  pipeline.addFilter(MessageFilter::encryption("xor", 1, "secret"));
  string text(200, 'a');

  Message wire = pipeline.applyOutgoing(makeTextMessage(text));
  REQUIRE(wire.hasFlag("compressed"));
  REQUIRE(wire.hasFlag("encrypted"));
  REQUIRE(wire.metadata["originalSize"] == 200);
  REQUIRE(*wire.content != text);

  Message back = pipeline.applyIncoming(Message::decode(wire.encode()));
  REQUIRE(back.content == text);
  REQUIRE(back.hasFlag("decompressed"));
  REQUIRE(back.hasFlag("decrypted"));
  REQUIRE_FALSE(back.hasFlag("compressed"));
  REQUIRE_FALSE(back.hasFlag("encrypted"));
}

TEST_CASE("Short content is not compressed", "[FilterPipeline]") {
  auto filter = MessageFilter::compression("zip", 0, 1024);
  Message out = filter.processOutgoing(makeTextMessage("short"));
  REQUIRE_FALSE(out.hasFlag("compressed"));
  REQUIRE(out.content == string("short"));
}

TEST_CASE("Secretbox encryption", "[FilterPipeline]") {
  auto sender = MessageFilter::encryption("box", 0, "pass", CipherKind::SECRETBOX);
  auto receiver =
      MessageFilter::encryption("box", 0, "pass", CipherKind::SECRETBOX);
  Message sealed = sender.processOutgoing(makeTextMessage("attack at dawn"));
  REQUIRE(sealed.content != string("attack at dawn"));
  REQUIRE(receiver.processIncoming(sealed).content == string("attack at dawn"));

  auto wrongKey =
      MessageFilter::encryption("box", 0, "other", CipherKind::SECRETBOX);
  REQUIRE_THROWS(wrongKey.processIncoming(sealed));
}

TEST_CASE("Compressed content may not inflate without bound",
          "[FilterPipeline]") {
  FilterPipeline pipeline;
  pipeline.addFilter(MessageFilter::compression("zip", 0, 16, 1024 * 1024));
  string zeros(4 * 1024 * 1024, '\0');
  Message bomb = makeTextMessage(base64Encode(gzipCompress(zeros)));
  bomb.metadata["compressed"] = true;
  REQUIRE(bomb.content->length() < 64 * 1024);
  REQUIRE_THROWS_AS(pipeline.applyIncoming(bomb), ValidationError);

  Message small = makeTextMessage(base64Encode(gzipCompress(string(1000, 'z'))));
  small.metadata["compressed"] = true;
  REQUIRE(pipeline.applyIncoming(small).content == string(1000, 'z'));
  REQUIRE_THROWS_AS(MessageFilter::compression("x", 0, 16, 0),
                    std::invalid_argument);
}

TEST_CASE("Validation rejects, other failures pass through",
          "[FilterPipeline]") {
  FilterPipeline pipeline;
  pipeline.addFilter(MessageFilter::validation("check", 0, {"sessionId"}));

  REQUIRE_THROWS_AS(pipeline.applyOutgoing(makeTextMessage("x")),
                    ValidationError);
  Message ok = makeTextMessage("x");
  ok.metadata["sessionId"] = "abc";
  REQUIRE(pipeline.applyOutgoing(ok).content == string("x"));

  pipeline.clearFilters();
  pipeline.addFilter(MessageFilter::custom(
      "broken", 0,
      [](const Message&) -> Message { throw std::runtime_error("boom"); },
      MessageTransform()));
  pipeline.addFilter(MessageFilter::routing("route", 1, {{"text", "chat"}}));
  Message routed = pipeline.applyIncoming(makeTextMessage("y"));
  REQUIRE(routed.content == string("y"));
  REQUIRE(routed.metadataString("routedTo") == "chat");
}

TEST_CASE("Filters from config", "[FilterPipeline]") {
  json config = {{"type", "routing"},
                 {"priority", 4},
                 {"routingRules", {{"file_request", "files"}}}};
  auto filter = MessageFilter::fromConfig("r", config);
  REQUIRE(filter.getTypeName() == "routing");
  REQUIRE(filter.getPriority() == 4);
  REQUIRE(filter.toConfig()["routingRules"]["file_request"] == "files");

  REQUIRE_THROWS_AS(MessageFilter::fromConfig("x", {{"type", "custom"}}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      MessageFilter::fromConfig("x", {{"type", "encryption"}, {"cipher", "rot13"}}),
      std::invalid_argument);
  REQUIRE_THROWS_AS(MessageFilter::compression("x", 0, -1),
                    std::invalid_argument);
  // Keys never show up in dumps
  auto secret = MessageFilter::encryption("e", 0, "hunter2");
  REQUIRE(secret.toConfig().dump().find("hunter2") == string::npos);
}

TEST_CASE("Compression helpers", "[Compression]") {
  string text = "The quick brown fox jumps over the lazy dog";
  REQUIRE(gzipDecompress(gzipCompress(text)) == text);
  REQUIRE_THROWS_AS(gzipDecompress("not gzip"), std::runtime_error);
  REQUIRE_THROWS_AS(gzipDecompress(gzipCompress(string(100000, 'a')), 65536),
                    std::length_error);
  REQUIRE(gzipDecompress(gzipCompress(text), text.length()) == text);
  REQUIRE(base64Decode(base64Encode(text)) == text);
  REQUIRE(xorKeystream(xorKeystream(text, "k3y"), "k3y") == text);
}
