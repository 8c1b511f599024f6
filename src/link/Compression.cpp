#include "Compression.hpp"

#include <zlib.h>

namespace btlink {
namespace {
// 15 window bits plus 16 selects the gzip container
const int GZIP_WINDOW_BITS = 15 + 16;
// 15 window bits plus 32 auto-detects gzip or zlib headers
const int AUTO_WINDOW_BITS = 15 + 32;
const size_t INFLATE_CHUNK = 16 * 1024;
}  // namespace

string gzipCompress(const string& input) {
  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  string output(deflateBound(&zs, input.length()), '\0');
  zs.next_in = (Bytef*)input.data();
  zs.avail_in = uInt(input.length());
  zs.next_out = (Bytef*)&output[0];
  zs.avail_out = uInt(output.length());
  int ret = deflate(&zs, Z_FINISH);
  size_t written = zs.total_out;
  deflateEnd(&zs);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error(string("deflate failed: ") +
                             (zs.msg ? zs.msg : to_string(ret)));
  }
  output.resize(written);
  return output;
}

string gzipDecompress(const string& input, size_t maxOutput) {
  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  if (inflateInit2(&zs, AUTO_WINDOW_BITS) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  zs.next_in = (Bytef*)input.data();
  zs.avail_in = uInt(input.length());

  string output;
  char buffer[INFLATE_CHUNK];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = (Bytef*)buffer;
    zs.avail_out = sizeof(buffer);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      string reason = zs.msg ? zs.msg : to_string(ret);
      inflateEnd(&zs);
      throw std::runtime_error("inflate failed: " + reason);
    }
    size_t produced = sizeof(buffer) - zs.avail_out;
    if (output.length() + produced > maxOutput) {
      inflateEnd(&zs);
      throw std::length_error("Decompressed size exceeds " +
                              to_string(maxOutput) + " bytes");
    }
    output.append(buffer, produced);
    if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw std::runtime_error("inflate failed: truncated input");
    }
  }
  inflateEnd(&zs);
  return output;
}

string base64Encode(const string& input) {
  string out;
  if (!Base64::Encode(input, &out)) {
    throw std::runtime_error("b64 encode failed");
  }
  return out;
}

string base64Decode(const string& input) {
  string out;
  if (!Base64::Decode(input, &out)) {
    throw std::runtime_error("b64 decode failed");
  }
  return out;
}

string xorKeystream(const string& input, const string& key) {
  if (key.empty()) {
    throw std::invalid_argument("XOR key must not be empty");
  }
  string out(input);
  for (size_t i = 0; i < out.length(); i++) {
    out[i] = char(out[i] ^ key[i % key.length()]);
  }
  return out;
}
}  // namespace btlink
