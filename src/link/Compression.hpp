#ifndef __BTLINK_COMPRESSION__
#define __BTLINK_COMPRESSION__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief gzip-compresses @p input with zlib.
 * @throws std::runtime_error if zlib reports an error.
 */
string gzipCompress(const string& input);

/**
 * @brief Inflates a gzip (or zlib) stream.
 * @throws std::length_error once the output would exceed @p maxOutput
 * bytes, std::runtime_error on corrupt or truncated input.
 */
string gzipDecompress(const string& input,
                      size_t maxOutput = size_t(MAX_FRAME_SIZE));

/** @brief Base64 encodes, throwing on failure. */
string base64Encode(const string& input);

/**
 * @brief Base64 decodes.
 * @throws std::runtime_error if the input is not valid base64.
 */
string base64Decode(const string& input);

/**
 * @brief Repeating-key XOR. Applying it twice with the same key is the
 * identity.
 */
string xorKeystream(const string& input, const string& key);
}  // namespace btlink

#endif  // __BTLINK_COMPRESSION__
