#pragma once

#include <tatar/compression.hxx>

#include <boost/iostreams/filtering_stream.hpp>

#include <istream>
#include <span>
#include <string_view>
#include <vector>

namespace tatar::detail {

/**
 * @struct Codec
 * @brief One row of the codec table: how to wrap a filter chain for a tag.
 *
 * The identity codec pushes nothing, so its chains hold only the device.
 */
struct Codec {
  Compression compression;
  std::string_view name;
  void (*push_compressor)(boost::iostreams::filtering_ostream &out,
                          const CompressionOptions &options);
  void (*push_decompressor)(boost::iostreams::filtering_istream &in);
};

/**
 * @brief Look up the codec for @p compression.
 *
 * @throws CompressionError for values outside the enumeration.
 */
const Codec &find_codec(Compression compression);

/**
 * @brief Run @p data through the compressor selected by @p compression.
 *
 * @throws CompressionError when the tag or options are invalid or the codec
 * fails.
 */
std::vector<char> compress(std::span<const char> data, Compression compression,
                           const CompressionOptions &options);

/**
 * @brief Read @p in to its end through the decompressor selected by
 * @p compression.
 *
 * @throws CompressionError when the tag is invalid or the input is not a
 * valid stream for the codec.
 */
std::vector<char> decompress(std::istream &in, Compression compression);

} // namespace tatar::detail
