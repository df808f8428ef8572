/**
 * @file compression.hxx
 * @brief Compression tags understood by tatar and helpers around them.
 */

#pragma once

#include <optional>
#include <string_view>

namespace tatar {

/**
 * @brief Codec applied to the tar stream when it leaves or enters memory.
 *
 * The archive itself always holds uncompressed tar data; the tag only
 * selects the codec used by the serialization boundaries.
 */
enum class Compression { None, Gzip, Bzip2, Lzma };

/**
 * @brief Tuning knobs forwarded to the selected codec.
 *
 * @c level is the gzip compression level (0-9), the bzip2 block size (1-9) or
 * the lzma preset (0-9). Leaving it unset uses the codec default.
 */
struct CompressionOptions {
  std::optional<int> level;
};

/**
 * @brief Lower-case name of @p compression ("none", "gzip", ...).
 *
 * Values outside the enumeration map to "unknown".
 */
std::string_view to_string(Compression compression);

/**
 * @brief Guess the compression from the final extension of @p file_name.
 *
 * The match is case-insensitive: ".xz" and ".lzma" select Lzma, ".bz2" and
 * ".bzip2" select Bzip2, ".gz" and ".gzip" select Gzip. Everything else,
 * including names without an extension, selects None.
 */
Compression guess_compression(std::string_view file_name);

} // namespace tatar
