/**
 * @file tar-reader.hxx
 * @brief Pull-style iteration over the members of an in-memory tar stream.
 */

#pragma once

#include <tatar/entry.hxx>

#include <cstddef>
#include <optional>
#include <span>

namespace tatar {

/**
 * @class TarReader
 * @brief Walks the members of an uncompressed tar stream held in memory.
 *
 * The reader does not own the bytes it walks; they must outlive it. Call
 * next() to advance to the following member and content() to access the data
 * of the member next() returned last.
 *
 * @code{.cpp}
 * tatar::TarReader reader(archive.data());
 * while (auto entry = reader.next()) {
 *   auto bytes = reader.content();
 *   // ...
 * }
 * @endcode
 *
 * ustar prefixes, PAX extended headers ('x') and GNU long name/link members
 * ('L', 'K') are folded into the returned Entry; PAX global headers ('g') are
 * skipped.
 */
class TarReader {
public:
  explicit TarReader(std::span<const char> data);

  /**
   * @brief Decode the next member header.
   *
   * @return The member, or std::nullopt at the end-of-archive marker or at
   * the end of the data when it falls on a block boundary.
   * @throws FormatError on a truncated stream, a checksum mismatch, a bad
   * numeric field or an unsupported member type.
   */
  std::optional<Entry> next();

  /**
   * @brief Data of the current member.
   *
   * Empty for header-only members (directories, links, devices, FIFOs) and
   * before the first call to next().
   */
  std::span<const char> content() const { return content_; }

private:
  std::span<const char> data_;
  std::size_t offset_ = 0;
  std::span<const char> content_;
  bool done_ = false;
};

} // namespace tatar
