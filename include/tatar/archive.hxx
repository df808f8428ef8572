/**
 * @file archive.hxx
 * @brief In-memory tar archive with a compression tag.
 */

#pragma once

#include <tatar/compression.hxx>
#include <tatar/entry.hxx>
#include <tatar/tar-reader.hxx>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

namespace tatar {

/**
 * @class Archive
 * @brief An uncompressed tar stream held in memory plus the codec used when it
 * is serialized.
 *
 * The bytes are always plain tar; compression only happens on the way out
 * (to_bytes(), to_file(), save()) and is undone on the way in (from_bytes(),
 * from_file(), from_stream()). Every operation either completes or throws,
 * in which case a half-built archive or directory must be discarded.
 *
 * @code{.cpp}
 * auto archive = tatar::Archive::from_directory("site");
 * archive.set_compression(tatar::Compression::Gzip);
 * archive.to_file("site.tar.gz");
 *
 * tatar::Archive::from_file("site.tar.gz").to_directory("restored");
 * @endcode
 */
class Archive {
public:
  /// Callback invoked by for_each(); @p content yields the member data.
  using EntryCallback =
      std::function<void(const Entry &entry, std::istream &content)>;

  /// An archive with no members: just the end-of-archive blocks.
  Archive();

  /**
   * @brief Wrap existing uncompressed tar bytes.
   */
  explicit Archive(std::vector<char> data,
                   Compression compression = Compression::None,
                   CompressionOptions options = {});

  /**
   * @brief Archive the contents of @p directory (not the directory itself).
   *
   * Children are visited depth first in lexical order, so parents always
   * precede their descendants. Symlinks are stored, not followed.
   *
   * @throws std::filesystem::filesystem_error if a path cannot be read.
   * @throws FormatError for sockets and members that cannot be encoded.
   */
  static Archive from_directory(const std::filesystem::path &directory);

  /**
   * @brief Decompress @p data with @p compression. The archive keeps the tag.
   *
   * @throws CompressionError when @p data is not a valid stream for the codec.
   */
  static Archive from_bytes(std::span<const char> data,
                            Compression compression);

  /**
   * @brief Read @p path, guessing the compression from its extension.
   *
   * @throws std::filesystem::filesystem_error if the file cannot be opened.
   * @throws CompressionError when the content does not match the codec.
   */
  static Archive from_file(const std::filesystem::path &path);

  /**
   * @brief Read @p in to its end and decompress it with @p compression.
   */
  static Archive from_stream(std::istream &in, Compression compression);

  /**
   * @brief The archive compressed with its own tag and options.
   *
   * @throws CompressionError for an unknown tag or invalid options.
   */
  std::vector<char> to_bytes() const;

  /**
   * @brief Write the compressed archive to @p path.
   *
   * When the archive's tag is Compression::None the codec is guessed from
   * @p path instead. Nothing is created if the codec cannot be selected.
   *
   * @return Number of bytes written to the file.
   */
  std::uint64_t to_file(const std::filesystem::path &path) const;

  /**
   * @brief Write the compressed archive to @p out.
   *
   * @return Number of bytes written.
   */
  std::uint64_t save(std::ostream &out) const;

  /**
   * @brief Extract every member below @p directory, creating it if needed.
   *
   * Failure to recreate a symlink is logged and skipped; any other error
   * stops the extraction. Member paths that are absolute, climb out of
   * @p directory, or pass through a symlink below it are rejected.
   */
  void to_directory(const std::filesystem::path &directory) const;

  /**
   * @brief Call @p callback for each member in stream order.
   *
   * Exceptions thrown by @p callback stop the iteration and propagate.
   */
  void for_each(const EntryCallback &callback) const;

  /// Pull-style reader over this archive; it must not outlive the archive.
  TarReader reader() const { return TarReader(data_); }

  /// The uncompressed tar bytes.
  const std::vector<char> &data() const { return data_; }

  Compression compression() const { return compression_; }
  void set_compression(Compression compression) { compression_ = compression; }

  const CompressionOptions &options() const { return options_; }
  void set_options(CompressionOptions options) { options_ = options; }

private:
  std::vector<char> data_;
  Compression compression_ = Compression::None;
  CompressionOptions options_;
};

} // namespace tatar
