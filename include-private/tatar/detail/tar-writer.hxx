#pragma once

#include <tatar/entry.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace tatar::detail {

/**
 * @class TarWriter
 * @brief Appends ustar members to an in-memory byte buffer.
 *
 * Each member is a header followed, for regular files, by exactly
 * Entry::size bytes of data. Members whose name or link target do not fit
 * the ustar fields are preceded by a PAX extended header. close() appends
 * the two zero blocks that terminate the archive.
 */
class TarWriter {
public:
  explicit TarWriter(std::vector<char> &out);

  /**
   * @brief Write the header block(s) of a member.
   *
   * @throws FormatError when a field cannot be represented.
   */
  void write_header(const Entry &entry);

  /**
   * @brief Copy the content of @p path as the data of the current member.
   *
   * @throws std::filesystem::filesystem_error when the file cannot be read.
   * @throws FormatError when the file size differs from the header.
   */
  void write_file_data(const std::filesystem::path &path);

  /// Append raw member data.
  void write_data(const char *data, std::size_t size);

  /// Pad the current member to a block boundary.
  void finish_member();

  /// Terminate the archive with two zero blocks.
  void close();

private:
  void write_pax_header(const Entry &entry, const std::vector<char> &records);

  std::vector<char> &out_;
  std::uint64_t member_remaining_ = 0;
  std::uint64_t member_written_ = 0;
};

} // namespace tatar::detail
