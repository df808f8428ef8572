/**
 * @file entry.hxx
 * @brief Metadata of a single tar member.
 */

#pragma once

#include <cstdint>
#include <string>

namespace tatar {

/// Member types tatar reads and writes, keyed by their ustar typeflag.
enum class EntryType : char {
  Regular = '0',
  HardLink = '1',
  Symlink = '2',
  CharDevice = '3',
  BlockDevice = '4',
  Directory = '5',
  Fifo = '6',
};

/**
 * @struct Entry
 * @brief Decoded header of one tar member.
 *
 * @c name is the full member path (ustar prefix, PAX and GNU long names
 * already applied) relative to the archive root, using '/' separators.
 * @c mode holds the permission bits including setuid, setgid and sticky.
 */
struct Entry {
  std::string name;
  std::uint32_t mode = 0;
  std::int64_t uid = 0;
  std::int64_t gid = 0;
  std::uint64_t size = 0;
  std::int64_t mtime = 0;
  EntryType type = EntryType::Regular;
  std::string link_name;
  std::string user_name;
  std::string group_name;
  std::uint32_t dev_major = 0;
  std::uint32_t dev_minor = 0;

  bool is_regular_file() const { return type == EntryType::Regular; }
  bool is_directory() const { return type == EntryType::Directory; }
  bool is_symlink() const { return type == EntryType::Symlink; }
  bool is_hard_link() const { return type == EntryType::HardLink; }
};

} // namespace tatar
