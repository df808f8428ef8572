#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tatar::detail {

/// Size of a tar block. Headers and member data are aligned to it.
inline constexpr std::size_t block_size = 512;

/**
 * @struct TarHeader
 * @brief Representation of a POSIX/USTAR TAR header block (512 bytes).
 *
 * The struct layout matches the on-disk TAR header format. Fields are
 * fixed-size character arrays and may be NUL-terminated or filled according to
 * the ustar format.
 *
 * Note: The struct is packed to guarantee the exact 512-byte layout.
 */
struct __attribute__((packed)) TarHeader {
  char name[100];     /**< @brief File name (may be NUL-terminated). */
  char mode[8];       /**< @brief File mode (octal ASCII). */
  char uid[8];        /**< @brief Owner user ID (octal ASCII). */
  char gid[8];        /**< @brief Owner group ID (octal ASCII). */
  char size[12];      /**< @brief File size (octal ASCII or base-256 binary). */
  char mtime[12];     /**< @brief Modification time (octal ASCII). */
  char chksum[8];     /**< @brief Header checksum field (octal ASCII). */
  char typeflag[1];   /**< @brief Type flag ('0' regular file, '5' directory,
                         etc.). */
  char linkname[100]; /**< @brief Name of linked file for symlinks. */
  char magic[6];      /**< @brief UStar magic ("ustar\0"). */
  char version[2];    /**< @brief UStar version ("00"). */
  char uname[32];     /**< @brief Owner user name. */
  char gname[32];     /**< @brief Owner group name. */
  char devmajor[8];   /**< @brief Device major number for special files. */
  char devminor[8];   /**< @brief Device minor number for special files. */
  char prefix[155];   /**< @brief Prefix for long file names. */
  char padding[12];   /**< @brief Padding to make the header 512 bytes. */
};

static_assert(sizeof(TarHeader) == block_size, "TarHeader must be 512 bytes");

/// Typeflags that appear in headers but never surface as an Entry.
inline constexpr char pax_extended_type = 'x';
inline constexpr char pax_global_type = 'g';
inline constexpr char gnu_long_name_type = 'L';
inline constexpr char gnu_long_link_type = 'K';

/**
 * @brief Check whether a 512-byte TAR block is entirely zeros.
 *
 * @param block Pointer to a 512-byte memory region to inspect.
 * @return true when every byte in the block is '\0'.
 */
bool is_zero_block(const char *block);

/**
 * @brief Parse a numeric header field, octal ASCII or base-256.
 *
 * A field whose first byte has the high bit set is decoded as a big-endian
 * two's complement base-256 number; otherwise it is read as octal text,
 * ignoring leading spaces and stopping at the first NUL or space.
 *
 * @throws FormatError when the field holds something other than digits.
 */
std::int64_t parse_numeric(const char *field, std::size_t size);

/**
 * @brief Write @p value into a numeric header field.
 *
 * Values that fit are written as zero-padded octal followed by a NUL. Larger
 * values fall back to base-256, which only the size field is wide enough to
 * carry in practice.
 *
 * @throws FormatError when @p value cannot be represented at all.
 */
void format_numeric(char *field, std::size_t size, std::int64_t value);

/**
 * @brief Extract a possibly non-null-terminated string field.
 */
std::string extract_string(const char *field, std::size_t size);

/// Header checksum under both byte interpretations.
struct HeaderChecksum {
  std::int64_t unsigned_sum = 0;
  std::int64_t signed_sum = 0;
};

/**
 * @brief Sum of the header bytes with the checksum field taken as spaces.
 *
 * Historic writers summed signed chars, so both interpretations are returned
 * for the reader to accept either one.
 */
HeaderChecksum compute_checksum(const TarHeader &header);

} // namespace tatar::detail
