#include <tatar/detail/tar-header.hxx>
#include <tatar/error.hxx>

#include <cstdint>
#include <cstring>
#include <string>

namespace tatar::detail {
namespace {

/**
 * @brief Parse a base-256 encoded integer from a TAR header field.
 *
 * GNU tar and newer POSIX extensions allow storing file sizes and other
 * numeric fields using a base-256 (binary) representation when values do
 * not fit into the traditional octal ASCII field. This routine implements
 * the decoding of that representation into a signed 64-bit integer.
 *
 * The function handles variable-length two's complement values encoded in
 * big-endian order and performs overflow checks against the int64_t range.
 *
 * @param _p Pointer to the first byte of the base-256 field.
 * @param char_cnt Number of bytes available in the field.
 * @return int64_t Decoded signed integer.
 * @throws FormatError when the value does not fit into int64_t.
 */
std::int64_t parse_base256_impl(const char *_p, std::size_t char_cnt) {
  std::uint64_t l;
  auto p = reinterpret_cast<const unsigned char *>(_p);
  auto c = *p;
  unsigned char neg;

  if (c & 0x40) {
    neg = 0xff;
    c |= 0x80;
    l = ~std::uint64_t(0);
  } else {
    neg = 0;
    c &= 0x7f;
    l = 0;
  }

  while (char_cnt > sizeof(std::int64_t)) {
    --char_cnt;
    if (c != neg)
      throw FormatError("base-256 field in tar header overflows 64 bits");
    c = *++p;
  }

  if ((c ^ neg) & 0x80)
    throw FormatError("base-256 field in tar header overflows 64 bits");

  while (--char_cnt > 0) {
    l = (l << 8) | c;
    c = *++p;
  }
  l = (l << 8) | c;
  return static_cast<std::int64_t>(l);
}

/**
 * @brief Parse an octal ASCII integer from a TAR header field.
 *
 * Leading spaces are skipped and parsing stops at the first NUL or space
 * after the digits, which covers the terminators used by every common writer.
 *
 * @param p Pointer to the first byte of the octal ASCII field.
 * @param n Number of bytes to inspect.
 * @return std::int64_t Parsed (non-negative) integer value.
 */
std::int64_t parse_octal_impl(const char *p, std::size_t n) {
  std::size_t i = 0;
  while (i < n && p[i] == ' ')
    ++i;

  std::uint64_t result = 0;
  for (; i < n && p[i] != '\0' && p[i] != ' '; ++i) {
    if (p[i] < '0' || p[i] > '7')
      throw FormatError("invalid octal digit in tar header field");
    if (result >> 61)
      throw FormatError("octal field in tar header overflows 64 bits");
    result = (result << 3) + static_cast<std::uint64_t>(p[i] - '0');
  }
  return static_cast<std::int64_t>(result);
}

void format_octal_impl(char *field, std::size_t size, std::uint64_t value) {
  // size - 1 digits followed by a terminating NUL.
  field[size - 1] = '\0';
  for (std::size_t i = size - 1; i > 0; --i) {
    field[i - 1] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
}

void format_base256_impl(char *field, std::size_t size, std::int64_t value) {
  auto v = static_cast<std::uint64_t>(value);
  for (std::size_t i = size; i > 1; --i) {
    field[i - 1] = static_cast<char>(v & 0xff);
    v = value < 0 ? (v >> 8) | (std::uint64_t(0xff) << 56) : v >> 8;
  }
  field[0] = static_cast<char>(value < 0 ? 0xff : 0x80);
}

} // unnamed namespace

bool is_zero_block(const char *block) {
  for (std::size_t i = 0; i < block_size; ++i)
    if (block[i] != '\0')
      return false;
  return true;
}

std::int64_t parse_numeric(const char *field, std::size_t size) {
  if (static_cast<unsigned char>(field[0]) & 0x80)
    return parse_base256_impl(field, size);
  return parse_octal_impl(field, size);
}

void format_numeric(char *field, std::size_t size, std::int64_t value) {
  const auto octal_digits = size - 1;
  if (value >= 0 && (octal_digits >= 21 ||
                     static_cast<std::uint64_t>(value) <
                         (std::uint64_t(1) << (3 * octal_digits)))) {
    format_octal_impl(field, size, static_cast<std::uint64_t>(value));
    return;
  }

  // The leading byte only carries the marker, so size - 1 bytes of payload.
  const auto payload_bits = 8 * (size - 1);
  if (payload_bits < 64) {
    const auto limit = std::int64_t(1) << (payload_bits - 1);
    if (value >= limit || value < -limit)
      throw FormatError("numeric value " + std::to_string(value) +
                        " does not fit into a tar header field");
  }
  format_base256_impl(field, size, value);
}

std::string extract_string(const char *field, std::size_t size) {
  std::size_t len = 0;
  for (; len < size; ++len)
    if (field[len] == '\0')
      break;
  return std::string(field, len);
}

HeaderChecksum compute_checksum(const TarHeader &header) {
  HeaderChecksum sum;
  auto bytes = reinterpret_cast<const char *>(&header);
  const auto chksum_begin = offsetof(TarHeader, chksum);
  const auto chksum_end = chksum_begin + sizeof(header.chksum);
  for (std::size_t i = 0; i < block_size; ++i) {
    const char c = (i >= chksum_begin && i < chksum_end) ? ' ' : bytes[i];
    sum.unsigned_sum += static_cast<unsigned char>(c);
    sum.signed_sum += static_cast<signed char>(c);
  }
  return sum;
}

} // namespace tatar::detail
