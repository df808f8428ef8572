#include <tatar/detail/tar-header.hxx>
#include <tatar/error.hxx>
#include <tatar/logging.hxx>
#include <tatar/tar-reader.hxx>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace tatar {
namespace {

using detail::TarHeader;

/**
 * @brief Header values that override the next real member.
 *
 * Filled from PAX extended headers and GNU long name/link members, consumed
 * by the member that follows them.
 */
struct PendingOverrides {
  std::optional<std::string> name;
  std::optional<std::string> link_name;
  std::optional<std::uint64_t> size;
  std::optional<std::int64_t> uid;
  std::optional<std::int64_t> gid;
  std::optional<std::int64_t> mtime;
  std::optional<std::string> user_name;
  std::optional<std::string> group_name;
};

std::size_t padded_size(std::uint64_t size) {
  return static_cast<std::size_t>((size + detail::block_size - 1) /
                                  detail::block_size * detail::block_size);
}

std::int64_t parse_decimal(std::string_view text, std::string_view key) {
  // PAX times may carry a fractional part, only whole seconds are kept.
  text = text.substr(0, text.find('.'));
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size())
    throw FormatError("invalid PAX value for '" + std::string(key) + "'");
  return value;
}

/**
 * @brief Parse the "<length> <key>=<value>\n" records of a PAX header.
 */
void parse_pax_records(std::span<const char> payload, PendingOverrides &pending) {
  std::string_view records(payload.data(), payload.size());
  while (!records.empty()) {
    // Trailing NUL padding written by some archivers.
    if (records.front() == '\0')
      break;

    const auto space = records.find(' ');
    if (space == std::string_view::npos)
      throw FormatError("malformed PAX record");
    std::size_t length = 0;
    auto [ptr, ec] =
        std::from_chars(records.data(), records.data() + space, length);
    if (ec != std::errc{} || ptr != records.data() + space ||
        length <= space + 1 || length > records.size() ||
        records[length - 1] != '\n')
      throw FormatError("malformed PAX record");

    const auto record = records.substr(space + 1, length - space - 2);
    records.remove_prefix(length);

    const auto equals = record.find('=');
    if (equals == std::string_view::npos)
      throw FormatError("malformed PAX record");
    const auto key = record.substr(0, equals);
    const auto value = record.substr(equals + 1);

    if (key == "path")
      pending.name = std::string(value);
    else if (key == "linkpath")
      pending.link_name = std::string(value);
    else if (key == "size")
      pending.size = static_cast<std::uint64_t>(parse_decimal(value, key));
    else if (key == "uid")
      pending.uid = parse_decimal(value, key);
    else if (key == "gid")
      pending.gid = parse_decimal(value, key);
    else if (key == "mtime")
      pending.mtime = parse_decimal(value, key);
    else if (key == "uname")
      pending.user_name = std::string(value);
    else if (key == "gname")
      pending.group_name = std::string(value);
    else
      logger()->trace("ignoring PAX record '{}'", key);
  }
}

std::string payload_string(std::span<const char> payload) {
  return detail::extract_string(payload.data(), payload.size());
}

bool is_header_only(EntryType type) { return type != EntryType::Regular; }

EntryType decode_type(const TarHeader &header, const std::string &name) {
  switch (header.typeflag[0]) {
  case '\0':
    // Pre-POSIX archives mark directories with a trailing slash only.
    return !name.empty() && name.back() == '/' ? EntryType::Directory
                                               : EntryType::Regular;
  case '0':
  case '7':
    return EntryType::Regular;
  case '1':
  case '2':
  case '3':
  case '4':
  case '5':
  case '6':
    return static_cast<EntryType>(header.typeflag[0]);
  default:
    throw FormatError(std::string("unsupported tar member type '") +
                      header.typeflag[0] + "' for '" + name + "'");
  }
}

bool is_posix_ustar(const TarHeader &header) {
  return std::memcmp(header.magic, "ustar\0", sizeof(header.magic)) == 0;
}

} // unnamed namespace

TarReader::TarReader(std::span<const char> data) : data_(data) {}

std::optional<Entry> TarReader::next() {
  content_ = {};
  if (done_)
    return std::nullopt;

  PendingOverrides pending;
  while (true) {
    if (offset_ >= data_.size()) {
      done_ = true;
      return std::nullopt;
    }
    if (data_.size() - offset_ < detail::block_size)
      throw FormatError("truncated tar header at offset " +
                        std::to_string(offset_));

    const char *block = data_.data() + offset_;
    if (detail::is_zero_block(block)) {
      done_ = true;
      return std::nullopt;
    }

    TarHeader header;
    std::memcpy(&header, block, sizeof(header));

    const auto expected = detail::parse_numeric(header.chksum, sizeof(header.chksum));
    const auto actual = detail::compute_checksum(header);
    if (expected != actual.unsigned_sum && expected != actual.signed_sum)
      throw FormatError("tar header checksum mismatch at offset " +
                        std::to_string(offset_));

    const auto header_size = detail::parse_numeric(header.size, sizeof(header.size));
    if (header_size < 0)
      throw FormatError("negative member size in tar header");
    auto size = static_cast<std::uint64_t>(header_size);

    const char typeflag = header.typeflag[0];
    std::string name = detail::extract_string(header.name, sizeof(header.name));
    if (is_posix_ustar(header)) {
      auto prefix = detail::extract_string(header.prefix, sizeof(header.prefix));
      if (!prefix.empty())
        name = prefix + "/" + name;
    }

    const bool is_extension = typeflag == detail::pax_extended_type ||
                              typeflag == detail::pax_global_type ||
                              typeflag == detail::gnu_long_name_type ||
                              typeflag == detail::gnu_long_link_type;
    EntryType type = EntryType::Regular;
    if (!is_extension) {
      type = decode_type(header, name);
      if (pending.size)
        size = *pending.size;
      if (is_header_only(type))
        size = 0;
    }

    const auto payload_offset = offset_ + detail::block_size;
    if (size > data_.size() - payload_offset)
      throw FormatError("truncated data for tar member '" + name + "'");
    const std::span<const char> payload =
        data_.subspan(payload_offset, static_cast<std::size_t>(size));
    offset_ = payload_offset + padded_size(size);

    switch (typeflag) {
    case detail::pax_extended_type:
      parse_pax_records(payload, pending);
      continue;
    case detail::pax_global_type:
      logger()->trace("skipping PAX global header");
      continue;
    case detail::gnu_long_name_type:
      pending.name = payload_string(payload);
      continue;
    case detail::gnu_long_link_type:
      pending.link_name = payload_string(payload);
      continue;
    default:
      break;
    }

    Entry entry;
    entry.name = pending.name.value_or(name);
    entry.mode = static_cast<std::uint32_t>(
        detail::parse_numeric(header.mode, sizeof(header.mode)) & 07777);
    entry.uid = pending.uid.value_or(
        detail::parse_numeric(header.uid, sizeof(header.uid)));
    entry.gid = pending.gid.value_or(
        detail::parse_numeric(header.gid, sizeof(header.gid)));
    entry.size = pending.size.value_or(static_cast<std::uint64_t>(header_size));
    entry.mtime = pending.mtime.value_or(
        detail::parse_numeric(header.mtime, sizeof(header.mtime)));
    entry.type = type;
    entry.link_name = pending.link_name.value_or(
        detail::extract_string(header.linkname, sizeof(header.linkname)));
    entry.user_name = pending.user_name.value_or(
        detail::extract_string(header.uname, sizeof(header.uname)));
    entry.group_name = pending.group_name.value_or(
        detail::extract_string(header.gname, sizeof(header.gname)));
    if (type == EntryType::CharDevice || type == EntryType::BlockDevice) {
      entry.dev_major = static_cast<std::uint32_t>(
          detail::parse_numeric(header.devmajor, sizeof(header.devmajor)));
      entry.dev_minor = static_cast<std::uint32_t>(
          detail::parse_numeric(header.devminor, sizeof(header.devminor)));
    }

    content_ = payload;
    return entry;
  }
}

} // namespace tatar
