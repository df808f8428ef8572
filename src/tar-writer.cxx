#include <tatar/detail/tar-header.hxx>
#include <tatar/detail/tar-writer.hxx>
#include <tatar/error.hxx>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace tatar::detail {
namespace {

constexpr std::size_t ustar_name_size = sizeof(TarHeader::name);
constexpr std::size_t ustar_prefix_size = sizeof(TarHeader::prefix);

void copy_string(char *field, std::size_t size, std::string_view value) {
  std::memcpy(field, value.data(), std::min(size, value.size()));
}

/**
 * @brief Split @p name into a ustar (prefix, name) pair.
 *
 * The split happens at the last '/' that keeps the prefix within 155 bytes;
 * names that still do not fit need a PAX "path" record instead.
 */
std::optional<std::pair<std::string_view, std::string_view>>
split_ustar_name(std::string_view name) {
  if (name.size() <= ustar_name_size)
    return std::pair{std::string_view{}, name};

  const auto slash = name.rfind('/', ustar_prefix_size);
  if (slash == std::string_view::npos || slash == 0)
    return std::nullopt;
  const auto rest = name.substr(slash + 1);
  if (rest.empty() || rest.size() > ustar_name_size)
    return std::nullopt;
  return std::pair{name.substr(0, slash), rest};
}

/// Append "<length> <key>=<value>\n", where length counts its own digits.
void append_pax_record(std::vector<char> &records, std::string_view key,
                       std::string_view value) {
  const auto base = key.size() + value.size() + 3;
  auto length = base + std::to_string(base).size();
  if (std::to_string(length).size() != std::to_string(base).size())
    ++length;
  const auto record = std::to_string(length) + " " + std::string(key) + "=" +
                      std::string(value) + "\n";
  records.insert(records.end(), record.begin(), record.end());
}

void append_padding(std::vector<char> &out, std::uint64_t size) {
  const auto padding = (block_size - size % block_size) % block_size;
  out.insert(out.end(), padding, '\0');
}

/// Fill in magic and checksum, then append the block to @p out.
void append_header(std::vector<char> &out, TarHeader &header) {
  std::memcpy(header.magic, "ustar\0", sizeof(header.magic));
  std::memcpy(header.version, "00", sizeof(header.version));

  std::memset(header.chksum, ' ', sizeof(header.chksum));
  const auto sum = compute_checksum(header).unsigned_sum;
  // Six octal digits, a NUL and a space, as historic tar does.
  format_numeric(header.chksum, 7, sum);
  header.chksum[7] = ' ';

  auto bytes = reinterpret_cast<const char *>(&header);
  out.insert(out.end(), bytes, bytes + block_size);
}

} // unnamed namespace

TarWriter::TarWriter(std::vector<char> &out) : out_(out) {}

void TarWriter::write_header(const Entry &entry) {
  if (member_remaining_ != 0)
    throw FormatError("previous tar member is missing " +
                      std::to_string(member_remaining_) + " bytes of data");

  TarHeader header{};
  std::vector<char> pax;

  if (auto split = split_ustar_name(entry.name)) {
    copy_string(header.prefix, sizeof(header.prefix), split->first);
    copy_string(header.name, sizeof(header.name), split->second);
  } else {
    append_pax_record(pax, "path", entry.name);
    copy_string(header.name, sizeof(header.name), entry.name);
  }

  if (entry.link_name.size() > sizeof(header.linkname))
    append_pax_record(pax, "linkpath", entry.link_name);
  copy_string(header.linkname, sizeof(header.linkname), entry.link_name);

  if (entry.user_name.size() > sizeof(header.uname))
    append_pax_record(pax, "uname", entry.user_name);
  else
    copy_string(header.uname, sizeof(header.uname), entry.user_name);
  if (entry.group_name.size() > sizeof(header.gname))
    append_pax_record(pax, "gname", entry.group_name);
  else
    copy_string(header.gname, sizeof(header.gname), entry.group_name);

  const std::uint64_t data_size = entry.is_regular_file() ? entry.size : 0;

  format_numeric(header.mode, sizeof(header.mode), entry.mode & 07777);
  format_numeric(header.uid, sizeof(header.uid), entry.uid);
  format_numeric(header.gid, sizeof(header.gid), entry.gid);
  format_numeric(header.size, sizeof(header.size),
                 static_cast<std::int64_t>(data_size));
  format_numeric(header.mtime, sizeof(header.mtime), entry.mtime);
  format_numeric(header.devmajor, sizeof(header.devmajor), entry.dev_major);
  format_numeric(header.devminor, sizeof(header.devminor), entry.dev_minor);
  header.typeflag[0] = static_cast<char>(entry.type);

  if (!pax.empty())
    write_pax_header(entry, pax);

  append_header(out_, header);
  member_remaining_ = data_size;
  member_written_ = 0;
}

void TarWriter::write_pax_header(const Entry &entry,
                                 const std::vector<char> &records) {
  TarHeader header{};
  const auto base = fs::path(entry.name).filename().string();
  copy_string(header.name, sizeof(header.name), "PaxHeaders.0/" + base);
  format_numeric(header.mode, sizeof(header.mode), 0644);
  format_numeric(header.uid, sizeof(header.uid), 0);
  format_numeric(header.gid, sizeof(header.gid), 0);
  format_numeric(header.size, sizeof(header.size),
                 static_cast<std::int64_t>(records.size()));
  format_numeric(header.mtime, sizeof(header.mtime), entry.mtime);
  header.typeflag[0] = pax_extended_type;

  append_header(out_, header);
  out_.insert(out_.end(), records.begin(), records.end());
  append_padding(out_, records.size());
}

void TarWriter::write_file_data(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw fs::filesystem_error("cannot open file for reading", path,
                               std::error_code(errno, std::generic_category()));

  const auto expected = member_remaining_;
  const auto start = out_.size();
  out_.resize(start + static_cast<std::size_t>(expected));
  in.read(out_.data() + start, static_cast<std::streamsize>(expected));
  if (in.bad())
    throw fs::filesystem_error("failed to read file", path,
                               std::make_error_code(std::errc::io_error));

  const auto got = static_cast<std::uint64_t>(in.gcount());
  if (got != expected || in.peek() != std::ifstream::traits_type::eof())
    throw FormatError("file '" + path.string() +
                      "' changed size while it was being archived");

  member_written_ += got;
  member_remaining_ = 0;
}

void TarWriter::write_data(const char *data, std::size_t size) {
  if (size > member_remaining_)
    throw FormatError("tar member data exceeds the size in its header");
  out_.insert(out_.end(), data, data + size);
  member_written_ += size;
  member_remaining_ -= size;
}

void TarWriter::finish_member() {
  if (member_remaining_ != 0)
    throw FormatError("tar member is missing " +
                      std::to_string(member_remaining_) + " bytes of data");
  append_padding(out_, member_written_);
  member_written_ = 0;
}

void TarWriter::close() {
  finish_member();
  out_.insert(out_.end(), 2 * block_size, '\0');
}

} // namespace tatar::detail
