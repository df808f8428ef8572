#include <tatar/archive.hxx>
#include <tatar/detail/codec.hxx>
#include <tatar/detail/tar-header.hxx>
#include <tatar/error.hxx>
#include <tatar/logging.hxx>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace tatar {

Archive::Archive() : data_(2 * detail::block_size, '\0') {}

Archive::Archive(std::vector<char> data, Compression compression,
                 CompressionOptions options)
    : data_(std::move(data)), compression_(compression), options_(options) {}

Archive Archive::from_bytes(std::span<const char> data,
                            Compression compression) {
  io::stream<io::array_source> in(data.data(), data.size());
  return from_stream(in, compression);
}

Archive Archive::from_file(const fs::path &path) {
  const auto compression = guess_compression(path.string());
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw fs::filesystem_error("cannot open archive", path,
                               std::error_code(errno, std::generic_category()));
  logger()->debug("loading '{}' as {}", path.string(), to_string(compression));
  return from_stream(in, compression);
}

Archive Archive::from_stream(std::istream &in, Compression compression) {
  return Archive(detail::decompress(in, compression), compression);
}

std::vector<char> Archive::to_bytes() const {
  return detail::compress(data_, compression_, options_);
}

std::uint64_t Archive::to_file(const fs::path &path) const {
  const auto compression = compression_ == Compression::None
                               ? guess_compression(path.string())
                               : compression_;
  // Compress first so an invalid codec leaves the filesystem untouched.
  const auto bytes = detail::compress(data_, compression, options_);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw fs::filesystem_error("cannot create archive", path,
                               std::error_code(errno, std::generic_category()));
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out)
    throw fs::filesystem_error("failed to write archive", path,
                               std::make_error_code(std::errc::io_error));

  logger()->debug("wrote {} bytes to '{}' ({})", bytes.size(), path.string(),
                  to_string(compression));
  return bytes.size();
}

std::uint64_t Archive::save(std::ostream &out) const {
  const auto bytes = to_bytes();
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out)
    throw Error("failed to write archive to stream");
  return bytes.size();
}

void Archive::for_each(const EntryCallback &callback) const {
  auto tar = reader();
  while (auto entry = tar.next()) {
    const auto content = tar.content();
    io::stream<io::array_source> stream(content.data(), content.size());
    callback(*entry, stream);
  }
}

} // namespace tatar
