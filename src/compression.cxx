#include <tatar/compression.hxx>
#include <tatar/detail/codec.hxx>
#include <tatar/error.hxx>
#include <tatar/logging.hxx>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>

#include <array>
#include <cstdint>
#include <ios>
#include <string>

namespace io = boost::iostreams;

namespace tatar {
namespace detail {
namespace {

int checked_level(const CompressionOptions &options, int min, int max,
                  std::string_view codec) {
  const int level = *options.level;
  if (level < min || level > max)
    throw CompressionError("invalid " + std::string(codec) + " level " +
                           std::to_string(level) + ", expected " +
                           std::to_string(min) + "-" + std::to_string(max));
  return level;
}

void push_identity_compressor(io::filtering_ostream &,
                              const CompressionOptions &) {}
void push_identity_decompressor(io::filtering_istream &) {}

void push_gzip_compressor(io::filtering_ostream &out,
                          const CompressionOptions &options) {
  // Default params leave the header mtime at 0 so output is reproducible.
  io::gzip_params params;
  if (options.level)
    params.level = checked_level(options, 0, 9, "gzip");
  out.push(io::gzip_compressor(params));
}

void push_gzip_decompressor(io::filtering_istream &in) {
  in.push(io::gzip_decompressor());
}

void push_bzip2_compressor(io::filtering_ostream &out,
                           const CompressionOptions &options) {
  io::bzip2_params params;
  if (options.level)
    params.block_size = checked_level(options, 1, 9, "bzip2");
  out.push(io::bzip2_compressor(params));
}

void push_bzip2_decompressor(io::filtering_istream &in) {
  in.push(io::bzip2_decompressor());
}

void push_lzma_compressor(io::filtering_ostream &out,
                          const CompressionOptions &options) {
  io::lzma_params params;
  if (options.level)
    params.level = static_cast<std::uint32_t>(checked_level(options, 0, 9, "lzma"));
  out.push(io::lzma_compressor(params));
}

void push_lzma_decompressor(io::filtering_istream &in) {
  in.push(io::lzma_decompressor());
}

const std::array<Codec, 4> codecs{{
    {Compression::None, "none", push_identity_compressor,
     push_identity_decompressor},
    {Compression::Gzip, "gzip", push_gzip_compressor, push_gzip_decompressor},
    {Compression::Bzip2, "bzip2", push_bzip2_compressor,
     push_bzip2_decompressor},
    {Compression::Lzma, "lzma", push_lzma_compressor, push_lzma_decompressor},
}};

} // unnamed namespace

const Codec &find_codec(Compression compression) {
  for (const auto &codec : codecs)
    if (codec.compression == compression)
      return codec;
  throw CompressionError("unknown compression " +
                         std::to_string(static_cast<int>(compression)));
}

std::vector<char> compress(std::span<const char> data, Compression compression,
                           const CompressionOptions &options) {
  const auto &codec = find_codec(compression);
  logger()->debug("compressing {} bytes with {}", data.size(), codec.name);

  std::vector<char> out;
  try {
    io::filtering_ostream stream;
    codec.push_compressor(stream, options);
    stream.push(io::back_inserter(out));
    // Only a complete chain clears the badbit of the empty stream.
    stream.exceptions(std::ios::badbit);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    // Closing the chain makes the compressor emit its trailer.
    stream.reset();
  } catch (const std::ios_base::failure &e) {
    throw CompressionError(std::string(codec.name) +
                           " compression failed: " + e.what());
  }
  return out;
}

std::vector<char> decompress(std::istream &in, Compression compression) {
  const auto &codec = find_codec(compression);
  logger()->debug("decompressing with {}", codec.name);

  std::vector<char> out;
  try {
    io::filtering_istream stream;
    codec.push_decompressor(stream);
    stream.push(in);
    io::copy(stream, io::back_inserter(out));
  } catch (const std::ios_base::failure &e) {
    throw CompressionError(std::string(codec.name) +
                           " decompression failed: " + e.what());
  }
  return out;
}

} // namespace detail

std::string_view to_string(Compression compression) {
  for (const auto &codec : detail::codecs)
    if (codec.compression == compression)
      return codec.name;
  return "unknown";
}

Compression guess_compression(std::string_view file_name) {
  const auto base = file_name.substr(file_name.find_last_of('/') + 1);
  const auto dot = base.rfind('.');
  if (dot == std::string_view::npos)
    return Compression::None;
  const auto ext = base.substr(dot);

  using boost::algorithm::iequals;
  if (iequals(ext, ".xz") || iequals(ext, ".lzma"))
    return Compression::Lzma;
  if (iequals(ext, ".bz2") || iequals(ext, ".bzip2"))
    return Compression::Bzip2;
  if (iequals(ext, ".gz") || iequals(ext, ".gzip"))
    return Compression::Gzip;
  return Compression::None;
}

} // namespace tatar
