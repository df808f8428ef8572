#include <tatar/archive.hxx>
#include <tatar/compression.hxx>
#include <tatar/error.hxx>

#include "test-utils.hxx"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using tatar::Archive;
using tatar::Compression;
using tatar::CompressionError;
using tatar::testing::TempDir;
using tatar::testing::write_file;

namespace {

/**
 * @brief Build a small tar archive whose content compresses well.
 */
Archive make_archive(const TempDir &dir) {
  write_file(dir / "src" / "a", "foobar!");
  write_file(dir / "src" / "sub" / "b", std::string(4096, 'z'));
  return Archive::from_directory(dir / "src");
}

bool starts_with(const std::vector<char> &data, std::string_view magic) {
  return data.size() >= magic.size() &&
         std::string_view(data.data(), magic.size()) == magic;
}

} // namespace

struct GuessCase {
  std::string file_name;
  Compression expected;
};

class GuessCompressionTest : public ::testing::TestWithParam<GuessCase> {};

TEST_P(GuessCompressionTest, MapsExtensionToCodec) {
  const auto &[file_name, expected] = GetParam();
  EXPECT_EQ(tatar::guess_compression(file_name), expected)
      << "for " << file_name;
}

INSTANTIATE_TEST_SUITE_P(
    Extensions, GuessCompressionTest,
    ::testing::Values(
        GuessCase{.file_name = "x.tar.gz", .expected = Compression::Gzip},
        GuessCase{.file_name = "x.tar.GZ", .expected = Compression::Gzip},
        GuessCase{.file_name = "x.tar.Gzip", .expected = Compression::Gzip},
        GuessCase{.file_name = "x.tar.bz2", .expected = Compression::Bzip2},
        GuessCase{.file_name = "x.TAR.BZIP2", .expected = Compression::Bzip2},
        GuessCase{.file_name = "x.tar.xz", .expected = Compression::Lzma},
        GuessCase{.file_name = "x.tar.XZ", .expected = Compression::Lzma},
        GuessCase{.file_name = "x.lzma", .expected = Compression::Lzma},
        GuessCase{.file_name = "x.tar", .expected = Compression::None},
        GuessCase{.file_name = "archive", .expected = Compression::None},
        GuessCase{.file_name = "dir.gz/archive", .expected = Compression::None},
        GuessCase{.file_name = "/tmp/out/x.tgz", .expected = Compression::None}));

TEST(CompressionNames, AreLowerCase) {
  EXPECT_EQ(tatar::to_string(Compression::None), "none");
  EXPECT_EQ(tatar::to_string(Compression::Gzip), "gzip");
  EXPECT_EQ(tatar::to_string(Compression::Bzip2), "bzip2");
  EXPECT_EQ(tatar::to_string(Compression::Lzma), "lzma");
  EXPECT_EQ(tatar::to_string(static_cast<Compression>(42)), "unknown");
}

class CodecTest : public ::testing::TestWithParam<Compression> {};

TEST_P(CodecTest, BytesRoundTripPreservesTarData) {
  TempDir dir;
  auto archive = make_archive(dir);
  archive.set_compression(GetParam());

  const auto bytes = archive.to_bytes();
  ASSERT_FALSE(bytes.empty());

  const auto restored = Archive::from_bytes(bytes, GetParam());
  EXPECT_EQ(restored.data(), archive.data());
  EXPECT_EQ(restored.compression(), GetParam());
}

TEST_P(CodecTest, OutputIsDeterministic) {
  TempDir dir;
  auto archive = make_archive(dir);
  archive.set_compression(GetParam());
  EXPECT_EQ(archive.to_bytes(), archive.to_bytes());
}

TEST_P(CodecTest, StreamRoundTrip) {
  TempDir dir;
  auto archive = make_archive(dir);
  archive.set_compression(GetParam());

  std::stringstream stream;
  const auto written = archive.save(stream);
  EXPECT_EQ(written, stream.str().size());

  const auto restored = Archive::from_stream(stream, GetParam());
  EXPECT_EQ(restored.data(), archive.data());
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, CodecTest,
                         ::testing::Values(Compression::None,
                                           Compression::Gzip,
                                           Compression::Bzip2,
                                           Compression::Lzma),
                         [](const auto &info) {
                           return std::string(tatar::to_string(info.param));
                         });

TEST(Codec, WritesStandardContainers) {
  TempDir dir;
  auto archive = make_archive(dir);

  archive.set_compression(Compression::None);
  EXPECT_EQ(archive.to_bytes(), archive.data());

  archive.set_compression(Compression::Gzip);
  EXPECT_TRUE(starts_with(archive.to_bytes(), "\x1f\x8b"));

  archive.set_compression(Compression::Bzip2);
  EXPECT_TRUE(starts_with(archive.to_bytes(), "BZh"));

  archive.set_compression(Compression::Lzma);
  EXPECT_TRUE(starts_with(archive.to_bytes(), "\xfd" "7zXZ"));
}

TEST(Codec, UnknownCompressionWritesNothing) {
  TempDir dir;
  auto archive = make_archive(dir);
  archive.set_compression(static_cast<Compression>(42));

  EXPECT_THROW(archive.to_bytes(), CompressionError);

  std::ostringstream stream;
  EXPECT_THROW(archive.save(stream), CompressionError);
  EXPECT_TRUE(stream.str().empty());

  const auto target = dir / "out.tar.gz";
  EXPECT_THROW(archive.to_file(target), CompressionError);
  EXPECT_FALSE(std::filesystem::exists(target));
}

TEST(Codec, UnknownCompressionOnLoad) {
  const std::vector<char> data(1024, '\0');
  EXPECT_THROW(Archive::from_bytes(data, static_cast<Compression>(-1)),
               CompressionError);
}

TEST(Codec, RejectsOutOfRangeLevels) {
  TempDir dir;
  auto archive = make_archive(dir);

  archive.set_options({.level = 10});
  archive.set_compression(Compression::Gzip);
  EXPECT_THROW(archive.to_bytes(), CompressionError);
  archive.set_compression(Compression::Lzma);
  EXPECT_THROW(archive.to_bytes(), CompressionError);

  archive.set_options({.level = 0});
  archive.set_compression(Compression::Bzip2);
  EXPECT_THROW(archive.to_bytes(), CompressionError);
}

TEST(Codec, LevelChangesGzipOutput) {
  TempDir dir;
  auto archive = make_archive(dir);
  archive.set_compression(Compression::Gzip);

  archive.set_options({.level = 0});
  const auto stored = archive.to_bytes();
  archive.set_options({.level = 9});
  const auto best = archive.to_bytes();

  EXPECT_GT(stored.size(), best.size());
  EXPECT_EQ(Archive::from_bytes(stored, Compression::Gzip).data(),
            Archive::from_bytes(best, Compression::Gzip).data());
}

TEST(Codec, CorruptInputIsACompressionError) {
  const std::string garbage = "this is definitely not a compressed stream";
  const std::vector<char> data(garbage.begin(), garbage.end());

  EXPECT_THROW(Archive::from_bytes(data, Compression::Gzip), CompressionError);
  EXPECT_THROW(Archive::from_bytes(data, Compression::Bzip2), CompressionError);
  EXPECT_THROW(Archive::from_bytes(data, Compression::Lzma), CompressionError);
}
