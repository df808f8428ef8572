#include <tatar/archive.hxx>
#include <tatar/detail/log-level.hxx>
#include <tatar/error.hxx>
#include <tatar/logging.hxx>

#include "test-utils.hxx"

#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using tatar::Archive;
using tatar::Compression;
using tatar::Entry;
using tatar::testing::TempDir;
using tatar::testing::write_file;

TEST(ArchiveValue, DefaultIsAnEmptyTarStream) {
  const Archive archive{};
  ASSERT_EQ(archive.data().size(), 1024u);
  EXPECT_TRUE(std::all_of(archive.data().begin(), archive.data().end(),
                          [](char c) { return c == '\0'; }));
  EXPECT_EQ(archive.compression(), Compression::None);
  EXPECT_FALSE(archive.options().level.has_value());
  EXPECT_FALSE(archive.reader().next().has_value());
  EXPECT_EQ(archive.to_bytes(), archive.data());

  TempDir dir;
  EXPECT_EQ(archive.to_file(dir / "empty.tar"), 1024u);
  EXPECT_EQ(Archive::from_file(dir / "empty.tar").data(), archive.data());
}

TEST(ArchiveValue, KeepsTagAndOptions) {
  const Archive archive(std::vector<char>(1024, '\0'), Compression::Lzma,
                        {.level = 6});
  EXPECT_EQ(archive.data().size(), 1024u);
  EXPECT_EQ(archive.compression(), Compression::Lzma);
  EXPECT_EQ(archive.options().level.value_or(-1), 6);
}

TEST(ArchiveValue, CopiesAreIndependent) {
  TempDir dir;
  write_file(dir / "src" / "a", "foobar!");
  const auto original = Archive::from_directory(dir / "src");

  auto copy = original;
  copy.set_compression(Compression::Gzip);
  EXPECT_EQ(original.compression(), Compression::None);
  EXPECT_EQ(copy.data(), original.data());
  EXPECT_NE(copy.to_bytes(), original.to_bytes());
}

TEST(ArchiveValue, ReaderAndForEachAgree) {
  TempDir dir;
  write_file(dir / "src" / "a", "foobar!");
  write_file(dir / "src" / "sub" / "b", "bazinga!");
  const auto archive = Archive::from_directory(dir / "src");

  std::vector<std::pair<std::string, std::string>> pulled;
  auto reader = archive.reader();
  while (auto entry = reader.next()) {
    const auto content = reader.content();
    pulled.emplace_back(entry->name,
                        std::string(content.data(), content.size()));
  }

  std::vector<std::pair<std::string, std::string>> pushed;
  archive.for_each([&](const Entry &entry, std::istream &content) {
    pushed.emplace_back(entry.name,
                        std::string(std::istreambuf_iterator<char>(content),
                                    std::istreambuf_iterator<char>{}));
  });

  EXPECT_EQ(pulled, pushed);
  ASSERT_EQ(pulled.size(), 3u);
  EXPECT_EQ(pulled[2].second, "bazinga!");
}

TEST(ArchiveValue, FromStreamReadsFiles) {
  TempDir dir;
  write_file(dir / "src" / "a", "foobar!");
  auto archive = Archive::from_directory(dir / "src");
  archive.set_compression(Compression::Lzma);
  archive.to_file(dir / "out.bin");

  std::ifstream in(dir / "out.bin", std::ios::binary);
  const auto restored = Archive::from_stream(in, Compression::Lzma);
  EXPECT_EQ(restored.data(), archive.data());
}

TEST(ArchiveValue, SaveToBrokenStreamFails) {
  TempDir dir;
  write_file(dir / "src" / "a", "foobar!");
  const auto archive = Archive::from_directory(dir / "src");

  std::ostringstream out;
  out.setstate(std::ios::badbit);
  EXPECT_THROW(archive.save(out), tatar::Error);
}

TEST(Logging, LoggerIsNamedAndAdjustable) {
  auto logger = tatar::logger();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "tatar");
  EXPECT_EQ(tatar::logger(), logger);

  const auto previous = logger->level();
  tatar::set_log_level(spdlog::level::debug);
  EXPECT_EQ(logger->level(), spdlog::level::debug);
  tatar::set_log_level(previous);
}

TEST(Logging, OnlyTheTatarEntryOfTheEnvironmentApplies) {
  using tatar::detail::find_logger_level;
  EXPECT_EQ(find_logger_level("tatar=debug", "tatar"), spdlog::level::debug);
  EXPECT_EQ(find_logger_level(" app = trace , tatar = ERR ", "tatar"),
            spdlog::level::err);
  EXPECT_EQ(find_logger_level("tatar=off", "tatar"), spdlog::level::off);

  EXPECT_FALSE(find_logger_level("", "tatar").has_value());
  EXPECT_FALSE(find_logger_level("info", "tatar").has_value());
  EXPECT_FALSE(find_logger_level("app=trace", "tatar").has_value());
  EXPECT_FALSE(find_logger_level("tatar=chatty", "tatar").has_value());
}
