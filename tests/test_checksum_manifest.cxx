#include <split-join/checksum-manifest.hxx>
#include <split-join/errors.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/positioning.hpp>

#include <archive-fixture.hxx>

#include <gtest/gtest.h>
#include <ios>
#include <string>

namespace io = boost::iostreams;
using namespace split_join;
using namespace split_join::test;

TEST(ChecksumManifestTest, TrailerLengthFollowsFlag) {
  ArchiveHeader header;
  header.part_count = 7;
  header.has_checksums = true;
  EXPECT_EQ(trailer_length(header), 7u * 32u);
  header.has_checksums = false;
  EXPECT_EQ(trailer_length(header), 0u);
}

TEST(ChecksumManifestTest, ReadsOneRecordPerPartInOrder) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "movie", {300, 400, 500});

  auto const manifest = read_manifest(fixture.parts.back(), 3);
  ASSERT_EQ(manifest.size(), 3u);
  for (std::size_t i = 0; i < manifest.size(); ++i) {
    EXPECT_EQ(manifest[i].size(), kChecksumRecordSize);
    EXPECT_EQ(manifest[i], fixture.manifest[i]) << "record " << i;
  }
}

TEST(ChecksumManifestTest, RewindsSourceAfterReading) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "movie", {10, 20});

  io::file_source source(fixture.parts.back().string(), std::ios::binary);
  ASSERT_TRUE(source.is_open());
  auto const manifest = read_manifest(source, fixture.parts.back(), 2);
  EXPECT_EQ(manifest.size(), 2u);

  auto const position =
      io::position_to_offset(source.seek(0, std::ios_base::cur));
  EXPECT_EQ(position, 0);

  char first = 0;
  ASSERT_EQ(source.read(&first, 1), 1);
  EXPECT_EQ(first, fixture.raw.back()[0]);
}

TEST(ChecksumManifestTest, LowercaseRecordsAreUppercased) {
  TemporaryDirectory tmp;
  auto const path = tmp.path() / "lower.001.xtm";
  write_file(path, "payload" + std::string("0123456789abcdef0123456789abcdef"));

  auto const manifest = read_manifest(path, 1);
  ASSERT_EQ(manifest.size(), 1u);
  EXPECT_EQ(manifest[0], "0123456789ABCDEF0123456789ABCDEF");
}

TEST(ChecksumManifestTest, ShortFileThrowsTruncatedTrailer) {
  TemporaryDirectory tmp;
  auto const path = tmp.path() / "tiny.003.xtm";
  write_file(path, std::string(95, 'A'));

  try {
    read_manifest(path, 3);
    FAIL() << "expected TruncatedTrailerError";
  } catch (const TruncatedTrailerError &e) {
    EXPECT_EQ(e.path(), path);
  }
}

TEST(ChecksumManifestTest, ExactlyManifestSizedFileHasNoPayload) {
  TemporaryDirectory tmp;
  auto const path = tmp.path() / "only.002.xtm";
  write_file(path, std::string(64, 'F'));

  auto const manifest = read_manifest(path, 2);
  EXPECT_EQ(manifest, ChecksumManifest(2, std::string(32, 'F')));
}
