#include <split-join/errors.hxx>
#include <split-join/joiner.hxx>
#include <split-join/part-boundary.hxx>
#include <split-join/part-locator.hxx>

#include <archive-fixture.hxx>

#include <cstddef>
#include <gtest/gtest.h>
#include <picosha2.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace split_join;
using namespace split_join::test;

namespace {

class RecordingSink : public ProgressSink {
public:
  void update(double fraction) override { values.push_back(fraction); }
  std::vector<double> values;
};

/// Located parts of @p fixture with their ranges resolved.
std::vector<PartDescriptor> resolved_parts(const ArchiveFixture &fixture) {
  auto parts = locate_parts(fixture.parts.front());
  resolve_payload_ranges(parts, fixture.header);
  return parts;
}

} // unnamed namespace

/**
 * @brief Archive layouts joined with several block sizes.
 */
struct JoinTestCase {
  std::vector<std::size_t> payload_sizes;
  bool checksums;
  std::vector<std::size_t> block_sizes;
};

class JoinerHashTest : public ::testing::TestWithParam<JoinTestCase> {};

TEST_P(JoinerHashTest, OutputMatchesOriginalSHA256) {
  const auto &[payload_sizes, checksums, block_sizes] = GetParam();

  TemporaryDirectory tmp;
  auto const fixture =
      write_archive(tmp.path(), "data", payload_sizes, checksums);
  auto const parts = resolved_parts(fixture);
  auto const expected = picosha2::hash256_hex_string(fixture.payload);

  for (auto const block_size : block_sizes) {
    auto const output = tmp.path() / "joined.bin";
    Joiner joiner(block_size);
    auto const written =
        joiner.join(parts, output, fixture.header.payload_size);

    EXPECT_EQ(written, fixture.payload.size()) << "block size " << block_size;
    EXPECT_EQ(picosha2::hash256_hex_string(read_file(output)), expected)
        << "block size " << block_size;
  }
}

INSTANTIATE_TEST_SUITE_P(
    JoinerTests, JoinerHashTest,
    ::testing::Values(
        JoinTestCase{.payload_sizes = {1000, 1000},
                     .checksums = true,
                     .block_sizes = {kDefaultBlockSize, 100, 1}},
        JoinTestCase{.payload_sizes = {70'000},
                     .checksums = true,
                     .block_sizes = {kDefaultBlockSize, 4'096, 13}},
        JoinTestCase{.payload_sizes = {100'000, 100'000, 100'000, 1},
                     .checksums = false,
                     .block_sizes = {kDefaultBlockSize, 65'537}},
        JoinTestCase{.payload_sizes = {0, 500, 0},
                     .checksums = true,
                     .block_sizes = {kDefaultBlockSize, 7}}));

TEST(JoinerTest, ProgressEndsAtExactlyOne) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "data", {3000, 3000, 10});
  auto const parts = resolved_parts(fixture);

  RecordingSink sink;
  Joiner joiner(1000, &sink);
  joiner.join(parts, tmp.path() / "joined.bin", fixture.header.payload_size);

  ASSERT_FALSE(sink.values.empty());
  for (std::size_t i = 1; i < sink.values.size(); ++i)
    EXPECT_LE(sink.values[i - 1], sink.values[i]);
  EXPECT_DOUBLE_EQ(sink.values.back(), 1.0);
  EXPECT_EQ(joiner.progress().bytes_written, 6010u);
  EXPECT_EQ(joiner.progress().total_bytes, 6010u);
}

TEST(JoinerTest, EmptyArchiveStillReportsCompletion) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "empty", {0});
  auto const parts = resolved_parts(fixture);

  RecordingSink sink;
  Joiner joiner(kDefaultBlockSize, &sink);
  auto const output = tmp.path() / "joined.bin";
  EXPECT_EQ(joiner.join(parts, output, 0), 0u);

  EXPECT_TRUE(fs::exists(output));
  EXPECT_EQ(fs::file_size(output), 0u);
  ASSERT_EQ(sink.values.size(), 1u);
  EXPECT_DOUBLE_EQ(sink.values.front(), 1.0);
}

TEST(JoinerTest, TruncatesExistingDestination) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "data", {10, 10});
  auto const parts = resolved_parts(fixture);
  auto const output = tmp.path() / "joined.bin";
  write_file(output, std::string(1000, 'z'));

  Joiner joiner;
  joiner.join(parts, output, fixture.header.payload_size);
  EXPECT_EQ(read_file(output), fixture.payload);
}

TEST(JoinerTest, PartShrunkAfterLocatingThrowsShortRead) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "data", {100, 100, 100});
  auto const parts = resolved_parts(fixture);
  write_file(fixture.parts[1], fixture.raw[1].substr(0, 40));

  Joiner joiner(16);
  try {
    joiner.join(parts, tmp.path() / "joined.bin", fixture.header.payload_size);
    FAIL() << "expected ShortReadError";
  } catch (const ShortReadError &e) {
    EXPECT_EQ(e.path(), fixture.parts[1]);
  }
}

TEST(JoinerTest, MissingPartFileThrowsFileAccess) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "data", {100, 100});
  auto const parts = resolved_parts(fixture);
  fs::remove(fixture.parts[1]);

  Joiner joiner;
  EXPECT_THROW(
      joiner.join(parts, tmp.path() / "joined.bin", fixture.header.payload_size),
      FileAccessError);
}

TEST(JoinerTest, UnwritableDestinationThrowsFileAccess) {
  TemporaryDirectory tmp;
  auto const fixture = write_archive(tmp.path(), "data", {10});
  auto const parts = resolved_parts(fixture);

  Joiner joiner;
  EXPECT_THROW(joiner.join(parts, tmp.path() / "no" / "such" / "dir.bin",
                           fixture.header.payload_size),
               FileAccessError);
}

TEST(JoinerTest, ZeroBlockSizeIsRejected) {
  EXPECT_THROW(Joiner joiner(0), std::invalid_argument);
}
