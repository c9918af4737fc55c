#include <split-join/errors.hxx>
#include <split-join/part-boundary.hxx>

#include <fmt/format.h>

#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

using namespace split_join;

namespace {

PartDescriptor make_part(std::uint32_t index, std::uint64_t raw_size,
                         PartRole role) {
  PartDescriptor part;
  part.path = fmt::format("doc.{:03}.xtm", index);
  part.index = index;
  part.raw_size = raw_size;
  part.role = role;
  return part;
}

} // unnamed namespace

TEST(PartBoundaryTest, RangeDependsOnRole) {
  EXPECT_EQ(resolve_payload_range(make_part(1, 1104, PartRole::first), 64),
            (PayloadRange{104, 1104}));
  EXPECT_EQ(resolve_payload_range(make_part(2, 500, PartRole::middle), 64),
            (PayloadRange{0, 500}));
  EXPECT_EQ(resolve_payload_range(make_part(3, 1064, PartRole::last), 64),
            (PayloadRange{0, 1000}));
  EXPECT_EQ(resolve_payload_range(make_part(1, 1136, PartRole::only), 32),
            (PayloadRange{104, 1104}));
}

TEST(PartBoundaryTest, LastPartWithoutManifestKeepsEverything) {
  auto const range =
      resolve_payload_range(make_part(2, 1000, PartRole::last), 0);
  EXPECT_EQ(range, (PayloadRange{0, 1000}));
  EXPECT_EQ(range.length(), 1000u);
}

TEST(PartBoundaryTest, HeaderOnlyFirstPartHasEmptyRange) {
  auto const range =
      resolve_payload_range(make_part(1, 104, PartRole::first), 0);
  EXPECT_EQ(range.length(), 0u);
}

TEST(PartBoundaryTest, FirstPartShorterThanHeaderThrows) {
  EXPECT_THROW(resolve_payload_range(make_part(1, 103, PartRole::first), 0),
               InvalidRangeError);
}

TEST(PartBoundaryTest, LastPartShorterThanTrailerThrows) {
  EXPECT_THROW(resolve_payload_range(make_part(3, 63, PartRole::last), 64),
               InvalidRangeError);
}

TEST(PartBoundaryTest, SinglePartMustHoldHeaderAndTrailer) {
  EXPECT_NO_THROW(resolve_payload_range(make_part(1, 136, PartRole::only), 32));
  EXPECT_THROW(resolve_payload_range(make_part(1, 135, PartRole::only), 32),
               InvalidRangeError);
}

TEST(PartBoundaryTest, ResolvesEveryPartAndSumsLengths) {
  std::vector<PartDescriptor> parts{make_part(1, 1104, PartRole::first),
                                    make_part(2, 1000, PartRole::middle),
                                    make_part(3, 1096, PartRole::last)};
  ArchiveHeader header;
  header.part_count = 3;
  header.has_checksums = true;

  auto const total = resolve_payload_ranges(parts, header);
  EXPECT_EQ(total, 3000u);
  EXPECT_EQ(parts[0].range, (PayloadRange{104, 1104}));
  EXPECT_EQ(parts[1].range, (PayloadRange{0, 1000}));
  EXPECT_EQ(parts[2].range, (PayloadRange{0, 1000}));
}

TEST(PartBoundaryTest, ResolveWithoutChecksumsLeavesLastPartWhole) {
  std::vector<PartDescriptor> parts{make_part(1, 1104, PartRole::first),
                                    make_part(2, 1096, PartRole::last)};
  ArchiveHeader header;
  header.part_count = 2;
  header.has_checksums = false;

  EXPECT_EQ(resolve_payload_ranges(parts, header), 2096u);
  EXPECT_EQ(parts[1].range, (PayloadRange{0, 1096}));
}
