#include <split-join/checksum-manifest.hxx>
#include <split-join/detail/file-io.hxx>
#include <split-join/errors.hxx>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/iostreams/positioning.hpp>

#include <array>
#include <ios>

namespace split_join {
namespace io = boost::iostreams;

namespace {

/// @brief Seek @p source to the absolute @p offset or fail.
void seek_to_impl(io::file_source &source, io::stream_offset offset,
                  const std::filesystem::path &origin) {
  auto const pos = io::position_to_offset(
      source.seek(offset, std::ios_base::beg, std::ios_base::in));
  if (pos != offset)
    throw FileAccessError(origin, "seek failed");
}

} // unnamed namespace

std::uint64_t trailer_length(const ArchiveHeader &header) noexcept {
  return header.has_checksums
             ? static_cast<std::uint64_t>(kChecksumRecordSize) *
                   header.part_count
             : 0;
}

ChecksumManifest read_manifest(io::file_source &source,
                               const std::filesystem::path &origin,
                               std::uint32_t part_count) {
  std::uint64_t const manifest_size =
      static_cast<std::uint64_t>(kChecksumRecordSize) * part_count;

  auto const end = io::position_to_offset(
      source.seek(0, std::ios_base::end, std::ios_base::in));
  if (end < 0)
    throw FileAccessError(origin, "cannot determine file size");
  auto const file_size = static_cast<std::uint64_t>(end);
  if (file_size < manifest_size)
    throw TruncatedTrailerError(origin, file_size, manifest_size);

  seek_to_impl(source,
               static_cast<io::stream_offset>(file_size - manifest_size),
               origin);

  ChecksumManifest manifest;
  manifest.reserve(part_count);
  std::array<char, kChecksumRecordSize> record{};
  while (manifest.size() < part_count) {
    auto const got = detail::read_fully(source, record.data(), record.size());
    if (got != record.size())
      throw TruncatedTrailerError(origin, file_size, manifest_size);
    manifest.push_back(boost::algorithm::to_upper_copy(
        std::string(record.data(), record.size())));
  }

  seek_to_impl(source, 0, origin);
  return manifest;
}

ChecksumManifest read_manifest(const std::filesystem::path &last_part,
                               std::uint32_t part_count) {
  auto source = detail::open_source(last_part);
  return read_manifest(source, last_part, part_count);
}
} // namespace split_join
