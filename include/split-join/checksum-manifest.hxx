#pragma once

#include <split-join/archive-header.hxx>

#include <boost/iostreams/device/file.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace split_join {

/// Width of one checksum record in the trailer (an MD5 digest in hex).
inline constexpr std::size_t kChecksumRecordSize = 32;

/**
 * @brief Ordered checksum records, one per part; element 0 belongs to part 1.
 */
using ChecksumManifest = std::vector<std::string>;

/**
 * @brief Number of trailer bytes at the end of the last part.
 *
 * @return std::uint64_t `32 * part_count` when the header announces a
 * manifest, 0 otherwise.
 */
std::uint64_t trailer_length(const ArchiveHeader &header) noexcept;

/**
 * @brief Read the manifest from an open last-part source.
 *
 * Seeks to `file_size - 32 * part_count`, reads the 32-byte records up to the
 * end of the file and seeks the source back to offset 0, so it can be reused
 * for payload extraction. Records are returned uppercased.
 *
 * @param source Open, seekable last part.
 * @param origin Path of @p source, used in error reports.
 * @param part_count Declared number of parts.
 * @throws TruncatedTrailerError when the file is shorter than the manifest.
 * @throws FileAccessError when seeking or reading fails.
 */
ChecksumManifest read_manifest(boost::iostreams::file_source &source,
                               const std::filesystem::path &origin,
                               std::uint32_t part_count);

/// @brief Open @p last_part and read its manifest.
ChecksumManifest read_manifest(const std::filesystem::path &last_part,
                               std::uint32_t part_count);
} // namespace split_join
