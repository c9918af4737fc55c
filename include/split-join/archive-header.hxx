#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace split_join {

/// Size of the header at the start of the first part.
inline constexpr std::size_t kHeaderSize = 104;
/// Capacity of the software-name window (offsets 1..39).
inline constexpr std::size_t kSoftwareNameCapacity = 39;
/// Capacity of the output-name window (offsets 41..90).
inline constexpr std::size_t kOutputNameCapacity = 50;

/**
 * @struct ArchiveHeader
 * @brief Archive metadata decoded from the first part.
 *
 * Text fields are kept as the raw bytes found in the file; no character set is
 * assumed.
 */
struct ArchiveHeader {
  std::string software_name; /**< @brief Producer of the archive (informative). */
  std::string output_name;   /**< @brief File name of the joined output. */
  bool has_checksums = false; /**< @brief A checksum manifest ends the last part. */
  std::uint32_t part_count = 0;   /**< @brief Declared number of parts. */
  std::uint64_t payload_size = 0; /**< @brief Declared joined size in bytes. */
};

/**
 * @brief Decode the fixed 104-byte header.
 *
 * A text length larger than its window is clamped to the window (and logged),
 * so each field is always read from its own window.
 *
 * @param data Start of the header bytes.
 * @param size Number of bytes available at @p data.
 * @param origin File the bytes came from, used in error reports.
 * @return ArchiveHeader The decoded header.
 * @throws TruncatedHeaderError when @p size is smaller than kHeaderSize.
 */
ArchiveHeader decode_header(const char *data, std::size_t size,
                            const std::filesystem::path &origin);

/**
 * @brief Read and decode the header at the start of @p first_part.
 *
 * @throws FileAccessError when the file cannot be opened.
 * @throws TruncatedHeaderError when the file is shorter than kHeaderSize.
 */
ArchiveHeader read_header(const std::filesystem::path &first_part);
} // namespace split_join
