#pragma once

#include <cstddef>
#include <cstdint>

namespace split_join::detail {
/**
 * @struct RawArchiveHeader
 * @brief On-disk layout of the header at the start of the first part
 * (104 bytes).
 *
 * Text fields are a length byte followed by a fixed window; bytes past the
 * length are unspecified. Integers are little-endian and stored as byte arrays
 * so decoding does not depend on the host byte order or alignment.
 *
 * Note: The struct is packed to guarantee the exact 104-byte layout.
 */
struct __attribute__((packed)) RawArchiveHeader {
  std::uint8_t software_name_length;  /**< @brief Offset 0. */
  char software_name[39];             /**< @brief Offset 1, producer name. */
  std::uint8_t output_name_length;    /**< @brief Offset 40. */
  char output_name[50];               /**< @brief Offset 41, joined file. */
  std::uint8_t checksum_flag;         /**< @brief Offset 91, 1 = manifest. */
  std::uint8_t part_count[4];         /**< @brief Offset 92, u32 LE. */
  std::uint8_t payload_size[8];       /**< @brief Offset 96, u64 LE. */
};

static_assert(sizeof(RawArchiveHeader) == 104,
              "RawArchiveHeader must be 104 bytes");
static_assert(offsetof(RawArchiveHeader, output_name_length) == 40);
static_assert(offsetof(RawArchiveHeader, checksum_flag) == 91);
static_assert(offsetof(RawArchiveHeader, part_count) == 92);
static_assert(offsetof(RawArchiveHeader, payload_size) == 96);
} // namespace split_join::detail
