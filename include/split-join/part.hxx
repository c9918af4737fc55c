#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace split_join {

/**
 * @enum PartRole
 * @brief Position of a part in the archive.
 *
 * A single-part archive is both first and last (`PartRole::only`), and both
 * the header and the trailer live in that one file.
 */
enum class PartRole : unsigned {
  middle = 0b00,
  first = 0b01,
  last = 0b10,
  only = 0b11
};

/// @brief True when @p role carries the archive header.
constexpr bool is_first(PartRole role) noexcept {
  return (static_cast<unsigned>(role) &
          static_cast<unsigned>(PartRole::first)) != 0;
}

/// @brief True when @p role carries the checksum trailer.
constexpr bool is_last(PartRole role) noexcept {
  return (static_cast<unsigned>(role) &
          static_cast<unsigned>(PartRole::last)) != 0;
}

/// @brief Role of the part at zero-based @p position among @p count parts.
constexpr PartRole role_for(std::size_t position, std::size_t count) noexcept {
  unsigned role = 0;
  if (position == 0)
    role |= static_cast<unsigned>(PartRole::first);
  if (position + 1 == count)
    role |= static_cast<unsigned>(PartRole::last);
  return static_cast<PartRole>(role);
}

/// @brief "first", "middle", "last" or "only".
const char *to_string(PartRole role) noexcept;

/**
 * @struct PayloadRange
 * @brief Half-open byte range `[begin, end)` of payload inside a raw part.
 */
struct PayloadRange {
  std::uint64_t begin = 0;
  std::uint64_t end = 0;

  std::uint64_t length() const noexcept { return end - begin; }

  friend bool operator==(const PayloadRange &, const PayloadRange &) = default;
};

/**
 * @struct PartDescriptor
 * @brief One located part file.
 *
 * `range` is filled in by resolve_payload_ranges() once the header and
 * trailer are known.
 */
struct PartDescriptor {
  std::filesystem::path path;
  std::uint32_t index = 0; /**< @brief 1-based index from the file name. */
  std::uint64_t raw_size = 0;
  PartRole role = PartRole::middle;
  PayloadRange range;
};
} // namespace split_join
