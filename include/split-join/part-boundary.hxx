#pragma once

#include <split-join/archive-header.hxx>
#include <split-join/part.hxx>

#include <cstdint>
#include <vector>

namespace split_join {

/**
 * @brief Compute the payload range of one part.
 *
 * | role   | range                                  |
 * |--------|----------------------------------------|
 * | first  | `[104, raw_size)`                      |
 * | middle | `[0, raw_size)`                        |
 * | last   | `[0, raw_size - trailer_size)`         |
 * | only   | `[104, raw_size - trailer_size)`       |
 *
 * @param part Located part (path, raw size and role are used).
 * @param trailer_size Trailer length, 0 when the archive has no manifest.
 * @throws InvalidRangeError when the header and/or trailer do not fit.
 */
PayloadRange resolve_payload_range(const PartDescriptor &part,
                                   std::uint64_t trailer_size);

/**
 * @brief Fill in the range of every part of an archive described by
 * @p header.
 *
 * @return std::uint64_t Sum of all range lengths.
 */
std::uint64_t resolve_payload_ranges(std::vector<PartDescriptor> &parts,
                                     const ArchiveHeader &header);
} // namespace split_join
