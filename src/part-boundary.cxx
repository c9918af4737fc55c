#include <split-join/checksum-manifest.hxx>
#include <split-join/errors.hxx>
#include <split-join/part-boundary.hxx>

namespace split_join {

PayloadRange resolve_payload_range(const PartDescriptor &part,
                                   std::uint64_t trailer_size) {
  std::uint64_t const leading = is_first(part.role) ? kHeaderSize : 0;
  std::uint64_t const trailing = is_last(part.role) ? trailer_size : 0;

  if (part.raw_size < leading + trailing)
    throw InvalidRangeError(part.path, part.raw_size, leading + trailing);

  return PayloadRange{leading, part.raw_size - trailing};
}

std::uint64_t resolve_payload_ranges(std::vector<PartDescriptor> &parts,
                                     const ArchiveHeader &header) {
  auto const trailer_size = trailer_length(header);
  std::uint64_t total = 0;
  for (auto &part : parts) {
    part.range = resolve_payload_range(part, trailer_size);
    total += part.range.length();
  }
  return total;
}
} // namespace split_join
