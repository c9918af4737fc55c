#include <split-join/archive-header.hxx>
#include <split-join/detail/file-io.hxx>
#include <split-join/detail/raw-header.hxx>
#include <split-join/errors.hxx>
#include <split-join/log.hxx>

#include <array>
#include <cstring>

namespace split_join {
namespace {

/**
 * @brief Decode an unsigned little-endian integer stored in a byte array.
 *
 * @tparam T Unsigned integer type to produce.
 * @tparam N Number of bytes in the field.
 */
template <typename T, std::size_t N>
T parse_le_impl(const std::uint8_t (&field)[N]) {
  static_assert(sizeof(T) == N, "field width must match the integer type");
  T value = 0;
  for (std::size_t i = N; i-- > 0;)
    value = static_cast<T>((value << 8) | field[i]);
  return value;
}

/**
 * @brief Extract a length-prefixed text field, clamped to its window.
 *
 * The declared length may exceed the window reserved for the field; in that
 * case only the window is returned and a warning is logged, since the bytes
 * beyond it belong to the next field.
 */
std::string extract_text_impl(std::uint8_t declared, const char *window,
                              std::size_t capacity, const char *field,
                              const std::filesystem::path &origin) {
  std::size_t length = declared;
  if (length > capacity) {
    log::warning("{}: {} length {} exceeds its {}-byte field, truncating",
                 origin.string(), field, length, capacity);
    length = capacity;
  }
  return std::string(window, length);
}

} // unnamed namespace

ArchiveHeader decode_header(const char *data, std::size_t size,
                            const std::filesystem::path &origin) {
  if (size < kHeaderSize)
    throw TruncatedHeaderError(origin, size);

  detail::RawArchiveHeader raw;
  std::memcpy(&raw, data, sizeof(raw));

  ArchiveHeader header;
  header.software_name =
      extract_text_impl(raw.software_name_length, raw.software_name,
                        sizeof(raw.software_name), "software name", origin);
  header.output_name =
      extract_text_impl(raw.output_name_length, raw.output_name,
                        sizeof(raw.output_name), "output name", origin);
  header.has_checksums = raw.checksum_flag != 0;
  header.part_count = parse_le_impl<std::uint32_t>(raw.part_count);
  header.payload_size = parse_le_impl<std::uint64_t>(raw.payload_size);
  return header;
}

ArchiveHeader read_header(const std::filesystem::path &first_part) {
  auto source = detail::open_source(first_part);

  std::array<char, kHeaderSize> buffer{};
  auto const filled =
      detail::read_fully(source, buffer.data(), buffer.size());
  source.close();

  return decode_header(buffer.data(), filled, first_part);
}
} // namespace split_join
