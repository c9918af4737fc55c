/**
 * @file part-filter.hxx
 * @brief Defines a filter that extracts the payload bytes of one split-archive
 * part using Boost.Iostreams.
 */

#pragma once

#include <split-join/detail/part-filter-impl.hxx>
#include <boost/iostreams/constants.hpp>
#include <boost/iostreams/filter/symmetric.hpp>
#include <boost/iostreams/pipeline.hpp>

#include <cstdint>

namespace split_join {
/**
 * @brief Boost.Iostreams-compatible symmetric filter that extracts the payload
 * range of a raw part file.
 *
 * The filter drops the first @p skip_bytes of its input (the archive header on
 * the first part), forwards the next @p payload_bytes and stops, leaving any
 * following bytes (the checksum trailer on the last part) unread. It can be
 * composed in a Boost.Iostreams filtering pipeline like any other filter.
 *
 * @tparam Alloc Allocator type for internal buffers (default:
 * std::allocator<char>)
 *
 * @code{.cpp}
 * #include <boost/iostreams/device/file.hpp>
 * #include <boost/iostreams/filtering_stream.hpp>
 * #include <split-join/part-filter.hxx>
 *
 * namespace io = boost::iostreams;
 *
 * int main() {
 *   io::filtering_istream in;
 *   // Skip the 104-byte header, forward 1000 payload bytes
 *   in.push(split_join::PartFilter<>(104, 1000));
 *   in.push(io::file_source("doc.001.xtm", std::ios::binary));
 *
 *   std::string payload((std::istreambuf_iterator<char>(in)),
 *                       std::istreambuf_iterator<char>());
 * }
 * @endcode
 *
 * @note A source that ends early simply ends the stream; compare the number of
 * bytes read with @p payload_bytes to detect a truncated part.
 *
 * @note Copies of the filter share their parsing state, as with every
 * symmetric_filter.
 */
template <typename Alloc = std::allocator<char>>
struct PartFilter
    : boost::iostreams::symmetric_filter<detail::PartFilterImpl<Alloc>, Alloc> {
private:
  using impl_type = detail::PartFilterImpl<Alloc>;
  using base_type = boost::iostreams::symmetric_filter<impl_type, Alloc>;

public:
  /// Character type used by the stream.
  using char_type = typename base_type::char_type;
  /// Filter category for Boost.Iostreams.
  using category = typename base_type::category;

  /**
   * @brief Constructs the filter for one payload range.
   *
   * @param skip_bytes Leading bytes to drop.
   * @param payload_bytes Bytes to forward after the leading region.
   * @param buffer_size Buffer size used internally (defaults to
   * Boost.Iostreams' default size).
   */
  PartFilter(std::uint64_t skip_bytes, std::uint64_t payload_bytes,
             std::streamsize buffer_size =
                 boost::iostreams::default_device_buffer_size)
      : base_type(buffer_size, skip_bytes, payload_bytes) {}
};

/// @brief Makes PartFilter pipable in Boost.Iostreams pipelines.
BOOST_IOSTREAMS_PIPABLE(PartFilter, 1)
} // namespace split_join
