#pragma once

#include "base-part-filter-impl.hxx"
#include <cstdint>
#include <memory>

namespace split_join::detail {
/**
 * @brief Range-extraction state bound to the stream's character type.
 *
 * symmetric_filter hands over buffers of `Alloc::value_type`; the byte
 * arithmetic lives in BasePartFilterImpl, which works on `char`. Only
 * byte-sized character types can be viewed that way.
 *
 * @tparam Alloc Allocator of the filter's buffers.
 */
template <typename Alloc = std::allocator<char>>
class PartFilterImpl : public BasePartFilterImpl {
public:
  using char_type = typename Alloc::value_type;
  static_assert(sizeof(char_type) == 1,
                "part payloads are extracted byte by byte");

  /// @param skip_bytes Header bytes in front of the payload.
  /// @param payload_bytes Length of the payload range.
  PartFilterImpl(std::uint64_t skip_bytes, std::uint64_t payload_bytes)
      : BasePartFilterImpl(skip_bytes, payload_bytes) {}

  /// @brief Run one step of the range state machine over byte views of the
  /// buffers; both cursors are moved by the number of bytes consumed or
  /// produced.
  bool filter(const char_type *&src_begin, const char_type *const src_end,
              char_type *&dest_begin, const char_type *const dest_end,
              bool flush) {
    auto *in = reinterpret_cast<const char *>(src_begin);
    auto *out = reinterpret_cast<char *>(dest_begin);

    bool const more = BasePartFilterImpl::filter(
        in, reinterpret_cast<const char *>(src_end), out,
        reinterpret_cast<const char *>(dest_end), flush);

    src_begin += in - reinterpret_cast<const char *>(src_begin);
    dest_begin += out - reinterpret_cast<char *>(dest_begin);
    return more;
  }
};
} // namespace split_join::detail
