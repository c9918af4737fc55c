#include <split-join/detail/base-part-filter-impl.hxx>

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace split_join::detail {
namespace {

/**
 * @brief Number of bytes that can be moved in one step.
 *
 * @param remaining Bytes still owed to the current state.
 * @param available Bytes available in the buffer being consumed or filled.
 * @return std::size_t The smaller of the two.
 */
std::size_t step_size_impl(std::uint64_t remaining, std::size_t available) {
  return static_cast<std::size_t>(
      std::min<std::uint64_t>(remaining, available));
}

} // unnamed namespace

BasePartFilterImpl::BasePartFilterImpl(std::uint64_t skip_bytes,
                                       std::uint64_t payload_bytes)
    : skip_bytes(skip_bytes), payload_bytes(payload_bytes) {}

/**
 * @brief Main streaming filter: drop the leading overhead, then forward the
 * payload.
 *
 * State transitions that need no input (an empty leading region, an empty
 * payload) are taken eagerly so that a range ending exactly on a buffer
 * boundary is reported complete without waiting for more data. Bytes after the
 * payload are never consumed; once the range is complete the filter returns
 * false and the caller stops reading.
 */
bool BasePartFilterImpl::filter(const char *&src_begin,
                                const char *const src_end, char *&dest_begin,
                                const char *const dest_end, bool flush) {
  auto settle = [this] {
    if (state == State::SkipLeading && bytes_skipped == skip_bytes)
      state = State::CopyPayload;
    if (state == State::CopyPayload && complete())
      state = State::Done;
  };

  settle();
  while (src_begin < src_end) {
    switch (state) {
    case State::SkipLeading: {
      auto const to_skip =
          step_size_impl(skip_bytes - bytes_skipped,
                         static_cast<std::size_t>(src_end - src_begin));
      src_begin += to_skip;
      bytes_skipped += to_skip;
      break;
    }

    case State::CopyPayload: {
      if (dest_begin >= dest_end)
        return true;

      auto const src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto const dest_space = static_cast<std::size_t>(dest_end - dest_begin);
      auto const to_copy = step_size_impl(payload_bytes - bytes_copied,
                                          std::min(src_avail, dest_space));
      std::copy(src_begin, src_begin + to_copy, dest_begin);

      src_begin += to_copy;
      dest_begin += to_copy;
      bytes_copied += to_copy;
      break;
    }

    case State::Done:
      return false;
    }
    settle();
  }

  if (state == State::Done)
    return false;
  // The source ran dry before the range was exhausted.
  if (flush)
    return false;
  return true;
}

/**
 * @brief Reset internal parser state so the filter can be reused.
 *
 * The configured range is kept; counters return to zero.
 */
void BasePartFilterImpl::close() {
  state = State::SkipLeading;
  bytes_skipped = 0;
  bytes_copied = 0;
}
} // namespace split_join::detail
