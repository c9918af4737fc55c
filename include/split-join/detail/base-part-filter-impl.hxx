#pragma once

#include <cstdint>

namespace split_join::detail {
/**
 * @class BasePartFilterImpl
 * @brief Core payload-extraction logic that operates on char buffers.
 *
 * A raw part file is laid out as `[leading overhead][payload][trailing
 * overhead]`: the first part carries the archive header in front, the last
 * part carries the checksum manifest behind. This class implements a small
 * state machine that drops the leading bytes, forwards exactly the payload
 * bytes and then reports completion without consuming the trailing bytes. It
 * is independent of any iostreams interfaces so it can be tested and reused by
 * templated adapter layers.
 */
class BasePartFilterImpl {
public:
  /** @enum State Parsing states for the internal state machine. */
  enum class State { SkipLeading, CopyPayload, Done };

  std::uint64_t skip_bytes = 0; /**< @brief Leading bytes to drop. */
  std::uint64_t payload_bytes =
      0; /**< @brief Number of payload bytes to forward. */
  std::uint64_t bytes_skipped =
      0; /**< @brief Leading bytes dropped so far. */
  std::uint64_t bytes_copied =
      0; /**< @brief Payload bytes forwarded so far. */
  State state = State::SkipLeading; /**< @brief Current state of the parser. */

  /**
   * @brief Construct a filter that forwards the byte range
   * `[skip_bytes, skip_bytes + payload_bytes)` of its input.
   */
  BasePartFilterImpl(std::uint64_t skip_bytes, std::uint64_t payload_bytes);

  /**
   * @brief Drop leading overhead and copy payload bytes to the destination
   * buffer.
   *
   * Implemented as a pull/push style function where both source and
   * destination pointers are advanced as bytes are consumed/produced.
   *
   * @param src_begin Reference to beginning of source buffer; advanced by
   * consumed bytes.
   * @param src_end One-past-end pointer of source buffer.
   * @param dest_begin Reference to beginning of destination buffer; advanced
   * by written bytes.
   * @param dest_end One-past-end pointer of destination buffer.
   * @param flush True once the source is exhausted.
   * @return true when more input/output activity may be possible.
   * @return false when the payload range is complete, or when the source is
   * exhausted (a short part; callers detect it by comparing bytes_copied with
   * payload_bytes).
   */
  bool filter(const char *&src_begin, const char *const src_end,
              char *&dest_begin, const char *const dest_end, bool flush);

  /**
   * @brief Reset the parser to its initial state for reuse on the same range.
   */
  void close();

  /// @brief True once every payload byte has been forwarded.
  bool complete() const noexcept { return bytes_copied == payload_bytes; }
};
} // namespace split_join::detail
