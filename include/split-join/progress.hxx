#pragma once

#include <algorithm>
#include <cstdint>

namespace split_join {

/**
 * @class ProgressSink
 * @brief Receives the completed fraction of a long-running operation.
 */
class ProgressSink {
public:
  virtual ~ProgressSink() = default;

  /// @brief Called after every processed block with a value in [0, 1].
  virtual void update(double fraction) = 0;
};

/**
 * @struct JoinProgress
 * @brief Bytes written so far against the declared payload size.
 */
struct JoinProgress {
  std::uint64_t bytes_written = 0;
  std::uint64_t total_bytes = 0;

  /// @brief Completed fraction, clamped to [0, 1]; an empty total counts as
  /// done.
  double fraction() const noexcept {
    if (total_bytes == 0)
      return 1.0;
    return std::min(1.0, static_cast<double>(bytes_written) /
                             static_cast<double>(total_bytes));
  }
};
} // namespace split_join
