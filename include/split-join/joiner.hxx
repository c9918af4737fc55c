#pragma once

#include <split-join/integrity-checker.hxx>
#include <split-join/part.hxx>
#include <split-join/progress.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace split_join {

/**
 * @class Joiner
 * @brief Streams the payload range of every part, in order, into one file.
 *
 * Each part is read through a PartFilter, so header and trailer bytes never
 * reach the destination. Progress is reported after every written block as
 * `bytes_written / declared_size`.
 */
class Joiner {
public:
  /**
   * @param block_size Copy size in bytes.
   * @param progress Optional sink; must outlive the Joiner.
   * @throws std::invalid_argument when @p block_size is 0.
   */
  explicit Joiner(std::size_t block_size = kDefaultBlockSize,
                  ProgressSink *progress = nullptr);

  /**
   * @brief Write the payload of @p parts to @p destination.
   *
   * The destination is created or truncated. Part handles are released as
   * soon as their range is copied, and every handle is released when an
   * exception leaves this function; a partially written destination is left
   * in place.
   *
   * @param parts Parts in ascending order with resolved ranges.
   * @param destination Output file.
   * @param declared_size Payload size announced by the header.
   * @return std::uint64_t Number of bytes written.
   * @throws FileAccessError when the destination cannot be opened or written.
   * @throws ShortReadError when a part ends inside its payload range.
   */
  std::uint64_t join(const std::vector<PartDescriptor> &parts,
                     const std::filesystem::path &destination,
                     std::uint64_t declared_size);

  /// @brief Progress of the last (or current) join() call.
  const JoinProgress &progress() const noexcept { return progress_; }

private:
  std::size_t block_size_;
  ProgressSink *sink_;
  JoinProgress progress_;
};
} // namespace split_join
