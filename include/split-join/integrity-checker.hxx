#pragma once

#include <split-join/checksum-manifest.hxx>
#include <split-join/digest.hxx>
#include <split-join/part.hxx>
#include <split-join/progress.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace split_join {

/// Block size used when streaming part files.
inline constexpr std::size_t kDefaultBlockSize = 64 * 1024;

/**
 * @class IntegrityChecker
 * @brief Verifies raw part files against the checksum manifest before they
 * are joined.
 *
 * Digests cover the raw file, not the payload range: the header bytes of the
 * first part are included, and only the trailer of the last part is left out.
 * Files are streamed in blocks of a fixed size, so memory use does not depend
 * on part size.
 */
class IntegrityChecker {
public:
  /**
   * @param factory Creates one digest per part.
   * @param block_size Read size in bytes.
   * @throws std::invalid_argument when @p block_size is 0 or the digest's hex
   * width differs from the manifest record width.
   */
  explicit IntegrityChecker(DigestFactory factory = default_digest_factory(),
                            std::size_t block_size = kDefaultBlockSize);

  /**
   * @brief Digest the first @p length bytes of @p path.
   *
   * @throws FileAccessError when the file cannot be opened.
   * @throws ShortReadError when the file holds fewer than @p length bytes.
   */
  std::string digest_prefix(const std::filesystem::path &path,
                            std::uint64_t length) const;

  /**
   * @brief Check every part against its manifest record, in order.
   *
   * Stops at the first mismatch; later parts are not read.
   *
   * @param parts Located parts in ascending order.
   * @param manifest Records in part order.
   * @param trailer_size Trailer length at the end of the last part.
   * @param progress Optional sink for the fraction of bytes digested.
   * @throws PartCountMismatchError when the part and record counts differ
   * (before any file is read).
   * @throws ChecksumMismatchError naming the first part that does not match.
   */
  void verify(const std::vector<PartDescriptor> &parts,
              const ChecksumManifest &manifest, std::uint64_t trailer_size,
              ProgressSink *progress = nullptr) const;

  std::size_t block_size() const noexcept { return block_size_; }

private:
  using BlockCallback = std::function<void(std::size_t)>;

  std::string digest_impl(const std::filesystem::path &path,
                          std::uint64_t length,
                          const BlockCallback &on_block) const;

  DigestFactory factory_;
  std::size_t block_size_;
};
} // namespace split_join
