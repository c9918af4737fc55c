#pragma once

#include <split-join/archive-header.hxx>
#include <split-join/checksum-manifest.hxx>
#include <split-join/integrity-checker.hxx>
#include <split-join/log.hxx>
#include <split-join/part-locator.hxx>
#include <split-join/part.hxx>
#include <split-join/progress.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace split_join {

/**
 * @struct JoinOptions
 * @brief Tunables of one join.
 */
struct JoinOptions {
  std::string extension{kDefaultExtension}; /**< @brief Part extension. */
  std::size_t block_size = kDefaultBlockSize; /**< @brief Streaming block. */
  bool verify = true;    /**< @brief Check the manifest when present. */
  bool in_place = false; /**< @brief Write straight to the final name. */
  std::filesystem::path output_directory{"."};
  std::optional<std::string> output_name; /**< @brief Overrides the header. */
  bool show_progress = true;
  log::Level log_level = log::Level::info;
};

/**
 * @struct JoinContext
 * @brief Everything known about one archive before it is joined.
 *
 * Built once by prepare_join() and passed explicitly to the later stages; no
 * state is shared between contexts.
 */
struct JoinContext {
  JoinOptions options;
  std::vector<PartDescriptor> parts; /**< @brief Ranges resolved. */
  ArchiveHeader header;
  ChecksumManifest manifest; /**< @brief Empty without checksums. */
  std::uint64_t payload_total = 0; /**< @brief Sum of the part ranges. */
};

/**
 * @struct JoinResult
 * @brief Outcome of a successful join_archive().
 */
struct JoinResult {
  std::filesystem::path output;
  std::uint64_t bytes_written = 0;
  bool verified = false;
};

/**
 * @brief Locate the parts of the archive @p any_part belongs to, read the
 * header and manifest and resolve every payload range.
 *
 * @throws JoinError subclasses for every structural problem; see errors.hxx.
 */
JoinContext prepare_join(const std::filesystem::path &any_part,
                         const JoinOptions &options);

/**
 * @brief Final path of the joined file.
 *
 * Only the file-name component of the declared (or overriding) name is kept,
 * so an archive cannot write outside the output directory.
 *
 * @throws InvalidHeaderError when no usable file name remains or the output
 * would overwrite one of the parts.
 */
std::filesystem::path output_path(const JoinContext &context);

/**
 * @brief Locate, verify and join an archive.
 *
 * Unless `options.in_place` is set the data is written to
 * `<output>.partial` and renamed over the output once every part has been
 * copied; the temporary file is removed when joining fails.
 *
 * @param any_part Any part of the archive.
 * @param options Tunables.
 * @param join_progress Optional sink for the copy stage.
 * @param verify_progress Optional sink for the checksum stage.
 */
JoinResult join_archive(const std::filesystem::path &any_part,
                        const JoinOptions &options,
                        ProgressSink *join_progress = nullptr,
                        ProgressSink *verify_progress = nullptr);

/// @brief Human-readable summary of @p context (header, parts and ranges).
std::string describe(const JoinContext &context);
} // namespace split_join
