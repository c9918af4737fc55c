#pragma once

#include <split-join/part.hxx>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace split_join {

/// Extension of XtremSplit part files.
inline constexpr std::string_view kDefaultExtension = "xtm";
/// Highest index expressible with three zero-padded digits.
inline constexpr std::uint32_t kMaxPartIndex = 999;

/**
 * @struct PartName
 * @brief Components of a part file name `<base>.<NNN>.<ext>`.
 */
struct PartName {
  std::string base;
  std::uint32_t index = 0;
  std::string extension;
};

/**
 * @brief Split a file name into base, index and extension.
 *
 * The extension is compared case-insensitively with @p extension, the index
 * must be exactly three decimal digits in 001..999 and the base must not be
 * empty.
 *
 * @return std::optional<PartName> The components, or std::nullopt when the
 * name does not follow the scheme.
 */
std::optional<PartName> parse_part_name(std::string_view file_name,
                                        std::string_view extension);

/**
 * @brief Path of the sibling with index @p index, spelled like @p sample.
 */
std::filesystem::path sibling_part_path(const std::filesystem::path &directory,
                                        const PartName &sample,
                                        std::uint32_t index);

/**
 * @brief Find every part of the archive @p any_part belongs to.
 *
 * Lists the immediate entries of the directory of @p any_part and keeps the
 * regular files whose name has the same base (case-insensitive), a three-digit
 * index and the extension @p extension. Parts are returned in ascending index
 * order with their raw size and role filled in; ranges are left empty.
 *
 * @throws InvalidNameError when @p any_part does not follow the scheme.
 * @throws MissingPartError when the indices are not exactly 1..N.
 * @throws DuplicatePartError when an index occurs twice (names differing only
 * in case).
 * @throws FileAccessError when the directory cannot be listed.
 */
std::vector<PartDescriptor>
locate_parts(const std::filesystem::path &any_part,
             std::string_view extension = kDefaultExtension);
} // namespace split_join
