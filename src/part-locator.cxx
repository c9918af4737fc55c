#include <split-join/errors.hxx>
#include <split-join/log.hxx>
#include <split-join/part-locator.hxx>

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <system_error>

namespace split_join {
namespace fs = std::filesystem;

namespace {

/**
 * @brief Parse exactly three ASCII decimal digits.
 *
 * @return std::uint32_t The value, or 0 when any character is not a digit.
 */
std::uint32_t parse_index_impl(std::string_view digits) {
  if (digits.size() != 3)
    return 0;
  std::uint32_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9')
      return 0;
    value = value * 10 + static_cast<std::uint32_t>(c - '0');
  }
  return value;
}

/// @brief Parse @p entry as a part of @p wanted's archive.
std::optional<PartName> match_sibling_impl(const fs::directory_entry &entry,
                                           const PartName &wanted,
                                           std::string_view extension) {
  std::error_code ec;
  if (!entry.is_regular_file(ec))
    return std::nullopt;
  auto name = parse_part_name(entry.path().filename().string(), extension);
  if (!name || !boost::algorithm::iequals(name->base, wanted.base))
    return std::nullopt;
  return name;
}

} // unnamed namespace

const char *to_string(PartRole role) noexcept {
  switch (role) {
  case PartRole::middle:
    return "middle";
  case PartRole::first:
    return "first";
  case PartRole::last:
    return "last";
  case PartRole::only:
    return "only";
  }
  return "unknown";
}

std::optional<PartName> parse_part_name(std::string_view file_name,
                                        std::string_view extension) {
  // "<base>" "." "NNN" "." "<ext>"
  auto const suffix_size = 1 + 3 + 1 + extension.size();
  if (file_name.size() <= suffix_size)
    return std::nullopt;

  auto const ext_pos = file_name.size() - extension.size();
  auto const ext = file_name.substr(ext_pos);
  if (file_name[ext_pos - 1] != '.' ||
      !boost::algorithm::iequals(ext, extension))
    return std::nullopt;

  auto const index_pos = ext_pos - 1 - 3;
  if (file_name[index_pos - 1] != '.')
    return std::nullopt;
  auto const index = parse_index_impl(file_name.substr(index_pos, 3));
  if (index == 0 || index > kMaxPartIndex)
    return std::nullopt;

  PartName name;
  name.base = std::string(file_name.substr(0, index_pos - 1));
  name.index = index;
  name.extension = std::string(ext);
  return name;
}

fs::path sibling_part_path(const fs::path &directory, const PartName &sample,
                           std::uint32_t index) {
  return directory /
         fmt::format("{}.{:03}.{}", sample.base, index, sample.extension);
}

std::vector<PartDescriptor> locate_parts(const fs::path &any_part,
                                         std::string_view extension) {
  auto const wanted = parse_part_name(any_part.filename().string(), extension);
  if (!wanted)
    throw InvalidNameError(any_part);

  auto directory = any_part.parent_path();
  if (directory.empty())
    directory = ".";

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec)
    throw FileAccessError(directory,
                          fmt::format("cannot list directory: {}", ec.message()));

  std::vector<PartDescriptor> parts;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    auto const name = match_sibling_impl(*it, *wanted, extension);
    if (!name)
      continue;

    PartDescriptor part;
    part.path = it->path();
    part.index = name->index;
    part.raw_size = it->file_size(ec);
    if (ec)
      throw FileAccessError(part.path, fmt::format("cannot determine size: {}",
                                                   ec.message()));
    parts.push_back(std::move(part));
  }
  if (ec)
    throw FileAccessError(directory,
                          fmt::format("cannot list directory: {}", ec.message()));

  // Ordering by index equals lexicographic ordering for equally cased names
  // and stays correct when the case differs between parts.
  std::sort(parts.begin(), parts.end(),
            [](const PartDescriptor &a, const PartDescriptor &b) {
              if (a.index != b.index)
                return a.index < b.index;
              return a.path.filename() < b.path.filename();
            });

  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto const expected = static_cast<std::uint32_t>(i + 1);
    if (parts[i].index < expected)
      throw DuplicatePartError(parts[i].path, parts[i].index);
    if (parts[i].index != expected)
      throw MissingPartError(sibling_part_path(directory, *wanted, expected),
                             expected);
    parts[i].role = role_for(i, parts.size());
  }
  if (parts.empty())
    throw MissingPartError(sibling_part_path(directory, *wanted, 1), 1);

  log::debug("located {} part(s) of {} in {}", parts.size(), wanted->base,
             directory.string());
  return parts;
}
} // namespace split_join
